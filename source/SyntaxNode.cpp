// SPDX-License-Identifier: Apache-2.0
#include "SyntaxNode.hpp"
#include <array>
#include "SyntaxPrinter.hpp"

static constexpr std::array<std::string_view, 31> kindNames = {
    "Token",
    "SourceFile",
    "Attribute",
    "FunctionDeclaration",
    "StructDeclaration",
    "EnumDeclaration",
    "TraitDeclaration",
    "ImplDeclaration",
    "ModuleDeclaration",
    "OpaqueItem",
    "ParameterList",
    "Parameter",
    "ReturnType",
    "ContractSpec",
    "ContractClause",
    "FieldList",
    "Field",
    "VariantList",
    "EnumVariant",
    "Block",
    "LetStatement",
    "ExpressionStatement",
    "MacroStatement",
    "ItemStatement",
    "Expression",
    "Group",
    "MacroInvocation",
    "TokenTree",
    "MatchBody",
    "MatchArm",
    "LoopSpec",
};

std::string_view toString(SyntaxKind kind) {
    return kindNames[static_cast<size_t>(kind)];
}

TokenSyntax* SyntaxNode::getFirstToken() {
    if (kind == SyntaxKind::Token)
        return &as<TokenSyntax>();
    for (auto child : children) {
        if (child->isRemoved())
            continue;
        if (auto token = child->getFirstToken())
            return token;
    }
    return nullptr;
}

TokenSyntax* SyntaxNode::getLastToken() {
    if (kind == SyntaxKind::Token)
        return &as<TokenSyntax>();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        if ((*it)->isRemoved())
            continue;
        if (auto token = (*it)->getLastToken())
            return token;
    }
    return nullptr;
}

SourceLocation SyntaxNode::getLocation() const {
    auto token = const_cast<SyntaxNode*>(this)->getFirstToken();
    return token ? token->token.location : SourceLocation::NoLocation;
}

std::string SyntaxNode::toString() const {
    return SyntaxPrinter().print(*this).str();
}

bool AttributeSyntax::isVerificationOnly() const {
    std::string_view head = path.substr(0, path.find("::"));
    return head == "verifier" || head == "verusfmt" || head == "trigger" || head == "via_fn";
}

SmallVector<SyntaxNode*, 8> DelimitedListSyntax::elements() const {
    SmallVector<SyntaxNode*, 8> result;
    for (auto child : children) {
        if (child->kind != SyntaxKind::Token && !child->isRemoved())
            result.push_back(child);
    }
    return result;
}

SmallVector<SyntaxNode*, 16> childNodes(const SyntaxNode& node) {
    SmallVector<SyntaxNode*, 16> result;
    for (auto child : node.children) {
        if (child->kind != SyntaxKind::Token && !child->isRemoved())
            result.push_back(child);
    }
    return result;
}

static void collectTokens(SyntaxNode& node, SmallVector<TokenSyntax*, 32>& tokens) {
    if (node.kind == SyntaxKind::Token) {
        tokens.push_back(&node.as<TokenSyntax>());
        return;
    }
    for (auto child : node.children) {
        if (!child->isRemoved())
            collectTokens(*child, tokens);
    }
}

std::string normalizedText(SyntaxNode& node) {
    SmallVector<TokenSyntax*, 32> tokens;
    collectTokens(node, tokens);
    std::string result;
    for (size_t i = 0; i < tokens.size(); i++) {
        auto& token = tokens[i]->token;
        if (i > 0 && (!token.leadingTrivia.empty() || !tokens[i - 1]->token.trailingTrivia.empty()))
            result += ' ';
        result += token.text;
    }
    return result;
}
