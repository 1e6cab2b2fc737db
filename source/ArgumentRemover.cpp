// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <span>
#include "StripRewriter.hpp"

// Keeps call sites and struct literals consistent with the stripped declarations: drops
// Ghost(..) / Tracked(..) call arguments, arguments of removed free function parameters and
// initializers of removed fields.
class ArgumentRemover : public StripRewriter<ArgumentRemover> {
   public:
    using StripRewriter::StripRewriter;

    ShouldVisitChildren handle(ExpressionSyntax& node) {
        auto& parts = node.children;
        bool turbofish = false;
        for (size_t i = 1; i < parts.size(); i++) {
            auto previous = parts[i - 1];
            if (isToken(*previous, "::") && isToken(*parts[i], "<"))
                turbofish = true;
            if (parts[i]->kind != SyntaxKind::Group || parts[i]->isRemoved())
                continue;
            auto& group = parts[i]->as<DelimitedListSyntax>();
            TokenKind open = group.open->token.kind;
            if (open == TokenKind::OpenParen && isCallee(*previous, turbofish)) {
                removeArguments(group, freeFunctionRemovals(parts, i));
            } else if (open == TokenKind::OpenBrace && previous->kind == SyntaxKind::Token) {
                removeInitializers(group, parts, i);
            }
        }
        return VISIT_CHILDREN;
    }

   private:
    static bool isToken(const SyntaxNode& node, std::string_view text) {
        return node.kind == SyntaxKind::Token && node.as<TokenSyntax>().is(text);
    }

    // Removals recorded for the unqualified free function called by the group at parts[index],
    // nullptr for methods, paths and unknown or ambiguous names.
    const ParameterRemovals* freeFunctionRemovals(std::span<SyntaxNode*> parts, size_t index) {
        auto callee = parts[index - 1];
        if (callee->kind != SyntaxKind::Token || (index >= 2 && (isToken(*parts[index - 2], ".") ||
                                                                 isToken(*parts[index - 2], "::"))))
            return nullptr;
        auto it = context.removedParameters.find(std::string(callee->as<TokenSyntax>().token.text));
        if (it == context.removedParameters.end() || it->second.ambiguous)
            return nullptr;
        return &it->second;
    }

    // Drop Ghost(..) / Tracked(..) arguments, and the arguments at positions the callee lost when
    // the call passes exactly as many arguments as the callee had parameters.
    void removeArguments(DelimitedListSyntax& group, const ParameterRemovals* removals) {
        if (removals && removals->count != group.elements().size())
            removals = nullptr;
        size_t position = 0;
        removeListElements(group, [&](SyntaxNode& element) {
            size_t current = position++;
            if (isGhostWrapper(element))
                return true;
            return removals && std::ranges::find(removals->positions, current) !=
                                   removals->positions.end();
        });
    }

    // Drop initializers of removed fields from `Name { .. }` and `Enum::Variant { .. }`.
    void removeInitializers(DelimitedListSyntax& group, std::span<SyntaxNode*> parts, size_t index) {
        std::string name(parts[index - 1]->as<TokenSyntax>().token.text);
        auto it = context.removedFields.end();
        if (index >= 3 && isToken(*parts[index - 2], "::") &&
            parts[index - 3]->kind == SyntaxKind::Token) {
            it = context.removedFields.find(
                std::string(parts[index - 3]->as<TokenSyntax>().token.text) + "::" + name);
        }
        if (it == context.removedFields.end())
            it = context.removedFields.find(name);
        if (it == context.removedFields.end() || it->second.empty())
            return;
        auto& removed = it->second;
        removeListElements(group, [&](SyntaxNode& element) {
            auto field = initializedField(element);
            return !field.empty() && removed.contains(std::string(field));
        });
    }

    // whether a '(' group following node is an argument list
    static bool isCallee(SyntaxNode& node, bool turbofish) {
        if (node.kind == SyntaxKind::Group)
            return node.as<DelimitedListSyntax>().open->token.kind != TokenKind::OpenBrace;
        if (node.kind != SyntaxKind::Token)
            return false;
        const Token& token = node.as<TokenSyntax>().token;
        if (token.is(">"))
            return turbofish;
        return token.isIdentifier() && (!token.isKeyword() || token.is("self") || token.is("Self"));
    }

    // Ghost(e) or Tracked(e)
    static bool isGhostWrapper(SyntaxNode& element) {
        auto& parts = element.children;
        if (element.kind != SyntaxKind::Expression || parts.size() != 2)
            return false;
        if (parts[0]->kind != SyntaxKind::Token || parts[1]->kind != SyntaxKind::Group)
            return false;
        auto& wrapper = parts[0]->as<TokenSyntax>();
        return (wrapper.is("Ghost") || wrapper.is("Tracked")) &&
               parts[1]->as<DelimitedListSyntax>().open->token.kind == TokenKind::OpenParen;
    }

    // field named by `name: value` or shorthand `name`, empty for anything else
    static std::string_view initializedField(SyntaxNode& element) {
        auto& parts = element.children;
        if (element.kind != SyntaxKind::Expression || parts.empty() ||
            parts[0]->kind != SyntaxKind::Token)
            return {};
        const Token& name = parts[0]->as<TokenSyntax>().token;
        if (!name.isIdentifier())
            return {};
        if (parts.size() == 1)
            return name.text;
        if (parts[1]->kind == SyntaxKind::Token && parts[1]->as<TokenSyntax>().is(":"))
            return name.text;
        return {};
    }
};

template void rewriteStage<ArgumentRemover>(SyntaxTree& tree,
                                            StripContext& context,
                                            const std::string& stageName);
