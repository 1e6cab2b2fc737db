// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include "ContractRenderer.hpp"
#include "StripRewriter.hpp"

// Reduces the signature of every retained function to plain Rust: contract clauses, exec and
// spec-only modifiers, named return bindings and ghost / tracked parameters go away.
class SignatureStripper : public StripRewriter<SignatureStripper> {
   public:
    using StripRewriter::StripRewriter;

    ShouldVisitChildren handle(FunctionDeclarationSyntax& node) {
        if (node.contract)
            removeContract(node);
        for (auto modifier : node.verusModifiers)
            removeKeepingTrivia(*modifier);
        if (node.returnType && node.returnType->isNamed)
            unnameReturn(*node.returnType);
        if (isFreeFunction(node))
            recordParameters(node);
        removeListElements(*node.parameters, [](SyntaxNode& element) {
            return element.as<ParameterSyntax>().qualifier != Qualifier::Executable;
        });
        return VISIT_CHILDREN;
    }

    // closure `|x| -> (r: T) requires .. ensures .. { }`
    ShouldVisitChildren handle(ContractSpecSyntax& node) {
        if (!node.parent || node.parent->kind != SyntaxKind::Expression)
            return DONT_VISIT_CHILDREN;
        removeNode(node);
        if (auto next = nextToken(node))
            joinAroundContract(node, *next);
        return DONT_VISIT_CHILDREN;
    }

    ShouldVisitChildren handle(ReturnTypeSyntax& node) {
        if (node.parent && node.parent->kind == SyntaxKind::Expression && node.isNamed)
            unnameReturn(node);
        return DONT_VISIT_CHILDREN;
    }

   private:
    static bool isFreeFunction(const FunctionDeclarationSyntax& node) {
        if (!node.parent)
            return false;
        SyntaxKind kind = node.parent->kind;
        return kind == SyntaxKind::SourceFile || kind == SyntaxKind::ModuleDeclaration ||
               kind == SyntaxKind::ItemStatement;
    }

    // remember which arguments calls of this function lose
    void recordParameters(FunctionDeclarationSyntax& node) {
        ParameterRemovals removals;
        auto parameters = node.parameters->elements();
        removals.count = parameters.size();
        for (size_t i = 0; i < parameters.size(); i++) {
            if (parameters[i]->as<ParameterSyntax>().qualifier != Qualifier::Executable)
                removals.positions.push_back(i);
        }

        auto [it, inserted] =
            context.removedParameters.try_emplace(std::string(node.name->token.text), removals);
        if (!inserted && (it->second.count != removals.count ||
                          it->second.positions != removals.positions))
            it->second.ambiguous = true;
    }

    void removeContract(FunctionDeclarationSyntax& node) {
        if (context.options.specAsComments)
            insertContractComment(tree, node);
        removeNode(*node.contract);
        if (auto next = node.body ? node.body->open : node.semicolon)
            joinAroundContract(*node.contract, *next);
    }

    // `-> T\n    requires ..\n{` becomes `-> T {`, `-> T ensures ..;` becomes `-> T;`
    static void joinAroundContract(SyntaxNode& contract, TokenSyntax& next) {
        auto& leading = next.token.leadingTrivia;
        if (!isBlankTrivia(leading))
            return;
        TokenSyntax* previous = nullptr;
        auto& siblings = contract.parent->children;
        for (auto it = std::find(siblings.begin(), siblings.end(), &contract);
             it != siblings.begin() && !previous;) {
            --it;
            if (!(*it)->isRemoved())
                previous = (*it)->getLastToken();
        }
        if (previous) {
            // a line comment after the signature keeps its line break
            if (!isBlankTrivia(previous->token.trailingTrivia))
                return;
            previous->token.trailingTrivia = "";
        }
        leading = next.is(";") ? "" : " ";
    }

    // -> (r: T) becomes -> T
    void unnameReturn(ReturnTypeSyntax& node) {
        auto close = node.closeParen;
        auto& children = node.children;
        auto it = std::find(children.begin(), children.end(), close);
        ASSERT(it != children.begin() && it != children.end(), "named return without type");
        if (auto last = (*(it - 1))->getLastToken()) {
            last->token.trailingTrivia = tree.makeText(std::string(last->token.trailingTrivia) +
                                                       std::string(close->token.trailingTrivia));
        }
        for (auto token : node.binding)
            removeNode(*token);
        removeNode(*close);
    }
};

template void rewriteStage<SignatureStripper>(SyntaxTree& tree,
                                              StripContext& context,
                                              const std::string& stageName);
