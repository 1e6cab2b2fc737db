// SPDX-License-Identifier: Apache-2.0
#include "StripRewriter.hpp"

// Drops spec, proof and axiom functions wherever they are declared.
class ModeRemover : public StripRewriter<ModeRemover> {
   public:
    using StripRewriter::StripRewriter;

    ShouldVisitChildren handle(FunctionDeclarationSyntax& node) {
        if (node.mode == FunctionMode::Executable)
            return VISIT_CHILDREN;
        removeFunction(node);
        return DONT_VISIT_CHILDREN;
    }

    // second sweep over whatever the traversal above left behind
    void leave(SourceFileSyntax& node) { sweep(node); }

   private:
    void removeFunction(FunctionDeclarationSyntax& node) {
        // a nested item goes together with its statement
        if (node.parent && node.parent->kind == SyntaxKind::ItemStatement)
            removeNode(node.parent->as<ItemStatementSyntax>());
        else
            removeNode(node);
    }

    void sweep(SyntaxNode& node) {
        for (auto child : node.children) {
            if (child->isRemoved())
                continue;
            if (child->kind == SyntaxKind::FunctionDeclaration &&
                child->as<FunctionDeclarationSyntax>().mode != FunctionMode::Executable) {
                removeFunction(child->as<FunctionDeclarationSyntax>());
                continue;
            }
            sweep(*child);
        }
    }
};

template void rewriteStage<ModeRemover>(SyntaxTree& tree,
                                        StripContext& context,
                                        const std::string& stageName);
