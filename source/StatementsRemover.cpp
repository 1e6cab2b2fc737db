// SPDX-License-Identifier: Apache-2.0
#include <array>
#include "StripRewriter.hpp"

// macros whose whole invocation is proof code
static constexpr std::array<std::string_view, 6> proofMacros = {
    "proof", "calc", "assert_forall_by", "assert_by", "open_invariant", "open_local_invariant",
};

// Removes ghost and tracked bindings, proof-only statements, proof macros and loop specs.
class StatementsRemover : public StripRewriter<StatementsRemover> {
   public:
    using StripRewriter::StripRewriter;

    ShouldVisitChildren handle(LetStatementSyntax& node) {
        if (node.qualifier == Qualifier::Executable)
            return VISIT_CHILDREN;
        removeNode(node);
        return DONT_VISIT_CHILDREN;
    }

    ShouldVisitChildren handle(ExpressionStatementSyntax& node) {
        if (!node.expression->isProofOnly())
            return VISIT_CHILDREN;
        removeNode(node);
        return DONT_VISIT_CHILDREN;
    }

    ShouldVisitChildren handle(MacroStatementSyntax& node) {
        if (std::ranges::find(proofMacros, node.name()) == proofMacros.end())
            return VISIT_CHILDREN;
        removeNode(node);
        return DONT_VISIT_CHILDREN;
    }

    ShouldVisitChildren handle(LoopSpecSyntax& node) {
        removeNode(node);
        // `while c\n    invariant ...\n{` becomes `while c {`
        if (auto next = nextToken(node)) {
            auto& trivia = next->token.leadingTrivia;
            if (isBlankTrivia(trivia) && trivia.find('\n') != std::string_view::npos)
                trivia = " ";
        }
        return DONT_VISIT_CHILDREN;
    }
};

template void rewriteStage<StatementsRemover>(SyntaxTree& tree,
                                              StripContext& context,
                                              const std::string& stageName);
