// SPDX-License-Identifier: Apache-2.0
#include "StripRewriter.hpp"

// Removes items and attributes that only the verifier understands: vstd / builtin imports,
// broadcast groups, spec constants, #[verifier::...] and friends.
class ImportsRemover : public StripRewriter<ImportsRemover> {
   public:
    using StripRewriter::StripRewriter;

    ShouldVisitChildren handle(OpaqueItemSyntax& node) {
        if (node.verificationOnly) {
            if (node.parent && node.parent->kind == SyntaxKind::ItemStatement)
                removeNode(node.parent->as<ItemStatementSyntax>());
            else
                removeNode(node);
        } else if (node.unknownVerification) {
            auto& sm = tree.sourceManager();
            auto location = node.getLocation();
            context.warnings.push_back(
                "line " + std::to_string(sm.getLineNumber(location)) +
                ": unrecognized verification item kept as is: " + firstLine(node));
        }
        return DONT_VISIT_CHILDREN;
    }

    ShouldVisitChildren handle(AttributeSyntax& node) {
        if (!node.isVerificationOnly())
            return DONT_VISIT_CHILDREN;
        removeKeepingTrivia(node);
        return DONT_VISIT_CHILDREN;
    }

   private:
    static std::string firstLine(SyntaxNode& node) {
        std::string text = normalizedText(node);
        text = text.substr(0, text.find('{'));
        return text.substr(0, text.find_last_not_of(' ') + 1);
    }
};

template void rewriteStage<ImportsRemover>(SyntaxTree& tree,
                                           StripContext& context,
                                           const std::string& stageName);
