// SPDX-License-Identifier: Apache-2.0
#include "Stripper.hpp"
#include <slang/text/SourceManager.h>
#include "BlockUnwrapper.hpp"
#include "StripRewritersFwd.hpp"
#include "SyntaxPrinter.hpp"
#include "SyntaxTree.hpp"

// whether any item survived
static bool hasItems(const SourceFileSyntax& root) {
    for (auto child : root.children) {
        if (!child->isRemoved() && child->kind != SyntaxKind::Token)
            return true;
    }
    return false;
}

StripResult stripSource(std::string_view text,
                        const StripOptions& options,
                        const std::string& name,
                        std::ostream* log) {
    std::string unwrapped = unwrapVerusBlocks(text);

    // every file gets its own manager, it refuses the same name twice
    SourceManager sourceManager;
    auto tree = SyntaxTree::fromText(unwrapped, sourceManager, name);

    StripContext context;
    context.options = options;
    context.file = name;
    context.log = log;

    rewriteStage<ModeRemover>(*tree, context, "modeRemover");
    rewriteStage<ImportsRemover>(*tree, context, "importsRemover");
    rewriteStage<FieldRemover>(*tree, context, "fieldRemover");
    rewriteStage<SignatureStripper>(*tree, context, "signatureStripper");
    rewriteStage<StatementsRemover>(*tree, context, "statementsRemover");
    rewriteStage<ArgumentRemover>(*tree, context, "argumentRemover");

    StripResult result;
    result.output = SyntaxPrinter::printFile(*tree);
    result.empty = !hasItems(tree->root());
    result.warnings = std::move(context.warnings);
    result.stats = std::move(context.stats);
    return result;
}

void dumpSyntaxTree(std::string_view text, const std::string& name, std::ostream& out) {
    std::string unwrapped = unwrapVerusBlocks(text);
    SourceManager sourceManager;
    auto tree = SyntaxTree::fromText(unwrapped, sourceManager, name);
    printSyntaxTree(*tree, out);
}
