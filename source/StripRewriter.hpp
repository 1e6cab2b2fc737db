// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <algorithm>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include "StripContext.hpp"
#include "SyntaxTree.hpp"
#include "SyntaxVisitor.hpp"
#include "Utils.hpp"

template <typename TDerived>
class StripRewriter {
    // Single pass node remover - nodes are tombstoned during traversal, SyntaxTree::compact()
    // sweeps them afterwards
   public:
    enum ShouldVisitChildren {
        VISIT_CHILDREN,
        DONT_VISIT_CHILDREN,
    };

    StripRewriter(SyntaxTree& tree, StripContext& context, StripStats& stats)
        : tree(tree), context(context), stats(stats) {}

    /// Visit all retained child nodes
    template <typename T>
    void visitDefault(T&& node) {
        for (auto child : node.children) {
            if (!child->isRemoved())
                child->visit(*DERIVED);
        }
    }

    // Try to call type-specific handler, and visit node's children. Visiting children can be
    // disabled by returning DONT_VISIT_CHILDREN from handle(). leave() runs once the children are
    // done, for rules that need the filtered child list.
    template <typename T>
    void visit(T&& node) {
        if constexpr (requires { DERIVED->handle(node); }) {
            if (DERIVED->handle(node) == VISIT_CHILDREN) {
                DERIVED->visitDefault(node);
            }
        } else {
            DERIVED->visitDefault(node);
        }

        if constexpr (requires { DERIVED->leave(node); }) {
            if (!node.isRemoved())
                DERIVED->leave(node);
        }
    }

    template <typename T>
    void logType(const T& node) {
        std::string name;
        if constexpr (std::is_same_v<T, SyntaxNode>)
            name = toString(node.kind);
        else
            name = STRINGIZE_NODE_TYPE(T);
        if (context.log)
            *context.log << name << "\n";
        stats.recordRemoval(name);
    }

    template <typename T>
    void removeNode(T& node) {
        if (node.isRemoved())
            return;
        logType<std::remove_cvref_t<T>>(node);
        if (context.log)
            *context.log << prefixLines(node.toString(), "-") << "\n";
        node.markRemoved();
    }

    // Remove node, handing the leading trivia of its first token to the token that follows it.
    void removeKeepingTrivia(SyntaxNode& node) {
        auto first = node.getFirstToken();
        auto next = nextToken(node);
        if (first && next)
            tree.transferLeadingTrivia(*first, *next);
        removeNode(node);
    }

    // first retained token after node, nullptr at the end of the tree
    static TokenSyntax* nextToken(SyntaxNode& node) {
        for (SyntaxNode* current = &node; current->parent; current = current->parent) {
            auto& siblings = current->parent->children;
            auto it = std::find(siblings.begin(), siblings.end(), current);
            for (++it; it != siblings.end(); ++it) {
                if ((*it)->isRemoved())
                    continue;
                if (auto token = (*it)->getFirstToken())
                    return token;
            }
        }
        return nullptr;
    }

    // Remove elements of a comma separated list matching pred. Each retained element but the last
    // keeps its ',', the last one keeps it only if the list had a trailing ','.
    // Returns the number of removed elements.
    template <typename TPred>
    size_t removeListElements(DelimitedListSyntax& list, TPred&& pred) {
        SmallVector<std::pair<SyntaxNode*, TokenSyntax*>, 8> entries;
        for (auto child : list.children) {
            if (child->isRemoved() || child == list.open || child == list.close)
                continue;
            if (child->kind == SyntaxKind::Token && child->as<TokenSyntax>().is(",")) {
                if (!entries.empty() && !entries.back().second)
                    entries.back().second = &child->as<TokenSyntax>();
                continue;
            }
            entries.push_back({child, nullptr});
        }
        if (entries.empty())
            return 0;

        bool trailingSeparator = entries.back().second != nullptr;
        auto firstToken = entries.front().first->getFirstToken();
        std::string_view firstLeading = firstToken ? firstToken->token.leadingTrivia : "";

        size_t removed = 0;
        SmallVector<std::pair<SyntaxNode*, TokenSyntax*>, 8> retained;
        for (auto& [element, separator] : entries) {
            if (pred(*element)) {
                removeNode(*element);
                if (separator)
                    separator->markRemoved();
                removed++;
            } else {
                retained.push_back({element, separator});
            }
        }
        if (!removed || retained.empty())
            return removed;

        if (retained.back().second && !trailingSeparator)
            retained.back().second->markRemoved();
        // `{ a, ghost b }` becomes `{ a }`
        if (entries.back().first->isRemoved() && !trailingSeparator) {
            auto removedLast = entries.back().first->getLastToken();
            auto retainedLast = retained.back().first->getLastToken();
            if (removedLast && retainedLast && isBlankTrivia(removedLast->token.trailingTrivia) &&
                isBlankTrivia(retainedLast->token.trailingTrivia))
                retainedLast->token.trailingTrivia = removedLast->token.trailingTrivia;
        }
        // the new first element takes the position of the old one
        if (entries.front().first->isRemoved()) {
            if (auto token = retained.front().first->getFirstToken())
                token->token.leadingTrivia = firstLeading;
        }
        return removed;
    }

    void transform() { DERIVED->visit(tree.root()); }

   protected:
    SyntaxTree& tree;
    StripContext& context;
    StripStats& stats;
};

// Run one removal stage over tree and sweep what it removed.
template <typename T>
void rewriteStage(SyntaxTree& tree, StripContext& context, const std::string& stageName) {
    StripStats stats(stageName, context.file);
    stats.begin(tree);
    T rewriter(tree, context, stats);
    rewriter.transform();
    tree.compact();
    stats.end(tree);
    if (context.log)
        stats.report(*context.log);
    context.stats.push_back(stats);
}
