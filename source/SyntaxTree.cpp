// SPDX-License-Identifier: Apache-2.0
#include "SyntaxTree.hpp"
#include "Lexer.hpp"
#include "Parser.hpp"

static void setParents(SyntaxNode& node) {
    for (auto child : node.children) {
        child->parent = &node;
        setParents(*child);
    }
}

static void compactNode(SyntaxNode& node) {
    size_t kept = 0;
    for (auto child : node.children) {
        if (!child->isRemoved()) {
            node.children[kept++] = child;
            compactNode(*child);
        }
    }
    node.children = node.children.first(kept);
}

std::shared_ptr<SyntaxTree> SyntaxTree::fromText(std::string_view text,
                                                 SourceManager& sourceManager,
                                                 std::string_view name) {
    auto buffer = sourceManager.assignText(name, text);
    std::string_view data = buffer.data;
    // SourceManager keeps a null terminator at the end of the buffer
    if (!data.empty() && data.back() == '\0')
        data.remove_suffix(1);

    auto tokens = Lexer(data, buffer.id, sourceManager).lex();

    std::shared_ptr<SyntaxTree> tree(new SyntaxTree(sourceManager));
    Parser parser(std::move(tokens), *tree);
    tree->rootNode = &parser.parseSourceFile();
    setParents(*tree->rootNode);
    return tree;
}

std::string_view SyntaxTree::makeText(std::string text) {
    return ownedText.emplace_back(std::move(text));
}

bool isBlankTrivia(std::string_view trivia) {
    return trivia.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

void SyntaxTree::transferLeadingTrivia(TokenSyntax& from, TokenSyntax& to) {
    std::string_view moved = from.token.leadingTrivia;
    from.token.leadingTrivia = {};
    std::string_view target = to.token.leadingTrivia;
    if (moved.empty()) {
        // the removed token opened the file, its line ending goes with it
        size_t newline = target.find('\n');
        if (from.token.location.offset() == 0 && newline != std::string_view::npos &&
            isBlankTrivia(target.substr(0, newline + 1)))
            to.token.leadingTrivia = target.substr(newline + 1);
        return;
    }
    if (target.find('\n') == std::string_view::npos) {
        // same line as the removed token, take over its position
        to.token.leadingTrivia = moved;
        return;
    }
    // keep comments and blank lines, drop the indentation of the removed line
    size_t lastNewline = moved.rfind('\n');
    if (lastNewline != std::string_view::npos && isBlankTrivia(moved.substr(lastNewline)))
        moved = moved.substr(0, lastNewline);
    else if (lastNewline == std::string_view::npos && isBlankTrivia(moved))
        moved = {};
    if (!moved.empty())
        to.token.leadingTrivia = makeText(std::string(moved) + std::string(target));
}

void SyntaxTree::compact() {
    compactNode(*rootNode);
}
