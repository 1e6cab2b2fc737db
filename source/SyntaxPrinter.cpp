// SPDX-License-Identifier: Apache-2.0
#include "SyntaxPrinter.hpp"
#include "Lexer.hpp"
#include "SyntaxTree.hpp"

void SyntaxPrinter::append(std::string_view text) {
    if (text.empty())
        return;
    // after a removal two words may end up adjacent
    if (!buffer.empty() && isIdentifierChar(buffer.back()) && isIdentifierChar(text.front()))
        buffer += ' ';
    buffer += text;
}

SyntaxPrinter& SyntaxPrinter::print(const Token& token) {
    buffer += token.leadingTrivia;
    append(token.text);
    buffer += token.trailingTrivia;
    return *this;
}

SyntaxPrinter& SyntaxPrinter::print(const SyntaxNode& node) {
    if (node.kind == SyntaxKind::Token)
        return print(node.as<TokenSyntax>().token);
    for (auto child : node.children) {
        if (!child->isRemoved())
            print(*child);
    }
    return *this;
}

std::string SyntaxPrinter::printFile(const SyntaxTree& tree) {
    return SyntaxPrinter().print(tree.root()).str();
}
