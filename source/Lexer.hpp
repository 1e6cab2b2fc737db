// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/text/SourceManager.h>
#include <string>
#include <string_view>
#include <vector>
#include "Token.hpp"

// Splits source text into tokens. Every byte ends up either in a token's text or in its trivia,
// so concatenating leading trivia, text and trailing trivia of all tokens gives back the input.
class Lexer {
   public:
    Lexer(std::string_view text, BufferID buffer, const SourceManager& sourceManager)
        : text(text), buffer(buffer), sourceManager(sourceManager) {}

    // throws SyntaxError on unterminated literals and comments
    std::vector<Token> lex();

   private:
    std::string_view text;
    size_t pos = 0;
    BufferID buffer;
    const SourceManager& sourceManager;

    char peek(size_t ahead = 0) const {
        return pos + ahead < text.size() ? text[pos + ahead] : '\0';
    }

    std::string_view lexLeadingTrivia();
    std::string_view lexTrailingTrivia();
    bool skipComment();
    Token lexToken();

    void lexIdentifier();
    void lexQuoted(char terminator);
    void lexRawString();
    TokenKind lexCharOrLifetime();
    void lexNumber();
    TokenKind lexPunctuation();

    [[noreturn]] void error(size_t offset, const std::string& message) const;
};

bool isIdentifierStart(char c);
bool isIdentifierChar(char c);
