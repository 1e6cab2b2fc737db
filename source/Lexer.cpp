// SPDX-License-Identifier: Apache-2.0
#include "Lexer.hpp"
#include <array>
#include "Errors.hpp"

bool isIdentifierStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool isIdentifierChar(char c) {
    return isIdentifierStart(c) || (c >= '0' && c <= '9');
}

static bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// length of the utf-8 sequence introduced by lead byte c
static size_t utf8Length(char c) {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80)
        return 1;
    if ((byte & 0xE0) == 0xC0)
        return 2;
    if ((byte & 0xF0) == 0xE0)
        return 3;
    if ((byte & 0xF8) == 0xF0)
        return 4;
    return 1;
}

// sorted longest first, so first match wins
static constexpr std::array<std::string_view, 35> punctuators = {
    "<==>", "=~~=", "...", "..=", "<<=", ">>=", "==>", "<==", "&&&", "|||", "=~=", "!==",
    "===",  "::",   "->",  "=>",  "==",  "!=",  "<=",  ">=",  "&&",  "||",  "+=",  "-=",
    "*=",   "/=",   "%=",  "^=",  "&=",  "|=",  "<<",  ">>",  "..",  "@",   "#",
};

std::vector<Token> Lexer::lex() {
    std::vector<Token> tokens;
    while (true) {
        Token token;
        token.leadingTrivia = lexLeadingTrivia();
        if (pos >= text.size()) {
            token.kind = TokenKind::EndOfFile;
            token.text = text.substr(pos, 0);
            token.location = SourceLocation(buffer, pos);
            tokens.push_back(token);
            return tokens;
        }
        Token lexed = lexToken();
        lexed.leadingTrivia = token.leadingTrivia;
        lexed.trailingTrivia = lexTrailingTrivia();
        tokens.push_back(lexed);
    }
}

// skip a comment starting at pos, return false if there is none
bool Lexer::skipComment() {
    if (peek() == '/' && peek(1) == '/') {
        while (pos < text.size() && text[pos] != '\n' && text[pos] != '\r')
            pos++;
        return true;
    }
    if (peek() == '/' && peek(1) == '*') {
        size_t start = pos;
        int depth = 0;
        while (pos < text.size()) {
            if (peek() == '/' && peek(1) == '*') {
                depth++;
                pos += 2;
            } else if (peek() == '*' && peek(1) == '/') {
                depth--;
                pos += 2;
                if (depth == 0)
                    return true;
            } else {
                pos++;
            }
        }
        error(start, "unterminated block comment");
    }
    return false;
}

std::string_view Lexer::lexLeadingTrivia() {
    size_t start = pos;
    while (pos < text.size()) {
        char c = text[pos];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            pos++;
        } else if (!skipComment()) {
            break;
        }
    }
    return text.substr(start, pos - start);
}

std::string_view Lexer::lexTrailingTrivia() {
    size_t start = pos;
    while (pos < text.size()) {
        char c = text[pos];
        if (c == ' ' || c == '\t') {
            pos++;
        } else if (!skipComment()) {
            break;
        }
    }
    return text.substr(start, pos - start);
}

Token Lexer::lexToken() {
    Token token;
    size_t start = pos;
    token.location = SourceLocation(buffer, start);
    char c = peek();

    if (c == 'r' && (peek(1) == '"' || (peek(1) == '#' && (peek(2) == '"' || peek(2) == '#')))) {
        lexRawString();
        token.kind = TokenKind::StringLiteral;
    } else if ((c == 'b' || c == 'c') && peek(1) == 'r' && (peek(2) == '"' || peek(2) == '#')) {
        pos++;
        lexRawString();
        token.kind = TokenKind::StringLiteral;
    } else if ((c == 'b' || c == 'c') && peek(1) == '"') {
        pos++;
        lexQuoted('"');
        token.kind = TokenKind::StringLiteral;
    } else if (c == 'b' && peek(1) == '\'') {
        pos++;
        lexQuoted('\'');
        token.kind = TokenKind::CharLiteral;
    } else if (c == 'r' && peek(1) == '#' && isIdentifierStart(peek(2))) {
        pos += 2;
        lexIdentifier();
        token.kind = TokenKind::Identifier;
    } else if (isIdentifierStart(c)) {
        lexIdentifier();
        token.kind = TokenKind::Identifier;
    } else if (isDigit(c)) {
        lexNumber();
        token.kind = TokenKind::NumberLiteral;
    } else if (c == '"') {
        lexQuoted('"');
        token.kind = TokenKind::StringLiteral;
    } else if (c == '\'') {
        token.kind = lexCharOrLifetime();
    } else {
        token.kind = lexPunctuation();
    }

    token.text = text.substr(start, pos - start);
    return token;
}

void Lexer::lexIdentifier() {
    while (pos < text.size() && isIdentifierChar(text[pos])) {
        pos += utf8Length(text[pos]);
    }
    if (pos > text.size())
        pos = text.size();
}

// pos is at the opening quote
void Lexer::lexQuoted(char terminator) {
    size_t start = pos;
    pos++;
    while (pos < text.size()) {
        char c = text[pos];
        if (c == '\\') {
            pos += 2;
        } else if (c == terminator) {
            pos++;
            return;
        } else {
            pos++;
        }
    }
    pos = text.size();
    error(start, terminator == '"' ? "unterminated string literal"
                                   : "unterminated character literal");
}

// pos is at the 'r' of r"..." / r#"..."#
void Lexer::lexRawString() {
    size_t start = pos;
    pos++;
    size_t hashes = 0;
    while (peek() == '#') {
        hashes++;
        pos++;
    }
    if (peek() != '"')
        error(start, "malformed raw string literal");
    pos++;
    while (pos < text.size()) {
        if (text[pos] == '"') {
            size_t n = 0;
            while (n < hashes && peek(1 + n) == '#')
                n++;
            if (n == hashes) {
                pos += 1 + hashes;
                return;
            }
        }
        pos++;
    }
    error(start, "unterminated raw string literal");
}

// 'x' and '\n' are character literals, 'a and 'static are lifetimes or labels
TokenKind Lexer::lexCharOrLifetime() {
    size_t start = pos;
    if (peek(1) == '\\') {
        lexQuoted('\'');
        return TokenKind::CharLiteral;
    }
    size_t len = utf8Length(peek(1));
    if (pos + 1 + len < text.size() && text[pos + 1 + len] == '\'') {
        pos += 2 + len;
        return TokenKind::CharLiteral;
    }
    if (isIdentifierStart(peek(1))) {
        pos++;
        lexIdentifier();
        return TokenKind::Lifetime;
    }
    error(start, "unterminated character literal");
}

void Lexer::lexNumber() {
    bool hex = peek() == '0' && (peek(1) == 'x' || peek(1) == 'X');
    while (pos < text.size()) {
        char c = text[pos];
        if (isIdentifierChar(c)) {
            pos++;
            if (!hex && (c == 'e' || c == 'E') && (peek() == '+' || peek() == '-') &&
                isDigit(peek(1)))
                pos++;
        } else if (c == '.' && isDigit(peek(1))) {
            pos++;
        } else {
            break;
        }
    }
}

TokenKind Lexer::lexPunctuation() {
    switch (peek()) {
        case '(':
            pos++;
            return TokenKind::OpenParen;
        case ')':
            pos++;
            return TokenKind::CloseParen;
        case '[':
            pos++;
            return TokenKind::OpenBracket;
        case ']':
            pos++;
            return TokenKind::CloseBracket;
        case '{':
            pos++;
            return TokenKind::OpenBrace;
        case '}':
            pos++;
            return TokenKind::CloseBrace;
        default:
            break;
    }

    std::string_view rest = text.substr(pos);
    for (auto punct : punctuators) {
        if (rest.starts_with(punct)) {
            pos += punct.size();
            return TokenKind::Punctuation;
        }
    }

    static constexpr std::string_view singles = "+-*/%^!&|=<>.,;:$?~\\";
    if (singles.find(peek()) != std::string_view::npos) {
        pos++;
        return TokenKind::Punctuation;
    }
    pos++;
    return TokenKind::Unknown;
}

void Lexer::error(size_t offset, const std::string& message) const {
    SourceLocation location(buffer, offset);
    throw SyntaxError(std::string(sourceManager.getFileName(location)),
                      sourceManager.getLineNumber(location),
                      sourceManager.getColumnNumber(location), message);
}
