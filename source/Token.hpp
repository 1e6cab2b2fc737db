// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/text/SourceLocation.h>
#include <cstdint>
#include <string_view>

using namespace slang;

enum class TokenKind : uint8_t {
    Identifier,
    Lifetime,
    CharLiteral,
    StringLiteral,
    NumberLiteral,
    Punctuation,
    OpenParen,
    CloseParen,
    OpenBracket,
    CloseBracket,
    OpenBrace,
    CloseBrace,
    Unknown,
    EndOfFile,
};

// A lexeme with the whitespace and comments around it.
// leadingTrivia covers everything between the previous token's trailing trivia and this token,
// trailingTrivia covers whitespace and comments that follow on the same line.
struct Token {
    TokenKind kind = TokenKind::EndOfFile;
    std::string_view text;
    std::string_view leadingTrivia;
    std::string_view trailingTrivia;
    SourceLocation location;

    bool is(std::string_view str) const {
        return text == str && kind != TokenKind::StringLiteral && kind != TokenKind::CharLiteral;
    }
    bool isIdentifier() const { return kind == TokenKind::Identifier; }
    bool isKeyword() const;
    // identifier that is not a reserved keyword, or one of the keywords usable as a value
    bool isOperandName() const;
    bool isLiteral() const {
        return kind == TokenKind::CharLiteral || kind == TokenKind::StringLiteral ||
               kind == TokenKind::NumberLiteral;
    }
    bool isOpenDelimiter() const {
        return kind == TokenKind::OpenParen || kind == TokenKind::OpenBracket ||
               kind == TokenKind::OpenBrace;
    }
    bool isCloseDelimiter() const {
        return kind == TokenKind::CloseParen || kind == TokenKind::CloseBracket ||
               kind == TokenKind::CloseBrace;
    }
};

TokenKind closingDelimiterFor(TokenKind open);
bool isRustKeyword(std::string_view text);
bool isContractKeyword(std::string_view text);
bool isLoopSpecKeyword(std::string_view text);
bool isAssignmentOperator(std::string_view text);
bool isBinaryOperator(std::string_view text);
