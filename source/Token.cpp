// SPDX-License-Identifier: Apache-2.0
#include "Token.hpp"
#include <slang/util/Hash.h>

static const flat_hash_set<std::string_view> keywords = {
    "as",     "async", "await", "break",  "const", "continue", "crate",  "dyn",
    "else",   "enum",  "extern", "false", "fn",    "for",      "if",     "impl",
    "in",     "let",   "loop",  "match",  "mod",   "move",     "mut",    "pub",
    "ref",    "return", "self", "Self",   "static", "struct",  "super",  "trait",
    "true",   "type",  "unsafe", "use",   "where", "while",    "yield",
};

// keywords that still denote a value or a path start inside an expression
static const flat_hash_set<std::string_view> operandKeywords = {
    "self", "Self", "super", "crate", "true", "false",
};

static const flat_hash_set<std::string_view> contractKeywords = {
    "requires", "recommends", "ensures",   "default_ensures",
    "returns",  "decreases",  "opens_invariants", "no_unwind",
};

static const flat_hash_set<std::string_view> loopSpecKeywords = {
    "invariant", "invariant_except_break", "invariant_ensures", "ensures", "decreases",
};

static const flat_hash_set<std::string_view> assignmentOperators = {
    "=", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "<<=", ">>=",
};

static const flat_hash_set<std::string_view> binaryOperators = {
    "+",  "-",  "*",  "/",  "%",  "==", "!=", "<",   ">",   "<=",  ">=",  "&&",
    "||", "&",  "|",  "^",  "<<", ">>", "..", "..=", "==>", "<==", "<==>", "===",
    "=~=", "=~~=", "!==", "as",
};

bool Token::isKeyword() const {
    return kind == TokenKind::Identifier && isRustKeyword(text);
}

bool Token::isOperandName() const {
    return kind == TokenKind::Identifier && (!isRustKeyword(text) || operandKeywords.contains(text));
}

TokenKind closingDelimiterFor(TokenKind open) {
    switch (open) {
        case TokenKind::OpenParen:
            return TokenKind::CloseParen;
        case TokenKind::OpenBracket:
            return TokenKind::CloseBracket;
        case TokenKind::OpenBrace:
            return TokenKind::CloseBrace;
        default:
            return TokenKind::Unknown;
    }
}

bool isRustKeyword(std::string_view text) {
    return keywords.contains(text);
}

bool isContractKeyword(std::string_view text) {
    return contractKeywords.contains(text);
}

bool isLoopSpecKeyword(std::string_view text) {
    return loopSpecKeywords.contains(text);
}

bool isAssignmentOperator(std::string_view text) {
    return assignmentOperators.contains(text);
}

bool isBinaryOperator(std::string_view text) {
    return binaryOperators.contains(text);
}
