// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>
#include <slang/text/SourceManager.h>
#include <string>
#include <vector>
#include "Errors.hpp"
#include "Lexer.hpp"

using namespace slang;

class LexerTest : public ::testing::Test {
   protected:
    std::vector<Token> lex(std::string_view text) {
        auto buffer = sourceManager.assignText("lexer_test_" + std::to_string(counter++) + ".rs",
                                               text);
        std::string_view data = buffer.data;
        if (!data.empty() && data.back() == '\0')
            data.remove_suffix(1);
        return Lexer(data, buffer.id, sourceManager).lex();
    }

    static std::vector<std::string> texts(const std::vector<Token>& tokens) {
        std::vector<std::string> result;
        for (auto& token : tokens) {
            if (token.kind != TokenKind::EndOfFile)
                result.emplace_back(token.text);
        }
        return result;
    }

    SourceManager sourceManager;
    int counter = 0;
};

TEST_F(LexerTest, Lossless) {
    std::string text =
        "// header\nfn f(x: u32) -> u32 /* c */ {\n    x + 1 // done\n}\n\n  /* tail */\n";
    std::string printed;
    for (auto& token : lex(text)) {
        printed += token.leadingTrivia;
        printed += token.text;
        printed += token.trailingTrivia;
    }
    EXPECT_EQ(printed, text);
}

TEST_F(LexerTest, TriviaSplitsAtNewline) {
    auto tokens = lex("a // one\n  b");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].trailingTrivia, " // one");
    EXPECT_EQ(tokens[1].leadingTrivia, "\n  ");
    EXPECT_EQ(tokens[1].text, "b");
}

TEST_F(LexerTest, VerusOperators) {
    auto tokens = lex("a ==> b <==> c <== d &&& e ||| f =~= g !== h === i");
    std::vector<std::string> expected = {"a", "==>", "b", "<==>", "c",  "<==", "d", "&&&", "e",
                                         "|||", "f", "=~=", "g", "!==", "h", "===", "i"};
    EXPECT_EQ(texts(tokens), expected);
}

TEST_F(LexerTest, LifetimesAndCharLiterals) {
    auto tokens = lex("'a 'static 'x' '\\n' '\\'' b'c'");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Lifetime);
    EXPECT_EQ(tokens[0].text, "'a");
    EXPECT_EQ(tokens[1].kind, TokenKind::Lifetime);
    EXPECT_EQ(tokens[2].kind, TokenKind::CharLiteral);
    EXPECT_EQ(tokens[2].text, "'x'");
    EXPECT_EQ(tokens[3].kind, TokenKind::CharLiteral);
    EXPECT_EQ(tokens[4].kind, TokenKind::CharLiteral);
    EXPECT_EQ(tokens[4].text, "'\\''");
    EXPECT_EQ(tokens[5].kind, TokenKind::CharLiteral);
}

TEST_F(LexerTest, StringLiterals) {
    auto tokens = lex(R"(" { " r"raw \ " r#"a "quoted" b"# b"bytes")");
    ASSERT_EQ(tokens.size(), 5u);
    for (size_t i = 0; i < 4; i++)
        EXPECT_EQ(tokens[i].kind, TokenKind::StringLiteral) << i;
    EXPECT_EQ(tokens[2].text, R"(r#"a "quoted" b"#)");
}

TEST_F(LexerTest, StringTokensDoNotMatchPunctuation) {
    auto tokens = lex("\";\" ;");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_FALSE(tokens[0].is(";"));
    EXPECT_TRUE(tokens[1].is(";"));
}

TEST_F(LexerTest, Numbers) {
    auto tokens = lex("1_000u64 0xFFu8 1.5e-3 1..2");
    std::vector<std::string> expected = {"1_000u64", "0xFFu8", "1.5e-3", "1", "..", "2"};
    EXPECT_EQ(texts(tokens), expected);
}

TEST_F(LexerTest, NestedBlockComments) {
    auto tokens = lex("/* a /* b */ c */ x");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].text, "x");
    EXPECT_EQ(tokens[0].leadingTrivia, "/* a /* b */ c */ ");
}

TEST_F(LexerTest, Delimiters) {
    auto tokens = lex("({[]})");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].kind, TokenKind::OpenParen);
    EXPECT_EQ(tokens[1].kind, TokenKind::OpenBrace);
    EXPECT_EQ(tokens[2].kind, TokenKind::OpenBracket);
    EXPECT_EQ(tokens[3].kind, TokenKind::CloseBracket);
    EXPECT_EQ(tokens[4].kind, TokenKind::CloseBrace);
    EXPECT_EQ(tokens[5].kind, TokenKind::CloseParen);
    EXPECT_EQ(tokens[6].kind, TokenKind::EndOfFile);
}

TEST_F(LexerTest, Errors) {
    EXPECT_THROW(lex("\"open"), SyntaxError);
    EXPECT_THROW(lex("/* open"), SyntaxError);
    EXPECT_THROW(lex("r#\"open\""), SyntaxError);

    try {
        lex("fn f() {\n    \"open\n}");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& error) {
        EXPECT_EQ(error.getLine(), 2u);
        EXPECT_EQ(error.getColumn(), 5u);
    }
}
