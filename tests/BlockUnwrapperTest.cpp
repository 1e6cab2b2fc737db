// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "BlockUnwrapper.hpp"
#include "Errors.hpp"
#include "TestHelpers.hpp"

TEST(FindMatchingBrace, Nested) {
    EXPECT_EQ(findMatchingBrace("{ { } }", 0), 6u);
    EXPECT_EQ(findMatchingBrace("{ { } }", 2), 4u);
}

TEST(FindMatchingBrace, IgnoresBracesInStrings) {
    EXPECT_EQ(findMatchingBrace("{ \"}\" }", 0), 6u);
    EXPECT_EQ(findMatchingBrace("{ \"\\\"}\" }", 0), 8u);

    std::string text = "{ let s = \"a { b\"; }";
    EXPECT_EQ(findMatchingBrace(text, 0), text.size() - 1);
}

TEST(FindMatchingBrace, IgnoresBracesInCharLiterals) {
    EXPECT_EQ(findMatchingBrace("{ '}' }", 0), 6u);
    EXPECT_EQ(findMatchingBrace("{ '\\'' }", 0), 7u);

    std::string text = "{ if c == '{' { x } }";
    EXPECT_EQ(findMatchingBrace(text, 0), text.size() - 1);
}

TEST(FindMatchingBrace, IgnoresBracesInComments) {
    EXPECT_EQ(findMatchingBrace("{ // }\n}", 0), 7u);
    EXPECT_EQ(findMatchingBrace("{ /* } */ }", 0), 10u);
}

TEST(FindMatchingBrace, LifetimesDoNotOpenLiterals) {
    std::string text = "{ fn f<'a>(x: &'a u8) -> &'static u8 { x } }";
    EXPECT_EQ(findMatchingBrace(text, 0), text.size() - 1);

    text = "{ 'outer: loop { break 'outer; } }";
    EXPECT_EQ(findMatchingBrace(text, 0), text.size() - 1);
}

TEST(FindMatchingBrace, Unmatched) {
    EXPECT_THROW(findMatchingBrace("{ {", 0), StructuralError);
    EXPECT_THROW(findMatchingBrace("{ \"}", 0), StructuralError);
    EXPECT_THROW(findMatchingBrace("{ /* } ", 0), StructuralError);
}

TEST(LexicalScanner, QuoteFollowedByLetter) {
    LexicalScanner lifetime("'a ");
    EXPECT_EQ(lifetime.step(0), 2u);
    EXPECT_EQ(lifetime.getState(), ScanState::Normal);

    LexicalScanner literal("'a'");
    EXPECT_EQ(literal.step(0), 3u);
    EXPECT_EQ(literal.getState(), ScanState::Normal);
}

TEST(LexicalScanner, CharLiteralState) {
    LexicalScanner scanner("'{' x");
    size_t i = scanner.step(0);
    EXPECT_EQ(scanner.getState(), ScanState::InChar);
    EXPECT_FALSE(scanner.inCode());
    i = scanner.step(i);
    EXPECT_EQ(scanner.getState(), ScanState::InChar);
    i = scanner.step(i);
    EXPECT_EQ(i, 3u);
    EXPECT_EQ(scanner.getState(), ScanState::Normal);
    EXPECT_TRUE(scanner.inCode());
}

TEST(LexicalScanner, PendingEscape) {
    LexicalScanner scanner("\"\\\"\"");
    size_t i = scanner.step(0);
    EXPECT_EQ(scanner.getState(), ScanState::InString);
    i = scanner.step(i);
    EXPECT_FALSE(scanner.inCode());
    i = scanner.step(i);
    EXPECT_EQ(scanner.getState(), ScanState::InString);
    scanner.step(i);
    EXPECT_EQ(scanner.getState(), ScanState::Normal);
}

TEST(UnwrapVerusBlocks, RemovesWrapper) {
    EXPECT_EQ(unwrapVerusBlocks("verus! {\nfn f() {}\n}\n"), "\nfn f() {}\n\n\n");
}

TEST(UnwrapVerusBlocks, KeepsSurroundingText) {
    EXPECT_EQ(unwrapVerusBlocks("use a;\nverus! {\nfn f() {}\n}\nfn g() {}\n"),
              "use a;\n\nfn f() {}\n\n\nfn g() {}\n");
}

TEST(UnwrapVerusBlocks, KeepsLinePositions) {
    std::string text = "use a;\n\nverus! {\n\nfn f() {}\n}\n";
    std::string unwrapped = unwrapVerusBlocks(text);
    auto lineOf = [](const std::string& str, std::string_view needle) {
        return std::count(str.begin(), str.begin() + str.find(needle), '\n');
    };
    EXPECT_EQ(lineOf(unwrapped, "fn f"), lineOf(text, "fn f"));
}

TEST(UnwrapVerusBlocks, DropsClosingMarkerComment) {
    EXPECT_EQ(unwrapVerusBlocks("verus! {\nfn f() {}\n} // verus!\n"), "\nfn f() {}\n\n\n");
    EXPECT_EQ(unwrapVerusBlocks("verus! {\nfn f() {}\n} // end\n"), "\nfn f() {}\n\n // end\n");
}

TEST(UnwrapVerusBlocks, Nested) {
    std::string text = "verus! {\nmod m {\nverus! {\nfn f() {}\n}\n}\n}\n";
    EXPECT_EQ(flatten(unwrapVerusBlocks(text)), "mod m { fn f() {} }");
}

TEST(UnwrapVerusBlocks, MultipleBlocks) {
    std::string text = "verus! { fn a() {} }\nfn b() {}\nverus! { fn c() {} }\n";
    EXPECT_EQ(flatten(unwrapVerusBlocks(text)), "fn a() {} fn b() {} fn c() {}");
}

TEST(UnwrapVerusBlocks, IgnoresMarkersOutsideCode) {
    std::string inString = "fn f() { let s = \"verus! {\"; }\n";
    EXPECT_EQ(unwrapVerusBlocks(inString), inString);

    std::string inComment = "// verus! {\nfn f() {}\n/* verus! { */\n";
    EXPECT_EQ(unwrapVerusBlocks(inComment), inComment);

    std::string glued = "myverus! { x }\n";
    EXPECT_EQ(unwrapVerusBlocks(glued), glued);
}

TEST(UnwrapVerusBlocks, BracesInsideLiterals) {
    std::string text = "verus! {\nfn f() -> &'static str { \"a { b\" }\nfn g() -> char { '}' }\n}\n";
    EXPECT_EQ(flatten(unwrapVerusBlocks(text)),
              "fn f() -> &'static str { \"a { b\" } fn g() -> char { '}' }");
}

TEST(UnwrapVerusBlocks, UnmatchedWrapper) {
    try {
        unwrapVerusBlocks("fn a() {}\nverus! {\nfn f() {\n}\n");
        FAIL() << "expected StructuralError";
    } catch (const StructuralError& error) {
        EXPECT_NE(std::string(error.what()).find("line 2"), std::string::npos);
        EXPECT_FALSE(error.getHint().empty());
    }
}
