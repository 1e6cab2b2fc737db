// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>
#include <slang/text/SourceManager.h>
#include <memory>
#include <string>
#include <vector>
#include "ContractRenderer.hpp"
#include "SyntaxPrinter.hpp"
#include "SyntaxTree.hpp"
#include "TestHelpers.hpp"

using namespace slang;

class ContractRendererTest : public ::testing::Test {
   protected:
    FunctionDeclarationSyntax& parseFunction(std::string_view text) {
        // names must be unique within one SourceManager
        tree = SyntaxTree::fromText(text, sourceManager,
                                    "contract_test_" + std::to_string(counter++) + ".rs");
        return childNodes(tree->root())[0]->as<FunctionDeclarationSyntax>();
    }

    std::vector<std::string> render(std::string_view text) {
        auto& fn = parseFunction(text);
        EXPECT_NE(fn.contract, nullptr);
        return renderContract(*fn.contract);
    }

    SourceManager sourceManager;
    std::shared_ptr<SyntaxTree> tree;
    int counter = 0;
};

TEST_F(ContractRendererTest, FixedClauseOrder) {
    auto lines = render(
        "fn f(x: u32) -> u32\n"
        "    ensures x + 1 > x,\n"
        "    requires x < 100,\n"
        "{ x + 1 }");
    std::vector<std::string> expected = {"requires x < 100", "ensures x + 1 > x"};
    EXPECT_EQ(lines, expected);
}

TEST_F(ContractRendererTest, JoinsExpressionsOfClause) {
    auto lines = render(
        "fn f(a: u32, b: u32)\n"
        "    requires\n"
        "        a > 0,\n"
        "        b > 0,\n"
        "{}");
    std::vector<std::string> expected = {"requires a > 0, b > 0"};
    EXPECT_EQ(lines, expected);
}

TEST_F(ContractRendererTest, DecreasesIsNeverRendered) {
    auto lines = render("fn f(n: u64)\n    requires n > 0,\n    decreases n,\n{}");
    std::vector<std::string> expected = {"requires n > 0"};
    EXPECT_EQ(lines, expected);

    EXPECT_TRUE(render("fn g(n: u64)\n    decreases n\n{}").empty());
}

TEST_F(ContractRendererTest, AuxiliaryExpressions) {
    auto lines = render(
        "fn f(x: u32)\n"
        "    recommends x > 1 via check_x,\n"
        "    no_unwind when x > 0\n"
        "{}");
    std::vector<std::string> expected = {"recommends x > 1 via check_x", "no_unwind when x > 0"};
    EXPECT_EQ(lines, expected);
}

TEST_F(ContractRendererTest, InvariantForms) {
    EXPECT_EQ(render("fn f()\n    opens_invariants any\n{}"),
              std::vector<std::string>{"opens_invariants any"});
    EXPECT_EQ(render("fn f()\n    opens_invariants none\n{}"),
              std::vector<std::string>{"opens_invariants none"});
    EXPECT_EQ(render("fn f()\n    opens_invariants [a, b]\n{}"),
              std::vector<std::string>{"opens_invariants [a, b]"});
    EXPECT_EQ(render("fn f()\n    opens_invariants set\n{}"),
              std::vector<std::string>{"opens_invariants set"});
}

TEST_F(ContractRendererTest, AllClauses) {
    auto lines = render(
        "fn f(x: u32) -> (r: u32)\n"
        "    no_unwind\n"
        "    opens_invariants any\n"
        "    returns x\n"
        "    default_ensures true\n"
        "    ensures r == x\n"
        "    recommends x > 0\n"
        "    requires x < 10\n"
        "{ x }");
    std::vector<std::string> expected = {
        "requires x < 10",        "recommends x > 0",    "ensures r == x", "default_ensures true",
        "returns x",              "opens_invariants any", "no_unwind",
    };
    EXPECT_EQ(lines, expected);
}

TEST_F(ContractRendererTest, CommentFollowsIndentation) {
    auto& fn = parseFunction("\n\n    pub fn f(x: u32)\n        requires x > 0,\n    {}\n");
    ASSERT_TRUE(insertContractComment(*tree, fn));
    std::string printed = SyntaxPrinter::printFile(*tree);
    EXPECT_EQ(printed.substr(0, printed.find("pub fn")),
              "\n\n    /// Specification (erased by verus-strip):\n"
              "    /// requires x > 0\n"
              "    ");
}

TEST_F(ContractRendererTest, PrivateFunctionsGetPlainComments) {
    auto& fn = parseFunction("fn f(x: u32)\n    requires x > 0,\n{}\n");
    ASSERT_TRUE(insertContractComment(*tree, fn));
    std::string printed = SyntaxPrinter::printFile(*tree);
    EXPECT_EQ(printed.substr(0, printed.find("fn f")),
              "// Specification (erased by verus-strip):\n// requires x > 0\n");
}

TEST_F(ContractRendererTest, NothingToRender) {
    auto& fn = parseFunction("fn f(n: u64)\n    decreases n,\n{}\n");
    EXPECT_FALSE(insertContractComment(*tree, fn));
    EXPECT_EQ(SyntaxPrinter::printFile(*tree), "fn f(n: u64)\n    decreases n,\n{}\n");
}
