// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "Errors.hpp"
#include "TestHelpers.hpp"

TEST(Stripper, RemovesContractClauses) {
    std::string input =
        "fn divide(a: u32, b: u32) -> u32\n"
        "    requires b > 0,\n"
        "    ensures a / b <= a,\n"
        "{\n"
        "    a / b\n"
        "}\n";
    EXPECT_EQ(strip(input), "fn divide(a: u32, b: u32) -> u32 {\n    a / b\n}\n");
}

TEST(Stripper, RemovesSpecificationFunctions) {
    std::string input =
        "fn a() {}\n"
        "\n"
        "spec fn b() -> bool { true }\n"
        "\n"
        "impl S {\n"
        "    pub closed spec fn view(&self) -> int { self.x as int }\n"
        "    proof fn lemma(&self) ensures self.view() >= 0 {}\n"
        "    fn c(&self) {}\n"
        "}\n"
        "\n"
        "axiom fn d();\n"
        "fn e() {}\n";
    EXPECT_EQ(dropBlankLines(strip(input)), "fn a() {}\nimpl S {\n    fn c(&self) {}\n}\nfn e() {}\n");
}

TEST(Stripper, RemovesNestedSpecificationFunctions) {
    std::string input =
        "fn outer() {\n"
        "    proof fn inner() {}\n"
        "    let x = 1;\n"
        "}\n";
    EXPECT_EQ(strip(input), "fn outer() {\n    let x = 1;\n}\n");
}

TEST(Stripper, RemovesGhostParameters) {
    EXPECT_EQ(strip("fn f(x: u32, ghost y: int) -> u32 { x + 1 }\n"),
              "fn f(x: u32) -> u32 { x + 1 }\n");
    EXPECT_EQ(strip("fn f(tracked p: Perm, x: u32) {}\n"), "fn f(x: u32) {}\n");
    EXPECT_EQ(strip("fn f(a: u8, b: Ghost<int>, c: u8) {}\n"), "fn f(a: u8, c: u8) {}\n");
    EXPECT_EQ(strip("fn f(ghost a: int, tracked b: Perm) {}\n"), "fn f() {}\n");
    EXPECT_EQ(strip("fn f(\n    a: u8,\n    b: Tracked<Perm>,\n) {}\n"), "fn f(\n    a: u8,\n) {}\n");
}

TEST(Stripper, RemovesGhostFields) {
    std::string input =
        "struct Account {\n"
        "    balance: u64,\n"
        "    ghost history: Seq<u64>,\n"
        "    owner: u32,\n"
        "}\n";
    EXPECT_EQ(strip(input), "struct Account {\n    balance: u64,\n    owner: u32,\n}\n");
}

TEST(Stripper, RemovesGhostVariantFields) {
    std::string input =
        "enum Message {\n"
        "    Quit,\n"
        "    Move { x: i32, ghost origin: int },\n"
        "    Write(String, Ghost<nat>),\n"
        "}\n";
    EXPECT_EQ(strip(input),
              "enum Message {\n    Quit,\n    Move { x: i32 },\n    Write(String),\n}\n");
}

TEST(Stripper, RemovesAssertKeepsArithmetic) {
    std::string input =
        "fn f(x: u32) -> u32 {\n"
        "    assert(x > 0);\n"
        "    let y = x + 1;\n"
        "    y\n"
        "}\n";
    EXPECT_EQ(strip(input), "fn f(x: u32) -> u32 {\n    let y = x + 1;\n    y\n}\n");
}

TEST(Stripper, SpecAsComments) {
    std::string input =
        "fn divide(a: u32, b: u32) -> u32\n"
        "    requires b > 0,\n"
        "    ensures a / b <= a,\n"
        "{\n"
        "    a / b\n"
        "}\n";
    EXPECT_EQ(strip(input, true),
              "// Specification (erased by verus-strip):\n"
              "// requires b > 0\n"
              "// ensures a / b <= a\n"
              "fn divide(a: u32, b: u32) -> u32 {\n"
              "    a / b\n"
              "}\n");
}

TEST(Stripper, SpecAsDocCommentsForPublicFunctions) {
    std::string input =
        "impl Counter {\n"
        "    /// Current value.\n"
        "    pub fn get(&self) -> (r: u64)\n"
        "        ensures r == self.value,\n"
        "    {\n"
        "        self.value\n"
        "    }\n"
        "}\n";
    EXPECT_EQ(strip(input, true),
              "impl Counter {\n"
              "    /// Current value.\n"
              "    /// Specification (erased by verus-strip):\n"
              "    /// ensures r == self.value\n"
              "    pub fn get(&self) -> u64 {\n"
              "        self.value\n"
              "    }\n"
              "}\n");
}

TEST(Stripper, UnwrapsVerusBlocks) {
    std::string input =
        "use vstd::prelude::*;\n"
        "\n"
        "verus! {\n"
        "\n"
        "pub fn id(x: u8) -> (r: u8)\n"
        "    ensures r == x,\n"
        "{\n"
        "    x\n"
        "}\n"
        "\n"
        "} // verus!\n";
    EXPECT_EQ(dropBlankLines(strip(input)), "pub fn id(x: u8) -> u8 {\n    x\n}\n");
}

TEST(Stripper, RemovesVerificationItems) {
    std::string input =
        "use vstd::prelude::*;\n"
        "use builtin_macros::*;\n"
        "use std::collections::HashMap;\n"
        "broadcast use vstd::seq::group_seq_axioms;\n"
        "broadcast group group_lemmas { lemma_a, lemma_b }\n"
        "global size_of usize == 8;\n"
        "spec const LIMIT: int = 10;\n"
        "const MAX: u64 = 10;\n";
    EXPECT_EQ(dropBlankLines(strip(input)),
              "use std::collections::HashMap;\nconst MAX: u64 = 10;\n");
}

TEST(Stripper, RemovesVerifierAttributes) {
    std::string input =
        "#[verifier::external_body]\n"
        "#[inline]\n"
        "fn f() {}\n"
        "\n"
        "// keep me\n"
        "#[verifier(opaque)] #[verusfmt::skip]\n"
        "pub fn g() {}\n";
    EXPECT_EQ(strip(input), "#[inline]\nfn f() {}\n\n// keep me\npub fn g() {}\n");
}

TEST(Stripper, RemovesExecModifier) {
    EXPECT_EQ(strip("pub exec fn f() {}\n"), "pub fn f() {}\n");
    EXPECT_EQ(strip("exec fn f() {}\n"), "fn f() {}\n");
}

TEST(Stripper, UnnamesReturnValue) {
    EXPECT_EQ(strip("fn f() -> (r: Vec<u8>) { Vec::new() }\n"), "fn f() -> Vec<u8> { Vec::new() }\n");
    EXPECT_EQ(strip("fn f() -> (u8, u8) { (1, 2) }\n"), "fn f() -> (u8, u8) { (1, 2) }\n");
}

TEST(Stripper, TraitDeclarations) {
    std::string input =
        "pub trait Shape {\n"
        "    spec fn area_spec(&self) -> int;\n"
        "    fn area(&self) -> u64\n"
        "        ensures true;\n"
        "}\n";
    EXPECT_EQ(strip(input), "pub trait Shape {\n    fn area(&self) -> u64;\n}\n");
}

TEST(Stripper, ContractOnSignatureLine) {
    EXPECT_EQ(strip("pub trait Shape {\n    fn area(&self) -> u64 ensures true;\n}\n"),
              "pub trait Shape {\n    fn area(&self) -> u64;\n}\n");
}

TEST(Stripper, RemovesGhostBindings) {
    std::string input =
        "fn f(x: u32) {\n"
        "    let ghost a = x;\n"
        "    let tracked b = take();\n"
        "    let c: Ghost<int> = Ghost(1);\n"
        "    let d = x;\n"
        "}\n";
    EXPECT_EQ(strip(input),
              "fn f(x: u32) {\n    let c: Ghost<int> = Ghost(1);\n    let d = x;\n}\n");
}

TEST(Stripper, RemovesProofStatements) {
    std::string input =
        "fn f(v: Vec<u8>) {\n"
        "    proof {\n"
        "        lemma(v@);\n"
        "    }\n"
        "    assume(v.len() > 0);\n"
        "    assert forall|i: int| 0 <= i < v.len() implies v[i] >= 0 by {\n"
        "    }\n"
        "    v@;\n"
        "    calc! {\n"
        "        (==)\n"
        "        1; {}\n"
        "        1;\n"
        "    }\n"
        "    assert_by!(true, {});\n"
        "    open_invariant!(&inv => x => {});\n"
        "    assert!(v.len() > 0);\n"
        "    println!(\"{}\", v.len());\n"
        "}\n";
    EXPECT_EQ(strip(input),
              "fn f(v: Vec<u8>) {\n"
              "    assert!(v.len() > 0);\n"
              "    println!(\"{}\", v.len());\n"
              "}\n");
}

TEST(Stripper, RecursesIntoNestedBlocks) {
    std::string input =
        "fn f(x: u32) {\n"
        "    if x > 0 {\n"
        "        assert(x >= 1);\n"
        "        g();\n"
        "    } else {\n"
        "        let ghost y = x;\n"
        "    }\n"
        "    match x {\n"
        "        0 => { assume(false); }\n"
        "        _ => {}\n"
        "    }\n"
        "}\n";
    EXPECT_EQ(flatten(strip(input)),
              "fn f(x: u32) { if x > 0 { g(); } else { } match x { 0 => { } _ => {} } }");
}

TEST(Stripper, RemovesLoopSpecifications) {
    std::string input =
        "fn sum(n: u32) -> u32 {\n"
        "    let mut i = 0;\n"
        "    while i < n\n"
        "        invariant\n"
        "            i <= n,\n"
        "        decreases n - i,\n"
        "    {\n"
        "        i = i + 1;\n"
        "    }\n"
        "    for k in 0..n\n"
        "        invariant k <= n,\n"
        "    {\n"
        "    }\n"
        "    i\n"
        "}\n";
    EXPECT_EQ(strip(input),
              "fn sum(n: u32) -> u32 {\n"
              "    let mut i = 0;\n"
              "    while i < n {\n"
              "        i = i + 1;\n"
              "    }\n"
              "    for k in 0..n {\n"
              "    }\n"
              "    i\n"
              "}\n");
}

TEST(Stripper, RemovesGhostArguments) {
    std::string input =
        "fn run(c: &mut Counter, t: Tracked<Perm>) {\n"
        "    bump(c, Ghost(c.value), 1);\n"
        "    c.apply(Tracked(t));\n"
        "    helper::<u64>(Ghost(0));\n"
        "    let pair = (1, Ghost(2));\n"
        "}\n";
    EXPECT_EQ(strip(input),
              "fn run(c: &mut Counter) {\n"
              "    bump(c, 1);\n"
              "    c.apply();\n"
              "    helper::<u64>();\n"
              "    let pair = (1, Ghost(2));\n"
              "}\n");
}

TEST(Stripper, RemovesInitializersOfGhostFields) {
    std::string input =
        "struct Counter {\n"
        "    value: u64,\n"
        "    ghost history: Seq<u64>,\n"
        "    limit: u64,\n"
        "}\n"
        "fn make(history: Seq<u64>) -> Counter {\n"
        "    Counter { value: 0, history, limit: 10 }\n"
        "}\n"
        "fn other() -> Other {\n"
        "    Other { value: 0, history: 1 }\n"
        "}\n";
    std::string output = strip(input);
    EXPECT_NE(output.find("    Counter { value: 0, limit: 10 }\n"), std::string::npos);
    EXPECT_NE(output.find("    Other { value: 0, history: 1 }\n"), std::string::npos);
}

TEST(Stripper, RemovesInitializersOfGhostVariantFields) {
    std::string input =
        "enum Shape {\n"
        "    Circle { radius: u32, ghost area: int },\n"
        "}\n"
        "fn make() -> Shape {\n"
        "    Shape::Circle { radius: 1, area: 3 }\n"
        "}\n"
        "fn other() -> Circle {\n"
        "    Circle { radius: 1, area: 3 }\n"
        "}\n";
    std::string output = strip(input);
    EXPECT_NE(output.find("    Circle { radius: u32 },\n"), std::string::npos);
    EXPECT_NE(output.find("    Shape::Circle { radius: 1 }\n"), std::string::npos);
    EXPECT_NE(output.find("    Circle { radius: 1, area: 3 }\n"), std::string::npos);
}

TEST(Stripper, KeepsTypedGhostBindingsAndCallArity) {
    std::string input =
        "fn consume(x: u32, g: Ghost<int>) -> u32 {\n"
        "    x\n"
        "}\n"
        "fn main() {\n"
        "    let x = 1;\n"
        "    let g: Ghost<int> = Ghost(2);\n"
        "    let r = consume(x, g);\n"
        "    let s = w.consume(x, g);\n"
        "}\n";
    EXPECT_EQ(strip(input),
              "fn consume(x: u32) -> u32 {\n"
              "    x\n"
              "}\n"
              "fn main() {\n"
              "    let x = 1;\n"
              "    let g: Ghost<int> = Ghost(2);\n"
              "    let r = consume(x);\n"
              "    let s = w.consume(x, g);\n"
              "}\n");
}

TEST(Stripper, KeepsArgumentsOfAmbiguousFunctions) {
    std::string input =
        "mod a {\n"
        "    pub fn pick(x: u32, ghost y: int) {}\n"
        "}\n"
        "mod b {\n"
        "    pub fn pick(x: u32, y: u32) {}\n"
        "}\n"
        "fn main() {\n"
        "    pick(1, 2);\n"
        "}\n";
    std::string output = strip(input);
    EXPECT_NE(output.find("    pub fn pick(x: u32) {}\n"), std::string::npos);
    EXPECT_NE(output.find("    pick(1, 2);\n"), std::string::npos);
}

TEST(Stripper, StripsClosures) {
    std::string input =
        "fn f() {\n"
        "    let a = |x: u32| -> u32 { assert(x > 0); x + 1 };\n"
        "    let b = |x: u32| -> (r: u32) requires x < 10, ensures r == x + 1, { x + 1 };\n"
        "    let c = |x: u32| x + 1;\n"
        "    let d = p || q;\n"
        "}\n";
    EXPECT_EQ(strip(input),
              "fn f() {\n"
              "    let a = |x: u32| -> u32 { x + 1 };\n"
              "    let b = |x: u32| -> u32 { x + 1 };\n"
              "    let c = |x: u32| x + 1;\n"
              "    let d = p || q;\n"
              "}\n");
}

TEST(Stripper, KeepsOrderOfRetainedItems) {
    std::string input =
        "fn a() {}\n"
        "spec fn s1() -> int { 1 }\n"
        "struct B { x: u8, ghost g: int, y: u8, z: u8 }\n"
        "proof fn p() {}\n"
        "fn c(q: u8, ghost r: int, s: u8) { let t = 1; let ghost u = 2; let v = 3; }\n";
    EXPECT_EQ(flatten(strip(input)),
              "fn a() {} struct B { x: u8, y: u8, z: u8 } "
              "fn c(q: u8, s: u8) { let t = 1; let v = 3; }");
}

TEST(Stripper, Idempotent) {
    std::string input =
        "use vstd::prelude::*;\n"
        "verus! {\n"
        "pub struct S { pub a: u8, ghost b: int }\n"
        "spec fn view(s: S) -> int { s.a as int }\n"
        "pub fn f(s: &S, ghost g: int) -> (r: u8)\n"
        "    requires s.a > 0,\n"
        "    ensures r == s.a,\n"
        "{\n"
        "    proof { assert(true); }\n"
        "    let mut i = 0;\n"
        "    while i < 3 invariant i <= 3 { i += 1; }\n"
        "    s.a\n"
        "}\n"
        "}\n";
    std::string once = strip(input);
    EXPECT_EQ(strip(once), once);
    EXPECT_EQ(strip(strip(input, true), true), strip(input, true));
}

TEST(Stripper, LeavesPlainRustUntouched) {
    std::string input =
        "//! crate docs\n"
        "use std::fmt;\n"
        "\n"
        "/// A point.\n"
        "#[derive(Debug, Clone)]\n"
        "pub struct Point<'a> {\n"
        "    pub x: i32, // x coordinate\n"
        "    name: &'a str,\n"
        "}\n"
        "\n"
        "impl<'a> fmt::Display for Point<'a> {\n"
        "    fn fmt(&self, f: &mut fmt::Formatter) -> fmt::Result {\n"
        "        write!(f, \"({}, {})\", self.x, self.name)\n"
        "    }\n"
        "}\n"
        "\n"
        "fn main() {\n"
        "    let c = '{';\n"
        "    let v: Vec<u8> = vec![1, 2];\n"
        "    let s = v.iter().map(|x| x + 1).collect::<Vec<_>>();\n"
        "    'outer: for i in 0..10 {\n"
        "        if i > 5 { break 'outer; }\n"
        "    }\n"
        "}\n";
    EXPECT_EQ(strip(input), input);
}

TEST(Stripper, Warnings) {
    StripOptions options;
    auto result = stripSource(
        "struct G {\n    ghost a: int,\n}\n"
        "enum E { V(Ghost<int>) }\n"
        "tracked struct T { x: u8 }\n",
        options, "warn.rs");
    ASSERT_EQ(result.warnings.size(), 3u);
    EXPECT_EQ(result.warnings[0], "line 5: unrecognized verification item kept as is: tracked struct T");
    EXPECT_EQ(result.warnings[1], "line 1: struct 'G' has no fields left after stripping");
    EXPECT_EQ(result.warnings[2], "line 4: enum variant 'V' has no fields left after stripping");
    EXPECT_FALSE(result.empty);
}

TEST(Stripper, EmptyResult) {
    StripOptions options;
    auto result = stripSource("use vstd::prelude::*;\nverus! {\nspec fn f() -> int { 1 }\n}\n",
                              options, "empty.rs");
    EXPECT_TRUE(result.empty);
    EXPECT_EQ(flatten(result.output), "");

    EXPECT_FALSE(stripSource("fn main() {}\n", options, "main.rs").empty);
}

TEST(Stripper, CollectsStageStatistics) {
    StripOptions options;
    std::ostringstream log;
    auto result =
        stripSource("fn g(ghost x: int) {}\nspec fn f() -> int { 1 }\n", options, "stats.rs", &log);
    ASSERT_EQ(result.stats.size(), 6u);
    EXPECT_EQ(result.stats[0].stage, "modeRemover");
    EXPECT_EQ(result.stats[0].nodesRemoved, 1);
    EXPECT_EQ(result.stats[0].linesBefore - result.stats[0].linesAfter, 1);
    EXPECT_EQ(result.stats[3].stage, "signatureStripper");
    EXPECT_EQ(result.stats[3].nodesRemoved, 1);
    EXPECT_NE(log.str().find("FunctionDeclaration"), std::string::npos);
    EXPECT_NE(log.str().find("-spec fn f() -> int { 1 }"), std::string::npos);
}

TEST(Stripper, Errors) {
    StripOptions options;
    EXPECT_THROW(stripSource("verus! {\nfn f() {}\n", options, "a.rs"), StructuralError);
    EXPECT_THROW(stripSource("verus! {\nfn f( {}\n}\n", options, "b.rs"), SyntaxError);
}
