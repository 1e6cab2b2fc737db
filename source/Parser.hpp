// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/util/SmallVector.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "SyntaxNode.hpp"
#include "SyntaxTree.hpp"

// Recursive descent parser building the tree the removers work on. Items, signatures, contracts
// and statements get dedicated nodes; expressions are kept as token trees that still expose every
// nested block, group and macro call.
class Parser {
   public:
    Parser(std::vector<Token> tokens, SyntaxTree& tree);

    // throws SyntaxError
    SourceFileSyntax& parseSourceFile();

   private:
    enum ExprFlags : uint32_t {
        NoFlags = 0,
        StopAtComma = 1 << 0,
        StopAtSemicolon = 1 << 1,
        StopAtFatArrow = 1 << 2,
        StopAtElse = 1 << 3,
        StopAtLoopSpec = 1 << 4,
        StopAtContract = 1 << 5,
        StopAtVia = 1 << 6,
        StopAtWhen = 1 << 7,
        // '{' following an operand opens a function or loop body
        StopAtBody = 1 << 8,
        // '{' ends the expression (conditions, scrutinees)
        NoStruct = 1 << 9,
        // a leading block-like expression ends the statement
        Statement = 1 << 10,
    };

    using Children = SmallVectorBase<SyntaxNode*>;
    using StopPredicate = std::function<bool(const Token&)>;

    std::vector<Token> tokens;
    size_t index = 0;
    SyntaxTree& tree;

    // token stream
    const Token& peek(size_t ahead = 0) const { return tokenAt(index + ahead); }
    const Token& tokenAt(size_t i) const {
        return i < tokens.size() ? tokens[i] : tokens.back();
    }
    bool peekIs(std::string_view text, size_t ahead = 0) const { return peek(ahead).is(text); }
    bool atEnd() const { return peek().kind == TokenKind::EndOfFile; }
    TokenSyntax* consume();
    TokenSyntax* expect(std::string_view text, std::string_view what);
    TokenSyntax* expectKind(TokenKind kind, std::string_view what);
    TokenSyntax* expectIdentifier(std::string_view what);
    [[noreturn]] void error(const Token& token, const std::string& message) const;

    template <typename T, typename... Args>
    T* make(Args&&... args);
    template <typename T>
    T* finish(T* node, Children& children);

    // lookahead helpers working on absolute token indices
    size_t skipGroup(size_t i) const;
    size_t skipAttributes(size_t i) const;
    size_t skipModifiers(size_t i) const;
    size_t macroPathLength(size_t i) const;
    bool isItemStart(size_t i) const;
    bool isContractStart() const;
    bool isLoopSpecStart() const;

    // generic pieces
    TokenTreeSyntax* parseTokenTree();
    void consumeBalanced(Children& children, const StopPredicate& stop);
    void consumeAngles(Children& children);
    size_t consumeType(Children& children, const StopPredicate& stop);
    void parseAttributes(Children& children);
    AttributeSyntax* parseAttribute();

    // items
    SyntaxNode* parseItem(bool inTrait);
    FunctionDeclarationSyntax* parseFunction(Children& children, bool inTrait);
    DelimitedListSyntax* parseParameterList();
    ParameterSyntax* parseParameter();
    ReturnTypeSyntax* parseReturnType();
    ContractSpecSyntax* parseContractSpec();
    ContractClauseSyntax* parseContractClause();
    bool atClauseEnd() const;
    StructDeclarationSyntax* parseStruct(Children& children);
    EnumDeclarationSyntax* parseEnum(Children& children);
    EnumVariantSyntax* parseVariant();
    DelimitedListSyntax* parseFieldList(bool named);
    FieldSyntax* parseNamedField();
    FieldSyntax* parseTupleField();
    ItemContainerSyntax* parseItemContainer(Children& children, SyntaxKind kind);
    OpaqueItemSyntax* parseOpaqueItem(Children& children);

    // statements and expressions
    BlockSyntax* parseBlock();
    SyntaxNode* parseStatement();
    LetStatementSyntax* parseLet(Children& children);
    ExpressionSyntax* parseExpression(uint32_t flags, SyntaxNode* seed = nullptr);
    void parseIf(Children& parts);
    void parseLoopTail(Children& parts);
    LoopSpecSyntax* parseLoopSpec();
    MatchBodySyntax* parseMatchBody();
    MatchArmSyntax* parseMatchArm();
    DelimitedListSyntax* parseGroup();
    MacroInvocationSyntax* parseMacroInvocation();
    void parseClosureParameters(Children& parts);
    void parseClosureTail(Children& parts);
};

template <typename T, typename... Args>
T* Parser::make(Args&&... args) {
    return tree.allocator().emplace<T>(std::forward<Args>(args)...);
}

template <typename T>
T* Parser::finish(T* node, Children& children) {
    node->children = children.copy(tree.allocator());
    return node;
}

// Last path segment of a type written as Ghost<T> / Tracked<T> (optionally path qualified)
// decides the qualifier of a parameter or field with that type. let bindings are tagged by
// their ghost / tracked keyword only.
Qualifier qualifierFromType(std::span<SyntaxNode* const> typeNodes);

// Sort an expression's outermost form into one of the ExpressionKind variants.
void classifyExpression(ExpressionSyntax& expression);
