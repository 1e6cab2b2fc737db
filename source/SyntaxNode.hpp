// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/util/SmallVector.h>
#include <span>
#include <string>
#include <string_view>
#include "Token.hpp"
#include "Utils.hpp"

enum class SyntaxKind : uint8_t {
    Token,
    SourceFile,
    Attribute,
    FunctionDeclaration,
    StructDeclaration,
    EnumDeclaration,
    TraitDeclaration,
    ImplDeclaration,
    ModuleDeclaration,
    OpaqueItem,
    ParameterList,
    Parameter,
    ReturnType,
    ContractSpec,
    ContractClause,
    FieldList,
    Field,
    VariantList,
    EnumVariant,
    Block,
    LetStatement,
    ExpressionStatement,
    MacroStatement,
    ItemStatement,
    Expression,
    Group,
    MacroInvocation,
    TokenTree,
    MatchBody,
    MatchArm,
    LoopSpec,
};

std::string_view toString(SyntaxKind kind);

enum class Qualifier : uint8_t { Executable, Ghost, Tracked };

enum class FunctionMode : uint8_t {
    Executable,
    Specification,
    SpecificationChecked,
    Proof,
    ProofAxiom,
};

enum class ExpressionKind : uint8_t {
    GhostUnary,
    ViewProjection,
    ConjunctionMarker,
    DisjunctionMarker,
    GhostBinary,
    AssertExpr,
    AssumeExpr,
    AssertForallExpr,
    MacroCall,
    Opaque,
};

enum class GhostUnaryOp : uint8_t { Proof, Forall, Exists, Choose };
enum class GhostBinaryOp : uint8_t { Implies, ImpliedBy, Equivalent };

enum class ContractClauseKind : uint8_t {
    Requires,
    Recommends,
    Ensures,
    DefaultEnsures,
    Returns,
    Invariants,
    Unwind,
    Decreases,
};

enum class InvariantKind : uint8_t { Any, None, List, Set };

struct TokenSyntax;

// Nodes live in the tree's BumpAllocator and are never destroyed individually,
// so every node type must stay trivially destructible.
class SyntaxNode {
   public:
    SyntaxKind kind;
    SyntaxNode* parent = nullptr;
    // tokens and child nodes in source order
    std::span<SyntaxNode*> children;

    bool isRemoved() const { return removed; }
    void markRemoved() { removed = true; }

    // first / last token of subtree that was not removed, nullptr if there is none
    TokenSyntax* getFirstToken();
    TokenSyntax* getLastToken();
    SourceLocation getLocation() const;
    std::string toString() const;

    template <typename T>
    T& as() {
        ASSERT(T::isKind(kind), "invalid syntax node cast");
        return static_cast<T&>(*this);
    }

    template <typename T>
    const T& as() const {
        ASSERT(T::isKind(kind), "invalid syntax node cast");
        return static_cast<const T&>(*this);
    }

    template <typename TVisitor, typename... Args>
    decltype(auto) visit(TVisitor& visitor, Args&&... args);

   protected:
    explicit SyntaxNode(SyntaxKind kind) : kind(kind) {}

   private:
    bool removed = false;
};

struct TokenSyntax : public SyntaxNode {
    Token token;

    explicit TokenSyntax(const Token& token) : SyntaxNode(SyntaxKind::Token), token(token) {}

    bool is(std::string_view text) const { return token.is(text); }
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::Token; }
};

struct SourceFileSyntax : public SyntaxNode {
    SourceFileSyntax() : SyntaxNode(SyntaxKind::SourceFile) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::SourceFile; }
};

// #[path(...)] or #![path]
struct AttributeSyntax : public SyntaxNode {
    std::string_view path;
    bool isInner = false;

    AttributeSyntax() : SyntaxNode(SyntaxKind::Attribute) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::Attribute; }

    // attribute understood only by the verifier and its tooling
    bool isVerificationOnly() const;
};

// ( ... ), [ ... ] or { ... } holding comma separated elements.
// Children: open token, elements interleaved with ',' tokens, close token.
struct DelimitedListSyntax : public SyntaxNode {
    TokenSyntax* open = nullptr;
    TokenSyntax* close = nullptr;

    explicit DelimitedListSyntax(SyntaxKind kind) : SyntaxNode(kind) {}
    static bool isKind(SyntaxKind kind) {
        return kind == SyntaxKind::ParameterList || kind == SyntaxKind::FieldList ||
               kind == SyntaxKind::VariantList || kind == SyntaxKind::Group;
    }

    SmallVector<SyntaxNode*, 8> elements() const;
};

struct ParameterSyntax : public SyntaxNode {
    Qualifier qualifier = Qualifier::Executable;
    bool isSelf = false;

    ParameterSyntax() : SyntaxNode(SyntaxKind::Parameter) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::Parameter; }
};

// -> T, or the named form -> (name: T)
struct ReturnTypeSyntax : public SyntaxNode {
    bool isNamed = false;
    // '(', optional 'tracked', name and ':' of the named form
    std::span<TokenSyntax*> binding;
    TokenSyntax* closeParen = nullptr;

    ReturnTypeSyntax() : SyntaxNode(SyntaxKind::ReturnType) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::ReturnType; }
};

struct ExpressionSyntax;

struct ContractClauseSyntax : public SyntaxNode {
    ContractClauseKind clauseKind;
    InvariantKind invariantKind = InvariantKind::Set;
    TokenSyntax* keyword = nullptr;
    std::span<ExpressionSyntax*> expressions;
    // opens_invariants [a, b]
    DelimitedListSyntax* invariantList = nullptr;
    // via of recommends, when of no_unwind
    ExpressionSyntax* auxiliary = nullptr;

    explicit ContractClauseSyntax(ContractClauseKind clauseKind)
        : SyntaxNode(SyntaxKind::ContractClause), clauseKind(clauseKind) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::ContractClause; }
};

struct ContractSpecSyntax : public SyntaxNode {
    ContractSpecSyntax() : SyntaxNode(SyntaxKind::ContractSpec) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::ContractSpec; }
};

struct BlockSyntax : public SyntaxNode {
    TokenSyntax* open = nullptr;
    TokenSyntax* close = nullptr;

    BlockSyntax() : SyntaxNode(SyntaxKind::Block) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::Block; }
};

struct FunctionDeclarationSyntax : public SyntaxNode {
    FunctionMode mode = FunctionMode::Executable;
    bool isPublic = false;
    bool inTrait = false;
    TokenSyntax* name = nullptr;
    // exec, open, closed, uninterp, broadcast
    std::span<TokenSyntax*> verusModifiers;
    DelimitedListSyntax* parameters = nullptr;
    ReturnTypeSyntax* returnType = nullptr;
    ContractSpecSyntax* contract = nullptr;
    BlockSyntax* body = nullptr;
    TokenSyntax* semicolon = nullptr;

    FunctionDeclarationSyntax() : SyntaxNode(SyntaxKind::FunctionDeclaration) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::FunctionDeclaration; }
};

struct FieldSyntax : public SyntaxNode {
    Qualifier qualifier = Qualifier::Executable;
    // nullptr for tuple fields
    TokenSyntax* name = nullptr;

    FieldSyntax() : SyntaxNode(SyntaxKind::Field) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::Field; }
};

struct StructDeclarationSyntax : public SyntaxNode {
    TokenSyntax* name = nullptr;
    // nullptr for unit structs
    DelimitedListSyntax* fields = nullptr;

    StructDeclarationSyntax() : SyntaxNode(SyntaxKind::StructDeclaration) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::StructDeclaration; }
};

struct EnumVariantSyntax : public SyntaxNode {
    TokenSyntax* name = nullptr;
    DelimitedListSyntax* fields = nullptr;

    EnumVariantSyntax() : SyntaxNode(SyntaxKind::EnumVariant) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::EnumVariant; }
};

struct EnumDeclarationSyntax : public SyntaxNode {
    TokenSyntax* name = nullptr;
    DelimitedListSyntax* variants = nullptr;

    EnumDeclarationSyntax() : SyntaxNode(SyntaxKind::EnumDeclaration) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::EnumDeclaration; }
};

// trait, impl and inline mod: a header followed by { items }
struct ItemContainerSyntax : public SyntaxNode {
    TokenSyntax* open = nullptr;
    TokenSyntax* close = nullptr;

    explicit ItemContainerSyntax(SyntaxKind kind) : SyntaxNode(kind) {}
    static bool isKind(SyntaxKind kind) {
        return kind == SyntaxKind::TraitDeclaration || kind == SyntaxKind::ImplDeclaration ||
               kind == SyntaxKind::ModuleDeclaration;
    }
};

// item passed through verbatim
struct OpaqueItemSyntax : public SyntaxNode {
    bool verificationOnly = false;
    bool unknownVerification = false;

    OpaqueItemSyntax() : SyntaxNode(SyntaxKind::OpaqueItem) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::OpaqueItem; }
};

struct ExpressionSyntax : public SyntaxNode {
    ExpressionKind expressionKind = ExpressionKind::Opaque;
    GhostUnaryOp unaryOp = GhostUnaryOp::Proof;
    GhostBinaryOp binaryOp = GhostBinaryOp::Implies;
    std::string_view macroName;

    ExpressionSyntax() : SyntaxNode(SyntaxKind::Expression) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::Expression; }

    // variants that exist only for verification
    bool isProofOnly() const {
        return expressionKind != ExpressionKind::MacroCall &&
               expressionKind != ExpressionKind::Opaque;
    }
};

struct LetStatementSyntax : public SyntaxNode {
    Qualifier qualifier = Qualifier::Executable;
    ExpressionSyntax* initializer = nullptr;

    LetStatementSyntax() : SyntaxNode(SyntaxKind::LetStatement) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::LetStatement; }
};

struct ExpressionStatementSyntax : public SyntaxNode {
    ExpressionSyntax* expression = nullptr;
    TokenSyntax* semicolon = nullptr;

    ExpressionStatementSyntax() : SyntaxNode(SyntaxKind::ExpressionStatement) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::ExpressionStatement; }
};

struct TokenTreeSyntax : public SyntaxNode {
    TokenTreeSyntax() : SyntaxNode(SyntaxKind::TokenTree) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::TokenTree; }
};

// path::name!( ... )
struct MacroInvocationSyntax : public SyntaxNode {
    std::string_view name;
    TokenTreeSyntax* body = nullptr;

    MacroInvocationSyntax() : SyntaxNode(SyntaxKind::MacroInvocation) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::MacroInvocation; }
};

struct MacroStatementSyntax : public SyntaxNode {
    MacroInvocationSyntax* macro = nullptr;
    TokenSyntax* semicolon = nullptr;

    MacroStatementSyntax() : SyntaxNode(SyntaxKind::MacroStatement) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::MacroStatement; }

    std::string_view name() const { return macro->name; }
};

struct ItemStatementSyntax : public SyntaxNode {
    SyntaxNode* item = nullptr;

    ItemStatementSyntax() : SyntaxNode(SyntaxKind::ItemStatement) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::ItemStatement; }
};

struct MatchArmSyntax : public SyntaxNode {
    MatchArmSyntax() : SyntaxNode(SyntaxKind::MatchArm) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::MatchArm; }
};

struct MatchBodySyntax : public SyntaxNode {
    MatchBodySyntax() : SyntaxNode(SyntaxKind::MatchBody) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::MatchBody; }
};

// invariant / ensures / decreases clauses between a loop header and its body
struct LoopSpecSyntax : public SyntaxNode {
    LoopSpecSyntax() : SyntaxNode(SyntaxKind::LoopSpec) {}
    static bool isKind(SyntaxKind kind) { return kind == SyntaxKind::LoopSpec; }
};

// retained child nodes that are not tokens
SmallVector<SyntaxNode*, 16> childNodes(const SyntaxNode& node);
// text of the retained tokens joined by single spaces where the source had trivia
std::string normalizedText(SyntaxNode& node);
