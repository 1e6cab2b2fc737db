// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/util/Util.h>
#include <utility>
#include "SyntaxNode.hpp"

#define DERIVED static_cast<TDerived*>(this)

template <typename TVisitor, typename... Args>
decltype(auto) SyntaxNode::visit(TVisitor& visitor, Args&&... args) {
#define NODE(KIND, TYPE) \
    case SyntaxKind::KIND: \
        return visitor.visit(this->as<TYPE>(), std::forward<Args>(args)...)

    switch (kind) {
        NODE(Token, TokenSyntax);
        NODE(SourceFile, SourceFileSyntax);
        NODE(Attribute, AttributeSyntax);
        NODE(FunctionDeclaration, FunctionDeclarationSyntax);
        NODE(StructDeclaration, StructDeclarationSyntax);
        NODE(EnumDeclaration, EnumDeclarationSyntax);
        NODE(TraitDeclaration, ItemContainerSyntax);
        NODE(ImplDeclaration, ItemContainerSyntax);
        NODE(ModuleDeclaration, ItemContainerSyntax);
        NODE(OpaqueItem, OpaqueItemSyntax);
        NODE(ParameterList, DelimitedListSyntax);
        NODE(Parameter, ParameterSyntax);
        NODE(ReturnType, ReturnTypeSyntax);
        NODE(ContractSpec, ContractSpecSyntax);
        NODE(ContractClause, ContractClauseSyntax);
        NODE(FieldList, DelimitedListSyntax);
        NODE(Field, FieldSyntax);
        NODE(VariantList, DelimitedListSyntax);
        NODE(EnumVariant, EnumVariantSyntax);
        NODE(Block, BlockSyntax);
        NODE(LetStatement, LetStatementSyntax);
        NODE(ExpressionStatement, ExpressionStatementSyntax);
        NODE(MacroStatement, MacroStatementSyntax);
        NODE(ItemStatement, ItemStatementSyntax);
        NODE(Expression, ExpressionSyntax);
        NODE(Group, DelimitedListSyntax);
        NODE(MacroInvocation, MacroInvocationSyntax);
        NODE(TokenTree, TokenTreeSyntax);
        NODE(MatchBody, MatchBodySyntax);
        NODE(MatchArm, MatchArmSyntax);
        NODE(LoopSpec, LoopSpecSyntax);
    }
#undef NODE
    SLANG_UNREACHABLE;
}

// Read-only traversal over retained nodes. Derived classes provide handle() overloads for the
// node types they are interested in and call visitDefault() to descend.
template <typename TDerived>
class SyntaxVisitor {
   public:
    template <typename T>
    void visit(T&& node) {
        if constexpr (requires { DERIVED->handle(node); }) {
            DERIVED->handle(node);
        } else {
            DERIVED->visitDefault(node);
        }
    }

    template <typename T>
    void visitDefault(T&& node) {
        for (auto child : node.children) {
            if (!child->isRemoved())
                child->visit(*DERIVED);
        }
    }
};
