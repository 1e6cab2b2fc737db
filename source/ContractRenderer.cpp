// SPDX-License-Identifier: Apache-2.0
#include "ContractRenderer.hpp"
#include <array>
#include "SyntaxTree.hpp"

static std::string joinExpressions(std::span<ExpressionSyntax*> expressions) {
    std::string result;
    for (auto expression : expressions) {
        if (!result.empty())
            result += ", ";
        result += normalizedText(*expression);
    }
    return result;
}

static std::string renderClause(ContractClauseSyntax& clause) {
    std::string line(clause.keyword->token.text);
    switch (clause.clauseKind) {
        case ContractClauseKind::Invariants:
            switch (clause.invariantKind) {
                case InvariantKind::Any:
                    return line + " any";
                case InvariantKind::None:
                    return line + " none";
                case InvariantKind::List:
                    return line + " " + normalizedText(*clause.invariantList);
                case InvariantKind::Set:
                    return line + " " + joinExpressions(clause.expressions);
            }
            break;
        case ContractClauseKind::Unwind:
            if (clause.auxiliary)
                line += " when " + normalizedText(*clause.auxiliary);
            return line;
        default:
            break;
    }
    if (!clause.expressions.empty())
        line += " " + joinExpressions(clause.expressions);
    if (clause.clauseKind == ContractClauseKind::Recommends && clause.auxiliary)
        line += " via " + normalizedText(*clause.auxiliary);
    return line;
}

std::vector<std::string> renderContract(ContractSpecSyntax& contract) {
    static constexpr std::array order = {
        ContractClauseKind::Requires,   ContractClauseKind::Recommends,
        ContractClauseKind::Ensures,    ContractClauseKind::DefaultEnsures,
        ContractClauseKind::Returns,    ContractClauseKind::Invariants,
        ContractClauseKind::Unwind,
    };
    std::vector<std::string> lines;
    for (auto kind : order) {
        for (auto child : contract.children) {
            if (child->isRemoved() || child->kind != SyntaxKind::ContractClause)
                continue;
            auto& clause = child->as<ContractClauseSyntax>();
            if (clause.clauseKind == kind)
                lines.push_back(renderClause(clause));
        }
    }
    return lines;
}

bool insertContractComment(SyntaxTree& tree, FunctionDeclarationSyntax& function) {
    if (!function.contract)
        return false;
    auto lines = renderContract(*function.contract);
    if (lines.empty())
        return false;

    auto first = function.getFirstToken();
    std::string_view trivia = first->token.leadingTrivia;
    size_t lineStart = trivia.rfind('\n');
    lineStart = lineStart == std::string_view::npos ? 0 : lineStart + 1;
    std::string_view indent = trivia.substr(lineStart);
    if (!isBlankTrivia(indent))
        indent = {};

    std::string marker = function.isPublic || function.inTrait ? "///" : "//";
    std::string comment;
    comment += marker + " " + std::string(contractCommentHeader) + "\n";
    for (auto& line : lines)
        comment += std::string(indent) + marker + " " + line + "\n";
    comment += indent;

    first->token.leadingTrivia = tree.makeText(std::string(trivia) + comment);
    return true;
}
