// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <string>
#include <vector>
#include "SyntaxNode.hpp"

class SyntaxTree;

inline constexpr std::string_view contractCommentHeader = "Specification (erased by verus-strip):";

// One line per rendered clause: requires, recommends, ensures, default_ensures, returns,
// opens_invariants, no_unwind. decreases is never rendered.
std::vector<std::string> renderContract(ContractSpecSyntax& contract);

// Put the rendered contract of function into the trivia in front of it, at the function's
// indentation. Returns false if there was nothing to render.
bool insertContractComment(SyntaxTree& tree, FunctionDeclarationSyntax& function);
