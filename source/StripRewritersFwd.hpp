// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <string>

class SyntaxTree;
struct StripContext;

// forward declarations of removal stages, each removes one category of verification-only code
class ModeRemover;
class ImportsRemover;
class FieldRemover;
class SignatureStripper;
class StatementsRemover;
class ArgumentRemover;

template <typename T>
void rewriteStage(SyntaxTree& tree, StripContext& context, const std::string& stageName);
