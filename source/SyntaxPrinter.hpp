// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <string>
#include "SyntaxNode.hpp"

class SyntaxTree;

// Turns (part of) a tree back into text. Removed nodes are skipped.
class SyntaxPrinter {
   public:
    SyntaxPrinter& print(const Token& token);
    SyntaxPrinter& print(const SyntaxNode& node);

    std::string str() const { return buffer; }

    static std::string printFile(const SyntaxTree& tree);

   private:
    void append(std::string_view text);

    std::string buffer;
};
