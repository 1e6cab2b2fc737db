// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/text/SourceManager.h>
#include <slang/util/BumpAllocator.h>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include "SyntaxNode.hpp"

// trivia made of whitespace only
bool isBlankTrivia(std::string_view trivia);

// Owns the nodes of one parsed file. The SourceManager that received the text must outlive it.
class SyntaxTree {
   public:
    SyntaxTree(const SyntaxTree&) = delete;
    SyntaxTree& operator=(const SyntaxTree&) = delete;

    // Lex and parse text registered in sourceManager under name. Throws SyntaxError.
    static std::shared_ptr<SyntaxTree> fromText(std::string_view text,
                                                SourceManager& sourceManager,
                                                std::string_view name = "source");

    SourceFileSyntax& root() const { return *rootNode; }
    SourceManager& sourceManager() const { return sm; }
    BumpAllocator& allocator() { return alloc; }

    // copy text into storage that lives as long as the tree
    std::string_view makeText(std::string text);

    // Move leading trivia of a token about to be removed onto the next retained token. Comments
    // and blank lines in front of it survive; a token on the same line takes over its spacing.
    void transferLeadingTrivia(TokenSyntax& from, TokenSyntax& to);

    // drop removed nodes from all children lists
    void compact();

   private:
    explicit SyntaxTree(SourceManager& sourceManager) : sm(sourceManager) {}

    BumpAllocator alloc;
    std::deque<std::string> ownedText;
    SourceManager& sm;
    SourceFileSyntax* rootNode = nullptr;
};
