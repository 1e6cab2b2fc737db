// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <string>
#include <string_view>

// Lexical context of a position in the source, as far as brace matching is concerned.
enum class ScanState { Normal, InString, InChar, InLineComment, InBlockComment };

// Walks text position by position tracking string, character literal and comment context.
// Braces and markers only mean something while inCode() holds.
class LexicalScanner {
   public:
    explicit LexicalScanner(std::string_view text) : text(text) {}

    bool inCode() const { return state == ScanState::Normal && !pendingEscape; }
    ScanState getState() const { return state; }

    // consume the construct starting at i, return the index following it
    size_t step(size_t i);

   private:
    bool startsWith(size_t i, std::string_view str) const { return text.substr(i).starts_with(str); }

    std::string_view text;
    ScanState state = ScanState::Normal;
    bool pendingEscape = false;
};

// Index of the '}' closing the '{' at openIndex. Throws StructuralError if input ends first.
size_t findMatchingBrace(std::string_view text, size_t openIndex);

// Replace every `verus! { inner }` by `inner` followed by a newline; a `// verus!` comment right
// after the closing brace goes too. Nested wrappers are unwrapped as well.
// Throws StructuralError for an unmatched wrapper.
std::string unwrapVerusBlocks(std::string_view text);
