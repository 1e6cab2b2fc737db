// SPDX-License-Identifier: Apache-2.0
#include "BlockUnwrapper.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include "Errors.hpp"
#include "Lexer.hpp"
#include "Utils.hpp"

static constexpr std::string_view verusMarker = "verus!";

size_t LexicalScanner::step(size_t i) {
    char c = text[i];
    if (pendingEscape) {
        pendingEscape = false;
        return i + 1;
    }

    switch (state) {
        case ScanState::InString:
        case ScanState::InChar:
            if (c == '\\')
                pendingEscape = true;
            else if (c == (state == ScanState::InString ? '"' : '\''))
                state = ScanState::Normal;
            return i + 1;
        case ScanState::InBlockComment:
            if (startsWith(i, "*/")) {
                state = ScanState::Normal;
                return i + 2;
            }
            return i + 1;
        case ScanState::InLineComment:
            if (c == '\n')
                state = ScanState::Normal;
            return i + 1;
        case ScanState::Normal:
            break;
    }

    if (startsWith(i, "//")) {
        state = ScanState::InLineComment;
        return i + 2;
    }
    if (startsWith(i, "/*")) {
        state = ScanState::InBlockComment;
        return i + 2;
    }
    if (c == '"') {
        state = ScanState::InString;
        return i + 1;
    }
    if (c == '\'') {
        if (i + 1 < text.size() && isIdentifierStart(text[i + 1])) {
            // 'a' is a character literal, 'a / 'static / 'outer: a lifetime or label
            size_t j = i + 1;
            while (j < text.size() && isIdentifierChar(text[j]))
                j++;
            return j < text.size() && text[j] == '\'' ? j + 1 : j;
        }
        state = ScanState::InChar;
        return i + 1;
    }
    return i + 1;
}

static size_t lineOf(std::string_view text, size_t offset) {
    return std::count(text.begin(), text.begin() + offset, '\n') + 1;
}

size_t findMatchingBrace(std::string_view text, size_t openIndex) {
    ASSERT(openIndex < text.size() && text[openIndex] == '{', "expected '{' to match");
    LexicalScanner scanner(text);
    int depth = 0;
    size_t i = openIndex;
    while (i < text.size()) {
        if (scanner.inCode()) {
            if (text[i] == '{') {
                depth++;
            } else if (text[i] == '}') {
                if (--depth == 0)
                    return i;
            }
        }
        i = scanner.step(i);
    }
    throw StructuralError("unmatched '{' of verus! block opened at line " +
                              std::to_string(lineOf(text, openIndex)),
                          "check that the verus! block is closed and that string literals and "
                          "comments inside it are terminated");
}

static bool isMarkerAt(std::string_view text, size_t i) {
    return text.substr(i).starts_with(verusMarker) && (i == 0 || !isIdentifierChar(text[i - 1]));
}

// `} // verus!` marks the end of the wrapper, drop the comment with the brace
static size_t skipClosingComment(std::string_view text, size_t i) {
    size_t j = i;
    while (j < text.size() && (text[j] == ' ' || text[j] == '\t'))
        j++;
    std::string_view rest = text.substr(j);
    if (!rest.starts_with("//"))
        return i;
    size_t end = std::min(rest.find('\n'), rest.size());
    std::string_view comment = rest.substr(2, end - 2);
    size_t first = comment.find_first_not_of(" \t");
    size_t last = comment.find_last_not_of(" \t\r");
    if (first == std::string_view::npos || comment.substr(first, last - first + 1) != verusMarker)
        return i;
    return j + end;
}

std::string unwrapVerusBlocks(std::string_view text) {
    LexicalScanner scanner(text);
    std::string out;
    out.reserve(text.size());
    size_t copied = 0;
    // closing braces of the wrappers we are in, innermost last
    std::vector<size_t> closes;

    size_t i = 0;
    while (i < text.size()) {
        if (scanner.inCode()) {
            if (!closes.empty() && i == closes.back()) {
                out.append(text.substr(copied, i - copied));
                out.push_back('\n');
                closes.pop_back();
                i = skipClosingComment(text, i + 1);
                copied = i;
                continue;
            }
            if (isMarkerAt(text, i)) {
                size_t open = i + verusMarker.size();
                while (open < text.size() && std::isspace(static_cast<unsigned char>(text[open])))
                    open++;
                if (open < text.size() && text[open] == '{') {
                    closes.push_back(findMatchingBrace(text, open));
                    out.append(text.substr(copied, i - copied));
                    copied = open + 1;
                    i = open + 1;
                    continue;
                }
            }
        }
        i = scanner.step(i);
    }
    out.append(text.substr(copied));
    return out;
}
