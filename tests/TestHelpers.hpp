// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <sstream>
#include <string>
#include <string_view>
#include "Stripper.hpp"

// Drop blank lines and trailing whitespace; layout the stripper does not promise to keep.
inline std::string dropBlankLines(std::string_view text) {
    std::string result;
    std::istringstream stream{std::string(text)};
    std::string line;
    while (std::getline(stream, line)) {
        size_t end = line.find_last_not_of(" \t\r");
        if (end == std::string::npos)
            continue;
        result += line.substr(0, end + 1);
        result += '\n';
    }
    return result;
}

// Collapse every whitespace run into one space.
inline std::string flatten(std::string_view text) {
    std::string result;
    bool space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            space = !result.empty();
            continue;
        }
        if (space)
            result += ' ';
        space = false;
        result += c;
    }
    return result;
}

inline std::string strip(std::string_view text, bool specAsComments = false) {
    StripOptions options;
    options.specAsComments = specAsComments;
    return stripSource(text, options, "test.rs").output;
}
