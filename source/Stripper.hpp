// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include "StripContext.hpp"
#include "Utils.hpp"

struct StripResult {
    std::string output;
    std::vector<std::string> warnings;
    std::vector<StripStats> stats;
    // no item survived stripping
    bool empty = false;
};

// Unwrap verus! blocks, parse and run all removal stages over text. name is used in diagnostics.
// log receives removed nodes and stage statistics when given.
// Throws StructuralError for unmatched verus! blocks and SyntaxError for unparsable input.
StripResult stripSource(std::string_view text,
                        const StripOptions& options,
                        const std::string& name = "source",
                        std::ostream* log = nullptr);

// Print the tree parsed from text, before any removal, to out.
void dumpSyntaxTree(std::string_view text, const std::string& name, std::ostream& out);
