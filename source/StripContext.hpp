// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/util/Hash.h>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>
#include "Utils.hpp"

using namespace slang;

struct StripOptions {
    // render removed contracts as documentation comments
    bool specAsComments = false;
};

// Parameter positions removed from a free function. Functions declared twice under one name are
// marked ambiguous and their call sites are left to the Ghost(..) / Tracked(..) rule.
struct ParameterRemovals {
    size_t count = 0;
    std::vector<size_t> positions;
    bool ambiguous = false;
};

// State shared by the removal stages of one file.
struct StripContext {
    StripOptions options;
    std::string file;
    // removal log, nullptr when quiet
    std::ostream* log = nullptr;
    std::vector<std::string> warnings;
    std::vector<StripStats> stats;
    // names of ghost / tracked fields removed from each struct declared in the file, variants
    // are keyed as Enum::Variant
    flat_hash_map<std::string, flat_hash_set<std::string>> removedFields;
    // ghost / tracked parameter positions of each free function, see ParameterRemovals
    flat_hash_map<std::string, ParameterRemovals> removedParameters;
};
