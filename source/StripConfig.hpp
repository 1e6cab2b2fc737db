// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "StripContext.hpp"

namespace fs = std::filesystem;

// Options of one verus-strip run, filled from the command line.
struct StripConfig {
    std::optional<std::string> output;
    std::optional<bool> inPlace;
    std::optional<bool> recursive;
    std::optional<bool> check;
    std::optional<bool> keepEmpty;
    std::optional<bool> specAsComments;
    std::optional<bool> verbose;
    // extensions selected in recursive mode, .rs when empty
    std::vector<std::string> extensions;
    std::optional<std::string> traceFile;
    std::optional<std::string> dumpTreeFile;

    bool isInPlace() const { return inPlace.value_or(false); }
    bool isRecursive() const { return recursive.value_or(false); }
    bool isCheck() const { return check.value_or(false); }
    bool isKeepEmpty() const { return keepEmpty.value_or(false); }
    bool isVerbose() const { return verbose.value_or(false); }

    StripOptions stripOptions() const;
    bool matchesExtension(const fs::path& file) const;

    // Reject flag combinations that cannot work for input. Throws ConfigError.
    void validate(const std::optional<fs::path>& input) const;
};
