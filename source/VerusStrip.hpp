// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/util/CommandLine.h>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include "StripConfig.hpp"

namespace fs = std::filesystem;

inline constexpr std::string_view verusStripVersion = "0.1.0";

class VerusStrip {
   public:
    VerusStrip(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : out(out), err(err) {}

    void addArgs();
    void usage();
    void parseCommandLine(int argc, char** argv);
    void parseArgs(int argc, char** argv);

    // Process the configured input, report failures. Returns the process exit code.
    int run();

    // Dispatch on the kind of input. Throws StripError subclasses.
    void process(const fs::path& input);
    void processFile(const fs::path& file);
    void processDirectory(const fs::path& dir);

    StripConfig& getConfig() { return config; }
    void setInput(const fs::path& path) { input = path; }

   private:
    void reportWarning(const fs::path& file, const std::string& message);

    CommandLine cmdLine;
    StripConfig config;
    std::optional<fs::path> input;
    std::optional<bool> showHelp;
    std::optional<bool> showVersion;
    std::ostream& out;
    std::ostream& err;
};
