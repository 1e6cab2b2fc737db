// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <typeinfo>

class SyntaxTree;

std::string prettifyNodeTypename(const char* type);
// stringize type of node, demangle and remove decorations
#define STRINGIZE_NODE_TYPE(TYPE) prettifyNodeTypename(typeid(TYPE).name())

class StripStats {
   public:
    std::string stage;
    std::string file;
    int linesBefore;
    int linesAfter;
    int nodesRemoved;
    std::chrono::time_point<std::chrono::high_resolution_clock> startTime;
    std::chrono::time_point<std::chrono::high_resolution_clock> endTime;
    std::string typeInfo;

    StripStats(const std::string& stage, const std::string& file)
        : stage(stage), file(file), linesBefore(0), linesAfter(0), nodesRemoved(0) {}

    StripStats& begin(const SyntaxTree& tree);
    StripStats& end(const SyntaxTree& tree);
    void recordRemoval(const std::string& typeName);
    std::string toStr() const;
    void report(std::ostream& log) const;
    // append a row to the trace file
    void report(const std::filesystem::path& traceFile) const;
    static void writeHeader(const std::filesystem::path& traceFilePath);
};

int countLines(std::string_view text);
std::string prefixLines(const std::string& str, const std::string& linePrefix);
void printSyntaxTree(const SyntaxTree& tree, std::ostream& file);

// throw ReadError / WriteError on failure
std::string readFile(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& contents);

// NOTE: doing it as variadic func rather than macro would prevent
// compiler from issuing warnings about incorrect format string
#define PRINTF_ERR(...) \
    do { \
        fprintf(stderr, "verus-strip: "); \
        fprintf(stderr, __VA_ARGS__); \
    } while (0)

#define PRINTF_INTERNAL_ERR(...) \
    do { \
        PRINTF_ERR("Internal error: %s:%d: ", __FILE__, __LINE__); \
        fprintf(stderr, __VA_ARGS__); \
    } while (0)

#define ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            PRINTF_INTERNAL_ERR("Assertion `%s` failed: %s\n", #cond, msg); \
            exit(1); \
        } \
    } while (0)
