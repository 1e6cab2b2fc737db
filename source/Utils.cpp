// SPDX-License-Identifier: Apache-2.0
#include "Utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <typeinfo>
#include "Errors.hpp"
#include "SyntaxPrinter.hpp"
#include "SyntaxTree.hpp"
#include "SyntaxVisitor.hpp"

#ifdef __GLIBCXX__
#include <cxxabi.h>
std::string tryDemangle(const char* mangled) {
    int rc;
    char* out = abi::__cxa_demangle(mangled, NULL, NULL, &rc);
    ASSERT(rc == 0, "demangling failed");
    std::string outStr = out;
    free(out);
    return outStr;
}
#else
std::string tryDemangle(const char* mangled) {
    return mangled;
}
#endif

// remove all occurrences of pattern from src string
std::string removeAll(std::string src, std::string pattern) {
    size_t pos;
    while ((pos = src.find(pattern)) != std::string::npos) {
        src.erase(pos, pattern.length());
    }
    return src;
}

std::string prettifyNodeTypename(const char* type) {
    // demangle and drop the Syntax suffix shared by all node types
    std::string demangled = tryDemangle(type);
    return removeAll(demangled, "Syntax");
}

class TreePrinter : public SyntaxVisitor<TreePrinter> {
   private:
    int indentLevel = 0;
    std::ostream& out;

   public:
    explicit TreePrinter(std::ostream& out) : out(out) {}

    void printIndent() {
        for (int i = 0; i < indentLevel; ++i)
            out << " ";
    }

    void handle(const TokenSyntax& node) {
        printIndent();
        out << " '" << node.token.text << "'\n";
    }

    template <typename T>
    void handle(const T& node) {
        std::string text = node.toString();
        indentLevel++;
        printIndent();
        out << STRINGIZE_NODE_TYPE(T) << ", " << toString(node.kind)
            << ", lines: " << countLines(text) << "\n";
        visitDefault(node);
        indentLevel--;
    }
};

void printSyntaxTree(const SyntaxTree& tree, std::ostream& file) {
    TreePrinter(file).visit(tree.root());
}

int countLines(std::string_view text) {
    if (text.empty())
        return 0;
    int lines = std::ranges::count(text, '\n');
    return text.back() == '\n' ? lines : lines + 1;
}

StripStats& StripStats::begin(const SyntaxTree& tree) {
    linesBefore = countLines(SyntaxPrinter::printFile(tree));
    startTime = std::chrono::high_resolution_clock::now();
    return *this;
}

StripStats& StripStats::end(const SyntaxTree& tree) {
    linesAfter = countLines(SyntaxPrinter::printFile(tree));
    endTime = std::chrono::high_resolution_clock::now();
    return *this;
}

void StripStats::recordRemoval(const std::string& typeName) {
    nodesRemoved++;
    if (typeInfo.find(typeName) == std::string::npos)
        typeInfo += typeInfo.empty() ? typeName : "," + typeName;
}

std::string StripStats::toStr() const {
    std::stringstream tmp;
    int lines = linesBefore - linesAfter;
    auto duration =
        std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count();
    tmp << stage << '\t' << file << '\t' << nodesRemoved << '\t' << lines << '\t' << duration
        << "us\t" << typeInfo << "\n";
    return tmp.str();
}

void StripStats::report(std::ostream& log) const {
    log << toStr();
}

void StripStats::report(const std::filesystem::path& traceFile) const {
    std::ofstream file(traceFile, std::ios_base::app);
    if (!file)
        throw WriteError(traceFile, strerror(errno));
    file << toStr() << std::flush;
}

void StripStats::writeHeader(const std::filesystem::path& traceFilePath) {
    std::ofstream file(traceFilePath);
    if (!file)
        throw WriteError(traceFilePath, strerror(errno));
    file << "stage\tfile\tnodes_removed\tlines_removed\ttime\ttype_info\n";
}

std::string prefixLines(const std::string& str, const std::string& linePrefix) {
    std::istringstream sstream(str);
    std::string line, out;
    while (getline(sstream, line)) {
        out += linePrefix + line + '\n';
    }
    return out;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw ReadError(path, strerror(errno));
    std::stringstream contents;
    contents << file.rdbuf();
    if (file.bad())
        throw ReadError(path, "I/O error");
    return contents.str();
}

void writeFile(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
        throw WriteError(path, strerror(errno));
    file << contents << std::flush;
    if (!file)
        throw WriteError(path, "I/O error");
}
