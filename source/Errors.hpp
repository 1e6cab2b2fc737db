// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <utility>

// Base of every failure the orchestrator knows how to report. The hint is a
// one-line remediation suggestion printed after the message.
class StripError : public std::runtime_error {
   public:
    explicit StripError(const std::string& message, std::string hint = "")
        : std::runtime_error(message), hint(std::move(hint)) {}

    const std::string& getHint() const { return hint; }

   private:
    std::string hint;
};

// unmatched verus! delimiters
class StructuralError : public StripError {
   public:
    using StripError::StripError;
};

// unwrapped text is not valid input for the parser; the SyntaxError is nested
class ParseError : public StripError {
   public:
    explicit ParseError(const std::filesystem::path& file)
        : StripError("failed to parse '" + file.string() + "'",
                     "ensure the file is valid Verus syntax") {}
};

class ReadError : public StripError {
   public:
    ReadError(const std::filesystem::path& file, const std::string& reason)
        : StripError("failed to read '" + file.string() + "': " + reason) {}
};

class WriteError : public StripError {
   public:
    WriteError(const std::filesystem::path& file, const std::string& reason)
        : StripError("failed to write '" + file.string() + "': " + reason,
                     "check that the destination is writable") {}
};

class ConfigError : public StripError {
   public:
    using StripError::StripError;
};

class AggregateError : public StripError {
   public:
    AggregateError(int failed, int total)
        : StripError(std::to_string(failed) + " of " + std::to_string(total) +
                     " files failed to process") {}
};

// Raised by the lexer and parser. Carries a position already resolved to line and column.
class SyntaxError : public std::runtime_error {
   public:
    SyntaxError(const std::string& name, size_t line, size_t column, const std::string& message)
        : std::runtime_error(name + ":" + std::to_string(line) + ":" + std::to_string(column) +
                             ": " + message),
          line(line),
          column(column) {}

    size_t getLine() const { return line; }
    size_t getColumn() const { return column; }

   private:
    size_t line;
    size_t column;
};

// Print error, its hint and the chain of nested causes.
void reportError(const std::exception& error, std::ostream& os);
