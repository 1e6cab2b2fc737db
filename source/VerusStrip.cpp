// SPDX-License-Identifier: Apache-2.0
#include "VerusStrip.hpp"
#include <algorithm>
#include <exception>
#include <fstream>
#include <vector>
#include "Errors.hpp"
#include "Stripper.hpp"
#include "Utils.hpp"

void VerusStrip::processFile(const fs::path& file) {
    std::string text = readFile(file);

    StripResult result;
    try {
        result = stripSource(text, config.stripOptions(), file.string(),
                             config.isVerbose() ? &err : nullptr);
    } catch (const SyntaxError&) {
        std::throw_with_nested(ParseError(file));
    } catch (const StructuralError& error) {
        throw StructuralError(file.string() + ": " + error.what(), error.getHint());
    }

    if (config.dumpTreeFile) {
        std::ofstream dump(*config.dumpTreeFile, std::ios_base::app);
        if (!dump)
            throw WriteError(*config.dumpTreeFile, "cannot open dump file");
        dump << "// " << file.string() << "\n";
        dumpSyntaxTree(text, file.string(), dump);
    }
    if (config.traceFile) {
        for (auto& stats : result.stats)
            stats.report(*config.traceFile);
    }

    for (auto& warning : result.warnings)
        reportWarning(file, warning);
    if (result.empty && !config.isKeepEmpty())
        reportWarning(file, "contained only specification code");

    if (config.isCheck()) {
        out << file.string() << ": would be stripped successfully\n";
        return;
    }

    if (config.isInPlace()) {
        writeFile(file, result.output);
        err << "Stripped " << file.string() << " in place\n";
    } else if (config.output) {
        writeFile(*config.output, result.output);
        err << "Stripped " << file.string() << " -> " << *config.output << "\n";
    } else {
        out << result.output << std::flush;
    }
}

void VerusStrip::processDirectory(const fs::path& dir) {
    // sort paths to have deterministic order
    std::vector<fs::path> files;
    // unreadable subdirectories are skipped
    for (const auto& entry :
         fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied)) {
        if (entry.is_regular_file() && config.matchesExtension(entry.path()))
            files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    int errors = 0;
    for (auto& file : files) {
        try {
            processFile(file);
        } catch (const StripError& error) {
            // one broken file does not stop the walk
            reportError(error, err);
            errors++;
        }
    }

    err << "\nProcessed " << files.size() << " files (" << errors << " errors)\n";
    if (errors > 0)
        throw AggregateError(errors, static_cast<int>(files.size()));
}

void VerusStrip::process(const fs::path& path) {
    config.validate(path);
    if (config.traceFile)
        StripStats::writeHeader(*config.traceFile);
    if (config.dumpTreeFile)
        writeFile(*config.dumpTreeFile, "");

    if (fs::is_directory(path))
        processDirectory(path);
    else
        processFile(path);
}

int VerusStrip::run() {
    try {
        process(input.value_or(fs::path()));
    } catch (const StripError& error) {
        reportError(error, err);
        return 1;
    } catch (const fs::filesystem_error& error) {
        reportError(error, err);
        return 1;
    }
    return 0;
}

void VerusStrip::reportWarning(const fs::path& file, const std::string& message) {
    err << "verus-strip: warning: " << file.string() << ": " << message << "\n";
}

void VerusStrip::usage() {
    std::cerr << cmdLine.getHelpText("verus-strip: erase Verus specifications and proof code");
}

void VerusStrip::addArgs() {
    cmdLine.add("-h,--help", showHelp, "Display available options");
    cmdLine.add("--version", showVersion, "Display version information and exit");
    cmdLine.add("-o,--output", config.output, "Write stripped output to <file> instead of stdout",
                "<file>");
    cmdLine.add("-i,--in-place", config.inPlace, "Overwrite input files with stripped output");
    cmdLine.add("-r,--recursive", config.recursive, "Process directories recursively");
    cmdLine.add("--check", config.check, "Strip but do not write anything, only report success");
    cmdLine.add("--keep-empty", config.keepEmpty,
                "Do not warn about files left empty after stripping");
    cmdLine.add("--spec-as-comments", config.specAsComments,
                "Keep removed contracts as documentation comments");
    cmdLine.add("--ext", config.extensions, "File extensions processed in recursive mode",
                "<ext>[,...]", CommandLineFlags::CommaList);
    cmdLine.add("-v,--verbose", config.verbose, "Log every removed node and stage statistics");
    cmdLine.add("--trace", config.traceFile, "Write per-stage statistics to <file>", "<file>");
    cmdLine.add("--dump-tree", config.dumpTreeFile, "Dump parse tree of each input to <file>",
                "<file>");

    cmdLine.setPositional(
        [this](std::string_view value) {
            if (input) {
                return "only one input file or directory can be given";
            }
            input = fs::path(value);
            return "";
        },
        "input");
}

void VerusStrip::parseCommandLine(int argc, char** argv) {
    if (!cmdLine.parse(argc, argv)) {
        for (auto& err : cmdLine.getErrors())
            std::cerr << err << std::endl;
        exit(1);
    }
}

void VerusStrip::parseArgs(int argc, char** argv) {
    parseCommandLine(argc, argv);
    if (showHelp.value_or(false)) {
        usage();
        exit(0);
    }
    if (showVersion.value_or(false)) {
        std::cout << "verus-strip " << verusStripVersion << "\n";
        exit(0);
    }
    if (!input) {
        usage();
        exit(1);
    }
}
