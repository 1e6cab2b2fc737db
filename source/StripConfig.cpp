// SPDX-License-Identifier: Apache-2.0
#include "StripConfig.hpp"
#include <algorithm>
#include "Errors.hpp"

StripOptions StripConfig::stripOptions() const {
    StripOptions options;
    options.specAsComments = specAsComments.value_or(false);
    return options;
}

bool StripConfig::matchesExtension(const fs::path& file) const {
    std::string extension = file.extension().string();
    if (extensions.empty())
        return extension == ".rs";
    return std::ranges::any_of(extensions, [&](const std::string& wanted) {
        // accept both "rs" and ".rs"
        return wanted.starts_with(".") ? extension == wanted : extension == "." + wanted;
    });
}

void StripConfig::validate(const std::optional<fs::path>& input) const {
    if (!input || input->empty())
        throw ConfigError("no input file or directory given", "run with --help for usage");
    if (output && isInPlace())
        throw ConfigError("--output cannot be used together with --in-place");
    std::error_code ec;
    if (!fs::exists(*input, ec))
        throw ConfigError("input path '" + input->string() + "' does not exist");
    if (fs::is_directory(*input, ec)) {
        if (!isRecursive())
            throw ConfigError("'" + input->string() + "' is a directory",
                              "use --recursive to process directories");
        if (output)
            throw ConfigError("--output cannot be used with a directory input",
                              "use --in-place or write to stdout");
    }
}
