/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "CLI11Parser.h"
#include <regex>
#include "VersionInfo.h"

namespace {
int last_exit_code = 0;
}

std::string
CompactFormatter::make_help(const CLI::App* app, std::string name, CLI::AppFormatMode mode) const {
    std::string help = CLI::Formatter::make_help(app, name, mode);

    // Remove the positionals section entirely
    size_t pos = help.find("\nPOSITIONALS:");
    if (pos != std::string::npos) {
        size_t end = help.find("\nOPTIONS:", pos);
        if (end != std::string::npos) {
            help.erase(pos, end - pos);
        }
    }

    help = std::regex_replace(help, std::regex("\n\n\n+"), "\n\n");

    return help;
}

std::optional<Config> CLI11Parser::parse(int argc, char* argv[]) {
    Config config;

    CLI::App app{VersionInfo::DESCRIPTION, VersionInfo::APP_NAME};
    setupApp(app, config);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Prints help, version or the error message
        last_exit_code = app.exit(e);
        return std::nullopt;
    }

    last_exit_code = 0;
    return config;
}

int CLI11Parser::lastExitCode() {
    return last_exit_code;
}

void CLI11Parser::setupApp(CLI::App& app, Config& config) {
    auto formatter = std::make_shared<CompactFormatter>();
    formatter->column_width(40);
    formatter->label("REQUIRED", "");
    app.formatter(formatter);

    app.allow_extras(false);
    app.allow_config_extras(false);

    app.set_version_flag("--version,-v", []() {
        VersionInfo::showVersion();
        return std::string{};
    });
    app.set_help_flag("--help,-h", "Show this help");

    app.add_option("files", config.inputFiles, "ELF files to analyze")
        ->check(CLI::ExistingFile);

    app.add_flag("--self", config.loadSelf, "Also analyze the running elfscope executable");

    // Output selection
    app.add_flag(
        "--json",
        [&config](bool flag) { config.format = flag ? "json" : "text"; },
        "Output in JSON format (default: text)");
    app.add_option("--space", config.space, "Trees to print: file, virtual or both (default: both)")
        ->check(CLI::IsMember({"file", "virtual", "both"}));
    app.add_flag("--show-notes", config.showNotes, "Print region notes in text output");
    app.add_option("--max-depth", config.maxDepth, "Limit printed depth below the root (0 = unlimited)")
        ->check(CLI::NonNegativeNumber);

    // Loading
    app.add_option("--threads", config.threadCount, "Worker threads for multiple files (0 = auto)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--mmap-threshold",
                   config.mmapThreshold,
                   "Memory-map files of at least this many bytes (default: 10485760)")
        ->check(CLI::PositiveNumber);

    app.add_flag(
           "--verbose",
           [&config](int64_t count) { config.verbosity = static_cast<int>(count); },
           "Show progress on stderr (use twice for more detail)")
        ->multi_option_policy(CLI::MultiOptionPolicy::Sum);
}
