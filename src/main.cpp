/**
 * @file main.cpp
 * @brief Command-line entry point for elfscope
 *
 * Parses options with CLI11, loads every requested binary and prints the
 * file and virtual region trees of the ones that parsed.
 *
 * @section usage_examples Usage Examples
 * @code
 * // Text trees of one binary
 * ./elfscope /bin/ls
 *
 * // Only the file space, with notes, two levels deep
 * ./elfscope --space file --show-notes --max-depth 2 /bin/ls
 *
 * // JSON for several binaries plus elfscope itself
 * ./elfscope --json --self a.out libfoo.so
 * @endcode
 *
 * @author elfscope Development Team
 * @date 2025
 * @copyright Mozilla Public License 2.0
 */

/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>
#include "BinaryLoader.h"
#include "ElfExceptions.h"
#include "cli/CLI11Parser.h"
#include "cli/ConfigValidator.h"
#include "output/OutputGenerator.h"

/**
 * @brief Main entry point
 *
 * 1. Parse arguments with CLI11 (help, version and usage errors end here)
 * 2. Validate the configuration
 * 3. Load all inputs, reporting each failure on stderr
 * 4. Print the layouts that loaded
 *
 * @return 0 when every input loaded, 1 otherwise
 */
int main(int argc, char* argv[]) {
    try {
        auto config_result = CLI11Parser::parse(argc, argv);
        if (!config_result) {
            return CLI11Parser::lastExitCode();
        }
        Config config = *config_result;

        auto validationResult = ConfigValidator::validate(config);
        if (!validationResult.is_valid) {
            std::cerr << "Configuration error: " << validationResult.error_message << '\n';
            return 1;
        }

        for (const auto& warning : validationResult.warnings) {
            std::cerr << "Warning: " << warning << '\n';
        }

        BinaryLoader loader(config);
        std::vector<LoadResult> results = loader.loadAll(config.inputFiles, config.loadSelf);

        std::vector<BinaryLayout> layouts;
        bool all_loaded = true;
        for (auto& result : results) {
            if (result.ok()) {
                layouts.push_back(std::move(*result.layout));
            } else {
                std::cerr << "Failed to load " << result.source << ": " << result.error << '\n';
                all_loaded = false;
            }
        }

        if (!layouts.empty()) {
            OutputGenerator generator(config);
            generator.generate(layouts);
        }

        return all_loaded ? 0 : 1;

    } catch (const ElfScopeExceptions::ElfParsingError& e) {
        std::cerr << "ELF Analysis Error: " << e.getDetailedMessage() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected Error: " << e.what() << '\n';
        return 1;
    }
}
