/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include "../ElfRegionParser.h"
#include <string>
#include <vector>

/**
 * @file ConfigValidator.h
 * @brief Configuration validation and conflict detection
 *
 * Checks a Config built from the command line before any file is loaded.
 *
 * @author elfscope Project
 * @date 2025
 */

/**
 * @class ConfigValidator
 * @brief Validates configuration options and detects conflicts
 *
 * ## Validation Categories:
 * - **Inputs**: at least one file or --self, every file readable and non-empty
 * - **Format Validation**: output format and space selection
 * - **Logical Consistency**: option combinations that have no effect (warnings)
 *
 * ## Usage:
 * ```cpp
 * std::string error;
 * if (!ConfigValidator::validate(config, error)) {
 *     std::cerr << "Configuration error: " << error << std::endl;
 *     return 1;
 * }
 * ```
 */
class ConfigValidator {
public:
    /**
     * @brief Validation result structure
     */
    struct ValidationResult {
        bool is_valid = true;           ///< Whether configuration is valid
        std::string error_message;      ///< Detailed error message if invalid
        std::vector<std::string> warnings; ///< Non-fatal warnings
    };

    /**
     * @brief Validate complete configuration
     *
     * Stops at the first error. Warnings are only collected for a valid
     * configuration.
     *
     * @param config Configuration to validate
     * @return ValidationResult with validation status and messages
     */
    static ValidationResult validate(const Config& config);

    /**
     * @brief Simple validation with error string
     *
     * @param config Configuration to validate
     * @param error Output parameter for error message
     * @return true if valid, false if errors found
     */
    static bool validate(const Config& config, std::string& error);

    /**
     * @brief Check that the output format is "text" or "json"
     */
    static bool validateFormat(const std::string& format, std::string& error);

    /**
     * @brief Check that the space selection is "file", "virtual" or "both"
     */
    static bool validateSpace(const std::string& space, std::string& error);

    /**
     * @brief Validate input file accessibility
     *
     * @param filepath Path to input file
     * @param error Output parameter for error message
     * @return true if file is accessible, false otherwise
     */
    static bool validateInputFile(const std::string& filepath, std::string& error);

    /**
     * @brief Check logical consistency of option combinations
     *
     * @param config Configuration to check
     * @param warnings Output parameter for warning messages
     * @return true always (generates warnings, not errors)
     */
    static bool checkLogicalConsistency(const Config& config, std::vector<std::string>& warnings);

private:
    static const std::vector<std::string> VALID_FORMATS;
    static const std::vector<std::string> VALID_SPACES;
};
