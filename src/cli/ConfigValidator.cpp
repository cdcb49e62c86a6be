/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ConfigValidator.h"
#include <algorithm>
#include <fstream>
#include <sstream>

const std::vector<std::string> ConfigValidator::VALID_FORMATS = {"text", "json"};

const std::vector<std::string> ConfigValidator::VALID_SPACES = {"file", "virtual", "both"};

namespace {

bool isMember(const std::vector<std::string>& valid,
              const std::string& value,
              const std::string& what,
              std::string& error) {
    if (std::find(valid.begin(), valid.end(), value) != valid.end()) {
        return true;
    }
    std::ostringstream oss;
    oss << "Invalid " << what << " '" << value << "'. Valid options are: ";
    for (size_t i = 0; i < valid.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << valid[i];
    }
    error = oss.str();
    return false;
}

}  // namespace

ConfigValidator::ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;
    std::string error;

    if (config.inputFiles.empty() && !config.loadSelf) {
        result.is_valid = false;
        result.error_message = "No input given. Specify one or more ELF files, or --self.";
        return result;
    }

    if (!validateFormat(config.format, error) || !validateSpace(config.space, error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    for (const auto& file : config.inputFiles) {
        if (!validateInputFile(file, error)) {
            result.is_valid = false;
            result.error_message = error;
            return result;
        }
    }

    checkLogicalConsistency(config, result.warnings);

    return result;
}

bool ConfigValidator::validate(const Config& config, std::string& error) {
    ValidationResult result = validate(config);
    if (!result.is_valid) {
        error = result.error_message;
        return false;
    }
    return true;
}

bool ConfigValidator::validateFormat(const std::string& format, std::string& error) {
    return isMember(VALID_FORMATS, format, "output format", error);
}

bool ConfigValidator::validateSpace(const std::string& space, std::string& error) {
    return isMember(VALID_SPACES, space, "space", error);
}

bool ConfigValidator::validateInputFile(const std::string& filepath, std::string& error) {
    if (filepath.empty()) {
        error = "Input file path is empty";
        return false;
    }

    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        error = "Cannot open input file '" + filepath + "'. Please check that the file exists and is readable.";
        return false;
    }

    file.seekg(0, std::ios::end);
    auto file_size = file.tellg();
    if (file_size <= 0) {
        error = "Input file '" + filepath + "' is empty or cannot determine file size.";
        return false;
    }

    return true;
}

bool ConfigValidator::checkLogicalConsistency(const Config& config, std::vector<std::string>& warnings) {
    if (config.showNotes && config.format == "json") {
        warnings.push_back("--show-notes has no effect with --json. JSON output always includes notes.");
    }

    size_t input_count = config.inputFiles.size() + (config.loadSelf ? 1 : 0);
    if (config.threadCount > 0 && input_count < 2) {
        warnings.push_back("--threads has no effect with a single input. Files are loaded in parallel only when there are several.");
    }

    return true;
}
