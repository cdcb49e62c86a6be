/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "BinaryLoader.h"

#include <algorithm>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <system_error>
#include "ElfExceptions.h"
#include "FileAccessStrategy.h"
#include "ThreadPool.h"

using ElfScopeExceptions::ElfFileError;
using ElfScopeExceptions::ElfParsingError;

namespace {

ElfFileError toFileError(const FileAccessException& e, const std::string& path) {
    switch (e.getFailure()) {
        case FileAccessFailure::NotFound:
            return ElfFileError(ElfFileError::ErrorType::FileNotFound, e.what(), path);
        case FileAccessFailure::PermissionDenied:
            return ElfFileError(ElfFileError::ErrorType::PermissionDenied, e.what(), path);
        case FileAccessFailure::Empty:
            return ElfFileError(ElfFileError::ErrorType::EmptyFile, e.what(), path);
        case FileAccessFailure::IoError:
            break;
    }
    return ElfFileError(ElfFileError::ErrorType::ReadError, e.what(), path);
}

}  // namespace

BinaryLoader::BinaryLoader(const Config& config) : config_(config) {}

std::string BinaryLoader::displayName(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    return name.empty() ? path : name;
}

BinaryLayout BinaryLoader::loadFile(const std::string& path) const {
    return loadFrom(path, displayName(path));
}

BinaryLayout BinaryLoader::loadSelf() const {
    std::error_code ec;
    std::filesystem::path target = std::filesystem::read_symlink(SELF_EXECUTABLE_PATH, ec);
    std::string name = ec ? std::string("self") : displayName(target.string());
    return loadFrom(SELF_EXECUTABLE_PATH, name);
}

BinaryLayout BinaryLoader::loadFrom(const std::string& path, const std::string& display_name) const {
    std::unique_ptr<FileAccessStrategy> file_access;
    try {
        FileAccessConfig access_config;
        access_config.mmap_threshold = config_.mmapThreshold;
        file_access = FileAccessStrategy::create(path, access_config);
    } catch (const FileAccessException& e) {
        throw toFileError(e, path);
    }

    if (config_.verbosity > 0) {
        AccessMetrics metrics = file_access->getMetrics();
        std::cerr << "Loading file: " << path << " (" << file_access->size() << " bytes) using "
                  << metrics.strategy_used << " access in " << metrics.load_time.count() << " ms"
                  << (metrics.fallback_used ? " after memory mapping failed" : "") << "\n";
    }

    ElfRegionParser parser(config_);
    return parser.parse(display_name, file_access->data(), file_access->size());
}

LoadResult BinaryLoader::loadCaptured(const std::string& path, bool is_self) const {
    LoadResult result;
    result.source = is_self ? std::string(SELF_EXECUTABLE_PATH) : path;
    try {
        result.layout = is_self ? loadSelf() : loadFile(path);
    } catch (const ElfParsingError& e) {
        result.error = e.what();
    } catch (const std::exception& e) {
        result.error = std::string("Unexpected error: ") + e.what();
    }
    return result;
}

std::vector<LoadResult> BinaryLoader::loadAll(const std::vector<std::string>& paths,
                                              bool include_self) const {
    size_t input_count = paths.size() + (include_self ? 1 : 0);
    std::vector<LoadResult> results;
    results.reserve(input_count);

    if (input_count <= 1) {
        for (const auto& path : paths) {
            results.push_back(loadCaptured(path, false));
        }
        if (include_self) {
            results.push_back(loadCaptured(std::string(), true));
        }
        return results;
    }

    size_t thread_count = config_.threadCount == 0
                              ? std::max(size_t(1), static_cast<size_t>(std::thread::hardware_concurrency()))
                              : config_.threadCount;
    thread_count = std::min(thread_count, input_count);

    std::vector<std::future<LoadResult>> pending;
    pending.reserve(input_count);
    {
        ThreadPool pool(thread_count);
        for (const auto& path : paths) {
            pending.push_back(pool.submit([this, path]() { return loadCaptured(path, false); }));
        }
        if (include_self) {
            pending.push_back(pool.submit([this]() { return loadCaptured(std::string(), true); }));
        }

        if (config_.verbosity > 0) {
            std::cerr << "Loading " << input_count << " binaries on " << pool.getThreadCount()
                      << " threads\n";
        }

        for (auto& future : pending) {
            results.push_back(future.get());
        }

        pool.shutdown();
        if (config_.verbosity > 0) {
            const ThreadPoolMetrics& metrics = pool.getMetrics();
            std::cerr << "Completed " << metrics.tasks_completed.load() << " of "
                      << metrics.tasks_submitted.load() << " load tasks, average "
                      << std::fixed << std::setprecision(1) << metrics.getAverageExecutionTime()
                      << " us per task\n"
                      << std::defaultfloat;
        }
    }
    return results;
}
