/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "FileAccessStrategy.h"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <system_error>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

/**
 * @brief Message builders shared by the strategies
 */
class FileAccessErrors {
public:
    static std::string cannotOpen(const std::string& filename, const std::string& reason = "") {
        return "Cannot open file '" + filename + "'" + (reason.empty() ? "" : ": " + reason);
    }

    static std::string cannotGetSize(const std::string& filename) {
        return "Cannot determine size of file '" + filename + "'";
    }

    static std::string cannotMap(const std::string& filename, const std::string& operation) {
        return "Cannot " + operation + " file '" + filename + "'";
    }

    static std::string fileTooLarge(const std::string& filename, size_t size, size_t limit) {
        return "File '" + filename + "' (" + std::to_string(size) + " bytes) exceeds limit of " +
               std::to_string(limit) + " bytes";
    }

    static FileAccessFailure classifyOpenError(int errno_code) {
        if (errno_code == EACCES || errno_code == EPERM) {
            return FileAccessFailure::PermissionDenied;
        }
        if (errno_code == ENOENT) {
            return FileAccessFailure::NotFound;
        }
        return FileAccessFailure::IoError;
    }
};

// ============================================================================
// FileAccessStrategy Implementation
// ============================================================================

std::unique_ptr<FileAccessStrategy> FileAccessStrategy::create(const std::string& filename,
                                                               const FileAccessConfig& config) {
    validateFilePath(filename);
    size_t file_size = getFileSize(filename);

    if (file_size == 0) {
        throw FileAccessException("Cannot process zero-sized file: " + filename,
                                  FileAccessFailure::Empty);
    }

    if (config.force_memory_mapping) {
        return std::make_unique<MemoryMappedFile>(filename);
    }
    if (config.force_in_memory || file_size < config.mmap_threshold) {
        return std::make_unique<InMemoryFile>(filename, config);
    }

    try {
        return std::make_unique<MemoryMappedFile>(filename);
    } catch (const FileAccessException& e) {
        if (!config.enable_fallback || e.getFailure() == FileAccessFailure::PermissionDenied) {
            throw;
        }
        std::cerr << "Warning: Memory mapping failed (" << e.what()
                  << "), falling back to in-memory loading\n";
        auto fallback = std::make_unique<InMemoryFile>(filename, config);
        fallback->markFallback();
        return fallback;
    }
}

std::unique_ptr<FileAccessStrategy> FileAccessStrategy::create(const std::string& filename,
                                                               size_t mmap_threshold) {
    FileAccessConfig config;
    config.mmap_threshold = mmap_threshold;
    return create(filename, config);
}

size_t FileAccessStrategy::getFileSize(const std::string& filename) {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(filename, ec);
    if (ec) {
        throw FileAccessException(FileAccessErrors::cannotGetSize(filename) + ": " + ec.message());
    }

    if (file_size > std::numeric_limits<size_t>::max() / 2) {
        throw FileAccessException("File too large for platform: " + filename + " (" +
                                  std::to_string(file_size) + " bytes)");
    }
    return static_cast<size_t>(file_size);
}

void FileAccessStrategy::validateFilePath(const std::string& filename) {
    if (filename.empty()) {
        throw FileAccessException("Filename cannot be empty", FileAccessFailure::NotFound);
    }

    std::error_code ec;
    if (!std::filesystem::exists(filename, ec)) {
        if (ec) {
            throw FileAccessException("Cannot check file existence '" + filename +
                                      "': " + ec.message());
        }
        throw FileAccessException("File does not exist: " + filename, FileAccessFailure::NotFound);
    }
    if (!std::filesystem::is_regular_file(filename, ec)) {
        if (ec) {
            throw FileAccessException("Cannot check file type '" + filename + "': " + ec.message());
        }
        throw FileAccessException("Path is not a regular file: " + filename,
                                  FileAccessFailure::NotFound);
    }
}

std::string FileAccessStrategy::getSystemErrorMessage(int errno_code) {
    return std::system_category().message(errno_code);
}

// ============================================================================
// InMemoryFile Implementation
// ============================================================================

InMemoryFile::InMemoryFile(const std::string& filename, const FileAccessConfig& config) {
    auto start_time = std::chrono::steady_clock::now();
    loadFile(filename, config.max_in_memory_size);
    auto end_time = std::chrono::steady_clock::now();
    metrics_.load_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    metrics_.strategy_used = getStrategyName();
}

void InMemoryFile::loadFile(const std::string& filename, size_t max_size) {
    size_t file_size = FileAccessStrategy::getFileSize(filename);
    if (file_size > max_size) {
        throw FileAccessException(FileAccessErrors::fileTooLarge(filename, file_size, max_size));
    }

    // Try open() first so a refused read reports the real errno
    int check_fd = open(filename.c_str(), O_RDONLY);
    if (check_fd == -1) {
        int error_code = errno;
        throw FileAccessException(
            FileAccessErrors::cannotOpen(filename, getSystemErrorMessage(error_code)),
            FileAccessErrors::classifyOpenError(error_code));
    }
    close(check_fd);

    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw FileAccessException(FileAccessErrors::cannotOpen(filename));
    }

    data_.resize(file_size);

    // Read file in chunks for better error handling
    constexpr size_t CHUNK_SIZE = static_cast<size_t>(1024) * 1024;  // 1MB chunks
    size_t bytes_read = 0;
    while (bytes_read < file_size) {
        size_t chunk_size = std::min(CHUNK_SIZE, file_size - bytes_read);
        file.read(reinterpret_cast<char*>(data_.data() + bytes_read),
                  static_cast<std::streamsize>(chunk_size));
        if (file.fail() && !file.eof()) {
            throw FileAccessException("Failed to read file '" + filename + "' at offset " +
                                      std::to_string(bytes_read));
        }
        bytes_read += static_cast<size_t>(file.gcount());
        if (file.eof()) {
            break;
        }
    }

    if (bytes_read != file_size) {
        throw FileAccessException("File size mismatch for '" + filename + "': expected " +
                                  std::to_string(file_size) + " bytes, read " +
                                  std::to_string(bytes_read) + " bytes");
    }
}

// ============================================================================
// MemoryMappedFile Implementation
// ============================================================================

MemoryMappedFile::MemoryMappedFile(const std::string& filename)
    : mapped_data_(nullptr), file_size_(0), file_descriptor_(-1) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        mapFile(filename);
    } catch (const FileAccessException&) {
        cleanup();
        throw;
    }
    auto end_time = std::chrono::steady_clock::now();
    metrics_.load_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    metrics_.strategy_used = getStrategyName();
}

void MemoryMappedFile::mapFile(const std::string& filename) {
    file_descriptor_ = open(filename.c_str(), O_RDONLY);
    if (file_descriptor_ == -1) {
        int error_code = errno;
        throw FileAccessException(
            FileAccessErrors::cannotOpen(filename, getSystemErrorMessage(error_code)),
            FileAccessErrors::classifyOpenError(error_code));
    }

    struct stat file_stat;
    if (fstat(file_descriptor_, &file_stat) == -1) {
        int error_code = errno;
        throw FileAccessException(FileAccessErrors::cannotGetSize(filename) + ": " +
                                  getSystemErrorMessage(error_code));
    }

    if (file_stat.st_size <= 0) {
        throw FileAccessException("Cannot process zero-sized file: " + filename,
                                  FileAccessFailure::Empty);
    }
    file_size_ = static_cast<size_t>(file_stat.st_size);

    void* mapped = mmap(nullptr, file_size_, PROT_READ, MAP_PRIVATE, file_descriptor_, 0);
    if (mapped == MAP_FAILED) {
        int error_code = errno;
        throw FileAccessException(FileAccessErrors::cannotMap(filename, "memory map") + ": " +
                                  getSystemErrorMessage(error_code));
    }
    mapped_data_ = static_cast<const uint8_t*>(mapped);
}

MemoryMappedFile::~MemoryMappedFile() {
    cleanup();
}

void MemoryMappedFile::cleanup() {
    if (mapped_data_) {
        munmap(const_cast<uint8_t*>(mapped_data_), file_size_);
        mapped_data_ = nullptr;
    }
    if (file_descriptor_ != -1) {
        close(file_descriptor_);
        file_descriptor_ = -1;
    }
    file_size_ = 0;
}
