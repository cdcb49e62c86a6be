/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file FileAccessStrategy.h
 * @brief File access strategies that hand the parser an immutable byte buffer
 *
 * Small binaries are read into memory, large ones are memory-mapped read-only.
 * Either way the parser only sees data() and size(); the strategy object keeps
 * the bytes alive for as long as the caller holds it.
 *
 * Key Features:
 * - Automatic strategy selection based on file size
 * - POSIX memory mapping with fallback to in-memory loading
 * - Load time metrics for verbose output
 *
 * @author elfscope Project
 * @date 2025
 */

/**
 * @brief Configuration for file access strategies
 */
struct FileAccessConfig {
    static constexpr size_t DEFAULT_MMAP_THRESHOLD = 10 * 1024 * 1024;               ///< 10MB default threshold
    static constexpr size_t DEFAULT_MAX_IN_MEMORY_SIZE = 2ULL * 1024 * 1024 * 1024;  ///< 2GB max in-memory

    size_t mmap_threshold = DEFAULT_MMAP_THRESHOLD;  ///< Size threshold for memory mapping
    bool force_memory_mapping = false;               ///< Force memory mapping regardless of size
    bool force_in_memory = false;                    ///< Force in-memory loading regardless of size
    bool enable_fallback = true;                     ///< Fall back to in-memory when mapping fails
    size_t max_in_memory_size = DEFAULT_MAX_IN_MEMORY_SIZE;  ///< Maximum size for in-memory loading
};

/**
 * @brief Performance metrics for file access operations
 */
struct AccessMetrics {
    std::chrono::milliseconds load_time{0};  ///< Time taken to load/map the file
    bool fallback_used = false;              ///< Whether fallback strategy was used
    std::string strategy_used;               ///< Name of strategy actually used
};

/**
 * @brief Reason a file could not be provided
 */
enum class FileAccessFailure {
    NotFound,          ///< Path does not exist or is not a regular file
    PermissionDenied,  ///< open() refused with EACCES/EPERM
    Empty,             ///< Zero-sized file
    IoError            ///< Any other read, stat or mapping failure
};

/**
 * @brief Custom exception for file access errors
 */
class FileAccessException : public std::runtime_error {
public:
    explicit FileAccessException(const std::string& message,
                                 FileAccessFailure failure = FileAccessFailure::IoError)
        : std::runtime_error(message), failure_(failure) {}

    FileAccessFailure getFailure() const noexcept { return failure_; }

private:
    FileAccessFailure failure_;
};

/**
 * @class FileAccessStrategy
 * @brief Abstract base class for different file access strategies
 *
 * ## Usage Examples:
 * @code
 * auto strategy = FileAccessStrategy::create("/bin/ls");
 * BinaryLayout layout = parser.parse("ls", strategy->data(), strategy->size());
 * @endcode
 */
class FileAccessStrategy {
public:
    virtual ~FileAccessStrategy() = default;

    /**
     * @brief Get pointer to file data
     * @note The returned pointer remains valid for the lifetime of this object
     */
    virtual const uint8_t* data() const = 0;

    virtual size_t size() const = 0;

    virtual bool isMemoryMapped() const = 0;

    /**
     * @brief Get human-readable description of the strategy
     * @return "Memory-mapped" or "In-memory"
     */
    virtual std::string getStrategyName() const = 0;

    virtual AccessMetrics getMetrics() const = 0;

    /**
     * @brief Factory method to create appropriate strategy based on configuration
     * @param filename Path to the ELF file
     * @param config Configuration options for file access
     * @return Unique pointer to the created strategy
     * @throws FileAccessException if file cannot be accessed
     */
    static std::unique_ptr<FileAccessStrategy> create(const std::string& filename,
                                                      const FileAccessConfig& config = {});

    /**
     * @brief Factory method with a plain size threshold
     * @param mmap_threshold Files at or above this size are memory-mapped
     */
    static std::unique_ptr<FileAccessStrategy> create(const std::string& filename,
                                                      size_t mmap_threshold);

    /**
     * @brief Get file size without opening the file
     * @throws FileAccessException if file cannot be accessed
     */
    static size_t getFileSize(const std::string& filename);

    /**
     * @brief Validate file path and accessibility
     * @throws FileAccessException if path is missing or not a regular file
     */
    static void validateFilePath(const std::string& filename);

    /**
     * @brief Describe an errno value
     */
    static std::string getSystemErrorMessage(int errno_code);
};

/**
 * @class InMemoryFile
 * @brief Strategy that loads entire file into memory
 *
 * ## Best for:
 * - Files smaller than the mmap threshold
 * - Special files whose size only becomes known while reading
 */
class InMemoryFile : public FileAccessStrategy {
public:
    /**
     * @brief Construct and load file into memory
     * @throws FileAccessException if file cannot be read
     */
    explicit InMemoryFile(const std::string& filename, const FileAccessConfig& config = {});

    const uint8_t* data() const override { return data_.data(); }
    size_t size() const override { return data_.size(); }
    bool isMemoryMapped() const override { return false; }
    std::string getStrategyName() const override { return "In-memory"; }
    AccessMetrics getMetrics() const override { return metrics_; }

    void markFallback() { metrics_.fallback_used = true; }

private:
    void loadFile(const std::string& filename, size_t max_size);

    std::vector<uint8_t> data_;
    AccessMetrics metrics_;
};

/**
 * @class MemoryMappedFile
 * @brief Strategy that maps the file read-only with mmap()
 *
 * The mapping is private and read-only; the OS pages it in lazily. The
 * mapping and descriptor are released on destruction.
 */
class MemoryMappedFile : public FileAccessStrategy {
public:
    /**
     * @brief Construct and memory-map the file
     * @throws FileAccessException if file cannot be mapped
     */
    explicit MemoryMappedFile(const std::string& filename);

    ~MemoryMappedFile() override;

    MemoryMappedFile(const MemoryMappedFile&) = delete;
    MemoryMappedFile& operator=(const MemoryMappedFile&) = delete;
    MemoryMappedFile(MemoryMappedFile&&) = delete;
    MemoryMappedFile& operator=(MemoryMappedFile&&) = delete;

    const uint8_t* data() const override { return mapped_data_; }
    size_t size() const override { return file_size_; }
    bool isMemoryMapped() const override { return true; }
    std::string getStrategyName() const override { return "Memory-mapped"; }
    AccessMetrics getMetrics() const override { return metrics_; }

private:
    void cleanup();
    void mapFile(const std::string& filename);

    const uint8_t* mapped_data_;
    size_t file_size_;
    int file_descriptor_;
    AccessMetrics metrics_;
};
