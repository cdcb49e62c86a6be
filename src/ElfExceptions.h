/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file ElfExceptions.h
 * @brief Exception hierarchy for ELF region parsing errors
 *
 * Every fatal condition met while turning a byte buffer into region trees is
 * reported through one of these exceptions. Each exception carries a machine
 * readable ErrorKind, optional context and a suggestion for the user.
 *
 * Exception Hierarchy:
 * - ElfParsingError (base)
 *   - ElfFileError (file acquisition before parsing)
 *   - BadMagicError (missing or wrong ELF signature)
 *   - TruncatedHeaderError (buffer shorter than the fixed header)
 *   - UnsupportedEncodingError (unknown class or data encoding)
 *   - MalformedTableBoundsError (a header-controlled table reaches outside the buffer)
 *
 * Unreadable section names are not exceptions: they resolve to a placeholder
 * and a note on the affected region (see StringTableResolver).
 *
 * Usage Examples:
 * @code
 * try {
 *     ElfRegionParser parser;
 *     BinaryLayout layout = parser.parse("a.out", bytes);
 * } catch (const MalformedTableBoundsError& e) {
 *     std::cerr << e.getTableName() << " at " << e.getExpectedOffset() << '\n';
 * } catch (const ElfParsingError& e) {
 *     std::cerr << "Parse error: " << e.getDetailedMessage() << std::endl;
 * }
 * @endcode
 *
 * @author elfscope Team
 * @date 2025
 */

#ifndef ELF_EXCEPTIONS_H
#define ELF_EXCEPTIONS_H

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ElfScopeExceptions {

/**
 * @brief Machine readable classification of a parse failure
 */
enum class ErrorKind {
    FileAccess,            ///< File could not be read before parsing started
    BadMagic,              ///< Leading signature bytes absent or mismatched
    TruncatedHeader,       ///< Buffer shorter than the fixed header layout
    UnsupportedEncoding,   ///< Unknown ELF class or data encoding
    MalformedTableBounds   ///< Offset/count/entry-size combination reads outside the buffer
};

/**
 * @brief Get printable name for an error kind
 */
inline const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::FileAccess:
            return "FileAccess";
        case ErrorKind::BadMagic:
            return "BadMagic";
        case ErrorKind::TruncatedHeader:
            return "TruncatedHeader";
        case ErrorKind::UnsupportedEncoding:
            return "UnsupportedEncoding";
        case ErrorKind::MalformedTableBounds:
            return "MalformedTableBounds";
    }
    return "Unknown";
}

/**
 * @brief Base exception class for all ELF parsing related errors
 *
 * This is the root of the exception hierarchy, allowing catch-all handling
 * while keeping the specific kind available through getKind().
 */
class ElfParsingError : public std::runtime_error {
public:
    /**
     * @brief Construct exception with kind, message and optional context
     * @param kind Classification of the failure
     * @param message Descriptive error message
     * @param context Additional context information (display name, table name, etc.)
     */
    ElfParsingError(ErrorKind kind, const std::string& message, const std::string& context = "")
        : std::runtime_error(message), kind_(kind), context_(context) {}

    ElfParsingError(const ElfParsingError&) = default;
    ElfParsingError& operator=(const ElfParsingError&) = default;
    ElfParsingError(ElfParsingError&&) noexcept = default;
    ElfParsingError& operator=(ElfParsingError&&) noexcept = default;

    /**
     * @brief Get the failure classification
     */
    ErrorKind getKind() const noexcept { return kind_; }

    /**
     * @brief Get additional context information
     * @return Context string (may be empty)
     */
    const std::string& getContext() const noexcept { return context_; }

    /**
     * @brief Get user-friendly suggestion for resolving the error
     */
    virtual std::string getSuggestion() const {
        return "File may be corrupted or is not an ELF binary";
    }

    /**
     * @brief Get formatted error message with kind, context and suggestion
     * @return Complete error description
     */
    virtual std::string getDetailedMessage() const {
        std::string msg = std::string(errorKindName(kind_)) + ": " + what();
        if (!context_.empty()) {
            msg += " (Context: " + context_ + ")";
        }
        return msg + "\nSuggestion: " + getSuggestion();
    }

protected:
    ErrorKind kind_;        ///< Failure classification
    std::string context_;   ///< Additional context information
};

/**
 * @brief File access errors raised while acquiring the byte buffer
 *
 * Thrown before the parser runs, when a binary cannot be opened or read.
 */
class ElfFileError : public ElfParsingError {
public:
    enum class ErrorType {
        FileNotFound,      ///< File does not exist
        PermissionDenied,  ///< Cannot read file due to permissions
        EmptyFile,         ///< File has no content
        ReadError          ///< I/O error during file reading
    };

    /**
     * @brief Construct file error with type and message
     * @param type Specific type of file error
     * @param message Error description
     * @param filename File path that caused the error
     */
    ElfFileError(ErrorType type, const std::string& message, const std::string& filename = "")
        : ElfParsingError(ErrorKind::FileAccess, message, filename), errorType_(type) {}

    /**
     * @brief Get the specific file error type
     */
    ErrorType getErrorType() const noexcept { return errorType_; }

    std::string getSuggestion() const override {
        switch (errorType_) {
            case ErrorType::FileNotFound:
                return "Check that the file path is correct and the file exists";
            case ErrorType::PermissionDenied:
                return "Verify that you have read permissions for the file";
            case ErrorType::EmptyFile:
                return "Ensure the file is a complete ELF binary and not truncated";
            case ErrorType::ReadError:
                return "Check for disk errors or file system issues";
        }
        return "Contact support with the error details";
    }

    static ElfFileError fileNotFound(const std::string& filename) {
        return ElfFileError(ErrorType::FileNotFound, "File not found: " + filename, filename);
    }

    static ElfFileError permissionDenied(const std::string& filename) {
        return ElfFileError(ErrorType::PermissionDenied, "Permission denied: " + filename, filename);
    }

private:
    ErrorType errorType_;
};

/**
 * @brief The buffer does not start with the ELF signature
 */
class BadMagicError : public ElfParsingError {
public:
    explicit BadMagicError(const std::string& message, const std::string& context = "")
        : ElfParsingError(ErrorKind::BadMagic, message, context) {}

    std::string getSuggestion() const override {
        return "Verify that the file is an ELF binary (try 'file' command)";
    }
};

/**
 * @brief The buffer is shorter than the fixed header layout
 */
class TruncatedHeaderError : public ElfParsingError {
public:
    /**
     * @param requiredSize Bytes the header layout needs
     * @param actualSize Bytes available in the buffer
     * @param context Display name of the binary
     */
    TruncatedHeaderError(uint64_t requiredSize, uint64_t actualSize, const std::string& context = "")
        : ElfParsingError(ErrorKind::TruncatedHeader,
                          "ELF header needs " + std::to_string(requiredSize) +
                              " bytes but the buffer holds " + std::to_string(actualSize),
                          context),
          requiredSize_(requiredSize),
          actualSize_(actualSize) {}

    uint64_t getRequiredSize() const noexcept { return requiredSize_; }
    uint64_t getActualSize() const noexcept { return actualSize_; }

    std::string getSuggestion() const override {
        return "Ensure the file is a complete ELF binary and not truncated";
    }

private:
    uint64_t requiredSize_;
    uint64_t actualSize_;
};

/**
 * @brief The identification block names a class or byte order we cannot decode
 */
class UnsupportedEncodingError : public ElfParsingError {
public:
    explicit UnsupportedEncodingError(const std::string& message, const std::string& context = "")
        : ElfParsingError(ErrorKind::UnsupportedEncoding, message, context) {}

    std::string getSuggestion() const override {
        return "Only ELFCLASS32/ELFCLASS64 with little or big endian encoding are supported";
    }
};

/**
 * @brief A header-controlled offset/count/entry-size combination reaches outside the buffer
 *
 * Carries the diagnostic triple: where the table was expected to start, how
 * many bytes it was expected to span, and how long the buffer actually is.
 */
class MalformedTableBoundsError : public ElfParsingError {
public:
    /**
     * @param tableName Name of the table or range being checked (e.g. "section header table")
     * @param expectedOffset Offset the table starts at according to the header
     * @param expectedLength Number of bytes the table spans according to the header
     * @param bufferLength Actual buffer length
     * @param detail Optional explanation replacing the generic message
     */
    MalformedTableBoundsError(const std::string& tableName,
                              uint64_t expectedOffset,
                              uint64_t expectedLength,
                              uint64_t bufferLength,
                              const std::string& detail = "")
        : ElfParsingError(ErrorKind::MalformedTableBounds,
                          detail.empty() ? formatMessage(tableName, expectedOffset, expectedLength,
                                                         bufferLength)
                                         : detail,
                          tableName),
          expectedOffset_(expectedOffset),
          expectedLength_(expectedLength),
          bufferLength_(bufferLength) {}

    const std::string& getTableName() const noexcept { return context_; }
    uint64_t getExpectedOffset() const noexcept { return expectedOffset_; }
    uint64_t getExpectedLength() const noexcept { return expectedLength_; }
    uint64_t getBufferLength() const noexcept { return bufferLength_; }

    std::string getDetailedMessage() const override {
        std::ostringstream oss;
        oss << ElfParsingError::getDetailedMessage() << "\nExpected offset: 0x" << std::hex
            << expectedOffset_ << ", expected length: 0x" << expectedLength_
            << ", buffer length: 0x" << bufferLength_;
        return oss.str();
    }

private:
    static std::string formatMessage(const std::string& tableName,
                                     uint64_t offset,
                                     uint64_t length,
                                     uint64_t bufferLength) {
        std::ostringstream oss;
        oss << tableName << " at offset 0x" << std::hex << offset << " with length 0x" << length
            << " exceeds buffer of 0x" << bufferLength << " bytes";
        return oss.str();
    }

    uint64_t expectedOffset_;
    uint64_t expectedLength_;
    uint64_t bufferLength_;
};

}  // namespace ElfScopeExceptions

#endif  // ELF_EXCEPTIONS_H
