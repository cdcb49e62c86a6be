/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file ElfMemoryValidator.h
 * @brief Bounds checking for every header-controlled access into an ELF buffer
 *
 * All offsets, counts and entry sizes read from an ELF header are untrusted.
 * Before the parser slices the buffer it asks the validator whether the range
 * fits; a range that does not fit raises MalformedTableBoundsError instead of
 * reading out of bounds.
 *
 * Key Features:
 * - Overflow-checked offset and table size arithmetic on 64-bit values
 * - Typed errors carrying offset, length and buffer length
 * - Signature and identification checks for the parse entry point
 *
 * @author elfscope Project
 * @date 2025
 */

#ifndef ELF_MEMORY_VALIDATOR_H
#define ELF_MEMORY_VALIDATOR_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include "ElfExceptions.h"
#include "ElfStructures.h"

namespace ElfScopeUtils {

/**
 * @brief Overflow-checked arithmetic for header-controlled values
 */
class SafeArithmetic {
public:
    /**
     * @brief Add two values, reporting overflow instead of wrapping
     * @return false if a + b does not fit into 64 bits
     */
    static bool checkedAdd(uint64_t a, uint64_t b, uint64_t& result) noexcept {
        if (a > std::numeric_limits<uint64_t>::max() - b) {
            return false;
        }
        result = a + b;
        return true;
    }

    /**
     * @brief Multiply two values, reporting overflow instead of wrapping
     * @return false if a * b does not fit into 64 bits
     */
    static bool checkedMultiply(uint64_t a, uint64_t b, uint64_t& result) noexcept {
        if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
            return false;
        }
        result = a * b;
        return true;
    }
};

/**
 * @brief Memory bounds validator for one immutable ELF buffer
 *
 * The validator never owns the buffer; the caller keeps it alive for the
 * duration of the parse.
 */
class ElfMemoryValidator {
private:
    const uint8_t* data_;
    uint64_t size_;
    std::string displayName_;

public:
    /**
     * @brief Construct validator for memory buffer
     * @param data Pointer to memory buffer (may be null only when size is 0)
     * @param size Size of memory buffer
     * @param displayName Name used in error context
     */
    ElfMemoryValidator(const uint8_t* data, size_t size, const std::string& displayName)
        : data_(data), size_(size), displayName_(displayName) {}

    /**
     * @brief Validate that [offset, offset + length) lies within the buffer
     * @param tableName Description used in the error
     * @throws MalformedTableBoundsError if the range is out of bounds or overflows
     */
    void validateRange(uint64_t offset, uint64_t length, const std::string& tableName) const {
        uint64_t end = 0;
        if (!SafeArithmetic::checkedAdd(offset, length, end) || end > size_) {
            throw ElfScopeExceptions::MalformedTableBoundsError(tableName, offset, length, size_);
        }
    }

    /**
     * @brief Validate a table of count entries of entrySize bytes starting at offset
     * @return Total table length in bytes
     * @throws MalformedTableBoundsError if the table does not fit or its size overflows
     */
    uint64_t validateTable(uint64_t offset,
                           uint64_t count,
                           uint64_t entrySize,
                           const std::string& tableName) const {
        uint64_t length = 0;
        if (!SafeArithmetic::checkedMultiply(count, entrySize, length)) {
            throw ElfScopeExceptions::MalformedTableBoundsError(
                tableName,
                offset,
                std::numeric_limits<uint64_t>::max(),
                size_,
                tableName + " size overflows (" + std::to_string(count) + " entries of " +
                    std::to_string(entrySize) + " bytes)");
        }
        validateRange(offset, length, tableName);
        return length;
    }

    /**
     * @brief Validate that a table's entry size can hold one decoded record
     * @throws MalformedTableBoundsError if entries are smaller than the record layout
     */
    void validateEntrySize(uint64_t tableOffset,
                           uint64_t entrySize,
                           uint64_t recordSize,
                           const std::string& tableName) const {
        if (entrySize < recordSize) {
            throw ElfScopeExceptions::MalformedTableBoundsError(
                tableName,
                tableOffset,
                recordSize,
                size_,
                tableName + " entry size " + std::to_string(entrySize) +
                    " is smaller than the " + std::to_string(recordSize) + "-byte record");
        }
    }

    /**
     * @brief Safe read of a raw (unswapped) value from the buffer
     * @tparam T Trivially copyable type to read
     * @throws MalformedTableBoundsError if the read would be out of bounds
     */
    template<typename T>
    T readValue(uint64_t offset, const std::string& context) const {
        validateRange(offset, sizeof(T), context);

        T value;
        std::memcpy(&value, data_ + offset, sizeof(T));
        return value;
    }

    /**
     * @brief Validate the ELF signature and identification block
     *
     * Checks run in this order: signature (BadMagic), identification length
     * (TruncatedHeader), class and encoding (UnsupportedEncoding), full header
     * length for the class (TruncatedHeader).
     *
     * @return The validated ELF class
     */
    ElfClass validateIdentification() const {
        if (size_ < ElfIdent::MAGIC_SIZE ||
            std::memcmp(data_, ElfIdent::MAGIC, ElfIdent::MAGIC_SIZE) != 0) {
            throw ElfScopeExceptions::BadMagicError("Magic ELF bytes were wrong", displayName_);
        }

        if (size_ < ElfIdent::EI_NIDENT) {
            throw ElfScopeExceptions::TruncatedHeaderError(ElfIdent::EI_NIDENT, size_, displayName_);
        }

        uint8_t elf_class = data_[ElfIdent::EI_CLASS];
        if (elf_class != static_cast<uint8_t>(ElfClass::ELFCLASS32) &&
            elf_class != static_cast<uint8_t>(ElfClass::ELFCLASS64)) {
            throw ElfScopeExceptions::UnsupportedEncodingError(
                "Invalid ELF class " + std::to_string(elf_class) + " (must be 32-bit or 64-bit)",
                displayName_);
        }

        uint8_t elf_data = data_[ElfIdent::EI_DATA];
        if (elf_data != static_cast<uint8_t>(ElfData::ELFDATA2LSB) &&
            elf_data != static_cast<uint8_t>(ElfData::ELFDATA2MSB)) {
            throw ElfScopeExceptions::UnsupportedEncodingError(
                "Invalid ELF data encoding " + std::to_string(elf_data) +
                    " (must be little or big endian)",
                displayName_);
        }

        ElfClass cls = static_cast<ElfClass>(elf_class);
        uint64_t header_size = cls == ElfClass::ELFCLASS32 ? ElfIdent::ELF32_EHDR_SIZE
                                                           : ElfIdent::ELF64_EHDR_SIZE;
        if (size_ < header_size) {
            throw ElfScopeExceptions::TruncatedHeaderError(header_size, size_, displayName_);
        }
        return cls;
    }

    uint64_t getSize() const noexcept { return size_; }

    const uint8_t* getData() const noexcept { return data_; }

    const std::string& getDisplayName() const noexcept { return displayName_; }
};

}  // namespace ElfScopeUtils

#endif  // ELF_MEMORY_VALIDATOR_H
