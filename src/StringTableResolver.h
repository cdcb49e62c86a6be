/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief Outcome of a string table lookup
 */
struct ResolvedName {
    std::string name;
    bool valid = true;  ///< false when the offset lay outside the table
};

/**
 * @class StringTableResolver
 * @brief Corruption tolerant lookup of NUL-terminated names in a string table blob
 *
 * The resolver views (does not own) the raw bytes of the name string section.
 * An offset outside the blob yields the placeholder "<invalid name offset>"
 * with valid == false; the caller decides how to report it. A name missing its
 * terminator ends at the end of the blob. No lookup reads past the blob.
 *
 * A resolver made by absent() stands for a file without a name table: every
 * offset resolves to an empty, valid name.
 */
class StringTableResolver {
public:
    static constexpr const char* INVALID_OFFSET_PLACEHOLDER = "<invalid name offset>";

    /// Zero-length table; only offset 0 resolves
    StringTableResolver() = default;

    StringTableResolver(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    /// No name table at all (e_shstrndx is SHN_UNDEF or names a NOBITS section)
    static StringTableResolver absent() {
        StringTableResolver resolver;
        resolver.absent_ = true;
        return resolver;
    }

    /**
     * @brief Resolve the name starting at offset
     * @param offset Byte offset into the blob (sh_name)
     * @return Name up to the next NUL, or the placeholder for an out-of-range offset
     */
    ResolvedName resolve(uint64_t offset) const;

    size_t size() const { return size_; }
    bool isAbsent() const { return absent_; }

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    bool absent_ = false;
};
