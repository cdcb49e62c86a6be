/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "StringTableResolver.h"

#include <cstring>

ResolvedName StringTableResolver::resolve(uint64_t offset) const {
    ResolvedName result;
    if (absent_) {
        return result;
    }
    if (offset > size_) {
        result.name = INVALID_OFFSET_PLACEHOLDER;
        result.valid = false;
        return result;
    }

    const char* begin = reinterpret_cast<const char*>(data_) + offset;
    size_t remaining = size_ - static_cast<size_t>(offset);
    if (remaining == 0) {
        return result;
    }

    const void* terminator = std::memchr(begin, '\0', remaining);
    size_t length = terminator != nullptr
                        ? static_cast<size_t>(static_cast<const char*>(terminator) - begin)
                        : remaining;
    result.name.assign(begin, length);
    return result;
}
