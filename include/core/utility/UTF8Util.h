/*
 * UTF8Util.h - UTF-8 and Latin-1 text utilities
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef BADGEBAKER_CORE_UTILITY_UTF8UTIL_H
#define BADGEBAKER_CORE_UTILITY_UTF8UTIL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace BadgeBaker {
namespace Core {
namespace Utility {

/**
 * @brief UTF-8 and ISO-8859-1 helpers for PNG text fields
 *
 * PNG text keywords and language tags are Latin-1 on the wire, while the
 * text body of an iTXt chunk is UTF-8. Internally every string is UTF-8.
 *
 * Thread Safety: All methods are stateless and thread-safe.
 */
class UTF8Util {
public:
    // ========================================================================
    // UTF-8 Validation
    // ========================================================================

    /**
     * @brief Check if a string is valid UTF-8
     * @param text String to validate
     * @return true if valid UTF-8, false otherwise
     */
    static bool isValid(const std::string& text);

    /**
     * @brief Check if a byte buffer is valid UTF-8
     * @param data Pointer to data
     * @param size Size of data in bytes
     * @return true if valid UTF-8, false otherwise
     */
    static bool isValid(const uint8_t* data, size_t size);

    // ========================================================================
    // ISO-8859-1 (Latin-1) Conversion
    // ========================================================================

    /**
     * @brief Convert Latin-1 bytes to UTF-8
     *
     * The whole range is converted; embedded NUL bytes are kept.
     */
    static std::string fromLatin1(const uint8_t* data, size_t size);

    /**
     * @brief Convert a UTF-8 string to Latin-1 bytes
     *
     * Characters above U+00FF become '?'. Use isLatin1() first when
     * lossy conversion is not acceptable.
     */
    static std::vector<uint8_t> toLatin1(const std::string& text);

    /**
     * @brief Check that a UTF-8 string is representable in Latin-1
     */
    static bool isLatin1(const std::string& text);

    // ========================================================================
    // Codepoint Operations
    // ========================================================================

    /**
     * @brief Encode a single codepoint to UTF-8
     * @param codepoint Unicode codepoint (U+0000 to U+10FFFF)
     * @return UTF-8 encoded string, or replacement char for invalid codepoints
     */
    static std::string encodeCodepoint(uint32_t codepoint);

    /**
     * @brief Decode a single codepoint from UTF-8 data
     * @param data Pointer to UTF-8 data
     * @param size Size of data
     * @param bytesConsumed Output: number of bytes consumed
     * @return Decoded codepoint, or U+FFFD on error
     */
    static uint32_t decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed);

    // ========================================================================
    // Buffer scanning
    // ========================================================================

    /**
     * @brief Find the next NUL byte at or after start
     * @return Offset of the NUL byte, or std::string::npos if none
     */
    static size_t findNullTerminator(const uint8_t* data, size_t size, size_t start = 0);

private:
    static void appendCodepoint(std::string& output, uint32_t codepoint);
};

} // namespace Utility
} // namespace Core
} // namespace BadgeBaker

#endif // BADGEBAKER_CORE_UTILITY_UTF8UTIL_H
