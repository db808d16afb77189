/*
 * BakerOptions.h - Baking engine configuration
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

#ifndef BADGEBAKER_BAKER_BAKEROPTIONS_H
#define BADGEBAKER_BAKER_BAKEROPTIONS_H

// No direct includes - all includes should be in badgebaker.h

namespace BadgeBaker {
namespace Baker {

/**
 * @brief What bake() does when the image already carries a credential
 */
enum class DuplicatePolicy {
    Insert,   // Add another chunk after IHDR, leave existing ones alone
    Replace   // Remove existing credential chunks first
};

/**
 * @brief Engine settings
 *
 * Config file format, one setting per line:
 *
 *   # comment
 *   keyword=openbadges
 *   verify_checksums=false
 *   duplicate_policy=insert
 *   max_inflated_size=16777216
 */
struct BakerOptions {
    static constexpr const char* DEFAULT_KEYWORD = "openbadges";
    static constexpr size_t DEFAULT_MAX_INFLATED_SIZE = 16 * 1024 * 1024;

    std::string keyword = DEFAULT_KEYWORD;
    bool verify_checksums = false;
    DuplicatePolicy duplicate_policy = DuplicatePolicy::Insert;
    size_t max_inflated_size = DEFAULT_MAX_INFLATED_SIZE;

    /**
     * @throws PNG::PNGException INVALID_INPUT if the keyword is empty, longer
     *         than 79 characters, not Latin-1 or contains NUL, or if
     *         max_inflated_size is zero
     */
    void validate() const;

    /**
     * @brief Load settings from a key=value file on top of the defaults
     * @throws PNG::PNGException INVALID_INPUT if the file cannot be read
     *         or a value does not parse
     */
    static BakerOptions fromFile(const std::string& path);

    /**
     * @brief Apply key=value lines from a stream to base
     */
    static BakerOptions fromStream(std::istream& in, BakerOptions base);
    static BakerOptions fromStream(std::istream& in);

    static bool parseBool(const std::string& value);
    static DuplicatePolicy parseDuplicatePolicy(const std::string& value);
    static const char* duplicatePolicyName(DuplicatePolicy policy);
};

} // namespace Baker
} // namespace BadgeBaker

#endif // BADGEBAKER_BAKER_BAKEROPTIONS_H
