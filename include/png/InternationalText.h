/*
 * InternationalText.h - iTXt chunk payload codec
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

#ifndef BADGEBAKER_PNG_INTERNATIONALTEXT_H
#define BADGEBAKER_PNG_INTERNATIONALTEXT_H

// No direct includes - all includes should be in badgebaker.h

namespace BadgeBaker {
namespace PNG {

/**
 * @brief iTXt text stored as-is (compression flag 0)
 */
struct UncompressedText {
    std::string text;  // UTF-8
};

/**
 * @brief iTXt text stored compressed (compression flag 1)
 *
 * Method 0 is zlib/deflate, the only method PNG defines.
 */
struct CompressedText {
    uint8_t method = 0;
    std::vector<uint8_t> bytes;
};

/**
 * @brief Data field of an iTXt chunk
 *
 * Wire layout:
 *   keyword\0 flag method language\0 translated-keyword\0 text
 *
 * Keyword, language tag and translated keyword are Latin-1 on the wire
 * and UTF-8 in memory. The text runs to the end of the data and carries
 * no terminator.
 *
 * decode() never throws. When a terminator is missing it returns what it
 * could read (the keyword, possibly empty) with no text body; hasText()
 * is then false and text() returns std::nullopt.
 */
class InternationalText {
public:
    using Body = std::variant<UncompressedText, CompressedText>;

    static constexpr uint8_t COMPRESSION_DEFLATE = 0;
    static constexpr size_t MAX_KEYWORD_LENGTH = 79;

    InternationalText() = default;
    InternationalText(std::string keyword, Body body,
                      std::string language_tag = std::string(),
                      std::string translated_keyword = std::string());

    static InternationalText uncompressed(const std::string& keyword, const std::string& text);

    /**
     * @brief Build a compressed entry, deflating text with the given compressor
     */
    static InternationalText compressed(const std::string& keyword, const std::string& text,
                                        Core::Compression::Compressor& compressor);

    static InternationalText decode(const std::vector<uint8_t>& data);

    /**
     * @brief Serialize to chunk data
     * @throws PNGException INVALID_INPUT if a Latin-1 field has characters
     *         above U+00FF or an embedded NUL, or if there is no body
     */
    std::vector<uint8_t> encode() const;

    const std::string& keyword() const { return m_keyword; }
    const std::string& languageTag() const { return m_language_tag; }
    const std::string& translatedKeyword() const { return m_translated_keyword; }

    bool hasText() const { return m_body.has_value(); }
    bool isCompressed() const;
    const std::optional<Body>& body() const { return m_body; }

    /**
     * @brief The text body, inflating it if compressed
     *
     * @return std::nullopt for a partially decoded entry
     * @throws PNGException UNSUPPORTED_FEATURE for an unknown compression
     *         method, DECOMPRESSION_FAILED for a corrupt stream
     */
    std::optional<std::string> text(Core::Compression::Decompressor& decompressor) const;

private:
    static void appendLatin1Field(std::vector<uint8_t>& out, const std::string& value,
                                  const char* field);

    std::string m_keyword;
    std::string m_language_tag;
    std::string m_translated_keyword;
    std::optional<Body> m_body;
};

} // namespace PNG
} // namespace BadgeBaker

#endif // BADGEBAKER_PNG_INTERNATIONALTEXT_H
