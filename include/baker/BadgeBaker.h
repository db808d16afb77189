/*
 * BadgeBaker.h - Embeds and extracts Open Badges assertions in PNG images
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

#ifndef BADGEBAKER_BAKER_BADGEBAKER_H
#define BADGEBAKER_BAKER_BADGEBAKER_H

// No direct includes - all includes should be in badgebaker.h

namespace BadgeBaker {
namespace Baker {

/**
 * @brief PNG credential baking engine
 *
 * Baking copies the signature and the IHDR chunk, writes one iTXt chunk
 * carrying the payload under the configured keyword, then copies every
 * remaining chunk in order. Apart from the inserted chunk the output has
 * the same chunks with the same data as the input; every CRC in the
 * output is recomputed.
 *
 * Unbaking returns the text of the first iTXt chunk whose keyword matches,
 * scanning up to and including IEND. No match is not an error and yields
 * std::nullopt.
 *
 * All methods are const and the engine holds no mutable state, so one
 * instance may be shared between threads.
 *
 * @throws PNG::PNGException from bake/unbake/strip/listChunks:
 *   INVALID_INPUT    null or short image, empty or non-UTF-8 payload
 *   INVALID_FORMAT   bad signature, first chunk not IHDR
 *   TRUNCATED        chunk runs past the end of the buffer
 *   CHECKSUM_MISMATCH  bad CRC with verify_checksums enabled
 *   DECOMPRESSION_FAILED / UNSUPPORTED_FEATURE  matched chunk is compressed
 *                    and cannot be inflated
 */
class BadgeBaker {
public:
    BadgeBaker();

    /**
     * @throws PNG::PNGException INVALID_INPUT if options fail validation
     */
    explicit BadgeBaker(BakerOptions options);

    const BakerOptions& options() const { return m_options; }

    std::vector<uint8_t> bake(const uint8_t* image, size_t size, const std::string& payload) const;
    std::vector<uint8_t> bake(const std::vector<uint8_t>& image, const std::string& payload) const;

    std::optional<std::string> unbake(const uint8_t* image, size_t size) const;
    std::optional<std::string> unbake(const std::vector<uint8_t>& image) const;

    bool isBaked(const std::vector<uint8_t>& image) const;

    /**
     * @brief Describe every chunk up to and including IEND
     *
     * Stored CRCs are reported, not enforced.
     */
    std::vector<PNG::ChunkInfo> listChunks(const std::vector<uint8_t>& image) const;

    /**
     * @brief Copy of the image with all credential chunks removed
     */
    std::vector<uint8_t> strip(const std::vector<uint8_t>& image) const;

    /**
     * @brief iTXt data field that bake() writes for this payload
     */
    std::vector<uint8_t> credentialChunkData(const std::string& payload) const;

private:
    void checkImageSize(const uint8_t* image, size_t size, const char* operation) const;
    void checkImage(const uint8_t* image, size_t size, const char* operation) const;
    PNG::Chunk readHeader(PNG::ChunkReader& reader) const;
    bool isCredentialChunk(const PNG::Chunk& chunk) const;

    BakerOptions m_options;
};

} // namespace Baker
} // namespace BadgeBaker

#endif // BADGEBAKER_BAKER_BADGEBAKER_H
