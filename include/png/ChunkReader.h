/*
 * ChunkReader.h - Sequential PNG chunk decoder over a memory buffer
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

#ifndef BADGEBAKER_PNG_CHUNKREADER_H
#define BADGEBAKER_PNG_CHUNKREADER_H

// No direct includes - all includes should be in badgebaker.h

namespace BadgeBaker {
namespace PNG {

/**
 * @brief Decodes length/type/data/CRC framed chunks one at a time
 *
 * The reader references the caller's buffer, which must outlive it.
 * It knows nothing about chunk semantics: any type tag is returned as is.
 *
 * By default stored CRCs are read but not checked. With verify_checksums
 * enabled, readChunk() throws CHECKSUM_MISMATCH for a chunk whose CRC
 * does not match its type and data.
 */
class ChunkReader {
public:
    /**
     * @param data Start of the PNG buffer (signature included)
     * @param size Buffer size in bytes
     * @param verify_checksums Reject chunks with a bad CRC
     * @param start Offset of the first chunk, normally just past the signature
     */
    ChunkReader(const uint8_t* data, size_t size, bool verify_checksums = false,
                size_t start = SIGNATURE.size());

    explicit ChunkReader(const std::vector<uint8_t>& buffer, bool verify_checksums = false);

    /**
     * @brief Decode the chunk at the cursor and advance past it
     * @throws PNGException TRUNCATED if the chunk runs past the buffer end,
     *         CHECKSUM_MISMATCH in verifying mode
     */
    Chunk readChunk();

    /**
     * @brief True while any bytes remain after the cursor
     */
    bool hasMoreChunks() const { return m_pos < m_size; }

    size_t position() const { return m_pos; }
    size_t remaining() const { return m_size - m_pos; }
    bool verifiesChecksums() const { return m_verify_checksums; }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
    bool m_verify_checksums;
};

} // namespace PNG
} // namespace BadgeBaker

#endif // BADGEBAKER_PNG_CHUNKREADER_H
