/*
 * ChunkWriter.h - PNG chunk encoder
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

#ifndef BADGEBAKER_PNG_CHUNKWRITER_H
#define BADGEBAKER_PNG_CHUNKWRITER_H

// No direct includes - all includes should be in badgebaker.h

namespace BadgeBaker {
namespace PNG {

/**
 * @brief Appends framed chunks to an output buffer it owns
 *
 * Every chunk is written with a CRC computed from its type and data.
 * No check is made on the type tag; any four bytes are accepted.
 */
class ChunkWriter {
public:
    ChunkWriter() = default;

    /**
     * @param reserve_bytes Expected output size, reserved up front
     */
    explicit ChunkWriter(size_t reserve_bytes);

    void writeSignature();

    /**
     * @brief Append length, type, data and a fresh CRC
     * @throws PNGException INVALID_INPUT if data exceeds MAX_CHUNK_LENGTH
     */
    void writeChunk(const ChunkType& type, const std::vector<uint8_t>& data);

    /**
     * @brief Re-emit a decoded chunk; its stored CRC is ignored
     */
    void writeChunk(const Chunk& chunk) { writeChunk(chunk.type, chunk.data); }

    size_t size() const { return m_buffer.size(); }

    /**
     * @brief Hand over the encoded bytes, leaving the writer empty
     */
    std::vector<uint8_t> release();

    static size_t encodedSize(size_t data_size) { return CHUNK_OVERHEAD + data_size; }

private:
    std::vector<uint8_t> m_buffer;
};

} // namespace PNG
} // namespace BadgeBaker

#endif // BADGEBAKER_PNG_CHUNKWRITER_H
