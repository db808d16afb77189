/*
 * Chunk.h - PNG chunk representation and stream constants
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

#ifndef BADGEBAKER_PNG_CHUNK_H
#define BADGEBAKER_PNG_CHUNK_H

// No direct includes - all includes should be in badgebaker.h

namespace BadgeBaker {
namespace PNG {

using ChunkType = std::array<uint8_t, 4>;

// 89 50 4E 47 0D 0A 1A 0A
static constexpr std::array<uint8_t, 8> SIGNATURE = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
};

static constexpr ChunkType IHDR_TYPE = {'I', 'H', 'D', 'R'};
static constexpr ChunkType IEND_TYPE = {'I', 'E', 'N', 'D'};
static constexpr ChunkType ITXT_TYPE = {'i', 'T', 'X', 't'};

// length + type + crc
static constexpr size_t CHUNK_OVERHEAD = 12;

// PNG limits chunk lengths to 2^31 - 1
static constexpr uint32_t MAX_CHUNK_LENGTH = 0x7FFFFFFFu;

/**
 * @brief One decoded chunk
 *
 * The stored CRC is kept as read from the source; writers ignore it and
 * always compute a fresh one.
 */
struct Chunk {
    ChunkType type{};
    std::vector<uint8_t> data;
    uint32_t crc = 0;         // CRC field as stored in the source
    size_t offset = 0;        // Offset of the length field in the source buffer

    bool isType(const ChunkType& other) const { return type == other; }

    /**
     * @brief Bit 5 of the first type byte clear means critical
     */
    bool isCritical() const { return (type[0] & 0x20) == 0; }

    /**
     * @brief Total encoded size including framing
     */
    size_t encodedSize() const { return CHUNK_OVERHEAD + data.size(); }

    /**
     * @brief Check the stored CRC against type || data
     */
    bool hasValidCRC() const;

    std::string typeName() const;
};

/**
 * @brief Summary of a chunk for diagnostics
 */
struct ChunkInfo {
    std::string type;
    uint32_t length = 0;
    size_t offset = 0;
    uint32_t crc = 0;
    bool crc_valid = false;
};

/**
 * @brief Build a chunk type from a four character string
 * @throws PNGException (INVALID_INPUT) if name is not exactly 4 bytes
 */
ChunkType makeChunkType(const std::string& name);

/**
 * @brief Printable form of a chunk type; non-printable bytes are escaped
 */
std::string chunkTypeName(const ChunkType& type);

/**
 * @brief True if data begins with the 8-byte PNG signature
 */
bool hasSignature(const uint8_t* data, size_t size);

inline uint32_t readBE32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline void appendBE32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

} // namespace PNG
} // namespace BadgeBaker

#endif // BADGEBAKER_PNG_CHUNK_H
