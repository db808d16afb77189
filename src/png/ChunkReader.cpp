/*
 * ChunkReader.cpp - Sequential PNG chunk decoder over a memory buffer
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"

namespace BadgeBaker {
namespace PNG {

ChunkReader::ChunkReader(const uint8_t* data, size_t size, bool verify_checksums, size_t start)
    : m_data(data), m_size(data ? size : 0), m_pos(std::min(start, data ? size : 0)),
      m_verify_checksums(verify_checksums) {
}

ChunkReader::ChunkReader(const std::vector<uint8_t>& buffer, bool verify_checksums)
    : ChunkReader(buffer.data(), buffer.size(), verify_checksums) {
}

Chunk ChunkReader::readChunk() {
    const size_t avail = remaining();

    if (avail < 8) {
        Debug::log("png", "Chunk header truncated at offset ", m_pos,
                   ": only ", avail, " bytes left");
        throw PNGException(PNGError::TRUNCATED,
                           "Chunk header truncated at offset " + std::to_string(m_pos));
    }

    Chunk chunk;
    chunk.offset = m_pos;

    const uint8_t* p = m_data + m_pos;
    const uint32_t length = readBE32(p);
    std::copy(p + 4, p + 8, chunk.type.begin());

    // data + CRC must fit in what is left after length and type
    if (static_cast<uint64_t>(length) + 4 > avail - 8) {
        Debug::log("png", "Chunk ", chunk.typeName(), " at offset ", m_pos,
                   " declares ", length, " bytes but only ", avail - 8, " remain");
        throw PNGException(PNGError::TRUNCATED,
                           "Chunk " + chunk.typeName() + " at offset " + std::to_string(m_pos) +
                           " declares " + std::to_string(length) + " bytes past end of buffer");
    }

    chunk.data.assign(p + 8, p + 8 + length);
    chunk.crc = readBE32(p + 8 + length);
    m_pos += CHUNK_OVERHEAD + length;

    if (m_verify_checksums && !chunk.hasValidCRC()) {
        uint32_t computed = CRC32::chunk(chunk.type, chunk.data);
        Debug::log("png", "CRC mismatch in ", chunk.typeName(), " at offset ", chunk.offset,
                   ": stored 0x", std::hex, std::setw(8), std::setfill('0'), chunk.crc,
                   " computed 0x", std::setw(8), computed, std::dec);
        throw PNGException(PNGError::CHECKSUM_MISMATCH,
                           "CRC mismatch in chunk " + chunk.typeName() +
                           " at offset " + std::to_string(chunk.offset));
    }

    Debug::log("png", "Read ", chunk.typeName(), " (", length, " bytes) at offset ", chunk.offset);
    return chunk;
}

} // namespace PNG
} // namespace BadgeBaker
