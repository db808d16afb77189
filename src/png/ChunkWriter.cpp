/*
 * ChunkWriter.cpp - PNG chunk encoder
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"

namespace BadgeBaker {
namespace PNG {

ChunkWriter::ChunkWriter(size_t reserve_bytes) {
    m_buffer.reserve(reserve_bytes);
}

void ChunkWriter::writeSignature() {
    m_buffer.insert(m_buffer.end(), SIGNATURE.begin(), SIGNATURE.end());
}

void ChunkWriter::writeChunk(const ChunkType& type, const std::vector<uint8_t>& data) {
    if (data.size() > MAX_CHUNK_LENGTH) {
        Debug::log("png", "Refusing to write ", chunkTypeName(type), " with ", data.size(), " bytes");
        throw PNGException(PNGError::INVALID_INPUT,
                           "Chunk data of " + std::to_string(data.size()) +
                           " bytes exceeds the PNG length limit");
    }

    appendBE32(m_buffer, static_cast<uint32_t>(data.size()));
    m_buffer.insert(m_buffer.end(), type.begin(), type.end());
    m_buffer.insert(m_buffer.end(), data.begin(), data.end());
    appendBE32(m_buffer, CRC32::chunk(type, data));
}

std::vector<uint8_t> ChunkWriter::release() {
    std::vector<uint8_t> out;
    out.swap(m_buffer);
    return out;
}

} // namespace PNG
} // namespace BadgeBaker
