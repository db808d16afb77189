/*
 * Chunk.cpp - PNG chunk representation
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"

namespace BadgeBaker {
namespace PNG {

bool Chunk::hasValidCRC() const {
    return CRC32::chunk(type, data) == crc;
}

std::string Chunk::typeName() const {
    return chunkTypeName(type);
}

ChunkType makeChunkType(const std::string& name) {
    if (name.size() != 4) {
        throw PNGException(PNGError::INVALID_INPUT,
                           "Chunk type must be exactly 4 bytes: '" + name + "'");
    }
    ChunkType type{};
    std::copy(name.begin(), name.end(), type.begin());
    return type;
}

std::string chunkTypeName(const ChunkType& type) {
    std::ostringstream oss;
    for (uint8_t c : type) {
        if (c >= 0x20 && c < 0x7F) {
            oss << static_cast<char>(c);
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                << std::dec;
        }
    }
    return oss.str();
}

bool hasSignature(const uint8_t* data, size_t size) {
    if (!data || size < SIGNATURE.size()) {
        return false;
    }
    return std::equal(SIGNATURE.begin(), SIGNATURE.end(), data);
}

} // namespace PNG
} // namespace BadgeBaker
