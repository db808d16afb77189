/*
 * BadgeBaker.cpp - Embeds and extracts Open Badges assertions in PNG images
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"

namespace BadgeBaker {
namespace Baker {

using PNG::Chunk;
using PNG::ChunkReader;
using PNG::ChunkWriter;
using PNG::InternationalText;
using PNG::PNGError;
using PNG::PNGException;

BadgeBaker::BadgeBaker()
    : BadgeBaker(BakerOptions()) {
}

BadgeBaker::BadgeBaker(BakerOptions options)
    : m_options(std::move(options)) {
    m_options.validate();
    Debug::log("baker", "keyword='", m_options.keyword, "' verify_checksums=", m_options.verify_checksums,
               " duplicate_policy=", BakerOptions::duplicatePolicyName(m_options.duplicate_policy));
}

void BadgeBaker::checkImageSize(const uint8_t* image, size_t size, const char* operation) const {
    if (!image || size < PNG::SIGNATURE.size()) {
        DEBUG_LOG("baker", operation, ": image of ", (image ? size : 0), " bytes is too short");
        throw PNGException(PNGError::INVALID_INPUT, "Invalid PNG data: buffer shorter than signature");
    }
}

void BadgeBaker::checkImage(const uint8_t* image, size_t size, const char* operation) const {
    checkImageSize(image, size, operation);
    if (!PNG::hasSignature(image, size)) {
        DEBUG_LOG("baker", operation, ": PNG signature mismatch");
        throw PNGException(PNGError::INVALID_FORMAT, "Invalid PNG signature");
    }
}

Chunk BadgeBaker::readHeader(ChunkReader& reader) const {
    if (!reader.hasMoreChunks()) {
        DEBUG_LOG("baker", "No chunks after signature");
        throw PNGException(PNGError::INVALID_FORMAT, "IHDR chunk not found after PNG signature");
    }
    Chunk header = reader.readChunk();
    if (!header.isType(PNG::IHDR_TYPE)) {
        DEBUG_LOG("baker", "First chunk is ", header.typeName(), ", expected IHDR");
        throw PNGException(PNGError::INVALID_FORMAT, "IHDR chunk not found after PNG signature");
    }
    return header;
}

bool BadgeBaker::isCredentialChunk(const Chunk& chunk) const {
    if (!chunk.isType(PNG::ITXT_TYPE)) {
        return false;
    }
    return InternationalText::decode(chunk.data).keyword() == m_options.keyword;
}

std::vector<uint8_t> BadgeBaker::credentialChunkData(const std::string& payload) const {
    return InternationalText::uncompressed(m_options.keyword, payload).encode();
}

std::vector<uint8_t> BadgeBaker::bake(const uint8_t* image, size_t size, const std::string& payload) const {
    checkImageSize(image, size, "bake");
    if (payload.empty()) {
        DEBUG_LOG("baker", "bake: empty payload");
        throw PNGException(PNGError::INVALID_INPUT, "Assertion payload cannot be empty");
    }
    if (!Core::Utility::UTF8Util::isValid(payload)) {
        DEBUG_LOG("baker", "bake: payload is not valid UTF-8");
        throw PNGException(PNGError::INVALID_INPUT, "Assertion payload is not valid UTF-8");
    }
    checkImage(image, size, "bake");

    ChunkReader reader(image, size, m_options.verify_checksums);
    const std::vector<uint8_t> credential = credentialChunkData(payload);

    ChunkWriter writer(size + ChunkWriter::encodedSize(credential.size()));
    writer.writeSignature();

    writer.writeChunk(readHeader(reader));
    writer.writeChunk(PNG::ITXT_TYPE, credential);

    size_t copied = 0;
    size_t dropped = 0;
    while (reader.hasMoreChunks()) {
        Chunk chunk = reader.readChunk();
        if (m_options.duplicate_policy == DuplicatePolicy::Replace && isCredentialChunk(chunk)) {
            Debug::log("baker", "Replacing credential chunk at offset ", chunk.offset);
            ++dropped;
            continue;
        }
        writer.writeChunk(chunk);
        ++copied;
    }

    std::vector<uint8_t> out = writer.release();
    Debug::log("baker", "Baked ", payload.size(), " byte assertion into PNG (", size, " -> ",
               out.size(), " bytes, ", copied, " chunks copied, ", dropped, " replaced)");
    return out;
}

std::vector<uint8_t> BadgeBaker::bake(const std::vector<uint8_t>& image, const std::string& payload) const {
    return bake(image.data(), image.size(), payload);
}

std::optional<std::string> BadgeBaker::unbake(const uint8_t* image, size_t size) const {
    checkImage(image, size, "unbake");

    ChunkReader reader(image, size, m_options.verify_checksums);
    while (reader.hasMoreChunks()) {
        Chunk chunk = reader.readChunk();

        if (chunk.isType(PNG::ITXT_TYPE)) {
            InternationalText entry = InternationalText::decode(chunk.data);
            if (entry.keyword() == m_options.keyword) {
                Core::Compression::ZlibDecompressor inflater(m_options.max_inflated_size);
                std::optional<std::string> text = entry.text(inflater);
                if (text) {
                    Debug::log("baker", "Found '", m_options.keyword, "' iTXt chunk at offset ",
                               chunk.offset, " with ", text->size(), " bytes",
                               entry.isCompressed() ? " (compressed)" : "");
                } else {
                    Debug::log("baker", "'", m_options.keyword, "' iTXt chunk at offset ",
                               chunk.offset, " is malformed, treating as absent");
                }
                return text;
            }
        }

        if (chunk.isType(PNG::IEND_TYPE)) {
            break;
        }
    }

    Debug::log("baker", "No '", m_options.keyword, "' iTXt chunk found in PNG");
    return std::nullopt;
}

std::optional<std::string> BadgeBaker::unbake(const std::vector<uint8_t>& image) const {
    return unbake(image.data(), image.size());
}

bool BadgeBaker::isBaked(const std::vector<uint8_t>& image) const {
    return unbake(image).has_value();
}

std::vector<PNG::ChunkInfo> BadgeBaker::listChunks(const std::vector<uint8_t>& image) const {
    checkImage(image.data(), image.size(), "listChunks");

    std::vector<PNG::ChunkInfo> result;
    ChunkReader reader(image);
    while (reader.hasMoreChunks()) {
        Chunk chunk = reader.readChunk();

        PNG::ChunkInfo info;
        info.type = chunk.typeName();
        info.length = static_cast<uint32_t>(chunk.data.size());
        info.offset = chunk.offset;
        info.crc = chunk.crc;
        info.crc_valid = chunk.hasValidCRC();
        result.push_back(info);

        if (chunk.isType(PNG::IEND_TYPE)) {
            break;
        }
    }
    return result;
}

std::vector<uint8_t> BadgeBaker::strip(const std::vector<uint8_t>& image) const {
    checkImage(image.data(), image.size(), "strip");

    ChunkReader reader(image, m_options.verify_checksums);
    ChunkWriter writer(image.size());
    writer.writeSignature();
    writer.writeChunk(readHeader(reader));

    size_t removed = 0;
    while (reader.hasMoreChunks()) {
        Chunk chunk = reader.readChunk();
        if (isCredentialChunk(chunk)) {
            ++removed;
            continue;
        }
        writer.writeChunk(chunk);
    }

    Debug::log("baker", "Stripped ", removed, " credential chunk(s)");
    return writer.release();
}

} // namespace Baker
} // namespace BadgeBaker
