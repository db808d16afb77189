/*
 * png_test_utils.h - PNG fixtures and helpers for BadgeBaker tests
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef BADGEBAKER_PNG_TEST_UTILS_H
#define BADGEBAKER_PNG_TEST_UTILS_H

#include "badgebaker.h"
#include "test_framework.h"

namespace PNGTestUtils {

using BadgeBaker::PNG::ChunkType;
using BadgeBaker::PNG::PNGError;
using BadgeBaker::PNG::PNGException;

inline std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

/**
 * @brief 13-byte IHDR data for a 1x1 8-bit RGB image
 */
inline std::vector<uint8_t> ihdrData() {
    return {
        0x00, 0x00, 0x00, 0x01,   // width
        0x00, 0x00, 0x00, 0x01,   // height
        0x08,                     // bit depth
        0x02,                     // colour type RGB
        0x00, 0x00, 0x00          // compression, filter, interlace
    };
}

inline std::vector<uint8_t> idatData() {
    return {0x78, 0x9C, 0x62, 0x00, 0x00, 0x00, 0x04, 0x00, 0x01};
}

/**
 * @brief Hand-framed chunk bytes
 *
 * Framing is written out here rather than through ChunkWriter so that
 * writer tests have an independent reference. crc_override replaces the
 * computed CRC when set.
 */
inline std::vector<uint8_t> chunkBytes(const std::string& type, const std::vector<uint8_t>& data,
                                       const uint32_t* crc_override = nullptr) {
    std::vector<uint8_t> out;
    BadgeBaker::PNG::appendBE32(out, static_cast<uint32_t>(data.size()));
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), data.begin(), data.end());

    std::vector<uint8_t> covered(type.begin(), type.end());
    covered.insert(covered.end(), data.begin(), data.end());
    uint32_t crc = crc_override ? *crc_override : BadgeBaker::PNG::CRC32::compute(covered);
    BadgeBaker::PNG::appendBE32(out, crc);
    return out;
}

inline std::vector<uint8_t> signature() {
    return std::vector<uint8_t>(BadgeBaker::PNG::SIGNATURE.begin(), BadgeBaker::PNG::SIGNATURE.end());
}

/**
 * @brief Signature followed by the given chunks, in order
 */
inline std::vector<uint8_t> pngWithChunks(const std::vector<std::pair<std::string, std::vector<uint8_t>>>& chunks) {
    std::vector<uint8_t> out = signature();
    for (const auto& c : chunks) {
        std::vector<uint8_t> framed = chunkBytes(c.first, c.second);
        out.insert(out.end(), framed.begin(), framed.end());
    }
    return out;
}

/**
 * @brief 1x1 image: IHDR, IDAT, IEND
 */
inline std::vector<uint8_t> minimalPng() {
    return pngWithChunks({
        {"IHDR", ihdrData()},
        {"IDAT", idatData()},
        {"IEND", {}}
    });
}

/**
 * @brief Minimal image whose IDAT carries a wrong CRC
 */
inline std::vector<uint8_t> pngWithBadIdatCrc() {
    const uint32_t bogus = 0xDEADBEEFu;
    std::vector<uint8_t> out = signature();
    for (const auto& part : {chunkBytes("IHDR", ihdrData()),
                             chunkBytes("IDAT", idatData(), &bogus),
                             chunkBytes("IEND", {})}) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

/**
 * @brief iTXt data field built by hand
 */
inline std::vector<uint8_t> itxtData(const std::string& keyword, uint8_t flag, uint8_t method,
                                     const std::string& language, const std::string& translated,
                                     const std::vector<uint8_t>& text) {
    std::vector<uint8_t> out(keyword.begin(), keyword.end());
    out.push_back(0);
    out.push_back(flag);
    out.push_back(method);
    out.insert(out.end(), language.begin(), language.end());
    out.push_back(0);
    out.insert(out.end(), translated.begin(), translated.end());
    out.push_back(0);
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

/**
 * @brief Chunk type names of a PNG, read permissively to the end
 */
inline std::vector<std::string> chunkTypes(const std::vector<uint8_t>& png) {
    std::vector<std::string> types;
    BadgeBaker::PNG::ChunkReader reader(png);
    while (reader.hasMoreChunks()) {
        types.push_back(reader.readChunk().typeName());
    }
    return types;
}

inline std::string joinTypes(const std::vector<std::string>& types) {
    std::string joined;
    for (const auto& t : types) {
        if (!joined.empty()) joined += ",";
        joined += t;
    }
    return joined;
}

/**
 * @brief Assert that func throws PNGException carrying the expected code
 */
inline void assertPNGError(std::function<void()> func, PNGError expected, const std::string& message) {
    try {
        func();
    } catch (const PNGException& e) {
        PNGException wanted(expected, "");
        ASSERT_EQUALS(std::string(wanted.getErrorName()), std::string(e.getErrorName()),
                      message + " (" + e.what() + ")");
        return;
    }
    throw TestFramework::AssertionFailure(message + " - expected PNGException, none thrown");
}

} // namespace PNGTestUtils

#endif // BADGEBAKER_PNG_TEST_UTILS_H
