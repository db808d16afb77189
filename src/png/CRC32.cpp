/*
 * CRC32.cpp - CRC-32 computation for PNG chunk checksums
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"

namespace BadgeBaker {
namespace PNG {

namespace {
    struct CRC32Table {
        std::array<uint32_t, 256> data{};
        CRC32Table() {
            for (uint32_t n = 0; n < 256; ++n) {
                uint32_t c = n;
                for (int k = 0; k < 8; ++k) {
                    c = (c & 1u) ? (CRC32::POLYNOMIAL ^ (c >> 1)) : (c >> 1);
                }
                data[n] = c;
            }
        }
    };
}

const std::array<uint32_t, 256>& CRC32::table() {
    static const CRC32Table lut;
    return lut.data;
}

uint32_t CRC32::update(uint32_t crc, const uint8_t* data, size_t length) {
    if (!data || length == 0) {
        return crc;
    }
    const auto& t = table();
    for (size_t i = 0; i < length; ++i) {
        crc = t[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc;
}

uint32_t CRC32::compute(const uint8_t* data, size_t length) {
    return update(INITIAL, data, length) ^ FINAL_XOR;
}

uint32_t CRC32::compute(const std::vector<uint8_t>& data) {
    return compute(data.data(), data.size());
}

uint32_t CRC32::chunk(const std::array<uint8_t, 4>& type, const std::vector<uint8_t>& data) {
    uint32_t crc = update(INITIAL, type.data(), type.size());
    crc = update(crc, data.data(), data.size());
    return crc ^ FINAL_XOR;
}

} // namespace PNG
} // namespace BadgeBaker
