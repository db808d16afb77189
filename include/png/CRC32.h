/*
 * CRC32.h - CRC-32 computation for PNG chunk checksums
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef BADGEBAKER_PNG_CRC32_H
#define BADGEBAKER_PNG_CRC32_H

// No direct includes - all includes should be in badgebaker.h

namespace BadgeBaker {
namespace PNG {

/**
 * CRC32 computes the CRC-32/ISO-HDLC checksum used by PNG chunks:
 * reflected polynomial 0xEDB88320, register initialised to 0xFFFFFFFF,
 * result XORed with 0xFFFFFFFF.
 *
 * The 256-entry lookup table is built on first use. Construction is
 * thread-safe and the table is never modified afterwards, so every
 * function here may be called concurrently.
 */
class CRC32 {
public:
    static constexpr uint32_t POLYNOMIAL = 0xEDB88320u;
    static constexpr uint32_t INITIAL = 0xFFFFFFFFu;
    static constexpr uint32_t FINAL_XOR = 0xFFFFFFFFu;

    CRC32() = delete;

    /**
     * One-shot CRC over a buffer.
     *
     * @param data Pointer to data buffer (may be null when length is 0)
     * @param length Number of bytes to process
     * @return Finished CRC-32 value
     */
    static uint32_t compute(const uint8_t* data, size_t length);
    static uint32_t compute(const std::vector<uint8_t>& data);

    /**
     * Fold bytes into a raw register. Start from INITIAL and XOR the
     * final register with FINAL_XOR to obtain the checksum.
     */
    static uint32_t update(uint32_t crc, const uint8_t* data, size_t length);

    /**
     * Checksum of a chunk: CRC over type || data.
     */
    static uint32_t chunk(const std::array<uint8_t, 4>& type, const std::vector<uint8_t>& data);

    /**
     * The lookup table, built on first call.
     */
    static const std::array<uint32_t, 256>& table();
};

} // namespace PNG
} // namespace BadgeBaker

#endif // BADGEBAKER_PNG_CRC32_H
