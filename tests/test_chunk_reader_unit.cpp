/*
 * test_chunk_reader_unit.cpp - Unit tests for ChunkReader
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"
#include "test_framework.h"
#include "png_test_utils.h"

using namespace BadgeBaker::PNG;
using namespace TestFramework;
using namespace PNGTestUtils;

// ============================================================================
// Sequential decoding
// ============================================================================

class ReadMinimalPngTest : public TestCase {
public:
    ReadMinimalPngTest() : TestCase("ChunkReader reads IHDR, IDAT, IEND") {}

protected:
    void runTest() override {
        std::vector<uint8_t> png = minimalPng();
        ChunkReader reader(png);

        ASSERT_EQUALS(8u, reader.position(), "Cursor starts after signature");
        ASSERT_TRUE(reader.hasMoreChunks(), "Chunks follow the signature");

        Chunk ihdr = reader.readChunk();
        ASSERT_TRUE(ihdr.isType(IHDR_TYPE), "First chunk is IHDR");
        ASSERT_EQUALS(13u, ihdr.data.size(), "IHDR carries 13 bytes");
        ASSERT_EQUALS(8u, ihdr.offset, "IHDR offset");
        ASSERT_TRUE(ihdr.isCritical(), "IHDR is critical");
        ASSERT_TRUE(ihdr.hasValidCRC(), "IHDR CRC is valid");
        ASSERT_EQUALS(33u, reader.position(), "Cursor after IHDR");

        Chunk idat = reader.readChunk();
        ASSERT_EQUALS(std::string("IDAT"), idat.typeName(), "Second chunk is IDAT");
        ASSERT_TRUE(idat.data == idatData(), "IDAT data read verbatim");

        Chunk iend = reader.readChunk();
        ASSERT_TRUE(iend.isType(IEND_TYPE), "Third chunk is IEND");
        ASSERT_TRUE(iend.data.empty(), "IEND is empty");
        ASSERT_EQUALS(0xAE426082u, iend.crc, "Stored IEND CRC");

        ASSERT_FALSE(reader.hasMoreChunks(), "Nothing after IEND");
        ASSERT_EQUALS(0u, reader.remaining(), "No bytes remain");
        ASSERT_EQUALS(png.size(), reader.position(), "Cursor at end");
    }
};

class ReadUnknownTypeTest : public TestCase {
public:
    ReadUnknownTypeTest() : TestCase("ChunkReader accepts any type tag") {}

protected:
    void runTest() override {
        std::vector<uint8_t> png = pngWithChunks({
            {"IHDR", ihdrData()},
            {"zzZz", bytes("private")},
            {"IEND", {}}
        });
        ChunkReader reader(png);
        reader.readChunk();
        Chunk custom = reader.readChunk();
        ASSERT_EQUALS(std::string("zzZz"), custom.typeName(), "Private chunk type kept");
        ASSERT_FALSE(custom.isCritical(), "Lowercase first letter means ancillary");
        ASSERT_EQUALS(std::string("private"), std::string(custom.data.begin(), custom.data.end()),
                      "Private chunk data kept");
    }
};

// ============================================================================
// Truncation
// ============================================================================

class ReadTruncatedTest : public TestCase {
public:
    ReadTruncatedTest() : TestCase("ChunkReader reports truncation") {}

protected:
    void runTest() override {
        std::vector<uint8_t> png = minimalPng();

        // Cut inside IDAT data
        std::vector<uint8_t> cut(png.begin(), png.begin() + 33 + 10);
        ChunkReader reader(cut);
        reader.readChunk();
        assertPNGError([&]() { reader.readChunk(); }, PNGError::TRUNCATED, "Data cut short");

        // Cut inside a length field
        std::vector<uint8_t> header_cut(png.begin(), png.begin() + 8 + 3);
        ChunkReader short_reader(header_cut);
        ASSERT_TRUE(short_reader.hasMoreChunks(), "Partial bytes still count as more");
        assertPNGError([&]() { short_reader.readChunk(); }, PNGError::TRUNCATED, "Header cut short");

        // Missing only the CRC
        std::vector<uint8_t> crc_cut(png.begin(), png.end() - 1);
        ChunkReader crc_reader(crc_cut);
        crc_reader.readChunk();
        crc_reader.readChunk();
        assertPNGError([&]() { crc_reader.readChunk(); }, PNGError::TRUNCATED, "CRC cut short");
    }
};

class ReadHugeLengthTest : public TestCase {
public:
    ReadHugeLengthTest() : TestCase("ChunkReader rejects oversized length") {}

protected:
    void runTest() override {
        std::vector<uint8_t> png = signature();
        appendBE32(png, 0xFFFFFFFFu);
        png.insert(png.end(), {'I', 'D', 'A', 'T', 0, 0, 0, 0});

        ChunkReader reader(png);
        assertPNGError([&]() { reader.readChunk(); }, PNGError::TRUNCATED,
                       "Length near 4 GiB must not wrap");
        ASSERT_EQUALS(8u, reader.position(), "Cursor unchanged after failure");
    }
};

// ============================================================================
// Checksums
// ============================================================================

class ReadChecksumModesTest : public TestCase {
public:
    ReadChecksumModesTest() : TestCase("ChunkReader permissive and strict checksums") {}

protected:
    void runTest() override {
        std::vector<uint8_t> png = pngWithBadIdatCrc();

        ChunkReader permissive(png);
        ASSERT_FALSE(permissive.verifiesChecksums(), "Permissive by default");
        permissive.readChunk();
        Chunk idat = permissive.readChunk();
        ASSERT_EQUALS(0xDEADBEEFu, idat.crc, "Stored CRC reported as read");
        ASSERT_FALSE(idat.hasValidCRC(), "Bad CRC detected on request");

        ChunkReader strict(png, true);
        strict.readChunk();
        assertPNGError([&]() { strict.readChunk(); }, PNGError::CHECKSUM_MISMATCH,
                       "Strict reader rejects bad CRC");
    }
};

class ReadCustomStartTest : public TestCase {
public:
    ReadCustomStartTest() : TestCase("ChunkReader start offset") {}

protected:
    void runTest() override {
        std::vector<uint8_t> png = minimalPng();
        ChunkReader reader(png.data(), png.size(), false, 33);
        ASSERT_EQUALS(std::string("IDAT"), reader.readChunk().typeName(), "Reads from given offset");

        ChunkReader past_end(png.data(), png.size(), false, png.size() + 10);
        ASSERT_FALSE(past_end.hasMoreChunks(), "Start past end is clamped");

        ChunkReader null_reader(nullptr, 100);
        ASSERT_FALSE(null_reader.hasMoreChunks(), "Null buffer has no chunks");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("ChunkReader Unit Tests");

    suite.addTest(std::make_unique<ReadMinimalPngTest>());
    suite.addTest(std::make_unique<ReadUnknownTypeTest>());
    suite.addTest(std::make_unique<ReadTruncatedTest>());
    suite.addTest(std::make_unique<ReadHugeLengthTest>());
    suite.addTest(std::make_unique<ReadChecksumModesTest>());
    suite.addTest(std::make_unique<ReadCustomStartTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
