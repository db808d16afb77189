/*
 * Zlib.h - zlib (RFC 1950) stream compression
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * Permission to use, copy, modify, and/or distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef BADGEBAKER_CORE_COMPRESSION_ZLIB_H
#define BADGEBAKER_CORE_COMPRESSION_ZLIB_H

#include "core/compression/Compressor.h"
#include "core/compression/Decompressor.h"

namespace BadgeBaker {
namespace Core {
namespace Compression {

/**
 * @brief zlib-wrapped deflate compressor (PNG compression method 0)
 */
class ZlibCompressor : public Compressor {
public:
    /**
     * @param level zlib compression level, 0-9 (default: 6)
     */
    explicit ZlibCompressor(int level = 6);

    std::vector<uint8_t> compress(const uint8_t* data, size_t size) override;

private:
    int m_level;
};

/**
 * @brief zlib-wrapped deflate decompressor with an output ceiling
 *
 * Throws std::runtime_error on a corrupt or incomplete stream, and when
 * the inflated size would exceed max_output.
 */
class ZlibDecompressor : public Decompressor {
public:
    /**
     * @param max_output Largest inflated size accepted (default: 16 MiB)
     */
    explicit ZlibDecompressor(size_t max_output = 16 * 1024 * 1024);

    std::vector<uint8_t> decompress(const uint8_t* data, size_t size) override;

private:
    size_t m_max_output;
};

} // namespace Compression
} // namespace Core
} // namespace BadgeBaker

#endif // BADGEBAKER_CORE_COMPRESSION_ZLIB_H
