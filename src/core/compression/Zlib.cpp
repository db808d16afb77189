/*
 * Zlib.cpp - zlib (RFC 1950) stream compression implementation
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

#include "badgebaker.h"

namespace BadgeBaker {
namespace Core {
namespace Compression {

namespace {
    constexpr size_t INFLATE_STEP = 16 * 1024;
}

ZlibCompressor::ZlibCompressor(int level)
    : m_level(level) {
    if (m_level < Z_NO_COMPRESSION) m_level = Z_NO_COMPRESSION;
    if (m_level > Z_BEST_COMPRESSION) m_level = Z_BEST_COMPRESSION;
}

std::vector<uint8_t> ZlibCompressor::compress(const uint8_t* data, size_t size) {
    uLongf bound = compressBound(static_cast<uLong>(size));
    std::vector<uint8_t> out(bound);

    int status = compress2(out.data(), &bound,
                           size ? data : reinterpret_cast<const Bytef*>(""),
                           static_cast<uLong>(size), m_level);
    if (status != Z_OK) {
        Debug::log("compression", "compress2 failed: ", zError(status));
        throw std::runtime_error("zlib compression failed");
    }

    out.resize(bound);
    Debug::log("compression", "Deflated ", size, " bytes to ", out.size());
    return out;
}

ZlibDecompressor::ZlibDecompressor(size_t max_output)
    : m_max_output(max_output) {
}

std::vector<uint8_t> ZlibDecompressor::decompress(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        throw std::runtime_error("Empty zlib stream");
    }

    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    if (inflateInit(&strm) != Z_OK) {
        throw std::runtime_error("inflateInit failed");
    }

    std::vector<uint8_t> out;
    int status = Z_OK;
    while (status != Z_STREAM_END) {
        // Allow one byte past the limit so a stream ending exactly at it is accepted
        size_t room = m_max_output - out.size();
        size_t step = room < INFLATE_STEP ? room + 1 : INFLATE_STEP;
        size_t offset = out.size();
        out.resize(offset + step);
        strm.next_out = out.data() + offset;
        strm.avail_out = static_cast<uInt>(step);

        status = inflate(&strm, Z_NO_FLUSH);
        out.resize(offset + (step - strm.avail_out));

        if (out.size() > m_max_output) {
            inflateEnd(&strm);
            Debug::log("compression", "Inflated data exceeds limit of ", m_max_output, " bytes");
            throw std::runtime_error("Inflated data exceeds size limit");
        }
        if (status == Z_STREAM_END) {
            break;
        }
        if (status != Z_OK) {
            // Z_BUF_ERROR here means no progress was possible: the input ran out
            std::string why = strm.msg ? strm.msg : "truncated stream";
            inflateEnd(&strm);
            Debug::log("compression", "inflate failed: ", why, " (status ", status, ")");
            throw std::runtime_error("zlib inflate failed: " + why);
        }
        if (strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            Debug::log("compression", "zlib stream ended without end marker");
            throw std::runtime_error("zlib inflate failed: truncated stream");
        }
    }

    inflateEnd(&strm);
    Debug::log("compression", "Inflated ", size, " bytes to ", out.size());
    return out;
}

} // namespace Compression
} // namespace Core
} // namespace BadgeBaker
