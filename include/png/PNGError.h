/*
 * PNGError.h - Error types and exception handling for the PNG chunk codec
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef BADGEBAKER_PNG_PNGERROR_H
#define BADGEBAKER_PNG_PNGERROR_H

// No direct includes - all includes should be in badgebaker.h

namespace BadgeBaker {
namespace PNG {

/**
 * @brief Error codes for chunk codec and baking operations
 *
 * A missing credential chunk is not an error and has no code here;
 * extraction reports it as an empty optional.
 */
enum class PNGError {
    /**
     * @brief No error occurred
     */
    NONE = 0,

    /**
     * @brief Null, empty or too-short buffer, or empty payload
     *
     * Caller error. Never retried.
     */
    INVALID_INPUT,

    /**
     * @brief Signature mismatch, or first chunk is not IHDR
     */
    INVALID_FORMAT,

    /**
     * @brief A chunk declares more bytes than remain in the buffer
     */
    TRUNCATED,

    /**
     * @brief Stored chunk CRC differs from the computed one
     *
     * Only raised when checksum verification is enabled.
     */
    CHECKSUM_MISMATCH,

    /**
     * @brief Compressed text could not be inflated
     */
    DECOMPRESSION_FAILED,

    /**
     * @brief Compression method other than zlib/deflate
     */
    UNSUPPORTED_FEATURE
};

/**
 * @brief Exception class for chunk codec errors
 *
 * USAGE:
 * ======
 * try {
 *     auto baked = baker.bake(image, assertion);
 * } catch (const PNGException& e) {
 *     if (e.getError() == PNGError::INVALID_FORMAT) {
 *         // reject the upload
 *     }
 * }
 */
class PNGException : public std::runtime_error {
public:
    /**
     * @brief Construct exception with error code and message
     *
     * @param error Error code indicating type of failure
     * @param message Descriptive error message
     */
    PNGException(PNGError error, const std::string& message)
        : std::runtime_error(message), m_error(error) {}

    /**
     * @brief Get the error code
     */
    PNGError getError() const { return m_error; }

    /**
     * @brief Get human-readable error type name
     */
    const char* getErrorName() const {
        switch (m_error) {
            case PNGError::NONE:
                return "NONE";
            case PNGError::INVALID_INPUT:
                return "INVALID_INPUT";
            case PNGError::INVALID_FORMAT:
                return "INVALID_FORMAT";
            case PNGError::TRUNCATED:
                return "TRUNCATED";
            case PNGError::CHECKSUM_MISMATCH:
                return "CHECKSUM_MISMATCH";
            case PNGError::DECOMPRESSION_FAILED:
                return "DECOMPRESSION_FAILED";
            case PNGError::UNSUPPORTED_FEATURE:
                return "UNSUPPORTED_FEATURE";
            default:
                return "UNKNOWN";
        }
    }

private:
    PNGError m_error;
};

/**
 * @brief Get human-readable error message for error code
 */
inline const char* getErrorMessage(PNGError error) {
    switch (error) {
        case PNGError::NONE:
            return "No error";
        case PNGError::INVALID_INPUT:
            return "Invalid input buffer or payload";
        case PNGError::INVALID_FORMAT:
            return "Not a PNG image with a leading IHDR chunk";
        case PNGError::TRUNCATED:
            return "Chunk extends past end of buffer";
        case PNGError::CHECKSUM_MISMATCH:
            return "Chunk CRC does not match its contents";
        case PNGError::DECOMPRESSION_FAILED:
            return "Compressed text could not be inflated";
        case PNGError::UNSUPPORTED_FEATURE:
            return "Unsupported compression method";
        default:
            return "Unknown error";
    }
}

} // namespace PNG
} // namespace BadgeBaker

#endif // BADGEBAKER_PNG_PNGERROR_H
