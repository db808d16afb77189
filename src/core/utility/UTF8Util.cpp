/*
 * UTF8Util.cpp - UTF-8 and Latin-1 text utilities implementation
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"

namespace BadgeBaker {
namespace Core {
namespace Utility {

static const char REPLACEMENT_CHAR[] = "\xEF\xBF\xBD"; // U+FFFD

void UTF8Util::appendCodepoint(std::string& output, uint32_t codepoint) {
    if (codepoint < 0x80) {
        output += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        output += static_cast<char>(0xC0 | (codepoint >> 6));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        output += static_cast<char>(0xE0 | (codepoint >> 12));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        output += static_cast<char>(0xF0 | (codepoint >> 18));
        output += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        output += REPLACEMENT_CHAR;
    }
}

std::string UTF8Util::encodeCodepoint(uint32_t codepoint) {
    std::string result;
    if (codepoint >= 0xD800 && codepoint <= 0xDFFF) {
        result += REPLACEMENT_CHAR;
        return result;
    }
    appendCodepoint(result, codepoint);
    return result;
}

uint32_t UTF8Util::decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed) {
    if (!data || size == 0) {
        bytesConsumed = 0;
        return 0xFFFD;
    }

    uint8_t c = data[0];

    if (c < 0x80) {
        bytesConsumed = 1;
        return c;
    } else if ((c & 0xE0) == 0xC0) {
        if (size < 2 || (data[1] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        // Overlong
        if ((c & 0x1E) == 0) {
            bytesConsumed = 2;
            return 0xFFFD;
        }
        bytesConsumed = 2;
        return ((c & 0x1F) << 6) | (data[1] & 0x3F);
    } else if ((c & 0xF0) == 0xE0) {
        if (size < 3 || (data[1] & 0xC0) != 0x80 || (data[2] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        if (c == 0xE0 && (data[1] & 0x20) == 0) {
            bytesConsumed = 3;
            return 0xFFFD;
        }
        uint32_t cp = ((c & 0x0F) << 12) | ((data[1] & 0x3F) << 6) | (data[2] & 0x3F);
        // Surrogates are not scalar values
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            bytesConsumed = 3;
            return 0xFFFD;
        }
        bytesConsumed = 3;
        return cp;
    } else if ((c & 0xF8) == 0xF0) {
        if (size < 4 || (data[1] & 0xC0) != 0x80 ||
            (data[2] & 0xC0) != 0x80 || (data[3] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        if (c == 0xF0 && (data[1] & 0x30) == 0) {
            bytesConsumed = 4;
            return 0xFFFD;
        }
        uint32_t cp = ((c & 0x07) << 18) | ((data[1] & 0x3F) << 12) |
                      ((data[2] & 0x3F) << 6) | (data[3] & 0x3F);
        if (cp > 0x10FFFF) {
            bytesConsumed = 4;
            return 0xFFFD;
        }
        bytesConsumed = 4;
        return cp;
    }

    // Invalid start byte
    bytesConsumed = 1;
    return 0xFFFD;
}

bool UTF8Util::isValid(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(data + i, size - i, consumed);
        if (cp == 0xFFFD && !(data[i] == 0xEF && i + 2 < size &&
            data[i + 1] == 0xBF && data[i + 2] == 0xBD)) {
            // Got replacement char but input wasn't actually U+FFFD
            return false;
        }
        i += consumed;
    }
    return true;
}

bool UTF8Util::isValid(const std::string& text) {
    return isValid(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string UTF8Util::fromLatin1(const uint8_t* data, size_t size) {
    std::string result;
    if (!data || size == 0) {
        return result;
    }

    result.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        appendCodepoint(result, data[i]);
    }
    return result;
}

std::vector<uint8_t> UTF8Util::toLatin1(const std::string& text) {
    std::vector<uint8_t> result;
    result.reserve(text.size());

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    size_t i = 0;
    while (i < text.size()) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(bytes + i, text.size() - i, consumed);
        result.push_back(cp <= 0xFF ? static_cast<uint8_t>(cp) : '?');
        i += consumed;
    }

    return result;
}

bool UTF8Util::isLatin1(const std::string& text) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    size_t i = 0;
    while (i < text.size()) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(bytes + i, text.size() - i, consumed);
        if (cp > 0xFF) {
            return false;
        }
        i += consumed;
    }
    return true;
}

size_t UTF8Util::findNullTerminator(const uint8_t* data, size_t size, size_t start) {
    if (!data) {
        return std::string::npos;
    }
    for (size_t i = start; i < size; ++i) {
        if (data[i] == 0x00) {
            return i;
        }
    }
    return std::string::npos;
}

} // namespace Utility
} // namespace Core
} // namespace BadgeBaker
