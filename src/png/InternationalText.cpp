/*
 * InternationalText.cpp - iTXt chunk payload codec
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"

namespace BadgeBaker {
namespace PNG {

using Core::Utility::UTF8Util;

InternationalText::InternationalText(std::string keyword, Body body,
                                     std::string language_tag,
                                     std::string translated_keyword)
    : m_keyword(std::move(keyword)),
      m_language_tag(std::move(language_tag)),
      m_translated_keyword(std::move(translated_keyword)),
      m_body(std::move(body)) {
}

InternationalText InternationalText::uncompressed(const std::string& keyword, const std::string& text) {
    return InternationalText(keyword, UncompressedText{text});
}

InternationalText InternationalText::compressed(const std::string& keyword, const std::string& text,
                                                Core::Compression::Compressor& compressor) {
    CompressedText body;
    body.method = COMPRESSION_DEFLATE;
    body.bytes = compressor.compress(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return InternationalText(keyword, std::move(body));
}

bool InternationalText::isCompressed() const {
    return m_body && std::holds_alternative<CompressedText>(*m_body);
}

void InternationalText::appendLatin1Field(std::vector<uint8_t>& out, const std::string& value,
                                          const char* field) {
    if (!UTF8Util::isLatin1(value) || value.find('\0') != std::string::npos) {
        throw PNGException(PNGError::INVALID_INPUT,
                           std::string("iTXt ") + field + " is not representable in Latin-1");
    }
    std::vector<uint8_t> latin1 = UTF8Util::toLatin1(value);
    out.insert(out.end(), latin1.begin(), latin1.end());
    out.push_back(0);
}

std::vector<uint8_t> InternationalText::encode() const {
    if (!m_body) {
        throw PNGException(PNGError::INVALID_INPUT, "iTXt entry has no text body");
    }

    std::vector<uint8_t> out;
    appendLatin1Field(out, m_keyword, "keyword");

    if (const auto* plain = std::get_if<UncompressedText>(&*m_body)) {
        out.push_back(0);
        out.push_back(0);
        appendLatin1Field(out, m_language_tag, "language tag");
        appendLatin1Field(out, m_translated_keyword, "translated keyword");
        out.insert(out.end(), plain->text.begin(), plain->text.end());
    } else {
        const auto& packed = std::get<CompressedText>(*m_body);
        out.push_back(1);
        out.push_back(packed.method);
        appendLatin1Field(out, m_language_tag, "language tag");
        appendLatin1Field(out, m_translated_keyword, "translated keyword");
        out.insert(out.end(), packed.bytes.begin(), packed.bytes.end());
    }

    return out;
}

InternationalText InternationalText::decode(const std::vector<uint8_t>& data) {
    InternationalText result;
    const uint8_t* p = data.data();
    const size_t size = data.size();

    size_t keyword_end = UTF8Util::findNullTerminator(p, size);
    if (keyword_end == std::string::npos) {
        Debug::log("png", "iTXt keyword is not terminated");
        return result;
    }
    result.m_keyword = UTF8Util::fromLatin1(p, keyword_end);

    size_t pos = keyword_end + 1;
    if (pos + 2 > size) {
        Debug::log("png", "iTXt '", result.m_keyword, "' ends before compression fields");
        return result;
    }
    const uint8_t flag = p[pos];
    const uint8_t method = p[pos + 1];
    pos += 2;

    size_t lang_end = UTF8Util::findNullTerminator(p, size, pos);
    if (lang_end == std::string::npos) {
        Debug::log("png", "iTXt '", result.m_keyword, "' language tag is not terminated");
        return result;
    }
    std::string language = UTF8Util::fromLatin1(p + pos, lang_end - pos);
    pos = lang_end + 1;

    size_t trans_end = UTF8Util::findNullTerminator(p, size, pos);
    if (trans_end == std::string::npos) {
        Debug::log("png", "iTXt '", result.m_keyword, "' translated keyword is not terminated");
        return result;
    }
    std::string translated = UTF8Util::fromLatin1(p + pos, trans_end - pos);
    pos = trans_end + 1;

    result.m_language_tag = std::move(language);
    result.m_translated_keyword = std::move(translated);

    if (flag == 0) {
        result.m_body = UncompressedText{std::string(data.begin() + pos, data.end())};
    } else {
        CompressedText packed;
        packed.method = method;
        packed.bytes.assign(data.begin() + pos, data.end());
        result.m_body = std::move(packed);
    }

    return result;
}

std::optional<std::string> InternationalText::text(Core::Compression::Decompressor& decompressor) const {
    if (!m_body) {
        return std::nullopt;
    }

    if (const auto* plain = std::get_if<UncompressedText>(&*m_body)) {
        return plain->text;
    }

    const auto& packed = std::get<CompressedText>(*m_body);
    if (packed.method != COMPRESSION_DEFLATE) {
        Debug::log("png", "iTXt '", m_keyword, "' uses unknown compression method ",
                   static_cast<int>(packed.method));
        throw PNGException(PNGError::UNSUPPORTED_FEATURE,
                           "Unsupported iTXt compression method " + std::to_string(packed.method));
    }

    std::vector<uint8_t> inflated;
    try {
        inflated = decompressor.decompress(packed.bytes.data(), packed.bytes.size());
    } catch (const std::runtime_error& e) {
        Debug::log("png", "iTXt '", m_keyword, "' could not be inflated: ", e.what());
        throw PNGException(PNGError::DECOMPRESSION_FAILED,
                           std::string("Failed to inflate iTXt text: ") + e.what());
    }

    return std::string(inflated.begin(), inflated.end());
}

} // namespace PNG
} // namespace BadgeBaker
