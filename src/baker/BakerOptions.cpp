/*
 * BakerOptions.cpp - Baking engine configuration
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "badgebaker.h"

namespace BadgeBaker {
namespace Baker {

using PNG::PNGError;
using PNG::PNGException;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return std::string();
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

void BakerOptions::validate() const {
    if (keyword.empty()) {
        throw PNGException(PNGError::INVALID_INPUT, "Keyword must not be empty");
    }
    if (keyword.find('\0') != std::string::npos ||
        !Core::Utility::UTF8Util::isValid(keyword) ||
        !Core::Utility::UTF8Util::isLatin1(keyword)) {
        throw PNGException(PNGError::INVALID_INPUT, "Keyword must be Latin-1 text without NUL: '" +
                           keyword + "'");
    }
    if (Core::Utility::UTF8Util::toLatin1(keyword).size() > PNG::InternationalText::MAX_KEYWORD_LENGTH) {
        throw PNGException(PNGError::INVALID_INPUT, "Keyword longer than 79 characters");
    }
    if (max_inflated_size == 0) {
        throw PNGException(PNGError::INVALID_INPUT, "max_inflated_size must be positive");
    }
}

bool BakerOptions::parseBool(const std::string& value) {
    std::string v = lower(trim(value));
    if (v == "true" || v == "1" || v == "yes") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no") {
        return false;
    }
    throw PNGException(PNGError::INVALID_INPUT, "Not a boolean: '" + value + "'");
}

DuplicatePolicy BakerOptions::parseDuplicatePolicy(const std::string& value) {
    std::string v = lower(trim(value));
    if (v == "insert") {
        return DuplicatePolicy::Insert;
    }
    if (v == "replace") {
        return DuplicatePolicy::Replace;
    }
    throw PNGException(PNGError::INVALID_INPUT, "Unknown duplicate policy: '" + value + "'");
}

const char* BakerOptions::duplicatePolicyName(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::Insert:
            return "insert";
        case DuplicatePolicy::Replace:
            return "replace";
        default:
            return "unknown";
    }
}

BakerOptions BakerOptions::fromStream(std::istream& in) {
    return fromStream(in, BakerOptions());
}

BakerOptions BakerOptions::fromStream(std::istream& in, BakerOptions base) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t equals = line.find('=');
        if (equals == std::string::npos) {
            Debug::log("config", "Ignoring line without '=': ", line);
            continue;
        }

        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));

        if (key == "keyword") {
            base.keyword = value;
        } else if (key == "verify_checksums") {
            base.verify_checksums = parseBool(value);
        } else if (key == "duplicate_policy") {
            base.duplicate_policy = parseDuplicatePolicy(value);
        } else if (key == "max_inflated_size") {
            try {
                size_t used = 0;
                unsigned long long parsed = std::stoull(value, &used);
                if (used != value.size() || value[0] == '-') {
                    throw std::invalid_argument(value);
                }
                base.max_inflated_size = static_cast<size_t>(parsed);
            } catch (const std::logic_error&) {
                throw PNGException(PNGError::INVALID_INPUT,
                                   "Invalid max_inflated_size: '" + value + "'");
            }
        } else {
            Debug::log("config", "Unknown key '", key, "' ignored");
            continue;
        }

        Debug::log("config", key, " = ", value);
    }

    return base;
}

BakerOptions BakerOptions::fromFile(const std::string& path) {
    std::ifstream config(path);
    if (!config.is_open()) {
        Debug::log("config", "Cannot open config file ", path);
        throw PNGException(PNGError::INVALID_INPUT, "Cannot open config file: " + path);
    }
    Debug::log("config", "Reading ", path);
    return fromStream(config);
}

} // namespace Baker
} // namespace BadgeBaker
