#include "converters/data_encoding.h"

namespace {
const char kHexDigits[] = "0123456789abcdef";
const char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string strip_whitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (!is_space(c)) {
            result.push_back(c);
        }
    }
    return result;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
}

std::string HexCodec::encode(const Bytes& data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(kHexDigits[byte >> 4]);
        result.push_back(kHexDigits[byte & 0x0F]);
    }
    return result;
}

std::optional<Bytes> HexCodec::try_decode(const std::string& text) {
    auto digits = strip_whitespace(text);
    if (digits.size() % 2 != 0) {
        return std::nullopt;
    }

    Bytes result;
    result.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int high = hex_value(digits[i]);
        int low = hex_value(digits[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return result;
}

std::string Base64Codec::encode(const Bytes& data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t chunk = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        result.push_back(kBase64Alphabet[(chunk >> 18) & 0x3F]);
        result.push_back(kBase64Alphabet[(chunk >> 12) & 0x3F]);
        result.push_back(kBase64Alphabet[(chunk >> 6) & 0x3F]);
        result.push_back(kBase64Alphabet[chunk & 0x3F]);
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t chunk = data[i] << 16;
        result.push_back(kBase64Alphabet[(chunk >> 18) & 0x3F]);
        result.push_back(kBase64Alphabet[(chunk >> 12) & 0x3F]);
        result.append("==");
    } else if (remaining == 2) {
        uint32_t chunk = (data[i] << 16) | (data[i + 1] << 8);
        result.push_back(kBase64Alphabet[(chunk >> 18) & 0x3F]);
        result.push_back(kBase64Alphabet[(chunk >> 12) & 0x3F]);
        result.push_back(kBase64Alphabet[(chunk >> 6) & 0x3F]);
        result.push_back('=');
    }
    return result;
}

std::optional<Bytes> Base64Codec::try_decode(const std::string& text) {
    auto chars = strip_whitespace(text);
    if (chars.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    if (!chars.empty() && chars.back() == '=') {
        padding = (chars.size() >= 2 && chars[chars.size() - 2] == '=') ? 2 : 1;
    }

    Bytes result;
    result.reserve(chars.size() / 4 * 3);
    for (size_t i = 0; i < chars.size(); i += 4) {
        bool last_quad = (i + 4 == chars.size());
        int values[4];
        for (size_t j = 0; j < 4; ++j) {
            char c = chars[i + j];
            if (c == '=') {
                // Padding only in the last one or two positions of the final quad.
                if (!last_quad || j < 4 - padding) {
                    return std::nullopt;
                }
                values[j] = 0;
                continue;
            }
            values[j] = base64_value(c);
            if (values[j] < 0) {
                return std::nullopt;
            }
        }

        uint32_t chunk = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
        result.push_back(static_cast<uint8_t>((chunk >> 16) & 0xFF));
        if (!last_quad || padding < 2) {
            result.push_back(static_cast<uint8_t>((chunk >> 8) & 0xFF));
        }
        if (!last_quad || padding < 1) {
            result.push_back(static_cast<uint8_t>(chunk & 0xFF));
        }
    }
    return result;
}
