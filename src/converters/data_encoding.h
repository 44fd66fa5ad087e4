#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

// Lowercase hexadecimal. Decoding ignores ASCII whitespace and accepts both cases.
class HexCodec {
public:
    static std::string encode(const Bytes& data);
    static std::optional<Bytes> try_decode(const std::string& text);
};

// Standard alphabet with '=' padding. Decoding ignores ASCII whitespace.
class Base64Codec {
public:
    static std::string encode(const Bytes& data);
    static std::optional<Bytes> try_decode(const std::string& text);
};
