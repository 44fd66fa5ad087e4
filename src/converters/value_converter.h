#pragma once

#include <functional>
#include <optional>
#include <string>

// Bidirectional conversion between text and a typed value. An empty optional
// from try_parse means the text could not be converted; an empty value
// formats as an empty string.
template <typename T>
struct ValueConverter {
    using TryParse = std::function<std::optional<T>(const std::string& text)>;
    using Format = std::function<std::string(const std::optional<T>& value, const std::string& format)>;

    TryParse try_parse;
    Format format;

    explicit operator bool() const { return try_parse && format; }
};
