#include "converters/value_converter_factory.h"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <type_traits>
#include <utility>

namespace {
std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(start, end - start + 1);
}

template <typename T>
std::optional<T> parse_number(const std::string& text) {
    auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-' || *first == '+') {
            return std::nullopt;
        }
    }
    if (std::is_unsigned<T>::value && *first == '-') {
        return std::nullopt;
    }

    T value{};
    auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc() || result.ptr != last) {
        return std::nullopt;
    }
    if constexpr (std::is_floating_point<T>::value) {
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
    }
    return value;
}

// A printf format fits a value when it holds exactly one "%[flags][width][.precision]"
// conversion of the value's kind, with literal text and "%%" around it. Any length
// modifier the caller wrote is replaced by the one the promoted argument needs.
// Returns the rewritten format and its conversion character.
std::optional<std::pair<std::string, char>> fit_format(const std::string& format, bool floating, const char* length) {
    const std::string conversions = floating ? "fFeEgGaA" : "diouxX";
    std::string rewritten;
    char conversion = 0;

    for (size_t i = 0; i < format.size(); ++i) {
        char c = format[i];
        rewritten += c;
        if (c != '%') {
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == '%') {
            rewritten += '%';
            ++i;
            continue;
        }
        if (conversion != 0) {
            return std::nullopt;
        }

        ++i;
        while (i < format.size() && std::string("-+ #0").find(format[i]) != std::string::npos) {
            rewritten += format[i++];
        }
        while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
            rewritten += format[i++];
        }
        if (i < format.size() && format[i] == '.') {
            rewritten += format[i++];
            while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
                rewritten += format[i++];
            }
        }
        while (i < format.size() && std::string("hlLjzt").find(format[i]) != std::string::npos) {
            ++i;
        }
        if (i >= format.size() || conversions.find(format[i]) == std::string::npos) {
            return std::nullopt;
        }
        conversion = format[i];
        rewritten += length;
        rewritten += conversion;
    }

    if (conversion == 0) {
        return std::nullopt;
    }
    return std::make_pair(rewritten, conversion);
}

template <typename T>
std::string format_number(const std::optional<T>& value, const std::string& format) {
    if (!value) {
        return "";
    }

    char shortest[64];
    auto shortest_end = std::to_chars(shortest, shortest + sizeof(shortest), *value).ptr;
    if (format.empty()) {
        return std::string(shortest, shortest_end);
    }

    char buffer[128];
    int written = -1;
    if constexpr (std::is_floating_point<T>::value) {
        if (auto fitted = fit_format(format, true, "")) {
            written = std::snprintf(buffer, sizeof(buffer), fitted->first.c_str(), static_cast<double>(*value));
        }
    } else {
        // Arguments get the usual promotions: int, unsigned int or a 64-bit type.
        using Promoted = decltype(+*value);
        const char* length = sizeof(Promoted) > sizeof(int) ? "ll" : "";
        if (auto fitted = fit_format(format, false, length)) {
            using Wide = typename std::conditional<(sizeof(Promoted) > sizeof(int)), long long, int>::type;
            if (fitted->second == 'd' || fitted->second == 'i') {
                written = std::snprintf(buffer, sizeof(buffer), fitted->first.c_str(), static_cast<Wide>(*value));
            } else {
                using UnsignedWide = typename std::make_unsigned<Wide>::type;
                written = std::snprintf(buffer, sizeof(buffer), fitted->first.c_str(), static_cast<UnsignedWide>(*value));
            }
        }
    }
    if (written < 0) {
        return std::string(shortest, shortest_end);
    }
    return std::string(buffer, std::min<size_t>(static_cast<size_t>(written), sizeof(buffer) - 1));
}

template <typename T>
ValueConverter<T> numeric_converter() {
    return ValueConverter<T>{&parse_number<T>, &format_number<T>};
}
}

ValueConverter<std::string> ValueConverterFactory::create_default_string_value_converter() {
    return ValueConverter<std::string>{
        [](const std::string& text) -> std::optional<std::string> { return text; },
        [](const std::optional<std::string>& value, const std::string&) { return value ? *value : std::string(); }};
}

ValueConverter<double> ValueConverterFactory::create_default_double_value_converter() {
    return numeric_converter<double>();
}

ValueConverter<float> ValueConverterFactory::create_default_float_value_converter() {
    return numeric_converter<float>();
}

ValueConverter<int> ValueConverterFactory::create_default_int_value_converter() {
    return numeric_converter<int>();
}

ValueConverter<unsigned int> ValueConverterFactory::create_default_uint_value_converter() {
    return numeric_converter<unsigned int>();
}

ValueConverter<short> ValueConverterFactory::create_default_short_value_converter() {
    return numeric_converter<short>();
}

ValueConverter<unsigned short> ValueConverterFactory::create_default_ushort_value_converter() {
    return numeric_converter<unsigned short>();
}

ValueConverter<long long> ValueConverterFactory::create_default_long_value_converter() {
    return numeric_converter<long long>();
}

ValueConverter<unsigned long long> ValueConverterFactory::create_default_ulong_value_converter() {
    return numeric_converter<unsigned long long>();
}

ValueConverter<Bytes> ValueConverterFactory::create_default_hexadecimal_value_converter() {
    return ValueConverter<Bytes>{
        [](const std::string& text) { return HexCodec::try_decode(text); },
        [](const std::optional<Bytes>& value, const std::string&) { return value ? HexCodec::encode(*value) : std::string(); }};
}

ValueConverter<Bytes> ValueConverterFactory::create_default_base64_value_converter() {
    return ValueConverter<Bytes>{
        [](const std::string& text) { return Base64Codec::try_decode(text); },
        [](const std::optional<Bytes>& value, const std::string&) { return value ? Base64Codec::encode(*value) : std::string(); }};
}
