#pragma once

#include <string>

#include "converters/data_encoding.h"
#include "converters/value_converter.h"

// Default converters for the editor value types. Numeric parsing trims
// surrounding whitespace, accepts a leading '+', and requires the whole text
// to be consumed and to fit the target range. Numeric format strings are
// printf style ("%.2f", "%08x") with exactly one conversion of the value's
// kind; without one, or when it does not fit, the shortest round-trip text is
// produced.
class ValueConverterFactory {
public:
    static ValueConverter<std::string> create_default_string_value_converter();
    static ValueConverter<double> create_default_double_value_converter();
    static ValueConverter<float> create_default_float_value_converter();
    static ValueConverter<int> create_default_int_value_converter();
    static ValueConverter<unsigned int> create_default_uint_value_converter();
    static ValueConverter<short> create_default_short_value_converter();
    static ValueConverter<unsigned short> create_default_ushort_value_converter();
    static ValueConverter<long long> create_default_long_value_converter();
    static ValueConverter<unsigned long long> create_default_ulong_value_converter();
    static ValueConverter<Bytes> create_default_hexadecimal_value_converter();
    static ValueConverter<Bytes> create_default_base64_value_converter();
};
