#pragma once

#include "converters/value_converter_factory.h"
#include "ui/editors/editor.h"

class DoubleEditor : public Editor<double> {
public:
    DoubleEditor() : Editor<double>(ValueConverterFactory::create_default_double_value_converter()) {}
};

class FloatEditor : public Editor<float> {
public:
    FloatEditor() : Editor<float>(ValueConverterFactory::create_default_float_value_converter()) {}
};

class IntEditor : public Editor<int> {
public:
    IntEditor() : Editor<int>(ValueConverterFactory::create_default_int_value_converter()) {}
};

class UIntEditor : public Editor<unsigned int> {
public:
    UIntEditor() : Editor<unsigned int>(ValueConverterFactory::create_default_uint_value_converter()) {}
};

class ShortEditor : public Editor<short> {
public:
    ShortEditor() : Editor<short>(ValueConverterFactory::create_default_short_value_converter()) {}
};

class UShortEditor : public Editor<unsigned short> {
public:
    UShortEditor() : Editor<unsigned short>(ValueConverterFactory::create_default_ushort_value_converter()) {}
};

class LongEditor : public Editor<long long> {
public:
    LongEditor() : Editor<long long>(ValueConverterFactory::create_default_long_value_converter()) {}
};

class ULongEditor : public Editor<unsigned long long> {
public:
    ULongEditor() : Editor<unsigned long long>(ValueConverterFactory::create_default_ulong_value_converter()) {}
};
