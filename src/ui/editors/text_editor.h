#pragma once

#include <string>

#include "converters/value_converter_factory.h"
#include "ui/editors/editor.h"

class TextEditor : public Editor<std::string> {
public:
    TextEditor()
        : Editor<std::string>(ValueConverterFactory::create_default_string_value_converter())
    {
        set_update_value_when_text_changed(true);
    }
};
