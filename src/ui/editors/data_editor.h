#pragma once

#include <gtkmm.h>
#include <string>

#include "converters/data_encoding.h"
#include "ui/editors/editor.h"

enum class DataEncoding {
    Hexadecimal,
    Base64
};

std::string to_string(DataEncoding encoding);

// Byte buffer editor. Switching the encoding keeps the value and reformats
// the text.
class DataEditor : public Editor<Bytes> {
public:
    explicit DataEditor(DataEncoding encoding = DataEncoding::Hexadecimal);

    DataEncoding get_data_encoding() const { return encoding_; }
    void set_data_encoding(DataEncoding encoding);

    // Hides the encoding selector when the encoding is fixed by the caller.
    void set_show_encoding_selector(bool show) { encoding_selector_.set_visible(show); }

private:
    static ValueConverter<Bytes> converter_for(DataEncoding encoding);

    DataEncoding encoding_;
    Gtk::DropDown encoding_selector_;
};
