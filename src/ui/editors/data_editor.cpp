#include "ui/editors/data_editor.h"

#include <vector>

#include "converters/value_converter_factory.h"

namespace {
std::vector<Glib::ustring> encoding_names() {
    return {"Hex", "Base64"};
}
}

std::string to_string(DataEncoding encoding) {
    switch (encoding) {
        case DataEncoding::Hexadecimal: return "Hexadecimal";
        case DataEncoding::Base64: return "Base64";
    }
    return "Unknown";
}

DataEditor::DataEditor(DataEncoding encoding)
    : Editor<Bytes>(converter_for(encoding))
    , encoding_(encoding)
    , encoding_selector_(encoding_names())
{
    encoding_selector_.set_selected(encoding == DataEncoding::Base64 ? 1 : 0);
    encoding_selector_.set_valign(Gtk::Align::CENTER);
    encoding_selector_.property_selected().signal_changed().connect([this]() {
        set_data_encoding(encoding_selector_.get_selected() == 1 ? DataEncoding::Base64 : DataEncoding::Hexadecimal);
    });
    add_button(encoding_selector_);
}

void DataEditor::set_data_encoding(DataEncoding encoding) {
    if (encoding == encoding_) {
        return;
    }
    encoding_ = encoding;
    encoding_selector_.set_selected(encoding == DataEncoding::Base64 ? 1 : 0);

    model_.set_converter(converter_for(encoding));
    model_.update_text();
}

ValueConverter<Bytes> DataEditor::converter_for(DataEncoding encoding) {
    return encoding == DataEncoding::Base64
        ? ValueConverterFactory::create_default_base64_value_converter()
        : ValueConverterFactory::create_default_hexadecimal_value_converter();
}
