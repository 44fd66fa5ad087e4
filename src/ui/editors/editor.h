#pragma once

#include <optional>
#include <string>

#include "converters/editor_model.h"
#include "ui/editors/editor_base.h"

// Editor bound to an EditorModel<T>. The value is committed on focus loss
// (or Enter) unless immediate updates are enabled on the model.
template <typename T>
class Editor : public EditorBase {
public:
    explicit Editor(ValueConverter<T> converter)
        : model_(std::move(converter))
    {
        model_.signal_text_changed().connect([this](const std::string& text) {
            set_entry_text(text);
        });
        model_.signal_error_changed().connect([this](const std::optional<std::string>& error) {
            show_error(error);
        });
    }

    const std::optional<T>& get_value() const { return model_.value(); }
    void set_value(const std::optional<T>& value) { model_.set_value(value); }

    void set_value_format(const std::string& format) { model_.set_value_format(format); }
    void set_update_value_when_text_changed(bool enabled) { model_.set_update_value_when_text_changed(enabled); }

    EditorModel<T>& model() { return model_; }

    sigc::signal<void(const std::optional<T>&)>& signal_value_changed() { return model_.signal_value_changed(); }

protected:
    void on_entry_text_changed(const std::string& text) override {
        model_.set_text(text);
    }

    void on_focus_lost() override {
        if (is_read_only()) {
            return;
        }
        model_.update_value();
        if (!model_.has_error()) {
            model_.update_text();
        }
    }

    void clear_editor() override {
        model_.clear();
    }

    EditorModel<T> model_;
};
