#pragma once

#include <sigc++/sigc++.h>
#include <optional>
#include <string>

#include "converters/value_converter.h"

// Two-way binding between the text of an editor and its typed value.
template <typename T>
class EditorModel {
public:
    explicit EditorModel(ValueConverter<T> converter = {})
        : converter_(std::move(converter)) {}

    const std::string& text() const { return text_; }
    const std::optional<T>& value() const { return value_; }
    const std::optional<std::string>& error() const { return error_; }
    bool has_error() const { return error_.has_value(); }

    const ValueConverter<T>& converter() const { return converter_; }
    const std::string& value_format() const { return value_format_; }
    bool update_value_when_text_changed() const { return update_value_when_text_changed_; }

    void set_converter(ValueConverter<T> converter) {
        converter_ = std::move(converter);
    }

    void set_value_format(const std::string& format) {
        value_format_ = format;
        update_text();
    }

    void set_update_value_when_text_changed(bool enabled) {
        update_value_when_text_changed_ = enabled;
    }

    // Programmatic value change: the text follows.
    void set_value(const std::optional<T>& value) {
        assign_value(value);
        update_text();
    }

    // User edit: the value follows only in immediate-update mode.
    void set_text(const std::string& text) {
        if (text == text_) {
            return;
        }
        text_ = text;
        signal_text_changed_.emit(text_);
        if (update_value_when_text_changed_) {
            update_value();
        }
    }

    void update_value() {
        if (text_.empty()) {
            assign_value(std::nullopt);
            set_error(std::nullopt);
            return;
        }

        std::optional<T> parsed;
        if (converter_.try_parse) {
            parsed = converter_.try_parse(text_);
        }
        if (parsed) {
            assign_value(parsed);
            set_error(std::nullopt);
        } else {
            set_error("Value '" + text_ + "' could not be converted.");
        }
    }

    void update_text() {
        std::string formatted = converter_.format ? converter_.format(value_, value_format_) : std::string();
        if (formatted != text_) {
            text_ = formatted;
            signal_text_changed_.emit(text_);
        }
    }

    void clear() {
        assign_value(std::nullopt);
        set_error(std::nullopt);
        update_text();
    }

    // Initial synchronization once both sides may have been set.
    void synchronize() {
        if (text_.empty() && value_) {
            update_text();
        }
        if (!value_ && !text_.empty()) {
            update_value();
        }
    }

    sigc::signal<void(const std::optional<T>&)>& signal_value_changed() { return signal_value_changed_; }
    sigc::signal<void(const std::string&)>& signal_text_changed() { return signal_text_changed_; }
    sigc::signal<void(const std::optional<std::string>&)>& signal_error_changed() { return signal_error_changed_; }

private:
    void assign_value(const std::optional<T>& value) {
        if (value == value_) {
            return;
        }
        value_ = value;
        signal_value_changed_.emit(value_);
    }

    void set_error(const std::optional<std::string>& error) {
        if (error == error_) {
            return;
        }
        error_ = error;
        signal_error_changed_.emit(error_);
    }

    ValueConverter<T> converter_;
    std::string text_;
    std::optional<T> value_;
    std::optional<std::string> error_;
    std::string value_format_;
    bool update_value_when_text_changed_ = false;

    sigc::signal<void(const std::optional<T>&)> signal_value_changed_;
    sigc::signal<void(const std::string&)> signal_text_changed_;
    sigc::signal<void(const std::optional<std::string>&)> signal_error_changed_;
};
