#pragma once

#include <optional>

enum class Visibility {
    Visible,
    Hidden,     // keeps its allocation, not drawn
    Collapsed   // takes no space
};

// Non-boolean input (an empty optional) converts to an empty optional.
std::optional<bool> bool_inverted(const std::optional<bool>& value);

struct BoolToVisibility {
    Visibility visibility_when_not_visible = Visibility::Collapsed;
    bool is_visible_when_true = true;

    std::optional<Visibility> convert(const std::optional<bool>& value) const;
    std::optional<bool> convert_back(const std::optional<Visibility>& visibility) const;
};

struct NullToVisibility {
    Visibility visibility_when_not_visible = Visibility::Collapsed;
    bool is_visible_when_not_null = true;

    template <typename T>
    Visibility convert(const std::optional<T>& value) const {
        return convert_presence(value.has_value());
    }

    template <typename T>
    Visibility convert(const T* value) const {
        return convert_presence(value != nullptr);
    }

    Visibility convert_presence(bool has_value) const;
};
