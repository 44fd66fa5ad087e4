#include "converters/binding_converters.h"

std::optional<bool> bool_inverted(const std::optional<bool>& value) {
    if (!value) {
        return std::nullopt;
    }
    return !*value;
}

std::optional<Visibility> BoolToVisibility::convert(const std::optional<bool>& value) const {
    if (!value) {
        return std::nullopt;
    }
    if (*value == is_visible_when_true) {
        return Visibility::Visible;
    }
    return visibility_when_not_visible;
}

std::optional<bool> BoolToVisibility::convert_back(const std::optional<Visibility>& visibility) const {
    if (!visibility) {
        return std::nullopt;
    }
    bool is_visible = *visibility == Visibility::Visible;
    return is_visible_when_true ? is_visible : !is_visible;
}

Visibility NullToVisibility::convert_presence(bool has_value) const {
    if (has_value == is_visible_when_not_null) {
        return Visibility::Visible;
    }
    return visibility_when_not_visible;
}
