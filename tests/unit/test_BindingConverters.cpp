#include <doctest/doctest.h>

#include "converters/binding_converters.h"

#include <memory>

TEST_SUITE("BindingConverters") {
    TEST_CASE("bool_inverted") {
        CHECK(bool_inverted(true) == false);
        CHECK(bool_inverted(false) == true);
        CHECK_FALSE(bool_inverted(std::nullopt));
    }

    TEST_CASE("BoolToVisibility defaults") {
        BoolToVisibility converter;
        CHECK(converter.convert(true) == Visibility::Visible);
        CHECK(converter.convert(false) == Visibility::Collapsed);
        CHECK_FALSE(converter.convert(std::nullopt));
        CHECK(converter.convert_back(Visibility::Visible) == true);
        CHECK(converter.convert_back(Visibility::Hidden) == false);
    }

    TEST_CASE("BoolToVisibility inverted and hidden") {
        BoolToVisibility converter;
        converter.is_visible_when_true = false;
        converter.visibility_when_not_visible = Visibility::Hidden;
        CHECK(converter.convert(false) == Visibility::Visible);
        CHECK(converter.convert(true) == Visibility::Hidden);
        CHECK(converter.convert_back(Visibility::Visible) == false);
    }

    TEST_CASE("NullToVisibility") {
        NullToVisibility converter;
        CHECK(converter.convert(std::optional<int>(3)) == Visibility::Visible);
        CHECK(converter.convert(std::optional<int>()) == Visibility::Collapsed);

        int value = 0;
        const int* missing = nullptr;
        CHECK(converter.convert(&value) == Visibility::Visible);
        CHECK(converter.convert(missing) == Visibility::Collapsed);

        converter.is_visible_when_not_null = false;
        CHECK(converter.convert(missing) == Visibility::Visible);
    }
}
