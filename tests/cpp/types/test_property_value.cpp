#include <catch2/catch_test_macros.hpp>

#include <liveprop/types/property_value.h>

#include <fmt/format.h>

#include <vector>

using namespace liveprop;

namespace {
    struct Point {
        int x;
        int y;

        bool operator==(const Point &) const = default;
    };
}

TEST_CASE("PropertyValue - basic behaviour", "[property_value]") {
    auto v1{make_property_value(1)};

    REQUIRE_FALSE(v1.is_un_set());

    REQUIRE(v1.is<lp_int>());
    REQUIRE_FALSE(v1.is<lp_string>());

    REQUIRE(v1.as<lp_int>() == 1);
    REQUIRE_FALSE(v1.as<lp_int>() == 2);

    REQUIRE_THROWS_AS(v1.as<lp_string>(), bad_property_type);

    // Copies are independent values
    PropertyValue v2{v1};
    REQUIRE(v2 == v1);
    v2 = make_property_value(2);
    REQUIRE(v1.as<lp_int>() == 1);
    REQUIRE(v2.as<lp_int>() == 2);
}

TEST_CASE("PropertyValue - default constructed value is unset", "[property_value]") {
    PropertyValue unset{};

    REQUIRE(unset.is_un_set());
    REQUIRE(unset == PropertyValue{});
    REQUIRE(unset != make_property_value(0));
    REQUIRE(make_property_value(0) != unset);
    REQUIRE(unset.to_string() == "<unset>");
    REQUIRE_THROWS_AS(unset.as<lp_int>(), bad_property_type);
}

TEST_CASE("PropertyValue - equality is strict", "[property_value]") {
    // Same type, same value
    CHECK(make_property_value("apple") == make_property_value(std::string{"apple"}));
    CHECK(make_property_value(5) == make_property_value(5L));
    CHECK(make_property_value(1.5f) == make_property_value(1.5));

    // Different types never compare equal
    CHECK(make_property_value(1) != make_property_value(1.0));
    CHECK(make_property_value(1) != make_property_value(true));
    CHECK(make_property_value("1") != make_property_value(1));

    // Same type, different value
    CHECK(make_property_value("apple") != make_property_value("pineapple"));
}

TEST_CASE("PropertyValue - holds user types", "[property_value]") {
    auto point{make_property_value(Point{1, 2})};

    REQUIRE(point.is<Point>());
    REQUIRE(point.as<Point>().y == 2);
    REQUIRE(point == make_property_value(Point{1, 2}));
    REQUIRE(point != make_property_value(Point{2, 1}));

    auto values{make_property_value(std::vector<lp_int>{1, 2, 3})};
    REQUIRE(values.as<std::vector<lp_int>>().size() == 3);
}

TEST_CASE("PropertyValue - formats for display", "[property_value]") {
    CHECK(make_property_value("apple").to_string() == "apple");
    CHECK(make_property_value(42).to_string() == "42");
    CHECK(make_property_value(true).to_string() == "true");
    CHECK(fmt::format("<{}>", make_property_value(7)) == "<7>");
    // No formatter for Point, falls back to the type name
    CHECK(make_property_value(Point{1, 2}).to_string().starts_with("<"));
}
