#include <catch2/catch_test_macros.hpp>

#include <liveprop/types/dependency_index.h>
#include <liveprop/types/live_object.h>

#include <string>
#include <vector>

using namespace liveprop;

namespace {
    ComputedProperty constant(std::vector<std::string> watches) {
        return prop(std::move(watches), [](const LiveObject &) { return make_property_value(0); });
    }

    using names = std::vector<std::string>;
}

TEST_CASE("DependencyIndex - maps watched names to their computed properties", "[dependency_index]") {
    PropertySchema schema{
        {"a", make_property_value(1)},
        {"b", make_property_value(2)},
        {"sum", constant({"a", "b"})},
        {"double_a", constant({"a"})},
        {"nothing", constant({})}
    };
    auto index{DependencyIndex::build(schema)};

    CHECK(index.size() == 2);
    CHECK(index.dependents("a") == names{"sum", "double_a"});
    CHECK(index.dependents("b") == names{"sum"});
    CHECK(index.dependents("sum").empty());
    CHECK(index.dependents("nothing").empty());
    CHECK_FALSE(index.is_watched("nothing"));
}

TEST_CASE("DependencyIndex - watched names need not be declared", "[dependency_index]") {
    PropertySchema schema{{"later", constant({"not_declared_yet"})}};
    auto index{DependencyIndex::build(schema)};

    CHECK(index.is_watched("not_declared_yet"));
    CHECK(index.dependents("not_declared_yet") == names{"later"});
}

TEST_CASE("DependencyIndex - stored values contribute nothing", "[dependency_index]") {
    PropertySchema schema{{"a", make_property_value(1)}, {"b", make_property_value("b")}};
    auto index{DependencyIndex::build(schema)};

    CHECK(index.size() == 0);
    CHECK_FALSE(index.find_cycle().has_value());
}

TEST_CASE("DependencyIndex - find_cycle on an acyclic chain", "[dependency_index]") {
    PropertySchema schema{
        {"a", make_property_value(1)},
        {"c", constant({"a"})},
        {"d", constant({"c", "a"})},
        {"e", constant({"d", "c"})}
    };
    CHECK_FALSE(DependencyIndex::build(schema).find_cycle().has_value());
}

TEST_CASE("DependencyIndex - find_cycle reports the cycle path", "[dependency_index]") {
    PropertySchema schema{
        {"a", make_property_value(1)},
        {"x", constant({"a", "z"})},
        {"y", constant({"x"})},
        {"z", constant({"y"})}
    };
    auto cycle{DependencyIndex::build(schema).find_cycle()};

    REQUIRE(cycle.has_value());
    CHECK(cycle->front() == cycle->back());
    CHECK(cycle->size() == 4);
    CHECK(*cycle == names{"x", "y", "z", "x"});
}

TEST_CASE("DependencyIndex - a property watching itself is a cycle", "[dependency_index]") {
    PropertySchema schema{{"self", constant({"self"})}};
    auto cycle{DependencyIndex::build(schema).find_cycle()};

    REQUIRE(cycle.has_value());
    CHECK(*cycle == names{"self", "self"});
}
