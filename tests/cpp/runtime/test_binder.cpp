#include <catch2/catch_test_macros.hpp>

#include <liveprop/runtime/binder.h>
#include <liveprop/types/live_object.h>

#include <memory>
#include <string>
#include <vector>

using namespace liveprop;

namespace {
    // Counts the writes made to a property through set
    struct WriteCounter : PropertyObserver {
        std::string name;
        int writes{0};

        explicit WriteCounter(std::string name_) : name{std::move(name_)} {}

        void on_before_set(LiveObject &, const std::string &name_, const PropertyValue &) override {
            if (name_ == name) { ++writes; }
        }
    };
}

TEST_CASE("bind_properties - object_a takes object_b's value at bind time", "[binder]") {
    LiveObject a{PropertySchema{{"x", make_property_value(1)}}};
    LiveObject b{PropertySchema{{"y", make_property_value(2)}}};

    bind_properties(a, "x", b, "y");

    REQUIRE(a.get("x") == make_property_value(2));
    REQUIRE(b.get("y") == make_property_value(2));
}

TEST_CASE("bind_properties - changes flow both ways", "[binder]") {
    LiveObject a{PropertySchema{{"x", make_property_value(0)}}};
    LiveObject b{PropertySchema{{"y", make_property_value(0)}}};
    bind_properties(a, "x", b, "y");

    b.set("y", 5);
    REQUIRE(a.get("x") == make_property_value(5));

    a.set("x", 7);
    REQUIRE(b.get("y") == make_property_value(7));

    // Values of a different type are not equal and are copied across
    a.set("x", "seven");
    REQUIRE(b.get("y") == make_property_value("seven"));
}

TEST_CASE("bind_properties - equal values are not written again", "[binder]") {
    LiveObject a{PropertySchema{{"x", make_property_value(0)}}};
    LiveObject b{PropertySchema{{"y", make_property_value(3)}}};
    auto a_writes{std::make_shared<WriteCounter>("x")};
    auto b_writes{std::make_shared<WriteCounter>("y")};
    a.add_observer(a_writes);
    b.add_observer(b_writes);

    bind_properties(a, "x", b, "y");
    REQUIRE(a_writes->writes == 1);
    REQUIRE(b_writes->writes == 0);

    b.set("y", 3);
    b.set("y", 3);
    REQUIRE(a_writes->writes == 1);
    REQUIRE(b_writes->writes == 2);

    b.set("y", 4);
    REQUIRE(a_writes->writes == 2);
    // The write to a is not echoed back to b
    REQUIRE(b_writes->writes == 3);
}

TEST_CASE("bind_properties - no write at bind time when the values already match", "[binder]") {
    LiveObject a{PropertySchema{{"x", make_property_value("same")}}};
    LiveObject b{PropertySchema{{"y", make_property_value("same")}}};
    int a_changes{0};
    a.on_change("x", [&a_changes]() { ++a_changes; });

    bind_properties(a, "x", b, "y");

    REQUIRE(a_changes == 0);
}

TEST_CASE("bind_properties - unbind removes both subscriptions", "[binder]") {
    LiveObject a{PropertySchema{{"x", make_property_value(0)}}};
    LiveObject b{PropertySchema{{"y", make_property_value(0)}}};

    auto binding{bind_properties(a, "x", b, "y")};
    REQUIRE(binding.is_bound());
    REQUIRE(a.subscriber_count(LiveObject::change_event_name("x")) == 1);
    REQUIRE(b.subscriber_count(LiveObject::change_event_name("y")) == 1);

    binding.unbind();
    REQUIRE_FALSE(binding.is_bound());
    REQUIRE(a.subscriber_count(LiveObject::change_event_name("x")) == 0);
    REQUIRE(b.subscriber_count(LiveObject::change_event_name("y")) == 0);

    b.set("y", 9);
    a.set("x", 4);
    REQUIRE(a.get("x") == make_property_value(4));
    REQUIRE(b.get("y") == make_property_value(9));

    // A second unbind does nothing
    REQUIRE_NOTHROW(binding.unbind());
}

TEST_CASE("bind_properties - dropping the binding keeps it in place", "[binder]") {
    LiveObject a{PropertySchema{{"x", make_property_value(0)}}};
    LiveObject b{PropertySchema{{"y", make_property_value(0)}}};

    { auto binding{bind_properties(a, "x", b, "y")}; }

    b.set("y", 5);
    REQUIRE(a.get("x") == make_property_value(5));
}

TEST_CASE("bind_properties - binds to computed properties", "[binder]") {
    LiveObject temperature{PropertySchema{
        {"celsius", make_property_value(20.0)},
        {"kelvin", prop({"celsius"},
                        [](const LiveObject &self) {
                            return make_property_value(self.get_as<lp_float>("celsius") + 273.0);
                        },
                        [](LiveObject &self, const PropertyValue &value) {
                            self.set("celsius", value.as<lp_float>() - 273.0);
                        })}
    }};
    LiveObject display{PropertySchema{{"value", make_property_value(0.0)}}};

    bind_properties(display, "value", temperature, "kelvin");
    REQUIRE(display.get("value") == make_property_value(293.0));

    // A change to the watched property reaches the binding through the computed property
    temperature.set("celsius", 30.0);
    REQUIRE(display.get("value") == make_property_value(303.0));

    display.set("value", 373.0);
    REQUIRE(temperature.get("celsius") == make_property_value(100.0));
}

TEST_CASE("bind_properties - properties on the same object", "[binder]") {
    LiveObject obj{PropertySchema{{"left", make_property_value(1)}, {"right", make_property_value(2)}}};

    bind_properties(obj, "left", obj, "right");
    REQUIRE(obj.get("left") == make_property_value(2));

    obj.set("left", 10);
    REQUIRE(obj.get("right") == make_property_value(10));
}

TEST_CASE("bind_properties - chains of bindings propagate", "[binder]") {
    std::vector<std::unique_ptr<LiveObject>> objects;
    for (int i = 0; i < 3; ++i) {
        objects.push_back(std::make_unique<LiveObject>(PropertySchema{{"v", make_property_value(i)}}));
    }
    bind_properties(*objects[0], "v", *objects[1], "v");
    bind_properties(*objects[1], "v", *objects[2], "v");

    objects[2]->set("v", 42);

    for (const auto &obj : objects) { REQUIRE(obj->get("v") == make_property_value(42)); }
}

TEST_CASE("bind_properties - a destroyed object stops the binding", "[binder]") {
    auto a{std::make_unique<LiveObject>(PropertySchema{{"x", make_property_value(0)}})};
    auto b{std::make_unique<LiveObject>(PropertySchema{{"y", make_property_value(1)}})};
    auto binding{bind_properties(*a, "x", *b, "y")};
    REQUIRE(a->get("x") == make_property_value(1));

    SECTION("object_a destroyed first") {
        a.reset();

        REQUIRE_NOTHROW(b->set("y", 2));
        REQUIRE(b->get("y") == make_property_value(2));

        binding.unbind();
        REQUIRE_FALSE(binding.is_bound());
        REQUIRE(b->subscriber_count(LiveObject::change_event_name("y")) == 0);
    }

    SECTION("object_b destroyed first") {
        b.reset();

        REQUIRE_NOTHROW(a->set("x", 3));
        REQUIRE(a->get("x") == make_property_value(3));

        binding.unbind();
        REQUIRE_FALSE(binding.is_bound());
        REQUIRE(a->subscriber_count(LiveObject::change_event_name("x")) == 0);
    }

    SECTION("both destroyed before unbind") {
        a.reset();
        b.reset();

        REQUIRE_NOTHROW(binding.unbind());
        REQUIRE_FALSE(binding.is_bound());
    }
}

TEST_CASE("bind_properties - an object destroyed without unbinding leaves the other usable", "[binder]") {
    LiveObject b{PropertySchema{{"y", make_property_value(1)}}};
    {
        LiveObject a{PropertySchema{{"x", make_property_value(0)}}};
        bind_properties(a, "x", b, "y");
    }

    b.set("y", 2);
    b.set("y", 3);

    REQUIRE(b.get("y") == make_property_value(3));
    // The handler left behind by the destroyed object stays subscribed but does nothing
    REQUIRE(b.subscriber_count(LiveObject::change_event_name("y")) == 1);
}
