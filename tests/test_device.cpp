#include <doctest/doctest.h>
#include "cclink/device.hpp"

using namespace cclink;

TEST_CASE("Same attributes give the same hash") {
    Device a{"d1", "sensor", "kitchen", {{"unit", "C"}, {"room", "k"}}};
    Device b{"d1", "sensor", "kitchen"};
    b.add_tag("room", "k");
    b.add_tag("unit", "C");

    CHECK(a.hash() == b.hash());
    CHECK(a.hash().size() == 40);
    CHECK(a == b);
}

TEST_CASE("Any attribute change changes the hash") {
    Device d{"d1", "sensor", "kitchen"};
    const std::string h0 = d.hash();

    d.set_name("hall");
    const std::string h1 = d.hash();
    CHECK(h1 != h0);

    d.set_type("actuator");
    const std::string h2 = d.hash();
    CHECK(h2 != h1);

    REQUIRE(d.add_tag("unit", "C"));
    const std::string h3 = d.hash();
    CHECK(h3 != h2);

    REQUIRE(d.change_tag("unit", "F"));
    CHECK(d.hash() != h3);

    REQUIRE(d.remove_tag("unit"));
    CHECK(d.hash() == h2);
}

TEST_CASE("Field boundaries are part of the hash") {
    Device a{"ab", "c", "n"};
    Device b{"a", "bc", "n"};
    CHECK(a.hash() != b.hash());

    Device t1{"d", "t", "n", {{"ab", "c"}}};
    Device t2{"d", "t", "n", {{"a", "bc"}}};
    CHECK(t1.hash() != t2.hash());
}

TEST_CASE("Tag operations report presence") {
    Device d{"d1", "sensor", "kitchen"};
    CHECK(d.add_tag("unit", "C"));
    CHECK_FALSE(d.add_tag("unit", "F"));
    CHECK(d.tags().at("unit") == "C");

    CHECK_FALSE(d.change_tag("missing", "x"));
    CHECK_FALSE(d.remove_tag("missing"));
    CHECK(d.has_tag("unit"));
    CHECK(d.remove_tag("unit"));
    CHECK_FALSE(d.has_tag("unit"));
}

TEST_CASE("Validity needs id and type") {
    CHECK(Device("d1", "sensor", "").valid());
    CHECK_FALSE(Device("", "sensor", "x").valid());
    CHECK_FALSE(Device("d1", "", "x").valid());
    CHECK_FALSE(Device().valid());
    CHECK(Device("d1", "sensor", "k").describe() == "Device(id='d1', type='sensor', name='k', tags=0)");
}
