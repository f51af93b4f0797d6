#include <doctest/doctest.h>
#include "cclink/backoff.hpp"

using namespace cclink;
using std::chrono::milliseconds;

TEST_CASE("Reconnect delay doubles from the minimum and stops at the maximum") {
    CHECK(reconnect_delay(1000, 60000, 1, 2.0) == milliseconds(1000));
    CHECK(reconnect_delay(1000, 60000, 2, 2.0) == milliseconds(2000));
    CHECK(reconnect_delay(1000, 60000, 3, 2.0) == milliseconds(4000));
    CHECK(reconnect_delay(1000, 60000, 6, 2.0) == milliseconds(40000));  // 32000 rounded up
    CHECK(reconnect_delay(1000, 60000, 7, 2.0) == milliseconds(60000));
    CHECK(reconnect_delay(1000, 60000, 500, 2.0) == milliseconds(60000));
}

TEST_CASE("Reconnect delay rounds up to the leading digit") {
    CHECK(reconnect_delay(1000, 60000, 2, 1.5) == milliseconds(2000));  // 1500
    CHECK(reconnect_delay(1000, 60000, 3, 1.5) == milliseconds(3000));  // 2250
    CHECK(reconnect_delay(1000, 2500, 3, 1.5) == milliseconds(2500));   // capped after rounding
}

TEST_CASE("Retry zero counts as the first retry, factor one is constant") {
    CHECK(reconnect_delay(1000, 60000, 0, 2.0) == milliseconds(1000));
    CHECK(reconnect_delay(250, 60000, 9, 1.0) == milliseconds(300));
}
