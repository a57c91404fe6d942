#include <doctest/doctest.h>
#include "device_registry.hpp"

using namespace hideez;

static const std::vector<DeviceInfo> DEVICES = {
    {"serial:/dev/ttyACM0", "/dev/ttyACM0"},
    {"serial:/dev/ttyACM1", "/dev/ttyACM1"},
};

TEST_CASE("No path picks the first enumerated device") {
    DeviceInfo d;
    REQUIRE(find_device("", DEVICES, false, d));
    CHECK(d.dev_path == "/dev/ttyACM0");
    CHECK(!find_device("", {}, true, d));
}

TEST_CASE("Exact match wins; prefix match only when allowed") {
    DeviceInfo d;
    REQUIRE(find_device("serial:/dev/ttyACM1", DEVICES, false, d));
    CHECK(d.dev_path == "/dev/ttyACM1");

    CHECK(!find_device("serial:/dev/ttyA", DEVICES, false, d));
    REQUIRE(find_device("serial:/dev/ttyA", DEVICES, true, d));
    CHECK(d.dev_path == "/dev/ttyACM0");
}

TEST_CASE("Bare tty paths are shorthand for serial: paths") {
    CHECK(normalize_path("/dev/ttyUSB0") == "serial:/dev/ttyUSB0");
    CHECK(normalize_path("serial:/dev/ttyUSB0") == "serial:/dev/ttyUSB0");

    DeviceInfo d;
    REQUIRE(find_device("/dev/ttyACM1", DEVICES, false, d));
    CHECK(d.path == "serial:/dev/ttyACM1");
}

TEST_CASE("An existing file outside the enumeration is accepted as a serial path") {
    DeviceInfo d;
    REQUIRE(find_device("serial:/dev/null", DEVICES, false, d));
    CHECK(d.dev_path == "/dev/null");

    CHECK(!find_device("serial:/nonexistent/tty", DEVICES, true, d));
    CHECK(!find_device("usb:0001", DEVICES, true, d));
}

TEST_CASE("Unknown paths resolve to device_not_found without opening anything") {
    std::string err;
    auto t = get_transport("serial:/nonexistent/tty", SerialConfig{}, err);
    CHECK(!t);
    CHECK(err == "device_not_found");
}
