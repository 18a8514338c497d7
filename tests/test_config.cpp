#include <doctest/doctest.h>
#include "xbeelink/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace xbeelink;

TEST_CASE("parse_config reads known keys and keeps defaults for the rest") {
    SessionConfig session;
    SerialConfig serial;
    std::string err;

    const std::string text = R"({
        "mode": "api2",
        "receive_timeout_ms": 750,
        "serial": { "path": "/dev/ttyAMA0" }
    })";
    REQUIRE_MESSAGE(parse_config(text, session, serial, err), err);

    CHECK(session.mode == OperatingMode::API_ESCAPED);
    CHECK(session.receive_timeout_ms == 750);
    CHECK(session.byte_timeout_ms == 300);
    CHECK(session.queue_capacity == PacketQueue::MAX_CAPACITY);
    CHECK(serial.path == "/dev/ttyAMA0");
    CHECK(serial.baud == 9600);
}

TEST_CASE("parse_config rejects bad input with a reason") {
    SessionConfig session;
    SerialConfig serial;
    std::string err;

    SUBCASE("wrong value type names the key") {
        CHECK_FALSE(parse_config(R"({"receive_timeout_ms": "fast"})", session, serial, err));
        CHECK(err.find("receive_timeout_ms") != std::string::npos);
    }
    SUBCASE("unknown mode") {
        CHECK_FALSE(parse_config(R"({"mode": "turbo"})", session, serial, err));
        CHECK(err.find("turbo") != std::string::npos);
    }
    SUBCASE("transparent mode cannot carry frames") {
        CHECK_FALSE(parse_config(R"({"mode": "at"})", session, serial, err));
    }
    SUBCASE("malformed JSON") {
        CHECK_FALSE(parse_config("{ \"mode\": ", session, serial, err));
        CHECK(err.rfind("config: ", 0) == 0);
    }
    SUBCASE("queue capacity above the maximum") {
        CHECK_FALSE(parse_config(R"({"queue_capacity": 100})", session, serial, err));
        CHECK(err.find("queue_capacity") != std::string::npos);
    }
    SUBCASE("serial must be an object") {
        CHECK_FALSE(parse_config(R"({"serial": "/dev/ttyUSB0"})", session, serial, err));
    }
}

TEST_CASE("load_config reads a file and reports a missing one") {
    SessionConfig session;
    SerialConfig serial;
    std::string err;

    CHECK_FALSE(load_config("/nonexistent/xbeelink.json", session, serial, err));
    CHECK(err == "config: cannot open /nonexistent/xbeelink.json");

    const auto path = (std::filesystem::temp_directory_path() / "xbeelink_test_config.json").string();
    {
        std::ofstream out(path);
        out << R"({"serial": {"baud": 115200}, "queue_capacity": 10})";
    }
    CHECK(load_config(path, session, serial, err));
    CHECK(serial.baud == 115200);
    CHECK(session.queue_capacity == 10);
    std::remove(path.c_str());
}
