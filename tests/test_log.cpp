#include <doctest/doctest.h>
#include "xbeelink/log.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace xbeelink;

TEST_CASE("Messages below the level are filtered") {
    std::vector<std::pair<log::Level, std::string>> seen;
    log::set_sink([&](log::Level lvl, const std::string& msg) { seen.emplace_back(lvl, msg); });
    log::set_level(log::Level::Info);

    log::debug("hidden");
    log::info("shown");
    log::error("also shown");

    REQUIRE(seen.size() == 2);
    CHECK(seen[0].first == log::Level::Info);
    CHECK(seen[0].second == "shown");
    CHECK(seen[1].first == log::Level::Error);

    log::set_level(log::Level::Off);
    log::error("silenced");
    CHECK(seen.size() == 2);

    log::set_sink(nullptr);
    log::set_level(log::Level::Warn);
}

TEST_CASE("Level names round-trip and reject unknown names") {
    log::Level lvl = log::Level::Off;
    CHECK(log::level_from_string("debug", lvl));
    CHECK(lvl == log::Level::Debug);
    CHECK(log::level_from_string("error", lvl));
    CHECK(std::string(log::to_string(lvl)) == "error");
    CHECK_FALSE(log::level_from_string("verbose", lvl));
    CHECK(lvl == log::Level::Error);
}
