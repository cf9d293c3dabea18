#include <catch2/catch_all.hpp>
#include "devicelink/core/util/logger.hpp"
#include "devicelink/core/util/error_types.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace devicelink;

TEST_CASE("Logger filters below the minimum level", "[logger]") {
    std::vector<std::pair<LogLevel, std::string>> lines;
    Logger::inst().setSink([&](LogLevel l, const std::string& m) { lines.emplace_back(l, m); });
    Logger::inst().setLevel(LogLevel::Warn);

    LOG_DEBUG("hidden");
    LOG_INFO("hidden");
    LOG_WARN("shown");
    LOG_ERROR(std::string("also ") + "shown");

    Logger::inst().setSink({});
    Logger::inst().setLevel(LogLevel::Info);

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].first == LogLevel::Warn);
    REQUIRE(lines[0].second == "shown");
    REQUIRE(lines[1].second == "also shown");
}

TEST_CASE("GatewayError carries its code", "[error]") {
    GatewayError e(GatewayErr::SessionCreation, "boom");
    REQUIRE(e.code() == GatewayErr::SessionCreation);
    REQUIRE(std::string(e.what()) == "boom");
    REQUIRE(std::string(toString(GatewayErr::NotSupported)) == "NotSupported");
}
