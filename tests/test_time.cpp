#include <catch2/catch.hpp>

#include <set>

#include "utils/time.hpp"

using namespace mailkeep;

TEST_CASE("ISO timestamps", "[time]") {

    SECTION("format and parse agree at millisecond precision") {
        const auto parsed = utils::ParseIso("2026-01-02T03:04:05.678Z");
        REQUIRE(parsed.has_value());
        REQUIRE(utils::FormatIso(*parsed) == "2026-01-02T03:04:05.678Z");
    }

    SECTION("offsets are normalized to UTC") {
        const auto shifted = utils::ParseIso("2026-01-02T05:04:05+02:00");
        const auto utc = utils::ParseIso("2026-01-02T03:04:05Z");
        REQUIRE(shifted.has_value());
        REQUIRE(utc.has_value());
        REQUIRE(*shifted == *utc);
    }

    SECTION("a timestamp without zone is read as UTC") {
        REQUIRE(utils::ParseIso("2026-01-02T03:04:05") == utils::ParseIso("2026-01-02T03:04:05Z"));
    }

    SECTION("long fractions are truncated to milliseconds") {
        const auto parsed = utils::ParseIso("2026-01-02T03:04:05.123456");
        REQUIRE(parsed.has_value());
        REQUIRE(utils::FormatIso(*parsed) == "2026-01-02T03:04:05.123Z");
    }

    SECTION("garbage is rejected") {
        REQUIRE_FALSE(utils::ParseIso("").has_value());
        REQUIRE_FALSE(utils::ParseIso("yesterday").has_value());
        REQUIRE_FALSE(utils::ParseIso("2026-13-01T00:00:00Z").has_value());
        REQUIRE_FALSE(utils::ParseIso("2026-01-01T00:00:00Zjunk").has_value());
    }
}

TEST_CASE("Record ids are unique and prefixed", "[time]") {
    const auto now = *utils::ParseIso("2026-03-04T05:06:07.089Z");
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(utils::GenerateRecordId("h", now));
    }
    REQUIRE(ids.size() == 100);
    REQUIRE(ids.begin()->rfind("h-20260304050607089-", 0) == 0);
}

TEST_CASE("Day arithmetic", "[time]") {
    const auto start = *utils::ParseIso("2026-01-01T00:00:00Z");
    REQUIRE(utils::FormatIso(start + utils::Days(90)) == "2026-04-01T00:00:00.000Z");
}

TEST_CASE("File times convert to system time", "[time]") {
    const auto now = utils::SystemNow();
    const auto round_trip = utils::FromFileTime(utils::ToFileTime(now));
    const auto drift = round_trip > now ? round_trip - now : now - round_trip;
    REQUIRE(drift < std::chrono::seconds(1));
}
