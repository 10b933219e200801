#include <catch2/catch.hpp>

#include "time_util.h"

using namespace kubeoidc::oauth;

TEST_CASE("RFC3339 formatting is UTC with a Z suffix", "[time_util]") {
    TimePoint t = std::chrono::system_clock::from_time_t(1767225600);
    REQUIRE(format_rfc3339(t) == "2026-01-01T00:00:00Z");
    REQUIRE(format_rfc3339(t + std::chrono::milliseconds(999)) == "2026-01-01T00:00:00Z");
}

TEST_CASE("RFC3339 parsing", "[time_util]") {
    const TimePoint expected = std::chrono::system_clock::from_time_t(1767225600);

    SECTION("Zulu time") {
        REQUIRE(parse_rfc3339("2026-01-01T00:00:00Z") == expected);
    }

    SECTION("Fractional seconds are dropped") {
        REQUIRE(parse_rfc3339("2026-01-01T00:00:00.123456Z") == expected);
    }

    SECTION("Numeric offsets are applied") {
        REQUIRE(parse_rfc3339("2026-01-01T02:00:00+02:00") == expected);
        REQUIRE(parse_rfc3339("2025-12-31T19:30:00-04:30") == expected);
    }

    SECTION("Malformed input") {
        REQUIRE_FALSE(parse_rfc3339("").has_value());
        REQUIRE_FALSE(parse_rfc3339("2026-01-01").has_value());
        REQUIRE_FALSE(parse_rfc3339("2026-01-01T00:00:00").has_value());
        REQUIRE_FALSE(parse_rfc3339("2026-13-01T00:00:00Z").has_value());
        REQUIRE_FALSE(parse_rfc3339("2026-01-01T00:00:00Zjunk").has_value());
        REQUIRE_FALSE(parse_rfc3339("not a timestamp").has_value());
    }
}
