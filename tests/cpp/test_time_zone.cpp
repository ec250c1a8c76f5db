#include <catch2/catch_test_macros.hpp>

#include <timedate/time_zone.h>
#include <timedate/util/errors.h>

#include "test_support.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <string>

using namespace timedate;
using namespace timedate::testing;
using namespace std::chrono_literals;

namespace {
    // Central European rules for 2023: +01:00, +02:00 from 2023-03-26T01:00Z, back to +01:00 at 2023-10-29T01:00Z
    std::shared_ptr<TransitionTimeZone> central_europe() {
        return std::make_shared<TransitionTimeZone>(
            "Europe/Berlin", 1h,
            std::vector<TransitionTimeZone::Transition>{{utc(2023, 3, 26, 1), 2h}, {utc(2023, 10, 29, 1), 1h}});
    }
}

TEST_CASE("Fixed offset zones", "[time_zone]") {
    FixedOffsetTimeZone zone{5h + 30min};
    CHECK(zone.name() == "+05:30");
    CHECK(zone.utc_offset(utc(2023, 1, 1)) == 5h + 30min);
    CHECK(zone.to_local(utc(2023, 1, 1, 20)) == local(2023, 1, 2, 1, 30));
    CHECK(zone.to_instant(local(2023, 1, 2, 1, 30)) == utc(2023, 1, 1, 20));

    CHECK(FixedOffsetTimeZone{-3h}.name() == "-03:00");
    CHECK(FixedOffsetTimeZone{0s}.name() == "UTC");
    CHECK(FixedOffsetTimeZone{2h, "EET"}.name() == "EET");
    CHECK(FixedOffsetTimeZone::utc()->name() == "UTC");
}

TEST_CASE("Transition zones", "[time_zone]") {
    auto zone = central_europe();

    SECTION("Offsets apply from the transition instant") {
        CHECK(zone->utc_offset(utc(2023, 1, 1)) == 1h);
        CHECK(zone->utc_offset(utc(2023, 3, 26, 1) - 1us) == 1h);
        CHECK(zone->utc_offset(utc(2023, 3, 26, 1)) == 2h);
        CHECK(zone->utc_offset(utc(2023, 10, 29, 1)) == 1h);
    }

    SECTION("Unambiguous readings") {
        CHECK(zone->to_instant(local(2023, 7, 1, 12)) == utc(2023, 7, 1, 10));
        CHECK(zone->to_instant(local(2023, 12, 1, 12)) == utc(2023, 12, 1, 11));
    }

    SECTION("A repeated reading maps to the earliest instant") {
        // 02:30 happens at 00:30Z (summer time) and again at 01:30Z
        CHECK(zone->to_instant(local(2023, 10, 29, 2, 30)) == utc(2023, 10, 29, 0, 30));
    }

    SECTION("A skipped reading maps to the transition") {
        // Clocks jump from 02:00 to 03:00
        CHECK(zone->to_instant(local(2023, 3, 26, 2, 30)) == utc(2023, 3, 26, 1));
        CHECK(zone->to_local(zone->to_instant(local(2023, 3, 26, 2, 30))) == local(2023, 3, 26, 3));
    }

    SECTION("Transitions must be sorted") {
        CHECK_THROWS_AS(TransitionTimeZone("bad", 0s, {{utc(2023, 2, 1), 1h}, {utc(2023, 1, 1), 0s}}),
                        std::invalid_argument);
    }
}

TEST_CASE("Parsing zone names", "[time_zone]") {
    CHECK(parse_time_zone("UTC")->name() == "UTC");
    CHECK(parse_time_zone("utc")->name() == "UTC");
    CHECK(parse_time_zone("Z")->name() == "UTC");
    CHECK(parse_time_zone(" GMT ")->name() == "UTC");
    CHECK(parse_time_zone("+05:30")->utc_offset(utc(2023, 1, 1)) == 5h + 30min);
    CHECK(parse_time_zone("-0800")->utc_offset(utc(2023, 1, 1)) == -8h);
    CHECK(parse_time_zone("+09")->utc_offset(utc(2023, 1, 1)) == 9h);
    CHECK(parse_time_zone("UTC+01:00")->name() == "+01:00");
    CHECK(parse_time_zone("+00:00")->name() == "UTC");
    CHECK(parse_time_zone("local")->name() == "local");

    CHECK_THROWS_AS(parse_time_zone(""), ConfigError);
    CHECK_THROWS_AS(parse_time_zone("Mars/Olympus_Mons"), ConfigError);
    CHECK_THROWS_AS(parse_time_zone("+24:00"), ConfigError);
    CHECK_THROWS_AS(parse_time_zone("+05:60"), ConfigError);
    CHECK_THROWS_AS(parse_time_zone("+5"), ConfigError);
}

TEST_CASE("The system zone follows the C library", "[time_zone]") {
    ::setenv("TZ", "UTC0", 1);
    ::tzset();
    SystemTimeZone zone;
    CHECK(zone.utc_offset(utc(2023, 6, 1)) == 0s);
    CHECK(zone.to_local(utc(2023, 6, 1, 12)) == local(2023, 6, 1, 12));
}

TEST_CASE("Zones from the system database", "[time_zone]") {
    SECTION("Europe/Berlin across both of its 2023 changes") {
        auto zone = parse_time_zone("Europe/Berlin");
        CHECK(zone->name() == "Europe/Berlin");
        CHECK(zone->utc_offset(utc(2023, 1, 1)) == 1h);
        CHECK(zone->utc_offset(utc(2023, 3, 26, 1) - 1s) == 1h);
        CHECK(zone->utc_offset(utc(2023, 3, 26, 1)) == 2h);
        CHECK(zone->utc_offset(utc(2023, 10, 29, 1) - 1s) == 2h);
        CHECK(zone->utc_offset(utc(2023, 10, 29, 1)) == 1h);

        CHECK(zone->to_local(utc(2023, 7, 1, 10)) == local(2023, 7, 1, 12));
        // Skipped and repeated readings resolve like any other zone
        CHECK(zone->to_instant(local(2023, 3, 26, 2, 30)) == utc(2023, 3, 26, 1));
        CHECK(zone->to_instant(local(2023, 10, 29, 2, 30)) == utc(2023, 10, 29, 0, 30));
        CHECK(zone->to_instant(local(2023, 3, 27)) == utc(2023, 3, 26, 22));
    }

    SECTION("America/New_York") {
        NamedTimeZone zone{"America/New_York"};
        CHECK(zone.utc_offset(utc(2023, 1, 15)) == -5h);
        CHECK(zone.utc_offset(utc(2023, 3, 12, 7) - 1s) == -5h);
        CHECK(zone.utc_offset(utc(2023, 3, 12, 7)) == -4h);
        CHECK(zone.utc_offset(utc(2023, 7, 1)) == -4h);
    }

    SECTION("Unknown or malformed names") {
        CHECK_THROWS_AS(parse_time_zone("Atlantis/Lost"), ConfigError);
        CHECK_THROWS_AS(parse_time_zone("Europe"), ConfigError);
        CHECK_THROWS_AS(parse_time_zone("../../etc/passwd"), ConfigError);
        CHECK_THROWS_AS(NamedTimeZone("/etc/localtime"), ConfigError);
        CHECK_THROWS_AS(NamedTimeZone(""), ConfigError);
    }

    SECTION("Reading a zone leaves the process zone alone") {
        ::setenv("TZ", "UTC0", 1);
        ::tzset();
        NamedTimeZone zone{"Asia/Kolkata"};
        CHECK(zone.utc_offset(utc(2023, 6, 1)) == 5h + 30min);
        REQUIRE(std::getenv("TZ") != nullptr);
        CHECK(std::string(std::getenv("TZ")) == "UTC0");
        CHECK(SystemTimeZone{}.utc_offset(utc(2023, 6, 1)) == 0s);
    }
}
