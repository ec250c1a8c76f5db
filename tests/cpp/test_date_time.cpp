#include <catch2/catch_test_macros.hpp>

#include <timedate/util/date_time.h>

#include "test_support.h"

using namespace timedate;
using namespace timedate::testing;
using namespace std::chrono_literals;

TEST_CASE("floor_mod is never negative", "[date_time]") {
    CHECK(floor_mod(time_delta_t{125'000'000}, 60s) == 5s);
    CHECK(floor_mod(-1us, 60s) == 60s - 1us);
    CHECK(floor_mod(-60s, 60s) == 0s);
    CHECK(floor_mod(0us, 86'400'000us) == 0us);
}

TEST_CASE("split_fields breaks out the calendar date and time of day", "[date_time]") {
    using namespace std::chrono;

    SECTION("After the epoch") {
        auto fields = split_fields(utc(2023, 3, 26, 1, 59, 30) + 250ms);
        CHECK(fields.date == year{2023} / March / 26);
        CHECK(fields.time_of_day.hours() == 1h);
        CHECK(fields.time_of_day.minutes() == 59min);
        CHECK(fields.time_of_day.seconds() == 30s);
        CHECK(fields.time_of_day.subseconds() == 250ms);
    }

    SECTION("Before the epoch") {
        auto fields = split_fields(instant_t{-1us});
        CHECK(fields.date == year{1969} / December / 31);
        CHECK(fields.time_of_day.hours() == 23h);
        CHECK(fields.time_of_day.minutes() == 59min);
        CHECK(fields.time_of_day.seconds() == 59s);
    }
}

TEST_CASE("to_iso_string", "[date_time]") {
    CHECK(to_iso_string(utc(2023, 1, 1, 23)) == "2023-01-01T23:00:00.000000Z");
    CHECK(to_iso_string(utc(1970, 1, 1) + 1us) == "1970-01-01T00:00:00.000001Z");
    CHECK(to_iso_string(local(2024, 2, 29, 12, 5, 9)) == "2024-02-29T12:05:09.000000");
}
