/**
 * @file test_calendar_date.cpp
 * @brief Unit tests for CalendarDate parsing and ordering
 */

#include <catch2/catch_test_macros.hpp>
#include "data/calendar_date.hpp"
#include "common/errors.hpp"

using namespace frontier;

TEST_CASE("CalendarDate parsing", "[CalendarDate]") {
    SECTION("ISO date") {
        auto d = CalendarDate::parse("2024-03-15");
        REQUIRE(d.year == 2024);
        REQUIRE(d.month == 3);
        REQUIRE(d.day == 15);
        REQUIRE(d.to_string() == "2024-03-15");
    }

    SECTION("Time-of-day suffix is dropped") {
        REQUIRE(CalendarDate::parse("2024-01-02 00:00:00+00:00") == CalendarDate(2024, 1, 2));
        REQUIRE(CalendarDate::parse("2024-01-02T16:00:00") == CalendarDate(2024, 1, 2));
    }

    SECTION("UTC offset suffix is dropped") {
        REQUIRE(CalendarDate::parse("2024-01-02+00:00") == CalendarDate(2024, 1, 2));
        REQUIRE(CalendarDate::parse("2024-01-02-05:00") == CalendarDate(2024, 1, 2));
        REQUIRE(CalendarDate::parse("2024-01-02Z") == CalendarDate(2024, 1, 2));
    }

    SECTION("Slash separators") {
        REQUIRE(CalendarDate::parse("2024/01/02") == CalendarDate(2024, 1, 2));
        REQUIRE_THROWS_AS(CalendarDate::parse("2024/01-02"), ParseError);
    }

    SECTION("Surrounding whitespace is ignored") {
        REQUIRE(CalendarDate::parse("  2021-12-31\r") == CalendarDate(2021, 12, 31));
    }

    SECTION("Leap days") {
        REQUIRE_NOTHROW(CalendarDate::parse("2020-02-29"));
        REQUIRE_NOTHROW(CalendarDate::parse("2000-02-29"));
        REQUIRE_THROWS_AS(CalendarDate::parse("2021-02-29"), ParseError);
        REQUIRE_THROWS_AS(CalendarDate::parse("1900-02-29"), ParseError);
    }

    SECTION("Malformed values") {
        REQUIRE_THROWS_AS(CalendarDate::parse(""), ParseError);
        REQUIRE_THROWS_AS(CalendarDate::parse("   "), ParseError);
        REQUIRE_THROWS_AS(CalendarDate::parse("2024.01.02"), ParseError);
        REQUIRE_THROWS_AS(CalendarDate::parse("2024-01-02x"), ParseError);
        REQUIRE_THROWS_AS(CalendarDate::parse("01-02-2024"), ParseError);
        REQUIRE_THROWS_AS(CalendarDate::parse("2024-13-01"), ParseError);
        REQUIRE_THROWS_AS(CalendarDate::parse("2024-04-31"), ParseError);
        REQUIRE_THROWS_AS(CalendarDate::parse("2024-0a-01"), ParseError);
    }
}

TEST_CASE("CalendarDate ordering", "[CalendarDate]") {
    CalendarDate a(2023, 12, 31);
    CalendarDate b(2024, 1, 1);
    CalendarDate c(2024, 1, 2);

    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(c > a);
    REQUIRE(a <= a);
    REQUIRE(b >= b);
    REQUIRE(a != b);
    REQUIRE_FALSE(b < a);
}
