/**
 * @file calendar_date.hpp
 * @brief Canonical calendar-date type used to index price history.
 */

#ifndef FRONTIER_DATA_CALENDAR_DATE_HPP
#define FRONTIER_DATA_CALENDAR_DATE_HPP

#include <string>

namespace frontier
{

    /**
     * @struct CalendarDate
     * @brief Proleptic Gregorian date without a time-of-day component.
     *
     * Dates compare chronologically and print as YYYY-MM-DD.
     */
    struct CalendarDate
    {
        int year = 1970;
        int month = 1;
        int day = 1;

        CalendarDate() = default;

        /**
         * @brief Construct from components.
         * @throws ParseError if the components do not form a valid date
         */
        CalendarDate(int y, int m, int d);

        /**
         * @brief Parse a date string.
         *
         * Accepts "YYYY-MM-DD" or "YYYY/MM/DD", optionally followed by a
         * time-of-day part separated by 'T' or a space
         * ("2024-01-02 00:00:00+00:00") or directly by a UTC offset
         * ("2024-01-02+00:00", "2024-01-02Z"). The suffix is discarded.
         * Surrounding whitespace is ignored.
         *
         * @param text Date text
         * @return Parsed date
         * @throws ParseError if text is empty or not a valid calendar date
         */
        static CalendarDate parse(const std::string &text);

        /**
         * @brief Format as YYYY-MM-DD.
         */
        std::string to_string() const;

        /**
         * @brief Number of days in a given month.
         */
        static int days_in_month(int year, int month);

        static bool is_leap_year(int year);

        bool operator==(const CalendarDate &other) const
        {
            return year == other.year && month == other.month && day == other.day;
        }

        bool operator!=(const CalendarDate &other) const { return !(*this == other); }

        bool operator<(const CalendarDate &other) const
        {
            if (year != other.year)
                return year < other.year;
            if (month != other.month)
                return month < other.month;
            return day < other.day;
        }

        bool operator>(const CalendarDate &other) const { return other < *this; }
        bool operator<=(const CalendarDate &other) const { return !(other < *this); }
        bool operator>=(const CalendarDate &other) const { return !(*this < other); }
    };

} // namespace frontier

#endif // FRONTIER_DATA_CALENDAR_DATE_HPP
