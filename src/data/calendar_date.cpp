/**
 * @file calendar_date.cpp
 * @brief Implementation of CalendarDate parsing and formatting
 */

#include "data/calendar_date.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <cstdio>

namespace frontier
{

    CalendarDate::CalendarDate(int y, int m, int d) : year(y), month(m), day(d)
    {
        if (m < 1 || m > 12)
        {
            throw ParseError("Invalid month " + std::to_string(m) + " in date");
        }
        if (d < 1 || d > days_in_month(y, m))
        {
            throw ParseError("Invalid day " + std::to_string(d) + " for " +
                             std::to_string(y) + "-" + std::to_string(m));
        }
    }

    CalendarDate CalendarDate::parse(const std::string &text)
    {
        size_t first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
        {
            throw ParseError("Missing date value");
        }
        size_t last = text.find_last_not_of(" \t\r\n");
        std::string trimmed = text.substr(first, last - first + 1);

        // Drop a trailing time-of-day or UTC-offset component
        if (trimmed.size() > 10)
        {
            const char next = trimmed[10];
            if (next == 'T' || next == ' ' || next == '+' || next == '-' || next == 'Z')
            {
                trimmed = trimmed.substr(0, 10);
            }
        }

        // YYYY-MM-DD or YYYY/MM/DD
        const char separator = trimmed.size() == 10 ? trimmed[4] : '\0';
        if (trimmed.size() != 10 || (separator != '-' && separator != '/') ||
            trimmed[7] != separator)
        {
            throw ParseError("Malformed date (expected YYYY-MM-DD): '" + text + "'");
        }

        for (size_t i = 0; i < trimmed.size(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(trimmed[i])))
            {
                throw ParseError("Malformed date (expected YYYY-MM-DD): '" + text + "'");
            }
        }

        int y = std::stoi(trimmed.substr(0, 4));
        int m = std::stoi(trimmed.substr(5, 2));
        int d = std::stoi(trimmed.substr(8, 2));

        return CalendarDate(y, m, d);
    }

    std::string CalendarDate::to_string() const
    {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
        return std::string(buffer);
    }

    bool CalendarDate::is_leap_year(int y)
    {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    int CalendarDate::days_in_month(int y, int m)
    {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && is_leap_year(y))
        {
            return 29;
        }
        return days[m - 1];
    }

} // namespace frontier
