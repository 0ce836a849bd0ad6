/**
 * @file price_loader.cpp
 * @brief Implementation of PriceLoader
 */

#include "data/price_loader.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <set>

namespace frontier
{

    PriceLoader::PriceLoader(const std::string &close_field) : close_field_(close_field)
    {
        if (close_field_.empty())
        {
            throw std::invalid_argument("Closing-price field label cannot be empty");
        }
    }

    PriceTable PriceLoader::extract_close_prices(const LabeledTable &table) const
    {
        // Locate the closing-price columns
        std::vector<size_t> close_columns;
        std::vector<std::string> tickers;
        std::set<std::string> seen;

        const auto &labels = table.get_labels();
        for (size_t c = 0; c < labels.size(); ++c)
        {
            if (labels[c].field != close_field_)
                continue;

            const std::string &ticker = labels[c].ticker;
            if (ticker.empty())
            {
                throw SchemaError("Column " + std::to_string(c) + " under field '" +
                                  close_field_ + "' has no ticker label");
            }
            if (!seen.insert(ticker).second)
            {
                throw SchemaError("Ticker '" + ticker + "' appears twice under field '" +
                                  close_field_ + "'");
            }
            close_columns.push_back(c);
            tickers.push_back(ticker);
        }

        if (close_columns.empty())
        {
            std::string available;
            for (const auto &field : table.fields())
            {
                available += available.empty() ? field : ", " + field;
            }
            throw SchemaError("Closing-price field '" + close_field_ +
                              "' not found in input columns (available fields: " +
                              (available.empty() ? std::string("none") : available) + ")");
        }

        // Parse the date key
        const auto &raw_dates = table.get_dates();
        const size_t n_rows = raw_dates.size();

        std::vector<CalendarDate> dates;
        dates.reserve(n_rows);
        for (size_t i = 0; i < n_rows; ++i)
        {
            try
            {
                dates.push_back(CalendarDate::parse(raw_dates[i]));
            }
            catch (const ParseError &e)
            {
                throw ParseError("Row " + std::to_string(i + 1) + ": " + e.what());
            }
        }

        // Order rows by date
        std::vector<size_t> order(n_rows);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&dates](size_t a, size_t b)
                         { return dates[a] < dates[b]; });

        for (size_t k = 1; k < order.size(); ++k)
        {
            if (dates[order[k - 1]] == dates[order[k]])
            {
                throw ParseError("Duplicate date in price data: " +
                                 dates[order[k]].to_string());
            }
        }

        Eigen::MatrixXd prices(n_rows, close_columns.size());
        std::vector<CalendarDate> sorted_dates;
        sorted_dates.reserve(n_rows);

        for (size_t k = 0; k < n_rows; ++k)
        {
            const size_t row = order[k];
            sorted_dates.push_back(dates[row]);

            for (size_t j = 0; j < close_columns.size(); ++j)
            {
                const std::string &cell = table.get_column(close_columns[j])[row];
                try
                {
                    prices(k, j) = parse_price(cell);
                }
                catch (const ParseError &e)
                {
                    throw ParseError(std::string(e.what()) + " (ticker " + tickers[j] +
                                     ", date " + dates[row].to_string() + ")");
                }
            }
        }

        return PriceTable(prices, sorted_dates, tickers);
    }

    double PriceLoader::parse_price(const std::string &cell)
    {
        size_t first = cell.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        size_t last = cell.find_last_not_of(" \t\r\n");
        std::string trimmed = cell.substr(first, last - first + 1);

        if (trimmed == "nan" || trimmed == "NaN" || trimmed == "NAN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        double value = 0.0;
        size_t consumed = 0;
        try
        {
            value = std::stod(trimmed, &consumed);
        }
        catch (const std::logic_error &)
        {
            throw ParseError("Unparseable price value '" + trimmed + "'");
        }

        if (consumed != trimmed.size() || !std::isfinite(value))
        {
            throw ParseError("Unparseable price value '" + trimmed + "'");
        }

        return value;
    }

} // namespace frontier
