/**
 * @file price_loader.hpp
 * @brief Extracts a clean closing-price table from labeled tabular input
 */

#ifndef FRONTIER_DATA_PRICE_LOADER_HPP
#define FRONTIER_DATA_PRICE_LOADER_HPP

#include "data/labeled_table.hpp"
#include "data/price_table.hpp"
#include <string>

namespace frontier
{

    /**
     * @class PriceLoader
     * @brief Turns a LabeledTable into a date-ordered PriceTable
     *
     * Keeps only the columns whose field label matches the closing-price
     * field, relabels them by ticker, parses dates into CalendarDate and
     * orders rows by ascending date. Other fields (High, Volume, ...) are
     * discarded.
     *
     * Usage Example:
     * @code
     * auto raw = DataLoader::read_csv("temp.csv");
     * PriceLoader loader("Close");
     * PriceTable closes = loader.extract_close_prices(raw);
     * @endcode
     */
    class PriceLoader
    {
    public:
        /**
         * @brief Constructor
         * @param close_field Field label that identifies closing prices
         * @throws std::invalid_argument if close_field is empty
         */
        explicit PriceLoader(const std::string &close_field = "Close");

        /**
         * @brief Build the closing-price table
         * @param table Raw labeled input
         * @return PriceTable with ticker-labeled columns and ascending dates
         * @throws ParseError if a date is missing, malformed or repeated, or a
         *         price cell is not numeric
         * @throws SchemaError if no column carries the closing-price field, a
         *         ticker label is empty or appears twice
         */
        PriceTable extract_close_prices(const LabeledTable &table) const;

        const std::string &get_close_field() const { return close_field_; }

        /**
         * @brief Parse one price cell
         *
         * Empty cells and "nan"/"NaN" are missing values and map to NaN.
         *
         * @throws ParseError if the cell is neither missing nor a finite number
         */
        static double parse_price(const std::string &cell);

    private:
        std::string close_field_;
    };

} // namespace frontier

#endif // FRONTIER_DATA_PRICE_LOADER_HPP
