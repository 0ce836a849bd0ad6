/*
 * @file price_table.hpp
 * @brief Date-indexed closing-price storage.
 *
 * Stores closing prices for a fixed set of assets using an Eigen matrix with
 * an ascending, duplicate-free calendar-date index.
 */

#ifndef FRONTIER_DATA_PRICE_TABLE_HPP
#define FRONTIER_DATA_PRICE_TABLE_HPP

#include "data/calendar_date.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

namespace frontier
{
    /**
     * @class PriceTable
     * @brief Container for multi-asset closing-price history.
     *
     * Rows are trading dates in strictly ascending order, columns are asset
     * tickers. The column order is the asset order used by every downstream
     * structure (statistics, weight vectors, output dataset).
     *
     * @note Data is stored as (dates x assets).
     * @note Missing prices are represented as NaN values.
     */
    class PriceTable
    {
    public:
        /**
         * @brief Constructor with data.
         * @param prices Price matrix (dates x assets).
         * @param dates Trading dates, strictly ascending.
         * @param tickers Asset ticker symbols, unique.
         * @throws std::invalid_argument if dimensions disagree, dates are not
         *         strictly ascending, or tickers repeat
         */
        PriceTable(const Eigen::MatrixXd &prices,
                   const std::vector<CalendarDate> &dates,
                   const std::vector<std::string> &tickers);

        ~PriceTable() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        /**
         * @brief Get the full price matrix.
         * @return Reference to price matrix (dates x assets).
         */
        const Eigen::MatrixXd &get_prices() const
        {
            return prices_;
        }

        const std::vector<CalendarDate> &get_dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &get_tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return prices_.rows();
        }

        size_t num_assets() const
        {
            return prices_.cols();
        }

        /** ===========================================
         *  Data Selection Methods
         *  ===========================================
         */

        /**
         * @brief Select subset of assets, in the given order
         * @param selected_tickers Tickers to keep
         * @return New PriceTable with selected assets
         * @throws SchemaError if a ticker is not present
         */
        PriceTable select_assets(const std::vector<std::string> &selected_tickers) const;

        /** ===========================================
         *  Validation Methods
         *  ===========================================
         */

        /**
         * @brief Check if data is non-empty and consistent
         */
        bool is_valid() const;

        /**
         * @brief Count missing values
         * @return Number of NaN entries in price matrix
         */
        size_t count_missing() const;

        /**
         * @brief Print summary statistics
         */
        void print_summary() const;

    private:
        /**
         * @brief Find index of ticker in tickers_ vector
         * @return Index, or -1 if not found
         */
        int find_ticker_index(const std::string &ticker) const;

        Eigen::MatrixXd prices_;                     ///< Price matrix (dates x assets)
        std::vector<CalendarDate> dates_;            ///< Ascending trading dates
        std::vector<std::string> tickers_;           ///< Asset tickers
        std::map<std::string, size_t> ticker_index_; ///< Ticker to index map
    };

}
#endif // FRONTIER_DATA_PRICE_TABLE_HPP
