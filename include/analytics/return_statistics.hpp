/**
 * @file return_statistics.hpp
 * @brief Daily return table and per-asset return/risk statistics.
 *
 * Derives simple daily returns from a closing-price table and summarizes
 * them into the quantities needed by the portfolio evaluator: mean daily
 * return, annualized return and volatility, and the daily covariance matrix.
 *
 * Annualization is linear in the number of trading days:
 *   annualized_return     = mean_daily_return * trading_days
 *   annualized_volatility = population_std(daily returns) * sqrt(trading_days)
 */

#ifndef FRONTIER_ANALYTICS_RETURN_STATISTICS_HPP
#define FRONTIER_ANALYTICS_RETURN_STATISTICS_HPP

#include "data/calendar_date.hpp"
#include "data/price_table.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace frontier
{
    namespace analytics
    {

        /**
         * @struct ReturnTable
         * @brief Period-over-period simple returns.
         *
         * Row i holds the return from the previous price date to dates[i].
         * Undefined entries are NaN; rows undefined for every asset are not
         * stored.
         */
        struct ReturnTable
        {
            Eigen::MatrixXd returns;          ///< Returns (rows x assets)
            std::vector<CalendarDate> dates;  ///< Date closing each return period
            std::vector<std::string> tickers; ///< Asset tickers, price-table order

            size_t num_rows() const { return returns.rows(); }
            size_t num_assets() const { return returns.cols(); }
        };

        /**
         * @struct AssetStatistics
         * @brief Per-asset return statistics and daily covariance.
         */
        struct AssetStatistics
        {
            std::vector<std::string> tickers;      ///< Asset order for every vector below
            Eigen::VectorXd mean_daily_returns;    ///< Arithmetic mean of daily returns
            Eigen::VectorXd annualized_returns;    ///< mean * trading_days
            Eigen::VectorXd annualized_volatility; ///< population std * sqrt(trading_days)
            Eigen::MatrixXd covariance;            ///< Daily sample covariance (n-1)
            int trading_days = 252;                ///< Annualization factor used
            size_t num_observations = 0;           ///< Return rows the statistics came from

            size_t num_assets() const { return tickers.size(); }

            /**
             * @brief Print per-asset statistics table
             */
            void print_summary() const;
        };

        /**
         * @class ReturnStatistics
         * @brief Computes returns and AssetStatistics from price history.
         *
         * Usage:
         * @code
         *   ReturnStatistics engine(252);
         *   ReturnTable returns = ReturnStatistics::compute_returns(prices);
         *   AssetStatistics stats = engine.compute(returns);
         * @endcode
         */
        class ReturnStatistics
        {
        public:
            /**
             * @brief Constructor
             * @param trading_days Trading days per year used for annualization
             * @throws std::invalid_argument if trading_days <= 0
             */
            explicit ReturnStatistics(int trading_days = 252);

            /**
             * @brief Simple returns (p[i] - p[i-1]) / p[i-1] for every asset.
             *
             * An entry is undefined (NaN) when either price is missing or the
             * prior price is zero. Rows undefined for every asset are dropped;
             * partially undefined rows are kept without filling.
             *
             * @param prices Closing-price table
             * @return Return table (at most num_dates - 1 rows)
             */
            static ReturnTable compute_returns(const PriceTable &prices);

            /**
             * @brief Summarize a return table
             * @param returns Return table
             * @return Asset statistics in the table's ticker order
             * @throws InsufficientDataError if fewer than 2 return rows exist,
             *         or an asset (or asset pair) has fewer than 2 observations
             */
            AssetStatistics compute(const ReturnTable &returns) const;

            /**
             * @brief compute_returns followed by compute
             */
            AssetStatistics compute(const PriceTable &prices) const;

            int get_trading_days() const { return trading_days_; }

        private:
            int trading_days_;
        };

    } // namespace analytics
} // namespace frontier

#endif // FRONTIER_ANALYTICS_RETURN_STATISTICS_HPP
