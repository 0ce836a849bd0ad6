/**
 * @file frontier_dataset.hpp
 * @brief Self-contained JSON dataset describing one frontier run
 *
 * Document layout (keys in this order, ticker maps in ticker order):
 * @code{.json}
 * {
 *   "tickers": ["AAA", "BBB", "CCC"],
 *   "mean_daily_returns":    { "AAA": 0.0004, ... },
 *   "annualized_returns":    { "AAA": 0.1008, ... },
 *   "annualized_volatility": { "AAA": 0.2114, ... },
 *   "covariance": { "AAA": { "AAA": 0.00017, ... }, ... },
 *   "weights": [[0.0, 0.0, 1.0], ...],
 *   "portfolio": { "returns": [...], "volatility": [...] },
 *   "frontier_indices": [5150, ...]
 * }
 * @endcode
 *
 * Covariance is daily; returns and volatilities are annualized.
 */

#ifndef FRONTIER_OUTPUT_FRONTIER_DATASET_HPP
#define FRONTIER_OUTPUT_FRONTIER_DATASET_HPP

#include "analytics/return_statistics.hpp"
#include "optimizer/portfolio_evaluator.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace frontier
{

    /**
     * @struct FrontierDataset
     * @brief Everything the visualization needs from a single run
     */
    struct FrontierDataset
    {
        analytics::AssetStatistics statistics;  ///< Per-asset statistics and covariance
        optimizer::PortfolioSet portfolios;     ///< Sampled and evaluated portfolios
        std::vector<size_t> frontier_indices;   ///< Frontier, ascending volatility

        /**
         * @brief Assemble and cross-check the pieces of a run
         * @throws std::invalid_argument if sizes disagree or a frontier index
         *         is out of range
         */
        static FrontierDataset assemble(const analytics::AssetStatistics &statistics,
                                        const optimizer::PortfolioSet &portfolios,
                                        const std::vector<size_t> &frontier_indices);

        /**
         * @brief Build the JSON document
         */
        nlohmann::ordered_json to_json() const;

        /**
         * @brief Serialize with the given indentation
         */
        std::string dump(int indent = 2) const;

        /**
         * @brief Write the document, creating parent directories
         * @param filepath Output file path
         * @throws std::runtime_error if the file cannot be written
         */
        void write(const std::string &filepath) const;
    };

} // namespace frontier

#endif // FRONTIER_OUTPUT_FRONTIER_DATASET_HPP
