/**
 * @file efficient_frontier.hpp
 * @brief Efficient frontier extraction from a cloud of evaluated portfolios
 *
 * Selects the Markowitz efficient frontier out of a finite set of
 * portfolios by a single volatility-ordered sweep instead of solving one
 * optimization problem per frontier point.
 *
 * Algorithm:
 *
 *     order = stable_argsort(volatility)
 *     best  = -inf
 *     For idx in order:
 *         If return[idx] >= best - epsilon:
 *             accept idx
 *             best = max(best, return[idx])
 *
 * A portfolio survives only if no lower-volatility portfolio earns more
 * than epsilon above it. The accepted indices, in ascending-volatility
 * order, trace the frontier curve.
 */

#pragma once

#include "optimizer/portfolio_evaluator.hpp"
#include <string>
#include <vector>

namespace frontier
{
    namespace optimizer
    {

        /**
         * @struct FrontierPoint
         * @brief Single portfolio on the efficient frontier
         */
        struct FrontierPoint
        {
            size_t index;               ///< Index into the evaluated portfolio set
            double expected_return;     ///< Annualized expected return
            double volatility;          ///< Annualized volatility
            Eigen::VectorXd weights;    ///< Portfolio weights
            bool is_valid;              ///< Point present

            /**
             * @brief Default constructor
             */
            FrontierPoint();

            /**
             * @brief Construct from portfolio index in a set
             */
            FrontierPoint(const PortfolioSet& portfolios, size_t idx);
        };

        /**
         * @struct FrontierSummary
         * @brief Descriptive view of an extracted frontier
         */
        struct FrontierSummary
        {
            size_t num_portfolios;                      ///< Portfolios evaluated
            std::vector<size_t> indices;                ///< Frontier indices, ascending volatility
            FrontierPoint min_volatility_portfolio;     ///< First frontier point
            FrontierPoint max_return_portfolio;         ///< Highest-return frontier point

            /**
             * @brief Default constructor
             */
            FrontierSummary();

            /**
             * @brief Check if the frontier has at least one point
             */
            bool is_valid() const;

            /**
             * @brief Print summary statistics
             * @param tickers Asset labels for the weight breakdown
             */
            void print_summary(const std::vector<std::string>& tickers) const;
        };

        /**
         * @class EfficientFrontier
         * @brief Extracts the non-dominated subset of evaluated portfolios
         *
         * Usage Example:
         * @code
         * EfficientFrontier frontier;          // epsilon = 1e-12
         * auto indices = frontier.extract(portfolios);
         * auto summary = frontier.summarize(portfolios, indices);
         * summary.print_summary(tickers);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class EfficientFrontier
        {
        public:
            static constexpr double DEFAULT_TOLERANCE = 1e-12;

            /**
             * @brief Constructor
             * @param tolerance Near-tie tolerance epsilon
             * @throws std::invalid_argument if tolerance is negative or NaN
             */
            explicit EfficientFrontier(double tolerance = DEFAULT_TOLERANCE);

            /**
             * @brief Destructor
             */
            ~EfficientFrontier() = default;

            /**
             * @brief Extract frontier indices
             * @param volatility Volatility per portfolio
             * @param returns Expected return per portfolio, same length
             * @return Accepted indices in ascending-volatility order
             *         (ties keep input index order)
             * @throws std::invalid_argument if sizes differ or values are not finite
             */
            std::vector<size_t> extract(
                const Eigen::VectorXd& volatility,
                const Eigen::VectorXd& returns) const;

            /**
             * @brief Extract frontier indices from an evaluated portfolio set
             */
            std::vector<size_t> extract(const PortfolioSet& portfolios) const;

            /**
             * @brief Describe a frontier previously extracted from portfolios
             * @throws std::out_of_range if an index is outside the set
             */
            FrontierSummary summarize(
                const PortfolioSet& portfolios,
                const std::vector<size_t>& indices) const;

            // ===== Configuration Methods =====

            /**
             * @brief Set near-tie tolerance
             * @throws std::invalid_argument if tolerance is negative or NaN
             */
            void set_tolerance(double tolerance);

            double get_tolerance() const { return tolerance_; }

        private:
            double tolerance_;              ///< Near-tie tolerance epsilon

            /**
             * @brief Indices sorted by ascending volatility, stable
             */
            std::vector<size_t> sort_by_volatility(const Eigen::VectorXd& volatility) const;
        };

    } // namespace optimizer
} // namespace frontier
