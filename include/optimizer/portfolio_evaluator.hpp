/**
 * @file portfolio_evaluator.hpp
 * @brief Annualized return and volatility for sampled weight vectors
 *
 * For each weight row w:
 *     return     = (w . mu) * trading_days
 *     volatility = sqrt(max(0, w^T * (Sigma * trading_days) * w))
 *
 * where mu is the mean daily return vector and Sigma the daily covariance.
 */

#pragma once

#include "analytics/return_statistics.hpp"
#include <Eigen/Dense>

namespace frontier
{
    namespace optimizer
    {

        /**
         * @struct PortfolioPoint
         * @brief One evaluated portfolio
         */
        struct PortfolioPoint
        {
            Eigen::VectorXd weights; ///< Asset weights, price-table order
            double expected_return;  ///< Annualized expected return
            double volatility;       ///< Annualized volatility
        };

        /**
         * @struct PortfolioSet
         * @brief Evaluated portfolios stored column-wise
         *
         * Row i of weights, returns(i) and volatility(i) describe the same
         * portfolio; i is its identity for the rest of the pipeline.
         */
        struct PortfolioSet
        {
            Eigen::MatrixXd weights;    ///< Weights (portfolios x assets)
            Eigen::VectorXd returns;    ///< Annualized expected returns
            Eigen::VectorXd volatility; ///< Annualized volatilities

            size_t size() const { return returns.size(); }

            /**
             * @brief Gather portfolio i
             * @throws std::out_of_range if i >= size()
             */
            PortfolioPoint point(size_t i) const;
        };

        /**
         * @class PortfolioEvaluator
         * @brief Maps weight vectors to annualized risk and return
         *
         * Rows are independent, so evaluation may be split across worker
         * threads. Each worker writes a disjoint block of rows, which keeps
         * the output index-aligned with the input regardless of scheduling.
         *
         * Usage Example:
         * @code
         * PortfolioEvaluator evaluator(252);
         * PortfolioSet set = evaluator.evaluate(weights, stats);
         * @endcode
         */
        class PortfolioEvaluator
        {
        public:
            /**
             * @brief Constructor
             * @param trading_days Annualization factor
             * @param num_threads Worker threads (1 = evaluate on calling thread).
             *        Requests above max_workers() are capped.
             * @throws std::invalid_argument if trading_days <= 0 or num_threads < 1
             */
            explicit PortfolioEvaluator(int trading_days = 252, int num_threads = 1);

            ~PortfolioEvaluator() = default;

            /**
             * @brief Evaluate every weight row
             * @param weights Weight matrix (portfolios x assets)
             * @param stats Asset statistics with matching asset count
             * @return Index-aligned portfolio set
             * @throws std::invalid_argument if dimensions disagree
             */
            PortfolioSet evaluate(const Eigen::MatrixXd &weights,
                                  const analytics::AssetStatistics &stats) const;

            /**
             * @brief Annualized return of a single portfolio
             */
            double portfolio_return(const Eigen::VectorXd &weights,
                                    const Eigen::VectorXd &mean_daily_returns) const;

            /**
             * @brief Annualized volatility of a single portfolio
             *
             * Negative variance residues from rounding are clamped to zero.
             */
            double portfolio_volatility(const Eigen::VectorXd &weights,
                                        const Eigen::MatrixXd &daily_covariance) const;

            int get_trading_days() const { return trading_days_; }
            int get_num_threads() const { return num_threads_; }

            /**
             * @brief Upper bound on concurrent workers (hardware threads, at least 1)
             */
            static int max_workers();

        private:
            int trading_days_;
            int num_threads_;

            /**
             * @brief Evaluate rows [begin, end) into the output set
             */
            void evaluate_range(const Eigen::MatrixXd &weights,
                                const Eigen::VectorXd &mean_daily_returns,
                                const Eigen::MatrixXd &annual_covariance,
                                Eigen::Index begin,
                                Eigen::Index end,
                                PortfolioSet &out) const;
        };

    } // namespace optimizer
} // namespace frontier
