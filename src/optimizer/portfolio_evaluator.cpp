/**
 * @file portfolio_evaluator.cpp
 * @brief Implementation of portfolio risk/return evaluation
 */

#include "optimizer/portfolio_evaluator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace frontier
{
    namespace optimizer
    {

        // ============================================================================
        // PortfolioSet Implementation
        // ============================================================================

        PortfolioPoint PortfolioSet::point(size_t i) const
        {
            if (i >= size())
            {
                throw std::out_of_range("Portfolio index " + std::to_string(i) +
                                        " out of range (size " + std::to_string(size()) + ")");
            }

            PortfolioPoint p;
            p.weights = weights.row(i).transpose();
            p.expected_return = returns(i);
            p.volatility = volatility(i);
            return p;
        }

        // ============================================================================
        // PortfolioEvaluator Implementation
        // ============================================================================

        PortfolioEvaluator::PortfolioEvaluator(int trading_days, int num_threads)
            : trading_days_(trading_days), num_threads_(num_threads)
        {
            if (trading_days_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected trading_days > 0, got: " + std::to_string(trading_days_));
            }
            if (num_threads_ < 1)
            {
                throw std::invalid_argument(
                    "Expected num_threads >= 1, got: " + std::to_string(num_threads_));
            }
        }

        PortfolioSet PortfolioEvaluator::evaluate(const Eigen::MatrixXd &weights,
                                                  const analytics::AssetStatistics &stats) const
        {
            const Eigen::Index n_assets = stats.mean_daily_returns.size();

            if (stats.covariance.rows() != n_assets || stats.covariance.cols() != n_assets)
            {
                throw std::invalid_argument("Covariance matrix must be " + std::to_string(n_assets) +
                                            "x" + std::to_string(n_assets));
            }
            if (weights.rows() > 0 && weights.cols() != n_assets)
            {
                throw std::invalid_argument("Weight vectors have " + std::to_string(weights.cols()) +
                                            " components but statistics cover " +
                                            std::to_string(n_assets) + " assets");
            }

            const Eigen::MatrixXd annual_covariance = stats.covariance * static_cast<double>(trading_days_);

            PortfolioSet out;
            out.weights = weights;
            out.returns = Eigen::VectorXd(weights.rows());
            out.volatility = Eigen::VectorXd(weights.rows());

            const Eigen::Index n = weights.rows();
            const Eigen::Index workers = std::min<Eigen::Index>(
                std::min<Eigen::Index>(num_threads_, max_workers()), n);

            if (workers <= 1)
            {
                evaluate_range(weights, stats.mean_daily_returns, annual_covariance, 0, n, out);
                return out;
            }

            // Disjoint contiguous blocks, one per worker
            std::vector<std::thread> threads;
            threads.reserve(workers);
            const Eigen::Index chunk = (n + workers - 1) / workers;

            try
            {
                for (Eigen::Index w = 0; w < workers; ++w)
                {
                    const Eigen::Index begin = w * chunk;
                    const Eigen::Index end = std::min(n, begin + chunk);
                    if (begin >= end)
                        break;

                    threads.emplace_back([&, begin, end]()
                                         { evaluate_range(weights, stats.mean_daily_returns,
                                                          annual_covariance, begin, end, out); });
                }
            }
            catch (...)
            {
                // Workers already running still reference local state
                for (auto &t : threads)
                {
                    t.join();
                }
                throw;
            }

            for (auto &t : threads)
            {
                t.join();
            }

            return out;
        }

        int PortfolioEvaluator::max_workers()
        {
            const unsigned int hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 1 : static_cast<int>(hardware);
        }

        void PortfolioEvaluator::evaluate_range(const Eigen::MatrixXd &weights,
                                                const Eigen::VectorXd &mean_daily_returns,
                                                const Eigen::MatrixXd &annual_covariance,
                                                Eigen::Index begin,
                                                Eigen::Index end,
                                                PortfolioSet &out) const
        {
            for (Eigen::Index i = begin; i < end; ++i)
            {
                const Eigen::VectorXd w = weights.row(i).transpose();

                out.returns(i) = w.dot(mean_daily_returns) * static_cast<double>(trading_days_);

                const double variance = w.dot(annual_covariance * w);
                out.volatility(i) = std::sqrt(std::max(0.0, variance));
            }
        }

        double PortfolioEvaluator::portfolio_return(const Eigen::VectorXd &weights,
                                                    const Eigen::VectorXd &mean_daily_returns) const
        {
            if (weights.size() != mean_daily_returns.size())
            {
                throw std::invalid_argument("Weights and returns must have the same size");
            }
            return weights.dot(mean_daily_returns) * static_cast<double>(trading_days_);
        }

        double PortfolioEvaluator::portfolio_volatility(const Eigen::VectorXd &weights,
                                                        const Eigen::MatrixXd &daily_covariance) const
        {
            if (daily_covariance.rows() != weights.size() || daily_covariance.cols() != weights.size())
            {
                throw std::invalid_argument("Covariance dimensions must match weights size");
            }
            const double variance =
                weights.dot((daily_covariance * static_cast<double>(trading_days_)) * weights);
            return std::sqrt(std::max(0.0, variance));
        }

    } // namespace optimizer
} // namespace frontier
