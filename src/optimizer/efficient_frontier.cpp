/**
 * @file efficient_frontier.cpp
 * @brief Implementation of efficient frontier extraction
 */

#include "optimizer/efficient_frontier.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace frontier
{
    namespace optimizer
    {

        // ============================================================================
        // FrontierPoint Implementation
        // ============================================================================

        FrontierPoint::FrontierPoint()
            : index(0),
              expected_return(0.0),
              volatility(0.0),
              is_valid(false)
        {
        }

        FrontierPoint::FrontierPoint(const PortfolioSet &portfolios, size_t idx)
            : index(idx),
              expected_return(0.0),
              volatility(0.0),
              is_valid(true)
        {
            PortfolioPoint p = portfolios.point(idx);
            expected_return = p.expected_return;
            volatility = p.volatility;
            weights = p.weights;
        }

        // ============================================================================
        // FrontierSummary Implementation
        // ============================================================================

        FrontierSummary::FrontierSummary()
            : num_portfolios(0)
        {
        }

        bool FrontierSummary::is_valid() const
        {
            return !indices.empty() && min_volatility_portfolio.is_valid;
        }

        void FrontierSummary::print_summary(const std::vector<std::string> &tickers) const
        {
            auto print_weights = [&tickers](const FrontierPoint &point)
            {
                for (Eigen::Index i = 0; i < point.weights.size(); ++i)
                {
                    const std::string label = static_cast<size_t>(i) < tickers.size()
                                                  ? tickers[i]
                                                  : std::to_string(i);
                    std::cout << "    " << std::setw(8) << std::left << label << std::right
                              << ": " << std::fixed << std::setprecision(2)
                              << point.weights(i) * 100 << "%\n";
                }
            };

            std::cout << "\n=== Efficient Frontier Summary ===\n";
            std::cout << "Portfolios evaluated: " << num_portfolios << "\n";
            std::cout << "Frontier points:      " << indices.size() << "\n";
            std::cout << std::string(60, '-') << "\n";

            if (min_volatility_portfolio.is_valid)
            {
                std::cout << "\nMinimum Volatility Portfolio (#" << min_volatility_portfolio.index << "):\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << min_volatility_portfolio.expected_return * 100 << "%\n";
                std::cout << "  Volatility:       "
                          << min_volatility_portfolio.volatility * 100 << "%\n";
                print_weights(min_volatility_portfolio);
            }

            if (max_return_portfolio.is_valid)
            {
                std::cout << "\nMaximum Return Frontier Portfolio (#" << max_return_portfolio.index << "):\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << max_return_portfolio.expected_return * 100 << "%\n";
                std::cout << "  Volatility:       "
                          << max_return_portfolio.volatility * 100 << "%\n";
                print_weights(max_return_portfolio);
            }

            if (is_valid())
            {
                std::cout << "\nFrontier Range:\n";
                std::cout << "  Return range:     " << std::fixed << std::setprecision(4)
                          << min_volatility_portfolio.expected_return * 100 << "% to "
                          << max_return_portfolio.expected_return * 100 << "%\n";
                std::cout << "  Volatility range: "
                          << min_volatility_portfolio.volatility * 100 << "% to "
                          << max_return_portfolio.volatility * 100 << "%\n";
            }

            std::cout << "================================\n"
                      << std::endl;
        }

        // ============================================================================
        // EfficientFrontier Implementation
        // ============================================================================

        EfficientFrontier::EfficientFrontier(double tolerance)
            : tolerance_(DEFAULT_TOLERANCE)
        {
            set_tolerance(tolerance);
        }

        void EfficientFrontier::set_tolerance(double tolerance)
        {
            if (!(tolerance >= 0.0))
            {
                throw std::invalid_argument("Frontier tolerance must be non-negative");
            }
            tolerance_ = tolerance;
        }

        std::vector<size_t> EfficientFrontier::extract(
            const Eigen::VectorXd &volatility,
            const Eigen::VectorXd &returns) const
        {
            if (volatility.size() != returns.size())
            {
                throw std::invalid_argument(
                    "Volatility and return vectors must have the same length, got: " +
                    std::to_string(volatility.size()) + " and " + std::to_string(returns.size()));
            }
            if (!volatility.allFinite() || !returns.allFinite())
            {
                throw std::invalid_argument("Volatility and return values must be finite");
            }

            std::vector<size_t> frontier;

            double best = -std::numeric_limits<double>::infinity();
            for (size_t idx : sort_by_volatility(volatility))
            {
                if (returns(idx) >= best - tolerance_)
                {
                    frontier.push_back(idx);
                    best = std::max(best, returns(idx));
                }
            }

            return frontier;
        }

        std::vector<size_t> EfficientFrontier::extract(const PortfolioSet &portfolios) const
        {
            return extract(portfolios.volatility, portfolios.returns);
        }

        FrontierSummary EfficientFrontier::summarize(
            const PortfolioSet &portfolios,
            const std::vector<size_t> &indices) const
        {
            FrontierSummary summary;
            summary.num_portfolios = portfolios.size();
            summary.indices = indices;

            if (indices.empty())
            {
                return summary;
            }

            summary.min_volatility_portfolio = FrontierPoint(portfolios, indices.front());

            size_t best_idx = indices.front();
            for (size_t idx : indices)
            {
                if (portfolios.point(idx).expected_return > portfolios.returns(best_idx))
                {
                    best_idx = idx;
                }
            }
            summary.max_return_portfolio = FrontierPoint(portfolios, best_idx);

            return summary;
        }

        std::vector<size_t> EfficientFrontier::sort_by_volatility(const Eigen::VectorXd &volatility) const
        {
            std::vector<size_t> order(volatility.size());
            std::iota(order.begin(), order.end(), 0);

            std::stable_sort(order.begin(), order.end(),
                             [&volatility](size_t a, size_t b)
                             {
                                 return volatility(a) < volatility(b);
                             });

            return order;
        }

    } // namespace optimizer
} // namespace frontier
