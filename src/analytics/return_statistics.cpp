/**
 * @file return_statistics.cpp
 * @brief Implementation of ReturnStatistics and AssetStatistics.
 */

#include "analytics/return_statistics.hpp"
#include "common/errors.hpp"
#include "risk/sample_covariance.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace frontier
{
    namespace analytics
    {

        // ===================================================================
        // AssetStatistics
        // ===================================================================

        void AssetStatistics::print_summary() const
        {
            std::cout << "\n  Asset Statistics (" << num_observations << " daily returns):\n";
            std::cout << "  " << std::string(56, '-') << "\n";
            std::cout << "  " << std::setw(8) << std::left << "Ticker" << std::right
                      << std::setw(14) << "Mean Daily"
                      << std::setw(16) << "Ann. Return"
                      << std::setw(16) << "Ann. Vol" << "\n";
            std::cout << "  " << std::string(56, '-') << "\n";

            for (size_t i = 0; i < tickers.size(); ++i)
            {
                std::cout << "  " << std::setw(8) << std::left << tickers[i] << std::right
                          << std::setw(13) << std::fixed << std::setprecision(4)
                          << mean_daily_returns(i) * 100 << "%"
                          << std::setw(15) << annualized_returns(i) * 100 << "%"
                          << std::setw(15) << annualized_volatility(i) * 100 << "%\n";
            }
            std::cout << "  " << std::string(56, '-') << "\n";
        }

        // ===================================================================
        // ReturnStatistics
        // ===================================================================

        ReturnStatistics::ReturnStatistics(int trading_days) : trading_days_(trading_days)
        {
            if (trading_days_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected trading_days > 0, got: " + std::to_string(trading_days_));
            }
        }

        ReturnTable ReturnStatistics::compute_returns(const PriceTable &prices)
        {
            const Eigen::MatrixXd &p = prices.get_prices();
            const auto &dates = prices.get_dates();

            ReturnTable table;
            table.tickers = prices.get_tickers();

            if (p.rows() < 2)
            {
                table.returns = Eigen::MatrixXd(0, p.cols());
                return table;
            }

            Eigen::MatrixXd all_returns(p.rows() - 1, p.cols());
            std::vector<Eigen::Index> kept_rows;
            kept_rows.reserve(p.rows() - 1);

            for (Eigen::Index i = 0; i < p.rows() - 1; ++i)
            {
                bool any_defined = false;

                for (Eigen::Index j = 0; j < p.cols(); ++j)
                {
                    double p_t = p(i + 1, j);
                    double p_tm1 = p(i, j);

                    if (std::isnan(p_t) || std::isnan(p_tm1) || p_tm1 == 0.0)
                    {
                        all_returns(i, j) = std::numeric_limits<double>::quiet_NaN();
                    }
                    else
                    {
                        all_returns(i, j) = (p_t - p_tm1) / p_tm1;
                        any_defined = true;
                    }
                }

                if (any_defined)
                {
                    kept_rows.push_back(i);
                }
            }

            table.returns = Eigen::MatrixXd(kept_rows.size(), p.cols());
            table.dates.reserve(kept_rows.size());
            for (size_t k = 0; k < kept_rows.size(); ++k)
            {
                table.returns.row(k) = all_returns.row(kept_rows[k]);
                table.dates.push_back(dates[kept_rows[k] + 1]);
            }

            return table;
        }

        AssetStatistics ReturnStatistics::compute(const ReturnTable &returns) const
        {
            const Eigen::MatrixXd &r = returns.returns;

            if (r.rows() < 2)
            {
                throw InsufficientDataError(
                    "At least 2 usable return rows are required, found: " +
                    std::to_string(r.rows()));
            }

            const Eigen::Index n_assets = r.cols();

            AssetStatistics stats;
            stats.tickers = returns.tickers;
            stats.trading_days = trading_days_;
            stats.num_observations = r.rows();
            stats.mean_daily_returns = Eigen::VectorXd(n_assets);
            stats.annualized_volatility = Eigen::VectorXd(n_assets);

            for (Eigen::Index j = 0; j < n_assets; ++j)
            {
                double sum = 0.0;
                int count = 0;

                for (Eigen::Index i = 0; i < r.rows(); ++i)
                {
                    if (!std::isnan(r(i, j)))
                    {
                        sum += r(i, j);
                        ++count;
                    }
                }

                if (count < 2)
                {
                    const std::string name = j < static_cast<Eigen::Index>(returns.tickers.size())
                                                 ? returns.tickers[j]
                                                 : std::to_string(j);
                    throw InsufficientDataError(
                        "Asset " + name + " has " + std::to_string(count) +
                        " return observation(s); at least 2 are required");
                }

                const double mean = sum / count;

                // Population standard deviation (divide by n)
                double sum_sq_dev = 0.0;
                for (Eigen::Index i = 0; i < r.rows(); ++i)
                {
                    if (!std::isnan(r(i, j)))
                    {
                        double dev = r(i, j) - mean;
                        sum_sq_dev += dev * dev;
                    }
                }

                stats.mean_daily_returns(j) = mean;
                stats.annualized_volatility(j) =
                    std::sqrt(sum_sq_dev / count) * std::sqrt(static_cast<double>(trading_days_));
            }

            stats.annualized_returns = stats.mean_daily_returns * static_cast<double>(trading_days_);

            risk::SampleCovariance estimator;
            stats.covariance = estimator.estimate_covariance(r);

            return stats;
        }

        AssetStatistics ReturnStatistics::compute(const PriceTable &prices) const
        {
            return compute(compute_returns(prices));
        }

    } // namespace analytics
} // namespace frontier
