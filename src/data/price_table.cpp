/**
 * @file price_table.cpp
 * @brief Implementation of PriceTable class
 */

#include "data/price_table.hpp"
#include "common/errors.hpp"
#include <iostream>
#include <cmath>

namespace frontier
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PriceTable::PriceTable(const Eigen::MatrixXd &prices,
                           const std::vector<CalendarDate> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }

        for (size_t i = 1; i < dates_.size(); ++i)
        {
            if (!(dates_[i - 1] < dates_[i]))
            {
                throw std::invalid_argument("Dates must be strictly ascending, found " +
                                            dates_[i - 1].to_string() + " before " +
                                            dates_[i].to_string());
            }
        }

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            if (!ticker_index_.emplace(tickers_[i], i).second)
            {
                throw std::invalid_argument("Duplicate ticker: " + tickers_[i]);
            }
        }
    }

    // ================================
    // Data Selection
    // ================================

    PriceTable PriceTable::select_assets(const std::vector<std::string> &selected_tickers) const
    {
        std::vector<int> indices;
        indices.reserve(selected_tickers.size());

        for (const auto &ticker : selected_tickers)
        {
            int idx = find_ticker_index(ticker);
            if (idx < 0)
            {
                throw SchemaError("Ticker not found in price data: " + ticker);
            }
            indices.push_back(idx);
        }

        Eigen::MatrixXd selected_prices(prices_.rows(), indices.size());
        for (size_t i = 0; i < indices.size(); ++i)
        {
            selected_prices.col(i) = prices_.col(indices[i]);
        }

        return PriceTable(selected_prices, dates_, selected_tickers);
    }

    // ===================
    // Validation Methods
    // ===================

    bool PriceTable::is_valid() const
    {
        if (prices_.rows() == 0 || prices_.cols() == 0)
        {
            return false;
        }
        if (dates_.size() != static_cast<size_t>(prices_.rows()))
        {
            return false;
        }
        if (tickers_.size() != static_cast<size_t>(prices_.cols()))
        {
            return false;
        }
        return true;
    }

    size_t PriceTable::count_missing() const
    {
        size_t count = 0;
        for (Eigen::Index i = 0; i < prices_.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                if (std::isnan(prices_(i, j)))
                {
                    ++count;
                }
            }
        }
        return count;
    }

    void PriceTable::print_summary() const
    {
        std::cout << "\n=== Price Data Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front().to_string() << " to "
                      << dates_.back().to_string() << "\n";
        }
        std::cout << "Assets: ";
        for (const auto &ticker : tickers_)
        {
            std::cout << ticker << " ";
        }
        std::cout << "\nMissing values: " << count_missing() << "\n";
        std::cout << "==========================\n"
                  << std::endl;
    }

    // =========================
    // Private Helper Methods
    // =========================

    int PriceTable::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it != ticker_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

} // namespace frontier
