/**
 * @file frontier_dataset.cpp
 * @brief Implementation of FrontierDataset serialization
 */

#include "output/frontier_dataset.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace frontier
{

    namespace
    {
        nlohmann::ordered_json ticker_map(const std::vector<std::string> &tickers,
                                          const Eigen::VectorXd &values)
        {
            nlohmann::ordered_json j = nlohmann::ordered_json::object();
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                j[tickers[i]] = values(i);
            }
            return j;
        }

        std::vector<double> to_std_vector(const Eigen::VectorXd &v)
        {
            return std::vector<double>(v.data(), v.data() + v.size());
        }
    }

    FrontierDataset FrontierDataset::assemble(const analytics::AssetStatistics &statistics,
                                              const optimizer::PortfolioSet &portfolios,
                                              const std::vector<size_t> &frontier_indices)
    {
        const Eigen::Index n_assets = static_cast<Eigen::Index>(statistics.tickers.size());

        if (statistics.mean_daily_returns.size() != n_assets ||
            statistics.annualized_returns.size() != n_assets ||
            statistics.annualized_volatility.size() != n_assets ||
            statistics.covariance.rows() != n_assets ||
            statistics.covariance.cols() != n_assets)
        {
            throw std::invalid_argument("Asset statistics do not match the ticker count");
        }

        const Eigen::Index n_portfolios = portfolios.weights.rows();
        if (portfolios.returns.size() != n_portfolios ||
            portfolios.volatility.size() != n_portfolios)
        {
            throw std::invalid_argument("Portfolio returns and volatility must parallel the weights");
        }
        if (n_portfolios > 0 && portfolios.weights.cols() != n_assets)
        {
            throw std::invalid_argument("Portfolio weights do not match the ticker count");
        }

        for (size_t idx : frontier_indices)
        {
            if (idx >= static_cast<size_t>(n_portfolios))
            {
                throw std::invalid_argument("Frontier index " + std::to_string(idx) +
                                            " is out of range");
            }
        }

        FrontierDataset dataset;
        dataset.statistics = statistics;
        dataset.portfolios = portfolios;
        dataset.frontier_indices = frontier_indices;
        return dataset;
    }

    nlohmann::ordered_json FrontierDataset::to_json() const
    {
        const auto &tickers = statistics.tickers;

        nlohmann::ordered_json j;
        j["tickers"] = tickers;
        j["mean_daily_returns"] = ticker_map(tickers, statistics.mean_daily_returns);
        j["annualized_returns"] = ticker_map(tickers, statistics.annualized_returns);
        j["annualized_volatility"] = ticker_map(tickers, statistics.annualized_volatility);

        nlohmann::ordered_json covariance = nlohmann::ordered_json::object();
        for (size_t i = 0; i < tickers.size(); ++i)
        {
            covariance[tickers[i]] = ticker_map(tickers, statistics.covariance.row(i).transpose());
        }
        j["covariance"] = covariance;

        nlohmann::ordered_json weights = nlohmann::ordered_json::array();
        for (Eigen::Index i = 0; i < portfolios.weights.rows(); ++i)
        {
            weights.push_back(to_std_vector(portfolios.weights.row(i).transpose()));
        }
        j["weights"] = weights;

        nlohmann::ordered_json portfolio;
        portfolio["returns"] = to_std_vector(portfolios.returns);
        portfolio["volatility"] = to_std_vector(portfolios.volatility);
        j["portfolio"] = portfolio;

        j["frontier_indices"] = frontier_indices;

        return j;
    }

    std::string FrontierDataset::dump(int indent) const
    {
        return to_json().dump(indent);
    }

    void FrontierDataset::write(const std::string &filepath) const
    {
        // Serialize before touching the filesystem
        const std::string document = dump(2);

        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << document;
        if (!file)
        {
            throw std::runtime_error("Failed writing dataset to: " + filepath);
        }
    }

} // namespace frontier
