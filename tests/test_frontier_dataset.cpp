/**
 * @file test_frontier_dataset.cpp
 * @brief Unit tests for the JSON frontier dataset
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "output/frontier_dataset.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/weight_sampler.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace frontier;
using Catch::Matchers::WithinAbs;

class FrontierDatasetFixture
{
protected:
    analytics::AssetStatistics stats_;
    optimizer::PortfolioSet portfolios_;
    std::vector<size_t> indices_;

    FrontierDatasetFixture()
    {
        stats_.tickers = {"CCC", "AAA", "BBB"};
        stats_.mean_daily_returns = Eigen::Vector3d(0.0002, 0.001, 0.0005);
        stats_.annualized_returns = stats_.mean_daily_returns * 252.0;
        stats_.covariance = Eigen::MatrixXd(3, 3);
        stats_.covariance << 2.5e-5, 1.0e-6, 2.0e-6,
            1.0e-6, 1.0e-4, 3.0e-6,
            2.0e-6, 3.0e-6, 4.0e-4;
        stats_.annualized_volatility = (stats_.covariance.diagonal() * 252.0).cwiseSqrt();
        stats_.num_observations = 60;

        optimizer::PortfolioEvaluator evaluator;
        portfolios_ = evaluator.evaluate(optimizer::WeightSampler(6).generate(), stats_);
        indices_ = optimizer::EfficientFrontier().extract(portfolios_);
    }
};

TEST_CASE_METHOD(FrontierDatasetFixture, "FrontierDataset JSON layout", "[FrontierDataset]")
{
    auto dataset = FrontierDataset::assemble(stats_, portfolios_, indices_);
    auto j = dataset.to_json();

    SECTION("Top-level keys in document order")
    {
        std::vector<std::string> keys;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            keys.push_back(it.key());
        }
        REQUIRE(keys == std::vector<std::string>{"tickers", "mean_daily_returns",
                                                 "annualized_returns", "annualized_volatility",
                                                 "covariance", "weights", "portfolio",
                                                 "frontier_indices"});
    }

    SECTION("Ticker maps follow ticker order")
    {
        REQUIRE(j["tickers"] == nlohmann::ordered_json({"CCC", "AAA", "BBB"}));

        std::vector<std::string> keys;
        for (auto it = j["annualized_returns"].begin(); it != j["annualized_returns"].end(); ++it)
        {
            keys.push_back(it.key());
        }
        REQUIRE(keys == stats_.tickers);

        REQUIRE_THAT(j["mean_daily_returns"]["AAA"].get<double>(), WithinAbs(0.001, 1e-15));
        REQUIRE_THAT(j["annualized_returns"]["BBB"].get<double>(), WithinAbs(0.126, 1e-12));
    }

    SECTION("Covariance is a nested ticker map")
    {
        REQUIRE_THAT(j["covariance"]["AAA"]["BBB"].get<double>(), WithinAbs(3.0e-6, 1e-18));
        REQUIRE(j["covariance"]["AAA"]["BBB"] == j["covariance"]["BBB"]["AAA"]);
        REQUIRE_THAT(j["covariance"]["CCC"]["CCC"].get<double>(), WithinAbs(2.5e-5, 1e-18));
    }

    SECTION("Portfolio arrays are parallel")
    {
        const size_t n = portfolios_.size();
        REQUIRE(j["weights"].size() == n);
        REQUIRE(j["weights"][0].size() == 3);
        REQUIRE(j["portfolio"]["returns"].size() == n);
        REQUIRE(j["portfolio"]["volatility"].size() == n);
        REQUIRE_THAT(j["portfolio"]["returns"][n - 1].get<double>(),
                     WithinAbs(portfolios_.returns(n - 1), 1e-15));
    }

    SECTION("Frontier indices are carried verbatim")
    {
        REQUIRE(j["frontier_indices"].get<std::vector<size_t>>() == indices_);
    }
}

TEST_CASE_METHOD(FrontierDatasetFixture, "FrontierDataset serialization", "[FrontierDataset]")
{
    auto dataset = FrontierDataset::assemble(stats_, portfolios_, indices_);

    SECTION("Dump is deterministic")
    {
        REQUIRE(dataset.dump() == dataset.dump());
        REQUIRE(dataset.dump() ==
                FrontierDataset::assemble(stats_, portfolios_, indices_).dump());
    }

    SECTION("Write creates parent directories")
    {
        auto dir = std::filesystem::temp_directory_path() / "frontier_test_dataset";
        std::filesystem::remove_all(dir);
        auto file = dir / "web" / "data" / "efficient_frontier.json";

        dataset.write(file.string());
        REQUIRE(std::filesystem::exists(file));

        std::ifstream in(file);
        std::stringstream buffer;
        buffer << in.rdbuf();
        REQUIRE(buffer.str() == dataset.dump(2));

        auto parsed = nlohmann::json::parse(buffer.str());
        REQUIRE(parsed["frontier_indices"].size() == indices_.size());

        std::filesystem::remove_all(dir);
    }
}

TEST_CASE_METHOD(FrontierDatasetFixture, "FrontierDataset consistency checks", "[FrontierDataset]")
{
    SECTION("Frontier index outside the portfolio set")
    {
        std::vector<size_t> bad = indices_;
        bad.push_back(portfolios_.size());
        REQUIRE_THROWS_AS(FrontierDataset::assemble(stats_, portfolios_, bad), std::invalid_argument);
    }

    SECTION("Statistics missing an asset")
    {
        stats_.annualized_volatility = Eigen::VectorXd::Zero(2);
        REQUIRE_THROWS_AS(FrontierDataset::assemble(stats_, portfolios_, indices_),
                          std::invalid_argument);
    }

    SECTION("Portfolio vectors of different lengths")
    {
        portfolios_.volatility.conservativeResize(portfolios_.volatility.size() - 1);
        REQUIRE_THROWS_AS(FrontierDataset::assemble(stats_, portfolios_, indices_),
                          std::invalid_argument);
    }
}
