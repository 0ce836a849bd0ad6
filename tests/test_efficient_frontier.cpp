/**
 * @file test_efficient_frontier.cpp
 * @brief Unit tests for efficient frontier extraction
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/weight_sampler.hpp"
#include <cmath>
#include <limits>

using namespace frontier;
using namespace frontier::optimizer;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

/**
 * Three uncorrelated assets, the last one riskless.
 */
class FrontierTestFixture
{
protected:
    analytics::AssetStatistics stats_;
    PortfolioSet portfolios_;

    FrontierTestFixture()
    {
        stats_.tickers = {"AAA", "BBB", "CCC"};
        stats_.mean_daily_returns = Eigen::Vector3d(0.001, 0.0005, 0.0);
        stats_.annualized_returns = stats_.mean_daily_returns * 252.0;
        stats_.covariance = Eigen::MatrixXd::Zero(3, 3);
        stats_.covariance(0, 0) = 0.01 * 0.01;
        stats_.covariance(1, 1) = 0.02 * 0.02;
        stats_.annualized_volatility = (stats_.covariance.diagonal() * 252.0).cwiseSqrt();
        stats_.num_observations = 250;

        PortfolioEvaluator evaluator;
        portfolios_ = evaluator.evaluate(WeightSampler().generate(), stats_);
    }
};

// ============================================================================
// Edge Cases
// ============================================================================

TEST_CASE("EfficientFrontier edge cases", "[EfficientFrontier]")
{
    EfficientFrontier frontier;
    REQUIRE(frontier.get_tolerance() == EfficientFrontier::DEFAULT_TOLERANCE);

    SECTION("Empty input")
    {
        auto indices = frontier.extract(Eigen::VectorXd(0), Eigen::VectorXd(0));
        REQUIRE(indices.empty());
    }

    SECTION("Single point")
    {
        Eigen::VectorXd vol(1), ret(1);
        vol << 0.2;
        ret << -0.05;
        auto indices = frontier.extract(vol, ret);
        REQUIRE(indices == std::vector<size_t>{0});
    }

    SECTION("Equal returns keep every point in volatility order")
    {
        Eigen::VectorXd vol(4), ret(4);
        vol << 0.3, 0.1, 0.2, 0.4;
        ret << 0.05, 0.05, 0.05, 0.05;
        auto indices = frontier.extract(vol, ret);
        REQUIRE(indices == std::vector<size_t>{1, 2, 0, 3});
    }

    SECTION("Volatility ties keep input order")
    {
        Eigen::VectorXd vol(3), ret(3);
        vol << 0.1, 0.1, 0.2;
        ret << 0.02, 0.04, 0.03;
        auto indices = frontier.extract(vol, ret);
        REQUIRE(indices == std::vector<size_t>{0, 1});
    }

    SECTION("Dominated points are dropped")
    {
        Eigen::VectorXd vol(5), ret(5);
        vol << 0.10, 0.15, 0.20, 0.25, 0.30;
        ret << 0.04, 0.03, 0.06, 0.05, 0.08;
        auto indices = frontier.extract(vol, ret);
        REQUIRE(indices == std::vector<size_t>{0, 2, 4});
    }
}

TEST_CASE("EfficientFrontier tolerance", "[EfficientFrontier]")
{
    Eigen::VectorXd vol(2), ret(2);
    vol << 0.1, 0.2;
    ret << 0.05, 0.05 - 1e-6;

    SECTION("Near ties inside the tolerance survive")
    {
        EfficientFrontier frontier(1e-5);
        REQUIRE(frontier.extract(vol, ret).size() == 2);
    }

    SECTION("Default tolerance rejects them")
    {
        EfficientFrontier frontier;
        REQUIRE(frontier.extract(vol, ret).size() == 1);
    }

    SECTION("Invalid tolerance")
    {
        REQUIRE_THROWS_AS(EfficientFrontier(-1e-9), std::invalid_argument);
        REQUIRE_THROWS_AS(EfficientFrontier(std::numeric_limits<double>::quiet_NaN()),
                          std::invalid_argument);

        EfficientFrontier frontier;
        REQUIRE_THROWS_AS(frontier.set_tolerance(-1.0), std::invalid_argument);
        REQUIRE(frontier.get_tolerance() == EfficientFrontier::DEFAULT_TOLERANCE);
    }
}

TEST_CASE("EfficientFrontier input validation", "[EfficientFrontier]")
{
    EfficientFrontier frontier;

    SECTION("Length mismatch")
    {
        REQUIRE_THROWS_AS(frontier.extract(Eigen::VectorXd::Zero(3), Eigen::VectorXd::Zero(2)),
                          std::invalid_argument);
    }

    SECTION("Non-finite values")
    {
        Eigen::VectorXd vol(2), ret(2);
        vol << 0.1, std::numeric_limits<double>::infinity();
        ret << 0.01, 0.02;
        REQUIRE_THROWS_AS(frontier.extract(vol, ret), std::invalid_argument);
    }
}

// ============================================================================
// Sampled Portfolio Cloud
// ============================================================================

TEST_CASE_METHOD(FrontierTestFixture, "EfficientFrontier on the sampled grid", "[EfficientFrontier]")
{
    EfficientFrontier frontier;
    auto indices = frontier.extract(portfolios_);

    REQUIRE_FALSE(indices.empty());

    SECTION("Riskless asset is the lowest-volatility point")
    {
        PortfolioPoint first = portfolios_.point(indices.front());
        REQUIRE(first.weights(0) == 0.0);
        REQUIRE(first.weights(1) == 0.0);
        REQUIRE(first.weights(2) == 1.0);
        REQUIRE(first.volatility == 0.0);
    }

    SECTION("Highest-return asset closes the frontier")
    {
        PortfolioPoint last = portfolios_.point(indices.back());
        REQUIRE(last.weights(0) == 1.0);
        REQUIRE_THAT(last.expected_return, WithinAbs(0.252, 1e-12));
        REQUIRE_THAT(last.volatility, WithinAbs(0.01 * std::sqrt(252.0), 1e-12));
    }

    SECTION("Volatility is non-decreasing along the frontier")
    {
        for (size_t k = 1; k < indices.size(); ++k)
        {
            REQUIRE(portfolios_.volatility(indices[k]) >= portfolios_.volatility(indices[k - 1]));
        }
    }

    SECTION("No accepted point is dominated")
    {
        const double eps = frontier.get_tolerance();
        size_t dominated = 0;
        for (size_t idx : indices)
        {
            for (size_t j = 0; j < portfolios_.size(); ++j)
            {
                if (portfolios_.volatility(j) < portfolios_.volatility(idx) &&
                    portfolios_.returns(j) > portfolios_.returns(idx) + eps)
                {
                    ++dominated;
                }
            }
        }
        REQUIRE(dominated == 0);
    }

    SECTION("Riskier asset never appears alone")
    {
        for (size_t idx : indices)
        {
            REQUIRE(portfolios_.weights(idx, 1) < 1.0);
        }
    }

    SECTION("Extraction is deterministic")
    {
        REQUIRE(frontier.extract(portfolios_) == indices);
    }
}

TEST_CASE_METHOD(FrontierTestFixture, "EfficientFrontier summary", "[EfficientFrontier]")
{
    EfficientFrontier frontier;
    auto indices = frontier.extract(portfolios_);
    auto summary = frontier.summarize(portfolios_, indices);

    REQUIRE(summary.is_valid());
    REQUIRE(summary.num_portfolios == portfolios_.size());
    REQUIRE(summary.indices == indices);
    REQUIRE(summary.min_volatility_portfolio.index == indices.front());
    REQUIRE_THAT(summary.max_return_portfolio.expected_return, WithinAbs(0.252, 1e-12));

    SECTION("Empty frontier")
    {
        auto empty = frontier.summarize(portfolios_, {});
        REQUIRE_FALSE(empty.is_valid());
        REQUIRE_FALSE(empty.max_return_portfolio.is_valid);
    }

    SECTION("Index outside the set")
    {
        REQUIRE_THROWS_AS(frontier.summarize(portfolios_, {portfolios_.size()}), std::out_of_range);
    }
}
