/**
 * @file frontier_pipeline.cpp
 * @brief Implementation of FrontierPipeline
 */

#include "pipeline/frontier_pipeline.hpp"
#include "common/errors.hpp"
#include "data/price_loader.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/weight_sampler.hpp"
#include <string>
#include <utility>

namespace frontier
{

    FrontierPipeline::FrontierPipeline(const FrontierConfig &config) : config_(config)
    {
        config_.validate();
    }

    PipelineResult FrontierPipeline::run(const LabeledTable &table) const
    {
        PriceLoader loader(config_.data.close_field);
        return run(loader.extract_close_prices(table));
    }

    PipelineResult FrontierPipeline::run(const PriceTable &prices) const
    {
        PriceTable selected = config_.data.tickers.empty()
                                  ? prices
                                  : prices.select_assets(config_.data.tickers);

        if (selected.num_assets() != REQUIRED_ASSETS)
        {
            throw SchemaError("Expected exactly " + std::to_string(REQUIRED_ASSETS) +
                              " tickers with closing prices, found " +
                              std::to_string(selected.num_assets()));
        }

        analytics::ReturnStatistics engine(config_.analysis.trading_days);
        analytics::ReturnTable returns = analytics::ReturnStatistics::compute_returns(selected);
        analytics::AssetStatistics statistics = engine.compute(returns);

        optimizer::WeightSampler sampler(config_.sampler.num_steps);
        Eigen::MatrixXd weights = sampler.generate();

        optimizer::PortfolioEvaluator evaluator(config_.analysis.trading_days,
                                                config_.sampler.num_threads);
        optimizer::PortfolioSet portfolios = evaluator.evaluate(weights, statistics);

        optimizer::EfficientFrontier frontier(config_.analysis.frontier_tolerance);
        std::vector<size_t> frontier_indices = frontier.extract(portfolios);

        FrontierDataset dataset = FrontierDataset::assemble(statistics, portfolios, frontier_indices);

        return PipelineResult{std::move(selected),
                              std::move(returns),
                              std::move(statistics),
                              std::move(portfolios),
                              std::move(frontier_indices),
                              std::move(dataset)};
    }

} // namespace frontier
