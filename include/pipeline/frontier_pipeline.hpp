/**
 * @file frontier_pipeline.hpp
 * @brief End-to-end efficient frontier computation
 *
 * Runs the stages in order, each consuming the previous stage's output:
 *
 *   LabeledTable --PriceLoader--> PriceTable
 *                --ReturnStatistics--> ReturnTable, AssetStatistics
 *                --WeightSampler + PortfolioEvaluator--> PortfolioSet
 *                --EfficientFrontier--> frontier indices
 *                --> FrontierDataset
 *
 * The pipeline holds configuration only; every run owns its data and
 * nothing is carried from one run to the next.
 */

#ifndef FRONTIER_PIPELINE_FRONTIER_PIPELINE_HPP
#define FRONTIER_PIPELINE_FRONTIER_PIPELINE_HPP

#include "analytics/return_statistics.hpp"
#include "data/data_loader.hpp"
#include "data/labeled_table.hpp"
#include "data/price_table.hpp"
#include "optimizer/portfolio_evaluator.hpp"
#include "output/frontier_dataset.hpp"
#include <vector>

namespace frontier
{

    /**
     * @struct PipelineResult
     * @brief Every intermediate product of one run
     */
    struct PipelineResult
    {
        PriceTable prices;                      ///< Closing prices actually analyzed
        analytics::ReturnTable returns;         ///< Daily returns
        analytics::AssetStatistics statistics;  ///< Per-asset statistics
        optimizer::PortfolioSet portfolios;     ///< Sampled portfolios
        std::vector<size_t> frontier_indices;   ///< Efficient subset
        FrontierDataset dataset;                ///< Output document
    };

    /**
     * @class FrontierPipeline
     * @brief Configured, stateless driver for the frontier computation
     *
     * Usage Example:
     * @code
     * FrontierConfig config = FrontierConfig::load_from_file("frontier_config.json");
     * FrontierPipeline pipeline(config);
     * auto raw = DataLoader::read_csv(config.data.data_file, config.data.close_field);
     * PipelineResult result = pipeline.run(raw);
     * result.dataset.write(config.output.output_file);
     * @endcode
     */
    class FrontierPipeline
    {
    public:
        static constexpr size_t REQUIRED_ASSETS = 3;

        /**
         * @brief Constructor
         * @param config Run configuration (file paths are ignored here)
         * @throws std::invalid_argument if the configuration is invalid
         */
        explicit FrontierPipeline(const FrontierConfig &config = FrontierConfig());

        /**
         * @brief Run on raw labeled input
         * @throws ParseError, SchemaError, InsufficientDataError
         */
        PipelineResult run(const LabeledTable &table) const;

        /**
         * @brief Run on an already loaded price table
         * @throws SchemaError if the selected table does not hold exactly 3 assets
         * @throws InsufficientDataError if fewer than 2 return rows are usable
         */
        PipelineResult run(const PriceTable &prices) const;

        const FrontierConfig &get_config() const { return config_; }

    private:
        FrontierConfig config_;
    };

} // namespace frontier

#endif // FRONTIER_PIPELINE_FRONTIER_PIPELINE_HPP
