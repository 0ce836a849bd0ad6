/**
 * @file main.cpp
 * @brief Main entry point for the efficient frontier generator
 *
 * Command-line application that loads closing-price history, samples the
 * three-asset weight grid, extracts the efficient frontier, and writes the
 * JSON dataset consumed by the visualization.
 */

#include "common/errors.hpp"
#include "data/data_loader.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "pipeline/frontier_pipeline.hpp"
#include <iostream>
#include <string>
#include <exception>
#include <optional>
#include <chrono>

using namespace frontier;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Efficient Frontier Generator v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file\n"
              << "  --data PATH           Price CSV file (default: temp.csv)\n"
              << "  --output PATH         Output JSON file (default: web/data/efficient_frontier.json)\n"
              << "  --steps N             Grid points per weight axis (default: 101)\n"
              << "  --threads N           Worker threads for portfolio evaluation (default: 1)\n"
              << "  --verbose             Print data and frontier summaries\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/frontier_config.json --verbose\n"
              << "  " << program_name << " --data prices.csv --output out/frontier.json --steps 51\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Efficient Frontier Generator v1.0.0                     \n"
              << "       Three-Asset Grid Sampling                               \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string data_path;
    std::string output_path;
    std::optional<int> num_steps;
    std::optional<int> num_threads;
    bool verbose = false;
    bool show_help = false;
    bool has_error = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--data" && i + 1 < argc)
            {
                args.data_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if ((arg == "--steps" || arg == "--threads") && i + 1 < argc)
            {
                std::string value = argv[++i];
                int parsed = 0;
                try
                {
                    parsed = std::stoi(value);
                }
                catch (const std::logic_error &)
                {
                    std::cerr << "Error: " << arg << " expects an integer, got: " << value << std::endl;
                    args.has_error = true;
                    continue;
                }

                if (arg == "--steps")
                    args.num_steps = parsed;
                else
                    args.num_threads = parsed;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    /**
     * @brief Apply command-line overrides on top of the loaded configuration
     */
    void apply_to(FrontierConfig &config) const
    {
        if (!data_path.empty())
            config.data.data_file = data_path;
        if (!output_path.empty())
            config.output.output_file = output_path;
        if (num_steps)
            config.sampler.num_steps = *num_steps;
        if (num_threads)
            config.sampler.num_threads = *num_threads;
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        FrontierConfig config;
        if (!args.config_path.empty())
        {
            config = DataLoader::load_config(args.config_path);
        }
        args.apply_to(config);
        config.validate();

        if (args.verbose)
        {
            std::cout << "  - Data file: " << config.data.data_file << "\n";
            std::cout << "  - Close field: " << config.data.close_field << "\n";
            if (!config.data.tickers.empty())
            {
                std::cout << "  - Tickers: ";
                for (const auto &ticker : config.data.tickers)
                {
                    std::cout << ticker << " ";
                }
                std::cout << "\n";
            }
            std::cout << "  - Trading days: " << config.analysis.trading_days << "\n";
            std::cout << "  - Grid steps: " << config.sampler.num_steps << "\n";
            std::cout << "  - Threads: " << config.sampler.num_threads << "\n";
        }

        // ====================================================================
        // 2. Load Price Data
        // ====================================================================
        std::cout << "[2/5] Loading price data..." << std::endl;

        auto raw = DataLoader::read_csv(config.data.data_file, config.data.close_field);

        std::cout << "  - Read " << raw.num_rows() << " rows, "
                  << raw.num_columns() << " columns" << std::endl;

        // ====================================================================
        // 3. Compute Statistics, Sample and Evaluate Portfolios
        // ====================================================================
        std::cout << "[3/5] Computing return statistics and portfolio grid..." << std::endl;

        FrontierPipeline pipeline(config);
        PipelineResult result = pipeline.run(raw);

        std::cout << "  - " << result.returns.num_rows() << " daily returns, "
                  << result.portfolios.size() << " portfolios evaluated" << std::endl;

        if (args.verbose)
        {
            result.prices.print_summary();
            result.statistics.print_summary();
        }

        // ====================================================================
        // 4. Efficient Frontier
        // ====================================================================
        std::cout << "[4/5] Extracting efficient frontier..." << std::endl;
        std::cout << "  - " << result.frontier_indices.size() << " frontier portfolios" << std::endl;

        if (args.verbose)
        {
            optimizer::EfficientFrontier frontier(config.analysis.frontier_tolerance);
            auto summary = frontier.summarize(result.portfolios, result.frontier_indices);
            summary.print_summary(result.statistics.tickers);
        }

        // ====================================================================
        // 5. Write Dataset
        // ====================================================================
        std::cout << "[5/5] Writing dataset..." << std::endl;

        result.dataset.write(config.output.output_file);
        std::cout << "Saved efficient frontier data to " << config.output.output_file << std::endl;

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Frontier computed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const ParseError &e)
    {
        std::cerr << "\nParse error: " << e.what() << std::endl;
        return 1;
    }
    catch (const SchemaError &e)
    {
        std::cerr << "\nSchema error: " << e.what() << std::endl;
        return 1;
    }
    catch (const InsufficientDataError &e)
    {
        std::cerr << "\nInsufficient data: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || args.has_error)
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
