/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic three-asset closing prices for the frontier generator
 */

#include "analytics/return_statistics.hpp"
#include "data/data_loader.hpp"
#include "data/price_table.hpp"
#include <cmath>
#include <exception>
#include <iostream>
#include <iomanip>

using namespace frontier;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    std::vector<std::string> tickers = {"AAA", "BBB", "CCC"};

    // 2 years of daily observations
    size_t num_days = 504;
    std::string start_date = "2022-01-03";

    std::string output_file = "temp.csv";
    double base_volatility = 0.015;  // 1.5% daily volatility
    double base_drift = 0.0003;      // ~8% annualized return
    unsigned int seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--volatility" && i + 1 < argc) {
                base_volatility = std::stod(argv[++i]);
            } else if (arg == "--drift" && i + 1 < argc) {
                base_drift = std::stod(argv[++i]);
            } else if (arg == "--days" && i + 1 < argc) {
                num_days = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: temp.csv)\n"
                          << "  --volatility VAL   Base daily volatility (default: 0.015)\n"
                          << "  --drift VAL        Base daily drift (default: 0.0003)\n"
                          << "  --days N           Number of daily observations (default: 504)\n"
                          << "  --seed N           Random seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            }
        } catch (const std::logic_error& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    std::cout << "Generating " << num_days << " days for " << tickers.size()
              << " assets starting " << start_date << "..." << std::endl;

    try {
        auto data = DataLoader::generate_synthetic_data(
            tickers,
            num_days,
            start_date,
            base_volatility,
            base_drift,
            seed
        );

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_csv_multi_header(data, output_file);

        analytics::ReturnStatistics engine(252);
        auto stats = engine.compute(data);
        stats.print_summary();
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nData generation complete.\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/efficient_frontier --data " << output_file << " --verbose\n";
    std::cout << std::endl;

    return 0;
}
