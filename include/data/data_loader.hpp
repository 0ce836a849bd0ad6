/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to read price history from CSV files into a
 * LabeledTable and to load run configuration from JSON files.
 */

#ifndef FRONTIER_DATA_DATA_LOADER_HPP
#define FRONTIER_DATA_DATA_LOADER_HPP

#include "data/labeled_table.hpp"
#include "data/price_table.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace frontier {

/**
 * @struct DataConfig
 * @brief Configuration parameters for data loading
 */
struct DataConfig {
    std::string data_file = "temp.csv";        ///< Path to price CSV file
    std::string close_field = "Close";         ///< Field label of closing prices
    std::vector<std::string> tickers;          ///< Tickers to analyze (all if empty)

    /**
     * @brief Load from JSON object
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AnalysisConfig
 * @brief Statistics and frontier parameters
 */
struct AnalysisConfig {
    int trading_days = 252;                    ///< Trading days per year for annualization
    double frontier_tolerance = 1e-12;         ///< Near-tie tolerance for frontier extraction

    static AnalysisConfig from_json(const nlohmann::json& j);

    /**
     * @throws std::invalid_argument if trading_days <= 0 or tolerance < 0
     */
    void validate() const;
};

/**
 * @struct SamplerConfig
 * @brief Weight grid resolution and evaluation parallelism
 */
struct SamplerConfig {
    int num_steps = 101;                       ///< Grid points per weight axis in [0, 1]
    int num_threads = 1;                       ///< Worker threads for portfolio evaluation

    static SamplerConfig from_json(const nlohmann::json& j);

    /**
     * @throws std::invalid_argument if num_steps < 1 or num_threads < 1
     */
    void validate() const;
};

/**
 * @struct OutputConfig
 * @brief Output dataset location
 */
struct OutputConfig {
    std::string output_file = "web/data/efficient_frontier.json";

    static OutputConfig from_json(const nlohmann::json& j);
};

/**
 * @struct FrontierConfig
 * @brief Complete run configuration
 */
struct FrontierConfig {
    DataConfig data;
    AnalysisConfig analysis;
    SamplerConfig sampler;
    OutputConfig output;

    /**
     * @brief Build from a parsed JSON document; missing sections keep defaults
     */
    static FrontierConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load complete configuration from JSON file
     */
    static FrontierConfig load_from_file(const std::string& config_path);

    /**
     * @brief Validate all sections
     * @throws std::invalid_argument on the first invalid value
     */
    void validate() const;
};

/**
 * @class DataLoader
 * @brief Reads price history from CSV files
 *
 * Supports three CSV layouts, detected from the header:
 * - Multi-level header (field row, ticker row, date row):
 *   Price,Close,Close,High,High
 *   Ticker,AAPL,MSFT,AAPL,MSFT
 *   Date,,,,
 *   2020-01-02,75.1,160.6,75.2,160.7
 * - Wide format: date,AAPL,MSFT,... (every column is a closing price)
 * - Long format: date,ticker,price
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Read a CSV file, auto-detecting its layout
     * @param filepath Path to CSV file
     * @param close_field Field label given to wide and long format columns
     * @return Raw labeled table
     * @throws std::runtime_error if file cannot be opened
     * @throws SchemaError if the header is missing or unrecognized
     */
    static LabeledTable read_csv(const std::string& filepath,
                                 const std::string& close_field = "Close");

    /**
     * @brief Parse CSV text from a stream, auto-detecting its layout
     */
    static LabeledTable parse_csv(std::istream& input,
                                  const std::string& close_field = "Close");

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @param filepath Path to JSON file
     * @return JSON object
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete run configuration
     */
    static FrontierConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate synthetic closing prices
     *
     * Prices follow a geometric random walk starting at 100. The generator is
     * seeded so the same arguments always produce the same table.
     *
     * @param tickers List of ticker symbols
     * @param num_days Number of consecutive calendar days
     * @param start_date First date
     * @param volatility Daily volatility (default 0.02)
     * @param drift Daily drift (default 0.0005)
     * @param seed Random seed
     * @throws std::invalid_argument if volatility <= 0, drift is not finite,
     *         or num_days < 2
     */
    static PriceTable generate_synthetic_data(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        std::uint32_t seed = 42
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Save closing prices with a multi-level (Price/Ticker/Date) header
     * @param data Price table
     * @param filepath Output file path
     * @param close_field Field label written in the first header row
     */
    static void save_csv_multi_header(const PriceTable& data,
                                      const std::string& filepath,
                                      const std::string& close_field = "Close");

private:
    // ========================
    // Private Helper Methods
    // ========================

    static LabeledTable parse_multi_header(const std::vector<std::vector<std::string>>& rows);

    static LabeledTable parse_wide(const std::vector<std::vector<std::string>>& rows,
                                   const std::string& close_field);

    static LabeledTable parse_long(const std::vector<std::vector<std::string>>& rows,
                                   const std::string& close_field);

    /**
     * @brief Parse CSV line into tokens
     */
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Trim whitespace from string
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Lower-case copy of a string
     */
    static std::string to_lower(const std::string& str);
};

} // namespace frontier

#endif // FRONTIER_DATA_DATA_LOADER_HPP
