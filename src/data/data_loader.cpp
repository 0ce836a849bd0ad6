/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <random>
#include <sstream>

namespace frontier
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_file = j.value("data_file", config.data_file);
        config.close_field = j.value("close_field", config.close_field);
        config.tickers = j.value("tickers", std::vector<std::string>{});
        return config;
    }

    AnalysisConfig AnalysisConfig::from_json(const nlohmann::json &j)
    {
        AnalysisConfig config;
        config.trading_days = j.value("trading_days", config.trading_days);
        config.frontier_tolerance = j.value("frontier_tolerance", config.frontier_tolerance);
        return config;
    }

    void AnalysisConfig::validate() const
    {
        if (trading_days <= 0)
        {
            throw std::invalid_argument("trading_days must be positive, got: " +
                                        std::to_string(trading_days));
        }
        if (!(frontier_tolerance >= 0.0))
        {
            throw std::invalid_argument("frontier_tolerance must be non-negative");
        }
    }

    SamplerConfig SamplerConfig::from_json(const nlohmann::json &j)
    {
        SamplerConfig config;
        config.num_steps = j.value("num_steps", config.num_steps);
        config.num_threads = j.value("num_threads", config.num_threads);
        return config;
    }

    void SamplerConfig::validate() const
    {
        if (num_steps < 1)
        {
            throw std::invalid_argument("num_steps must be at least 1, got: " +
                                        std::to_string(num_steps));
        }
        if (num_threads < 1)
        {
            throw std::invalid_argument("num_threads must be at least 1, got: " +
                                        std::to_string(num_threads));
        }
    }

    OutputConfig OutputConfig::from_json(const nlohmann::json &j)
    {
        OutputConfig config;
        config.output_file = j.value("output_file", config.output_file);
        return config;
    }

    FrontierConfig FrontierConfig::from_json(const nlohmann::json &j)
    {
        FrontierConfig config;

        try
        {
            if (j.contains("data"))
            {
                config.data = DataConfig::from_json(j["data"]);
            }

            if (j.contains("analysis"))
            {
                config.analysis = AnalysisConfig::from_json(j["analysis"]);
            }

            if (j.contains("sampler"))
            {
                config.sampler = SamplerConfig::from_json(j["sampler"]);
            }

            if (j.contains("output"))
            {
                config.output = OutputConfig::from_json(j["output"]);
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration value: " + std::string(e.what()));
        }

        config.validate();
        return config;
    }

    FrontierConfig FrontierConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    void FrontierConfig::validate() const
    {
        if (data.close_field.empty())
        {
            throw std::invalid_argument("close_field cannot be empty");
        }
        analysis.validate();
        sampler.validate();
    }

    // ===========================
    // CSV Loading
    // ===========================

    LabeledTable DataLoader::read_csv(const std::string &filepath,
                                      const std::string &close_field)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        return parse_csv(file, close_field);
    }

    LabeledTable DataLoader::parse_csv(std::istream &input, const std::string &close_field)
    {
        std::vector<std::vector<std::string>> rows;
        std::string line;

        while (std::getline(input, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            for (auto &field : fields)
            {
                field = trim(field);
            }
            rows.push_back(fields);
        }

        if (rows.empty())
        {
            throw SchemaError("Empty CSV input");
        }

        const auto &header = rows[0];

        // Multi-level header: Price,<fields...> / Ticker,<tickers...> / Date,,,
        if (rows.size() >= 2 && to_lower(header[0]) == "price" &&
            to_lower(rows[1][0]) == "ticker")
        {
            return parse_multi_header(rows);
        }

        // Long format: date, ticker, price
        if (header.size() == 3 &&
            (to_lower(header[1]) == "ticker" || to_lower(header[1]) == "symbol"))
        {
            return parse_long(rows, close_field);
        }

        return parse_wide(rows, close_field);
    }

    LabeledTable DataLoader::parse_multi_header(const std::vector<std::vector<std::string>> &rows)
    {
        const auto &field_row = rows[0];
        const auto &ticker_row = rows[1];

        size_t first_data_row = 2;
        if (rows.size() > 2 && to_lower(rows[2][0]) == "date")
        {
            first_data_row = 3;
        }

        const size_t n_columns = field_row.size() - 1;

        std::vector<std::string> dates;
        std::vector<std::vector<std::string>> cells(n_columns);

        for (size_t r = first_data_row; r < rows.size(); ++r)
        {
            const auto &fields = rows[r];
            dates.push_back(fields[0]);

            for (size_t c = 0; c < n_columns; ++c)
            {
                cells[c].push_back(c + 1 < fields.size() ? fields[c + 1] : "");
            }
        }

        LabeledTable table(dates);
        for (size_t c = 0; c < n_columns; ++c)
        {
            ColumnLabel label;
            label.field = field_row[c + 1];
            label.ticker = c + 1 < ticker_row.size() ? ticker_row[c + 1] : "";
            table.add_column(label, cells[c]);
        }

        return table;
    }

    LabeledTable DataLoader::parse_wide(const std::vector<std::vector<std::string>> &rows,
                                        const std::string &close_field)
    {
        const auto &header = rows[0];
        if (header.empty() || to_lower(header[0]) != "date")
        {
            throw SchemaError("CSV must start with a 'date' column");
        }

        const size_t n_columns = header.size() - 1;

        std::vector<std::string> dates;
        std::vector<std::vector<std::string>> cells(n_columns);

        for (size_t r = 1; r < rows.size(); ++r)
        {
            const auto &fields = rows[r];
            dates.push_back(fields[0]);

            for (size_t c = 0; c < n_columns; ++c)
            {
                cells[c].push_back(c + 1 < fields.size() ? fields[c + 1] : "");
            }
        }

        LabeledTable table(dates);
        for (size_t c = 0; c < n_columns; ++c)
        {
            table.add_column(ColumnLabel{close_field, header[c + 1]}, cells[c]);
        }

        return table;
    }

    LabeledTable DataLoader::parse_long(const std::vector<std::vector<std::string>> &rows,
                                        const std::string &close_field)
    {
        std::vector<std::string> dates;
        std::vector<std::string> tickers;
        std::map<std::string, std::map<std::string, std::string>> data_map; // date -> ticker -> price

        for (size_t r = 1; r < rows.size(); ++r)
        {
            const auto &fields = rows[r];
            if (fields.size() < 3)
            {
                throw SchemaError("Long-format row " + std::to_string(r + 1) +
                                  " must have date, ticker and price");
            }

            const std::string &date = fields[0];
            const std::string &ticker = fields[1];

            if (!data_map.count(date))
            {
                dates.push_back(date);
            }
            if (std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
            {
                tickers.push_back(ticker);
            }

            if (!data_map[date].emplace(ticker, fields[2]).second)
            {
                throw ParseError("Duplicate observation for " + ticker + " on " + date);
            }
        }

        LabeledTable table(dates);
        for (const auto &ticker : tickers)
        {
            std::vector<std::string> cells;
            cells.reserve(dates.size());
            for (const auto &date : dates)
            {
                const auto &by_ticker = data_map[date];
                auto it = by_ticker.find(ticker);
                cells.push_back(it != by_ticker.end() ? it->second : "");
            }
            table.add_column(ColumnLabel{close_field, ticker}, cells);
        }

        return table;
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    FrontierConfig DataLoader::load_config(const std::string &config_path)
    {
        return FrontierConfig::from_json(load_json(config_path));
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PriceTable DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        std::uint32_t seed)
    {
        if (!(volatility > 0.0) || !std::isfinite(volatility))
        {
            throw std::invalid_argument("Synthetic volatility must be positive and finite");
        }
        if (!std::isfinite(drift))
        {
            throw std::invalid_argument("Synthetic drift must be finite");
        }
        if (num_days < 2)
        {
            throw std::invalid_argument("At least 2 days are required, got: " +
                                        std::to_string(num_days));
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        Eigen::MatrixXd prices(num_days, tickers.size());
        std::vector<CalendarDate> dates;
        dates.reserve(num_days);

        CalendarDate date = CalendarDate::parse(start_date);
        for (size_t i = 0; i < num_days; ++i)
        {
            dates.push_back(date);

            int y = date.year;
            int m = date.month;
            int d = date.day + 1;
            if (d > CalendarDate::days_in_month(y, m))
            {
                d = 1;
                if (++m > 12)
                {
                    m = 1;
                    ++y;
                }
            }
            date = CalendarDate(y, m, d);
        }

        // Generate prices (geometric random walk)
        for (size_t j = 0; j < tickers.size(); ++j)
        {
            prices(0, j) = 100.0;

            for (size_t i = 1; i < num_days; ++i)
            {
                double return_val = dist(gen);
                prices(i, j) = prices(i - 1, j) * (1.0 + return_val);
            }
        }

        return PriceTable(prices, dates, tickers);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_csv_multi_header(const PriceTable &data,
                                           const std::string &filepath,
                                           const std::string &close_field)
    {
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

        const auto &tickers = data.get_tickers();

        file << "Price";
        for (size_t j = 0; j < tickers.size(); ++j)
        {
            file << "," << close_field;
        }
        file << "\nTicker";
        for (const auto &ticker : tickers)
        {
            file << "," << ticker;
        }
        file << "\nDate";
        for (size_t j = 0; j < tickers.size(); ++j)
        {
            file << ",";
        }
        file << "\n";

        const auto &prices = data.get_prices();
        const auto &dates = data.get_dates();

        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i].to_string();
            for (Eigen::Index j = 0; j < prices.cols(); ++j)
            {
                file << ",";
                if (!std::isnan(prices(i, j)))
                {
                    file << std::fixed << std::setprecision(6) << prices(i, j);
                }
            }
            file << "\n";
        }
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string DataLoader::to_lower(const std::string &str)
    {
        std::string out = str;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return out;
    }

} // namespace frontier
