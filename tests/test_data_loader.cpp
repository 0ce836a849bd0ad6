/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader CSV parsing and configuration loading
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "data/price_loader.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace frontier;
using Catch::Matchers::WithinAbs;

namespace {

std::filesystem::path scratch_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("frontier_test_data_loader_" + name);
}

}

TEST_CASE("CSV with a multi-level header", "[DataLoader]") {
    std::istringstream csv(
        "Price,Close,Close,Close,High,High,High\n"
        "Ticker,AAA,BBB,CCC,AAA,BBB,CCC\n"
        "Date,,,,,,\n"
        "2024-01-02,100.0,50.0,20.0,101.0,51.0,21.0\n"
        "2024-01-03,101.0,,20.5,102.0,52.0,21.5\n"
        "\n"
        "2024-01-04,102.0,51.0,21.0,103.0,53.0,22.0\n");

    auto table = DataLoader::parse_csv(csv);

    REQUIRE(table.num_rows() == 3);
    REQUIRE(table.num_columns() == 6);
    REQUIRE(table.get_labels()[0].field == "Close");
    REQUIRE(table.get_labels()[0].ticker == "AAA");
    REQUIRE(table.get_labels()[4].field == "High");
    REQUIRE(table.get_labels()[4].ticker == "BBB");
    REQUIRE(table.get_dates()[2] == "2024-01-04");
    REQUIRE(table.fields() == std::vector<std::string>{"Close", "High"});

    SECTION("Close prices are extracted per ticker") {
        auto prices = PriceLoader().extract_close_prices(table);
        REQUIRE(prices.get_tickers() == std::vector<std::string>{"AAA", "BBB", "CCC"});
        REQUIRE_THAT(prices.get_prices()(2, 2), WithinAbs(21.0, 1e-12));
        REQUIRE(std::isnan(prices.get_prices()(1, 1)));
    }
}

TEST_CASE("CSV with a multi-level header and no Date row", "[DataLoader]") {
    std::istringstream csv(
        "Price,Close,Close\n"
        "Ticker,AAA,BBB\n"
        "2024-01-02,1.0,2.0\n"
        "2024-01-03,1.5,2.5\n");

    auto table = DataLoader::parse_csv(csv);
    REQUIRE(table.num_rows() == 2);
    REQUIRE(table.get_dates()[0] == "2024-01-02");
}

TEST_CASE("CSV in wide format", "[DataLoader]") {
    std::istringstream csv(
        "Date,AAA,BBB,CCC\r\n"
        "2024-01-02, 100.0 ,50.0,20.0\r\n"
        "2024-01-03,101.0,49.0,20.5\r\n");

    auto table = DataLoader::parse_csv(csv, "Adj Close");

    REQUIRE(table.num_rows() == 2);
    REQUIRE(table.num_columns() == 3);
    REQUIRE(table.get_labels()[1].field == "Adj Close");
    REQUIRE(table.get_labels()[1].ticker == "BBB");
    REQUIRE(table.get_column(0)[0] == "100.0");
}

TEST_CASE("CSV in long format", "[DataLoader]") {
    std::istringstream csv(
        "date,ticker,close\n"
        "2024-01-02,AAA,100.0\n"
        "2024-01-02,BBB,50.0\n"
        "2024-01-03,AAA,101.0\n"
        "2024-01-03,BBB,51.0\n"
        "2024-01-04,AAA,102.0\n");

    auto table = DataLoader::parse_csv(csv);

    REQUIRE(table.num_rows() == 3);
    REQUIRE(table.num_columns() == 2);
    REQUIRE(table.get_labels()[0].ticker == "AAA");
    REQUIRE(table.get_labels()[1].ticker == "BBB");
    REQUIRE(table.get_labels()[1].field == "Close");

    SECTION("Absent observations become empty cells") {
        REQUIRE(table.get_column(1)[2].empty());
    }

    SECTION("Duplicate observation") {
        std::istringstream dup(
            "date,symbol,close\n"
            "2024-01-02,AAA,100.0\n"
            "2024-01-02,AAA,100.5\n");
        REQUIRE_THROWS_AS(DataLoader::parse_csv(dup), ParseError);
    }

    SECTION("Short row") {
        std::istringstream short_row(
            "date,ticker,close\n"
            "2024-01-02,AAA\n");
        REQUIRE_THROWS_AS(DataLoader::parse_csv(short_row), SchemaError);
    }
}

TEST_CASE("CSV schema errors", "[DataLoader]") {
    SECTION("Empty input") {
        std::istringstream empty("");
        REQUIRE_THROWS_AS(DataLoader::parse_csv(empty), SchemaError);
    }

    SECTION("No date column") {
        std::istringstream csv("AAA,BBB\n1.0,2.0\n");
        REQUIRE_THROWS_AS(DataLoader::parse_csv(csv), SchemaError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::read_csv("nonexistent_prices.csv"), std::runtime_error);
    }
}

TEST_CASE("DataLoader synthetic data", "[DataLoader]") {
    std::vector<std::string> tickers = {"AAA", "BBB", "CCC"};

    auto data = DataLoader::generate_synthetic_data(tickers, 100, "2020-02-27");

    REQUIRE(data.num_dates() == 100);
    REQUIRE(data.num_assets() == 3);
    REQUIRE(data.is_valid());
    REQUIRE(data.get_dates()[2] == CalendarDate(2020, 2, 29));
    REQUIRE(data.get_dates()[3] == CalendarDate(2020, 3, 1));

    SECTION("Same seed, same prices") {
        auto again = DataLoader::generate_synthetic_data(tickers, 100, "2020-02-27");
        REQUIRE(again.get_prices() == data.get_prices());
    }

    SECTION("Invalid generator parameters") {
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_data(tickers, 100, "2020-01-01", -1.0),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_data(tickers, 100, "2020-01-01", 0.0),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_data(tickers, 1, "2020-01-01"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_data(tickers, 0, "2020-01-01"),
                          std::invalid_argument);
    }
}

TEST_CASE("Multi-header CSV export reloads", "[DataLoader]") {
    auto dir = scratch_path("export");
    std::filesystem::remove_all(dir);
    auto file = dir / "nested" / "prices.csv";

    auto data = DataLoader::generate_synthetic_data({"AAA", "BBB", "CCC"}, 10, "2024-01-01");
    DataLoader::save_csv_multi_header(data, file.string());

    auto table = DataLoader::read_csv(file.string());
    auto reloaded = PriceLoader().extract_close_prices(table);

    REQUIRE(reloaded.get_tickers() == data.get_tickers());
    REQUIRE(reloaded.get_dates() == data.get_dates());
    REQUIRE(reloaded.get_prices().isApprox(data.get_prices(), 1e-6));

    std::filesystem::remove_all(dir);
}

TEST_CASE("JSON configuration loading", "[DataLoader]") {
    SECTION("Defaults") {
        FrontierConfig config;
        REQUIRE(config.data.data_file == "temp.csv");
        REQUIRE(config.data.close_field == "Close");
        REQUIRE(config.analysis.trading_days == 252);
        REQUIRE(config.sampler.num_steps == 101);
        REQUIRE(config.sampler.num_threads == 1);
        REQUIRE(config.output.output_file == "web/data/efficient_frontier.json");
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Partial document keeps defaults") {
        auto j = nlohmann::json::parse(R"({
            "data": {"data_file": "prices.csv", "tickers": ["AAA", "BBB", "CCC"]},
            "sampler": {"num_steps": 21}
        })");

        auto config = FrontierConfig::from_json(j);
        REQUIRE(config.data.data_file == "prices.csv");
        REQUIRE(config.data.tickers.size() == 3);
        REQUIRE(config.data.close_field == "Close");
        REQUIRE(config.sampler.num_steps == 21);
        REQUIRE(config.sampler.num_threads == 1);
        REQUIRE(config.analysis.trading_days == 252);
    }

    SECTION("Invalid values") {
        REQUIRE_THROWS_AS(FrontierConfig::from_json(nlohmann::json::parse(
                              R"({"sampler": {"num_steps": 0}})")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(FrontierConfig::from_json(nlohmann::json::parse(
                              R"({"analysis": {"trading_days": -5}})")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(FrontierConfig::from_json(nlohmann::json::parse(
                              R"({"sampler": {"num_steps": "many"}})")),
                          std::invalid_argument);
    }

    SECTION("Load from file") {
        auto path = scratch_path("config.json");
        {
            std::ofstream out(path);
            out << R"({"analysis": {"trading_days": 260}, "output": {"output_file": "out.json"}})";
        }

        auto config = DataLoader::load_config(path.string());
        REQUIRE(config.analysis.trading_days == 260);
        REQUIRE(config.output.output_file == "out.json");

        std::filesystem::remove(path);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS(DataLoader::load_config("nonexistent_config.json"));
    }

    SECTION("Malformed file") {
        auto path = scratch_path("broken.json");
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        REQUIRE_THROWS_AS(DataLoader::load_config(path.string()), std::runtime_error);
        std::filesystem::remove(path);
    }
}
