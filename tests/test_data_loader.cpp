/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader, AnalysisConfig and the price providers
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "data/price_provider.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>

using namespace sensitivity;
using Catch::Matchers::WithinAbs;

namespace
{
    std::filesystem::path scratch_dir(const std::string &name)
    {
        auto dir = std::filesystem::temp_directory_path() / ("sensitivity_tests_" + name);
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream file(path);
        file << content;
    }
} // namespace

TEST_CASE("Load OHLC CSV", "[DataLoader]") {
    auto dir = scratch_dir("load_csv");
    auto path = dir / "ETH-USD.csv";

    // Out of order rows, mixed-case header, timestamp dates, a bad row,
    // a row without close and an extra volume column
    write_file(path,
               "Date,Open,High,Low,Close,Volume\n"
               "2020-01-03 00:00:00+00:00,102,104,101,103,900\n"
               "2020-01-01 00:00:00+00:00,100,101,99,100.5,1000\n"
               "not-a-date,1,1,1,1,1\n"
               "2020-01-02,100.5,,99.5,,800\n"
               "2020-01-04,103,105,102,104,700\n"
               "\n");

    auto history = DataLoader::load_price_csv(path.string(), "ETH-USD");

    REQUIRE(history.symbol() == "ETH-USD");
    REQUIRE(history.size() == 3);
    REQUIRE(history.dates() == std::vector<std::string>{"2020-01-01", "2020-01-03", "2020-01-04"});
    REQUIRE_THAT(*history.bars()[0].close, WithinAbs(100.5, 1e-12));
    REQUIRE_THAT(*history.bars()[1].high, WithinAbs(104.0, 1e-12));
    REQUIRE_THAT(*history.bars()[2].low, WithinAbs(102.0, 1e-12));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Load CSV failures", "[DataLoader]") {
    auto dir = scratch_dir("load_failures");

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_price_csv((dir / "nope.csv").string(), "X"),
                          std::runtime_error);
    }

    SECTION("Missing required column") {
        auto path = dir / "no_low.csv";
        write_file(path, "date,open,high,close\n2020-01-01,1,2,1.5\n");
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(path.string(), "X"), std::runtime_error);
    }

    SECTION("Duplicate dates") {
        auto path = dir / "dup.csv";
        write_file(path,
                   "date,high,low,close\n"
                   "2020-01-01,2,1,1.5\n"
                   "2020-01-01,2,1,1.6\n");
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(path.string(), "X"), std::runtime_error);
    }

    SECTION("No valid rows") {
        auto path = dir / "empty.csv";
        write_file(path, "date,high,low,close\n");
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(path.string(), "X"), std::runtime_error);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Save and reload a synthetic history", "[DataLoader]") {
    auto dir = scratch_dir("save_reload");
    auto path = (dir / "SYN.csv").string();

    auto history = DataLoader::generate_synthetic_history("SYN", 60, "2021-03-01", 0.02, 0.0005, 11);
    REQUIRE(history.size() == 60);
    REQUIRE(history.dates().front() == "2021-03-01");
    REQUIRE(history.dates()[31] == "2021-04-01");

    for (const auto &bar : history.bars())
    {
        REQUIRE(*bar.high >= *bar.close);
        REQUIRE(*bar.low <= *bar.close);
        REQUIRE(*bar.low > 0.0);
    }

    DataLoader::save_price_csv(history, path);
    auto reloaded = DataLoader::load_price_csv(path, "SYN");

    REQUIRE(reloaded.dates() == history.dates());
    for (size_t i = 0; i < history.size(); ++i)
    {
        REQUIRE_THAT(*reloaded.bars()[i].close, WithinAbs(*history.bars()[i].close, 1e-6));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Synthetic history follows the factor", "[DataLoader]") {
    std::vector<double> factor(100, 0.0);
    for (size_t i = 1; i < factor.size(); ++i)
    {
        factor[i] = (i % 2 == 0) ? 0.02 : -0.02;
    }

    auto a = DataLoader::generate_synthetic_history("A", 100, "2020-01-01", 0.001, 0.0, 3, factor, 1.0);
    auto b = DataLoader::generate_synthetic_history("A", 100, "2020-01-01", 0.001, 0.0, 3, factor, 1.0);
    REQUIRE(*a.bars().back().close == *b.bars().back().close);

    REQUIRE_THROWS_AS(DataLoader::generate_synthetic_history("A", 50, "2020-01-01", 0.01, 0.0, 3, factor, 1.0),
                      std::invalid_argument);
}

TEST_CASE("Configuration parsing", "[Config]") {
    SECTION("Defaults") {
        auto config = DataLoader::config_from_json(nlohmann::json::object());
        REQUIRE(config.data.data_dir == "data/market");
        REQUIRE(config.data.market_symbol == "BTC-USD");
        REQUIRE(config.data.symbols.empty());
        REQUIRE(config.analysis.window == 30);
        REQUIRE(config.smoothing.enabled);
        REQUIRE(config.smoothing.window_length == 21);
        REQUIRE(config.smoothing.polyorder == 3);
        REQUIRE(config.output.directory == "results");
        REQUIRE(config.output.export_csv);
    }

    SECTION("Explicit values") {
        nlohmann::json j = {
            {"data", {{"symbols", {"SOL-USD", "DOGE-USD"}}, {"market_symbol", "ETH-USD"}}},
            {"analysis", {{"window", 60}}},
            {"smoothing", {{"enabled", false}}},
            {"output", {{"directory", "out"}, {"export_csv", false}}}};

        auto config = DataLoader::config_from_json(j);
        REQUIRE(config.data.symbols == std::vector<std::string>{"SOL-USD", "DOGE-USD"});
        REQUIRE(config.data.market_symbol == "ETH-USD");
        REQUIRE(config.data.start_date == "2020-01-01");
        REQUIRE(config.analysis.window == 60);
        REQUIRE_FALSE(config.smoothing.enabled);
        REQUIRE(config.output.directory == "out");
        REQUIRE_FALSE(config.output.export_csv);
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Wrong value type") {
        nlohmann::json j = {{"analysis", {{"window", "thirty"}}}};
        REQUIRE_THROWS_AS(DataLoader::config_from_json(j), std::runtime_error);
    }

    SECTION("Load from file") {
        auto dir = scratch_dir("config");
        auto path = dir / "config.json";
        write_file(path, R"({"data": {"symbols": ["PEPE-USD"]}, "analysis": {"window": 45}})");

        auto config = AnalysisConfig::load_from_file(path.string());
        REQUIRE(config.data.symbols.size() == 1);
        REQUIRE(config.analysis.window == 45);

        write_file(path, "{ not json");
        REQUIRE_THROWS_AS(DataLoader::load_json(path.string()), std::runtime_error);
        REQUIRE_THROWS_AS(DataLoader::load_json((dir / "missing.json").string()), std::runtime_error);

        std::filesystem::remove_all(dir);
    }
}

TEST_CASE("Configuration validation", "[Config]") {
    AnalysisConfig config;
    config.data.symbols = {"SOL-USD"};
    REQUIRE_NOTHROW(config.validate());

    SECTION("Non-positive window") {
        config.analysis.window = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("No symbols") {
        config.data.symbols.clear();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Empty market symbol") {
        config.data.market_symbol.clear();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Inverted date range") {
        config.data.start_date = "2024-01-01";
        config.data.end_date = "2023-01-01";
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Even smoothing window") {
        config.smoothing.window_length = 20;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

        config.smoothing.enabled = false;
        REQUIRE_NOTHROW(config.validate());
    }
}

TEST_CASE("CsvPriceProvider", "[PriceProvider]") {
    auto dir = scratch_dir("provider");
    auto history = DataLoader::generate_synthetic_history("SOL-USD", 40, "2020-01-01");
    DataLoader::save_price_csv(history, (dir / "SOL-USD.csv").string());

    CsvPriceProvider provider(dir.string());
    REQUIRE(provider.path_for("SOL-USD") == (dir / "SOL-USD.csv").string());

    SECTION("Date range is half-open") {
        auto fetched = provider.fetch("SOL-USD", "2020-01-05", "2020-01-15");
        REQUIRE(fetched.size() == 10);
        REQUIRE(fetched.dates().front() == "2020-01-05");
        REQUIRE(fetched.dates().back() == "2020-01-14");
    }

    SECTION("Unknown symbol") {
        REQUIRE_THROWS_AS(provider.fetch("NOPE-USD", "2020-01-01", "2021-01-01"), std::runtime_error);
    }

    SECTION("Empty range") {
        REQUIRE_THROWS_AS(provider.fetch("SOL-USD", "2019-01-01", "2019-06-01"), std::runtime_error);
    }

    REQUIRE_THROWS_AS(CsvPriceProvider(""), std::invalid_argument);

    std::filesystem::remove_all(dir);
}

TEST_CASE("InMemoryPriceProvider", "[PriceProvider]") {
    InMemoryPriceProvider provider;
    provider.add(test::make_history("AAA", {1.0, 2.0, 3.0, 4.0}));

    auto fetched = provider.fetch("AAA", "", "");
    REQUIRE(fetched.size() == 4);
    REQUIRE(provider.get_name() == "InMemoryPriceProvider");
    REQUIRE_THROWS_AS(provider.fetch("BBB", "", ""), std::runtime_error);
}
