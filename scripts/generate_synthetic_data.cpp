/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic OHLC price files for the sensitivity analyzer
 */

#include "data/data_loader.hpp"
#include "data/price_history.hpp"
#include "analytics/returns_transform.hpp"
#include <filesystem>
#include <iostream>
#include <iomanip>

using namespace sensitivity;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    // Assets with different loadings on the market factor
    struct AssetSpec {
        std::string symbol;
        double beta;
        double volatility;
        double drift;
    };
    std::vector<AssetSpec> assets = {
        {"SOL-USD",  1.4, 0.030, 0.0008},   // High beta
        {"DOGE-USD", 1.1, 0.045, 0.0004},   // Noisy
        {"PEPE-USD", 0.6, 0.060, 0.0010}    // Weakly linked
    };
    std::string market_symbol = "BTC-USD";

    size_t num_days = 1461;                 // 2020-01-01 .. 2023-12-31
    std::string start_date = "2020-01-01";
    std::string output_dir = "data/market";
    unsigned int seed = 7;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            num_days = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output DIR       Output directory (default: data/market)\n"
                      << "  --days N           Number of daily bars (default: 1461)\n"
                      << "  --seed N           Random seed (default: 7)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    std::filesystem::create_directories(output_dir);

    std::cout << "Generating " << num_days << " daily bars from " << start_date << std::endl;

    // Market leg first; its returns drive the factor of every asset
    auto market = DataLoader::generate_synthetic_history(
        market_symbol, num_days, start_date, 0.035, 0.0006, seed);
    auto market_returns = analytics::ReturnsTransform::compute(market.closes());

    std::vector<double> factor(num_days, 0.0);
    for (size_t i = 0; i < num_days; ++i) {
        if (market_returns[i]) {
            factor[i] = *market_returns[i];
        }
    }

    auto save = [&output_dir](const PriceHistory& history) {
        std::string path = (std::filesystem::path(output_dir) / (history.symbol() + ".csv")).string();
        DataLoader::save_price_csv(history, path);
        std::cout << "  Saved " << path << std::endl;
    };

    save(market);
    for (size_t k = 0; k < assets.size(); ++k) {
        const auto& spec = assets[k];
        auto history = DataLoader::generate_synthetic_history(
            spec.symbol, num_days, start_date, spec.volatility, spec.drift,
            seed + static_cast<unsigned int>(k) + 1, factor, spec.beta);
        save(history);
    }

    std::cout << "\n=== Generated Data Summary ===\n";
    std::cout << std::setw(10) << "Symbol" << std::setw(10) << "Beta"
              << std::setw(14) << "Last Close" << "\n";
    std::cout << std::string(34, '-') << "\n";
    std::cout << std::setw(10) << market_symbol << std::setw(10) << "-"
              << std::setw(14) << std::fixed << std::setprecision(2)
              << *market.bars().back().close << "\n";
    for (const auto& spec : assets) {
        std::cout << std::setw(10) << spec.symbol << std::setw(10) << std::setprecision(2) << spec.beta << "\n";
    }

    std::cout << "\nData generation complete!\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/bin/regime_sensitivity --config data/config/analysis_config.json --verbose\n";
    std::cout << std::endl;

    return 0;
}
