/**
 * @file price_provider.cpp
 * @brief Implementation of the CSV and in-memory price providers
 */

#include "data/price_provider.hpp"
#include "data/data_loader.hpp"
#include <filesystem>
#include <stdexcept>

namespace sensitivity
{

    namespace
    {
        PriceHistory restrict_to_range(const PriceHistory &history,
                                       const std::string &start_date,
                                       const std::string &end_date)
        {
            auto filtered = history.filter_by_date(start_date, end_date);
            if (filtered.empty())
            {
                throw std::runtime_error(
                    "No price data for " + history.symbol() + " in range [" + start_date + ", " + end_date + ")");
            }
            return filtered;
        }
    } // namespace

    // ============================================================================
    // CsvPriceProvider
    // ============================================================================

    CsvPriceProvider::CsvPriceProvider(const std::string &data_dir)
        : data_dir_(data_dir)
    {
        if (data_dir_.empty())
        {
            throw std::invalid_argument("Data directory cannot be empty");
        }
    }

    std::string CsvPriceProvider::path_for(const std::string &symbol) const
    {
        return (std::filesystem::path(data_dir_) / (symbol + ".csv")).string();
    }

    PriceHistory CsvPriceProvider::fetch(const std::string &symbol,
                                         const std::string &start_date,
                                         const std::string &end_date) const
    {
        std::string path = path_for(symbol);
        if (!std::filesystem::exists(path))
        {
            throw std::runtime_error("No price file for symbol " + symbol + ": " + path);
        }

        return restrict_to_range(DataLoader::load_price_csv(path, symbol),
                                 start_date, end_date);
    }

    // ============================================================================
    // InMemoryPriceProvider
    // ============================================================================

    void InMemoryPriceProvider::add(const PriceHistory &history)
    {
        histories_[history.symbol()] = history;
    }

    PriceHistory InMemoryPriceProvider::fetch(const std::string &symbol,
                                              const std::string &start_date,
                                              const std::string &end_date) const
    {
        auto it = histories_.find(symbol);
        if (it == histories_.end())
        {
            throw std::runtime_error("Unknown symbol: " + symbol);
        }

        return restrict_to_range(it->second, start_date, end_date);
    }

} // namespace sensitivity
