/**
 * @file price_provider.hpp
 * @brief Abstract source of historical price bars.
 *
 * The sensitivity pipeline never fetches data itself; it consumes a
 * PriceProvider. CsvPriceProvider reads one CSV file per symbol, and
 * InMemoryPriceProvider serves histories held in memory (synthetic data,
 * tests, callers that fetched data elsewhere).
 */

#ifndef PRICE_PROVIDER_HPP
#define PRICE_PROVIDER_HPP

#include "data/price_history.hpp"
#include <map>
#include <string>

namespace sensitivity
{
    /**
     * @class PriceProvider
     * @brief Interface for historical price retrieval.
     */
    class PriceProvider
    {
    public:
        virtual ~PriceProvider() = default;

        /**
         * @brief Fetch bars for a symbol over [start_date, end_date).
         * @param symbol Ticker symbol.
         * @param start_date Inclusive start (empty = unbounded).
         * @param end_date Exclusive end (empty = unbounded).
         * @return History in increasing date order, possibly with gaps.
         * @throws std::runtime_error if the symbol cannot be retrieved or
         *         no bars fall inside the range.
         */
        virtual PriceHistory fetch(const std::string &symbol,
                                   const std::string &start_date,
                                   const std::string &end_date) const = 0;

        /**
         * @brief Provider name for diagnostics.
         */
        virtual std::string get_name() const = 0;
    };

    /**
     * @class CsvPriceProvider
     * @brief Reads <data_dir>/<SYMBOL>.csv price files.
     */
    class CsvPriceProvider : public PriceProvider
    {
    public:
        explicit CsvPriceProvider(const std::string &data_dir);

        PriceHistory fetch(const std::string &symbol,
                           const std::string &start_date,
                           const std::string &end_date) const override;

        std::string get_name() const override
        {
            return "CsvPriceProvider(" + data_dir_ + ")";
        }

        /**
         * @brief Path of the file backing a symbol.
         */
        std::string path_for(const std::string &symbol) const;

    private:
        std::string data_dir_;
    };

    /**
     * @class InMemoryPriceProvider
     * @brief Serves pre-loaded histories keyed by symbol.
     */
    class InMemoryPriceProvider : public PriceProvider
    {
    public:
        InMemoryPriceProvider() = default;

        /**
         * @brief Register (or replace) the history for its symbol.
         */
        void add(const PriceHistory &history);

        PriceHistory fetch(const std::string &symbol,
                           const std::string &start_date,
                           const std::string &end_date) const override;

        std::string get_name() const override
        {
            return "InMemoryPriceProvider";
        }

    private:
        std::map<std::string, PriceHistory> histories_;
    };

} // namespace sensitivity

#endif // PRICE_PROVIDER_HPP
