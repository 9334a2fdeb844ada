/**
 * @file price_history.hpp
 * @brief OHLC price bar history for a single symbol.
 *
 * Holds the bars returned by a price provider and exposes the high, low
 * and close columns as TimeSeries for the analytics stages.
 */

#ifndef PRICE_HISTORY_HPP
#define PRICE_HISTORY_HPP

#include "data/time_series.hpp"
#include <string>
#include <vector>

namespace sensitivity
{
    /**
     * @struct PriceBar
     * @brief One trading period of OHLC prices.
     *
     * Only high, low and close are consumed by the sensitivity pipeline.
     */
    struct PriceBar
    {
        std::string date; ///< Observation date (YYYY-MM-DD)
        Value open;       ///< Opening price
        Value high;       ///< Period high
        Value low;        ///< Period low
        Value close;      ///< Closing price
    };

    /**
     * @class PriceHistory
     * @brief Ordered bar history for one symbol.
     *
     * @note Bars are kept in strictly increasing date order; gaps
     *       (non-trading days) are allowed.
     */
    class PriceHistory
    {
    public:
        PriceHistory() = default;

        /**
         * @brief Constructor with bars.
         * @param symbol Ticker symbol.
         * @param bars Bars in strictly increasing date order.
         * @throws std::invalid_argument if dates are not strictly increasing.
         */
        PriceHistory(const std::string &symbol, const std::vector<PriceBar> &bars);

        ~PriceHistory() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const std::string &symbol() const
        {
            return symbol_;
        }

        const std::vector<PriceBar> &bars() const
        {
            return bars_;
        }

        size_t size() const
        {
            return bars_.size();
        }

        bool empty() const
        {
            return bars_.empty();
        }

        /**
         * @brief Dates of all bars.
         */
        std::vector<std::string> dates() const;

        /**
         * @brief High prices as a series.
         */
        TimeSeries highs() const;

        /**
         * @brief Low prices as a series.
         */
        TimeSeries lows() const;

        /**
         * @brief Close prices as a series.
         */
        TimeSeries closes() const;

        /** ===========================================
         *  Filtering Methods
         *  ===========================================
         */

        /**
         * @brief Restrict to bars with start_date <= date < end_date.
         * @param start_date Inclusive lower bound (empty = unbounded).
         * @param end_date Exclusive upper bound (empty = unbounded).
         * @return New PriceHistory with the filtered bars.
         */
        PriceHistory filter_by_date(const std::string &start_date,
                                    const std::string &end_date) const;

        /**
         * @brief Restrict to the given dates.
         * @param dates Increasing subset of this history's dates.
         * @return New PriceHistory containing only those dates.
         * @throws std::invalid_argument if a date is absent.
         */
        PriceHistory select_dates(const std::vector<std::string> &dates) const;

        /**
         * @brief Print summary statistics
         */
        void print_summary() const;

    private:
        template <typename Field>
        TimeSeries column(Field field) const;

        std::string symbol_;         ///< Ticker symbol
        std::vector<PriceBar> bars_; ///< Bars in date order
    };

} // namespace sensitivity

#endif // PRICE_HISTORY_HPP
