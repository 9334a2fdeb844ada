/**
 * @file price_history.cpp
 * @brief Implementation of PriceHistory class
 */

#include "data/price_history.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace sensitivity
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PriceHistory::PriceHistory(const std::string &symbol, const std::vector<PriceBar> &bars)
        : symbol_(symbol), bars_(bars)
    {
        for (size_t i = 1; i < bars_.size(); ++i)
        {
            if (!(bars_[i - 1].date < bars_[i].date))
            {
                throw std::invalid_argument(
                    "Bars for " + symbol_ + " must have strictly increasing dates: " + bars_[i - 1].date + " then " + bars_[i].date);
            }
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    std::vector<std::string> PriceHistory::dates() const
    {
        std::vector<std::string> out;
        out.reserve(bars_.size());
        for (const auto &bar : bars_)
        {
            out.push_back(bar.date);
        }
        return out;
    }

    template <typename Field>
    TimeSeries PriceHistory::column(Field field) const
    {
        std::vector<Value> values;
        values.reserve(bars_.size());
        for (const auto &bar : bars_)
        {
            values.push_back(bar.*field);
        }
        return TimeSeries(dates(), values);
    }

    TimeSeries PriceHistory::highs() const
    {
        return column(&PriceBar::high);
    }

    TimeSeries PriceHistory::lows() const
    {
        return column(&PriceBar::low);
    }

    TimeSeries PriceHistory::closes() const
    {
        return column(&PriceBar::close);
    }

    // ============================================================================
    // Filtering Methods
    // ============================================================================

    PriceHistory PriceHistory::filter_by_date(const std::string &start_date,
                                              const std::string &end_date) const
    {
        std::vector<PriceBar> kept;
        for (const auto &bar : bars_)
        {
            if (!start_date.empty() && bar.date < start_date)
            {
                continue;
            }
            if (!end_date.empty() && !(bar.date < end_date))
            {
                continue;
            }
            kept.push_back(bar);
        }
        return PriceHistory(symbol_, kept);
    }

    PriceHistory PriceHistory::select_dates(const std::vector<std::string> &dates) const
    {
        std::vector<PriceBar> kept;
        kept.reserve(dates.size());

        size_t j = 0;
        for (const auto &d : dates)
        {
            while (j < bars_.size() && bars_[j].date < d)
            {
                ++j;
            }
            if (j == bars_.size() || bars_[j].date != d)
            {
                throw std::invalid_argument("Date not found in " + symbol_ + " history: " + d);
            }
            kept.push_back(bars_[j]);
        }

        return PriceHistory(symbol_, kept);
    }

    void PriceHistory::print_summary() const
    {
        std::cout << "\n=== Price History: " << symbol_ << " ===\n";
        std::cout << "Bars: " << bars_.size() << "\n";

        if (bars_.empty())
        {
            return;
        }

        std::cout << "Date range: " << bars_.front().date << " to "
                  << bars_.back().date << "\n";

        auto close = closes();
        auto first = close.first_valid();
        auto mean = close.mean();
        std::cout << std::fixed << std::setprecision(4);
        if (first)
        {
            std::cout << "First close: " << *first << "\n";
        }
        if (bars_.back().close)
        {
            std::cout << "Last close:  " << *bars_.back().close << "\n";
        }
        if (mean)
        {
            std::cout << "Mean close:  " << *mean << "\n";
        }
        std::cout << "Missing closes: " << close.count_missing() << "\n";
    }

} // namespace sensitivity
