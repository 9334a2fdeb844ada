/**
 * @file true_range_volatility.cpp
 * @brief Implementation of TrueRangeVolatility.
 *
 * The rolling mean is computed per window directly rather than with a
 * running sum, so a window's result does not depend on values that have
 * already left it.
 */

#include "analytics/true_range_volatility.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sensitivity
{
    namespace analytics
    {

        TrueRangeVolatility::TrueRangeVolatility(int window)
            : window_(window)
        {
            if (window_ < 1)
            {
                throw std::invalid_argument(
                    "Expected window >= 1 for true range volatility, got: " + std::to_string(window_));
            }
        }

        TimeSeries TrueRangeVolatility::true_range(const TimeSeries &high,
                                                   const TimeSeries &low,
                                                   const TimeSeries &close)
        {
            if (!high.same_index(low) || !high.same_index(close))
            {
                throw std::invalid_argument("High, low and close series must share the same dates");
            }

            TimeSeries result(high.dates());

            for (size_t t = 0; t < high.size(); ++t)
            {
                if (!high[t] || !low[t])
                {
                    continue;
                }

                double tr = *high[t] - *low[t];
                if (t > 0 && close[t - 1])
                {
                    double prev_close = *close[t - 1];
                    tr = std::max({tr,
                                   std::abs(*high[t] - prev_close),
                                   std::abs(*low[t] - prev_close)});
                }
                result.set(t, tr);
            }

            return result;
        }

        TimeSeries TrueRangeVolatility::compute(const TimeSeries &high,
                                                const TimeSeries &low,
                                                const TimeSeries &close) const
        {
            return average(true_range(high, low, close));
        }

        TimeSeries TrueRangeVolatility::average(const TimeSeries &true_range) const
        {
            TimeSeries result(true_range.dates());
            const size_t n = true_range.size();
            const size_t w = static_cast<size_t>(window_);

            for (size_t i = w - 1; i < n; ++i)
            {
                double sum = 0.0;
                bool complete = true;
                for (size_t k = i + 1 - w; k <= i; ++k)
                {
                    if (!true_range[k])
                    {
                        complete = false;
                        break;
                    }
                    sum += *true_range[k];
                }
                if (complete)
                {
                    result.set(i, sum / static_cast<double>(w));
                }
            }

            return result;
        }

    } // namespace analytics
} // namespace sensitivity
