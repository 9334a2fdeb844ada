/**
 * @file volatility_adjusted_ratio.cpp
 * @brief Implementation of VolatilityAdjustedRatioEngine.
 */

#include "analytics/volatility_adjusted_ratio.hpp"

#include <stdexcept>

namespace sensitivity
{
    namespace analytics
    {

        VolatilityAdjustedRatioEngine::VolatilityAdjustedRatioEngine(int window)
            : volatility_(window), ratio_engine_(window)
        {
        }

        TimeSeries VolatilityAdjustedRatioEngine::compute(const TimeSeries &returns,
                                                          const TimeSeries &high,
                                                          const TimeSeries &low,
                                                          const TimeSeries &close) const
        {
            return compute(returns, volatility_.compute(high, low, close));
        }

        TimeSeries VolatilityAdjustedRatioEngine::compute(const TimeSeries &returns,
                                                          const TimeSeries &average_true_range) const
        {
            return ratio_engine_.compute(adjust_returns(returns, average_true_range));
        }

        TimeSeries VolatilityAdjustedRatioEngine::adjust_returns(const TimeSeries &returns,
                                                                 const TimeSeries &average_true_range)
        {
            if (!returns.same_index(average_true_range))
            {
                throw std::invalid_argument(
                    "Return series and average true range must share the same dates");
            }

            TimeSeries adjusted(returns.dates());
            for (size_t t = 0; t < returns.size(); ++t)
            {
                const Value &r = returns[t];
                const Value &atr = average_true_range[t];
                if (!r || !atr || *atr == 0.0)
                {
                    continue;
                }
                adjusted.set(t, *r / *atr);
            }

            return adjusted;
        }

    } // namespace analytics
} // namespace sensitivity
