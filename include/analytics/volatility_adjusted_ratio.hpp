/**
 * @file volatility_adjusted_ratio.hpp
 * @brief Performance ratio computed on ATR-normalized returns.
 *
 *   adjusted[t] = returns[t] / ATR[t]
 *   result      = PerformanceRatioEngine(window).compute(adjusted)
 *
 * ATR uses the same window as the ratio. Where ATR is zero or missing the
 * adjusted return is missing, which in turn makes every ratio window that
 * contains it missing.
 */

#ifndef SENSITIVITY_ANALYTICS_VOLATILITY_ADJUSTED_RATIO_HPP
#define SENSITIVITY_ANALYTICS_VOLATILITY_ADJUSTED_RATIO_HPP

#include "analytics/performance_ratio.hpp"
#include "analytics/true_range_volatility.hpp"
#include "data/time_series.hpp"

namespace sensitivity
{
    namespace analytics
    {

        /**
         * @class VolatilityAdjustedRatioEngine
         * @brief Volatility-normalized performance ratio.
         */
        class VolatilityAdjustedRatioEngine
        {
        public:
            /**
             * @brief Construct with a rolling window.
             * @param window Window for both ATR and the ratio (default 90).
             * @throws std::invalid_argument If window < 1.
             */
            explicit VolatilityAdjustedRatioEngine(int window = 90);

            /**
             * @brief Compute from returns and raw high/low/close prices.
             * @throws std::invalid_argument If the series do not share an index.
             */
            TimeSeries compute(const TimeSeries &returns,
                               const TimeSeries &high,
                               const TimeSeries &low,
                               const TimeSeries &close) const;

            /**
             * @brief Compute from returns and a precomputed ATR series.
             * @throws std::invalid_argument If the series do not share an index.
             */
            TimeSeries compute(const TimeSeries &returns,
                               const TimeSeries &average_true_range) const;

            /**
             * @brief Returns divided by ATR, missing where ATR is zero or missing.
             * @throws std::invalid_argument If the series do not share an index.
             */
            static TimeSeries adjust_returns(const TimeSeries &returns,
                                             const TimeSeries &average_true_range);

            int window() const
            {
                return ratio_engine_.window();
            }

        private:
            TrueRangeVolatility volatility_;
            PerformanceRatioEngine ratio_engine_;
        };

    } // namespace analytics
} // namespace sensitivity

#endif // SENSITIVITY_ANALYTICS_VOLATILITY_ADJUSTED_RATIO_HPP
