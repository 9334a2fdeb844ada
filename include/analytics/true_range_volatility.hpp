/**
 * @file true_range_volatility.hpp
 * @brief Rolling average true range from high/low/close series.
 *
 * True range captures both intrabar range and overnight gaps:
 *
 *   TR[t] = max(high[t] - low[t],
 *               |high[t] - close[t-1]|,
 *               |low[t]  - close[t-1]|)
 *
 * The first bar (no prior close) degrades to high - low. The average
 * true range at i is the mean of TR over the trailing window ending at i
 * (inclusive).
 */

#ifndef SENSITIVITY_ANALYTICS_TRUE_RANGE_VOLATILITY_HPP
#define SENSITIVITY_ANALYTICS_TRUE_RANGE_VOLATILITY_HPP

#include "data/time_series.hpp"

namespace sensitivity
{
    namespace analytics
    {

        /**
         * @class TrueRangeVolatility
         * @brief Computes true range and its rolling mean.
         *
         * Usage:
         * @code
         *   TrueRangeVolatility atr(90);
         *   TimeSeries avg_tr = atr.compute(high, low, close);
         * @endcode
         */
        class TrueRangeVolatility
        {
        public:
            /**
             * @brief Construct with a rolling window.
             * @param window Trailing observations per average (default 90).
             * @throws std::invalid_argument If window < 1.
             */
            explicit TrueRangeVolatility(int window = 90);

            /**
             * @brief Per-bar true range.
             * @return Series on the common index; missing where high or low
             *         is missing. A missing prior close degrades to high - low.
             * @throws std::invalid_argument If the inputs do not share an index.
             */
            static TimeSeries true_range(const TimeSeries &high,
                                         const TimeSeries &low,
                                         const TimeSeries &close);

            /**
             * @brief Rolling average true range.
             * @return Series on the common index; missing for i < window - 1
             *         and wherever the trailing window holds a missing TR.
             * @throws std::invalid_argument If the inputs do not share an index.
             */
            TimeSeries compute(const TimeSeries &high,
                               const TimeSeries &low,
                               const TimeSeries &close) const;

            /**
             * @brief Rolling mean of an already computed true range series.
             */
            TimeSeries average(const TimeSeries &true_range) const;

            int window() const
            {
                return window_;
            }

        private:
            int window_;
        };

    } // namespace analytics
} // namespace sensitivity

#endif // SENSITIVITY_ANALYTICS_TRUE_RANGE_VOLATILITY_HPP
