/**
 * @file performance_ratio.hpp
 * @brief Rolling gain-to-pain style performance ratio.
 *
 * For every index i >= window the ratio is computed over the trailing
 * slice [i - window, i), which ends strictly before i:
 *
 *   gains  = sum(returns[k])
 *   losses = sum(|min(returns[k], 0)|)
 *   ratio  = gains / losses
 *
 * Entries i < window are missing. A slice containing any missing return
 * yields a missing ratio, and so does a slice without losses.
 */

#ifndef SENSITIVITY_ANALYTICS_PERFORMANCE_RATIO_HPP
#define SENSITIVITY_ANALYTICS_PERFORMANCE_RATIO_HPP

#include "data/time_series.hpp"

namespace sensitivity
{
    namespace analytics
    {

        /**
         * @class PerformanceRatioEngine
         * @brief Rolling ratio of net return to absolute negative return.
         *
         * The ratio is invariant to scaling all returns by a positive
         * constant, which is what allows the volatility-adjusted variant to
         * reuse it on ATR-normalized returns.
         *
         * Thread safety: Instances are immutable after construction.
         */
        class PerformanceRatioEngine
        {
        public:
            /**
             * @brief Construct with a rolling window.
             * @param window Trailing observations per ratio (default 90).
             * @throws std::invalid_argument If window < 1.
             */
            explicit PerformanceRatioEngine(int window = 90);

            /**
             * @brief Compute the rolling ratio.
             * @param returns Return series.
             * @return Ratio series on the same index as returns.
             */
            TimeSeries compute(const TimeSeries &returns) const;

            int window() const
            {
                return window_;
            }

        private:
            int window_;
        };

    } // namespace analytics
} // namespace sensitivity

#endif // SENSITIVITY_ANALYTICS_PERFORMANCE_RATIO_HPP
