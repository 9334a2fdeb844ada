/**
 * @file regime_sensitivity.hpp
 * @brief Rolling dual-regime market sensitivity of a derived metric.
 *
 * For each index i >= window, the trailing slice [i - window, i) of the
 * metric and market return series is split into up-market and down-market
 * regimes. If both regimes hold more than window / 4 observations, the
 * metric is regressed on the market return within each regime and four
 * measures are emitted at i:
 *
 *   upside_sensitivity    = b_up
 *   downside_sensitivity  = b_down
 *   composite_sensitivity = b_up - b_down
 *   market_independence   = 1 - |b_up * b_down|
 *
 * Any degenerate window (gate failure, missing metric inside a regime,
 * zero-variance predictor) leaves all four outputs missing at i.
 */

#ifndef SENSITIVITY_ANALYTICS_REGIME_SENSITIVITY_HPP
#define SENSITIVITY_ANALYTICS_REGIME_SENSITIVITY_HPP

#include "analytics/regime_regression.hpp"
#include "data/time_series.hpp"

#include <functional>
#include <string>
#include <vector>

namespace sensitivity
{
    namespace analytics
    {

        /**
         * @struct SensitivityBundle
         * @brief Four aligned sensitivity series for one metric.
         */
        struct SensitivityBundle
        {
            TimeSeries upside_sensitivity;
            TimeSeries downside_sensitivity;
            TimeSeries composite_sensitivity;
            TimeSeries market_independence;

            /**
             * @brief Measure names in presentation order.
             */
            static const std::vector<std::string> &measure_names();

            /**
             * @brief Look up a measure by name.
             * @throws std::invalid_argument For an unknown name.
             */
            const TimeSeries &measure(const std::string &name) const;

            /**
             * @brief Apply a series transform to each measure independently.
             */
            SensitivityBundle transform(
                const std::function<TimeSeries(const TimeSeries &)> &func) const;
        };

        /**
         * @class RegimeSensitivityAnalyzer
         * @brief Rolling up/down regime regression against market returns.
         *
         * Usage:
         * @code
         *   RegimeSensitivityAnalyzer analyzer(30);
         *   SensitivityBundle bundle = analyzer.analyze(ratio, market_returns);
         * @endcode
         *
         * Performance: O(n * window); each step re-partitions its slice.
         */
        class RegimeSensitivityAnalyzer
        {
        public:
            /**
             * @brief Construct with a rolling window.
             * @param window Trailing observations per regression (default 90).
             * @throws std::invalid_argument If window < 1.
             */
            explicit RegimeSensitivityAnalyzer(int window = 90);

            /**
             * @brief Compute the sensitivity bundle.
             * @param metric Derived metric series (e.g. a performance ratio).
             * @param market_returns Market return series on the same dates.
             * @return Bundle aligned to metric's index.
             * @throws std::invalid_argument If the series do not share an index.
             */
            SensitivityBundle analyze(const TimeSeries &metric,
                                      const TimeSeries &market_returns) const;

            int window() const
            {
                return window_;
            }

        private:
            int window_;
        };

    } // namespace analytics
} // namespace sensitivity

#endif // SENSITIVITY_ANALYTICS_REGIME_SENSITIVITY_HPP
