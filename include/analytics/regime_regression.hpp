/**
 * @file regime_regression.hpp
 * @brief Up/down market regime partition and per-regime OLS fit.
 *
 * A rolling window of (market return, metric) pairs is split by the sign
 * of the market return into an up regime (> 0) and a down regime (< 0).
 * Zero market returns belong to neither regime. Each regime is then fitted
 * with ordinary least squares:
 *
 *   metric = a + b * market_return + epsilon
 *
 * The slope b is the regime sensitivity.
 */

#ifndef SENSITIVITY_ANALYTICS_REGIME_REGRESSION_HPP
#define SENSITIVITY_ANALYTICS_REGIME_REGRESSION_HPP

#include "data/time_series.hpp"

#include <optional>
#include <vector>

namespace sensitivity
{
    namespace analytics
    {

        /**
         * @struct RegimeSamples
         * @brief Paired observations belonging to one market regime.
         */
        struct RegimeSamples
        {
            std::vector<double> market_returns; ///< Predictor (x)
            std::vector<double> metric_values;  ///< Response (y)

            void add(double market_return, double metric)
            {
                market_returns.push_back(market_return);
                metric_values.push_back(metric);
            }

            size_t size() const
            {
                return market_returns.size();
            }
        };

        /**
         * @struct RegimePartition
         * @brief Up-market and down-market samples of one window.
         */
        struct RegimePartition
        {
            RegimeSamples up;   ///< Observations with market return > 0
            RegimeSamples down; ///< Observations with market return < 0

            /// False when a regime observation had a missing metric value.
            bool complete = true;
        };

        /**
         * @struct LinearFit
         * @brief Result of a simple linear regression.
         */
        struct LinearFit
        {
            double intercept;     ///< Fitted a
            double slope;         ///< Fitted b
            double r_squared;     ///< Coefficient of determination (0 when y is constant)
            int num_observations; ///< Number of points in the fit
        };

        /**
         * @brief Split observations [begin, end) by the sign of the market return.
         *
         * A missing market return belongs to neither regime. A missing metric
         * paired with a non-zero market return marks the partition incomplete.
         *
         * @throws std::invalid_argument If the vectors differ in size or the
         *         range is out of bounds.
         */
        RegimePartition partition_by_regime(const std::vector<Value> &metric,
                                            const std::vector<Value> &market_returns,
                                            size_t begin,
                                            size_t end);

        /**
         * @brief Split every observation by the sign of the market return.
         */
        RegimePartition partition_by_regime(const std::vector<Value> &metric,
                                            const std::vector<Value> &market_returns);

        /**
         * @brief Both regimes must hold strictly more than window / 4 points.
         */
        bool passes_cardinality_gate(const RegimePartition &partition, int window);

        /**
         * @brief Ordinary least squares fit of metric on market return.
         * @return The fit, or std::nullopt with fewer than two points, a
         *         zero-variance predictor, or a non-finite result.
         */
        std::optional<LinearFit> fit_ols(const RegimeSamples &samples);

    } // namespace analytics
} // namespace sensitivity

#endif // SENSITIVITY_ANALYTICS_REGIME_REGRESSION_HPP
