/**
 * @file analysis_result.hpp
 * @brief Packaged output of one asset/market sensitivity analysis.
 */

#ifndef SENSITIVITY_PIPELINE_ANALYSIS_RESULT_HPP
#define SENSITIVITY_PIPELINE_ANALYSIS_RESULT_HPP

#include "analytics/regime_sensitivity.hpp"
#include "data/time_series.hpp"

#include <string>
#include <utility>
#include <vector>

namespace sensitivity
{
    namespace pipeline
    {

        /**
         * @struct MetricAnalysis
         * @brief A derived metric and its regime sensitivities.
         */
        struct MetricAnalysis
        {
            std::string name;                      ///< Metric key (e.g. "Performance_Ratio")
            TimeSeries ratio;                      ///< Underlying metric series
            analytics::SensitivityBundle measures; ///< Sensitivities of the metric
        };

        /**
         * @struct AnalysisResult
         * @brief Everything produced for one asset against the market.
         *
         * All series share the aligned date index of the asset and market
         * histories.
         */
        struct AnalysisResult
        {
            std::string symbol;        ///< Analyzed asset
            std::string market_symbol; ///< Benchmark
            int window = 0;            ///< Rolling window used
            bool smoothed = false;     ///< True if a smoothing filter was applied

            MetricAnalysis performance_ratio;         ///< "Performance_Ratio"
            MetricAnalysis volatility_adjusted_ratio; ///< "Volatility_Adjusted_Ratio"

            TimeSeries asset_prices;  ///< Asset close prices
            TimeSeries market_prices; ///< Market close prices

            /**
             * @brief Metric keys in presentation order.
             */
            static const std::vector<std::string> &metric_names();

            /**
             * @brief Look up a metric by key.
             * @throws std::invalid_argument For an unknown key.
             */
            const MetricAnalysis &metric(const std::string &name) const;

            /**
             * @brief Shorthand for metric(metric_name).measures.measure(measure_name).
             */
            const TimeSeries &series(const std::string &metric_name,
                                     const std::string &measure_name) const;

            const std::vector<std::string> &dates() const
            {
                return asset_prices.dates();
            }
        };

        /**
         * @struct BatchResult
         * @brief Outcome of analyzing several symbols.
         */
        struct BatchResult
        {
            std::vector<AnalysisResult> results;                      ///< Successful analyses
            std::vector<std::pair<std::string, std::string>> failures; ///< (symbol, error message)

            size_t num_succeeded() const
            {
                return results.size();
            }

            size_t num_failed() const
            {
                return failures.size();
            }
        };

        /**
         * @brief Rescale a price series so its first observation equals base.
         * @return Normalized series; all missing if the series has no
         *         non-zero first observation.
         */
        TimeSeries normalize_to_base(const TimeSeries &prices, double base = 100.0);

    } // namespace pipeline
} // namespace sensitivity

#endif // SENSITIVITY_PIPELINE_ANALYSIS_RESULT_HPP
