/**
 * @file analysis_result.cpp
 * @brief Implementation of AnalysisResult lookups and price normalization.
 */

#include "pipeline/analysis_result.hpp"

#include <stdexcept>

namespace sensitivity
{
    namespace pipeline
    {

        const std::vector<std::string> &AnalysisResult::metric_names()
        {
            static const std::vector<std::string> names = {
                "Performance_Ratio",
                "Volatility_Adjusted_Ratio"};
            return names;
        }

        const MetricAnalysis &AnalysisResult::metric(const std::string &name) const
        {
            if (name == performance_ratio.name)
                return performance_ratio;
            if (name == volatility_adjusted_ratio.name)
                return volatility_adjusted_ratio;

            throw std::invalid_argument("Unknown metric: " + name);
        }

        const TimeSeries &AnalysisResult::series(const std::string &metric_name,
                                                 const std::string &measure_name) const
        {
            return metric(metric_name).measures.measure(measure_name);
        }

        TimeSeries normalize_to_base(const TimeSeries &prices, double base)
        {
            TimeSeries result(prices.dates());

            auto first = prices.first_valid();
            if (!first || *first == 0.0)
            {
                return result;
            }

            for (size_t i = 0; i < prices.size(); ++i)
            {
                if (prices[i])
                {
                    result.set(i, *prices[i] / *first * base);
                }
            }

            return result;
        }

    } // namespace pipeline
} // namespace sensitivity
