/**
 * @file regime_sensitivity.cpp
 * @brief Implementation of RegimeSensitivityAnalyzer.
 */

#include "analytics/regime_sensitivity.hpp"

#include <cmath>
#include <stdexcept>

namespace sensitivity
{
    namespace analytics
    {

        // ===================================================================
        // SensitivityBundle
        // ===================================================================

        const std::vector<std::string> &SensitivityBundle::measure_names()
        {
            static const std::vector<std::string> names = {
                "upside_sensitivity",
                "downside_sensitivity",
                "composite_sensitivity",
                "market_independence"};
            return names;
        }

        const TimeSeries &SensitivityBundle::measure(const std::string &name) const
        {
            if (name == "upside_sensitivity")
                return upside_sensitivity;
            if (name == "downside_sensitivity")
                return downside_sensitivity;
            if (name == "composite_sensitivity")
                return composite_sensitivity;
            if (name == "market_independence")
                return market_independence;

            throw std::invalid_argument("Unknown sensitivity measure: " + name);
        }

        SensitivityBundle SensitivityBundle::transform(
            const std::function<TimeSeries(const TimeSeries &)> &func) const
        {
            SensitivityBundle out;
            out.upside_sensitivity = func(upside_sensitivity);
            out.downside_sensitivity = func(downside_sensitivity);
            out.composite_sensitivity = func(composite_sensitivity);
            out.market_independence = func(market_independence);
            return out;
        }

        // ===================================================================
        // RegimeSensitivityAnalyzer
        // ===================================================================

        RegimeSensitivityAnalyzer::RegimeSensitivityAnalyzer(int window)
            : window_(window)
        {
            if (window_ < 1)
            {
                throw std::invalid_argument(
                    "Expected window >= 1 for regime sensitivity, got: " + std::to_string(window_));
            }
        }

        SensitivityBundle RegimeSensitivityAnalyzer::analyze(const TimeSeries &metric,
                                                             const TimeSeries &market_returns) const
        {
            if (!metric.same_index(market_returns))
            {
                throw std::invalid_argument(
                    "Metric series and market returns must share the same dates");
            }

            SensitivityBundle bundle;
            bundle.upside_sensitivity = TimeSeries(metric.dates());
            bundle.downside_sensitivity = TimeSeries(metric.dates());
            bundle.composite_sensitivity = TimeSeries(metric.dates());
            bundle.market_independence = TimeSeries(metric.dates());

            const size_t n = metric.size();
            const size_t w = static_cast<size_t>(window_);

            for (size_t i = w; i < n; ++i)
            {
                RegimePartition partition =
                    partition_by_regime(metric.values(), market_returns.values(), i - w, i);

                if (!partition.complete || !passes_cardinality_gate(partition, window_))
                {
                    continue;
                }

                auto up_fit = fit_ols(partition.up);
                auto down_fit = fit_ols(partition.down);
                if (!up_fit || !down_fit)
                {
                    continue;
                }

                double upside_slope = up_fit->slope;
                double downside_slope = down_fit->slope;

                bundle.upside_sensitivity.set(i, upside_slope);
                bundle.downside_sensitivity.set(i, downside_slope);
                bundle.composite_sensitivity.set(i, upside_slope - downside_slope);
                bundle.market_independence.set(i, 1.0 - std::abs(upside_slope * downside_slope));
            }

            return bundle;
        }

    } // namespace analytics
} // namespace sensitivity
