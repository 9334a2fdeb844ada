/**
 * @file performance_ratio.cpp
 * @brief Implementation of PerformanceRatioEngine.
 */

#include "analytics/performance_ratio.hpp"

#include <cmath>
#include <stdexcept>

namespace sensitivity
{
    namespace analytics
    {

        PerformanceRatioEngine::PerformanceRatioEngine(int window)
            : window_(window)
        {
            if (window_ < 1)
            {
                throw std::invalid_argument(
                    "Expected window >= 1 for performance ratio, got: " + std::to_string(window_));
            }
        }

        TimeSeries PerformanceRatioEngine::compute(const TimeSeries &returns) const
        {
            TimeSeries result(returns.dates());
            const size_t n = returns.size();
            const size_t w = static_cast<size_t>(window_);

            for (size_t i = w; i < n; ++i)
            {
                double gains = 0.0;
                double losses = 0.0;
                bool complete = true;

                for (size_t k = i - w; k < i; ++k)
                {
                    const Value &r = returns[k];
                    if (!r)
                    {
                        complete = false;
                        break;
                    }
                    gains += *r;
                    if (*r < 0.0)
                    {
                        losses += -*r;
                    }
                }

                // No losses in the window: the ratio is undefined and left missing
                if (!complete || losses == 0.0)
                {
                    continue;
                }
                result.set(i, gains / losses);
            }

            return result;
        }

    } // namespace analytics
} // namespace sensitivity
