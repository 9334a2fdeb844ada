/**
 * @file returns_transform.cpp
 * @brief Implementation of ReturnsTransform.
 */

#include "analytics/returns_transform.hpp"

namespace sensitivity
{
    namespace analytics
    {

        TimeSeries ReturnsTransform::compute(const TimeSeries &prices)
        {
            TimeSeries result(prices.dates());

            for (size_t t = 1; t < prices.size(); ++t)
            {
                const Value &p_t = prices[t];
                const Value &p_tm1 = prices[t - 1];

                if (!p_t || !p_tm1 || *p_tm1 == 0.0)
                {
                    continue;
                }
                result.set(t, (*p_t - *p_tm1) / *p_tm1);
            }

            return result;
        }

    } // namespace analytics
} // namespace sensitivity
