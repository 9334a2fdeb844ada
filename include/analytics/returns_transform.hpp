/**
 * @file returns_transform.hpp
 * @brief Price-to-return conversion for date-indexed series.
 */

#ifndef SENSITIVITY_ANALYTICS_RETURNS_TRANSFORM_HPP
#define SENSITIVITY_ANALYTICS_RETURNS_TRANSFORM_HPP

#include "data/time_series.hpp"

namespace sensitivity
{
    namespace analytics
    {

        /**
         * @class ReturnsTransform
         * @brief Converts a price series into simple returns.
         *
         * result[t] = (price[t] - price[t-1]) / price[t-1]. The first entry is
         * always missing. A missing price on either side, or a zero prior
         * price, yields a missing return rather than an exception.
         */
        class ReturnsTransform
        {
        public:
            /**
             * @brief Compute simple returns.
             * @param prices Price series.
             * @return Return series on the same index as prices.
             */
            static TimeSeries compute(const TimeSeries &prices);
        };

    } // namespace analytics
} // namespace sensitivity

#endif // SENSITIVITY_ANALYTICS_RETURNS_TRANSFORM_HPP
