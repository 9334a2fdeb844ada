/**
 * @file smoothing_filter.hpp
 * @brief Display-oriented smoothing of series with gaps.
 *
 * Smoothing is a post-processing step applied to finished sensitivity
 * series; nothing in the numeric pipeline depends on it.
 */

#ifndef SENSITIVITY_ANALYTICS_SMOOTHING_FILTER_HPP
#define SENSITIVITY_ANALYTICS_SMOOTHING_FILTER_HPP

#include "data/time_series.hpp"

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace sensitivity
{
    struct SmoothingConfig;

    namespace analytics
    {

        /**
         * @class SmoothingFilter
         * @brief Abstract base class for series smoothers.
         *
         * Implementations return a series on the same index as the input.
         */
        class SmoothingFilter
        {
        public:
            virtual ~SmoothingFilter() = default;

            /**
             * @brief Smooth a series.
             * @param series Input series, possibly with missing values.
             * @return Smoothed series on the same dates.
             */
            virtual TimeSeries apply(const TimeSeries &series) const = 0;

            /**
             * @brief Get the name of the filter
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Forward-fill then backward-fill missing values.
             * @return Filled values; empty when every entry is missing.
             */
            static std::vector<double> fill_missing(const TimeSeries &series);
        };

        /**
         * @class SavitzkyGolayFilter
         * @brief Local least-squares polynomial smoother.
         *
         * Missing values are forward- then backward-filled. Each interior
         * point is replaced by the value at the window center of a degree
         * polyorder polynomial fitted to its window_length neighbours. The
         * first and last window_length / 2 points are evaluated from a
         * single polynomial fitted to the first and last window_length
         * points respectively.
         *
         * Series with fewer than window_length + 1 observations, or with no
         * observation at all, are returned unchanged.
         */
        class SavitzkyGolayFilter : public SmoothingFilter
        {
        public:
            /**
             * @brief Construct a filter.
             * @param window_length Odd window length (default 21).
             * @param polyorder Polynomial degree, < window_length (default 3).
             * @throws std::invalid_argument On an even or non-positive window
             *         or an out-of-range polyorder.
             */
            explicit SavitzkyGolayFilter(int window_length = 21, int polyorder = 3);

            TimeSeries apply(const TimeSeries &series) const override;

            std::string get_name() const override;

            int window_length() const
            {
                return window_length_;
            }

            int polyorder() const
            {
                return polyorder_;
            }

            /**
             * @brief Convolution weights producing the window-center estimate.
             */
            const Eigen::VectorXd &coefficients() const
            {
                return coefficients_;
            }

        private:
            /**
             * @brief Fit a polynomial to a window and evaluate it at offsets.
             * @param window Values of window_length consecutive points.
             * @param offsets Positions relative to the window center.
             */
            Eigen::VectorXd fit_and_evaluate(const Eigen::VectorXd &window,
                                             const Eigen::VectorXd &offsets) const;

            Eigen::MatrixXd vandermonde(const Eigen::VectorXd &positions) const;

            int window_length_;
            int polyorder_;
            Eigen::VectorXd coefficients_;
        };

        /**
         * @brief Create the filter described by a smoothing configuration.
         * @return Filter instance, or nullptr when smoothing is disabled.
         */
        std::unique_ptr<SmoothingFilter> create_smoothing_filter(const SmoothingConfig &config);

    } // namespace analytics
} // namespace sensitivity

#endif // SENSITIVITY_ANALYTICS_SMOOTHING_FILTER_HPP
