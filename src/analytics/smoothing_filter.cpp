/**
 * @file smoothing_filter.cpp
 * @brief Implementation of the Savitzky-Golay smoother.
 *
 * With positions x = -m..m (m = window_length / 2) and the Vandermonde
 * matrix A(i, k) = x_i^k, the least-squares coefficients of a window y are
 * c = (A^T A)^{-1} A^T y and the smoothed center value is c_0. The first
 * row of (A^T A)^{-1} A^T is therefore a fixed convolution kernel, which
 * is computed once per filter.
 */

#include "analytics/smoothing_filter.hpp"
#include "data/data_loader.hpp"

#include <stdexcept>

namespace sensitivity
{
    namespace analytics
    {

        // ===================================================================
        // SmoothingFilter
        // ===================================================================

        std::vector<double> SmoothingFilter::fill_missing(const TimeSeries &series)
        {
            auto first = series.first_valid();
            if (!first)
            {
                return {};
            }

            std::vector<double> filled(series.size());

            // Leading gap takes the first observation (backward fill)
            double last = *first;
            for (size_t i = 0; i < series.size(); ++i)
            {
                if (series[i])
                {
                    last = *series[i];
                }
                filled[i] = last;
            }

            return filled;
        }

        // ===================================================================
        // SavitzkyGolayFilter
        // ===================================================================

        SavitzkyGolayFilter::SavitzkyGolayFilter(int window_length, int polyorder)
            : window_length_(window_length), polyorder_(polyorder)
        {
            if (window_length_ < 1 || window_length_ % 2 == 0)
            {
                throw std::invalid_argument(
                    "Expected a positive odd window_length, got: " + std::to_string(window_length_));
            }
            if (polyorder_ < 0 || polyorder_ >= window_length_)
            {
                throw std::invalid_argument(
                    "Expected 0 <= polyorder < window_length, got: " + std::to_string(polyorder_));
            }

            const int m = window_length_ / 2;
            Eigen::VectorXd positions = Eigen::VectorXd::LinSpaced(window_length_, -m, m);
            Eigen::MatrixXd a = vandermonde(positions);
            Eigen::MatrixXd solver = (a.transpose() * a).ldlt().solve(a.transpose());
            coefficients_ = solver.row(0).transpose();
        }

        std::string SavitzkyGolayFilter::get_name() const
        {
            return "SavitzkyGolay(window=" + std::to_string(window_length_) +
                   ", polyorder=" + std::to_string(polyorder_) + ")";
        }

        TimeSeries SavitzkyGolayFilter::apply(const TimeSeries &series) const
        {
            const size_t w = static_cast<size_t>(window_length_);
            if (series.size() < w + 1)
            {
                return series;
            }

            std::vector<double> filled = fill_missing(series);
            if (filled.empty())
            {
                return series;
            }

            const Eigen::Index n = static_cast<Eigen::Index>(filled.size());
            const Eigen::Index m = window_length_ / 2;
            Eigen::Map<const Eigen::VectorXd> y(filled.data(), n);
            Eigen::VectorXd smoothed(n);

            // Interior: fixed convolution kernel
            for (Eigen::Index i = m; i < n - m; ++i)
            {
                smoothed(i) = coefficients_.dot(y.segment(i - m, window_length_));
            }

            // Edges: evaluate the polynomial fitted to the first/last window
            Eigen::VectorXd head_offsets(m);
            Eigen::VectorXd tail_offsets(m);
            for (Eigen::Index k = 0; k < m; ++k)
            {
                head_offsets(k) = static_cast<double>(k - m);
                tail_offsets(k) = static_cast<double>(k + 1);
            }

            if (m > 0)
            {
                smoothed.head(m) = fit_and_evaluate(y.head(window_length_), head_offsets);
                smoothed.tail(m) = fit_and_evaluate(y.tail(window_length_), tail_offsets);
            }

            std::vector<double> out(smoothed.data(), smoothed.data() + n);
            return TimeSeries::from_doubles(series.dates(), out);
        }

        Eigen::VectorXd SavitzkyGolayFilter::fit_and_evaluate(const Eigen::VectorXd &window,
                                                              const Eigen::VectorXd &offsets) const
        {
            const int m = window_length_ / 2;
            Eigen::VectorXd positions = Eigen::VectorXd::LinSpaced(window_length_, -m, m);
            Eigen::VectorXd poly = vandermonde(positions).colPivHouseholderQr().solve(window);
            return vandermonde(offsets) * poly;
        }

        Eigen::MatrixXd SavitzkyGolayFilter::vandermonde(const Eigen::VectorXd &positions) const
        {
            Eigen::MatrixXd a(positions.size(), polyorder_ + 1);
            for (Eigen::Index i = 0; i < positions.size(); ++i)
            {
                double power = 1.0;
                for (int k = 0; k <= polyorder_; ++k)
                {
                    a(i, k) = power;
                    power *= positions(i);
                }
            }
            return a;
        }

        // ===================================================================
        // Factory
        // ===================================================================

        std::unique_ptr<SmoothingFilter> create_smoothing_filter(const SmoothingConfig &config)
        {
            if (!config.enabled)
            {
                return nullptr;
            }
            return std::make_unique<SavitzkyGolayFilter>(config.window_length, config.polyorder);
        }

    } // namespace analytics
} // namespace sensitivity
