/**
 * @file regime_regression.cpp
 * @brief Implementation of the regime partition and OLS fit.
 *
 * The fit uses centered sums:
 *
 *   Sxx = sum((x - mean_x)^2)
 *   Sxy = sum((x - mean_x)(y - mean_y))
 *   b   = Sxy / Sxx,  a = mean_y - b * mean_x
 *
 * A predictor whose values are all identical is rejected before the
 * division; its centered sum of squares is only rounding noise.
 */

#include "analytics/regime_regression.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <stdexcept>

namespace sensitivity
{
    namespace analytics
    {

        RegimePartition partition_by_regime(const std::vector<Value> &metric,
                                            const std::vector<Value> &market_returns,
                                            size_t begin,
                                            size_t end)
        {
            if (metric.size() != market_returns.size())
            {
                throw std::invalid_argument(
                    "Metric series size (" + std::to_string(metric.size()) + ") must match market return series size (" + std::to_string(market_returns.size()) + ")");
            }
            if (begin > end || end > metric.size())
            {
                throw std::invalid_argument(
                    "Invalid regime range [" + std::to_string(begin) + ", " + std::to_string(end) + ") for series of size " + std::to_string(metric.size()));
            }

            RegimePartition partition;

            for (size_t k = begin; k < end; ++k)
            {
                const Value &x = market_returns[k];
                if (!x || *x == 0.0)
                {
                    continue;
                }

                RegimeSamples &regime = (*x > 0.0) ? partition.up : partition.down;
                const Value &y = metric[k];
                if (!y)
                {
                    partition.complete = false;
                    continue;
                }
                regime.add(*x, *y);
            }

            return partition;
        }

        RegimePartition partition_by_regime(const std::vector<Value> &metric,
                                            const std::vector<Value> &market_returns)
        {
            return partition_by_regime(metric, market_returns, 0, metric.size());
        }

        bool passes_cardinality_gate(const RegimePartition &partition, int window)
        {
            const size_t minimum = static_cast<size_t>(window / 4);
            return partition.up.size() > minimum && partition.down.size() > minimum;
        }

        std::optional<LinearFit> fit_ols(const RegimeSamples &samples)
        {
            const Eigen::Index n = static_cast<Eigen::Index>(samples.size());
            if (n < 2)
            {
                return std::nullopt;
            }

            Eigen::Map<const Eigen::VectorXd> x(samples.market_returns.data(), n);
            Eigen::Map<const Eigen::VectorXd> y(samples.metric_values.data(), n);

            // Zero-variance predictor: slope undefined
            if (x.maxCoeff() == x.minCoeff())
            {
                return std::nullopt;
            }

            double mean_x = x.mean();
            double mean_y = y.mean();
            Eigen::VectorXd dx = x.array() - mean_x;
            Eigen::VectorXd dy = y.array() - mean_y;

            double sxx = dx.squaredNorm();
            double sxy = dx.dot(dy);
            double syy = dy.squaredNorm();

            if (!(sxx > 0.0))
            {
                return std::nullopt;
            }

            LinearFit fit;
            fit.slope = sxy / sxx;
            fit.intercept = mean_y - fit.slope * mean_x;
            fit.r_squared = syy > 0.0 ? (sxy * sxy) / (sxx * syy) : 0.0;
            fit.num_observations = static_cast<int>(n);

            if (!std::isfinite(fit.slope) || !std::isfinite(fit.intercept))
            {
                return std::nullopt;
            }

            return fit;
        }

    } // namespace analytics
} // namespace sensitivity
