/**
 * @file test_regime_sensitivity.cpp
 * @brief Unit tests for the regime partition, OLS fit and
 *        RegimeSensitivityAnalyzer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/regime_regression.hpp"
#include "analytics/regime_sensitivity.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace sensitivity;
using namespace sensitivity::analytics;
using Catch::Matchers::WithinAbs;

namespace
{
    // Metric: the five-return pattern repeated. Market: +-0.01 .. +-0.04
    // alternating, so each 8-point window holds four up and four down days.
    void scenario(size_t n, std::vector<double> &metric, std::vector<double> &market)
    {
        const std::vector<double> metric_pattern = {0.01, -0.02, 0.03, -0.01, 0.02};
        const std::vector<double> market_pattern = {0.01, -0.01, 0.02, -0.02, 0.03, -0.03, 0.04, -0.04};
        metric.resize(n);
        market.resize(n);
        for (size_t i = 0; i < n; ++i)
        {
            metric[i] = metric_pattern[i % metric_pattern.size()];
            market[i] = market_pattern[i % market_pattern.size()];
        }
    }

    // Closed-form simple regression slope
    double closed_form_slope(const std::vector<double> &x, const std::vector<double> &y)
    {
        double n = static_cast<double>(x.size());
        double sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
        for (size_t k = 0; k < x.size(); ++k)
        {
            sx += x[k];
            sy += y[k];
            sxx += x[k] * x[k];
            sxy += x[k] * y[k];
        }
        return (n * sxy - sx * sy) / (n * sxx - sx * sx);
    }
} // namespace

TEST_CASE("Regime partition splits by market sign", "[Regime][Partition]") {
    std::vector<Value> metric = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
    std::vector<Value> market = {0.01, -0.02, 0.0, std::nullopt, 0.03, -0.01};

    auto partition = partition_by_regime(metric, market);

    REQUIRE(partition.complete);
    REQUIRE(partition.up.size() == 2);
    REQUIRE(partition.down.size() == 2);
    REQUIRE(partition.up.market_returns == std::vector<double>{0.01, 0.03});
    REQUIRE(partition.up.metric_values == std::vector<double>{1.0, 5.0});
    REQUIRE(partition.down.market_returns == std::vector<double>{-0.02, -0.01});
    REQUIRE(partition.down.metric_values == std::vector<double>{2.0, 6.0});

    SECTION("Sub-range") {
        auto sub = partition_by_regime(metric, market, 1, 3);
        REQUIRE(sub.up.size() == 0);
        REQUIRE(sub.down.size() == 1);
    }

    SECTION("Missing metric on a regime day marks the partition incomplete") {
        std::vector<Value> gappy = metric;
        gappy[4] = std::nullopt;
        REQUIRE_FALSE(partition_by_regime(gappy, market).complete);
    }

    SECTION("Missing metric on a flat-market day is ignored") {
        std::vector<Value> gappy = metric;
        gappy[2] = std::nullopt;
        REQUIRE(partition_by_regime(gappy, market).complete);
    }

    SECTION("Invalid inputs") {
        REQUIRE_THROWS_AS(partition_by_regime(metric, {0.01}), std::invalid_argument);
        REQUIRE_THROWS_AS(partition_by_regime(metric, market, 4, 2), std::invalid_argument);
        REQUIRE_THROWS_AS(partition_by_regime(metric, market, 0, 7), std::invalid_argument);
    }
}

TEST_CASE("Cardinality gate is strict", "[Regime][Gate]") {
    RegimePartition partition;
    for (int k = 0; k < 2; ++k)
    {
        partition.up.add(0.01 * (k + 1), 1.0);
        partition.down.add(-0.01 * (k + 1), 1.0);
    }

    // window / 4 == 2: two points per regime is not enough
    REQUIRE_FALSE(passes_cardinality_gate(partition, 8));
    REQUIRE_FALSE(passes_cardinality_gate(partition, 11));

    partition.up.add(0.05, 1.0);
    REQUIRE_FALSE(passes_cardinality_gate(partition, 8));

    partition.down.add(-0.05, 1.0);
    REQUIRE(passes_cardinality_gate(partition, 8));
    REQUIRE_FALSE(passes_cardinality_gate(partition, 12));
}

TEST_CASE("OLS fit", "[Regime][OLS]") {
    SECTION("Exact line") {
        RegimeSamples samples;
        for (int k = 1; k <= 5; ++k)
        {
            double x = 0.01 * k;
            samples.add(x, 2.0 + 3.0 * x);
        }
        auto fit = fit_ols(samples);
        REQUIRE(fit.has_value());
        REQUIRE_THAT(fit->slope, WithinAbs(3.0, 1e-10));
        REQUIRE_THAT(fit->intercept, WithinAbs(2.0, 1e-10));
        REQUIRE_THAT(fit->r_squared, WithinAbs(1.0, 1e-10));
        REQUIRE(fit->num_observations == 5);
    }

    SECTION("Constant response has zero slope") {
        RegimeSamples samples;
        samples.add(0.01, 4.0);
        samples.add(0.02, 4.0);
        samples.add(0.05, 4.0);
        auto fit = fit_ols(samples);
        REQUIRE(fit.has_value());
        REQUIRE(fit->slope == 0.0);
        REQUIRE(fit->r_squared == 0.0);
    }

    SECTION("Zero-variance predictor") {
        RegimeSamples samples;
        samples.add(-0.01, 1.0);
        samples.add(-0.01, 2.0);
        samples.add(-0.01, 3.0);
        REQUIRE_FALSE(fit_ols(samples).has_value());
    }

    SECTION("Too few points") {
        RegimeSamples samples;
        REQUIRE_FALSE(fit_ols(samples).has_value());
        samples.add(0.01, 1.0);
        REQUIRE_FALSE(fit_ols(samples).has_value());
    }
}

TEST_CASE("Regime sensitivity end-to-end scenario", "[Regime][Analyzer]") {
    std::vector<double> metric_values, market_values;
    scenario(12, metric_values, market_values);
    auto metric = test::make_series(metric_values);
    auto market = test::make_series(market_values);

    RegimeSensitivityAnalyzer analyzer(8);
    auto bundle = analyzer.analyze(metric, market);

    for (const auto &name : SensitivityBundle::measure_names())
    {
        const auto &series = bundle.measure(name);
        REQUIRE(series.size() == 12);
        REQUIRE(series.same_index(metric));
        for (size_t i = 0; i < 8; ++i)
        {
            REQUIRE_FALSE(series.has_value(i));
        }
    }

    // Window [0, 8):
    //   up:   x = {0.01, 0.02, 0.03, 0.04},     y = {0.01, 0.03, 0.02, -0.02}
    //   down: x = {-0.01, -0.02, -0.03, -0.04}, y = {-0.02, -0.01, 0.01, 0.03}
    REQUIRE_THAT(*bundle.upside_sensitivity[8], WithinAbs(-1.0, 1e-9));
    REQUIRE_THAT(*bundle.downside_sensitivity[8], WithinAbs(-1.7, 1e-9));
    REQUIRE_THAT(*bundle.composite_sensitivity[8], WithinAbs(0.7, 1e-9));
    REQUIRE_THAT(*bundle.market_independence[8], WithinAbs(-0.7, 1e-9));

    // Cross-check every later window against the closed-form slope
    for (size_t i = 8; i < 12; ++i)
    {
        std::vector<double> ux, uy, dx, dy;
        for (size_t k = i - 8; k < i; ++k)
        {
            if (market_values[k] > 0.0)
            {
                ux.push_back(market_values[k]);
                uy.push_back(metric_values[k]);
            }
            else
            {
                dx.push_back(market_values[k]);
                dy.push_back(metric_values[k]);
            }
        }
        REQUIRE_THAT(*bundle.upside_sensitivity[i], WithinAbs(closed_form_slope(ux, uy), 1e-9));
        REQUIRE_THAT(*bundle.downside_sensitivity[i], WithinAbs(closed_form_slope(dx, dy), 1e-9));
    }
}

TEST_CASE("Regime sensitivity measure identities", "[Regime][Analyzer]") {
    std::vector<double> metric_values, market_values;
    scenario(64, metric_values, market_values);
    // Perturb the metric so slopes vary from window to window
    for (size_t i = 0; i < metric_values.size(); ++i)
    {
        metric_values[i] += 0.001 * std::sin(0.7 * static_cast<double>(i));
    }
    auto metric = test::make_series(metric_values);
    auto market = test::make_series(market_values);

    auto bundle = RegimeSensitivityAnalyzer(16).analyze(metric, market);

    size_t valid = 0;
    for (size_t i = 0; i < metric.size(); ++i)
    {
        if (!bundle.upside_sensitivity.has_value(i))
        {
            REQUIRE_FALSE(bundle.downside_sensitivity.has_value(i));
            REQUIRE_FALSE(bundle.composite_sensitivity.has_value(i));
            REQUIRE_FALSE(bundle.market_independence.has_value(i));
            continue;
        }
        ++valid;
        double up = *bundle.upside_sensitivity[i];
        double down = *bundle.downside_sensitivity[i];
        REQUIRE(*bundle.composite_sensitivity[i] == up - down);
        REQUIRE(*bundle.market_independence[i] == 1.0 - std::abs(up * down));
        REQUIRE(*bundle.market_independence[i] <= 1.0);
    }
    REQUIRE(valid == metric.size() - 16);
}

TEST_CASE("Market independence is one when a slope is zero", "[Regime][Analyzer]") {
    // Up days: metric constant. Down days: metric = 2 * market.
    const std::vector<double> market_pattern = {0.01, -0.01, 0.02, -0.02, 0.03, -0.03, 0.04, -0.04};
    std::vector<double> market_values, metric_values;
    for (size_t i = 0; i < 10; ++i)
    {
        double x = market_pattern[i % market_pattern.size()];
        market_values.push_back(x);
        metric_values.push_back(x > 0.0 ? 0.5 : 2.0 * x);
    }

    auto bundle = RegimeSensitivityAnalyzer(8).analyze(test::make_series(metric_values),
                                                       test::make_series(market_values));

    REQUIRE(*bundle.upside_sensitivity[8] == 0.0);
    REQUIRE_THAT(*bundle.downside_sensitivity[8], WithinAbs(2.0, 1e-9));
    REQUIRE(*bundle.market_independence[8] == 1.0);
}

TEST_CASE("Regime validity gate boundary yields missing", "[Regime][Analyzer]") {
    // window 8: exactly two up days and two down days, the rest flat
    std::vector<double> market_values = {0.01, -0.01, 0.0, 0.0, 0.02, -0.02, 0.0, 0.0, 0.0};
    std::vector<double> metric_values = {0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7, 0.8, 0.9};

    auto bundle = RegimeSensitivityAnalyzer(8).analyze(test::make_series(metric_values),
                                                       test::make_series(market_values));

    REQUIRE(bundle.upside_sensitivity.count_missing() == 9);
    REQUIRE(bundle.downside_sensitivity.count_missing() == 9);
    REQUIRE(bundle.composite_sensitivity.count_missing() == 9);
    REQUIRE(bundle.market_independence.count_missing() == 9);

    SECTION("One more observation per regime passes the gate") {
        market_values[2] = 0.03;
        market_values[3] = -0.03;
        auto passing = RegimeSensitivityAnalyzer(8).analyze(test::make_series(metric_values),
                                                            test::make_series(market_values));
        REQUIRE(passing.upside_sensitivity.has_value(8));
    }
}

TEST_CASE("Zero-variance down regime yields missing", "[Regime][Analyzer]") {
    std::vector<double> market_values = {0.01, -0.01, 0.02, -0.01, 0.03, -0.01, 0.04, -0.01, 0.05, -0.01};
    std::vector<double> metric_values = {0.3, 0.1, 0.5, 0.2, 0.4, 0.6, 0.9, 0.7, 0.8, 0.2};

    auto bundle = RegimeSensitivityAnalyzer(8).analyze(test::make_series(metric_values),
                                                       test::make_series(market_values));

    for (size_t i = 0; i < market_values.size(); ++i)
    {
        REQUIRE_FALSE(bundle.downside_sensitivity.has_value(i));
        REQUIRE_FALSE(bundle.upside_sensitivity.has_value(i));
    }
    Eigen::VectorXd downside = bundle.downside_sensitivity.to_eigen();
    for (Eigen::Index k = 0; k < downside.size(); ++k)
    {
        REQUIRE(std::isnan(downside(k)));
    }
}

TEST_CASE("Missing metric inside a window yields missing", "[Regime][Analyzer]") {
    std::vector<double> metric_values, market_values;
    scenario(12, metric_values, market_values);
    std::vector<Value> metric(metric_values.begin(), metric_values.end());
    metric[3] = std::nullopt;

    auto bundle = RegimeSensitivityAnalyzer(8).analyze(test::make_series(metric),
                                                       test::make_series(market_values));

    // Windows [0,8) .. [3,11) contain index 3
    for (size_t i = 8; i <= 11; ++i)
    {
        REQUIRE_FALSE(bundle.upside_sensitivity.has_value(i));
    }
}

TEST_CASE("RegimeSensitivityAnalyzer input validation", "[Regime][Analyzer]") {
    REQUIRE_THROWS_AS(RegimeSensitivityAnalyzer(0), std::invalid_argument);

    TimeSeries a(test::make_dates(5));
    TimeSeries b(test::make_dates(5, 2030));
    REQUIRE_THROWS_AS(RegimeSensitivityAnalyzer(2).analyze(a, b), std::invalid_argument);

    SensitivityBundle bundle;
    REQUIRE_THROWS_AS(bundle.measure("beta"), std::invalid_argument);
}
