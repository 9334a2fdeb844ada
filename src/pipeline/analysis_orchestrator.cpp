/**
 * @file analysis_orchestrator.cpp
 * @brief Implementation of AnalysisOrchestrator.
 */

#include "pipeline/analysis_orchestrator.hpp"

#include "analytics/performance_ratio.hpp"
#include "analytics/regime_sensitivity.hpp"
#include "analytics/returns_transform.hpp"
#include "analytics/volatility_adjusted_ratio.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace sensitivity
{
    namespace pipeline
    {

        AnalysisOrchestrator::AnalysisOrchestrator(std::shared_ptr<const PriceProvider> provider,
                                                   const OrchestratorOptions &options,
                                                   std::shared_ptr<const analytics::SmoothingFilter> smoother)
            : provider_(std::move(provider)), options_(options), smoother_(std::move(smoother))
        {
            if (!provider_)
            {
                throw std::invalid_argument("Price provider cannot be null");
            }
            if (options_.window < 1)
            {
                throw std::invalid_argument(
                    "Expected window >= 1, got: " + std::to_string(options_.window));
            }
            if (options_.market_symbol.empty())
            {
                throw std::invalid_argument("Market symbol cannot be empty");
            }
        }

        AnalysisResult AnalysisOrchestrator::analyze(const std::string &symbol) const
        {
            PriceHistory asset = provider_->fetch(symbol, options_.start_date, options_.end_date);
            PriceHistory market = provider_->fetch(options_.market_symbol,
                                                   options_.start_date, options_.end_date);
            return analyze(asset, market);
        }

        AnalysisResult AnalysisOrchestrator::analyze(const PriceHistory &asset,
                                                     const PriceHistory &market) const
        {
            // Rolling windows run over observations, so both legs must share them
            auto dates = common_dates(asset.dates(), market.dates());
            if (dates.size() < 2)
            {
                throw std::runtime_error(
                    "Need at least 2 common observations for " + asset.symbol() + " and " + market.symbol() + ", got: " + std::to_string(dates.size()));
            }

            PriceHistory aligned_asset = asset.select_dates(dates);
            PriceHistory aligned_market = market.select_dates(dates);

            TimeSeries asset_close = aligned_asset.closes();
            TimeSeries market_close = aligned_market.closes();

            TimeSeries asset_returns = analytics::ReturnsTransform::compute(asset_close);
            TimeSeries market_returns = analytics::ReturnsTransform::compute(market_close);

            analytics::PerformanceRatioEngine ratio_engine(options_.window);
            analytics::VolatilityAdjustedRatioEngine adjusted_engine(options_.window);

            TimeSeries performance = ratio_engine.compute(asset_returns);
            TimeSeries adjusted = adjusted_engine.compute(asset_returns,
                                                          aligned_asset.highs(),
                                                          aligned_asset.lows(),
                                                          asset_close);

            AnalysisResult result;
            result.symbol = asset.symbol();
            result.market_symbol = market.symbol();
            result.window = options_.window;
            result.smoothed = smoother_ != nullptr;
            result.performance_ratio = analyze_metric(AnalysisResult::metric_names()[0],
                                                      performance, market_returns);
            result.volatility_adjusted_ratio = analyze_metric(AnalysisResult::metric_names()[1],
                                                              adjusted, market_returns);
            result.asset_prices = asset_close;
            result.market_prices = market_close;

            return result;
        }

        BatchResult AnalysisOrchestrator::analyze_batch(const std::vector<std::string> &symbols) const
        {
            BatchResult batch;

            for (const auto &symbol : symbols)
            {
                try
                {
                    batch.results.push_back(analyze(symbol));
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Error analyzing " << symbol << ": " << e.what() << "\n";
                    batch.failures.emplace_back(symbol, e.what());
                }
            }

            return batch;
        }

        MetricAnalysis AnalysisOrchestrator::analyze_metric(const std::string &name,
                                                            const TimeSeries &ratio,
                                                            const TimeSeries &market_returns) const
        {
            analytics::RegimeSensitivityAnalyzer analyzer(options_.window);

            MetricAnalysis metric;
            metric.name = name;
            metric.ratio = ratio;
            metric.measures = analyzer.analyze(ratio, market_returns);

            if (smoother_)
            {
                metric.measures = metric.measures.transform(
                    [this](const TimeSeries &series)
                    { return smoother_->apply(series); });
            }

            return metric;
        }

    } // namespace pipeline
} // namespace sensitivity
