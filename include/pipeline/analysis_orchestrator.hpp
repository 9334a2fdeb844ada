/**
 * @file analysis_orchestrator.hpp
 * @brief End-to-end regime sensitivity analysis of an asset vs the market.
 *
 * Pipeline per symbol:
 *   1. Fetch asset and market histories from the PriceProvider.
 *   2. Align both on their common dates.
 *   3. Simple returns of both close series.
 *   4. Performance ratio and volatility-adjusted ratio of asset returns.
 *   5. Regime sensitivity of each ratio against market returns.
 *   6. Optional smoothing of each of the eight sensitivity series.
 *   7. Package into an AnalysisResult.
 */

#ifndef SENSITIVITY_PIPELINE_ANALYSIS_ORCHESTRATOR_HPP
#define SENSITIVITY_PIPELINE_ANALYSIS_ORCHESTRATOR_HPP

#include "analytics/smoothing_filter.hpp"
#include "data/price_history.hpp"
#include "data/price_provider.hpp"
#include "pipeline/analysis_result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sensitivity
{
    namespace pipeline
    {

        /**
         * @struct OrchestratorOptions
         * @brief Parameters shared by every symbol of a run.
         */
        struct OrchestratorOptions
        {
            std::string market_symbol = "BTC-USD"; ///< Benchmark symbol
            std::string start_date = "2020-01-01"; ///< Inclusive
            std::string end_date = "2025-01-01";   ///< Exclusive
            int window = 30;                       ///< Rolling window for every stage
        };

        /**
         * @class AnalysisOrchestrator
         * @brief Sequences the analytics stages over one asset/market pair.
         *
         * The orchestrator owns no series between calls; every analyze()
         * call is independent.
         */
        class AnalysisOrchestrator
        {
        public:
            /**
             * @brief Construct an orchestrator.
             * @param provider Price source (required).
             * @param options Market symbol, date range and window.
             * @param smoother Optional post-processing filter (nullptr = none).
             * @throws std::invalid_argument If provider is null, the window is
             *         < 1 or the market symbol is empty.
             */
            AnalysisOrchestrator(std::shared_ptr<const PriceProvider> provider,
                                 const OrchestratorOptions &options,
                                 std::shared_ptr<const analytics::SmoothingFilter> smoother = nullptr);

            /**
             * @brief Fetch and analyze one symbol against the market.
             * @throws std::runtime_error If either fetch fails or the aligned
             *         histories hold fewer than two observations.
             */
            AnalysisResult analyze(const std::string &symbol) const;

            /**
             * @brief Analyze already fetched histories.
             * @throws std::runtime_error If the aligned histories hold fewer
             *         than two observations.
             */
            AnalysisResult analyze(const PriceHistory &asset,
                                   const PriceHistory &market) const;

            /**
             * @brief Analyze several symbols; a failing symbol is logged to
             *        std::cerr, recorded and skipped.
             */
            BatchResult analyze_batch(const std::vector<std::string> &symbols) const;

            const OrchestratorOptions &options() const
            {
                return options_;
            }

        private:
            MetricAnalysis analyze_metric(const std::string &name,
                                          const TimeSeries &ratio,
                                          const TimeSeries &market_returns) const;

            std::shared_ptr<const PriceProvider> provider_;
            OrchestratorOptions options_;
            std::shared_ptr<const analytics::SmoothingFilter> smoother_;
        };

    } // namespace pipeline
} // namespace sensitivity

#endif // SENSITIVITY_PIPELINE_ANALYSIS_ORCHESTRATOR_HPP
