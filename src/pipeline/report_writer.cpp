/**
 * @file report_writer.cpp
 * @brief Implementation of ReportWriter.
 */

#include "pipeline/report_writer.hpp"

#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace sensitivity
{
    namespace pipeline
    {

        namespace
        {
            void write_value(std::ostream &os, const Value &v)
            {
                os << ",";
                if (v)
                {
                    os << std::fixed << std::setprecision(8) << *v;
                }
            }
        } // namespace

        void ReportWriter::print_summary(const AnalysisResult &result, std::ostream &os)
        {
            os << "\nPerformance Analysis Summary: " << result.symbol
               << " vs " << result.market_symbol
               << " (window=" << result.window
               << (result.smoothed ? ", smoothed" : "") << ")\n";

            for (const auto &metric_name : AnalysisResult::metric_names())
            {
                os << "\n"
                   << metric_name << ":\n";
                for (const auto &measure_name : analytics::SensitivityBundle::measure_names())
                {
                    auto mean = result.series(metric_name, measure_name).mean();
                    os << measure_name << ": ";
                    if (mean)
                    {
                        os << std::fixed << std::setprecision(3) << *mean;
                    }
                    else
                    {
                        os << "n/a";
                    }
                    os << "\n";
                }
            }
        }

        void ReportWriter::print_batch_summary(const BatchResult &batch, std::ostream &os)
        {
            os << std::string(60, '-') << "\n";
            os << "Symbols analyzed: " << batch.num_succeeded()
               << ", failed: " << batch.num_failed() << "\n";
            for (const auto &failure : batch.failures)
            {
                os << "  " << std::setw(16) << std::left << failure.first
                   << failure.second << "\n";
            }
            os << std::string(60, '-') << "\n";
        }

        void ReportWriter::export_to_csv(const AnalysisResult &result, const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            TimeSeries norm_asset = normalize_to_base(result.asset_prices);
            TimeSeries norm_market = normalize_to_base(result.market_prices);

            std::vector<const TimeSeries *> columns = {
                &result.asset_prices,
                &result.market_prices,
                &norm_asset,
                &norm_market,
                &result.performance_ratio.ratio,
                &result.volatility_adjusted_ratio.ratio};

            // Write header
            file << "date,asset_close,market_close,asset_normalized,market_normalized,"
                 << "performance_ratio,volatility_adjusted_ratio";
            for (const auto &metric_name : AnalysisResult::metric_names())
            {
                for (const auto &measure_name : analytics::SensitivityBundle::measure_names())
                {
                    file << "," << metric_name << "." << measure_name;
                    columns.push_back(&result.series(metric_name, measure_name));
                }
            }
            file << "\n";

            const auto &dates = result.dates();
            for (size_t i = 0; i < dates.size(); ++i)
            {
                file << dates[i];
                for (const TimeSeries *column : columns)
                {
                    write_value(file, (*column)[i]);
                }
                file << "\n";
            }

            file.close();
        }

        std::string ReportWriter::csv_filename(const std::string &symbol)
        {
            return symbol + "_sensitivity.csv";
        }

    } // namespace pipeline
} // namespace sensitivity
