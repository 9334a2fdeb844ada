/**
 * @file report_writer.hpp
 * @brief Console summaries and CSV export of analysis results.
 *
 * The CSV layout is meant for an external chart renderer: one row per
 * aligned date with raw and normalized prices, both ratio series and the
 * eight sensitivity series. Missing values are written as empty fields.
 */

#ifndef SENSITIVITY_PIPELINE_REPORT_WRITER_HPP
#define SENSITIVITY_PIPELINE_REPORT_WRITER_HPP

#include "pipeline/analysis_result.hpp"

#include <iosfwd>
#include <string>

namespace sensitivity
{
    namespace pipeline
    {

        /**
         * @class ReportWriter
         * @brief Formats AnalysisResult and BatchResult for people and tools.
         */
        class ReportWriter
        {
        public:
            /**
             * @brief Print the mean of every sensitivity series.
             *
             * Format per metric:
             * @code
             *   Performance_Ratio:
             *   upside_sensitivity: 0.123
             *   ...
             * @endcode
             */
            static void print_summary(const AnalysisResult &result, std::ostream &os);

            /**
             * @brief Print succeeded/failed symbol counts and failure messages.
             */
            static void print_batch_summary(const BatchResult &batch, std::ostream &os);

            /**
             * @brief Write a result to CSV.
             * @throws std::runtime_error If the file cannot be opened.
             */
            static void export_to_csv(const AnalysisResult &result, const std::string &filepath);

            /**
             * @brief Output file name for a symbol, e.g. "SOL-USD_sensitivity.csv".
             */
            static std::string csv_filename(const std::string &symbol);
        };

    } // namespace pipeline
} // namespace sensitivity

#endif // SENSITIVITY_PIPELINE_REPORT_WRITER_HPP
