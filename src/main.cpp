/**
 * @file main.cpp
 * @brief Main entry point for the Regime Sensitivity Analyzer
 *
 * Command-line application that loads configuration, fetches price
 * histories, runs the regime sensitivity pipeline for each configured
 * symbol against the market benchmark and reports the results.
 */

#include "analytics/smoothing_filter.hpp"
#include "data/data_loader.hpp"
#include "data/price_provider.hpp"
#include "pipeline/analysis_orchestrator.hpp"
#include "pipeline/report_writer.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace sensitivity;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Regime Sensitivity Analyzer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (overrides config)\n"
              << "  --symbol SYM          Analyze SYM (repeatable, overrides config symbols)\n"
              << "  --window N            Rolling window (overrides config)\n"
              << "  --no-smoothing        Disable Savitzky-Golay smoothing\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/analysis_config.json --verbose\n"
              << "  " << program_name << " --config data/config/analysis_config.json --symbol SOL-USD --window 60\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Regime Sensitivity Analyzer v1.0.0                      \n"
              << "       Up/Down Market Sensitivity of Performance Ratios        \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir;
    std::vector<std::string> symbols;
    int window = 0;
    bool no_smoothing = false;
    bool verbose = false;
    bool show_help = false;
    bool parse_error = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--symbol" && i + 1 < argc)
            {
                args.symbols.push_back(argv[++i]);
            }
            else if (arg == "--window" && i + 1 < argc)
            {
                std::string value = argv[++i];
                try
                {
                    args.window = std::stoi(value);
                }
                catch (const std::exception &)
                {
                    std::cerr << "Error: Invalid window: " << value << std::endl;
                    args.parse_error = true;
                }
            }
            else if (arg == "--no-smoothing")
            {
                args.no_smoothing = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !parse_error && !config_path.empty();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);

        if (!args.symbols.empty())
        {
            config.data.symbols = args.symbols;
        }
        if (args.window > 0)
        {
            config.analysis.window = args.window;
        }
        if (args.no_smoothing)
        {
            config.smoothing.enabled = false;
        }
        if (!args.output_dir.empty())
        {
            config.output.directory = args.output_dir;
        }

        config.validate();

        if (args.verbose)
        {
            std::cout << "  - Symbols: ";
            for (const auto &symbol : config.data.symbols)
            {
                std::cout << symbol << " ";
            }
            std::cout << "\n  - Market: " << config.data.market_symbol << "\n";
            std::cout << "  - Date range: [" << config.data.start_date
                      << ", " << config.data.end_date << ")\n";
            std::cout << "  - Window: " << config.analysis.window << "\n";
            std::cout << "  - Data directory: " << config.data.data_dir << "\n";
        }

        // ====================================================================
        // 2. Set Up Pipeline
        // ====================================================================
        std::cout << "[2/4] Setting up analysis pipeline..." << std::endl;

        auto provider = std::make_shared<CsvPriceProvider>(config.data.data_dir);
        std::shared_ptr<const analytics::SmoothingFilter> smoother =
            analytics::create_smoothing_filter(config.smoothing);

        if (args.verbose)
        {
            std::cout << "  - Price provider: " << provider->get_name() << "\n";
            std::cout << "  - Smoothing: "
                      << (smoother ? smoother->get_name() : std::string("disabled")) << "\n";
        }

        pipeline::OrchestratorOptions options;
        options.market_symbol = config.data.market_symbol;
        options.start_date = config.data.start_date;
        options.end_date = config.data.end_date;
        options.window = config.analysis.window;

        pipeline::AnalysisOrchestrator orchestrator(provider, options, smoother);

        // ====================================================================
        // 3. Analyze Symbols
        // ====================================================================
        std::cout << "[3/4] Analyzing " << config.data.symbols.size()
                  << " symbol(s) against " << config.data.market_symbol << "..." << std::endl;

        pipeline::BatchResult batch;
        for (const auto &symbol : config.data.symbols)
        {
            std::cout << "\nWorking " << symbol << " ..." << std::endl;

            auto single = orchestrator.analyze_batch({symbol});
            for (auto &result : single.results)
            {
                if (args.verbose)
                {
                    std::cout << "  - Observations: " << result.dates().size()
                              << " (" << result.dates().front() << " to "
                              << result.dates().back() << ")\n";
                }
                pipeline::ReportWriter::print_summary(result, std::cout);
                batch.results.push_back(std::move(result));
            }
            for (auto &failure : single.failures)
            {
                batch.failures.push_back(std::move(failure));
            }
        }

        // ====================================================================
        // 4. Export Results
        // ====================================================================
        if (config.output.export_csv && !batch.results.empty())
        {
            std::cout << "\n[4/4] Exporting results to " << config.output.directory << "..." << std::endl;

            std::filesystem::create_directories(config.output.directory);
            for (const auto &result : batch.results)
            {
                std::string path = (std::filesystem::path(config.output.directory) /
                                    pipeline::ReportWriter::csv_filename(result.symbol))
                                       .string();
                pipeline::ReportWriter::export_to_csv(result, path);
                if (args.verbose)
                {
                    std::cout << "  - Wrote " << path << "\n";
                }
            }
        }
        else
        {
            std::cout << "\n[4/4] Skipping export\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n";
        pipeline::ReportWriter::print_batch_summary(batch, std::cout);
        std::cout << "Analysis completed in " << duration << " ms\n"
                  << std::endl;

        return batch.results.empty() ? 1 : 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    // Print banner
    print_banner();

    // Run analysis
    return run(args);
}
