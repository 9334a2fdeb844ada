/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load OHLC price histories from CSV files and
 * analysis configuration from JSON files.
 */

#ifndef DATA_LOADER_HPP
#define DATA_LOADER_HPP

#include "price_history.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sensitivity {

/**
 * @struct DataConfig
 * @brief Configuration parameters for price data retrieval
 */
struct DataConfig {
    std::string data_dir;                      ///< Directory holding <SYMBOL>.csv files
    std::vector<std::string> symbols;          ///< Assets to analyze
    std::string market_symbol;                 ///< Market benchmark symbol
    std::string start_date;                    ///< Inclusive start date
    std::string end_date;                      ///< Exclusive end date

    /**
     * @brief Load from JSON object
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct WindowConfig
 * @brief Rolling window parameters for the sensitivity pipeline
 */
struct WindowConfig {
    int window;                                ///< Trailing observations per rolling step

    static WindowConfig from_json(const nlohmann::json& j);
};

/**
 * @struct SmoothingConfig
 * @brief Post-processing smoothing parameters
 */
struct SmoothingConfig {
    bool enabled;                              ///< Apply smoothing to sensitivity series
    int window_length;                         ///< Odd filter window length
    int polyorder;                             ///< Local polynomial degree

    static SmoothingConfig from_json(const nlohmann::json& j);
};

/**
 * @struct OutputConfig
 * @brief Result export parameters
 */
struct OutputConfig {
    std::string directory;                     ///< Output directory for CSV exports
    bool export_csv;                           ///< Write one CSV per analyzed symbol

    static OutputConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AnalysisConfig
 * @brief Complete analysis configuration
 */
struct AnalysisConfig {
    DataConfig data = DataConfig::from_json(nlohmann::json::object());
    WindowConfig analysis = WindowConfig::from_json(nlohmann::json::object());
    SmoothingConfig smoothing = SmoothingConfig::from_json(nlohmann::json::object());
    OutputConfig output = OutputConfig::from_json(nlohmann::json::object());

    /**
     * @brief Check configuration consistency
     * @throws std::invalid_argument on a non-positive window, an empty
     *         symbol list or market symbol, or invalid smoothing parameters
     */
    void validate() const;

    /**
     * @brief Load complete configuration from JSON file
     */
    static AnalysisConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and parses price histories and configuration
 *
 * Price CSV format (one file per symbol):
 * date,open,high,low,close[,volume,...]
 * 2020-01-02,100.0,101.5,99.2,100.8
 */
class DataLoader {
public:
    DataLoader() = default;

    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load an OHLC price history from a CSV file
     *
     * Rows with malformed dates or a missing close are skipped. Rows are
     * sorted by date after loading.
     *
     * @param filepath Path to CSV file
     * @param symbol Symbol to attach to the history
     * @return PriceHistory in increasing date order
     * @throws std::runtime_error if the file cannot be opened, lacks the
     *         required columns, contains duplicate dates or has no valid rows
     */
    static PriceHistory load_price_csv(const std::string& filepath,
                                       const std::string& symbol);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @param filepath Path to JSON config file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete analysis configuration
     * @param config_path Path to config JSON file
     * @return AnalysisConfig struct
     */
    static AnalysisConfig load_config(const std::string& config_path);

    /**
     * @brief Build configuration from an already parsed JSON document
     */
    static AnalysisConfig config_from_json(const nlohmann::json& j);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate a synthetic OHLC history
     *
     * Close-to-close returns follow drift + beta * factor + noise. High and
     * low are placed around the open/close range with a random intrabar
     * extension.
     *
     * @param symbol Ticker symbol
     * @param num_days Number of daily bars
     * @param start_date Starting date
     * @param volatility Daily idiosyncratic volatility (default 0.02)
     * @param drift Daily drift (default 0.0005)
     * @param seed Random seed for reproducible output
     * @param factor_returns Optional common factor returns (size num_days)
     * @param beta Loading on factor_returns
     * @return PriceHistory with synthetic bars
     */
    static PriceHistory generate_synthetic_history(
        const std::string& symbol,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        unsigned int seed = 42,
        const std::vector<double>& factor_returns = {},
        double beta = 0.0
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Save a price history to CSV
     * @param history PriceHistory object
     * @param filepath Output file path
     */
    static void save_price_csv(const PriceHistory& history, const std::string& filepath);

private:
    // ========================
    // Private Helper Methods
    // ========================

    static std::vector<std::string> parse_csv_line(const std::string& line);

    static bool is_valid_date_format(const std::string& date);

    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to a price
     * @return Value, or missing if conversion fails
     */
    static Value safe_stod(const std::string& str);

    static std::string add_days(const std::string& start_date, int days_offset);
};

} // namespace sensitivity

#endif // DATA_LOADER_HPP
