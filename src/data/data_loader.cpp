/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>

namespace sensitivity
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_dir = j.value("data_dir", "data/market");
        config.symbols = j.value("symbols", std::vector<std::string>{});
        config.market_symbol = j.value("market_symbol", "BTC-USD");
        config.start_date = j.value("start_date", "2020-01-01");
        config.end_date = j.value("end_date", "2025-01-01");
        return config;
    }

    WindowConfig WindowConfig::from_json(const nlohmann::json &j)
    {
        WindowConfig config;
        config.window = j.value("window", 30);
        return config;
    }

    SmoothingConfig SmoothingConfig::from_json(const nlohmann::json &j)
    {
        SmoothingConfig config;
        config.enabled = j.value("enabled", true);
        config.window_length = j.value("window_length", 21);
        config.polyorder = j.value("polyorder", 3);
        return config;
    }

    OutputConfig OutputConfig::from_json(const nlohmann::json &j)
    {
        OutputConfig config;
        config.directory = j.value("directory", "results");
        config.export_csv = j.value("export_csv", true);
        return config;
    }

    void AnalysisConfig::validate() const
    {
        if (analysis.window < 1)
        {
            throw std::invalid_argument(
                "Expected analysis window >= 1, got: " + std::to_string(analysis.window));
        }
        if (data.symbols.empty())
        {
            throw std::invalid_argument("At least one symbol must be configured");
        }
        if (data.market_symbol.empty())
        {
            throw std::invalid_argument("Market symbol cannot be empty");
        }
        if (!data.start_date.empty() && !data.end_date.empty() &&
            !(data.start_date < data.end_date))
        {
            throw std::invalid_argument(
                "start_date (" + data.start_date + ") must precede end_date (" + data.end_date + ")");
        }
        if (smoothing.enabled)
        {
            if (smoothing.window_length < 1 || smoothing.window_length % 2 == 0)
            {
                throw std::invalid_argument(
                    "Smoothing window_length must be a positive odd number, got: " + std::to_string(smoothing.window_length));
            }
            if (smoothing.polyorder < 0 || smoothing.polyorder >= smoothing.window_length)
            {
                throw std::invalid_argument(
                    "Smoothing polyorder must be in [0, window_length), got: " + std::to_string(smoothing.polyorder));
            }
        }
    }

    AnalysisConfig AnalysisConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading - OHLC Format
    // ===========================

    PriceHistory DataLoader::load_price_csv(const std::string &filepath,
                                            const std::string &symbol)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;

        // Read header line
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        std::map<std::string, size_t> columns;
        for (size_t i = 0; i < header.size(); ++i)
        {
            std::string name = trim(header[i]);
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            columns[name] = i;
        }

        for (const char *required : {"date", "high", "low", "close"})
        {
            if (!columns.count(required))
            {
                throw std::runtime_error(
                    "CSV " + filepath + " is missing required column '" + required + "'");
            }
        }

        const size_t date_col = columns["date"];
        const size_t high_col = columns["high"];
        const size_t low_col = columns["low"];
        const size_t close_col = columns["close"];
        const bool has_open = columns.count("open") > 0;
        const size_t open_col = has_open ? columns["open"] : 0;

        auto field = [](const std::vector<std::string> &fields, size_t idx) -> Value
        {
            if (idx < fields.size())
            {
                return safe_stod(fields[idx]);
            }
            return std::nullopt;
        };

        std::map<std::string, PriceBar> rows; // date -> bar, sorted

        // Read data rows
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (date_col >= fields.size())
                continue;

            // Accept full timestamps ("2020-01-02 00:00:00-05:00") by keeping the date part
            std::string date = trim(fields[date_col]).substr(0, 10);
            if (!is_valid_date_format(date))
            {
                continue; // Skip invalid dates
            }

            PriceBar bar;
            bar.date = date;
            bar.open = has_open ? field(fields, open_col) : std::nullopt;
            bar.high = field(fields, high_col);
            bar.low = field(fields, low_col);
            bar.close = field(fields, close_col);

            if (!bar.close)
            {
                continue;
            }

            if (!rows.emplace(date, bar).second)
            {
                throw std::runtime_error("Duplicate date " + date + " in " + filepath);
            }
        }

        file.close();

        if (rows.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        std::vector<PriceBar> bars;
        bars.reserve(rows.size());
        for (const auto &entry : rows)
        {
            bars.push_back(entry.second);
        }

        return PriceHistory(symbol, bars);
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    AnalysisConfig DataLoader::load_config(const std::string &config_path)
    {
        return config_from_json(load_json(config_path));
    }

    AnalysisConfig DataLoader::config_from_json(const nlohmann::json &j)
    {
        AnalysisConfig config;

        try
        {
            if (j.contains("data"))
            {
                config.data = DataConfig::from_json(j["data"]);
            }

            if (j.contains("analysis"))
            {
                config.analysis = WindowConfig::from_json(j["analysis"]);
            }

            if (j.contains("smoothing"))
            {
                config.smoothing = SmoothingConfig::from_json(j["smoothing"]);
            }

            if (j.contains("output"))
            {
                config.output = OutputConfig::from_json(j["output"]);
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
        }

        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PriceHistory DataLoader::generate_synthetic_history(
        const std::string &symbol,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        unsigned int seed,
        const std::vector<double> &factor_returns,
        double beta)
    {
        if (!factor_returns.empty() && factor_returns.size() != num_days)
        {
            throw std::invalid_argument(
                "Factor return series size (" + std::to_string(factor_returns.size()) + ") must match num_days (" + std::to_string(num_days) + ")");
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> noise(0.0, volatility);
        std::uniform_real_distribution<double> extension(0.0, volatility);

        std::vector<PriceBar> bars;
        bars.reserve(num_days);

        double prev_close = 100.0; // Initial price

        for (size_t i = 0; i < num_days; ++i)
        {
            double r = 0.0;
            if (i > 0)
            {
                double factor = factor_returns.empty() ? 0.0 : factor_returns[i];
                r = drift + beta * factor + noise(gen);
            }

            // Keep prices strictly positive (geometric walk)
            double close = std::max(prev_close * (1.0 + r), 1e-6);
            double open = prev_close;
            double high = std::max(open, close) * (1.0 + extension(gen));
            double low = std::min(open, close) * (1.0 - extension(gen));

            PriceBar bar;
            bar.date = add_days(start_date, static_cast<int>(i));
            bar.open = open;
            bar.high = high;
            bar.low = low;
            bar.close = close;
            bars.push_back(bar);

            prev_close = close;
        }

        return PriceHistory(symbol, bars);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_price_csv(const PriceHistory &history, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        // Write header
        file << "date,open,high,low,close\n";

        auto write_value = [&file](const Value &v)
        {
            file << ",";
            if (v)
            {
                file << std::fixed << std::setprecision(6) << *v;
            }
        };

        for (const auto &bar : history.bars())
        {
            file << bar.date;
            write_value(bar.open);
            write_value(bar.high);
            write_value(bar.low);
            write_value(bar.close);
            file << "\n";
        }

        file.close();
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    bool DataLoader::is_valid_date_format(const std::string &date)
    {
        // Simple check for YYYY-MM-DD format
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    Value DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::nullopt;
        }

        try
        {
            size_t consumed = 0;
            double v = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size() || !std::isfinite(v))
            {
                return std::nullopt;
            }
            return v;
        }
        catch (const std::invalid_argument &)
        {
            return std::nullopt;
        }
        catch (const std::out_of_range &)
        {
            return std::nullopt;
        }
    }

    std::string DataLoader::add_days(const std::string &start_date, int days_offset)
    {
        struct tm tm = {};
        std::istringstream ss(start_date);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail())
        {
            throw std::invalid_argument("Invalid start date: " + start_date);
        }

        // Normalize through mktime at midday so DST shifts never cross a day boundary
        tm.tm_hour = 12;
        tm.tm_mday += days_offset;
        tm.tm_isdst = -1;
        std::mktime(&tm);

        char buffer[11];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);

        return std::string(buffer);
    }

} // namespace sensitivity
