/**
 * @file time_series.cpp
 * @brief Implementation of TimeSeries
 */

#include "data/time_series.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace sensitivity
{

    // ============================================================================
    // Constructors
    // ============================================================================

    TimeSeries::TimeSeries(const std::vector<std::string> &dates,
                           const std::vector<Value> &values)
        : dates_(dates), values_(values)
    {
        if (dates_.size() != values_.size())
        {
            throw std::invalid_argument(
                "Dates size (" + std::to_string(dates_.size()) + ") must match values size (" + std::to_string(values_.size()) + ")");
        }
        validate_dates();

        for (auto &v : values_)
        {
            if (v && !std::isfinite(*v))
            {
                v.reset();
            }
        }
    }

    TimeSeries::TimeSeries(const std::vector<std::string> &dates)
        : dates_(dates), values_(dates.size())
    {
        validate_dates();
    }

    TimeSeries TimeSeries::from_doubles(const std::vector<std::string> &dates,
                                        const std::vector<double> &values)
    {
        std::vector<Value> converted;
        converted.reserve(values.size());
        for (double v : values)
        {
            if (std::isfinite(v))
            {
                converted.emplace_back(v);
            }
            else
            {
                converted.emplace_back(std::nullopt);
            }
        }
        return TimeSeries(dates, converted);
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    void TimeSeries::set(size_t i, const Value &value)
    {
        if (i >= values_.size())
        {
            throw std::out_of_range("TimeSeries index out of range: " + std::to_string(i));
        }
        if (value && std::isfinite(*value))
        {
            values_[i] = value;
        }
        else
        {
            values_[i].reset();
        }
    }

    // ============================================================================
    // Statistics and Conversion
    // ============================================================================

    size_t TimeSeries::count_missing() const
    {
        return static_cast<size_t>(std::count_if(values_.begin(), values_.end(),
                                                 [](const Value &v)
                                                 { return !v.has_value(); }));
    }

    Value TimeSeries::mean() const
    {
        double sum = 0.0;
        size_t count = 0;
        for (const auto &v : values_)
        {
            if (v)
            {
                sum += *v;
                ++count;
            }
        }
        if (count == 0)
        {
            return std::nullopt;
        }
        return sum / static_cast<double>(count);
    }

    Value TimeSeries::first_valid() const
    {
        for (const auto &v : values_)
        {
            if (v)
            {
                return v;
            }
        }
        return std::nullopt;
    }

    Eigen::VectorXd TimeSeries::to_eigen() const
    {
        Eigen::VectorXd out(static_cast<Eigen::Index>(values_.size()));
        for (size_t i = 0; i < values_.size(); ++i)
        {
            out(static_cast<Eigen::Index>(i)) =
                values_[i] ? *values_[i] : std::numeric_limits<double>::quiet_NaN();
        }
        return out;
    }

    TimeSeries TimeSeries::reindex(const std::vector<std::string> &dates) const
    {
        std::vector<Value> out;
        out.reserve(dates.size());

        // Both date vectors are sorted, so a single forward scan suffices
        size_t j = 0;
        for (const auto &d : dates)
        {
            while (j < dates_.size() && dates_[j] < d)
            {
                ++j;
            }
            if (j == dates_.size() || dates_[j] != d)
            {
                throw std::invalid_argument("Date not found in series: " + d);
            }
            out.push_back(values_[j]);
        }

        return TimeSeries(dates, out);
    }

    // ============================================================================
    // Private Helper Methods
    // ============================================================================

    void TimeSeries::validate_dates() const
    {
        for (size_t i = 1; i < dates_.size(); ++i)
        {
            if (!(dates_[i - 1] < dates_[i]))
            {
                throw std::invalid_argument(
                    "Dates must be strictly increasing: " + dates_[i - 1] + " then " + dates_[i]);
            }
        }
    }

    std::vector<std::string> common_dates(const std::vector<std::string> &a,
                                          const std::vector<std::string> &b)
    {
        std::vector<std::string> out;
        std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                              std::back_inserter(out));
        return out;
    }

} // namespace sensitivity
