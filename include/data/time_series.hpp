/**
 * @file time_series.hpp
 * @brief Date-indexed numeric series with explicit missing values.
 *
 * Every intermediate and output quantity of the sensitivity pipeline is a
 * TimeSeries: an ordered sequence of (date, optional value) pairs with
 * strictly increasing ISO dates. Missing values are represented by an
 * empty std::optional so that rolling windows can detect insufficient data.
 */

#ifndef TIME_SERIES_HPP
#define TIME_SERIES_HPP

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace sensitivity
{
    /**
     * @brief A single possibly-missing observation.
     */
    using Value = std::optional<double>;

    /**
     * @class TimeSeries
     * @brief Ordered (date, value) sequence with explicit missing entries.
     *
     * @note Dates are "YYYY-MM-DD" strings and must be strictly increasing.
     * @note Instances are never mutated by the analytics stages; every stage
     *       returns a new series on the same index.
     */
    class TimeSeries
    {
    public:
        /**
         * @brief Construct an empty series.
         */
        TimeSeries() = default;

        /**
         * @brief Construct from dates and optional values.
         * @param dates Strictly increasing date strings.
         * @param values One value per date.
         * @throws std::invalid_argument if sizes differ or dates are not
         *         strictly increasing.
         */
        TimeSeries(const std::vector<std::string> &dates,
                   const std::vector<Value> &values);

        /**
         * @brief Construct a series of all-missing values on a date index.
         * @param dates Strictly increasing date strings.
         */
        explicit TimeSeries(const std::vector<std::string> &dates);

        /**
         * @brief Build a series from raw doubles, mapping NaN/Inf to missing.
         * @param dates Strictly increasing date strings.
         * @param values Raw values (non-finite entries become missing).
         * @return New TimeSeries.
         */
        static TimeSeries from_doubles(const std::vector<std::string> &dates,
                                       const std::vector<double> &values);

        ~TimeSeries() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        size_t size() const
        {
            return values_.size();
        }

        bool empty() const
        {
            return values_.empty();
        }

        const std::vector<std::string> &dates() const
        {
            return dates_;
        }

        const std::vector<Value> &values() const
        {
            return values_;
        }

        const std::string &date(size_t i) const
        {
            return dates_.at(i);
        }

        const Value &operator[](size_t i) const
        {
            return values_[i];
        }

        const Value &at(size_t i) const
        {
            return values_.at(i);
        }

        bool has_value(size_t i) const
        {
            return values_.at(i).has_value();
        }

        /**
         * @brief Set the value at an index (finite values only).
         * @param i Position in the series.
         * @param value New value; non-finite doubles are stored as missing.
         */
        void set(size_t i, const Value &value);

        /**
         * @brief Check that another series shares this series' date index.
         */
        bool same_index(const TimeSeries &other) const
        {
            return dates_ == other.dates_;
        }

        /** ===========================================
         *  Statistics and Conversion
         *  ===========================================
         */

        /**
         * @brief Number of missing entries.
         */
        size_t count_missing() const;

        /**
         * @brief Number of present entries.
         */
        size_t count_valid() const
        {
            return size() - count_missing();
        }

        /**
         * @brief Arithmetic mean of the present values.
         * @return Mean, or missing if every entry is missing.
         */
        Value mean() const;

        /**
         * @brief First present value, if any.
         */
        Value first_valid() const;

        /**
         * @brief Convert to an Eigen vector with NaN in place of missing.
         */
        Eigen::VectorXd to_eigen() const;

        /**
         * @brief Return a copy restricted to the given dates.
         * @param dates Subset of this series' dates, in increasing order.
         * @throws std::invalid_argument if a date is not in the series.
         */
        TimeSeries reindex(const std::vector<std::string> &dates) const;

    private:
        void validate_dates() const;

        std::vector<std::string> dates_; ///< Observation dates
        std::vector<Value> values_;      ///< Observation values
    };

    /**
     * @brief Dates present in both inputs, in increasing order.
     */
    std::vector<std::string> common_dates(const std::vector<std::string> &a,
                                          const std::vector<std::string> &b);

} // namespace sensitivity

#endif // TIME_SERIES_HPP
