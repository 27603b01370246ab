/**
 * @file price_series.hpp
 * @brief Per-ticker OHLCV history and derived return series.
 *
 * Dates are carried as "YYYY-MM-DD" strings throughout the code base, so
 * lexicographic order equals chronological order.
 */

#ifndef EQUITY_DATA_PRICE_SERIES_HPP
#define EQUITY_DATA_PRICE_SERIES_HPP

#include <string>
#include <utility>
#include <vector>

namespace equity
{
    namespace data
    {

        /**
         * @struct PriceBar
         * @brief One trading day of a single instrument.
         */
        struct PriceBar
        {
            std::string date; ///< Trading date (YYYY-MM-DD), unique per ticker
            double open = 0.0;
            double high = 0.0;
            double low = 0.0;
            double close = 0.0;
            double volume = 0.0;
        };

        /**
         * @struct DateRange
         * @brief Inclusive date window. An empty bound is unbounded.
         */
        struct DateRange
        {
            std::string start; ///< First date included ("" = from the beginning)
            std::string end;   ///< Last date included ("" = up to the latest bar)

            bool contains(const std::string &date) const;

            /**
             * @brief Validate bound formats and ordering.
             * @throws std::invalid_argument If a bound is malformed or start > end.
             */
            void validate() const;
        };

        /**
         * @class PriceSeries
         * @brief Ordered price history of one ticker.
         *
         * Bars are kept sorted by strictly increasing date. The series is
         * read-only input to the analytics layer.
         */
        class PriceSeries
        {
        public:
            PriceSeries() = default;

            /**
             * @brief Construct from bars, sorting them by date.
             * @param ticker Instrument identifier.
             * @param bars Bars in any order.
             * @throws std::invalid_argument If the ticker is empty, a date is
             *         malformed, or two bars share a date.
             */
            PriceSeries(const std::string &ticker, std::vector<PriceBar> bars);

            const std::string &ticker() const { return ticker_; }
            const std::vector<PriceBar> &bars() const { return bars_; }
            size_t size() const { return bars_.size(); }
            bool empty() const { return bars_.empty(); }

            std::vector<std::string> dates() const;
            std::vector<double> closes() const;

            /** @brief Close of the latest bar. @throws std::out_of_range if empty. */
            double last_close() const;

            /**
             * @brief Bars falling inside a date window.
             * @param range Inclusive window.
             * @return New series with the same ticker (possibly empty).
             */
            PriceSeries slice(const DateRange &range) const;

        private:
            std::string ticker_;
            std::vector<PriceBar> bars_;
        };

        /**
         * @struct ReturnSeries
         * @brief Ordered (date, fractional return) observations.
         */
        struct ReturnSeries
        {
            std::vector<std::string> dates;
            std::vector<double> values;

            size_t size() const { return values.size(); }
            bool empty() const { return values.empty(); }

            /**
             * @brief Append one observation.
             * @throws std::invalid_argument If date does not follow the last date.
             */
            void append(const std::string &date, double value);
        };

        /**
         * @brief Simple daily returns from closes
         *
         * return[t] = (close[t] - close[t-1]) / close[t-1], dated at t. The
         * first bar has no return; dates whose previous close is zero or not
         * finite (or whose own close is not finite) are left out.
         *
         * @param series Price history of one ticker
         * @return Return series (empty for fewer than 2 bars)
         */
        ReturnSeries calculate_returns(const PriceSeries &series);

        /**
         * @brief Check the YYYY-MM-DD layout of a date string.
         */
        bool is_valid_date(const std::string &date);

        /**
         * @brief Dates present in both sorted date vectors.
         * @return Sorted intersection.
         */
        std::vector<std::string> intersect_dates(const std::vector<std::string> &a,
                                                 const std::vector<std::string> &b);

        /**
         * @brief Restrict two return series to their common dates.
         * @return Pair of series sharing the same date vector, in input order.
         */
        std::pair<ReturnSeries, ReturnSeries> align(const ReturnSeries &a,
                                                    const ReturnSeries &b);

    } // namespace data
} // namespace equity

#endif // EQUITY_DATA_PRICE_SERIES_HPP
