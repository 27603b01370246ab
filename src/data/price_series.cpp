/**
 * @file price_series.cpp
 * @brief Implementation of PriceSeries, ReturnSeries and date helpers
 */

#include "data/price_series.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace equity
{
    namespace data
    {

        // ===================================================================
        // Date helpers
        // ===================================================================

        bool is_valid_date(const std::string &date)
        {
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

            int month = std::stoi(date.substr(5, 2));
            int day = std::stoi(date.substr(8, 2));
            return month >= 1 && month <= 12 && day >= 1 && day <= 31;
        }

        std::vector<std::string> intersect_dates(const std::vector<std::string> &a,
                                                 const std::vector<std::string> &b)
        {
            std::vector<std::string> common;
            std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                                  std::back_inserter(common));
            return common;
        }

        std::pair<ReturnSeries, ReturnSeries> align(const ReturnSeries &a,
                                                    const ReturnSeries &b)
        {
            ReturnSeries out_a;
            ReturnSeries out_b;

            size_t i = 0;
            size_t j = 0;
            while (i < a.size() && j < b.size())
            {
                if (a.dates[i] < b.dates[j])
                {
                    ++i;
                }
                else if (b.dates[j] < a.dates[i])
                {
                    ++j;
                }
                else
                {
                    out_a.dates.push_back(a.dates[i]);
                    out_a.values.push_back(a.values[i]);
                    out_b.dates.push_back(b.dates[j]);
                    out_b.values.push_back(b.values[j]);
                    ++i;
                    ++j;
                }
            }

            return {out_a, out_b};
        }

        ReturnSeries calculate_returns(const PriceSeries &series)
        {
            ReturnSeries returns;
            const auto &bars = series.bars();

            for (size_t i = 1; i < bars.size(); ++i)
            {
                double p_t = bars[i].close;
                double p_tm1 = bars[i - 1].close;

                if (!std::isfinite(p_t) || !std::isfinite(p_tm1) || p_tm1 == 0.0)
                {
                    continue;
                }
                returns.dates.push_back(bars[i].date);
                returns.values.push_back((p_t - p_tm1) / p_tm1);
            }

            return returns;
        }

        // ===================================================================
        // DateRange
        // ===================================================================

        bool DateRange::contains(const std::string &date) const
        {
            if (!start.empty() && date < start)
                return false;
            if (!end.empty() && date > end)
                return false;
            return true;
        }

        void DateRange::validate() const
        {
            if (!start.empty() && !is_valid_date(start))
            {
                throw std::invalid_argument("Invalid start date (expected YYYY-MM-DD): '" + start + "'");
            }
            if (!end.empty() && !is_valid_date(end))
            {
                throw std::invalid_argument("Invalid end date (expected YYYY-MM-DD): '" + end + "'");
            }
            if (!start.empty() && !end.empty() && start > end)
            {
                throw std::invalid_argument("Start date " + start + " is after end date " + end);
            }
        }

        // ===================================================================
        // PriceSeries
        // ===================================================================

        PriceSeries::PriceSeries(const std::string &ticker, std::vector<PriceBar> bars)
            : ticker_(ticker), bars_(std::move(bars))
        {
            if (ticker_.empty())
            {
                throw std::invalid_argument("PriceSeries ticker cannot be empty");
            }

            for (const auto &bar : bars_)
            {
                if (!is_valid_date(bar.date))
                {
                    throw std::invalid_argument(
                        "Invalid bar date for " + ticker_ + ": '" + bar.date + "'");
                }
            }

            std::sort(bars_.begin(), bars_.end(),
                      [](const PriceBar &a, const PriceBar &b)
                      { return a.date < b.date; });

            for (size_t i = 1; i < bars_.size(); ++i)
            {
                if (bars_[i].date == bars_[i - 1].date)
                {
                    throw std::invalid_argument(
                        "Duplicate bar date for " + ticker_ + ": " + bars_[i].date);
                }
            }
        }

        std::vector<std::string> PriceSeries::dates() const
        {
            std::vector<std::string> out;
            out.reserve(bars_.size());
            for (const auto &bar : bars_)
            {
                out.push_back(bar.date);
            }
            return out;
        }

        std::vector<double> PriceSeries::closes() const
        {
            std::vector<double> out;
            out.reserve(bars_.size());
            for (const auto &bar : bars_)
            {
                out.push_back(bar.close);
            }
            return out;
        }

        double PriceSeries::last_close() const
        {
            if (bars_.empty())
            {
                throw std::out_of_range("No bars in price series for " + ticker_);
            }
            return bars_.back().close;
        }

        PriceSeries PriceSeries::slice(const DateRange &range) const
        {
            PriceSeries out;
            out.ticker_ = ticker_;
            for (const auto &bar : bars_)
            {
                if (range.contains(bar.date))
                {
                    out.bars_.push_back(bar);
                }
            }
            return out;
        }

        // ===================================================================
        // ReturnSeries
        // ===================================================================

        void ReturnSeries::append(const std::string &date, double value)
        {
            if (!dates.empty() && !(dates.back() < date))
            {
                throw std::invalid_argument(
                    "Return dates must be strictly increasing: " + date + " after " + dates.back());
            }
            dates.push_back(date);
            values.push_back(value);
        }

    } // namespace data
} // namespace equity
