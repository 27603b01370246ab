/**
 * @file trade_ratio.cpp
 * @brief Implementation of RatioSeries and TradeRatioCalculator.
 */

#include "signals/trade_ratio.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <map>
#include <stdexcept>

namespace equity
{
    namespace signals
    {

        // ===================================================================
        // RatioSeries
        // ===================================================================

        double RatioSeries::current_ratio() const
        {
            if (ratio.empty())
            {
                throw NoOverlap("Ratio series " + ticker_a + "/" + ticker_b + " is empty");
            }
            return ratio.back();
        }

        std::optional<double> RatioSeries::current_moving_average() const
        {
            if (moving_average.empty())
            {
                return std::nullopt;
            }
            return moving_average.back();
        }

        nlohmann::json RatioSeries::to_json() const
        {
            nlohmann::json j;
            j["ticker_a"] = ticker_a;
            j["ticker_b"] = ticker_b;
            j["window"] = window;
            j["dates"] = dates;
            j["close_a"] = close_a;
            j["close_b"] = close_b;
            j["ratio"] = ratio;

            nlohmann::json ma = nlohmann::json::array();
            for (const auto &v : moving_average)
            {
                if (v)
                {
                    ma.push_back(*v);
                }
                else
                {
                    ma.push_back(nullptr);
                }
            }
            j["moving_average"] = ma;

            if (!ratio.empty())
            {
                j["current_ratio"] = ratio.back();
                auto current_ma = current_moving_average();
                j["current_moving_average"] = current_ma ? nlohmann::json(*current_ma) : nlohmann::json(nullptr);
            }
            return j;
        }

        // ===================================================================
        // TradeRatioCalculator
        // ===================================================================

        TradeRatioCalculator::TradeRatioCalculator(int window)
            : window_(window)
        {
            if (window < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'window', got: " + std::to_string(window));
            }
        }

        RatioSeries TradeRatioCalculator::compute(const data::PriceSeries &a, const data::PriceSeries &b) const
        {
            RatioSeries out;
            out.ticker_a = a.ticker();
            out.ticker_b = b.ticker();
            out.window = window_;

            std::vector<std::string> common = data::intersect_dates(a.dates(), b.dates());
            if (common.empty())
            {
                throw NoOverlap("No common dates between " + a.ticker() + " and " + b.ticker());
            }

            std::map<std::string, double> closes_b;
            for (const auto &bar : b.bars())
            {
                closes_b[bar.date] = bar.close;
            }

            size_t j = 0;
            const auto &bars_a = a.bars();
            for (const auto &date : common)
            {
                while (j < bars_a.size() && bars_a[j].date < date)
                {
                    ++j;
                }
                double ca = bars_a[j].close;
                double cb = closes_b[date];
                if (cb == 0.0 || !std::isfinite(ca) || !std::isfinite(cb))
                {
                    continue;
                }
                out.dates.push_back(date);
                out.close_a.push_back(ca);
                out.close_b.push_back(cb);
                out.ratio.push_back(ca / cb);
            }

            if (out.ratio.empty())
            {
                throw NoOverlap("No usable common dates between " + a.ticker() + " and " + b.ticker() +
                                " (denominator close is zero on every shared date)");
            }

            out.moving_average = moving_average(out.ratio, window_);
            return out;
        }

        RatioSeries TradeRatioCalculator::compute(const data::PriceStore &store,
                                                  const std::string &ticker_a,
                                                  const std::string &ticker_b,
                                                  const data::DateRange &range) const
        {
            data::PriceSeries a = store.get_price_history(ticker_a, range);
            data::PriceSeries b = store.get_price_history(ticker_b, range);
            return compute(a, b);
        }

        std::vector<std::optional<double>> TradeRatioCalculator::moving_average(const std::vector<double> &values,
                                                                                int window)
        {
            if (window < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'window', got: " + std::to_string(window));
            }

            std::vector<std::optional<double>> out(values.size());
            double sum = 0.0;
            for (size_t i = 0; i < values.size(); ++i)
            {
                sum += values[i];
                if (i >= static_cast<size_t>(window))
                {
                    sum -= values[i - window];
                }
                if (i + 1 >= static_cast<size_t>(window))
                {
                    out[i] = sum / static_cast<double>(window);
                }
            }
            return out;
        }

    } // namespace signals
} // namespace equity
