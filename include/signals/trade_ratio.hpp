/**
 * @file trade_ratio.hpp
 * @brief Pairwise price-ratio signal between two tickers.
 *
 * The ratio close_a / close_b is built over the dates both tickers trade
 * on, together with a trailing simple moving average of the ratio.
 * Nothing is forward- or back-filled across calendars.
 */

#ifndef EQUITY_SIGNALS_TRADE_RATIO_HPP
#define EQUITY_SIGNALS_TRADE_RATIO_HPP

#include "data/price_series.hpp"
#include "data/price_store.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace equity
{
    namespace signals
    {

        /**
         * @struct RatioSeries
         * @brief Price ratio of two tickers on their shared dates.
         *
         * moving_average[i] is empty for the first window - 1 positions.
         */
        struct RatioSeries
        {
            std::string ticker_a;
            std::string ticker_b;
            int window = 20;
            std::vector<std::string> dates;
            std::vector<double> close_a;
            std::vector<double> close_b;
            std::vector<double> ratio; ///< close_a / close_b
            std::vector<std::optional<double>> moving_average;

            size_t size() const { return ratio.size(); }
            bool empty() const { return ratio.empty(); }

            /**
             * @brief Latest ratio.
             * @throws NoOverlap If the series is empty.
             */
            double current_ratio() const;

            /**
             * @brief Latest moving average, if the window is filled.
             */
            std::optional<double> current_moving_average() const;

            /**
             * @brief Export to JSON (absent averages become null).
             */
            nlohmann::json to_json() const;
        };

        /**
         * @class TradeRatioCalculator
         * @brief Builds RatioSeries from two price histories.
         *
         * Usage:
         * @code
         *   TradeRatioCalculator calc(20);
         *   RatioSeries rs = calc.compute(store, "KO", "PEP", range);
         *   double now = rs.current_ratio();
         * @endcode
         */
        class TradeRatioCalculator
        {
        public:
            /**
             * @param window Moving average window in observations (default 20).
             * @throws std::invalid_argument If window < 1.
             */
            explicit TradeRatioCalculator(int window = 20);

            ~TradeRatioCalculator() = default;

            /**
             * @brief Ratio of two price series over their shared dates.
             *
             * Dates where close_b is zero are left out.
             *
             * @throws NoOverlap If the series share no usable date.
             */
            RatioSeries compute(const data::PriceSeries &a, const data::PriceSeries &b) const;

            /**
             * @brief Fetch both tickers from a store and compute their ratio.
             * @throws DataUnavailable If either ticker has no data in the window.
             * @throws NoOverlap If the histories share no usable date.
             */
            RatioSeries compute(const data::PriceStore &store,
                                const std::string &ticker_a,
                                const std::string &ticker_b,
                                const data::DateRange &range) const;

            /**
             * @brief Trailing simple moving average.
             * @return One entry per input; empty until @p window values are seen.
             */
            static std::vector<std::optional<double>> moving_average(const std::vector<double> &values,
                                                                     int window);

            int window() const { return window_; }

        private:
            int window_;
        };

    } // namespace signals
} // namespace equity

#endif // EQUITY_SIGNALS_TRADE_RATIO_HPP
