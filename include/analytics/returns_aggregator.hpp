/**
 * @file returns_aggregator.hpp
 * @brief Weighted aggregation of constituent return series.
 *
 * Turns the price histories of a portfolio's constituents into one daily
 * return series. The output calendar is the union of the constituents'
 * return dates; a constituent without a return on a date contributes 0
 * there. Gaps are counted per ticker so reports can flag them.
 */

#ifndef EQUITY_ANALYTICS_RETURNS_AGGREGATOR_HPP
#define EQUITY_ANALYTICS_RETURNS_AGGREGATOR_HPP

#include "data/price_series.hpp"
#include "data/price_store.hpp"
#include "portfolio/portfolio_definition.hpp"

#include <map>
#include <string>
#include <vector>

namespace equity
{
    namespace analytics
    {

        /**
         * @struct WeightedSeries
         * @brief Return series of one constituent with its portfolio weight.
         */
        struct WeightedSeries
        {
            std::string ticker;
            double weight = 0.0;
            data::ReturnSeries returns;
        };

        /**
         * @struct AggregationResult
         * @brief Aggregated returns plus data-quality bookkeeping.
         */
        struct AggregationResult
        {
            data::ReturnSeries returns;                 ///< Weighted portfolio returns
            std::map<std::string, int> missing_days;    ///< ticker -> output dates it had no return on
            std::vector<std::string> unavailable_tickers; ///< Tickers with no usable data at all
            std::map<std::string, std::string> fetch_errors; ///< ticker -> provider message
            std::map<std::string, double> last_close;        ///< ticker -> latest close in the window

            bool empty() const { return returns.empty(); }
        };

        /**
         * @class ReturnsAggregator
         * @brief Builds weighted portfolio return series.
         *
         * Usage:
         * @code
         *   ReturnsAggregator aggregator;
         *   AggregationResult agg = aggregator.aggregate_portfolio(store, definition, range);
         *   if (agg.empty()) { ... insufficient data ... }
         * @endcode
         *
         * Thread safety: Stateless; safe to share.
         */
        class ReturnsAggregator
        {
        public:
            ReturnsAggregator() = default;
            ~ReturnsAggregator() = default;

            /**
             * @brief Weighted sum of constituent returns on the union calendar.
             *
             * r_p[t] = sum_i w_i * r_i[t], where a constituent with no
             * observation at t contributes 0. Constituents with an empty
             * series are reported as unavailable.
             *
             * @param constituents Weighted return series (any order).
             * @return Aggregated series; empty when no constituent has data.
             */
            static AggregationResult aggregate(const std::vector<WeightedSeries> &constituents);

            /**
             * @brief Fetch every allocated ticker and aggregate with the allocation weights.
             *
             * A ticker whose fetch fails (DataUnavailable) is recorded as
             * unavailable and logged; it never fails the aggregation.
             *
             * @param store Price provider.
             * @param definition Portfolio snapshot.
             * @param range Inclusive date window.
             * @return Aggregated series; empty when no ticker has data.
             */
            AggregationResult aggregate_portfolio(const data::PriceStore &store,
                                                  const portfolio::PortfolioDefinition &definition,
                                                  const data::DateRange &range) const;
        };

    } // namespace analytics
} // namespace equity

#endif // EQUITY_ANALYTICS_RETURNS_AGGREGATOR_HPP
