/**
 * @file returns_aggregator.cpp
 * @brief Implementation of the ReturnsAggregator class.
 */

#include "analytics/returns_aggregator.hpp"
#include "core/errors.hpp"

#include <iostream>
#include <set>

namespace equity
{
    namespace analytics
    {

        // ===================================================================
        // Aggregation
        // ===================================================================

        AggregationResult ReturnsAggregator::aggregate(const std::vector<WeightedSeries> &constituents)
        {
            AggregationResult result;

            // Union calendar; std::set keeps it sorted and unique
            std::set<std::string> calendar;
            for (const auto &c : constituents)
            {
                if (c.returns.empty())
                {
                    result.unavailable_tickers.push_back(c.ticker);
                    continue;
                }
                calendar.insert(c.returns.dates.begin(), c.returns.dates.end());
            }

            if (calendar.empty())
            {
                return result;
            }

            std::map<std::string, double> sums;
            for (const auto &date : calendar)
            {
                sums[date] = 0.0;
            }

            for (const auto &c : constituents)
            {
                if (c.returns.empty())
                {
                    continue;
                }
                for (size_t i = 0; i < c.returns.size(); ++i)
                {
                    sums[c.returns.dates[i]] += c.weight * c.returns.values[i];
                }
                int missing = static_cast<int>(calendar.size() - c.returns.size());
                if (missing > 0)
                {
                    result.missing_days[c.ticker] += missing;
                }
            }

            for (const auto &entry : sums)
            {
                result.returns.append(entry.first, entry.second);
            }
            return result;
        }

        AggregationResult ReturnsAggregator::aggregate_portfolio(const data::PriceStore &store,
                                                                 const portfolio::PortfolioDefinition &definition,
                                                                 const data::DateRange &range) const
        {
            std::vector<WeightedSeries> constituents;
            std::map<std::string, std::string> errors;
            std::map<std::string, double> closes;

            for (const auto &entry : definition.allocations)
            {
                WeightedSeries ws;
                ws.ticker = entry.first;
                ws.weight = entry.second;
                try
                {
                    data::PriceSeries prices = store.get_price_history(entry.first, range);
                    closes[entry.first] = prices.last_close();
                    ws.returns = data::calculate_returns(prices);
                }
                catch (const DataUnavailable &e)
                {
                    std::cerr << "Warning: no price data for " << entry.first
                              << " (portfolio " << definition.id << "): " << e.what() << "\n";
                    errors[entry.first] = e.what();
                }
                constituents.push_back(ws);
            }

            AggregationResult result = aggregate(constituents);
            result.fetch_errors = errors;
            result.last_close = closes;
            return result;
        }

    } // namespace analytics
} // namespace equity
