/**
 * @file price_store.cpp
 * @brief Implementation of InMemoryPriceStore
 */

#include "data/price_store.hpp"
#include "core/errors.hpp"

namespace equity
{
    namespace data
    {

        InMemoryPriceStore::InMemoryPriceStore(const std::string &benchmark_ticker)
            : benchmark_ticker_(benchmark_ticker)
        {
        }

        void InMemoryPriceStore::add_series(const PriceSeries &series)
        {
            if (series.ticker().empty())
            {
                throw std::invalid_argument("Cannot store a price series without ticker");
            }
            series_[series.ticker()] = series;
        }

        void InMemoryPriceStore::remove_series(const std::string &ticker)
        {
            series_.erase(ticker);
        }

        bool InMemoryPriceStore::has_ticker(const std::string &ticker) const
        {
            return series_.count(ticker) > 0;
        }

        std::vector<std::string> InMemoryPriceStore::tickers() const
        {
            std::vector<std::string> out;
            out.reserve(series_.size());
            for (const auto &entry : series_)
            {
                out.push_back(entry.first);
            }
            return out;
        }

        PriceSeries InMemoryPriceStore::get_price_history(const std::string &ticker,
                                                          const DateRange &range) const
        {
            auto it = series_.find(ticker);
            if (it == series_.end())
            {
                throw DataUnavailable("Unknown ticker: " + ticker);
            }

            PriceSeries window = it->second.slice(range);
            if (window.empty())
            {
                throw DataUnavailable("No price data for " + ticker + " in [" +
                                      (range.start.empty() ? "-" : range.start) + ", " +
                                      (range.end.empty() ? "-" : range.end) + "]");
            }
            return window;
        }

        ReturnSeries InMemoryPriceStore::get_benchmark_history(const DateRange &range) const
        {
            if (benchmark_ticker_.empty())
            {
                throw DataUnavailable("No benchmark ticker configured");
            }

            ReturnSeries returns = calculate_returns(get_price_history(benchmark_ticker_, range));
            if (returns.empty())
            {
                throw DataUnavailable("Benchmark " + benchmark_ticker_ +
                                      " has fewer than 2 usable prices in the window");
            }
            return returns;
        }

    } // namespace data
} // namespace equity
