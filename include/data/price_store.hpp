/**
 * @file price_store.hpp
 * @brief Abstract source of price history plus an in-memory implementation
 *
 * The analytics layer only talks to PriceStore. Real market-data providers
 * plug in behind this interface; InMemoryPriceStore serves files loaded by
 * DataLoader and test fixtures.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#ifndef EQUITY_DATA_PRICE_STORE_HPP
#define EQUITY_DATA_PRICE_STORE_HPP

#include "data/price_series.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace equity
{
    namespace data
    {

        /**
         * @class PriceStore
         * @brief Abstract base class for price history providers
         *
         * Usage Example:
         * @code
         * InMemoryPriceStore store("SPY");
         * store.add_series(series);
         * PriceSeries aapl = store.get_price_history("AAPL", {"2024-01-01", "2024-12-31"});
         * @endcode
         */
        class PriceStore
        {
        public:
            virtual ~PriceStore() = default;

            /**
             * @brief Ordered price history of a ticker inside a window
             * @param ticker Instrument identifier
             * @param range Inclusive date window
             * @return Non-empty price series
             * @throws DataUnavailable if the ticker is unknown or the window has no bars
             */
            virtual PriceSeries get_price_history(const std::string &ticker,
                                                  const DateRange &range) const = 0;

            /**
             * @brief Daily returns of the benchmark inside a window
             * @param range Inclusive date window
             * @return Non-empty return series
             * @throws DataUnavailable if no benchmark data is available
             */
            virtual ReturnSeries get_benchmark_history(const DateRange &range) const = 0;

            /**
             * @brief Identifier of the benchmark served by get_benchmark_history
             */
            virtual std::string get_benchmark_ticker() const = 0;

            /**
             * @brief Get the name of the provider
             */
            virtual std::string get_name() const = 0;
        };

        /**
         * @class InMemoryPriceStore
         * @brief PriceStore holding complete series in memory
         *
         * The benchmark is an ordinary ticker of the store whose closes are
         * differenced into returns on request.
         */
        class InMemoryPriceStore : public PriceStore
        {
        public:
            /**
             * @brief Constructor
             * @param benchmark_ticker Ticker used by get_benchmark_history
             */
            explicit InMemoryPriceStore(const std::string &benchmark_ticker = "SPY");

            ~InMemoryPriceStore() override = default;

            /**
             * @brief Add or replace the series of a ticker
             */
            void add_series(const PriceSeries &series);

            /**
             * @brief Remove a ticker (no-op when absent)
             */
            void remove_series(const std::string &ticker);

            bool has_ticker(const std::string &ticker) const;
            std::vector<std::string> tickers() const;
            const std::string &benchmark_ticker() const { return benchmark_ticker_; }
            void set_benchmark_ticker(const std::string &ticker) { benchmark_ticker_ = ticker; }

            PriceSeries get_price_history(const std::string &ticker,
                                          const DateRange &range) const override;

            ReturnSeries get_benchmark_history(const DateRange &range) const override;

            std::string get_benchmark_ticker() const override { return benchmark_ticker_; }

            std::string get_name() const override { return "InMemoryPriceStore"; }

        private:
            std::string benchmark_ticker_;
            std::map<std::string, PriceSeries> series_;
        };

    } // namespace data
} // namespace equity

#endif // EQUITY_DATA_PRICE_STORE_HPP
