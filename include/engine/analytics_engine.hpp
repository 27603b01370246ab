/**
 * @file analytics_engine.hpp
 * @brief Public entry point of the portfolio analytics engine.
 *
 * Wires a price store, a portfolio repository and the analytics
 * configuration together. Every call recomputes its result from a fresh
 * portfolio snapshot; nothing derived is cached between calls.
 */

#ifndef EQUITY_ENGINE_ANALYTICS_ENGINE_HPP
#define EQUITY_ENGINE_ANALYTICS_ENGINE_HPP

#include "analytics/performance_report.hpp"
#include "analytics/returns_aggregator.hpp"
#include "data/data_loader.hpp"
#include "data/price_store.hpp"
#include "portfolio/portfolio_repository.hpp"
#include "signals/trade_ratio.hpp"

#include <map>
#include <string>
#include <vector>

namespace equity
{
    namespace engine
    {

        /**
         * @class AnalyticsEngine
         * @brief Performance, comparison, ratio and rebalance operations.
         *
         * The store and repository are borrowed and must outlive the engine.
         *
         * Usage:
         * @code
         *   AnalyticsEngine engine(store, repository, config.analytics);
         *   auto report = engine.compute_performance(1, {"2024-01-01", "2024-12-31"});
         *   std::cout << report.summary();
         * @endcode
         */
        class AnalyticsEngine
        {
        public:
            /**
             * @param store Price provider
             * @param repository Portfolio record store
             * @param config Metric parameters
             * @throws std::invalid_argument If the configuration is invalid
             */
            AnalyticsEngine(const data::PriceStore &store,
                            portfolio::PortfolioRepository &repository,
                            const data::AnalyticsConfig &config = data::AnalyticsConfig());

            ~AnalyticsEngine() = default;

            /**
             * @brief Full performance and risk report of one portfolio.
             *
             * Tickers without data are left out of the aggregate and listed in
             * the data-quality section. If the benchmark cannot be fetched the
             * report is still produced with beta, alpha and tracking error
             * marked unavailable.
             *
             * @throws PortfolioNotFound If the id is unknown
             * @throws InsufficientData If no constituent has a usable return
             * @throws std::invalid_argument If the window is malformed
             */
            analytics::PerformanceReport compute_performance(int portfolio_id,
                                                             const data::DateRange &range = data::DateRange()) const;

            /**
             * @brief Compare several portfolios over one window.
             *
             * Repeated ids are collapsed. Portfolios whose report fails are
             * skipped and listed with the reason.
             *
             * @throws InsufficientData If fewer than 2 distinct ids are given or
             *         fewer than 2 portfolios can be analyzed
             */
            analytics::ComparisonReport compare_portfolios(const std::vector<int> &portfolio_ids,
                                                           const data::DateRange &range = data::DateRange()) const;

            /**
             * @brief Price ratio of two tickers with its moving average.
             * @throws DataUnavailable If either ticker has no data in the window
             * @throws NoOverlap If the two histories share no usable date
             */
            signals::RatioSeries compute_trade_ratio(const std::string &ticker_a,
                                                     const std::string &ticker_b,
                                                     const data::DateRange &range = data::DateRange()) const;

            /**
             * @brief Validate new weights and store them in one save.
             * @return Portfolio snapshot after the save
             * @throws PortfolioNotFound If the id is unknown
             * @throws AllocationInvalid If the weights are rejected; nothing is stored
             */
            portfolio::PortfolioDefinition validate_and_rebalance(int portfolio_id,
                                                                  const std::map<std::string, double> &weights);

            const data::AnalyticsConfig &config() const { return config_; }

        private:
            void fill_valuation(const portfolio::PortfolioDefinition &definition,
                                const analytics::AggregationResult &aggregation,
                                analytics::PerformanceReport &report) const;

            void fill_metrics(analytics::PerformanceReport &report) const;

            void fill_benchmark(const data::DateRange &range,
                                analytics::PerformanceReport &report) const;

            const data::PriceStore &store_;
            portfolio::PortfolioRepository &repository_;
            data::AnalyticsConfig config_;
            analytics::ReturnsAggregator aggregator_;
        };

    } // namespace engine
} // namespace equity

#endif // EQUITY_ENGINE_ANALYTICS_ENGINE_HPP
