/**
 * @file analytics_engine.cpp
 * @brief Implementation of the AnalyticsEngine class.
 */

#include "engine/analytics_engine.hpp"
#include "analytics/benchmark_analysis.hpp"
#include "analytics/performance_metrics.hpp"
#include "analytics/portfolio_comparator.hpp"
#include "analytics/risk_metrics.hpp"
#include "core/errors.hpp"
#include "portfolio/allocation_rebalancer.hpp"

#include <cmath>
#include <iostream>

namespace equity
{
    namespace engine
    {

        using analytics::MetricValue;

        AnalyticsEngine::AnalyticsEngine(const data::PriceStore &store,
                                         portfolio::PortfolioRepository &repository,
                                         const data::AnalyticsConfig &config)
            : store_(store), repository_(repository), config_(config)
        {
            config_.validate();
        }

        // ===================================================================
        // Performance
        // ===================================================================

        analytics::PerformanceReport AnalyticsEngine::compute_performance(int portfolio_id,
                                                                          const data::DateRange &range) const
        {
            range.validate();

            portfolio::PortfolioDefinition definition = repository_.load_portfolio(portfolio_id);

            analytics::AggregationResult aggregation = aggregator_.aggregate_portfolio(store_, definition, range);
            if (aggregation.empty())
            {
                throw InsufficientData("No usable return data for portfolio " + std::to_string(portfolio_id) +
                                       " (" + definition.name + ") in the requested window");
            }

            analytics::PerformanceReport report;
            report.portfolio_id = definition.id;
            report.name = definition.name;
            report.window = range;
            report.daily_returns = aggregation.returns;
            report.first_date = aggregation.returns.dates.front();
            report.last_date = aggregation.returns.dates.back();
            report.data_quality.unavailable_tickers = aggregation.unavailable_tickers;
            report.data_quality.missing_return_days = aggregation.missing_days;

            fill_valuation(definition, aggregation, report);
            fill_metrics(report);
            fill_benchmark(range, report);

            return report;
        }

        void AnalyticsEngine::fill_valuation(const portfolio::PortfolioDefinition &definition,
                                             const analytics::AggregationResult &aggregation,
                                             analytics::PerformanceReport &report) const
        {
            report.total_value = 0.0;
            for (const auto &entry : definition.allocations)
            {
                portfolio::Position position = definition.position_or_default(entry.first);

                analytics::PositionBreakdown row;
                row.ticker = entry.first;
                row.shares = position.shares;
                row.sector = position.sector.empty() ? "Unknown" : position.sector;
                row.allocation = entry.second;

                auto close = aggregation.last_close.find(entry.first);
                row.price = (close != aggregation.last_close.end()) ? close->second : position.current_price;
                row.value = row.shares * row.price;

                report.total_value += row.value;
                report.positions.push_back(row);
            }

            for (auto &row : report.positions)
            {
                row.weight = (report.total_value > 0.0) ? row.value / report.total_value : 0.0;
                report.sector_allocation[row.sector] += row.value;
            }
        }

        void AnalyticsEngine::fill_metrics(analytics::PerformanceReport &report) const
        {
            analytics::PerformanceMetrics perf(report.daily_returns, config_.trading_days_per_year);
            analytics::RiskMetrics risk(report.daily_returns);

            auto &m = report.metrics;
            m.total_return = MetricValue::computed(perf.total_return());
            m.annualized_return = MetricValue::computed(perf.annualized_return());
            m.max_drawdown = MetricValue::computed(perf.max_drawdown());
            report.drawdown = perf.max_drawdown_info();

            if (perf.size() < 2)
            {
                m.volatility = MetricValue::neutral("fewer than 2 return observations");
            }
            else
            {
                m.volatility = MetricValue::computed(perf.annualized_volatility());
            }

            if (perf.annualized_volatility() < 1e-18)
            {
                m.sharpe_ratio = MetricValue::neutral("zero volatility");
            }
            else
            {
                m.sharpe_ratio = MetricValue::computed(perf.sharpe_ratio());
            }

            if (perf.downside_count() == 0)
            {
                m.sortino_ratio = MetricValue::neutral("no negative returns");
            }
            else if (perf.downside_deviation() < 1e-18)
            {
                m.sortino_ratio = MetricValue::neutral("zero downside deviation");
            }
            else
            {
                m.sortino_ratio = MetricValue::computed(perf.sortino_ratio());
            }

            if (std::abs(perf.max_drawdown()) < 1e-18)
            {
                m.calmar_ratio = MetricValue::neutral("zero drawdown");
            }
            else
            {
                m.calmar_ratio = MetricValue::computed(perf.calmar_ratio());
            }

            auto &r = report.risk_metrics;
            r.var_95 = MetricValue::computed(risk.value_at_risk(0.95));
            r.var_99 = MetricValue::computed(risk.value_at_risk(0.99));
            r.cvar_95 = MetricValue::computed(risk.conditional_var(0.95));
            r.cvar_99 = MetricValue::computed(risk.conditional_var(0.99));
        }

        void AnalyticsEngine::fill_benchmark(const data::DateRange &range,
                                             analytics::PerformanceReport &report) const
        {
            auto &quality = report.data_quality;
            auto &m = report.metrics;
            auto &rel = report.relative;
            quality.benchmark_ticker = store_.get_benchmark_ticker();

            data::ReturnSeries benchmark;
            try
            {
                benchmark = store_.get_benchmark_history(range);
            }
            catch (const DataUnavailable &e)
            {
                std::cerr << "Warning: benchmark unavailable for portfolio " << report.portfolio_id
                          << ": " << e.what() << "\n";
                quality.benchmark_available = false;
                quality.benchmark_message = e.what();

                const std::string note = std::string("benchmark unavailable: ") + e.what();
                m.beta = MetricValue::unavailable(note);
                m.alpha = MetricValue::unavailable(note);
                report.risk_metrics.tracking_error = MetricValue::unavailable(note);
                rel.r_squared = MetricValue::unavailable(note);
                rel.active_return = MetricValue::unavailable(note);
                rel.information_ratio = MetricValue::unavailable(note);
                return;
            }

            quality.benchmark_available = true;

            analytics::BenchmarkAnalysis bench(report.daily_returns, benchmark,
                                               config_.risk_free_rate, config_.market_return,
                                               config_.trading_days_per_year);
            rel.observations = bench.num_observations();

            if (!bench.sufficient())
            {
                const std::string note = "fewer than 2 dates shared with the benchmark";
                quality.benchmark_message = note;
                m.beta = MetricValue::neutral(note);
                m.alpha = MetricValue::neutral(note);
                report.risk_metrics.tracking_error = MetricValue::neutral(note);
                rel.r_squared = MetricValue::neutral(note);
                rel.active_return = MetricValue::neutral(note);
                rel.information_ratio = MetricValue::neutral(note);
                return;
            }

            m.beta = bench.benchmark_has_variance() ? MetricValue::computed(bench.beta())
                                                    : MetricValue::neutral("zero benchmark variance");
            m.alpha = MetricValue::computed(bench.alpha());
            report.risk_metrics.tracking_error = MetricValue::computed(bench.tracking_error());
            rel.r_squared = MetricValue::computed(bench.r_squared());
            rel.active_return = MetricValue::computed(bench.active_return());
            rel.information_ratio = (bench.tracking_error() > 1e-18)
                                        ? MetricValue::computed(bench.information_ratio())
                                        : MetricValue::neutral("zero tracking error");
        }

        // ===================================================================
        // Comparison
        // ===================================================================

        analytics::ComparisonReport AnalyticsEngine::compare_portfolios(const std::vector<int> &portfolio_ids,
                                                                        const data::DateRange &range) const
        {
            analytics::PortfolioComparator comparator;

            std::vector<int> ids = analytics::PortfolioComparator::distinct_ids(portfolio_ids);
            if (ids.size() < 2)
            {
                throw InsufficientData("Comparison needs at least 2 distinct portfolio ids, got " +
                                       std::to_string(ids.size()));
            }

            std::vector<analytics::PerformanceReport> reports;
            std::vector<analytics::SkippedPortfolio> skipped;
            for (int id : ids)
            {
                try
                {
                    reports.push_back(compute_performance(id, range));
                }
                catch (const EngineError &e)
                {
                    std::cerr << "Warning: skipping portfolio " << id << " in comparison: " << e.what() << "\n";
                    analytics::SkippedPortfolio s;
                    s.portfolio_id = id;
                    s.reason = e.what();
                    skipped.push_back(s);
                }
            }

            return comparator.compare(reports, skipped);
        }

        // ===================================================================
        // Trade Ratio
        // ===================================================================

        signals::RatioSeries AnalyticsEngine::compute_trade_ratio(const std::string &ticker_a,
                                                                  const std::string &ticker_b,
                                                                  const data::DateRange &range) const
        {
            range.validate();
            signals::TradeRatioCalculator calculator(config_.ratio_window);
            return calculator.compute(store_, ticker_a, ticker_b, range);
        }

        // ===================================================================
        // Rebalance
        // ===================================================================

        portfolio::PortfolioDefinition AnalyticsEngine::validate_and_rebalance(int portfolio_id,
                                                                               const std::map<std::string, double> &weights)
        {
            portfolio::AllocationRebalancer rebalancer(repository_);
            return rebalancer.rebalance(portfolio_id, weights);
        }

    } // namespace engine
} // namespace equity
