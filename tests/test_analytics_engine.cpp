/**
 * @file test_analytics_engine.cpp
 * @brief Integration tests for AnalyticsEngine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/performance_metrics.hpp"
#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "engine/analytics_engine.hpp"

using namespace equity;
using namespace equity::analytics;
using Catch::Matchers::WithinAbs;

namespace {

data::PriceSeries make_prices(const std::string& ticker,
                              const std::vector<std::string>& dates,
                              const std::vector<double>& closes) {
    std::vector<data::PriceBar> bars;
    for (size_t i = 0; i < dates.size(); ++i) {
        data::PriceBar bar;
        bar.date = dates[i];
        bar.open = bar.high = bar.low = bar.close = closes[i];
        bars.push_back(bar);
    }
    return data::PriceSeries(ticker, bars);
}

portfolio::Position make_position(const std::string& ticker, double shares, const std::string& sector) {
    portfolio::Position p;
    p.ticker = ticker;
    p.shares = shares;
    p.sector = sector;
    return p;
}

struct Fixture {
    data::InMemoryPriceStore store{"SPY"};
    portfolio::InMemoryPortfolioRepository repo;
    int growth = 0;
    int income = 0;
    int empty = 0;

    Fixture() {
        auto history = data::DataLoader::generate_synthetic_history(
            {"AAPL", "MSFT", "KO", "PEP", "SPY"}, 120, "2023-01-02", 0.015, 0.0003, 3);
        for (const auto& s : history) {
            store.add_series(s);
        }

        repo.upsert_position(make_position("AAPL", 10.0, "Technology"));
        repo.upsert_position(make_position("MSFT", 5.0, "Technology"));
        repo.upsert_position(make_position("KO", 20.0, "Consumer"));

        growth = repo.create_portfolio("Growth");
        repo.add_stock(growth, "AAPL", 0.6);
        repo.add_stock(growth, "MSFT", 0.4);

        income = repo.create_portfolio("Income");
        repo.add_stock(income, "KO", 0.5);
        repo.add_stock(income, "PEP", 0.5);

        empty = repo.create_portfolio("Empty");
        repo.add_stock(empty, "NODATA", 1.0);
    }
};

} // namespace

TEST_CASE("Performance report", "[AnalyticsEngine]") {
    Fixture f;
    engine::AnalyticsEngine engine(f.store, f.repo);

    auto report = engine.compute_performance(f.growth);

    REQUIRE(report.name == "Growth");
    REQUIRE(report.daily_returns.size() == 119);
    REQUIRE(report.positions.size() == 2);
    REQUIRE(report.sector_allocation.size() == 1);
    REQUIRE_THAT(report.sector_allocation.at("Technology"), WithinAbs(report.total_value, 1e-9));

    double weight_sum = 0.0;
    for (const auto& p : report.positions) {
        weight_sum += p.weight;
        REQUIRE_THAT(p.value, WithinAbs(p.shares * p.price, 1e-9));
    }
    REQUIRE_THAT(weight_sum, WithinAbs(1.0, 1e-12));

    PerformanceMetrics perf(report.daily_returns);
    REQUIRE(report.metrics.total_return.is_computed());
    REQUIRE_THAT(report.metrics.total_return.value, WithinAbs(perf.total_return(), 1e-12));
    REQUIRE(report.metrics.max_drawdown.value <= 0.0);
    REQUIRE(report.risk_metrics.cvar_95.value <= report.risk_metrics.var_95.value);
    REQUIRE(report.risk_metrics.var_99.value <= report.risk_metrics.var_95.value);

    REQUIRE(report.data_quality.benchmark_available);
    REQUIRE(report.data_quality.benchmark_ticker == "SPY");
    REQUIRE(report.metrics.beta.is_computed());
    REQUIRE(report.risk_metrics.tracking_error.is_computed());
    REQUIRE(report.relative.observations == 119);

    auto j = report.to_json();
    REQUIRE(j["portfolio_id"] == f.growth);
    REQUIRE(j["metrics"]["beta"]["status"] == "computed");
    REQUIRE(j["data_quality"]["benchmark_ticker"] == "SPY");
}

TEST_CASE("Missing constituent data degrades the report", "[AnalyticsEngine]") {
    Fixture f;
    f.repo.add_stock(f.growth, "NODATA", 0.1);
    engine::AnalyticsEngine engine(f.store, f.repo);

    auto report = engine.compute_performance(f.growth);
    REQUIRE(report.data_quality.unavailable_tickers == std::vector<std::string>{"NODATA"});
    REQUIRE(report.daily_returns.size() == 119);
}

TEST_CASE("Benchmark unavailable", "[AnalyticsEngine]") {
    Fixture f;
    f.store.remove_series("SPY");
    engine::AnalyticsEngine engine(f.store, f.repo);

    auto report = engine.compute_performance(f.growth);

    REQUIRE_FALSE(report.data_quality.benchmark_available);
    REQUIRE(report.metrics.beta.status == MetricStatus::UNAVAILABLE);
    REQUIRE(report.metrics.alpha.status == MetricStatus::UNAVAILABLE);
    REQUIRE(report.risk_metrics.tracking_error.status == MetricStatus::UNAVAILABLE);
    REQUIRE(report.metrics.beta.value == 0.0);
    REQUIRE(report.metrics.sharpe_ratio.is_computed());
}

TEST_CASE("Single return observation", "[AnalyticsEngine]") {
    data::InMemoryPriceStore store("SPY");
    store.add_series(make_prices("A", {"2024-01-02", "2024-01-03"}, {100.0, 101.0}));
    store.add_series(make_prices("SPY", {"2024-01-02", "2024-01-03"}, {400.0, 402.0}));
    portfolio::InMemoryPortfolioRepository repo;
    int id = repo.create_portfolio("One");
    repo.add_stock(id, "A", 1.0);

    engine::AnalyticsEngine engine(store, repo);
    auto report = engine.compute_performance(id);

    REQUIRE_THAT(report.metrics.total_return.value, WithinAbs(0.01, 1e-12));
    REQUIRE(report.metrics.volatility.status == MetricStatus::NEUTRAL);
    REQUIRE(report.metrics.sharpe_ratio.value == 0.0);
    REQUIRE(report.metrics.sortino_ratio.status == MetricStatus::NEUTRAL);
    REQUIRE(report.metrics.calmar_ratio.status == MetricStatus::NEUTRAL);
    REQUIRE(report.metrics.beta.status == MetricStatus::NEUTRAL);
    REQUIRE(report.positions[0].sector == "Unknown");
}

TEST_CASE("Performance errors", "[AnalyticsEngine]") {
    Fixture f;
    engine::AnalyticsEngine engine(f.store, f.repo);

    REQUIRE_THROWS_AS(engine.compute_performance(99), PortfolioNotFound);
    REQUIRE_THROWS_AS(engine.compute_performance(f.empty), InsufficientData);
    REQUIRE_THROWS_AS(engine.compute_performance(f.growth, {"2024-02-01", "2024-01-01"}),
                      std::invalid_argument);
}

TEST_CASE("Portfolio comparison", "[AnalyticsEngine]") {
    Fixture f;
    engine::AnalyticsEngine engine(f.store, f.repo);

    SECTION("Two portfolios") {
        auto cmp = engine.compare_portfolios({f.growth, f.income});
        REQUIRE(cmp.rows.size() == 2);
        REQUIRE(cmp.correlation.rows() == 2);
        REQUIRE(cmp.correlation(0, 1) >= -1.0);
        REQUIRE(cmp.correlation(0, 1) <= 1.0);
        REQUIRE(cmp.cumulative_returns[0].dates.size() == 119);
    }

    SECTION("Failing portfolios are skipped") {
        auto cmp = engine.compare_portfolios({f.growth, f.income, f.empty, 99});
        REQUIRE(cmp.rows.size() == 2);
        REQUIRE(cmp.skipped.size() == 2);
    }

    SECTION("Only one valid portfolio is insufficient") {
        REQUIRE_THROWS_AS(engine.compare_portfolios({f.growth, f.empty}), InsufficientData);
    }

    SECTION("Repeated ids count once") {
        REQUIRE_THROWS_AS(engine.compare_portfolios({f.growth, f.growth}), InsufficientData);
    }
}

TEST_CASE("Trade ratio through the engine", "[AnalyticsEngine]") {
    Fixture f;
    data::AnalyticsConfig config;
    config.ratio_window = 5;
    engine::AnalyticsEngine engine(f.store, f.repo, config);

    auto rs = engine.compute_trade_ratio("KO", "PEP");
    REQUIRE(rs.window == 5);
    REQUIRE(rs.size() == 120);
    REQUIRE(rs.moving_average[4].has_value());

    REQUIRE_THROWS_AS(engine.compute_trade_ratio("KO", "NODATA"), DataUnavailable);
}

TEST_CASE("Rebalance through the engine", "[AnalyticsEngine]") {
    Fixture f;
    engine::AnalyticsEngine engine(f.store, f.repo);

    REQUIRE_THROWS_AS(engine.validate_and_rebalance(f.growth, {{"AAPL", 0.6}, {"MSFT", 0.5}}),
                      AllocationInvalid);
    REQUIRE(f.repo.load_portfolio(f.growth).allocations.at("MSFT") == 0.4);

    auto def = engine.validate_and_rebalance(f.growth, {{"AAPL", 0.2}, {"MSFT", 0.8}});
    REQUIRE(def.allocations.at("MSFT") == 0.8);
}

TEST_CASE("Invalid engine configuration", "[AnalyticsEngine]") {
    Fixture f;
    data::AnalyticsConfig config;
    config.trading_days_per_year = 0;
    REQUIRE_THROWS_AS(engine::AnalyticsEngine(f.store, f.repo, config), std::invalid_argument);
}
