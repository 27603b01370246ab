/**
 * @file test_performance_metrics.cpp
 * @brief Unit tests for PerformanceMetrics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/performance_metrics.hpp"
#include <cmath>

using namespace equity::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Performance metrics on a five-day series", "[PerformanceMetrics]")
{
    std::vector<double> r = {0.01, -0.02, 0.03, -0.01, 0.02};
    PerformanceMetrics perf(r);

    SECTION("Total return compounds the daily returns")
    {
        double expected = 1.01 * 0.98 * 1.03 * 0.99 * 1.02 - 1.0;
        REQUIRE_THAT(perf.total_return(), WithinAbs(expected, 1e-12));
        REQUIRE_THAT(perf.total_return(), WithinAbs(0.0294850412, 1e-9));
    }

    SECTION("Annualized return is the mean daily return times 252")
    {
        REQUIRE_THAT(perf.annualized_return(), WithinAbs(0.006 * 252.0, 1e-12));
    }

    SECTION("Volatility uses the sample standard deviation")
    {
        double daily = std::sqrt(1.72e-3 / 4.0);
        REQUIRE_THAT(perf.annualized_volatility(), WithinAbs(daily * std::sqrt(252.0), 1e-10));
        REQUIRE_THAT(perf.sharpe_ratio(),
                     WithinAbs(perf.annualized_return() / perf.annualized_volatility(), 1e-12));
    }

    SECTION("Max drawdown from the first peak")
    {
        REQUIRE_THAT(perf.max_drawdown(), WithinAbs(-0.02, 1e-12));

        const auto& info = perf.max_drawdown_info();
        REQUIRE(info.peak_index == 0);
        REQUIRE(info.trough_index == 1);
        REQUIRE(info.duration_days == 1);
        REQUIRE(info.recovery_index == 2);
        REQUIRE(info.recovery_days == 1);
    }

    SECTION("Sortino uses only negative returns")
    {
        REQUIRE(perf.downside_count() == 2);
        double dd = std::sqrt((0.0004 + 0.0001) / 2.0);
        REQUIRE_THAT(perf.downside_deviation(), WithinAbs(dd, 1e-12));
        REQUIRE_THAT(perf.sortino_ratio(),
                     WithinAbs(perf.annualized_return() / (dd * std::sqrt(252.0)), 1e-9));
    }

    SECTION("Calmar divides by the drawdown magnitude")
    {
        REQUIRE_THAT(perf.calmar_ratio(), WithinAbs(1.512 / 0.02, 1e-9));
    }

    SECTION("Cumulative curve ends at one plus total return")
    {
        auto cum = perf.cumulative_returns();
        REQUIRE(cum.size() == r.size());
        REQUIRE_THAT(cum.back(), WithinAbs(1.0 + perf.total_return(), 1e-12));
        for (double dd : perf.drawdown_series())
        {
            REQUIRE(dd <= 0.0);
        }
    }
}

TEST_CASE("Performance metrics degenerate inputs", "[PerformanceMetrics]")
{
    SECTION("Empty series")
    {
        PerformanceMetrics perf(std::vector<double>{});
        REQUIRE(perf.total_return() == 0.0);
        REQUIRE(perf.annualized_return() == 0.0);
        REQUIRE(perf.annualized_volatility() == 0.0);
        REQUIRE(perf.max_drawdown() == 0.0);
        REQUIRE(perf.sharpe_ratio() == 0.0);
    }

    SECTION("Single observation has zero volatility")
    {
        PerformanceMetrics perf(std::vector<double>{0.05});
        REQUIRE_THAT(perf.total_return(), WithinAbs(0.05, 1e-12));
        REQUIRE(perf.annualized_volatility() == 0.0);
        REQUIRE(perf.sharpe_ratio() == 0.0);
    }

    SECTION("Constant returns")
    {
        PerformanceMetrics perf(std::vector<double>{0.25, 0.25, 0.25, 0.25});
        REQUIRE(perf.annualized_volatility() == 0.0);
        REQUIRE(perf.sharpe_ratio() == 0.0);
        REQUIRE(perf.max_drawdown() == 0.0);
        REQUIRE(perf.calmar_ratio() == 0.0);
    }

    SECTION("No negative returns")
    {
        PerformanceMetrics perf(std::vector<double>{0.01, 0.02, 0.0});
        REQUIRE(perf.downside_count() == 0);
        REQUIRE(perf.sortino_ratio() == 0.0);
    }

    SECTION("Unrecovered drawdown")
    {
        PerformanceMetrics perf(std::vector<double>{0.10, -0.50, 0.10});
        REQUIRE_THAT(perf.max_drawdown(), WithinAbs(-0.5, 1e-12));
        REQUIRE(perf.max_drawdown_info().recovery_days == -1);
        REQUIRE(perf.max_drawdown() >= -1.0);
    }
}

TEST_CASE("Performance metrics validation", "[PerformanceMetrics]")
{
    REQUIRE_THROWS_AS(PerformanceMetrics(std::vector<double>{0.01}, 0), std::invalid_argument);

    equity::data::ReturnSeries rs;
    rs.dates = {"2024-01-02"};
    rs.values = {0.01, 0.02};
    REQUIRE_THROWS_AS(PerformanceMetrics(rs), std::invalid_argument);
}
