/**
 * @file test_trade_ratio.cpp
 * @brief Unit tests for TradeRatioCalculator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "signals/trade_ratio.hpp"

using namespace equity;
using namespace equity::signals;
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

} // namespace

TEST_CASE("Ratio over the shared calendar", "[TradeRatio]") {
    auto a = make_prices("KO", {"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-04"}, {60.0, 61.0, 62.0, 63.0});
    auto b = make_prices("PEP", {"2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"}, {160.0, 155.0, 150.0, 149.0});

    TradeRatioCalculator calc(2);
    auto rs = calc.compute(a, b);

    REQUIRE(rs.ticker_a == "KO");
    REQUIRE(rs.dates == std::vector<std::string>{"2024-01-02", "2024-01-03", "2024-01-04"});
    for (size_t i = 0; i < rs.size(); ++i) {
        REQUIRE_THAT(rs.ratio[i] * rs.close_b[i], WithinAbs(rs.close_a[i], 1e-9));
    }

    REQUIRE_FALSE(rs.moving_average[0].has_value());
    REQUIRE(rs.moving_average[1].has_value());
    REQUIRE_THAT(*rs.moving_average[1], WithinAbs((61.0 / 160.0 + 62.0 / 155.0) / 2.0, 1e-12));

    REQUIRE_THAT(rs.current_ratio(), WithinAbs(63.0 / 150.0, 1e-12));
    REQUIRE(rs.current_moving_average().has_value());

    auto j = rs.to_json();
    REQUIRE(j["ratio"].size() == 3);
    REQUIRE(j["moving_average"][0].is_null());
}

TEST_CASE("Ratio property on synthetic histories", "[TradeRatio]") {
    auto history = data::DataLoader::generate_synthetic_history({"A", "B"}, 60, "2023-01-02", 0.02, 0.0, 11);
    TradeRatioCalculator calc;
    auto rs = calc.compute(history[0], history[1]);

    REQUIRE(rs.size() == 60);
    for (size_t i = 0; i < rs.size(); ++i) {
        REQUIRE_THAT(rs.ratio[i] * rs.close_b[i], WithinAbs(rs.close_a[i], 1e-9));
    }
    REQUIRE_FALSE(rs.moving_average[18].has_value());
    REQUIRE(rs.moving_average[19].has_value());
}

TEST_CASE("Ratio edge cases", "[TradeRatio]") {
    TradeRatioCalculator calc;

    SECTION("Disjoint calendars have no overlap") {
        auto a = make_prices("A", {"2024-01-01", "2024-01-03"}, {1.0, 2.0});
        auto b = make_prices("B", {"2024-01-02", "2024-01-04"}, {1.0, 2.0});
        REQUIRE_THROWS_AS(calc.compute(a, b), NoOverlap);
    }

    SECTION("Zero closes in the denominator are skipped") {
        auto a = make_prices("A", {"2024-01-01", "2024-01-02"}, {10.0, 12.0});
        auto b = make_prices("B", {"2024-01-01", "2024-01-02"}, {0.0, 4.0});
        auto rs = calc.compute(a, b);
        REQUIRE(rs.size() == 1);
        REQUIRE_THAT(rs.current_ratio(), WithinAbs(3.0, 1e-12));
        REQUIRE_FALSE(rs.current_moving_average().has_value());
    }

    SECTION("Only zero denominators leave nothing") {
        auto a = make_prices("A", {"2024-01-01"}, {10.0});
        auto b = make_prices("B", {"2024-01-01"}, {0.0});
        REQUIRE_THROWS_AS(calc.compute(a, b), NoOverlap);
    }

    SECTION("Empty ratio series has no current ratio") {
        RatioSeries empty;
        REQUIRE_THROWS_AS(empty.current_ratio(), NoOverlap);
    }

    SECTION("Unknown ticker in the store") {
        data::InMemoryPriceStore store;
        store.add_series(make_prices("A", {"2024-01-01"}, {10.0}));
        REQUIRE_THROWS_AS(calc.compute(store, "A", "B", data::DateRange()), DataUnavailable);
    }

    SECTION("Invalid window") {
        REQUIRE_THROWS_AS(TradeRatioCalculator(0), std::invalid_argument);
    }
}
