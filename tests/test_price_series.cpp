/**
 * @file test_price_series.cpp
 * @brief Unit tests for PriceSeries, ReturnSeries and InMemoryPriceStore
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/errors.hpp"
#include "data/price_series.hpp"
#include "data/price_store.hpp"

using namespace equity;
using namespace equity::data;
using Catch::Matchers::WithinAbs;

namespace {

PriceSeries make_series(const std::string& ticker,
                        const std::vector<std::string>& dates,
                        const std::vector<double>& closes) {
    std::vector<PriceBar> bars;
    for (size_t i = 0; i < dates.size(); ++i) {
        PriceBar bar;
        bar.date = dates[i];
        bar.open = bar.high = bar.low = bar.close = closes[i];
        bars.push_back(bar);
    }
    return PriceSeries(ticker, bars);
}

} // namespace

TEST_CASE("PriceSeries construction", "[PriceSeries]") {
    SECTION("Bars are sorted by date") {
        auto s = make_series("AAPL", {"2024-01-03", "2024-01-01", "2024-01-02"}, {3.0, 1.0, 2.0});
        REQUIRE(s.size() == 3);
        REQUIRE(s.dates() == std::vector<std::string>{"2024-01-01", "2024-01-02", "2024-01-03"});
        REQUIRE(s.closes() == std::vector<double>{1.0, 2.0, 3.0});
        REQUIRE(s.last_close() == 3.0);
    }

    SECTION("Error: duplicate date") {
        REQUIRE_THROWS_AS(make_series("AAPL", {"2024-01-01", "2024-01-01"}, {1.0, 2.0}),
                          std::invalid_argument);
    }

    SECTION("Error: malformed date") {
        REQUIRE_THROWS_AS(make_series("AAPL", {"2024/01/01"}, {1.0}), std::invalid_argument);
    }

    SECTION("Error: empty ticker") {
        REQUIRE_THROWS_AS(make_series("", {"2024-01-01"}, {1.0}), std::invalid_argument);
    }
}

TEST_CASE("Date helpers", "[PriceSeries]") {
    REQUIRE(is_valid_date("2024-02-29"));
    REQUIRE_FALSE(is_valid_date("2024-13-01"));
    REQUIRE_FALSE(is_valid_date("2024-01-00"));
    REQUIRE_FALSE(is_valid_date("24-01-01"));

    DateRange range{"2024-01-02", "2024-01-03"};
    REQUIRE(range.contains("2024-01-02"));
    REQUIRE(range.contains("2024-01-03"));
    REQUIRE_FALSE(range.contains("2024-01-04"));
    REQUIRE(DateRange().contains("1999-12-31"));

    REQUIRE_THROWS_AS((DateRange{"2024-02-01", "2024-01-01"}.validate()), std::invalid_argument);
    REQUIRE_THROWS_AS((DateRange{"yesterday", ""}.validate()), std::invalid_argument);
    REQUIRE_NOTHROW(DateRange().validate());
}

TEST_CASE("Return calculation", "[PriceSeries]") {
    SECTION("Simple returns dated at the later bar") {
        auto s = make_series("A", {"2024-01-01", "2024-01-02", "2024-01-03"}, {100.0, 110.0, 99.0});
        auto r = calculate_returns(s);
        REQUIRE(r.size() == 2);
        REQUIRE(r.dates[0] == "2024-01-02");
        REQUIRE_THAT(r.values[0], WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(r.values[1], WithinAbs(-0.10, 1e-12));
    }

    SECTION("Single bar gives no return") {
        auto s = make_series("A", {"2024-01-01"}, {100.0});
        REQUIRE(calculate_returns(s).empty());
    }

    SECTION("Zero previous close is skipped") {
        auto s = make_series("A", {"2024-01-01", "2024-01-02", "2024-01-03"}, {0.0, 10.0, 11.0});
        auto r = calculate_returns(s);
        REQUIRE(r.size() == 1);
        REQUIRE(r.dates[0] == "2024-01-03");
    }

    SECTION("Appending out of order throws") {
        ReturnSeries r;
        r.append("2024-01-02", 0.01);
        REQUIRE_THROWS_AS(r.append("2024-01-01", 0.02), std::invalid_argument);
        REQUIRE_THROWS_AS(r.append("2024-01-02", 0.02), std::invalid_argument);
    }
}

TEST_CASE("Return series alignment", "[PriceSeries]") {
    ReturnSeries a;
    a.append("2024-01-02", 0.01);
    a.append("2024-01-03", 0.02);
    a.append("2024-01-05", 0.03);
    ReturnSeries b;
    b.append("2024-01-03", -0.01);
    b.append("2024-01-04", -0.02);
    b.append("2024-01-05", -0.03);

    auto aligned = align(a, b);
    REQUIRE(aligned.first.dates == std::vector<std::string>{"2024-01-03", "2024-01-05"});
    REQUIRE(aligned.second.dates == aligned.first.dates);
    REQUIRE(aligned.first.values == std::vector<double>{0.02, 0.03});
    REQUIRE(aligned.second.values == std::vector<double>{-0.01, -0.03});
}

TEST_CASE("InMemoryPriceStore", "[PriceStore]") {
    InMemoryPriceStore store("SPY");
    store.add_series(make_series("AAPL", {"2024-01-01", "2024-01-02", "2024-01-03"}, {10.0, 11.0, 12.0}));
    store.add_series(make_series("SPY", {"2024-01-01", "2024-01-02"}, {400.0, 404.0}));

    SECTION("History is sliced to the window") {
        auto s = store.get_price_history("AAPL", {"2024-01-02", ""});
        REQUIRE(s.size() == 2);
        REQUIRE(s.bars().front().date == "2024-01-02");
    }

    SECTION("Unknown ticker") {
        REQUIRE_THROWS_AS(store.get_price_history("MSFT", DateRange()), DataUnavailable);
    }

    SECTION("Empty window") {
        REQUIRE_THROWS_AS(store.get_price_history("AAPL", {"2025-01-01", ""}), DataUnavailable);
    }

    SECTION("Benchmark returns") {
        auto r = store.get_benchmark_history(DateRange());
        REQUIRE(r.size() == 1);
        REQUIRE_THAT(r.values[0], WithinAbs(0.01, 1e-12));
        REQUIRE(store.get_benchmark_ticker() == "SPY");
    }

    SECTION("Benchmark with a single price is unavailable") {
        REQUIRE_THROWS_AS(store.get_benchmark_history({"2024-01-02", ""}), DataUnavailable);
    }

    SECTION("Removing a ticker") {
        store.remove_series("AAPL");
        REQUIRE_FALSE(store.has_ticker("AAPL"));
        REQUIRE(store.tickers() == std::vector<std::string>{"SPY"});
    }
}
