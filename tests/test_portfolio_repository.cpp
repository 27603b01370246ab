#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/errors.hpp"
#include "portfolio/portfolio_repository.hpp"

#include <cmath>

using namespace equity;
using namespace equity::portfolio;

namespace {

Position make_position(const std::string& ticker, double shares, const std::string& sector, double price) {
    Position p;
    p.ticker = ticker;
    p.shares = shares;
    p.sector = sector;
    p.current_price = price;
    return p;
}

} // namespace

TEST_CASE("Position valuation", "[Position]") {
    Position p = make_position("AAPL", 10.0, "Technology", 150.0);
    REQUIRE(p.market_value() == Catch::Approx(1500.0));
    REQUIRE(p.weight(3000.0) == Catch::Approx(0.5));
    REQUIRE(p.weight(0.0) == 0.0);
}

TEST_CASE("Portfolio creation", "[PortfolioRepository]") {
    InMemoryPortfolioRepository repo;

    SECTION("Happy path: ids are assigned in order") {
        int a = repo.create_portfolio("Growth", "tech");
        int b = repo.create_portfolio("Income");
        REQUIRE(a == 1);
        REQUIRE(b == 2);
        REQUIRE(repo.size() == 2);
        REQUIRE(repo.load_portfolio(a).description == "tech");
    }

    SECTION("Error: empty name") {
        REQUIRE_THROWS_AS(repo.create_portfolio(""), std::invalid_argument);
    }

    SECTION("Error: duplicate name") {
        repo.create_portfolio("Growth");
        REQUIRE_THROWS_AS(repo.create_portfolio("Growth"), std::invalid_argument);
    }

    SECTION("Explicit ids advance the id counter") {
        PortfolioDefinition def;
        def.id = 10;
        def.name = "Imported";
        repo.insert_portfolio(def);
        REQUIRE(repo.create_portfolio("Next") == 11);
        REQUIRE_THROWS_AS(repo.insert_portfolio(def), std::invalid_argument);

        def.id = 0;
        def.name = "Zero";
        REQUIRE_THROWS_AS(repo.insert_portfolio(def), std::invalid_argument);
    }
}

TEST_CASE("Portfolio allocations", "[PortfolioRepository]") {
    InMemoryPortfolioRepository repo;
    int id = repo.create_portfolio("Growth");
    repo.upsert_position(make_position("AAPL", 10.0, "Technology", 150.0));
    repo.upsert_position(make_position("XOM", 5.0, "Energy", 100.0));

    repo.add_stock(id, "AAPL", 0.7);
    repo.add_stock(id, "MSFT", 0.3);

    SECTION("Snapshot carries allocations and matching positions") {
        PortfolioDefinition def = repo.load_portfolio(id);
        REQUIRE(def.tickers() == std::vector<std::string>{"AAPL", "MSFT"});
        REQUIRE(def.allocation_sum() == Catch::Approx(1.0));
        REQUIRE(def.positions.count("AAPL") == 1);
        REQUIRE(def.positions.count("XOM") == 0);
        REQUIRE(def.position_or_default("MSFT").shares == 0.0);
        REQUIRE(def.position_or_default("MSFT").sector == "Unknown");
        REQUIRE(def.allocation_list().size() == 2);
    }

    SECTION("Snapshots are independent of later changes") {
        PortfolioDefinition before = repo.load_portfolio(id);
        repo.add_stock(id, "AAPL", 0.5);
        REQUIRE(before.allocations.at("AAPL") == Catch::Approx(0.7));
        REQUIRE(repo.load_portfolio(id).allocations.at("AAPL") == Catch::Approx(0.5));
    }

    SECTION("Removing a stock") {
        REQUIRE(repo.remove_stock(id, "MSFT"));
        REQUIRE_FALSE(repo.remove_stock(id, "MSFT"));
        REQUIRE(repo.load_portfolio(id).allocations.size() == 1);
    }

    SECTION("Error: unknown portfolio") {
        REQUIRE_THROWS_AS(repo.add_stock(99, "AAPL", 0.1), PortfolioNotFound);
        REQUIRE_THROWS_AS(repo.load_portfolio(99), PortfolioNotFound);
    }

    SECTION("Error: allocation outside [0, 1]") {
        REQUIRE_THROWS_AS(repo.add_stock(id, "AAA", 5.0), std::invalid_argument);
        REQUIRE_THROWS_AS(repo.add_stock(id, "BBB", -0.5), std::invalid_argument);
        REQUIRE_THROWS_AS(repo.add_stock(id, "CCC", std::nan("")), std::invalid_argument);
        REQUIRE(repo.load_portfolio(id).allocations.size() == 2);

        PortfolioDefinition levered;
        levered.id = 42;
        levered.name = "Levered";
        levered.allocations["AAPL"] = 1.5;
        REQUIRE_THROWS_AS(repo.insert_portfolio(levered), std::invalid_argument);
        REQUIRE_THROWS_AS(repo.load_portfolio(42), PortfolioNotFound);

        PortfolioDefinition shorted = repo.load_portfolio(id);
        shorted.allocations["MSFT"] = -0.3;
        REQUIRE_THROWS_AS(repo.save_portfolio(shorted), std::invalid_argument);
        REQUIRE(repo.load_portfolio(id).allocations.at("MSFT") == Catch::Approx(0.3));
    }

    SECTION("Error: negative shares") {
        REQUIRE_THROWS_AS(repo.upsert_position(make_position("AAPL", -1.0, "Technology", 1.0)),
                          std::invalid_argument);
        REQUIRE(repo.positions().at("AAPL").shares == Catch::Approx(10.0));
    }

    SECTION("Deleting a portfolio") {
        REQUIRE(repo.delete_portfolio(id));
        REQUIRE_FALSE(repo.delete_portfolio(id));
        REQUIRE(repo.list_portfolios().empty());
    }
}

TEST_CASE("Portfolio save", "[PortfolioRepository]") {
    InMemoryPortfolioRepository repo;
    int a = repo.create_portfolio("A");
    repo.create_portfolio("B");

    PortfolioDefinition def = repo.load_portfolio(a);
    def.name = "B";
    REQUIRE_THROWS_AS(repo.save_portfolio(def), std::invalid_argument);

    def.name = "A2";
    def.allocations["KO"] = 1.0;
    def.positions["KO"] = make_position("KO", 20.0, "Consumer", 60.0);
    repo.save_portfolio(def);

    PortfolioDefinition stored = repo.load_portfolio(a);
    REQUIRE(stored.name == "A2");
    REQUIRE(stored.positions.at("KO").shares == Catch::Approx(20.0));
}
