/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic price histories and sample portfolios for Equity Tracker
 */

#include "analytics/performance_metrics.hpp"
#include "data/data_loader.hpp"
#include "portfolio/portfolio_repository.hpp"
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace equity;

namespace {

struct Listing {
    const char* ticker;
    const char* sector;
};

// SPY is written with the prices but kept out of the sample portfolios
const std::vector<Listing> kUniverse = {
    {"AAPL", "Technology"},
    {"MSFT", "Technology"},
    {"JPM", "Finance"},
    {"JNJ", "Healthcare"},
    {"XOM", "Energy"},
    {"KO", "Consumer"},
    {"PEP", "Consumer"},
    {"SPY", "Index"},
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n"
              << "Options:\n"
              << "  --output FILE      Price CSV to write (default: data/market/prices.csv)\n"
              << "  --portfolios FILE  Portfolio JSON to write (default: data/portfolios/portfolios.json)\n"
              << "  --volatility VAL   Daily return standard deviation (default: 0.015)\n"
              << "  --drift VAL        Daily mean return (default: 0.0003)\n"
              << "  --seed N           Generator seed (default: 42)\n"
              << "  --help             Print this message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string prices_path = "data/market/prices.csv";
    std::string portfolios_path = "data/portfolios/portfolios.json";
    double volatility = 0.015;
    double drift = 0.0003;
    std::uint32_t seed = 42;
    const size_t trading_days = 504;
    const std::string first_day = "2022-01-03";

    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        const bool has_value = i + 1 < argc;
        if (flag == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (flag == "--output" && has_value) {
            prices_path = argv[++i];
        } else if (flag == "--portfolios" && has_value) {
            portfolios_path = argv[++i];
        } else if (flag == "--volatility" && has_value) {
            volatility = std::stod(argv[++i]);
        } else if (flag == "--drift" && has_value) {
            drift = std::stod(argv[++i]);
        } else if (flag == "--seed" && has_value) {
            seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
        } else {
            std::cerr << "Warning: Unknown argument: " << flag << "\n";
        }
    }

    std::vector<std::string> tickers;
    std::map<std::string, std::string> sectors;
    for (const auto& listing : kUniverse) {
        tickers.push_back(listing.ticker);
        sectors[listing.ticker] = listing.sector;
    }

    std::cout << "\nEquity Tracker sample data\n"
              << "  tickers:      " << tickers.size() << "\n"
              << "  first day:    " << first_day << "\n"
              << "  trading days: " << trading_days << "\n" << std::endl;

    try {
        auto history = data::DataLoader::generate_synthetic_history(
            tickers, trading_days, first_day, volatility, drift, seed);

        std::cout << "Writing prices to " << prices_path << std::endl;
        data::DataLoader::save_price_csv(history, prices_path);

        // Sample portfolios with positions valued at the last generated close
        portfolio::InMemoryPortfolioRepository repository;
        for (const auto& series : history) {
            if (series.ticker() == "SPY") {
                continue;
            }
            portfolio::Position position;
            position.ticker = series.ticker();
            position.shares = 100.0;
            position.sector = sectors[series.ticker()];
            position.current_price = series.last_close();
            repository.upsert_position(position);
        }

        int growth = repository.create_portfolio("Growth", "Large-cap technology tilt");
        repository.add_stock(growth, "AAPL", 0.5);
        repository.add_stock(growth, "MSFT", 0.5);

        int income = repository.create_portfolio("Income", "Defensive dividend payers");
        repository.add_stock(income, "JNJ", 0.3);
        repository.add_stock(income, "KO", 0.3);
        repository.add_stock(income, "PEP", 0.2);
        repository.add_stock(income, "XOM", 0.2);

        int balanced = repository.create_portfolio("Balanced", "One name per sector");
        repository.add_stock(balanced, "AAPL", 0.25);
        repository.add_stock(balanced, "JPM", 0.25);
        repository.add_stock(balanced, "JNJ", 0.25);
        repository.add_stock(balanced, "XOM", 0.25);

        std::cout << "Writing portfolios to " << portfolios_path << std::endl;
        data::DataLoader::save_portfolios(repository, portfolios_path);

        const auto& first_bars = history.front().bars();
        std::cout << "\n" << history.size() << " tickers, " << repository.size() << " portfolios, "
                  << first_bars.front().date << " .. " << first_bars.back().date << "\n\n";

        const std::string rule(52, '=');
        std::cout << rule << "\n"
                  << std::left << std::setw(10) << "Ticker" << std::right
                  << std::setw(14) << "Ann. return"
                  << std::setw(14) << "Ann. vol"
                  << std::setw(14) << "Max DD" << "\n"
                  << rule << "\n";

        std::cout << std::fixed << std::setprecision(2);
        for (const auto& series : history) {
            analytics::PerformanceMetrics stats(data::calculate_returns(series));
            std::cout << std::left << std::setw(10) << series.ticker() << std::right
                      << std::setw(13) << stats.annualized_return() * 100.0 << "%"
                      << std::setw(13) << stats.annualized_volatility() * 100.0 << "%"
                      << std::setw(13) << stats.max_drawdown() * 100.0 << "%\n";
        }
        std::cout << rule << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nNext: ./build/bin/equity_tracker --config data/config/engine_config.json performance --portfolio 1\n"
              << std::endl;
    return 0;
}
