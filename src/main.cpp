/**
 * @file main.cpp
 * @brief Main entry point for Equity Tracker
 *
 * Command-line application that loads configuration, price histories and
 * portfolio definitions, then runs one analytics command.
 */

#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "engine/analytics_engine.hpp"
#include <iostream>
#include <string>
#include <exception>
#include <iomanip>
#include <chrono>
#include <map>
#include <sstream>
#include <vector>

using namespace equity;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Equity Tracker v1.0.0\n"
              << "Usage: " << program_name << " --config PATH COMMAND [OPTIONS]\n\n"
              << "Commands:\n"
              << "  performance --portfolio ID              Performance and risk report\n"
              << "  compare --portfolios ID,ID[,...]        Compare portfolios\n"
              << "  ratio --pair A,B                        Price ratio of two tickers\n"
              << "  rebalance --portfolio ID --weights T=W,...  Validate and store new weights\n"
              << "  list                                    List portfolios\n"
              << "\nOptions:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --start DATE          Window start (YYYY-MM-DD, overrides config)\n"
              << "  --end DATE            Window end (YYYY-MM-DD, overrides config)\n"
              << "  --json                Print results as JSON\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/engine_config.json performance --portfolio 1\n"
              << "  " << program_name << " --config data/config/engine_config.json ratio --pair KO,PEP --json\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Equity Tracker v1.0.0                                   \n"
              << "       Portfolio Performance & Risk Analytics                  \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Split a comma-separated list
 */
std::vector<std::string> split_list(const std::string &text)
{
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        if (!item.empty())
        {
            out.push_back(item);
        }
    }
    return out;
}

int parse_id(const std::string &text)
{
    size_t consumed = 0;
    int id = std::stoi(text, &consumed);
    if (consumed != text.size())
    {
        throw std::invalid_argument("Invalid portfolio id: '" + text + "'");
    }
    return id;
}

/**
 * @brief Parse "AAPL=0.6,MSFT=0.4" into a weight map
 */
std::map<std::string, double> parse_weights(const std::string &text)
{
    std::map<std::string, double> weights;
    for (const auto &item : split_list(text))
    {
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            throw std::invalid_argument("Invalid weight '" + item + "' (expected TICKER=WEIGHT)");
        }
        size_t consumed = 0;
        std::string value = item.substr(eq + 1);
        double w = std::stod(value, &consumed);
        if (consumed != value.size())
        {
            throw std::invalid_argument("Invalid weight value in '" + item + "'");
        }
        weights[item.substr(0, eq)] = w;
    }
    return weights;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string command;
    std::string portfolio;
    std::string portfolios;
    std::string pair;
    std::string weights;
    std::string start_date;
    std::string end_date;
    bool json = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--portfolio" && i + 1 < argc)
            {
                args.portfolio = argv[++i];
            }
            else if (arg == "--portfolios" && i + 1 < argc)
            {
                args.portfolios = argv[++i];
            }
            else if (arg == "--pair" && i + 1 < argc)
            {
                args.pair = argv[++i];
            }
            else if (arg == "--weights" && i + 1 < argc)
            {
                args.weights = argv[++i];
            }
            else if (arg == "--start" && i + 1 < argc)
            {
                args.start_date = argv[++i];
            }
            else if (arg == "--end" && i + 1 < argc)
            {
                args.end_date = argv[++i];
            }
            else if (arg == "--json")
            {
                args.json = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else if (args.command.empty() && !arg.empty() && arg[0] != '-')
            {
                args.command = arg;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() && !command.empty();
    }
};

/**
 * @brief Print a ratio series as text
 */
void print_ratio(const signals::RatioSeries &rs, bool verbose)
{
    std::cout << "\nPrice Ratio " << rs.ticker_a << "/" << rs.ticker_b << "\n";
    std::cout << std::string(60, '-') << "\n";
    std::cout << "Common dates:     " << rs.size() << " (" << rs.dates.front()
              << " to " << rs.dates.back() << ")\n";
    std::cout << "Current ratio:    " << std::fixed << std::setprecision(4) << rs.current_ratio() << "\n";
    auto ma = rs.current_moving_average();
    std::cout << "Moving avg (" << rs.window << "):  ";
    if (ma)
    {
        std::cout << *ma << "\n";
    }
    else
    {
        std::cout << "n/a (fewer than " << rs.window << " observations)\n";
    }

    if (verbose)
    {
        std::cout << "\n  " << std::setw(12) << std::left << "Date" << std::right
                  << std::setw(12) << "Close A" << std::setw(12) << "Close B"
                  << std::setw(10) << "Ratio" << std::setw(10) << "MA" << "\n";
        for (size_t i = 0; i < rs.size(); ++i)
        {
            std::cout << "  " << std::setw(12) << std::left << rs.dates[i] << std::right
                      << std::setw(12) << std::setprecision(2) << rs.close_a[i]
                      << std::setw(12) << rs.close_b[i]
                      << std::setw(10) << std::setprecision(4) << rs.ratio[i];
            if (rs.moving_average[i])
            {
                std::cout << std::setw(10) << *rs.moving_average[i];
            }
            std::cout << "\n";
        }
    }
    std::cout << std::string(60, '-') << "\n";
}

/**
 * @brief Print portfolio list as text
 */
void print_portfolios(const portfolio::PortfolioRepository &repository)
{
    std::cout << "\nPortfolios\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto &def : repository.list_portfolios())
    {
        std::cout << std::setw(4) << def.id << "  " << def.name;
        if (!def.description.empty())
        {
            std::cout << " - " << def.description;
        }
        std::cout << "\n";
        for (const auto &entry : def.allocations)
        {
            std::cout << "        " << std::setw(8) << std::left << entry.first << std::right
                      << std::fixed << std::setprecision(2) << entry.second * 100.0 << "%\n";
        }
    }
    std::cout << std::string(60, '-') << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();
    const bool progress = !args.json;

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        if (progress)
            std::cout << "[1/3] Loading configuration..." << std::endl;

        auto config = data::DataLoader::load_config(args.config_path);
        if (!args.start_date.empty())
        {
            config.data.start_date = args.start_date;
        }
        if (!args.end_date.empty())
        {
            config.data.end_date = args.end_date;
        }
        data::DateRange range = config.data.range();
        range.validate();

        if (args.verbose && progress)
        {
            std::cout << "  - Prices: " << config.data.price_file << "\n";
            std::cout << "  - Portfolios: " << config.data.portfolio_file << "\n";
            std::cout << "  - Benchmark: " << config.data.benchmark << "\n";
            std::cout << "  - Date range: " << (range.start.empty() ? "-" : range.start)
                      << " to " << (range.end.empty() ? "-" : range.end) << "\n";
            std::cout << "  - Risk-free rate: " << config.analytics.risk_free_rate
                      << ", market return: " << config.analytics.market_return << "\n";
        }

        // ====================================================================
        // 2. Load Market Data and Portfolios
        // ====================================================================
        if (progress)
            std::cout << "[2/3] Loading market data and portfolios..." << std::endl;

        auto store = data::DataLoader::load_price_store(config.data.price_file, config.data.benchmark);
        auto repository = data::DataLoader::load_portfolios(config.data.portfolio_file);

        if (progress)
        {
            std::cout << "  - Loaded " << store.tickers().size() << " tickers, "
                      << repository.size() << " portfolios" << std::endl;
        }

        engine::AnalyticsEngine engine(store, repository, config.analytics);

        // ====================================================================
        // 3. Run Command
        // ====================================================================
        if (progress)
            std::cout << "[3/3] Running '" << args.command << "'..." << std::endl;

        if (args.command == "performance")
        {
            if (args.portfolio.empty())
                throw std::invalid_argument("performance requires --portfolio ID");

            auto report = engine.compute_performance(parse_id(args.portfolio), range);
            if (args.json)
                std::cout << report.to_json(args.verbose).dump(2) << std::endl;
            else
                std::cout << "\n" << report.summary();
        }
        else if (args.command == "compare")
        {
            std::vector<int> ids;
            for (const auto &item : split_list(args.portfolios))
            {
                ids.push_back(parse_id(item));
            }

            auto comparison = engine.compare_portfolios(ids, range);
            if (args.json)
                std::cout << comparison.to_json().dump(2) << std::endl;
            else
                std::cout << "\n" << comparison.summary();
        }
        else if (args.command == "ratio")
        {
            auto tickers = split_list(args.pair);
            if (tickers.size() != 2)
                throw std::invalid_argument("ratio requires --pair A,B");

            auto rs = engine.compute_trade_ratio(tickers[0], tickers[1], range);
            if (args.json)
                std::cout << rs.to_json().dump(2) << std::endl;
            else
                print_ratio(rs, args.verbose);
        }
        else if (args.command == "rebalance")
        {
            if (args.portfolio.empty() || args.weights.empty())
                throw std::invalid_argument("rebalance requires --portfolio ID and --weights T=W,...");

            auto updated = engine.validate_and_rebalance(parse_id(args.portfolio), parse_weights(args.weights));
            data::DataLoader::save_portfolios(repository, config.data.portfolio_file);

            if (args.json)
            {
                nlohmann::json j;
                j["portfolio_id"] = updated.id;
                j["allocations"] = updated.allocations;
                std::cout << j.dump(2) << std::endl;
            }
            else
            {
                std::cout << "  - Saved new allocation of portfolio " << updated.id
                          << " to " << config.data.portfolio_file << "\n";
                print_portfolios(repository);
            }
        }
        else if (args.command == "list")
        {
            if (args.json)
                std::cout << data::DataLoader::portfolios_to_json(repository).dump(2) << std::endl;
            else
                print_portfolios(repository);
        }
        else
        {
            throw std::invalid_argument("Unknown command: " + args.command);
        }

        // ====================================================================
        // Summary
        // ====================================================================
        if (progress)
        {
            auto end_time = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                                end_time - start_time)
                                .count();

            std::cout << "\n================================================================\n";
            std::cout << "Completed in " << duration << " ms\n";
            std::cout << "================================================================\n"
                      << std::endl;
        }

        return 0;
    }
    catch (const AllocationInvalid &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        for (const auto &v : e.violations())
        {
            std::cerr << "  - " << v << "\n";
        }
        return 2;
    }
    catch (const EngineError &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    if (!args.json)
    {
        print_banner();
    }

    return run(args);
}
