/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <random>
#include <stdexcept>

namespace equity
{
    namespace data
    {

        // =============================================
        // Configuration Structures - from_json Methods
        // =============================================

        DataConfig DataConfig::from_json(const nlohmann::json &j)
        {
            DataConfig config;
            config.price_file = j.value("price_file", "data/market/prices.csv");
            config.portfolio_file = j.value("portfolio_file", "data/portfolios/portfolios.json");
            config.benchmark = j.value("benchmark", "SPY");
            config.start_date = j.value("start_date", "");
            config.end_date = j.value("end_date", "");

            if (config.benchmark.empty())
            {
                throw std::invalid_argument("data.benchmark must not be empty");
            }
            config.range().validate();
            return config;
        }

        DateRange DataConfig::range() const
        {
            DateRange r;
            r.start = start_date;
            r.end = end_date;
            return r;
        }

        AnalyticsConfig AnalyticsConfig::from_json(const nlohmann::json &j)
        {
            AnalyticsConfig config;
            config.risk_free_rate = j.value("risk_free_rate", 0.02);
            config.market_return = j.value("market_return", 0.10);
            config.trading_days_per_year = j.value("trading_days_per_year", 252);
            config.ratio_window = j.value("ratio_window", 20);
            config.validate();
            return config;
        }

        void AnalyticsConfig::validate() const
        {
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("analytics.risk_free_rate must be finite");
            }
            if (!std::isfinite(market_return))
            {
                throw std::invalid_argument("analytics.market_return must be finite");
            }
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for 'analytics.trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }
            if (ratio_window < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for 'analytics.ratio_window', got: " + std::to_string(ratio_window));
            }
        }

        EngineConfig EngineConfig::from_json(const nlohmann::json &j)
        {
            EngineConfig config;
            config.data = DataConfig::from_json(j.contains("data") ? j["data"] : nlohmann::json::object());

            if (j.contains("analytics"))
            {
                config.analytics = AnalyticsConfig::from_json(j["analytics"]);
            }

            return config;
        }

        EngineConfig EngineConfig::load_from_file(const std::string &config_path)
        {
            return DataLoader::load_config(config_path);
        }

        // ===========================
        // CSV Loading
        // ===========================

        std::vector<PriceSeries> DataLoader::load_price_csv(const std::string &filepath,
                                                            const std::vector<std::string> &tickers)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            // Locate columns by header name
            auto header = parse_csv_line(line);
            std::map<std::string, size_t> columns;
            for (size_t i = 0; i < header.size(); ++i)
            {
                std::string name = trim(header[i]);
                std::transform(name.begin(), name.end(), name.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                columns[name] = i;
            }
            if (!columns.count("close") && columns.count("price"))
            {
                columns["close"] = columns["price"];
            }
            if (!columns.count("ticker") && columns.count("symbol"))
            {
                columns["ticker"] = columns["symbol"];
            }
            for (const char *required : {"date", "ticker", "close"})
            {
                if (!columns.count(required))
                {
                    throw std::runtime_error("CSV header must contain a '" + std::string(required) + "' column: " + filepath);
                }
            }

            auto field = [&columns](const std::vector<std::string> &fields, const std::string &name) -> std::string
            {
                auto it = columns.find(name);
                if (it == columns.end() || it->second >= fields.size())
                {
                    return "";
                }
                return fields[it->second];
            };

            std::map<std::string, std::map<std::string, PriceBar>> data_map; // ticker -> date -> bar
            size_t skipped = 0;

            while (std::getline(file, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);

                std::string date = trim(field(fields, "date"));
                std::string ticker = trim(field(fields, "ticker"));
                if (!is_valid_date(date) || ticker.empty())
                {
                    ++skipped;
                    continue; // Skip invalid rows
                }

                // Filter by tickers if specified
                if (!tickers.empty() &&
                    std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
                {
                    continue;
                }

                PriceBar bar;
                bar.date = date;
                bar.close = safe_stod(field(fields, "close"));
                if (!std::isfinite(bar.close))
                {
                    ++skipped;
                    continue;
                }
                double open = safe_stod(field(fields, "open"));
                double high = safe_stod(field(fields, "high"));
                double low = safe_stod(field(fields, "low"));
                double volume = safe_stod(field(fields, "volume"));
                bar.open = std::isfinite(open) ? open : bar.close;
                bar.high = std::isfinite(high) ? high : bar.close;
                bar.low = std::isfinite(low) ? low : bar.close;
                bar.volume = std::isfinite(volume) ? volume : 0.0;

                data_map[ticker][date] = bar; // last row wins
            }

            file.close();

            if (skipped > 0)
            {
                std::cerr << "Warning: skipped " << skipped << " malformed rows in " << filepath << "\n";
            }

            if (data_map.empty())
            {
                throw std::runtime_error("No valid data found in CSV file: " + filepath);
            }

            std::vector<PriceSeries> out;
            out.reserve(data_map.size());
            for (const auto &entry : data_map)
            {
                std::vector<PriceBar> bars;
                bars.reserve(entry.second.size());
                for (const auto &dated : entry.second)
                {
                    bars.push_back(dated.second);
                }
                out.emplace_back(entry.first, std::move(bars));
            }
            return out;
        }

        InMemoryPriceStore DataLoader::load_price_store(const std::string &filepath,
                                                        const std::string &benchmark)
        {
            InMemoryPriceStore store(benchmark);
            for (const auto &series : load_price_csv(filepath))
            {
                store.add_series(series);
            }
            return store;
        }

        void DataLoader::save_price_csv(const std::vector<PriceSeries> &series, const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "date,ticker,open,high,low,close,volume\n";
            file << std::fixed;

            for (const auto &s : series)
            {
                for (const auto &bar : s.bars())
                {
                    file << bar.date << "," << s.ticker() << ","
                         << std::setprecision(6) << bar.open << ","
                         << bar.high << ","
                         << bar.low << ","
                         << bar.close << ","
                         << std::setprecision(0) << bar.volume << "\n";
                }
            }

            file.close();
        }

        // ================
        // Portfolio Files
        // ================

        portfolio::InMemoryPortfolioRepository DataLoader::load_portfolios(const std::string &filepath)
        {
            return parse_portfolios(load_json(filepath));
        }

        portfolio::InMemoryPortfolioRepository DataLoader::parse_portfolios(const nlohmann::json &j)
        {
            portfolio::InMemoryPortfolioRepository repo;

            try
            {
                if (j.contains("positions"))
                {
                    for (const auto &p : j.at("positions"))
                    {
                        portfolio::Position pos;
                        pos.ticker = p.at("ticker").get<std::string>();
                        pos.shares = p.value("shares", 0.0);
                        pos.sector = p.value("sector", "Unknown");
                        pos.current_price = p.value("current_price", 0.0);
                        repo.upsert_position(pos);
                    }
                }

                if (j.contains("portfolios"))
                {
                    for (const auto &p : j.at("portfolios"))
                    {
                        std::map<std::string, double> allocations;
                        if (p.contains("allocations"))
                        {
                            allocations = p.at("allocations").get<std::map<std::string, double>>();
                        }

                        if (p.contains("id"))
                        {
                            portfolio::PortfolioDefinition def;
                            def.id = p.at("id").get<int>();
                            def.name = p.at("name").get<std::string>();
                            def.description = p.value("description", "");
                            def.allocations = allocations;
                            repo.insert_portfolio(def);
                        }
                        else
                        {
                            int id = repo.create_portfolio(p.at("name").get<std::string>(),
                                                           p.value("description", ""));
                            for (const auto &entry : allocations)
                            {
                                repo.add_stock(id, entry.first, entry.second);
                            }
                        }
                    }
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid portfolio definitions: " + std::string(e.what()));
            }

            return repo;
        }

        nlohmann::json DataLoader::portfolios_to_json(const portfolio::PortfolioRepository &repository)
        {
            nlohmann::json j;

            j["positions"] = nlohmann::json::array();
            for (const auto &entry : repository.positions())
            {
                const auto &pos = entry.second;
                nlohmann::json p = {{"ticker", pos.ticker},
                                    {"shares", pos.shares},
                                    {"sector", pos.sector},
                                    {"current_price", pos.current_price}};
                j["positions"].push_back(p);
            }

            j["portfolios"] = nlohmann::json::array();
            for (const auto &def : repository.list_portfolios())
            {
                nlohmann::json p;
                p["id"] = def.id;
                p["name"] = def.name;
                p["description"] = def.description;
                p["allocations"] = def.allocations;
                j["portfolios"].push_back(p);
            }

            return j;
        }

        void DataLoader::save_portfolios(const portfolio::PortfolioRepository &repository,
                                         const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }
            file << portfolios_to_json(repository).dump(2) << "\n";
            file.close();
        }

        // ================
        // JSON Loading
        // ================

        nlohmann::json DataLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            file.close();
            return j;
        }

        EngineConfig DataLoader::load_config(const std::string &config_path)
        {
            auto j = load_json(config_path);

            try
            {
                return EngineConfig::from_json(j);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid configuration in " + config_path + ": " + std::string(e.what()));
            }
        }

        // ===========================
        // Synthetic Data Generation
        // ===========================

        std::vector<PriceSeries> DataLoader::generate_synthetic_history(
            const std::vector<std::string> &tickers,
            size_t num_days,
            const std::string &start_date,
            double volatility,
            double drift,
            std::uint32_t seed)
        {
            if (!is_valid_date(start_date))
            {
                throw std::invalid_argument("Invalid start date: '" + start_date + "'");
            }
            if (!(volatility > 0.0))
            {
                throw std::invalid_argument("volatility must be > 0");
            }

            std::mt19937 gen(seed);
            std::normal_distribution<double> dist(drift, volatility);
            std::normal_distribution<double> range_dist(0.0, volatility * 0.5);
            std::uniform_real_distribution<double> volume_dist(1.0e5, 1.0e7);

            // Trading calendar: weekdays only
            std::vector<std::string> dates;
            dates.reserve(num_days);
            for (int offset = 0; dates.size() < num_days; ++offset)
            {
                std::string date = add_days(start_date, offset);
                int wd = weekday(date);
                if (wd != 0 && wd != 6)
                {
                    dates.push_back(date);
                }
            }

            std::vector<PriceSeries> out;
            out.reserve(tickers.size());

            // Prices follow a geometric random walk
            for (const auto &ticker : tickers)
            {
                std::vector<PriceBar> bars;
                bars.reserve(num_days);
                double prev_close = 100.0; // Initial price

                for (size_t i = 0; i < num_days; ++i)
                {
                    PriceBar bar;
                    bar.date = dates[i];
                    bar.open = prev_close;
                    bar.close = (i == 0) ? prev_close : prev_close * std::max(0.01, 1.0 + dist(gen));
                    bar.high = std::max(bar.open, bar.close) * (1.0 + std::abs(range_dist(gen)));
                    bar.low = std::min(bar.open, bar.close) * std::max(0.0, 1.0 - std::abs(range_dist(gen)));
                    bar.volume = std::floor(volume_dist(gen));
                    bars.push_back(bar);
                    prev_close = bar.close;
                }

                out.emplace_back(ticker, std::move(bars));
            }

            return out;
        }

        std::string DataLoader::add_days(const std::string &start_date, int days_offset)
        {
            if (!is_valid_date(start_date))
            {
                throw std::invalid_argument("Invalid date: '" + start_date + "'");
            }

            // Calendar arithmetic through mktime normalisation; noon avoids DST edges
            std::tm tm = {};
            tm.tm_year = std::stoi(start_date.substr(0, 4)) - 1900;
            tm.tm_mon = std::stoi(start_date.substr(5, 2)) - 1;
            tm.tm_mday = std::stoi(start_date.substr(8, 2)) + days_offset;
            tm.tm_hour = 12;
            tm.tm_isdst = -1;
            std::mktime(&tm);

            char buffer[11];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
            return std::string(buffer);
        }

        // =======================
        // Private Helper Methods
        // =======================

        int DataLoader::weekday(const std::string &date)
        {
            std::tm tm = {};
            tm.tm_year = std::stoi(date.substr(0, 4)) - 1900;
            tm.tm_mon = std::stoi(date.substr(5, 2)) - 1;
            tm.tm_mday = std::stoi(date.substr(8, 2));
            tm.tm_hour = 12;
            tm.tm_isdst = -1;
            std::mktime(&tm);
            return tm.tm_wday;
        }

        std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        double DataLoader::safe_stod(const std::string &str)
        {
            std::string trimmed = trim(str);
            if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            try
            {
                size_t consumed = 0;
                double value = std::stod(trimmed, &consumed);
                return (consumed == trimmed.size()) ? value : std::numeric_limits<double>::quiet_NaN();
            }
            catch (const std::invalid_argument &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            catch (const std::out_of_range &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
        }

    } // namespace data
} // namespace equity
