/**
 * @file data_loader.hpp
 * @brief File I/O for prices, portfolios and engine settings
 *
 * Loads OHLCV price histories from CSV files, portfolio definitions and
 * engine configuration from JSON files, and generates synthetic price
 * histories for tests and demos.
 */

#ifndef EQUITY_DATA_DATA_LOADER_HPP
#define EQUITY_DATA_DATA_LOADER_HPP

#include "data/price_series.hpp"
#include "data/price_store.hpp"
#include "portfolio/portfolio_repository.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>


namespace equity {
namespace data {

/**
 * @struct DataConfig
 * @brief Input files and analysis window
 */
struct DataConfig {
    std::string price_file;                    ///< Long-format OHLCV CSV
    std::string portfolio_file;                ///< Portfolio definitions JSON
    std::string benchmark;                     ///< Benchmark ticker
    std::string start_date;                    ///< Start date filter ("" = unbounded)
    std::string end_date;                      ///< End date filter ("" = unbounded)

    /**
     * @brief Read the "data" section; absent keys keep their defaults
     * @throws std::invalid_argument on malformed dates or an empty benchmark
     */
    static DataConfig from_json(const nlohmann::json& j);

    /**
     * @brief Analysis window built from start_date / end_date
     */
    DateRange range() const;
};

/**
 * @struct AnalyticsConfig
 * @brief Parameters of the metric calculations
 */
struct AnalyticsConfig {
    double risk_free_rate = 0.02;              ///< Annualized risk-free rate (CAPM alpha)
    double market_return = 0.10;               ///< Annualized assumed market return (CAPM alpha)
    int trading_days_per_year = 252;           ///< Annualization factor
    int ratio_window = 20;                     ///< Moving average window of the trade ratio

    /**
     * @brief Read the "analytics" section, then validate()
     * @throws std::invalid_argument on invalid values
     */
    static AnalyticsConfig from_json(const nlohmann::json& j);

    /**
     * @brief Check value ranges
     * @throws std::invalid_argument if a value is out of range
     */
    void validate() const;
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 */
struct EngineConfig {
    DataConfig data;
    AnalyticsConfig analytics;

    static EngineConfig from_json(const nlohmann::json& j);

    /** @brief Parse the file at @p config_path */
    static EngineConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and saves price histories, portfolios and configuration
 *
 * Price CSV format (long, header required):
 * date,ticker,open,high,low,close,volume
 * 2024-01-02,AAPL,187.15,188.44,183.89,185.64,82488700
 *
 * Only date, ticker and close (or price) columns are mandatory; missing
 * open/high/low default to the close and a missing volume to 0.
 */
class DataLoader {
public:
    // ========================================================================
    // Price Files
    // ========================================================================

    /**
     * @brief Load price histories from a long-format CSV file
     *
     * Rows with a malformed date or a non-numeric close are skipped. When the
     * same (ticker, date) appears twice the last row wins.
     *
     * @param filepath CSV to read
     * @param tickers Tickers to keep; every ticker when empty
     * @return One series per ticker, ordered by ticker
     * @throws std::runtime_error if the file cannot be read or holds no valid row
     */
    static std::vector<PriceSeries> load_price_csv(const std::string& filepath,
                                                   const std::vector<std::string>& tickers = {});

    /**
     * @brief Read a price CSV and index it by ticker in an InMemoryPriceStore
     */
    static InMemoryPriceStore load_price_store(const std::string& filepath,
                                               const std::string& benchmark = "SPY");

    /**
     * @brief Save price histories to a long-format CSV file
     * @throws std::runtime_error if the file cannot be opened
     */
    static void save_price_csv(const std::vector<PriceSeries>& series, const std::string& filepath);

    // ========================================================================
    // Portfolio Files
    // ========================================================================

    /**
     * @brief Load portfolio definitions and positions from a JSON file
     *
     * Layout:
     * {
     *   "positions": [{"ticker": "AAPL", "shares": 10, "sector": "Technology", "current_price": 185.0}],
     *   "portfolios": [{"id": 1, "name": "Growth", "description": "", "allocations": {"AAPL": 0.6}}]
     * }
     *
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument on duplicate ids/names or negative shares
     */
    static portfolio::InMemoryPortfolioRepository load_portfolios(const std::string& filepath);

    /**
     * @brief Parse portfolio definitions from a JSON document
     */
    static portfolio::InMemoryPortfolioRepository parse_portfolios(const nlohmann::json& j);

    /**
     * @brief Serialize a repository to the portfolio JSON format
     */
    static nlohmann::json portfolios_to_json(const portfolio::PortfolioRepository& repository);

    /**
     * @brief Write a repository to a JSON file
     * @throws std::runtime_error if the file cannot be opened
     */
    static void save_portfolios(const portfolio::PortfolioRepository& repository,
                                const std::string& filepath);

    // ========================================================================
    // Engine Settings
    // ========================================================================

    /**
     * @brief Read and parse a JSON document
     * @throws std::runtime_error if the file is missing or not valid JSON
     */
    static nlohmann::json load_json(const std::string& filepath);

    /** @brief Read an EngineConfig from a JSON file */
    static EngineConfig load_config(const std::string& config_path);

    // ========================================================================
    // Synthetic Histories
    // ========================================================================

    /**
     * @brief Random-walk OHLCV bars for each ticker, weekdays only
     *
     * Daily returns are normal with mean @p drift and standard deviation
     * @p volatility, which must be positive. Equal seeds give equal output.
     *
     * @throws std::invalid_argument on a malformed start date or bad volatility
     */
    static std::vector<PriceSeries> generate_synthetic_history(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        std::uint32_t seed = 42
    );

    /** @brief Shift a YYYY-MM-DD date by a number of calendar days (may be negative) */
    static std::string add_days(const std::string& start_date, int days_offset);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);

    // NaN when the field is not a number
    static double safe_stod(const std::string& str);

    // 0 = Sunday
    static int weekday(const std::string& date);
};

} // namespace data
} // namespace equity

#endif // EQUITY_DATA_DATA_LOADER_HPP
