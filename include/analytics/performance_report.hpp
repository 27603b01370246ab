/**
 * @file performance_report.hpp
 * @brief Structured results of the analytics engine.
 *
 * Every metric is carried as a MetricValue so callers can tell a regular
 * value from a neutral fallback (numeric degeneracy) or an unavailable
 * input (e.g. the benchmark could not be fetched). Reports are derived on
 * demand and never persisted; they export to JSON and to a text summary.
 */

#ifndef EQUITY_ANALYTICS_PERFORMANCE_REPORT_HPP
#define EQUITY_ANALYTICS_PERFORMANCE_REPORT_HPP

#include "analytics/performance_metrics.hpp"
#include "data/price_series.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace equity
{
    namespace analytics
    {

        /**
         * @enum MetricStatus
         * @brief How a metric value was obtained.
         */
        enum class MetricStatus
        {
            COMPUTED,   ///< Regular value
            NEUTRAL,    ///< Degenerate input forced the neutral value 0
            UNAVAILABLE ///< An input could not be obtained; value is 0
        };

        /**
         * @brief Convert MetricStatus to string.
         */
        std::string metric_status_to_string(MetricStatus status);

        /**
         * @struct MetricValue
         * @brief A metric with its provenance.
         */
        struct MetricValue
        {
            double value = 0.0;
            MetricStatus status = MetricStatus::COMPUTED;
            std::string note; ///< Reason for a NEUTRAL or UNAVAILABLE status

            static MetricValue computed(double value);
            static MetricValue neutral(const std::string &note);
            static MetricValue unavailable(const std::string &note);

            bool is_computed() const { return status == MetricStatus::COMPUTED; }
        };

        void to_json(nlohmann::json &j, const MetricValue &m);

        /**
         * @struct PositionBreakdown
         * @brief Valuation of one constituent.
         */
        struct PositionBreakdown
        {
            std::string ticker;
            double shares = 0.0;
            double price = 0.0;      ///< Last close in the window, else the stored price
            double value = 0.0;      ///< shares * price
            double weight = 0.0;     ///< value / total_value
            double allocation = 0.0; ///< Target weight from the portfolio definition
            std::string sector = "Unknown";
        };

        /**
         * @struct PerformanceMetricValues
         * @brief Return and risk-adjusted metrics of a report.
         */
        struct PerformanceMetricValues
        {
            MetricValue total_return;
            MetricValue annualized_return;
            MetricValue volatility;
            MetricValue sharpe_ratio;
            MetricValue sortino_ratio;
            MetricValue calmar_ratio;
            MetricValue max_drawdown;
            MetricValue beta;
            MetricValue alpha;
        };

        /**
         * @struct RiskMetricValues
         * @brief Tail-risk and tracking metrics of a report.
         */
        struct RiskMetricValues
        {
            MetricValue var_95;
            MetricValue var_99;
            MetricValue cvar_95;
            MetricValue cvar_99;
            MetricValue tracking_error;
        };

        /**
         * @struct BenchmarkMetricValues
         * @brief Supplementary benchmark-relative statistics.
         */
        struct BenchmarkMetricValues
        {
            MetricValue r_squared;
            MetricValue active_return;
            MetricValue information_ratio;
            int observations = 0; ///< Dates shared with the benchmark
        };

        /**
         * @struct DataQuality
         * @brief Gaps and degraded inputs behind a report.
         */
        struct DataQuality
        {
            std::vector<std::string> unavailable_tickers;   ///< Tickers without any data
            std::map<std::string, int> missing_return_days; ///< ticker -> dates it contributed 0
            std::string benchmark_ticker;
            bool benchmark_available = false;
            std::string benchmark_message;
        };

        /**
         * @struct PerformanceReport
         * @brief Full analytics of one portfolio over one window.
         */
        struct PerformanceReport
        {
            int portfolio_id = 0;
            std::string name;
            data::DateRange window;   ///< Requested window
            std::string first_date;   ///< First return date actually used
            std::string last_date;    ///< Last return date actually used

            double total_value = 0.0;
            std::vector<PositionBreakdown> positions;
            std::map<std::string, double> sector_allocation; ///< sector -> value

            data::ReturnSeries daily_returns;
            DrawdownInfo drawdown;

            PerformanceMetricValues metrics;
            RiskMetricValues risk_metrics;
            BenchmarkMetricValues relative;
            DataQuality data_quality;

            /**
             * @brief Export to JSON.
             * @param include_series Also export the daily return series.
             */
            nlohmann::json to_json(bool include_series = true) const;

            /**
             * @brief Generate a formatted multi-line summary.
             */
            std::string summary() const;
        };

        /**
         * @struct ComparisonRow
         * @brief One line of the comparison metrics table.
         */
        struct ComparisonRow
        {
            int portfolio_id = 0;
            std::string name;
            PerformanceMetricValues metrics;
            RiskMetricValues risk_metrics;
            size_t observations = 0;
        };

        /**
         * @struct SkippedPortfolio
         * @brief A requested portfolio that could not be analyzed.
         */
        struct SkippedPortfolio
        {
            int portfolio_id = 0;
            std::string reason;
        };

        /**
         * @struct CumulativeCurve
         * @brief Growth of 1 unit, compounded from the series' own first observation.
         */
        struct CumulativeCurve
        {
            int portfolio_id = 0;
            std::vector<std::string> dates;
            std::vector<double> values;
        };

        /**
         * @struct ComparisonReport
         * @brief Side-by-side analytics of several portfolios.
         *
         * Rows, correlation rows/columns and curves share the same order.
         */
        struct ComparisonReport
        {
            std::vector<ComparisonRow> rows;
            std::vector<SkippedPortfolio> skipped;
            Eigen::MatrixXd correlation;
            std::vector<CumulativeCurve> cumulative_returns;

            nlohmann::json to_json() const;
            std::string summary() const;
        };

    } // namespace analytics
} // namespace equity

#endif // EQUITY_ANALYTICS_PERFORMANCE_REPORT_HPP
