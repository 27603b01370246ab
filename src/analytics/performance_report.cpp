/**
 * @file performance_report.cpp
 * @brief JSON and text export of performance and comparison reports.
 */

#include "analytics/performance_report.hpp"

#include <iomanip>
#include <sstream>

namespace equity
{
    namespace analytics
    {

        // ===================================================================
        // Anonymous namespace: formatting helpers
        // ===================================================================

        namespace
        {

            /**
             * @brief Render a metric as a percentage, flagging non-computed values.
             */
            std::string format_percent(const MetricValue &m)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(4) << m.value * 100.0 << "%";
                if (!m.is_computed())
                {
                    oss << " (" << metric_status_to_string(m.status) << ")";
                }
                return oss.str();
            }

            std::string format_ratio(const MetricValue &m)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(4) << m.value;
                if (!m.is_computed())
                {
                    oss << " (" << metric_status_to_string(m.status) << ")";
                }
                return oss.str();
            }

            nlohmann::json metrics_to_json(const PerformanceMetricValues &m)
            {
                nlohmann::json j;
                j["total_return"] = m.total_return;
                j["annualized_return"] = m.annualized_return;
                j["volatility"] = m.volatility;
                j["sharpe_ratio"] = m.sharpe_ratio;
                j["sortino_ratio"] = m.sortino_ratio;
                j["calmar_ratio"] = m.calmar_ratio;
                j["max_drawdown"] = m.max_drawdown;
                j["beta"] = m.beta;
                j["alpha"] = m.alpha;
                return j;
            }

            nlohmann::json risk_to_json(const RiskMetricValues &m)
            {
                nlohmann::json j;
                j["var_95"] = m.var_95;
                j["var_99"] = m.var_99;
                j["cvar_95"] = m.cvar_95;
                j["cvar_99"] = m.cvar_99;
                j["tracking_error"] = m.tracking_error;
                return j;
            }

        } // anonymous namespace

        // ===================================================================
        // MetricValue
        // ===================================================================

        std::string metric_status_to_string(MetricStatus status)
        {
            switch (status)
            {
            case MetricStatus::COMPUTED:
                return "computed";
            case MetricStatus::NEUTRAL:
                return "neutral";
            case MetricStatus::UNAVAILABLE:
                return "unavailable";
            default:
                return "unknown";
            }
        }

        MetricValue MetricValue::computed(double value)
        {
            MetricValue m;
            m.value = value;
            m.status = MetricStatus::COMPUTED;
            return m;
        }

        MetricValue MetricValue::neutral(const std::string &note)
        {
            MetricValue m;
            m.value = 0.0;
            m.status = MetricStatus::NEUTRAL;
            m.note = note;
            return m;
        }

        MetricValue MetricValue::unavailable(const std::string &note)
        {
            MetricValue m;
            m.value = 0.0;
            m.status = MetricStatus::UNAVAILABLE;
            m.note = note;
            return m;
        }

        void to_json(nlohmann::json &j, const MetricValue &m)
        {
            j = nlohmann::json{{"value", m.value}, {"status", metric_status_to_string(m.status)}};
            if (!m.note.empty())
            {
                j["note"] = m.note;
            }
        }

        // ===================================================================
        // PerformanceReport
        // ===================================================================

        nlohmann::json PerformanceReport::to_json(bool include_series) const
        {
            nlohmann::json j;

            j["portfolio_id"] = portfolio_id;
            j["name"] = name;
            j["window"]["start"] = window.start;
            j["window"]["end"] = window.end;
            j["window"]["first_date"] = first_date;
            j["window"]["last_date"] = last_date;
            j["window"]["observations"] = daily_returns.size();

            j["total_value"] = total_value;
            j["positions"] = nlohmann::json::array();
            for (const auto &p : positions)
            {
                nlohmann::json entry = {{"ticker", p.ticker},
                                        {"shares", p.shares},
                                        {"price", p.price},
                                        {"value", p.value},
                                        {"weight", p.weight},
                                        {"allocation", p.allocation},
                                        {"sector", p.sector}};
                j["positions"].push_back(entry);
            }
            j["sector_allocation"] = sector_allocation;

            j["metrics"] = metrics_to_json(metrics);
            j["risk_metrics"] = risk_to_json(risk_metrics);

            j["benchmark_relative"]["r_squared"] = relative.r_squared;
            j["benchmark_relative"]["active_return"] = relative.active_return;
            j["benchmark_relative"]["information_ratio"] = relative.information_ratio;
            j["benchmark_relative"]["observations"] = relative.observations;

            j["max_drawdown_detail"]["depth"] = drawdown.depth;
            j["max_drawdown_detail"]["duration_days"] = drawdown.duration_days;
            j["max_drawdown_detail"]["recovery_days"] = drawdown.recovery_days;
            j["max_drawdown_detail"]["peak_index"] = drawdown.peak_index;
            j["max_drawdown_detail"]["trough_index"] = drawdown.trough_index;

            j["data_quality"]["unavailable_tickers"] = data_quality.unavailable_tickers;
            j["data_quality"]["missing_return_days"] = data_quality.missing_return_days;
            j["data_quality"]["benchmark_ticker"] = data_quality.benchmark_ticker;
            j["data_quality"]["benchmark_available"] = data_quality.benchmark_available;
            j["data_quality"]["benchmark_message"] = data_quality.benchmark_message;

            if (include_series)
            {
                j["daily_returns"]["dates"] = daily_returns.dates;
                j["daily_returns"]["values"] = daily_returns.values;
            }

            return j;
        }

        std::string PerformanceReport::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Performance Report: " << name << " (id " << portfolio_id << ")\n";
            oss << "==================================================\n";
            oss << "Period:              " << first_date << " to " << last_date
                << " (" << daily_returns.size() << " returns)\n";
            oss << "Total Value:         " << std::setprecision(2) << total_value << "\n";
            oss << "\n";

            oss << "Positions:\n";
            for (const auto &p : positions)
            {
                oss << "  " << std::left << std::setw(8) << p.ticker << std::right
                    << std::setw(12) << std::setprecision(2) << p.shares
                    << std::setw(12) << p.price
                    << std::setw(14) << p.value
                    << std::setw(9) << p.weight * 100.0 << "%  " << p.sector << "\n";
            }
            if (!sector_allocation.empty())
            {
                oss << "Sectors:\n";
                for (const auto &entry : sector_allocation)
                {
                    oss << "  " << std::left << std::setw(24) << entry.first << std::right
                        << std::setprecision(2) << entry.second << "\n";
                }
            }
            oss << "\n";

            oss << "Return Metrics:\n";
            oss << "  Total Return:        " << format_percent(metrics.total_return) << "\n";
            oss << "  Annualized Return:   " << format_percent(metrics.annualized_return) << "\n";
            oss << "\n";

            oss << "Risk Metrics:\n";
            oss << "  Volatility:          " << format_percent(metrics.volatility) << "\n";
            oss << "  Max Drawdown:        " << format_percent(metrics.max_drawdown) << "\n";
            oss << "  VaR (95%):           " << format_percent(risk_metrics.var_95) << "\n";
            oss << "  VaR (99%):           " << format_percent(risk_metrics.var_99) << "\n";
            oss << "  CVaR (95%):          " << format_percent(risk_metrics.cvar_95) << "\n";
            oss << "  CVaR (99%):          " << format_percent(risk_metrics.cvar_99) << "\n";
            oss << "\n";

            oss << "Risk-Adjusted Metrics:\n";
            oss << "  Sharpe Ratio:        " << format_ratio(metrics.sharpe_ratio) << "\n";
            oss << "  Sortino Ratio:       " << format_ratio(metrics.sortino_ratio) << "\n";
            oss << "  Calmar Ratio:        " << format_ratio(metrics.calmar_ratio) << "\n";
            oss << "\n";

            oss << "Benchmark (" << data_quality.benchmark_ticker << "):\n";
            oss << "  Beta:                " << format_ratio(metrics.beta) << "\n";
            oss << "  Alpha:               " << format_percent(metrics.alpha) << "\n";
            oss << "  Tracking Error:      " << format_percent(risk_metrics.tracking_error) << "\n";
            oss << "  Information Ratio:   " << format_ratio(relative.information_ratio) << "\n";
            oss << "  R-squared:           " << format_ratio(relative.r_squared) << "\n";
            if (!data_quality.benchmark_available)
            {
                oss << "  Unavailable: " << data_quality.benchmark_message << "\n";
            }

            if (!data_quality.unavailable_tickers.empty() || !data_quality.missing_return_days.empty())
            {
                oss << "\nData Quality:\n";
                for (const auto &t : data_quality.unavailable_tickers)
                {
                    oss << "  " << t << ": no data\n";
                }
                for (const auto &entry : data_quality.missing_return_days)
                {
                    oss << "  " << entry.first << ": missing on " << entry.second << " dates\n";
                }
            }

            return oss.str();
        }

        // ===================================================================
        // ComparisonReport
        // ===================================================================

        nlohmann::json ComparisonReport::to_json() const
        {
            nlohmann::json j;

            j["portfolios"] = nlohmann::json::array();
            for (const auto &row : rows)
            {
                nlohmann::json r;
                r["portfolio_id"] = row.portfolio_id;
                r["name"] = row.name;
                r["observations"] = row.observations;
                r["metrics"] = metrics_to_json(row.metrics);
                r["risk_metrics"] = risk_to_json(row.risk_metrics);
                j["portfolios"].push_back(r);
            }

            j["skipped"] = nlohmann::json::array();
            for (const auto &s : skipped)
            {
                nlohmann::json entry = {{"portfolio_id", s.portfolio_id}, {"reason", s.reason}};
                j["skipped"].push_back(entry);
            }

            j["correlation"] = nlohmann::json::array();
            for (Eigen::Index i = 0; i < correlation.rows(); ++i)
            {
                std::vector<double> line(static_cast<size_t>(correlation.cols()));
                for (Eigen::Index k = 0; k < correlation.cols(); ++k)
                {
                    line[static_cast<size_t>(k)] = correlation(i, k);
                }
                j["correlation"].push_back(nlohmann::json(line));
            }

            j["cumulative_returns"] = nlohmann::json::array();
            for (const auto &curve : cumulative_returns)
            {
                nlohmann::json entry = {{"portfolio_id", curve.portfolio_id},
                                        {"dates", curve.dates},
                                        {"values", curve.values}};
                j["cumulative_returns"].push_back(entry);
            }

            return j;
        }

        std::string ComparisonReport::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(4);

            oss << "Portfolio Comparison\n";
            oss << "====================\n\n";

            oss << std::left << std::setw(6) << "Id" << std::setw(20) << "Name" << std::right
                << std::setw(12) << "Total" << std::setw(12) << "Annual" << std::setw(12) << "Vol"
                << std::setw(10) << "Sharpe" << std::setw(12) << "MaxDD" << std::setw(12) << "VaR95" << "\n";
            for (const auto &row : rows)
            {
                oss << std::left << std::setw(6) << row.portfolio_id << std::setw(20) << row.name << std::right
                    << std::setw(12) << row.metrics.total_return.value
                    << std::setw(12) << row.metrics.annualized_return.value
                    << std::setw(12) << row.metrics.volatility.value
                    << std::setw(10) << row.metrics.sharpe_ratio.value
                    << std::setw(12) << row.metrics.max_drawdown.value
                    << std::setw(12) << row.risk_metrics.var_95.value << "\n";
            }

            oss << "\nCorrelation:\n";
            for (Eigen::Index i = 0; i < correlation.rows(); ++i)
            {
                oss << "  ";
                for (Eigen::Index k = 0; k < correlation.cols(); ++k)
                {
                    oss << std::setw(9) << correlation(i, k);
                }
                oss << "\n";
            }

            if (!skipped.empty())
            {
                oss << "\nSkipped:\n";
                for (const auto &s : skipped)
                {
                    oss << "  " << s.portfolio_id << ": " << s.reason << "\n";
                }
            }

            return oss.str();
        }

    } // namespace analytics
} // namespace equity
