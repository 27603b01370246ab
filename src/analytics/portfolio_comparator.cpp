/**
 * @file portfolio_comparator.cpp
 * @brief Implementation of the PortfolioComparator class.
 */

#include "analytics/portfolio_comparator.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace equity
{
    namespace analytics
    {

        std::vector<int> PortfolioComparator::distinct_ids(const std::vector<int> &ids)
        {
            std::vector<int> out;
            std::set<int> seen;
            for (int id : ids)
            {
                if (seen.insert(id).second)
                {
                    out.push_back(id);
                }
            }
            return out;
        }

        ComparisonReport PortfolioComparator::compare(const std::vector<PerformanceReport> &reports,
                                                      const std::vector<SkippedPortfolio> &skipped) const
        {
            if (reports.size() < 2)
            {
                throw InsufficientData("Comparison needs at least 2 analyzable portfolios, got " +
                                       std::to_string(reports.size()));
            }

            ComparisonReport out;
            out.skipped = skipped;

            std::vector<data::ReturnSeries> series;
            series.reserve(reports.size());

            for (const auto &report : reports)
            {
                ComparisonRow row;
                row.portfolio_id = report.portfolio_id;
                row.name = report.name;
                row.metrics = report.metrics;
                row.risk_metrics = report.risk_metrics;
                row.observations = report.daily_returns.size();
                out.rows.push_back(row);

                out.cumulative_returns.push_back(cumulative_curve(report.portfolio_id, report.daily_returns));
                series.push_back(report.daily_returns);
            }

            out.correlation = correlation_matrix(series);
            return out;
        }

        // ===================================================================
        // Correlation
        // ===================================================================

        double PortfolioComparator::correlation(const data::ReturnSeries &a, const data::ReturnSeries &b)
        {
            auto aligned = data::align(a, b);
            const auto n = static_cast<Eigen::Index>(aligned.first.size());
            if (n < 2)
            {
                return 0.0;
            }

            Eigen::Map<const Eigen::VectorXd> x(aligned.first.values.data(), n);
            Eigen::Map<const Eigen::VectorXd> y(aligned.second.values.data(), n);

            Eigen::VectorXd dx = (x.array() - x.mean()).matrix();
            Eigen::VectorXd dy = (y.array() - y.mean()).matrix();

            double sxx = dx.squaredNorm();
            double syy = dy.squaredNorm();
            if (sxx < 1e-18 || syy < 1e-18)
            {
                return 0.0;
            }

            double rho = dx.dot(dy) / std::sqrt(sxx * syy);
            return std::max(-1.0, std::min(1.0, rho));
        }

        Eigen::MatrixXd PortfolioComparator::correlation_matrix(const std::vector<data::ReturnSeries> &series)
        {
            const auto n = static_cast<Eigen::Index>(series.size());
            Eigen::MatrixXd corr = Eigen::MatrixXd::Identity(n, n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                for (Eigen::Index k = i + 1; k < n; ++k)
                {
                    double rho = correlation(series[static_cast<size_t>(i)], series[static_cast<size_t>(k)]);
                    corr(i, k) = rho;
                    corr(k, i) = rho;
                }
            }
            return corr;
        }

        // ===================================================================
        // Cumulative Curves
        // ===================================================================

        CumulativeCurve PortfolioComparator::cumulative_curve(int portfolio_id, const data::ReturnSeries &returns)
        {
            CumulativeCurve curve;
            curve.portfolio_id = portfolio_id;
            curve.dates = returns.dates;
            curve.values.reserve(returns.size());

            double growth = 1.0;
            for (double r : returns.values)
            {
                growth *= (1.0 + r);
                curve.values.push_back(growth);
            }
            return curve;
        }

    } // namespace analytics
} // namespace equity
