/**
 * @file benchmark_analysis.cpp
 * @brief Beta, CAPM alpha and tracking statistics against a benchmark.
 *
 * Beta comes from an ordinary least squares fit of portfolio returns on
 * benchmark returns over the shared dates. Alpha compares the annualized
 * mean portfolio return with the CAPM expectation built from the
 * configured risk-free rate and market return.
 */

#include "analytics/benchmark_analysis.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>

namespace equity
{
    namespace analytics
    {

        // ===================================================================
        // Constructors
        // ===================================================================

        BenchmarkAnalysis::BenchmarkAnalysis(const data::ReturnSeries &portfolio_returns,
                                             const data::ReturnSeries &benchmark_returns,
                                             double risk_free_rate,
                                             double market_return,
                                             int trading_days_per_year)
            : risk_free_rate_(risk_free_rate), market_return_(market_return), trading_days_per_year_(trading_days_per_year), tracking_error_(0.0), information_ratio_(0.0), active_return_(0.0), benchmark_has_variance_(false)
        {
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument("BenchmarkAnalysis: trading_days_per_year must be positive, got " +
                                            std::to_string(trading_days_per_year));
            }

            auto aligned = data::align(portfolio_returns, benchmark_returns);
            dates_ = aligned.first.dates;
            portfolio_returns_ = aligned.first.values;
            benchmark_returns_ = aligned.second.values;

            excess_returns_.reserve(portfolio_returns_.size());
            std::transform(portfolio_returns_.begin(), portfolio_returns_.end(),
                           benchmark_returns_.begin(), std::back_inserter(excess_returns_),
                           std::minus<double>());
            regression_result_.num_observations = static_cast<int>(excess_returns_.size());

            if (sufficient())
            {
                run_regression();
                compute_tracking_metrics();
            }
        }

        bool BenchmarkAnalysis::sufficient() const
        {
            return portfolio_returns_.size() >= 2;
        }

        int BenchmarkAnalysis::num_observations() const
        {
            return regression_result_.num_observations;
        }

        bool BenchmarkAnalysis::benchmark_has_variance() const
        {
            return benchmark_has_variance_;
        }

        // ===================================================================
        // Regression Metrics
        // ===================================================================

        double BenchmarkAnalysis::alpha() const
        {
            return regression_result_.alpha;
        }

        double BenchmarkAnalysis::beta() const
        {
            return regression_result_.beta;
        }

        double BenchmarkAnalysis::r_squared() const
        {
            return regression_result_.r_squared;
        }

        // ===================================================================
        // Tracking and Relative Risk
        // ===================================================================

        double BenchmarkAnalysis::tracking_error() const
        {
            return tracking_error_;
        }

        double BenchmarkAnalysis::information_ratio() const
        {
            return information_ratio_;
        }

        double BenchmarkAnalysis::active_return() const
        {
            return active_return_;
        }

        // ===================================================================
        // Aligned Series
        // ===================================================================

        const std::vector<std::string> &BenchmarkAnalysis::dates() const
        {
            return dates_;
        }

        const std::vector<double> &BenchmarkAnalysis::excess_returns() const
        {
            return excess_returns_;
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void BenchmarkAnalysis::run_regression()
        {
            const auto count = static_cast<Eigen::Index>(portfolio_returns_.size());
            const double days = static_cast<double>(trading_days_per_year_);
            Eigen::Map<const Eigen::VectorXd> bench(benchmark_returns_.data(), count);
            Eigen::Map<const Eigen::VectorXd> port(portfolio_returns_.data(), count);

            const double bench_mean = bench.mean();
            const double port_mean = port.mean();
            const Eigen::VectorXd bench_dev = (bench.array() - bench_mean).matrix();
            const Eigen::VectorXd port_dev = (port.array() - port_mean).matrix();

            // Ratio of co-moment to benchmark moment; normalisation cancels
            const double bench_moment = bench_dev.squaredNorm();
            double slope = 0.0;
            if (bench_moment >= 1e-18)
            {
                benchmark_has_variance_ = true;
                slope = bench_dev.dot(port_dev) / bench_moment;
            }
            const double intercept = port_mean - slope * bench_mean;

            regression_result_.beta = slope;
            regression_result_.alpha = port_mean * days -
                                       (risk_free_rate_ + slope * (market_return_ - risk_free_rate_));

            const Eigen::VectorXd fitted = ((slope * bench).array() + intercept).matrix();
            const double unexplained = (port - fitted).squaredNorm();
            const double total = port_dev.squaredNorm();

            regression_result_.r_squared = total < 1e-18 ? 0.0 : 1.0 - unexplained / total;
        }

        void BenchmarkAnalysis::compute_tracking_metrics()
        {
            const auto count = static_cast<Eigen::Index>(excess_returns_.size());
            const double days = static_cast<double>(trading_days_per_year_);
            Eigen::Map<const Eigen::VectorXd> active(excess_returns_.data(), count);

            const double daily_active = active.mean();
            const double spread = (active.array() - daily_active).matrix().squaredNorm();

            active_return_ = daily_active * days;
            tracking_error_ = std::sqrt(spread / static_cast<double>(count - 1)) * std::sqrt(days);
            information_ratio_ = tracking_error_ > 1e-18 ? active_return_ / tracking_error_ : 0.0;
        }

    } // namespace analytics
} // namespace equity
