/**
 * @file benchmark_analysis.hpp
 * @brief Relative performance analysis against a benchmark.
 *
 * Computes beta, CAPM alpha, R-squared, tracking error, active return and
 * information ratio of a portfolio return series against a benchmark
 * return series. Both series are first restricted to the dates they share;
 * nothing is forward- or back-filled.
 *
 * The CAPM expectation used for alpha is:
 *   E[R_p] = R_f + beta * (R_m - R_f)
 *
 * where R_f is the risk-free rate and R_m the assumed market return, both
 * annualized configuration inputs.
 */

#ifndef EQUITY_ANALYTICS_BENCHMARK_ANALYSIS_HPP
#define EQUITY_ANALYTICS_BENCHMARK_ANALYSIS_HPP

#include "data/price_series.hpp"

#include <string>
#include <vector>

namespace equity
{
    namespace analytics
    {

        /**
         * @struct RegressionResult
         * @brief Results of the benchmark regression.
         */
        struct RegressionResult
        {
            double alpha = 0.0;         ///< Annualized return minus the CAPM expectation
            double beta = 0.0;          ///< cov(R_p, R_b) / var(R_b)
            double r_squared = 0.0;     ///< Coefficient of determination (0 to 1)
            int num_observations = 0;   ///< Number of aligned data points
        };

        /**
         * @class BenchmarkAnalysis
         * @brief Computes relative performance metrics against a benchmark.
         *
         * With fewer than 2 aligned observations every metric is 0 and
         * sufficient() returns false.
         *
         * Usage:
         * @code
         *   BenchmarkAnalysis bench(portfolio_returns, benchmark_returns, 0.02, 0.10);
         *   if (bench.sufficient())
         *   {
         *       double beta = bench.beta();
         *       double te = bench.tracking_error();
         *   }
         * @endcode
         *
         * Thread safety: Instances are effectively immutable after construction.
         */
        class BenchmarkAnalysis
        {
        public:
            // ---------------------------------------------------------------
            // Constructors
            // ---------------------------------------------------------------

            /**
             * @brief Construct from dated portfolio and benchmark return series.
             * @param portfolio_returns Daily simple returns of the portfolio.
             * @param benchmark_returns Daily simple returns of the benchmark.
             * @param risk_free_rate Annualized risk-free rate (default 0.02 = 2%).
             * @param market_return Annualized assumed market return (default 0.10 = 10%).
             * @param trading_days_per_year Number of trading days per year (default 252).
             * @throws std::invalid_argument If trading_days_per_year is not positive.
             */
            BenchmarkAnalysis(const data::ReturnSeries &portfolio_returns,
                              const data::ReturnSeries &benchmark_returns,
                              double risk_free_rate = 0.02,
                              double market_return = 0.10,
                              int trading_days_per_year = 252);

            /** @brief Default destructor. */
            ~BenchmarkAnalysis() = default;

            /**
             * @brief Whether enough aligned observations (>= 2) exist.
             */
            bool sufficient() const;

            /** @brief Number of dates shared by both series. */
            int num_observations() const;

            /**
             * @brief Whether the aligned benchmark returns vary at all.
             *
             * When false, beta is forced to 0.
             */
            bool benchmark_has_variance() const;

            // ---------------------------------------------------------------
            // Regression Metrics
            // ---------------------------------------------------------------

            /**
             * @brief CAPM alpha (annualized).
             * @return annualized mean portfolio return - (R_f + beta * (R_m - R_f)).
             */
            double alpha() const;

            /**
             * @brief Beta (market sensitivity).
             * @return cov / var of the benchmark; 0 if the benchmark variance is zero.
             */
            double beta() const;

            /**
             * @brief R-squared of the regression.
             */
            double r_squared() const;

            // ---------------------------------------------------------------
            // Tracking and Relative Risk
            // ---------------------------------------------------------------

            /**
             * @brief Tracking error (annualized).
             * @return Sample standard deviation of (portfolio - benchmark) * sqrt(trading_days).
             */
            double tracking_error() const;

            /**
             * @brief Information ratio.
             * @return active_return / tracking_error.
             *
             * @note Returns 0.0 if tracking error is zero.
             */
            double information_ratio() const;

            /**
             * @brief Active return (annualized excess return over benchmark).
             */
            double active_return() const;

            // ---------------------------------------------------------------
            // Aligned Series
            // ---------------------------------------------------------------

            /** @brief Dates shared by both inputs. */
            const std::vector<std::string> &dates() const;

            /** @brief Excess return series (portfolio - benchmark) on the shared dates. */
            const std::vector<double> &excess_returns() const;

        private:
            void run_regression();
            void compute_tracking_metrics();

            std::vector<std::string> dates_;
            std::vector<double> portfolio_returns_;
            std::vector<double> benchmark_returns_;
            std::vector<double> excess_returns_;
            double risk_free_rate_;
            double market_return_;
            int trading_days_per_year_;

            RegressionResult regression_result_;
            double tracking_error_;
            double information_ratio_;
            double active_return_;
            bool benchmark_has_variance_;
        };

    } // namespace analytics
} // namespace equity

#endif // EQUITY_ANALYTICS_BENCHMARK_ANALYSIS_HPP
