/**
 * @file performance_metrics.hpp
 * @brief Return, volatility, drawdown and risk-adjusted metrics of a return series.
 *
 * All annualized values use simple scaling: means are multiplied by the
 * number of trading days per year (default 252) and standard deviations by
 * its square root. The ratios are computed without subtracting a
 * risk-free rate.
 *
 * Degenerate inputs never throw: an empty series, a zero volatility, an
 * empty downside set or a zero drawdown all yield 0.
 */

#ifndef EQUITY_ANALYTICS_PERFORMANCE_METRICS_HPP
#define EQUITY_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "data/price_series.hpp"

#include <string>
#include <vector>

namespace equity
{
    namespace analytics
    {

        /**
         * @struct DrawdownInfo
         * @brief Summary of the maximum drawdown event.
         *
         * Indices refer to positions in the return series. The recovery index
         * is the first observation after the trough whose cumulative value is
         * back at the peak, or -1 if the series ends underwater.
         */
        struct DrawdownInfo
        {
            double depth = 0.0;      ///< Maximum drawdown as a non-positive fraction (e.g., -0.15)
            int duration_days = 0;   ///< Observations from peak to trough
            int recovery_days = -1;  ///< Observations from trough to recovery (-1 if unrecovered)
            int peak_index = 0;      ///< Index of the peak before the drawdown
            int trough_index = 0;    ///< Index of the trough
            int recovery_index = -1; ///< Index of recovery (-1 if unrecovered)
            double peak_value = 1.0;   ///< Cumulative value at the peak
            double trough_value = 1.0; ///< Cumulative value at the trough
        };

        /**
         * @class PerformanceMetrics
         * @brief Performance analytics for a daily return series.
         *
         * Usage:
         * @code
         *   PerformanceMetrics metrics(aggregated.returns);
         *   double sharpe = metrics.sharpe_ratio();
         *   double max_dd = metrics.max_drawdown();   // <= 0
         * @endcode
         *
         * Thread safety: Instances are effectively immutable after construction.
         * All public methods are const and safe to call concurrently.
         */
        class PerformanceMetrics
        {
        public:
            // ---------------------------------------------------------------
            // Constructors
            // ---------------------------------------------------------------

            /**
             * @brief Construct from a dated return series.
             * @param returns Daily simple returns (may be empty).
             * @param trading_days_per_year Number of trading days per year (default 252).
             * @throws std::invalid_argument If trading_days_per_year is not positive.
             */
            explicit PerformanceMetrics(const data::ReturnSeries &returns,
                                        int trading_days_per_year = 252);

            /**
             * @brief Construct from raw returns without dates.
             * @param returns Daily simple returns (may be empty).
             * @param trading_days_per_year Number of trading days per year (default 252).
             * @throws std::invalid_argument If trading_days_per_year is not positive.
             */
            explicit PerformanceMetrics(const std::vector<double> &returns,
                                        int trading_days_per_year = 252);

            ~PerformanceMetrics() = default;

            // ---------------------------------------------------------------
            // Return Metrics
            // ---------------------------------------------------------------

            /**
             * @brief Compounded return over the full series.
             * @return prod(1 + r) - 1, or 0 for an empty series.
             */
            double total_return() const;

            /**
             * @brief Arithmetic annualized return.
             * @return mean(r) * trading_days_per_year, or 0 for an empty series.
             */
            double annualized_return() const;

            /**
             * @brief Cumulative growth curve.
             * @return cum[t] = prod_{k<=t}(1 + r_k), starting at the first observation.
             */
            std::vector<double> cumulative_returns() const;

            // ---------------------------------------------------------------
            // Risk Metrics
            // ---------------------------------------------------------------

            /**
             * @brief Annualized volatility.
             * @return Sample standard deviation (N-1) * sqrt(trading_days); 0 when N < 2.
             */
            double annualized_volatility() const;

            /**
             * @brief Daily downside deviation.
             * @return sqrt(mean(r^2)) over the negative observations only;
             *         0 when no observation is negative.
             */
            double downside_deviation() const;

            /**
             * @brief Number of negative observations.
             */
            int downside_count() const;

            /**
             * @brief Maximum drawdown depth.
             * @return Worst (cum - running_max) / running_max, a value <= 0.
             */
            double max_drawdown() const;

            /**
             * @brief Detailed maximum drawdown information.
             */
            const DrawdownInfo &max_drawdown_info() const;

            /**
             * @brief Full drawdown (underwater) series.
             * @return Drawdown at each observation; 0 at a running peak, negative below it.
             */
            const std::vector<double> &drawdown_series() const;

            // ---------------------------------------------------------------
            // Risk-Adjusted Metrics
            // ---------------------------------------------------------------

            /**
             * @brief Sharpe ratio.
             * @return annualized_return / annualized_volatility.
             *
             * @note Returns 0.0 if volatility is zero.
             */
            double sharpe_ratio() const;

            /**
             * @brief Sortino ratio.
             * @return annualized_return / (downside_deviation * sqrt(trading_days)).
             *
             * @note Returns 0.0 if there are no negative returns or the
             *       downside deviation is zero.
             */
            double sortino_ratio() const;

            /**
             * @brief Calmar ratio.
             * @return annualized_return / |max_drawdown|.
             *
             * @note Returns 0.0 if max drawdown is zero.
             */
            double calmar_ratio() const;

            // ---------------------------------------------------------------
            // Accessors
            // ---------------------------------------------------------------

            /** @brief Get the return series. */
            const std::vector<double> &return_series() const;

            /** @brief Get the date series (empty when built from raw returns). */
            const std::vector<std::string> &dates() const;

            /** @brief Number of observations. */
            size_t size() const { return returns_.size(); }

            /** @brief Get the trading days per year setting. */
            int trading_days_per_year() const;

        private:
            /**
             * @brief Validate settings and compute the drawdown cache.
             */
            void initialize();

            /**
             * @brief Compute the cumulative and drawdown series.
             */
            void compute_drawdown();

            double mean() const;

            std::vector<double> returns_;
            std::vector<std::string> dates_;
            int trading_days_per_year_;

            std::vector<double> drawdown_series_;
            DrawdownInfo max_drawdown_info_;
        };

    } // namespace analytics
} // namespace equity

#endif // EQUITY_ANALYTICS_PERFORMANCE_METRICS_HPP
