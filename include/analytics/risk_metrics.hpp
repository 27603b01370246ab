/**
 * @file risk_metrics.hpp
 * @brief Historical tail-risk measures (VaR and CVaR) of a return series.
 *
 * VaR is the (1 - confidence) quantile of the empirical return
 * distribution, interpolated linearly between order statistics at index
 * (1 - confidence) * (N - 1) of the sorted returns. It is reported as a
 * signed return, so a typical 95% VaR is negative. CVaR is the mean of all
 * returns at or below VaR.
 */

#ifndef EQUITY_ANALYTICS_RISK_METRICS_HPP
#define EQUITY_ANALYTICS_RISK_METRICS_HPP

#include "data/price_series.hpp"

#include <vector>

namespace equity
{
    namespace analytics
    {

        /**
         * @class RiskMetrics
         * @brief Historical Value at Risk and Conditional Value at Risk.
         *
         * Usage:
         * @code
         *   RiskMetrics risk(aggregated.returns);
         *   double var95 = risk.value_at_risk(0.95);    // e.g. -0.018
         *   double cvar95 = risk.conditional_var(0.95); // <= var95
         * @endcode
         *
         * Both measures are 0 for an empty series.
         */
        class RiskMetrics
        {
        public:
            explicit RiskMetrics(const data::ReturnSeries &returns);
            explicit RiskMetrics(const std::vector<double> &returns);

            ~RiskMetrics() = default;

            /**
             * @brief Historical Value at Risk.
             * @param confidence Confidence level in (0, 1) (default 0.95).
             * @return Signed (1 - confidence) quantile of the returns.
             * @throws std::invalid_argument If confidence is not in (0, 1).
             */
            double value_at_risk(double confidence = 0.95) const;

            /**
             * @brief Historical Conditional VaR (expected shortfall).
             * @param confidence Confidence level in (0, 1) (default 0.95).
             * @return Mean of the returns <= value_at_risk(confidence).
             * @throws std::invalid_argument If confidence is not in (0, 1).
             */
            double conditional_var(double confidence = 0.95) const;

            /** @brief Returns sorted ascending. */
            const std::vector<double> &sorted_returns() const { return sorted_; }

            size_t size() const { return sorted_.size(); }
            bool empty() const { return sorted_.empty(); }

        private:
            static void check_confidence(double confidence);

            std::vector<double> sorted_;
        };

    } // namespace analytics
} // namespace equity

#endif // EQUITY_ANALYTICS_RISK_METRICS_HPP
