/**
 * @file portfolio_comparator.hpp
 * @brief Side-by-side comparison of several portfolio reports.
 *
 * Builds the metrics table, the pairwise return correlation matrix and the
 * cumulative-return curves of already computed PerformanceReports. Pairwise
 * statistics use only the dates both portfolios share.
 */

#ifndef EQUITY_ANALYTICS_PORTFOLIO_COMPARATOR_HPP
#define EQUITY_ANALYTICS_PORTFOLIO_COMPARATOR_HPP

#include "analytics/performance_report.hpp"

#include <vector>

namespace equity
{
    namespace analytics
    {

        /**
         * @class PortfolioComparator
         * @brief Assembles a ComparisonReport from individual reports.
         *
         * Usage:
         * @code
         *   PortfolioComparator comparator;
         *   ComparisonReport cmp = comparator.compare(reports, skipped);
         *   double rho = cmp.correlation(0, 1);
         * @endcode
         */
        class PortfolioComparator
        {
        public:
            PortfolioComparator() = default;
            ~PortfolioComparator() = default;

            /**
             * @brief Drop repeated ids, keeping the order of first appearance.
             */
            static std::vector<int> distinct_ids(const std::vector<int> &ids);

            /**
             * @brief Build the comparison of the given reports.
             * @param reports One report per successfully analyzed portfolio.
             * @param skipped Portfolios that could not be analyzed, with reasons.
             * @return Report whose rows follow the order of @p reports.
             * @throws InsufficientData If fewer than 2 reports are supplied.
             */
            ComparisonReport compare(const std::vector<PerformanceReport> &reports,
                                     const std::vector<SkippedPortfolio> &skipped = {}) const;

            /**
             * @brief Pearson correlation of two return series over their shared dates.
             * @return Correlation in [-1, 1]; 0 with fewer than 2 shared dates or
             *         when either side has zero variance.
             */
            static double correlation(const data::ReturnSeries &a, const data::ReturnSeries &b);

            /**
             * @brief Correlation matrix of several return series.
             * @return Symmetric matrix with unit diagonal.
             */
            static Eigen::MatrixXd correlation_matrix(const std::vector<data::ReturnSeries> &series);

            /**
             * @brief Growth curve compounded from the series' own first observation.
             */
            static CumulativeCurve cumulative_curve(int portfolio_id, const data::ReturnSeries &returns);
        };

    } // namespace analytics
} // namespace equity

#endif // EQUITY_ANALYTICS_PORTFOLIO_COMPARATOR_HPP
