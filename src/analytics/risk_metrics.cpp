/**
 * @file risk_metrics.cpp
 * @brief Implementation of the RiskMetrics class.
 */

#include "analytics/risk_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace equity
{
    namespace analytics
    {

        RiskMetrics::RiskMetrics(const data::ReturnSeries &returns)
            : RiskMetrics(returns.values)
        {
        }

        RiskMetrics::RiskMetrics(const std::vector<double> &returns)
            : sorted_(returns)
        {
            std::sort(sorted_.begin(), sorted_.end());
        }

        double RiskMetrics::value_at_risk(double confidence) const
        {
            check_confidence(confidence);

            int n = static_cast<int>(sorted_.size());
            if (n == 0)
            {
                return 0.0;
            }

            double index = (1.0 - confidence) * static_cast<double>(n - 1);
            int lower = static_cast<int>(std::floor(index));
            int upper = static_cast<int>(std::ceil(index));

            if (lower == upper || upper >= n)
            {
                return sorted_[lower];
            }

            // Written as lower + frac * gap so the result never drops below sorted_[lower]
            double frac = index - static_cast<double>(lower);
            return sorted_[lower] + frac * (sorted_[upper] - sorted_[lower]);
        }

        double RiskMetrics::conditional_var(double confidence) const
        {
            double var = value_at_risk(confidence);
            if (sorted_.empty())
            {
                return 0.0;
            }

            double sum = 0.0;
            int count = 0;
            for (double r : sorted_)
            {
                if (r > var)
                {
                    break;
                }
                sum += r;
                ++count;
            }
            return sum / static_cast<double>(count);
        }

        void RiskMetrics::check_confidence(double confidence)
        {
            if (!(confidence > 0.0 && confidence < 1.0))
            {
                throw std::invalid_argument(
                    "Confidence level must be in (0, 1), got: " + std::to_string(confidence));
            }
        }

    } // namespace analytics
} // namespace equity
