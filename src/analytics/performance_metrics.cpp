/**
 * @file performance_metrics.cpp
 * @brief Return, volatility, drawdown and ratio statistics for one return series.
 *
 * Annualization is simple scaling: the mean daily return is multiplied by
 * trading_days_per_year and daily standard deviations by its square root.
 */

#include "analytics/performance_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace equity
{
    namespace analytics
    {

        // ===================================================================
        // Constructors
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const data::ReturnSeries &returns,
                                               int trading_days_per_year)
            : returns_(returns.values), dates_(returns.dates), trading_days_per_year_(trading_days_per_year)
        {
            initialize();
        }

        PerformanceMetrics::PerformanceMetrics(const std::vector<double> &returns,
                                               int trading_days_per_year)
            : returns_(returns), trading_days_per_year_(trading_days_per_year)
        {
            initialize();
        }

        // ===================================================================
        // Return Metrics
        // ===================================================================

        double PerformanceMetrics::total_return() const
        {
            double growth = 1.0;
            for (double r : returns_)
            {
                growth *= (1.0 + r);
            }
            return growth - 1.0;
        }

        double PerformanceMetrics::annualized_return() const
        {
            return mean() * static_cast<double>(trading_days_per_year_);
        }

        std::vector<double> PerformanceMetrics::cumulative_returns() const
        {
            std::vector<double> cum(returns_.size());
            double growth = 1.0;
            for (size_t i = 0; i < returns_.size(); ++i)
            {
                growth *= (1.0 + returns_[i]);
                cum[i] = growth;
            }
            return cum;
        }

        // ===================================================================
        // Risk Metrics
        // ===================================================================

        double PerformanceMetrics::annualized_volatility() const
        {
            const size_t count = returns_.size();
            if (count < 2)
            {
                return 0.0;
            }

            const double centre = mean();
            const double dispersion = std::accumulate(returns_.begin(), returns_.end(), 0.0,
                                                      [centre](double acc, double r)
                                                      { return acc + (r - centre) * (r - centre); });
            const double sample_variance = dispersion / static_cast<double>(count - 1);
            return std::sqrt(sample_variance * static_cast<double>(trading_days_per_year_));
        }

        double PerformanceMetrics::downside_deviation() const
        {
            const int losses = downside_count();
            if (losses == 0)
            {
                return 0.0;
            }
            double loss_energy = 0.0;
            for (double r : returns_)
            {
                loss_energy += r < 0.0 ? r * r : 0.0;
            }
            return std::sqrt(loss_energy / static_cast<double>(losses));
        }

        int PerformanceMetrics::downside_count() const
        {
            return static_cast<int>(std::count_if(returns_.begin(), returns_.end(),
                                                  [](double r)
                                                  { return r < 0.0; }));
        }

        double PerformanceMetrics::max_drawdown() const
        {
            return max_drawdown_info_.depth;
        }

        const DrawdownInfo &PerformanceMetrics::max_drawdown_info() const
        {
            return max_drawdown_info_;
        }

        const std::vector<double> &PerformanceMetrics::drawdown_series() const
        {
            return drawdown_series_;
        }

        // ===================================================================
        // Risk-Adjusted Metrics
        // ===================================================================

        double PerformanceMetrics::sharpe_ratio() const
        {
            const double sigma = annualized_volatility();
            return sigma < 1e-18 ? 0.0 : annualized_return() / sigma;
        }

        double PerformanceMetrics::sortino_ratio() const
        {
            const double downside = downside_deviation() * std::sqrt(static_cast<double>(trading_days_per_year_));
            return downside < 1e-18 ? 0.0 : annualized_return() / downside;
        }

        double PerformanceMetrics::calmar_ratio() const
        {
            const double depth = std::abs(max_drawdown());
            return depth < 1e-18 ? 0.0 : annualized_return() / depth;
        }

        // ===================================================================
        // Accessors
        // ===================================================================

        const std::vector<double> &PerformanceMetrics::return_series() const
        {
            return returns_;
        }

        const std::vector<std::string> &PerformanceMetrics::dates() const
        {
            return dates_;
        }

        int PerformanceMetrics::trading_days_per_year() const
        {
            return trading_days_per_year_;
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void PerformanceMetrics::initialize()
        {
            if (trading_days_per_year_ <= 0)
            {
                throw std::invalid_argument("PerformanceMetrics: trading_days_per_year must be positive, got " +
                                            std::to_string(trading_days_per_year_));
            }
            if (!dates_.empty() && dates_.size() != returns_.size())
            {
                throw std::invalid_argument("PerformanceMetrics: " + std::to_string(dates_.size()) +
                                            " dates for " + std::to_string(returns_.size()) + " returns");
            }
            compute_drawdown();
        }

        void PerformanceMetrics::compute_drawdown()
        {
            int n = static_cast<int>(returns_.size());
            drawdown_series_.assign(n, 0.0);
            max_drawdown_info_ = DrawdownInfo{};
            if (n == 0)
            {
                return;
            }

            const std::vector<double> wealth = cumulative_returns();

            // Running peak starts at the first observation
            double high_water = wealth[0];
            int high_water_at = 0;
            DrawdownInfo &worst = max_drawdown_info_;

            for (int day = 0; day < n; ++day)
            {
                if (wealth[day] > high_water)
                {
                    high_water = wealth[day];
                    high_water_at = day;
                }
                const double underwater = high_water > 0.0 ? wealth[day] / high_water - 1.0 : 0.0;
                drawdown_series_[day] = underwater;

                if (underwater < worst.depth)
                {
                    worst.depth = underwater;
                    worst.peak_index = high_water_at;
                    worst.trough_index = day;
                }
            }

            worst.peak_value = wealth[worst.peak_index];
            worst.trough_value = wealth[worst.trough_index];
            worst.duration_days = worst.trough_index - worst.peak_index;

            auto regained = std::find_if(wealth.begin() + worst.trough_index + 1, wealth.end(),
                                         [&worst](double w)
                                         { return w >= worst.peak_value; });
            if (regained != wealth.end())
            {
                worst.recovery_index = static_cast<int>(regained - wealth.begin());
                worst.recovery_days = worst.recovery_index - worst.trough_index;
            }
            else
            {
                worst.recovery_index = -1;
                worst.recovery_days = -1;
            }
        }

        double PerformanceMetrics::mean() const
        {
            if (returns_.empty())
            {
                return 0.0;
            }
            return std::accumulate(returns_.begin(), returns_.end(), 0.0) / static_cast<double>(returns_.size());
        }

    } // namespace analytics
} // namespace equity
