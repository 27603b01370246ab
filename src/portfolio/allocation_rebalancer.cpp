// ============================================================================
// Implementation of AllocationRebalancer
// ============================================================================

#include "portfolio/allocation_rebalancer.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace equity {
namespace portfolio {

AllocationRebalancer::AllocationRebalancer(PortfolioRepository& repository, double tolerance)
    : repository_(repository), tolerance_(tolerance) {
    if (!(tolerance > 0.0)) throw std::invalid_argument("tolerance must be > 0");
}

// ============================================================================
// validation
// ============================================================================

AllocationCheck AllocationRebalancer::validate(const std::map<std::string, double>& weights) const {
    AllocationCheck check;
    if (weights.empty()) {
        check.violations.push_back("no weights supplied");
        return check;
    }

    bool all_finite = true;
    for (const auto& entry : weights) {
        const double w = entry.second;
        if (entry.first.empty()) {
            check.violations.push_back("empty ticker");
        }
        if (!std::isfinite(w)) {
            all_finite = false;
            check.violations.push_back("weight of " + entry.first + " is not finite");
        } else if (w < 0.0 || w > 1.0) {
            std::ostringstream msg;
            msg << "weight of " << entry.first << " outside [0, 1]: " << w;
            check.violations.push_back(msg.str());
        }
    }

    if (all_finite) {
        check.weight_sum = std::accumulate(weights.begin(), weights.end(), 0.0,
                                           [](double acc, const std::pair<const std::string, double>& entry) {
                                               return acc + entry.second;
                                           });
        if (std::abs(check.weight_sum - 1.0) > tolerance_) {
            std::ostringstream msg;
            msg << "weights sum to " << check.weight_sum << ", expected 1";
            check.violations.push_back(msg.str());
        }
    } else {
        check.weight_sum = std::nan("");
    }

    check.valid = check.violations.empty();
    return check;
}

// ============================================================================
// commit
// ============================================================================

PortfolioDefinition AllocationRebalancer::rebalance(int portfolio_id,
                                                    const std::map<std::string, double>& weights) {
    PortfolioDefinition def = repository_.load_portfolio(portfolio_id);

    AllocationCheck check = validate(weights);
    if (!check.valid) throw AllocationInvalid(check.violations);

    for (const auto& entry : weights) def.allocations[entry.first] = entry.second;
    repository_.save_portfolio(def);
    return repository_.load_portfolio(portfolio_id);
}

} // namespace portfolio
} // namespace equity
