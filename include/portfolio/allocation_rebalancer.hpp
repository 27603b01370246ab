// SPDX-License-Identifier: MIT
#ifndef EQUITY_PORTFOLIO_ALLOCATION_REBALANCER_HPP
#define EQUITY_PORTFOLIO_ALLOCATION_REBALANCER_HPP

#include "portfolio/portfolio_repository.hpp"

#include <map>
#include <string>
#include <vector>

namespace equity {
namespace portfolio {

/**
 * @struct AllocationCheck
 * @brief Outcome of validating a proposed weight set
 */
struct AllocationCheck {
    bool valid = false;
    double weight_sum = 0.0;
    std::vector<std::string> violations;  ///< One message per failed rule
};

/**
 * @class AllocationRebalancer
 * @brief Validates proposed allocation weights and commits them in one save
 *
 * A weight set is accepted only when it is non-empty, every weight is finite
 * and inside [0, 1], and the weights sum to 1 within the tolerance.
 * Tickers not named in the weight set keep their stored weight.
 */
class AllocationRebalancer {
public:
    static constexpr double kDefaultTolerance = 1e-6;

    explicit AllocationRebalancer(PortfolioRepository& repository,
                                  double tolerance = kDefaultTolerance);

    /** @brief Check a weight set without touching the repository */
    AllocationCheck validate(const std::map<std::string, double>& weights) const;

    /**
     * @brief Validate and store new weights for a portfolio
     * @return Snapshot of the portfolio after the save
     * @throws PortfolioNotFound if the id is unknown
     * @throws AllocationInvalid if the weight set fails validation; nothing is saved
     */
    PortfolioDefinition rebalance(int portfolio_id, const std::map<std::string, double>& weights);

    double tolerance() const { return tolerance_; }

private:
    PortfolioRepository& repository_;
    double tolerance_;
};

} // namespace portfolio
} // namespace equity

#endif // EQUITY_PORTFOLIO_ALLOCATION_REBALANCER_HPP
