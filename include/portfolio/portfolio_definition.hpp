// SPDX-License-Identifier: MIT
#ifndef EQUITY_PORTFOLIO_PORTFOLIO_DEFINITION_HPP
#define EQUITY_PORTFOLIO_PORTFOLIO_DEFINITION_HPP

#include <map>
#include <string>
#include <vector>

namespace equity {
namespace portfolio {

/**
 * @struct Position
 * @brief Holding of one instrument, shared by every portfolio that allocates to it
 */
struct Position {
    std::string ticker;              ///< Asset identifier (unique key)
    double shares = 0.0;             ///< Number of shares held (>= 0)
    std::string sector = "Unknown";  ///< Sector label
    double current_price = 0.0;      ///< Last known price

    double market_value() const;
    double weight(double total_value) const;
};

/**
 * @struct PortfolioAllocation
 * @brief Weight of one ticker inside one portfolio
 */
struct PortfolioAllocation {
    int portfolio_id = 0;
    std::string ticker;
    double weight = 1.0;
};

/**
 * @struct PortfolioDefinition
 * @brief Immutable snapshot of a portfolio as stored by the repository
 *
 * Holds the allocations of the portfolio and the positions of the tickers
 * it allocates to. Analytics read one snapshot per computation.
 */
struct PortfolioDefinition {
    int id = 0;
    std::string name;
    std::string description;
    std::map<std::string, double> allocations;  ///< ticker -> weight
    std::map<std::string, Position> positions;  ///< ticker -> position

    std::vector<std::string> tickers() const;
    std::vector<PortfolioAllocation> allocation_list() const;
    double allocation_sum() const;

    /** @brief Position of a ticker, or a zero-share "Unknown" position when none is stored */
    Position position_or_default(const std::string& ticker) const;
};

} // namespace portfolio
} // namespace equity

#endif // EQUITY_PORTFOLIO_PORTFOLIO_DEFINITION_HPP
