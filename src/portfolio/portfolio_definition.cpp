// ============================================================================
// Implementation of Position and PortfolioDefinition
// ============================================================================

#include "portfolio/portfolio_definition.hpp"

namespace equity {
namespace portfolio {

// ============================================================================
// Position
// ============================================================================

double Position::market_value() const {
    return shares * current_price;
}

double Position::weight(double total_value) const {
    if (total_value <= 0.0) return 0.0;
    return market_value() / total_value;
}

// ============================================================================
// PortfolioDefinition
// ============================================================================

std::vector<std::string> PortfolioDefinition::tickers() const {
    std::vector<std::string> out;
    out.reserve(allocations.size());
    for (const auto& entry : allocations) out.push_back(entry.first);
    return out;
}

std::vector<PortfolioAllocation> PortfolioDefinition::allocation_list() const {
    std::vector<PortfolioAllocation> out;
    out.reserve(allocations.size());
    for (const auto& entry : allocations) {
        out.push_back(PortfolioAllocation{id, entry.first, entry.second});
    }
    return out;
}

double PortfolioDefinition::allocation_sum() const {
    double sum = 0.0;
    for (const auto& entry : allocations) sum += entry.second;
    return sum;
}

Position PortfolioDefinition::position_or_default(const std::string& ticker) const {
    auto it = positions.find(ticker);
    if (it != positions.end()) return it->second;
    Position p;
    p.ticker = ticker;
    return p;
}

} // namespace portfolio
} // namespace equity
