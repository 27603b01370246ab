// ============================================================================
// Implementation of InMemoryPortfolioRepository
// ============================================================================

#include "portfolio/portfolio_repository.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace equity {
namespace portfolio {

namespace {

void check_allocation(const std::string& ticker, double allocation) {
    if (ticker.empty()) throw std::invalid_argument("ticker must not be empty");
    if (!std::isfinite(allocation)) throw std::invalid_argument("allocation must be finite for " + ticker);
    if (allocation < 0.0 || allocation > 1.0) {
        std::ostringstream msg;
        msg << "allocation of " << ticker << " outside [0, 1]: " << allocation;
        throw std::invalid_argument(msg.str());
    }
}

} // namespace

// ============================================================================
// helpers
// ============================================================================

InMemoryPortfolioRepository::Record& InMemoryPortfolioRepository::find_record(int portfolio_id) {
    auto it = records_.find(portfolio_id);
    if (it == records_.end()) throw PortfolioNotFound(portfolio_id);
    return it->second;
}

const InMemoryPortfolioRepository::Record& InMemoryPortfolioRepository::find_record(int portfolio_id) const {
    auto it = records_.find(portfolio_id);
    if (it == records_.end()) throw PortfolioNotFound(portfolio_id);
    return it->second;
}

bool InMemoryPortfolioRepository::name_taken(const std::string& name, int except_id) const {
    for (const auto& entry : records_) {
        if (entry.first != except_id && entry.second.name == name) return true;
    }
    return false;
}

PortfolioDefinition InMemoryPortfolioRepository::snapshot(const Record& record) const {
    PortfolioDefinition def;
    def.id = record.id;
    def.name = record.name;
    def.description = record.description;
    def.allocations = record.allocations;
    for (const auto& entry : record.allocations) {
        auto pos = positions_.find(entry.first);
        if (pos != positions_.end()) def.positions[entry.first] = pos->second;
    }
    return def;
}

// ============================================================================
// queries
// ============================================================================

PortfolioDefinition InMemoryPortfolioRepository::load_portfolio(int portfolio_id) const {
    return snapshot(find_record(portfolio_id));
}

std::vector<PortfolioDefinition> InMemoryPortfolioRepository::list_portfolios() const {
    std::vector<PortfolioDefinition> out;
    out.reserve(records_.size());
    for (const auto& entry : records_) out.push_back(snapshot(entry.second));
    return out;
}

std::map<std::string, Position> InMemoryPortfolioRepository::positions() const {
    return positions_;
}

// ============================================================================
// mutations
// ============================================================================

void InMemoryPortfolioRepository::save_portfolio(const PortfolioDefinition& definition) {
    Record& record = find_record(definition.id);
    if (definition.name.empty()) throw std::invalid_argument("portfolio name must not be empty");
    if (name_taken(definition.name, definition.id)) {
        throw std::invalid_argument("portfolio name already exists: " + definition.name);
    }
    for (const auto& entry : definition.positions) {
        if (entry.second.shares < 0.0) {
            throw std::invalid_argument("negative shares for " + entry.first);
        }
    }
    for (const auto& entry : definition.allocations) check_allocation(entry.first, entry.second);

    record.name = definition.name;
    record.description = definition.description;
    record.allocations = definition.allocations;
    for (const auto& entry : definition.positions) {
        Position p = entry.second;
        p.ticker = entry.first;
        positions_[entry.first] = p;
    }
}

int InMemoryPortfolioRepository::create_portfolio(const std::string& name, const std::string& description) {
    if (name.empty()) throw std::invalid_argument("portfolio name must not be empty");
    if (name_taken(name, 0)) throw std::invalid_argument("portfolio name already exists: " + name);

    Record record;
    record.id = next_id_++;
    record.name = name;
    record.description = description;
    records_[record.id] = record;
    return record.id;
}

void InMemoryPortfolioRepository::insert_portfolio(const PortfolioDefinition& definition) {
    if (definition.id <= 0) {
        std::ostringstream msg;
        msg << "portfolio id must be positive, got " << definition.id;
        throw std::invalid_argument(msg.str());
    }
    if (records_.count(definition.id)) {
        throw std::invalid_argument("duplicate portfolio id: " + std::to_string(definition.id));
    }
    if (definition.name.empty()) throw std::invalid_argument("portfolio name must not be empty");
    if (name_taken(definition.name, definition.id)) {
        throw std::invalid_argument("portfolio name already exists: " + definition.name);
    }
    for (const auto& entry : definition.allocations) check_allocation(entry.first, entry.second);

    Record record;
    record.id = definition.id;
    record.name = definition.name;
    record.description = definition.description;
    record.allocations = definition.allocations;
    records_[record.id] = record;
    for (const auto& entry : definition.positions) upsert_position(entry.second);

    if (definition.id >= next_id_) next_id_ = definition.id + 1;
}

bool InMemoryPortfolioRepository::delete_portfolio(int portfolio_id) {
    return records_.erase(portfolio_id) > 0;
}

void InMemoryPortfolioRepository::add_stock(int portfolio_id, const std::string& ticker, double allocation) {
    check_allocation(ticker, allocation);
    find_record(portfolio_id).allocations[ticker] = allocation;
}

bool InMemoryPortfolioRepository::remove_stock(int portfolio_id, const std::string& ticker) {
    return find_record(portfolio_id).allocations.erase(ticker) > 0;
}

void InMemoryPortfolioRepository::upsert_position(const Position& position) {
    if (position.ticker.empty()) throw std::invalid_argument("position ticker must not be empty");
    if (!(position.shares >= 0.0)) {
        std::ostringstream msg;
        msg << "shares for " << position.ticker << " must be >= 0, got " << position.shares;
        throw std::invalid_argument(msg.str());
    }
    Position p = position;
    if (p.sector.empty()) p.sector = "Unknown";
    positions_[p.ticker] = p;
}

} // namespace portfolio
} // namespace equity
