// SPDX-License-Identifier: MIT
#ifndef EQUITY_PORTFOLIO_PORTFOLIO_REPOSITORY_HPP
#define EQUITY_PORTFOLIO_PORTFOLIO_REPOSITORY_HPP

#include "portfolio/portfolio_definition.hpp"

#include <map>
#include <string>
#include <vector>

namespace equity {
namespace portfolio {

/**
 * @class PortfolioRepository
 * @brief Record store of portfolio definitions and positions
 *
 * Every read returns a snapshot by value; callers never hold references
 * into the store.
 */
class PortfolioRepository {
public:
    virtual ~PortfolioRepository() = default;

    /**
     * @brief Load one portfolio with its allocations and positions
     * @throws PortfolioNotFound if the id is unknown
     */
    virtual PortfolioDefinition load_portfolio(int portfolio_id) const = 0;

    /**
     * @brief Replace the stored record of a portfolio (name, description,
     *        allocations) and upsert the positions it carries
     * @throws PortfolioNotFound if the id is unknown
     * @throws std::invalid_argument if an allocation is not a finite weight in [0, 1]
     */
    virtual void save_portfolio(const PortfolioDefinition& definition) = 0;

    /** @brief All portfolios ordered by id */
    virtual std::vector<PortfolioDefinition> list_portfolios() const = 0;

    /**
     * @brief Create an empty portfolio
     * @return New portfolio id
     * @throws std::invalid_argument if the name is empty or already used
     */
    virtual int create_portfolio(const std::string& name, const std::string& description = "") = 0;

    /** @return false when no portfolio had that id */
    virtual bool delete_portfolio(int portfolio_id) = 0;

    /**
     * @brief Insert or replace the allocation of a ticker in a portfolio
     * @throws PortfolioNotFound if the id is unknown
     * @throws std::invalid_argument if the ticker is empty or the allocation
     *         is not a finite weight in [0, 1]
     */
    virtual void add_stock(int portfolio_id, const std::string& ticker, double allocation = 1.0) = 0;

    /** @return false when the ticker was not allocated */
    virtual bool remove_stock(int portfolio_id, const std::string& ticker) = 0;

    /**
     * @brief Insert or replace a position
     * @throws std::invalid_argument on empty ticker or negative shares
     */
    virtual void upsert_position(const Position& position) = 0;

    /** @return All stored positions keyed by ticker */
    virtual std::map<std::string, Position> positions() const = 0;
};

/**
 * @class InMemoryPortfolioRepository
 * @brief PortfolioRepository kept entirely in memory
 *
 * Backs the JSON portfolio files handled by DataLoader and the tests.
 * Mutating operations are not thread-safe.
 */
class InMemoryPortfolioRepository : public PortfolioRepository {
public:
    InMemoryPortfolioRepository() = default;
    ~InMemoryPortfolioRepository() override = default;

    PortfolioDefinition load_portfolio(int portfolio_id) const override;
    void save_portfolio(const PortfolioDefinition& definition) override;
    std::vector<PortfolioDefinition> list_portfolios() const override;

    int create_portfolio(const std::string& name, const std::string& description = "") override;
    bool delete_portfolio(int portfolio_id) override;

    void add_stock(int portfolio_id, const std::string& ticker, double allocation = 1.0) override;
    bool remove_stock(int portfolio_id, const std::string& ticker) override;

    void upsert_position(const Position& position) override;
    std::map<std::string, Position> positions() const override;

    /**
     * @brief Insert a portfolio with a caller-chosen id (used when loading files)
     * @throws std::invalid_argument if the id or name is already used, or an
     *         allocation is outside [0, 1]
     */
    void insert_portfolio(const PortfolioDefinition& definition);

    size_t size() const { return records_.size(); }

private:
    struct Record {
        int id = 0;
        std::string name;
        std::string description;
        std::map<std::string, double> allocations;
    };

    std::map<int, Record> records_;
    std::map<std::string, Position> positions_;
    int next_id_ = 1;

    Record& find_record(int portfolio_id);
    const Record& find_record(int portfolio_id) const;
    bool name_taken(const std::string& name, int except_id) const;
    PortfolioDefinition snapshot(const Record& record) const;
};

} // namespace portfolio
} // namespace equity

#endif // EQUITY_PORTFOLIO_PORTFOLIO_REPOSITORY_HPP
