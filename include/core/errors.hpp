/**
 * @file errors.hpp
 * @brief Exception types raised by the analytics engine.
 *
 * Structural failures (no data, no overlap, invalid allocation, unknown
 * portfolio) are reported with these exceptions. Numeric degeneracies are
 * never reported this way; they produce neutral metric values instead.
 */

#ifndef EQUITY_CORE_ERRORS_HPP
#define EQUITY_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace equity
{

    /**
     * @class EngineError
     * @brief Base class of all engine failures surfaced to callers.
     */
    class EngineError : public std::runtime_error
    {
    public:
        explicit EngineError(const std::string &message)
            : std::runtime_error(message) {}
    };

    /**
     * @class DataUnavailable
     * @brief The price provider has no data for a ticker or window.
     */
    class DataUnavailable : public EngineError
    {
    public:
        explicit DataUnavailable(const std::string &message)
            : EngineError(message) {}
    };

    /**
     * @class InsufficientData
     * @brief Not enough usable data to produce a report.
     */
    class InsufficientData : public EngineError
    {
    public:
        explicit InsufficientData(const std::string &message)
            : EngineError(message) {}
    };

    /**
     * @class NoOverlap
     * @brief Two series share no common date.
     */
    class NoOverlap : public EngineError
    {
    public:
        explicit NoOverlap(const std::string &message)
            : EngineError(message) {}
    };

    /**
     * @class PortfolioNotFound
     * @brief The repository holds no portfolio with the requested id.
     */
    class PortfolioNotFound : public EngineError
    {
    public:
        explicit PortfolioNotFound(int portfolio_id)
            : EngineError("Portfolio not found: " + std::to_string(portfolio_id)),
              portfolio_id_(portfolio_id) {}

        int portfolio_id() const { return portfolio_id_; }

    private:
        int portfolio_id_;
    };

    /**
     * @class AllocationInvalid
     * @brief A proposed weight set violates the allocation invariants.
     *
     * Carries every violation found, not only the first one.
     */
    class AllocationInvalid : public EngineError
    {
    public:
        explicit AllocationInvalid(const std::vector<std::string> &violations)
            : EngineError(build_message(violations)), violations_(violations) {}

        const std::vector<std::string> &violations() const { return violations_; }

    private:
        static std::string build_message(const std::vector<std::string> &violations)
        {
            std::string msg = "Invalid allocation";
            for (size_t i = 0; i < violations.size(); ++i)
            {
                msg += (i == 0 ? ": " : "; ");
                msg += violations[i];
            }
            return msg;
        }

        std::vector<std::string> violations_;
    };

} // namespace equity

#endif // EQUITY_CORE_ERRORS_HPP
