// =================================================================
// include/Arbiter/BudgetGate.hpp
// =================================================================
// Monthly spend accounting per (tenant, app) and the budget gate stage.

#pragma once

#include "Arbiter/CandidateSet.hpp"
#include "Arbiter/Policy.hpp"
#include "Arbiter/RequestContext.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Arbiter {

/**
 * @brief Spend accumulators keyed by (tenant, app) and calendar month (UTC)
 *
 * Each account has its own lock; a new month starts a fresh accumulator.
 */
class BudgetLedger {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit BudgetLedger(Clock clock = Clock());

    /**
     * @brief Spend recorded for the current month
     */
    double spent(const std::string& tenant_id, const std::string& app_id);

    /**
     * @brief Add the cost of a billed invocation
     */
    void recordSpend(const std::string& tenant_id, const std::string& app_id, double cost);

    /**
     * @brief Current month key, e.g. "2024-03"
     */
    std::string currentMonth() const;

    /**
     * @brief Month key of a time point in UTC
     */
    static std::string monthKey(std::chrono::system_clock::time_point time_point);

private:
    struct Account {
        std::mutex mutex;
        std::string month;
        double spent = 0.0;
    };

    Clock m_clock;
    std::unordered_map<std::string, std::shared_ptr<Account>> m_accounts;
    mutable std::shared_mutex m_accounts_mutex;

    std::shared_ptr<Account> accountFor(const std::string& tenant_id, const std::string& app_id);
};

/**
 * @brief Budget position of a request at gate time
 */
struct BudgetStatus {
    double limit = 0.0;          ///< Monthly limit; 0 when the gate is disabled
    double spent = 0.0;          ///< Spend so far this month
    double remaining = 0.0;      ///< limit - spent, floored at 0
    bool low_water = false;      ///< Remaining is below the low-water mark
    bool exhausted = false;      ///< Limit fully used
};

/**
 * @brief Outcome of the budget gate
 */
struct BudgetGateResult {
    CandidateSet candidates;              ///< Reordered or narrowed candidates
    BudgetStatus status;                  ///< Budget position
    bool downgraded = false;              ///< Candidates were reordered by price
    std::vector<std::string> removed;     ///< Candidates above the minimal-cost threshold
};

/**
 * @brief Budget gate stage
 */
class BudgetGate {
public:
    /**
     * @brief Downgrade or narrow candidates according to the budget position
     *
     * Below the low-water mark candidates are stably reordered by ascending
     * price and the directive becomes ordered. Once the limit is exhausted
     * every candidate priced above the minimal-cost threshold is removed; an
     * empty result is a budget_exceeded deny.
     */
    static BudgetGateResult apply(CandidateSet candidates,
                                  const RequestContext& context,
                                  const BudgetLimits& limits,
                                  BudgetLedger& ledger);

    /**
     * @brief Apply an already computed budget position to another candidate list
     */
    static CandidateSet applyStatus(CandidateSet candidates, const BudgetStatus& status, const BudgetLimits& limits);

    static BudgetStatus status(const RequestContext& context, const BudgetLimits& limits, BudgetLedger& ledger);
};

} // namespace Arbiter
