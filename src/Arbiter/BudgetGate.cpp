// =================================================================
// src/Arbiter/BudgetGate.cpp
// =================================================================
// Implementation of the budget ledger and gate.

#include "Arbiter/BudgetGate.hpp"
#include "Arbiter/Logger.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Arbiter {

BudgetLedger::BudgetLedger(Clock clock)
    : m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = []() { return std::chrono::system_clock::now(); };
    }
}

std::string BudgetLedger::monthKey(std::chrono::system_clock::time_point time_point) {
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m");
    return oss.str();
}

std::string BudgetLedger::currentMonth() const {
    return monthKey(m_clock());
}

std::shared_ptr<BudgetLedger::Account> BudgetLedger::accountFor(const std::string& tenant_id,
                                                                 const std::string& app_id) {
    std::string key = tenant_id + "/" + app_id;
    {
        std::shared_lock<std::shared_mutex> lock(m_accounts_mutex);
        auto it = m_accounts.find(key);
        if (it != m_accounts.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(m_accounts_mutex);
    auto& slot = m_accounts[key];
    if (!slot) {
        slot = std::make_shared<Account>();
    }
    return slot;
}

double BudgetLedger::spent(const std::string& tenant_id, const std::string& app_id) {
    auto account = accountFor(tenant_id, app_id);
    std::string month = currentMonth();

    std::lock_guard<std::mutex> lock(account->mutex);
    if (account->month != month) {
        account->month = month;
        account->spent = 0.0;
    }
    return account->spent;
}

void BudgetLedger::recordSpend(const std::string& tenant_id, const std::string& app_id, double cost) {
    if (cost <= 0.0) {
        return;
    }
    auto account = accountFor(tenant_id, app_id);
    std::string month = currentMonth();

    std::lock_guard<std::mutex> lock(account->mutex);
    if (account->month != month) {
        account->month = month;
        account->spent = 0.0;
    }
    account->spent += cost;
}

BudgetStatus BudgetGate::status(const RequestContext& context, const BudgetLimits& limits, BudgetLedger& ledger) {
    BudgetStatus status;
    if (limits.monthly_limit <= 0.0) {
        return status;
    }

    status.limit = limits.monthly_limit;
    status.spent = ledger.spent(context.tenant_id, context.app_id);
    status.remaining = std::max(0.0, status.limit - status.spent);
    status.exhausted = status.spent >= status.limit;
    status.low_water = status.remaining < limits.low_water_mark;
    return status;
}

CandidateSet BudgetGate::applyStatus(CandidateSet candidates, const BudgetStatus& status, const BudgetLimits& limits) {
    if (status.exhausted) {
        double threshold = limits.minimal_cost_threshold;
        candidates.removeIf([threshold](const Candidate& candidate) {
            return candidate.model->unitPrice() > threshold;
        });
    }

    if (status.exhausted || status.low_water) {
        std::stable_sort(candidates.candidates.begin(), candidates.candidates.end(),
                         [](const Candidate& a, const Candidate& b) {
                             return a.model->unitPrice() < b.model->unitPrice();
                         });
        candidates.kind = DirectiveKind::ORDERED;
    }
    return candidates;
}

BudgetGateResult BudgetGate::apply(CandidateSet candidates,
                                   const RequestContext& context,
                                   const BudgetLimits& limits,
                                   BudgetLedger& ledger) {
    BudgetGateResult result;
    result.status = status(context, limits, ledger);

    if (result.status.exhausted || result.status.low_water) {
        std::vector<std::string> before = candidates.modelIds();
        result.candidates = applyStatus(std::move(candidates), result.status, limits);
        result.downgraded = !result.candidates.empty();

        for (const auto& id : before) {
            if (!result.candidates.contains(id)) {
                result.removed.push_back(id);
            }
        }

        Logger::getInstance().info("BudgetGate",
            result.status.exhausted ? "Monthly budget exhausted" : "Budget below low-water mark",
            "tenant=" + context.tenant_id + " app=" + context.app_id +
            " remaining=" + std::to_string(result.status.remaining));
        return result;
    }

    result.candidates = std::move(candidates);
    return result;
}

} // namespace Arbiter
