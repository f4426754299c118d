#include "ledger/ledger.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include "core/clock/clock.hpp"
#include "core/logging/logger.hpp"

namespace arena::ledger {

using core::errors::ContestError;
using core::errors::ErrorCategory;

std::int64_t Ledger::balance_locked(const std::string& actor) const {
    std::int64_t sum = 0;
    for (const auto& tx : transactions_) {
        if (tx.actor == actor) {
            sum += tx.delta;
        }
    }
    return sum;
}

std::vector<std::string> Ledger::actors_locked() const {
    std::vector<std::string> ordered;
    for (const auto& tx : transactions_) {
        if (std::find(ordered.begin(), ordered.end(), tx.actor) == ordered.end()) {
            ordered.push_back(tx.actor);
        }
    }
    return ordered;
}

namespace {

bool add_overflows(const std::int64_t a, const std::int64_t b) {
    if (b > 0) {
        return a > std::numeric_limits<std::int64_t>::max() - b;
    }
    return a < std::numeric_limits<std::int64_t>::min() - b;
}

}  // namespace

std::int64_t Ledger::total_locked() const {
    std::int64_t sum = 0;
    for (const auto& tx : transactions_) {
        sum += tx.delta;
    }
    return sum;
}

std::optional<ContestError> Ledger::check_delta_locked(const std::string& actor,
                                                       const std::int64_t delta) const {
    if (add_overflows(balance_locked(actor), delta) || add_overflows(total_locked(), delta)) {
        return ContestError{ErrorCategory::Ledger,
                            "Amount " + std::to_string(delta) + " for " + actor +
                                " would overflow the ledger.",
                            "invalid_amount"};
    }
    return std::nullopt;
}

std::int64_t Ledger::append_locked(const std::string& actor, const std::int64_t delta,
                                   const std::string& reason) {
    Transaction tx;
    tx.sequence = transactions_.size() + 1;
    tx.timestamp_ms = core::clock::now_unix_ms();
    tx.actor = actor;
    tx.delta = delta;
    tx.resulting_balance = balance_locked(actor) + delta;
    tx.reason = reason;
    transactions_.push_back(tx);
    LOG_DEBUG("Ledger: " + actor + " " + (delta >= 0 ? "+" : "") + std::to_string(delta) +
              " -> " + std::to_string(tx.resulting_balance) + " (" + reason + ")");
    return tx.resulting_balance;
}

core::errors::Result<std::int64_t> Ledger::adjust(const std::string& actor,
                                                  const std::int64_t delta,
                                                  const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto overflow = check_delta_locked(actor, delta)) {
        return overflow.value();
    }
    return append_locked(actor, delta, reason);
}

core::errors::Result<std::int64_t> Ledger::deposit(const std::string& actor,
                                                   const std::int64_t amount,
                                                   const std::string& reason) {
    if (amount < 0) {
        return ContestError{ErrorCategory::Ledger, "Deposit amount must be non-negative.",
                            "invalid_amount"};
    }
    return adjust(actor, amount, reason);
}

core::errors::Result<std::int64_t> Ledger::withdraw(const std::string& actor,
                                                    const std::int64_t amount,
                                                    const std::string& reason) {
    if (amount < 0) {
        return ContestError{ErrorCategory::Ledger, "Withdrawal amount must be non-negative.",
                            "invalid_amount"};
    }
    return adjust(actor, -amount, reason);
}

core::errors::Result<std::int64_t> Ledger::transfer(const std::string& from,
                                                    const std::string& to,
                                                    const std::int64_t amount,
                                                    const std::string& reason,
                                                    const SolvencyPolicy policy) {
    if (amount <= 0) {
        return ContestError{ErrorCategory::Ledger, "Transfer amount must be positive.",
                            "invalid_amount"};
    }
    if (from == to) {
        return ContestError{ErrorCategory::Ledger, "Cannot transfer to the same actor.",
                            "invalid_transfer"};
    }

    // Check and both appends happen under one lock so no reader sees half a transfer.
    std::lock_guard<std::mutex> lock(mutex_);
    const std::int64_t available = balance_locked(from);
    if (policy == SolvencyPolicy::RequireFunds && available < amount) {
        return ContestError{ErrorCategory::Ledger,
                            "Insufficient funds: " + from + " has $" +
                                std::to_string(available) + ", needs $" +
                                std::to_string(amount),
                            "insufficient_funds"};
    }
    if (auto overflow = check_delta_locked(from, -amount)) {
        return overflow.value();
    }
    if (add_overflows(balance_locked(to), amount)) {
        return ContestError{ErrorCategory::Ledger,
                            "Amount " + std::to_string(amount) + " for " + to +
                                " would overflow the ledger.",
                            "invalid_amount"};
    }
    const std::int64_t sender_balance =
        append_locked(from, -amount, "Transfer to " + to + ": " + reason);
    static_cast<void>(append_locked(to, amount, "Transfer from " + from + ": " + reason));
    return sender_balance;
}

std::int64_t Ledger::balance(const std::string& actor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_locked(actor);
}

std::vector<Standing> Ledger::leaderboard() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Standing> standings;
    for (const auto& actor : actors_locked()) {
        standings.push_back(Standing{actor, balance_locked(actor)});
    }
    // actors_locked() is already in first-transaction order.
    std::stable_sort(standings.begin(), standings.end(),
                     [](const Standing& a, const Standing& b) { return a.balance > b.balance; });
    return standings;
}

std::vector<Transaction> Ledger::history(const std::optional<std::string>& actor,
                                         const std::optional<std::size_t> limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transaction> selected;
    for (const auto& tx : transactions_) {
        if (!actor.has_value() || tx.actor == actor.value()) {
            selected.push_back(tx);
        }
    }
    if (limit.has_value() && selected.size() > limit.value()) {
        selected.erase(selected.begin(),
                       selected.end() - static_cast<std::ptrdiff_t>(limit.value()));
    }
    return selected;
}

std::vector<std::string> Ledger::actors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actors_locked();
}

std::int64_t Ledger::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_locked();
}

std::size_t Ledger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transactions_.size();
}

core::errors::Result<std::size_t> Ledger::audit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, std::int64_t> running;
    for (std::size_t i = 0; i < transactions_.size(); ++i) {
        const auto& tx = transactions_[i];
        if (tx.sequence != i + 1) {
            return ContestError{ErrorCategory::Ledger,
                                "Transaction sequence gap at position " + std::to_string(i),
                                "ledger_inconsistent"};
        }
        running[tx.actor] += tx.delta;
        if (running[tx.actor] != tx.resulting_balance) {
            return ContestError{ErrorCategory::Ledger,
                                "Recorded balance for " + tx.actor + " at transaction " +
                                    std::to_string(tx.sequence) + " disagrees with history",
                                "ledger_inconsistent"};
        }
    }
    return transactions_.size();
}

}  // namespace arena::ledger
