#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/contest_errors.hpp"

namespace arena::ledger {

struct Transaction {
    std::uint64_t sequence = 0;
    std::int64_t timestamp_ms = 0;
    std::string actor;
    std::int64_t delta = 0;
    std::int64_t resulting_balance = 0;
    std::string reason;
};

struct Standing {
    std::string actor;
    std::int64_t balance = 0;
};

// Caller-chosen rule for transfers. The ledger itself permits debt.
enum class SolvencyPolicy {
    AllowDebt,
    RequireFunds
};

// Append-only transaction log. Balances, standings and totals are folds over
// the log; nothing derived is stored separately.
class Ledger {
public:
    // Appends one transaction and returns the actor's new balance. A delta that
    // would overflow the actor's balance or the ledger total is rejected.
    core::errors::Result<std::int64_t> adjust(const std::string& actor, std::int64_t delta,
                                              const std::string& reason);

    core::errors::Result<std::int64_t> deposit(const std::string& actor,
                                               std::int64_t amount,
                                               const std::string& reason);
    core::errors::Result<std::int64_t> withdraw(const std::string& actor,
                                                std::int64_t amount,
                                                const std::string& reason);

    // Debit then credit. Under RequireFunds an insufficient debit leaves the
    // log untouched. Returns the sender's new balance.
    core::errors::Result<std::int64_t> transfer(
        const std::string& from, const std::string& to, std::int64_t amount,
        const std::string& reason,
        SolvencyPolicy policy = SolvencyPolicy::RequireFunds);

    std::int64_t balance(const std::string& actor) const;

    // Descending balance; ties keep the order of each actor's first transaction.
    std::vector<Standing> leaderboard() const;

    // Most recent `limit` transactions (all when unset), oldest first.
    std::vector<Transaction> history(const std::optional<std::string>& actor = std::nullopt,
                                     std::optional<std::size_t> limit = std::nullopt) const;

    // Actors in order of their first transaction.
    std::vector<std::string> actors() const;
    std::int64_t total() const;
    std::size_t size() const;

    // Re-folds the log and checks every recorded resulting_balance. Returns the
    // number of transactions verified.
    core::errors::Result<std::size_t> audit() const;

private:
    std::int64_t balance_locked(const std::string& actor) const;
    std::int64_t total_locked() const;
    std::vector<std::string> actors_locked() const;
    std::optional<core::errors::ContestError> check_delta_locked(const std::string& actor,
                                                                 std::int64_t delta) const;
    std::int64_t append_locked(const std::string& actor, std::int64_t delta,
                               const std::string& reason);

    mutable std::mutex mutex_;
    std::vector<Transaction> transactions_;
};

// Read-only view over one actor's account, handed to agents.
class AccountView {
public:
    AccountView(const Ledger& ledger, std::string actor)
        : ledger_(&ledger), actor_(std::move(actor)) {}

    const std::string& actor() const { return actor_; }
    std::int64_t balance() const { return ledger_->balance(actor_); }
    std::vector<Transaction> history(std::size_t limit = 10) const {
        return ledger_->history(actor_, limit);
    }
    std::vector<Standing> leaderboard() const { return ledger_->leaderboard(); }

private:
    const Ledger* ledger_;
    std::string actor_;
};

}  // namespace arena::ledger
