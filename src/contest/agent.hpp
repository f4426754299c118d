#pragma once

#include <string>
#include "ledger/ledger.hpp"
#include "protocol/problem_contract.hpp"
#include "protocol/round_contract.hpp"

namespace arena::contest {

// A contest participant. produce() is called on a worker thread under the
// contest's response budget and may block or throw; a call that overruns the
// budget is abandoned, not interrupted, so it can still be running when the
// next round asks again.
class Agent {
public:
    virtual ~Agent() = default;

    virtual const std::string& name() const = 0;
    virtual std::string produce(const protocol::Problem& problem) = 0;
    virtual void receive(const protocol::Feedback& feedback) = 0;

    // Read-only view of the agent's own account, given once at registration.
    virtual void on_registered(const ledger::AccountView& account) {
        static_cast<void>(account);
    }
};

}  // namespace arena::contest
