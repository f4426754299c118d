#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "contest/agent.hpp"
#include "core/errors/contest_errors.hpp"

namespace arena::agents {

struct ScriptedAgentConfig {
    std::string name;
    std::map<std::string, std::string> responses;  // keyed by problem id
    std::string default_response;
    std::uint32_t delay_ms = 0;
    std::set<std::string> fail_on;                  // problem ids that make produce() throw
};

// Agent that replays canned responses. Used by the CLI and by tests.
class ScriptedAgent : public contest::Agent {
public:
    explicit ScriptedAgent(ScriptedAgentConfig config);

    const std::string& name() const override { return config_.name; }
    std::string produce(const protocol::Problem& problem) override;
    void receive(const protocol::Feedback& feedback) override;
    void on_registered(const ledger::AccountView& account) override;

    std::vector<protocol::Feedback> feedback_history() const;
    std::optional<std::int64_t> balance() const;

private:
    const ScriptedAgentConfig config_;
    mutable std::mutex mutex_;
    std::vector<protocol::Feedback> feedback_;
    std::optional<ledger::AccountView> account_;
};

// Reads a JSON array of agent objects:
//   {"name", "responses": {id: text}, "default_response", "delay_ms", "fail_on": [id]}
core::errors::Result<std::vector<ScriptedAgentConfig>> load_agent_configs(
    const std::filesystem::path& file);

}  // namespace arena::agents
