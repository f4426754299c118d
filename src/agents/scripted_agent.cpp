#include "agents/scripted_agent.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace arena::agents {

using core::errors::ContestError;
using core::errors::ErrorCategory;

ScriptedAgent::ScriptedAgent(ScriptedAgentConfig config) : config_(std::move(config)) {}

std::string ScriptedAgent::produce(const protocol::Problem& problem) {
    if (config_.delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.delay_ms));
    }
    if (config_.fail_on.count(problem.id) > 0) {
        throw std::runtime_error(config_.name + " has no answer for problem " + problem.id);
    }
    const auto it = config_.responses.find(problem.id);
    if (it != config_.responses.end()) {
        return it->second;
    }
    return config_.default_response;
}

void ScriptedAgent::receive(const protocol::Feedback& feedback) {
    LOG_DEBUG(config_.name + ": feedback for problem " + feedback.problem_id + " reward " +
              std::to_string(feedback.reward) + " balance " + std::to_string(feedback.balance));
    std::lock_guard<std::mutex> lock(mutex_);
    feedback_.push_back(feedback);
}

void ScriptedAgent::on_registered(const ledger::AccountView& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    account_ = account;
}

std::vector<protocol::Feedback> ScriptedAgent::feedback_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return feedback_;
}

std::optional<std::int64_t> ScriptedAgent::balance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!account_.has_value()) {
        return std::nullopt;
    }
    return account_->balance();
}

core::errors::Result<std::vector<ScriptedAgentConfig>> load_agent_configs(
    const std::filesystem::path& file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        return ContestError{ErrorCategory::Input,
                            "Unable to open agents file: " + file.string(),
                            "agents_file_unreadable"};
    }

    const nlohmann::json document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        return ContestError{ErrorCategory::Input,
                            "Agents file must contain a JSON array: " + file.string(),
                            "agents_file_invalid"};
    }

    std::vector<ScriptedAgentConfig> configs;
    for (const auto& entry : document) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() ||
            entry["name"].get<std::string>().empty()) {
            return ContestError{ErrorCategory::Input,
                                "Every agent needs a non-empty string \"name\".",
                                "agents_file_invalid"};
        }

        ScriptedAgentConfig config;
        config.name = entry["name"].get<std::string>();
        try {
            if (entry.contains("responses")) {
                for (const auto& item : entry["responses"].items()) {
                    config.responses[item.key()] = item.value().get<std::string>();
                }
            }
            config.default_response = entry.value("default_response", std::string());
            config.delay_ms = entry.value("delay_ms", static_cast<std::uint32_t>(0));
            if (entry.contains("fail_on")) {
                for (const auto& id : entry["fail_on"]) {
                    config.fail_on.insert(id.get<std::string>());
                }
            }
        } catch (const nlohmann::json::exception& e) {
            return ContestError{ErrorCategory::Input,
                                "Invalid agent entry for " + config.name + ": " + e.what(),
                                "agents_file_invalid"};
        }
        configs.push_back(std::move(config));
    }

    if (configs.empty()) {
        return ContestError{ErrorCategory::Input, "Agents file lists no agents.",
                            "agents_file_invalid", "Add at least one agent object."};
    }
    return configs;
}

}  // namespace arena::agents
