#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "agents/scripted_agent.hpp"
#include "app/cli_parser.hpp"
#include "contest/contest_engine.hpp"
#include "contest/problem_source.hpp"
#include "core/config/contest_id.hpp"
#include "core/errors/contest_errors.hpp"
#include "core/logging/logger.hpp"
#include "ledger/ledger.hpp"
#include "policy/ruleset_reward_policy.hpp"
#include "ruleset/ruleset_store.hpp"
#include "session/audit_writer.hpp"

int main(int argc, char* argv[]) {
    // 1. Generate a unique Contest ID for this execution
    const std::string contest_id = arena::core::config::generate_contest_id();

    // 2. Register the Contest ID with the Global Logger
    arena::core::logging::Logger::get().set_contest_id(contest_id);

    // 3. Parse CLI input and return normalized input errors
    LOG_INFO("Arena: Bootstrapping...");
    auto parsed = arena::app::cli::parse_and_validate(argc, argv);
    if (arena::core::errors::is_error(parsed)) {
        const auto& err = arena::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& req = arena::core::errors::get_value(parsed);
    if (req.verbose) {
        arena::core::logging::Logger::get().set_min_level(arena::core::logging::LogLevel::DEBUG);
    }

    auto agent_configs = arena::agents::load_agent_configs(req.agents_file);
    if (arena::core::errors::is_error(agent_configs)) {
        const auto& err = arena::core::errors::get_error(agent_configs);
        LOG_ERROR("Failed to load agents [" + err.code + "]: " + err.message);
        return 2;
    }

    std::unique_ptr<arena::contest::ProblemSource> problem_source;
    if (req.problems_file.has_value()) {
        problem_source = std::make_unique<arena::contest::JsonProblemSource>(req.problems_file.value());
    } else {
        LOG_INFO("No problems file given; using the builtin problem set.");
        problem_source = std::make_unique<arena::contest::BuiltinProblemSource>();
    }

    arena::ledger::Ledger ledger;
    arena::ruleset::RulesetStore rulesets;
    arena::policy::RulesetRewardPolicy reward_policy;

    arena::contest::ContestOptions options;
    options.response_budget = std::chrono::milliseconds(req.response_budget_ms);
    options.round_pause = std::chrono::milliseconds(req.round_pause_ms);
    options.sandbox.interpreter = req.interpreter;

    arena::session::AuditWriter audit_writer(req.artifacts_directory, contest_id);
    arena::contest::ContestEngine engine(ledger, rulesets, *problem_source, reward_policy, options);
    engine.add_event_sink(audit_writer.sink());

    auto loaded = engine.load_problems();
    if (arena::core::errors::is_error(loaded)) {
        const auto& err = arena::core::errors::get_error(loaded);
        LOG_ERROR("Failed to load problems [" + err.code + "]: " + err.message);
        return 3;
    }

    for (const auto& config : arena::core::errors::get_value(agent_configs)) {
        auto registered = engine.register_agent(std::make_shared<arena::agents::ScriptedAgent>(config));
        if (arena::core::errors::is_error(registered)) {
            const auto& err = arena::core::errors::get_error(registered);
            LOG_ERROR("Failed to register agent [" + err.code + "]: " + err.message);
            return 3;
        }
    }

    auto finished = engine.run_full_contest();
    if (arena::core::errors::is_error(finished)) {
        const auto& err = arena::core::errors::get_error(finished);
        LOG_ERROR("Contest failed [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 1;
    }

    LOG_INFO("Final leaderboard:");
    for (const auto& standing : arena::core::errors::get_value(finished)) {
        LOG_INFO("  " + standing.actor + ": $" + std::to_string(standing.balance));
    }

    auto audited = ledger.audit();
    if (arena::core::errors::is_error(audited)) {
        const auto& err = arena::core::errors::get_error(audited);
        LOG_ERROR("Ledger audit failed [" + err.code + "]: " + err.message);
        return 4;
    }

    auto audit_artifact = audit_writer.write_audit(engine.status(), ledger, rulesets, engine.round_logs());
    if (arena::core::errors::is_error(audit_artifact)) {
        const auto& err = arena::core::errors::get_error(audit_artifact);
        LOG_ERROR("Failed to write audit artifact [" + err.code + "]: " + err.message);
        return 6;
    }
    LOG_INFO("Artifacts: " + arena::core::errors::get_value(audit_artifact).string());

    return 0;
}
