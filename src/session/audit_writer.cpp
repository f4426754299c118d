#include "session/audit_writer.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace arena::session {

using core::errors::ContestError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

json standings_to_json(const std::vector<protocol::Standing>& standings) {
    json rows = json::array();
    for (const auto& standing : standings) {
        rows.push_back({{"actor", standing.first}, {"balance", standing.second}});
    }
    return rows;
}

json standings_to_json(const std::vector<ledger::Standing>& standings) {
    return standings_to_json(contest::to_event_standings(standings));
}

json outcome_to_json(const protocol::ExecutionOutcome& outcome) {
    json payload;
    payload["success"] = outcome.success;
    payload["stdout"] = outcome.stdout_text;
    payload["error"] = outcome.error.has_value() ? json(outcome.error.value()) : json(nullptr);
    payload["duration_ms"] = outcome.duration_ms;
    payload["peak_memory_mb"] = outcome.peak_memory_mb;
    payload["tests_passed"] = outcome.tests_passed;
    payload["total_tests"] = outcome.total_tests;
    return payload;
}

json error_to_json(const ContestError& error) {
    return {{"category", core::errors::to_string(error.category)},
            {"code", error.code},
            {"message", error.message},
            {"hint", error.hint}};
}

struct PayloadVisitor {
    json operator()(const protocol::AgentRegisteredEvent& e) const {
        return {{"name", e.name}};
    }
    json operator()(const protocol::ContestStartedEvent& e) const {
        return {{"total_problems", e.total_problems}, {"participants", e.participants}};
    }
    json operator()(const protocol::RoundStartedEvent& e) const {
        return {{"round_number", e.round_number}, {"problem_id", e.problem_id}};
    }
    json operator()(const protocol::SubmissionReceivedEvent& e) const {
        return {{"agent", e.agent},
                {"problem_id", e.problem_id},
                {"response_latency_ms", e.response_latency_ms}};
    }
    json operator()(const protocol::RulesetUpdatedEvent& e) const {
        return {{"version", e.version}, {"author", e.author}};
    }
    json operator()(const protocol::RoundCompletedEvent& e) const {
        return {{"round_number", e.round_number},
                {"problem_id", e.problem_id},
                {"responders", e.responders},
                {"ruleset_updated", e.ruleset_updated},
                {"leaderboard", standings_to_json(e.leaderboard)}};
    }
    json operator()(const protocol::ContestEndedEvent& e) const {
        return {{"winner", e.winner}, {"final_leaderboard", standings_to_json(e.final_leaderboard)}};
    }
};

}  // namespace

json event_to_json(const protocol::ContestEvent& event) {
    json line;
    line["ts_unix_ms"] = event.timestamp_ms;
    line["event"] = protocol::event_kind(event);
    line["payload"] = std::visit(PayloadVisitor{}, event.payload);
    return line;
}

json round_log_to_json(const contest::RoundLog& round) {
    json payload;
    payload["round_number"] = round.round_number;
    payload["problem_id"] = round.problem_id;
    payload["released_at_ms"] = round.released_at_ms;
    payload["completed_at_ms"] = round.completed_at_ms;
    payload["ruleset_text"] = round.ruleset_text;
    payload["ruleset_updated"] = round.ruleset_updated;
    payload["ruleset_version"] =
        round.ruleset_version.has_value() ? json(round.ruleset_version.value()) : json(nullptr);

    json agents = json::array();
    for (const auto& record : round.records) {
        json row;
        row["agent"] = record.agent;
        row["status"] = protocol::to_string(record.solicitation);
        row["response_latency_ms"] = record.response_latency_ms;
        row["extracted_code"] = record.extracted_code;
        row["error"] = record.error.has_value() ? json(record.error.value()) : json(nullptr);
        row["outcome"] = record.outcome.has_value() ? outcome_to_json(record.outcome.value())
                                                    : json(nullptr);
        row["reward"] = nullptr;
        row["explanation"] = nullptr;
        for (const auto& reward : round.rewards) {
            if (reward.first == record.agent) {
                row["reward"] = reward.second.amount;
                row["explanation"] = reward.second.explanation;
            }
        }
        agents.push_back(row);
    }
    payload["agents"] = agents;

    json errors = json::array();
    for (const auto& error : round.errors) {
        errors.push_back(error_to_json(error));
    }
    payload["errors"] = errors;
    return payload;
}

AuditWriter::AuditWriter(std::filesystem::path artifacts_directory, std::string contest_id)
    : artifacts_directory_(std::move(artifacts_directory)), contest_id_(std::move(contest_id)) {}

core::errors::Result<std::filesystem::path> AuditWriter::artifact_path(
    const std::string& suffix) const {
    if (contest_id_.empty()) {
        return ContestError{ErrorCategory::Input, "Contest ID cannot be empty.",
                            "invalid_contest_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(artifacts_directory_, ec);
    if (ec) {
        return ContestError{ErrorCategory::Internal,
                            "Unable to create artifacts directory: " +
                                artifacts_directory_.string(),
                            "artifact_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(artifacts_directory_, ec) || ec) {
        return ContestError{ErrorCategory::Input,
                            "Artifacts path is not a directory: " + artifacts_directory_.string(),
                            "invalid_artifacts_directory"};
    }
    return artifacts_directory_ / (contest_id_ + suffix);
}

core::errors::Result<std::filesystem::path> AuditWriter::event_log_path() const {
    return artifact_path(".jsonl");
}

core::errors::Result<std::filesystem::path> AuditWriter::audit_path() const {
    return artifact_path(".audit.json");
}

core::errors::Result<std::filesystem::path> AuditWriter::write_event(
    const protocol::ContestEvent& event) const {
    auto path_result = event_log_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto log_path = core::errors::get_value(path_result);

    json line = event_to_json(event);
    line["contest_id"] = contest_id_;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(log_path, std::ios::app);
    if (!out.is_open()) {
        return ContestError{ErrorCategory::Internal,
                            "Unable to open event log: " + log_path.string(),
                            "artifact_open_failed"};
    }
    out << line.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return ContestError{ErrorCategory::Internal,
                            "Unable to write contest event: " + log_path.string(),
                            "artifact_write_failed"};
    }
    return log_path;
}

core::errors::Result<std::filesystem::path> AuditWriter::write_audit(
    const contest::ContestStatus& status, const ledger::Ledger& ledger,
    const ruleset::RulesetStore& rulesets,
    const std::vector<contest::RoundLog>& rounds) const {
    auto path_result = audit_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto out_path = core::errors::get_value(path_result);

    json document;
    document["contest_id"] = contest_id_;

    json status_json;
    status_json["phase"] = contest::to_string(status.phase);
    status_json["started_at_ms"] =
        status.started_at_ms.has_value() ? json(status.started_at_ms.value()) : json(nullptr);
    status_json["current_problem_index"] = status.current_problem_index;
    status_json["total_problems"] = status.total_problems;
    status_json["current_problem_id"] = status.current_problem_id.has_value()
                                            ? json(status.current_problem_id.value())
                                            : json(nullptr);
    status_json["participants"] = status.participants;
    status_json["leaderboard"] = standings_to_json(status.leaderboard);
    document["status"] = status_json;

    json transactions = json::array();
    for (const auto& tx : ledger.history()) {
        transactions.push_back({{"sequence", tx.sequence},
                                {"timestamp_ms", tx.timestamp_ms},
                                {"actor", tx.actor},
                                {"delta", tx.delta},
                                {"resulting_balance", tx.resulting_balance},
                                {"reason", tx.reason}});
    }
    document["transactions"] = transactions;
    document["ledger_total"] = ledger.total();

    json versions = json::array();
    for (const auto& version : rulesets.history()) {
        versions.push_back({{"version", version.version},
                            {"timestamp_ms", version.timestamp_ms},
                            {"author", version.author},
                            {"old_text", version.old_text},
                            {"new_text", version.new_text}});
    }
    document["ruleset"] = {{"governing_role", rulesets.governing_role()},
                           {"origin", rulesets.origin()},
                           {"current", rulesets.current()},
                           {"version", rulesets.version()},
                           {"history", versions}};

    json round_rows = json::array();
    for (const auto& round : rounds) {
        round_rows.push_back(round_log_to_json(round));
    }
    document["rounds"] = round_rows;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(out_path, std::ios::trunc);
    if (!out.is_open()) {
        return ContestError{ErrorCategory::Internal,
                            "Unable to open audit file: " + out_path.string(),
                            "artifact_open_failed"};
    }
    out << document.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return ContestError{ErrorCategory::Internal,
                            "Unable to write audit file: " + out_path.string(),
                            "artifact_write_failed"};
    }
    return out_path;
}

contest::EventSink AuditWriter::sink() const {
    return [this](const protocol::ContestEvent& event) {
        auto written = write_event(event);
        if (core::errors::is_error(written)) {
            LOG_ERROR("AuditWriter: " + core::errors::get_error(written).message);
        }
    };
}

}  // namespace arena::session
