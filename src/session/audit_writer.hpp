#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "contest/contest_engine.hpp"
#include "core/errors/contest_errors.hpp"
#include "ledger/ledger.hpp"
#include "protocol/event_contract.hpp"
#include "ruleset/ruleset_store.hpp"

namespace arena::session {

// Writes the contest's artifacts under one directory:
//   <contest-id>.jsonl       one JSON line per contest event
//   <contest-id>.audit.json  final snapshot of ledger, ruleset and rounds
class AuditWriter {
public:
    AuditWriter(std::filesystem::path artifacts_directory, std::string contest_id);

    core::errors::Result<std::filesystem::path> event_log_path() const;
    core::errors::Result<std::filesystem::path> audit_path() const;

    core::errors::Result<std::filesystem::path> write_event(
        const protocol::ContestEvent& event) const;

    core::errors::Result<std::filesystem::path> write_audit(
        const contest::ContestStatus& status, const ledger::Ledger& ledger,
        const ruleset::RulesetStore& rulesets,
        const std::vector<contest::RoundLog>& rounds) const;

    // Event sink for ContestEngine::add_event_sink. Write failures are logged.
    contest::EventSink sink() const;

private:
    core::errors::Result<std::filesystem::path> artifact_path(const std::string& suffix) const;

    std::filesystem::path artifacts_directory_;
    std::string contest_id_;
    mutable std::mutex mutex_;
};

nlohmann::json event_to_json(const protocol::ContestEvent& event);
nlohmann::json round_log_to_json(const contest::RoundLog& round);

}  // namespace arena::session
