#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "contest/contest_engine.hpp"
#include "core/config/contest_id.hpp"
#include "core/errors/contest_errors.hpp"
#include "ledger/ledger.hpp"
#include "protocol/event_contract.hpp"
#include "ruleset/ruleset_store.hpp"
#include "session/audit_writer.hpp"

namespace {

using arena::contest::ContestPhase;
using arena::contest::ContestStatus;
using arena::contest::RoundLog;
using arena::core::errors::get_error;
using arena::core::errors::get_value;
using arena::core::errors::is_error;
using arena::protocol::ContestEvent;
using arena::session::AuditWriter;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_audit_writer_" + arena::core::config::generate_contest_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<std::string> read_lines(const std::filesystem::path& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

ContestEvent make_event(arena::protocol::EventPayload payload) {
    ContestEvent event;
    event.timestamp_ms = 1700000000000;
    event.payload = std::move(payload);
    return event;
}

TEST(AuditWriterTest, AppendsOneLinePerEvent) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root() / "runs", "contest-test0001");

    ASSERT_FALSE(is_error(writer.write_event(
        make_event(arena::protocol::RoundStartedEvent{1, "001"}))));
    auto sink = writer.sink();
    sink(make_event(arena::protocol::ContestEndedEvent{"alpha", {{"alpha", 990}, {"beta", -505}}}));

    auto path = writer.event_log_path();
    ASSERT_FALSE(is_error(path));
    EXPECT_EQ(get_value(path).filename(), "contest-test0001.jsonl");

    const auto lines = read_lines(get_value(path));
    ASSERT_EQ(lines.size(), 2u);

    const auto started = json::parse(lines[0]);
    EXPECT_EQ(started.at("event").get<std::string>(), "round_started");
    EXPECT_EQ(started.at("contest_id").get<std::string>(), "contest-test0001");
    EXPECT_EQ(started.at("ts_unix_ms").get<std::int64_t>(), 1700000000000);
    EXPECT_EQ(started.at("payload").at("problem_id").get<std::string>(), "001");

    const auto ended = json::parse(lines[1]);
    EXPECT_EQ(ended.at("event").get<std::string>(), "contest_ended");
    EXPECT_EQ(ended.at("payload").at("winner").get<std::string>(), "alpha");
    const auto& board = ended.at("payload").at("final_leaderboard");
    ASSERT_EQ(board.size(), 2u);
    EXPECT_EQ(board[1].at("actor").get<std::string>(), "beta");
    EXPECT_EQ(board[1].at("balance").get<std::int64_t>(), -505);
}

TEST(AuditWriterTest, WritesAuditDocument) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root(), "contest-test0002");

    arena::ledger::Ledger ledger;
    ledger.adjust("alpha", 0, "Initial registration");
    ledger.adjust("alpha", 1000, "Problem 001 submission");
    arena::ruleset::RulesetStore rulesets("v0");
    ASSERT_FALSE(is_error(rulesets.update("v1", "PrincipleEvaluator")));

    ContestStatus status;
    status.phase = ContestPhase::Ended;
    status.current_problem_index = 1;
    status.total_problems = 1;
    status.participants = {"alpha"};
    status.leaderboard = ledger.leaderboard();

    RoundLog round;
    round.round_number = 1;
    round.problem_id = "001";
    round.ruleset_text = "v0";
    arena::protocol::AgentRoundRecord record;
    record.agent = "alpha";
    record.solicitation = arena::protocol::StepStatus::Ok;
    record.outcome = arena::protocol::ExecutionOutcome{};
    round.records.push_back(record);
    round.rewards.emplace_back("alpha", arena::protocol::Reward{1000, "passed"});
    round.ruleset_updated = true;
    round.ruleset_version = 1;
    round.errors.push_back(arena::core::errors::ContestError{
        arena::core::errors::ErrorCategory::Ruleset, "denied", "ruleset_permission_denied"});

    auto written = writer.write_audit(status, ledger, rulesets, {round});
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(get_value(written).filename(), "contest-test0002.audit.json");

    std::ifstream in(get_value(written));
    const json document = json::parse(in);
    EXPECT_EQ(document.at("status").at("phase").get<std::string>(), "ended");
    ASSERT_EQ(document.at("transactions").size(), 2u);
    EXPECT_EQ(document.at("transactions")[1].at("resulting_balance").get<std::int64_t>(), 1000);
    EXPECT_EQ(document.at("ledger_total").get<std::int64_t>(), 1000);
    EXPECT_EQ(document.at("ruleset").at("origin").get<std::string>(), "v0");
    EXPECT_EQ(document.at("ruleset").at("current").get<std::string>(), "v1");
    ASSERT_EQ(document.at("ruleset").at("history").size(), 1u);

    const auto& logged = document.at("rounds")[0];
    EXPECT_EQ(logged.at("agents")[0].at("status").get<std::string>(), "ok");
    EXPECT_EQ(logged.at("agents")[0].at("reward").get<std::int64_t>(), 1000);
    EXPECT_EQ(logged.at("errors")[0].at("code").get<std::string>(), "ruleset_permission_denied");
}

TEST(AuditWriterTest, ReplacesInvalidUtf8FromSubmissionOutput) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root(), "contest-test0004");

    arena::ledger::Ledger ledger;
    arena::ruleset::RulesetStore rulesets("v0");
    ContestStatus status;
    status.phase = ContestPhase::Ended;

    RoundLog round;
    round.round_number = 1;
    round.problem_id = "001";
    arena::protocol::AgentRoundRecord record;
    record.agent = "alpha";
    record.solicitation = arena::protocol::StepStatus::Ok;
    arena::protocol::ExecutionOutcome outcome;
    outcome.stdout_text = std::string("garbage \xff\xfe tail");
    outcome.error = std::string("Traceback \x80");
    record.outcome = outcome;
    round.records.push_back(record);

    auto written = writer.write_audit(status, ledger, rulesets, {round});
    ASSERT_FALSE(is_error(written));

    std::ifstream in(get_value(written));
    const json document = json::parse(in);
    const auto& logged = document.at("rounds")[0].at("agents")[0].at("outcome");
    const auto stdout_text = logged.at("stdout").get<std::string>();
    EXPECT_EQ(stdout_text.rfind("garbage ", 0), 0u);
    EXPECT_NE(stdout_text.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(stdout_text.find("tail"), std::string::npos);
    EXPECT_NE(logged.at("error").get<std::string>().find("Traceback"), std::string::npos);
}

TEST(AuditWriterTest, ReplacesInvalidUtf8InEventLine) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root(), "contest-test0005");

    auto written = writer.write_event(make_event(
        arena::protocol::SubmissionReceivedEvent{std::string("al\xffpha"), "001", 12.0}));
    ASSERT_FALSE(is_error(written));

    const auto lines = read_lines(get_value(written));
    ASSERT_EQ(lines.size(), 1u);
    const auto line = json::parse(lines[0]);
    EXPECT_EQ(line.at("payload").at("agent").get<std::string>(), "al\xEF\xBF\xBDpha");
}

TEST(AuditWriterTest, FailsForEmptyContestId) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root(), "");
    auto result = writer.write_event(make_event(arena::protocol::AgentRegisteredEvent{"alpha"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_contest_id");
}

TEST(AuditWriterTest, FailsWhenArtifactsPathIsAFile) {
    TempWorkspace workspace;
    const auto blocker = workspace.root() / "blocker";
    std::ofstream(blocker) << "x";
    AuditWriter writer(blocker, "contest-test0003");
    auto result = writer.write_event(make_event(arena::protocol::AgentRegisteredEvent{"alpha"}));
    ASSERT_TRUE(is_error(result));
}

}  // namespace
