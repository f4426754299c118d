#include "contest/contest_engine.hpp"

#include <exception>
#include <future>
#include <system_error>
#include <thread>
#include <utility>
#include "core/clock/clock.hpp"
#include "core/logging/logger.hpp"
#include "submission/extractor.hpp"

namespace arena::contest {

using core::errors::ContestError;
using core::errors::ErrorCategory;
using protocol::AgentRoundRecord;
using protocol::ExecutionOutcome;
using protocol::Problem;
using protocol::StepStatus;

namespace {

struct Reply {
    std::string text;
    double latency_ms = 0.0;
};

struct PendingReply {
    std::string agent;
    std::future<Reply> future;
    std::optional<std::string> launch_error;
};

std::string describe(const ExecutionOutcome& outcome) {
    return std::string(outcome.all_tests_passed() ? "passed" : "failed") + " (" +
           std::to_string(outcome.tests_passed) + "/" + std::to_string(outcome.total_tests) +
           " tests, " + std::to_string(static_cast<long long>(outcome.duration_ms)) + "ms)";
}

}  // namespace

std::string to_string(const ContestPhase phase) {
    switch (phase) {
        case ContestPhase::Idle:
            return "idle";
        case ContestPhase::Active:
            return "active";
        case ContestPhase::RoundInProgress:
            return "round_in_progress";
        case ContestPhase::Ended:
            return "ended";
        default:
            return "unknown";
    }
}

std::vector<protocol::Standing> to_event_standings(const std::vector<ledger::Standing>& standings) {
    std::vector<protocol::Standing> converted;
    converted.reserve(standings.size());
    for (const auto& standing : standings) {
        converted.emplace_back(standing.actor, standing.balance);
    }
    return converted;
}

ContestEngine::ContestEngine(ledger::Ledger& ledger, ruleset::RulesetStore& rulesets,
                             ProblemSource& problem_source, RewardPolicy& reward_policy,
                             ContestOptions options)
    : ledger_(ledger),
      rulesets_(rulesets),
      problem_source_(problem_source),
      reward_policy_(reward_policy),
      options_(std::move(options)) {
    if (!options_.extractor) {
        options_.extractor = submission::extract_executable;
    }
}

void ContestEngine::add_event_sink(EventSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void ContestEngine::emit(protocol::EventPayload payload) {
    protocol::ContestEvent event;
    event.timestamp_ms = core::clock::now_unix_ms();
    event.payload = std::move(payload);

    std::vector<EventSink> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        try {
            sink(event);
        } catch (const std::exception& e) {
            LOG_ERROR("ContestEngine: event sink failed on " + protocol::event_kind(event) + ": " +
                      e.what());
        }
    }
}

core::errors::Result<std::size_t> ContestEngine::load_problems() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != ContestPhase::Idle) {
            return ContestError{ErrorCategory::Configuration,
                                "Problems can only be loaded before the contest starts.",
                                "contest_already_active"};
        }
    }

    core::errors::Result<std::vector<Problem>> loaded =
        ContestError{ErrorCategory::Configuration, "Problem source returned nothing.",
                     "problem_source_failed"};
    try {
        loaded = problem_source_.load();
    } catch (const std::exception& e) {
        return ContestError{ErrorCategory::Configuration,
                            std::string("Problem source failed: ") + e.what(),
                            "problem_source_failed"};
    }
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }

    auto ordered = order_problems(core::errors::get_value(loaded));
    if (core::errors::is_error(ordered)) {
        return core::errors::get_error(ordered);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    problems_ = core::errors::get_value(ordered);
    problems_loaded_ = true;
    LOG_INFO("ContestEngine: loaded " + std::to_string(problems_.size()) + " problems");
    return problems_.size();
}

core::errors::Result<std::size_t> ContestEngine::register_agent(std::shared_ptr<Agent> agent) {
    if (!agent) {
        return ContestError{ErrorCategory::Configuration, "Cannot register a null agent.",
                            "invalid_agent"};
    }
    const std::string name = agent->name();
    if (name.empty()) {
        return ContestError{ErrorCategory::Configuration, "Agent name cannot be empty.",
                            "invalid_agent"};
    }
    if (name == reward_policy_.governing_role()) {
        return ContestError{ErrorCategory::Configuration,
                            "Agent name collides with the governing role: " + name,
                            "duplicate_agent"};
    }

    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != ContestPhase::Idle) {
            return ContestError{ErrorCategory::Configuration,
                                "Registration is closed once the contest has started.",
                                "registration_closed"};
        }
        for (const auto& participant : participants_) {
            if (participant.name == name) {
                return ContestError{ErrorCategory::Configuration,
                                    "Agent already registered: " + name, "duplicate_agent"};
            }
        }
        participants_.push_back(Participant{name, agent});
        count = participants_.size();
    }

    // Zero-amount opening entry keeps the audit trail complete.
    static_cast<void>(ledger_.adjust(name, 0, "Initial registration"));
    agent->on_registered(ledger::AccountView(ledger_, name));

    LOG_INFO("ContestEngine: registered agent " + name);
    emit(protocol::AgentRegisteredEvent{name});
    return count;
}

core::errors::Result<ContestPhase> ContestEngine::start() {
    bool needs_load = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == ContestPhase::Active || phase_ == ContestPhase::RoundInProgress) {
            return ContestError{ErrorCategory::Configuration, "Contest is already active.",
                                "contest_already_active"};
        }
        if (phase_ == ContestPhase::Ended) {
            return ContestError{ErrorCategory::Configuration, "Contest has already ended.",
                                "contest_ended", "Call reset() before starting again."};
        }
        needs_load = !problems_loaded_;
    }

    if (needs_load) {
        auto loaded = load_problems();
        if (core::errors::is_error(loaded)) {
            return core::errors::get_error(loaded);
        }
    }

    std::size_t total = 0;
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (problems_.empty()) {
            return ContestError{ErrorCategory::Configuration, "No problems loaded.",
                                "no_problems_loaded"};
        }
        if (participants_.empty()) {
            return ContestError{ErrorCategory::Configuration, "No agents registered.",
                                "no_agents_registered",
                                "Register at least one agent before starting."};
        }
        phase_ = ContestPhase::Active;
        current_index_ = 0;
        started_at_ms_ = core::clock::now_unix_ms();
        total = problems_.size();
        for (const auto& participant : participants_) {
            names.push_back(participant.name);
        }
    }

    LOG_INFO("ContestEngine: contest started with " + std::to_string(total) + " problems and " +
             std::to_string(names.size()) + " agents");
    emit(protocol::ContestStartedEvent{total, names});
    return ContestPhase::Active;
}

std::vector<AgentRoundRecord> ContestEngine::solicit(const Problem& problem,
                                                     const std::size_t round_number) {
    std::vector<Participant> roster;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roster = participants_;
    }

    const auto solicited_at = std::chrono::steady_clock::now();
    const auto deadline = solicited_at + options_.response_budget;

    std::vector<PendingReply> pending;
    pending.reserve(roster.size());
    for (const auto& participant : roster) {
        // Detached so an overrunning agent is abandoned instead of joined.
        auto task = std::make_shared<std::packaged_task<Reply()>>(
            [agent = participant.agent, problem, solicited_at]() {
                std::string text = agent->produce(problem);
                return Reply{std::move(text), core::clock::elapsed_ms(solicited_at)};
            });
        PendingReply entry;
        entry.agent = participant.name;
        entry.future = task->get_future();
        try {
            std::thread([task]() { (*task)(); }).detach();
        } catch (const std::system_error& e) {
            entry.launch_error = std::string("Failed to start solicitation: ") + e.what();
        }
        pending.push_back(std::move(entry));
    }

    std::vector<AgentRoundRecord> records;
    records.reserve(pending.size());
    for (auto& entry : pending) {
        AgentRoundRecord record;
        record.agent = entry.agent;

        if (entry.launch_error.has_value()) {
            record.solicitation = StepStatus::Failed;
            record.error = entry.launch_error;
        } else if (entry.future.wait_until(deadline) != std::future_status::ready) {
            record.solicitation = StepStatus::TimedOut;
            record.response_latency_ms = static_cast<double>(options_.response_budget.count());
            record.error = "No response within " + std::to_string(options_.response_budget.count()) +
                           "ms";
        } else {
            try {
                Reply reply = entry.future.get();
                record.solicitation = StepStatus::Ok;
                record.raw_submission = std::move(reply.text);
                record.response_latency_ms = reply.latency_ms;
            } catch (const std::exception& e) {
                record.solicitation = StepStatus::Failed;
                record.error = std::string("Agent raised: ") + e.what();
            } catch (...) {
                record.solicitation = StepStatus::Failed;
                record.error = "Agent raised a non-standard exception";
            }
        }

        if (record.responded()) {
            LOG_INFO("Round " + std::to_string(round_number) + ": received submission from " +
                     record.agent + " (" +
                     std::to_string(static_cast<long long>(record.response_latency_ms)) + "ms)");
            emit(protocol::SubmissionReceivedEvent{record.agent, problem.id,
                                                   record.response_latency_ms});
        } else {
            LOG_WARN("Round " + std::to_string(round_number) + ": no submission from " +
                     record.agent + " [" + protocol::to_string(record.solicitation) + "]: " +
                     record.error.value_or(""));
        }
        records.push_back(std::move(record));
    }
    return records;
}

void ContestEngine::extract_and_execute(const Problem& problem,
                                        std::vector<AgentRoundRecord>& records) const {
    const std::string entry_point = submission::entry_point_from_stub(problem.stub);

    for (auto& record : records) {
        if (!record.responded()) {
            continue;
        }
        try {
            record.extracted_code = options_.extractor(record.raw_submission, entry_point);
        } catch (const std::exception& e) {
            record.error = std::string("Extraction failed: ") + e.what();
            record.outcome = protocol::failed_outcome(record.error.value());
            LOG_WARN("ContestEngine: extraction failed for " + record.agent + ": " + e.what());
        } catch (...) {
            record.error = "Extraction failed: non-standard exception";
            record.outcome = protocol::failed_outcome(record.error.value());
            LOG_WARN("ContestEngine: extraction failed for " + record.agent +
                     ": non-standard exception");
        }
    }

    // One sandbox per submission, all running side by side.
    std::vector<std::pair<std::size_t, std::future<core::errors::Result<ExecutionOutcome>>>> runs;
    for (std::size_t i = 0; i < records.size(); ++i) {
        auto& record = records[i];
        if (!record.responded() || record.outcome.has_value()) {
            continue;
        }
        try {
            runs.emplace_back(
                i, std::async(std::launch::async,
                              [sandbox_options = options_.sandbox, code = record.extracted_code,
                               harness = problem.harness, timeout_s = problem.timeout_s,
                               memory_limit_mb = problem.memory_limit_mb]() {
                                  sandbox::SandboxRunner runner(sandbox_options);
                                  return runner.execute(code, harness,
                                                        static_cast<double>(timeout_s),
                                                        memory_limit_mb);
                              }));
        } catch (const std::system_error& e) {
            record.outcome =
                protocol::failed_outcome(std::string("Failed to start sandbox: ") + e.what());
        }
    }

    for (auto& run : runs) {
        auto& record = records[run.first];
        try {
            auto result = run.second.get();
            if (core::errors::is_error(result)) {
                record.outcome = protocol::failed_outcome(core::errors::get_error(result).message);
            } else {
                record.outcome = core::errors::get_value(result);
            }
        } catch (const std::exception& e) {
            record.outcome = protocol::failed_outcome(std::string("Sandbox failure: ") + e.what());
        }
        LOG_INFO("ContestEngine: " + record.agent + " " + describe(record.outcome.value()));
    }
}

void ContestEngine::reward_and_feedback(protocol::RoundContext& context, RoundLog& log) {
    std::vector<std::pair<std::string, protocol::Reward>> rewards;
    const std::string reason = "Problem " + context.problem.id + " submission";

    // Every outcome exists before the first reward is computed.
    for (const auto& record : context.records) {
        if (!record.responded()) {
            continue;
        }
        try {
            auto scored = reward_policy_.score(record.agent, context);
            if (core::errors::is_error(scored)) {
                const auto& err = core::errors::get_error(scored);
                LOG_ERROR("ContestEngine: reward policy failed for " + record.agent + " [" +
                          err.code + "]: " + err.message);
                log.errors.push_back(err);
                continue;
            }
            rewards.emplace_back(record.agent, core::errors::get_value(scored));
        } catch (const std::exception& e) {
            LOG_ERROR("ContestEngine: reward policy threw for " + record.agent + ": " + e.what());
            log.errors.push_back(ContestError{ErrorCategory::Internal,
                                              "Reward policy threw for " + record.agent + ": " +
                                                  e.what(),
                                              "reward_policy_failed"});
        }
    }

    std::vector<std::pair<std::string, protocol::Reward>> posted;
    for (const auto& entry : rewards) {
        auto balance = ledger_.adjust(entry.first, entry.second.amount, reason);
        if (core::errors::is_error(balance)) {
            const auto& err = core::errors::get_error(balance);
            LOG_ERROR("ContestEngine: ledger rejected reward for " + entry.first + ": " +
                      err.message);
            log.errors.push_back(err);
            continue;
        }
        posted.push_back(entry);
    }
    if (options_.evaluator_fee != 0) {
        auto fee = ledger_.adjust(reward_policy_.governing_role(), options_.evaluator_fee,
                                  "Problem " + context.problem.id + " evaluation");
        if (core::errors::is_error(fee)) {
            const auto& err = core::errors::get_error(fee);
            LOG_ERROR("ContestEngine: ledger rejected evaluator fee: " + err.message);
            log.errors.push_back(err);
        }
    }
    context.rewards = posted;
    log.rewards = posted;

    std::vector<Participant> roster;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roster = participants_;
    }
    for (const auto& participant : roster) {
        const AgentRoundRecord* record = context.find(participant.name);
        if (record == nullptr || !record->responded()) {
            continue;
        }
        protocol::Feedback feedback;
        feedback.problem_id = context.problem.id;
        feedback.timestamp_ms = core::clock::now_unix_ms();
        feedback.outcome = record->outcome.value_or(protocol::failed_outcome("No outcome"));
        feedback.ruleset_text = context.ruleset_text;
        feedback.extracted_code = record->extracted_code;
        feedback.response_latency_ms = record->response_latency_ms;
        feedback.balance = ledger_.balance(participant.name);
        for (const auto& entry : posted) {
            if (entry.first == participant.name) {
                feedback.reward = entry.second.amount;
                feedback.explanation = entry.second.explanation;
            }
        }
        try {
            participant.agent->receive(feedback);
        } catch (const std::exception& e) {
            LOG_WARN("ContestEngine: agent " + participant.name + " failed to take feedback: " +
                     e.what());
        }
    }
}

void ContestEngine::check_ruleset(const protocol::RoundContext& context, RoundLog& log) {
    std::optional<std::string> proposal;
    try {
        proposal = reward_policy_.maybe_revise_ruleset(context);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("ContestEngine: ruleset revision check threw: ") + e.what());
        log.errors.push_back(ContestError{ErrorCategory::Internal,
                                          std::string("Ruleset revision check threw: ") + e.what(),
                                          "reward_policy_failed"});
        return;
    }
    if (!proposal.has_value()) {
        return;
    }

    const std::string author = reward_policy_.governing_role();
    auto updated = rulesets_.update(proposal.value(), author);
    if (core::errors::is_error(updated)) {
        const auto& err = core::errors::get_error(updated);
        LOG_ERROR("ContestEngine: ruleset update rejected [" + err.code + "]: " + err.message);
        log.errors.push_back(err);
        return;
    }
    log.ruleset_updated = true;
    log.ruleset_version = core::errors::get_value(updated);
    emit(protocol::RulesetUpdatedEvent{log.ruleset_version.value(), author});
}

core::errors::Result<RoundLog> ContestEngine::run_round() {
    Problem problem;
    std::size_t round_number = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (phase_) {
            case ContestPhase::Idle:
                return ContestError{ErrorCategory::Configuration, "Contest has not started.",
                                    "contest_not_started"};
            case ContestPhase::RoundInProgress:
                return ContestError{ErrorCategory::Configuration,
                                    "A round is already in progress.", "round_in_progress"};
            case ContestPhase::Ended:
                return ContestError{ErrorCategory::Configuration, "Contest has already ended.",
                                    "contest_ended", "Call reset() before running more rounds."};
            case ContestPhase::Active:
                break;
        }
        Problem& slot = problems_[current_index_];
        if (!slot.released_at_ms.has_value()) {
            slot.released_at_ms = core::clock::now_unix_ms();
        }
        problem = slot;
        round_number = current_index_ + 1;
        phase_ = ContestPhase::RoundInProgress;
    }

    RoundLog log;
    log.round_number = round_number;
    log.problem_id = problem.id;
    log.released_at_ms = problem.released_at_ms.value();
    log.ruleset_text = rulesets_.current();

    LOG_INFO("Round " + std::to_string(round_number) + ": released problem " + problem.id);
    emit(protocol::RoundStartedEvent{round_number, problem.id});

    protocol::RoundContext context;
    context.round_number = round_number;
    context.problem = problem;
    context.ruleset_text = log.ruleset_text;
    context.records = solicit(problem, round_number);
    extract_and_execute(problem, context.records);

    reward_and_feedback(context, log);
    check_ruleset(context, log);

    log.records = context.records;
    log.completed_at_ms = core::clock::now_unix_ms();

    std::size_t responders = 0;
    for (const auto& record : log.records) {
        if (record.responded()) {
            ++responders;
        }
    }

    bool ended = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++current_index_;
        if (current_index_ >= problems_.size()) {
            phase_ = ContestPhase::Ended;
            ended = true;
        } else {
            phase_ = ContestPhase::Active;
        }
        round_logs_.push_back(log);
    }

    const auto standings = to_event_standings(ledger_.leaderboard());
    LOG_INFO("Round " + std::to_string(round_number) + ": completed problem " + problem.id +
             " with " + std::to_string(responders) + " submissions");
    emit(protocol::RoundCompletedEvent{round_number, problem.id, responders, log.ruleset_updated,
                                       standings});

    if (ended) {
        const std::string winner = standings.empty() ? "" : standings.front().first;
        LOG_INFO("ContestEngine: contest ended. Winner: " + (winner.empty() ? "none" : winner));
        emit(protocol::ContestEndedEvent{winner, standings});
    }
    return log;
}

core::errors::Result<std::vector<ledger::Standing>> ContestEngine::run_full_contest() {
    const ContestPhase entry_phase = phase();
    if (entry_phase == ContestPhase::Ended) {
        return ContestError{ErrorCategory::Configuration, "Contest has already ended.",
                            "contest_ended", "Call reset() before running again."};
    }
    if (entry_phase == ContestPhase::Idle) {
        auto started = start();
        if (core::errors::is_error(started)) {
            return core::errors::get_error(started);
        }
    }

    while (phase() == ContestPhase::Active) {
        auto round = run_round();
        if (core::errors::is_error(round)) {
            return core::errors::get_error(round);
        }
        if (phase() == ContestPhase::Active && options_.round_pause.count() > 0) {
            std::this_thread::sleep_for(options_.round_pause);
        }
    }
    return ledger_.leaderboard();
}

core::errors::Result<ContestPhase> ContestEngine::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == ContestPhase::Active || phase_ == ContestPhase::RoundInProgress) {
            return ContestError{ErrorCategory::Configuration,
                                "Cannot reset a contest that is still running.",
                                "contest_already_active"};
        }
        phase_ = ContestPhase::Idle;
        current_index_ = 0;
        started_at_ms_.reset();
        problems_.clear();
        problems_loaded_ = false;
    }
    LOG_INFO("ContestEngine: contest reset");

    auto reloaded = load_problems();
    if (core::errors::is_error(reloaded)) {
        return core::errors::get_error(reloaded);
    }
    return ContestPhase::Idle;
}

ContestPhase ContestEngine::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

ContestStatus ContestEngine::status() const {
    ContestStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status.phase = phase_;
        status.started_at_ms = started_at_ms_;
        status.current_problem_index = current_index_;
        status.total_problems = problems_.size();
        if ((phase_ == ContestPhase::Active || phase_ == ContestPhase::RoundInProgress) &&
            current_index_ < problems_.size()) {
            status.current_problem_id = problems_[current_index_].id;
        }
        for (const auto& participant : participants_) {
            status.participants.push_back(participant.name);
        }
    }
    status.leaderboard = ledger_.leaderboard();
    return status;
}

std::optional<Problem> ContestEngine::current_problem() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == ContestPhase::Idle || phase_ == ContestPhase::Ended ||
        current_index_ >= problems_.size()) {
        return std::nullopt;
    }
    return problems_[current_index_];
}

std::vector<Problem> ContestEngine::problems() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return problems_;
}

std::vector<RoundLog> ContestEngine::round_logs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return round_logs_;
}

std::vector<std::string> ContestEngine::participants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& participant : participants_) {
        names.push_back(participant.name);
    }
    return names;
}

}  // namespace arena::contest
