#include "ruleset/ruleset_store.hpp"

#include <utility>
#include "core/clock/clock.hpp"
#include "core/logging/logger.hpp"

namespace arena::ruleset {

using core::errors::ContestError;
using core::errors::ErrorCategory;

std::string default_constitution() {
    return "All unit tests pass: + $1,000\n"
           "\n"
           "Compilation error or any failing test: - $500\n"
           "\n"
           "Latency: - $5 x (seconds from problem release to query return)\n"
           "\n"
           "The Principle Evaluator may overwrite these lines (or add new ones) after any round.";
}

RulesetStore::RulesetStore(std::string origin_text, std::string governing_role)
    : origin_(std::move(origin_text)),
      governing_role_(std::move(governing_role)),
      current_(std::make_shared<const std::string>(origin_)) {}

std::string RulesetStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return *current_;
}

core::errors::Result<std::size_t> RulesetStore::update(const std::string& new_text,
                                                       const std::string& author) {
    if (author != governing_role_) {
        LOG_WARN("RulesetStore: rejected update from " + author);
        return ContestError{ErrorCategory::Ruleset,
                            "Only " + governing_role_ + " can modify the constitution (got " +
                                author + ")",
                            "ruleset_permission_denied"};
    }

    auto next = std::make_shared<const std::string>(new_text);
    std::lock_guard<std::mutex> lock(mutex_);
    RulesetVersion entry;
    entry.version = versions_.size() + 1;
    entry.timestamp_ms = core::clock::now_unix_ms();
    entry.author = author;
    entry.old_text = *current_;
    entry.new_text = new_text;
    versions_.push_back(std::move(entry));
    current_ = std::move(next);
    LOG_INFO("RulesetStore: constitution updated to version " +
             std::to_string(versions_.size()) + " by " + author);
    return versions_.size();
}

std::vector<RulesetVersion> RulesetStore::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return versions_;
}

std::size_t RulesetStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return versions_.size();
}

core::errors::Result<std::string> RulesetStore::text_at(const std::size_t version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (version > versions_.size()) {
        return ContestError{ErrorCategory::Ruleset,
                            "Ruleset version " + std::to_string(version) + " does not exist",
                            "unknown_ruleset_version"};
    }
    std::string text = origin_;
    for (std::size_t i = 0; i < version; ++i) {
        if (versions_[i].old_text != text) {
            return ContestError{ErrorCategory::Ruleset,
                                "Ruleset history broken at version " + std::to_string(i + 1),
                                "ruleset_history_broken"};
        }
        text = versions_[i].new_text;
    }
    return text;
}

core::errors::Result<std::size_t> RulesetStore::verify_chain() const {
    const std::size_t head = version();
    auto replayed = text_at(head);
    if (core::errors::is_error(replayed)) {
        return core::errors::get_error(replayed);
    }
    if (core::errors::get_value(replayed) != current()) {
        return ContestError{ErrorCategory::Ruleset,
                            "Replayed ruleset does not match the current text",
                            "ruleset_history_broken"};
    }
    return head;
}

}  // namespace arena::ruleset
