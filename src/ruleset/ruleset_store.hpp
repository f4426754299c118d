#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/errors/contest_errors.hpp"

namespace arena::ruleset {

inline constexpr const char* kDefaultGoverningRole = "PrincipleEvaluator";

std::string default_constitution();

struct RulesetVersion {
    std::size_t version = 0;  // 1-based; version 0 is the origin text
    std::int64_t timestamp_ms = 0;
    std::string author;
    std::string old_text;
    std::string new_text;
};

// The contest constitution and its full edit history. Only the governing
// role may write; every write is one atomic swap of the current text.
class RulesetStore {
public:
    explicit RulesetStore(std::string origin_text = default_constitution(),
                          std::string governing_role = kDefaultGoverningRole);

    std::string current() const;

    // Returns the new version number.
    core::errors::Result<std::size_t> update(const std::string& new_text,
                                             const std::string& author);

    std::vector<RulesetVersion> history() const;
    std::size_t version() const;
    const std::string& origin() const { return origin_; }
    const std::string& governing_role() const { return governing_role_; }

    // Replays history from the origin text up to `version`.
    core::errors::Result<std::string> text_at(std::size_t version) const;

    // Checks that every version's old_text equals its predecessor's new_text
    // and that the replayed head equals current().
    core::errors::Result<std::size_t> verify_chain() const;

private:
    const std::string origin_;
    const std::string governing_role_;
    mutable std::mutex mutex_;
    std::shared_ptr<const std::string> current_;
    std::vector<RulesetVersion> versions_;
};

}  // namespace arena::ruleset
