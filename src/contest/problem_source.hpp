#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "core/errors/contest_errors.hpp"
#include "protocol/problem_contract.hpp"

namespace arena::contest {

class ProblemSource {
public:
    virtual ~ProblemSource() = default;
    virtual core::errors::Result<std::vector<protocol::Problem>> load() = 0;
};

// Five small problems with self-reporting Python harnesses, used when no
// problems file is given.
class BuiltinProblemSource : public ProblemSource {
public:
    explicit BuiltinProblemSource(std::uint32_t timeout_s = 1,
                                  std::uint32_t memory_limit_mb = 256);
    core::errors::Result<std::vector<protocol::Problem>> load() override;

private:
    std::uint32_t timeout_s_;
    std::uint32_t memory_limit_mb_;
};

// JSON array of {id, stub, harness, description, timeout_s, memory_limit_mb}.
class JsonProblemSource : public ProblemSource {
public:
    explicit JsonProblemSource(std::filesystem::path file);
    core::errors::Result<std::vector<protocol::Problem>> load() override;

private:
    std::filesystem::path file_;
};

// All-digit ids sort first and compare as numbers. The rest follow,
// compared lexicographically.
bool problem_id_less(const std::string& a, const std::string& b);

// Rejects empty or duplicate ids and returns the problems in id order.
core::errors::Result<std::vector<protocol::Problem>> order_problems(
    std::vector<protocol::Problem> problems);

}  // namespace arena::contest
