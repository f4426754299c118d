#include "contest/problem_source.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace arena::contest {

using core::errors::ContestError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Problem;

namespace {

// Runs each check, counts the outcome, and prints the summary line the
// sandbox parses.
std::string checks_harness(const std::string& checks) {
    return "_checks = [\n" + checks +
           "]\n"
           "_passed = 0\n"
           "_failed = 0\n"
           "for _check in _checks:\n"
           "    try:\n"
           "        if _check():\n"
           "            _passed += 1\n"
           "        else:\n"
           "            _failed += 1\n"
           "    except Exception:\n"
           "        _failed += 1\n"
           "print(f\"{_failed} failed, {_passed} passed\")\n"
           "raise SystemExit(0 if _failed == 0 else 1)\n";
}

Problem make_problem(const std::string& id, const std::string& signature,
                     const std::string& description, const std::string& checks,
                     const std::uint32_t timeout_s, const std::uint32_t memory_limit_mb) {
    Problem problem;
    problem.id = id;
    problem.stub = "def " + signature + ":\n    \"\"\"" + description + "\"\"\"\n    pass";
    problem.harness = checks_harness(checks);
    problem.description = description;
    problem.timeout_s = timeout_s;
    problem.memory_limit_mb = memory_limit_mb;
    return problem;
}

bool all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](const unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

std::string strip_leading_zeros(const std::string& value) {
    const auto first = value.find_first_not_of('0');
    return first == std::string::npos ? "0" : value.substr(first);
}

}  // namespace

bool problem_id_less(const std::string& a, const std::string& b) {
    const bool numeric_a = all_digits(a);
    const bool numeric_b = all_digits(b);
    if (numeric_a != numeric_b) {
        return numeric_a;
    }
    if (numeric_a) {
        const std::string na = strip_leading_zeros(a);
        const std::string nb = strip_leading_zeros(b);
        if (na.size() != nb.size()) {
            return na.size() < nb.size();
        }
        if (na != nb) {
            return na < nb;
        }
    }
    return a < b;
}

core::errors::Result<std::vector<Problem>> order_problems(std::vector<Problem> problems) {
    std::set<std::string> seen;
    for (const auto& problem : problems) {
        if (problem.id.empty()) {
            return ContestError{ErrorCategory::Configuration, "Problem id cannot be empty.",
                                "invalid_problem_id"};
        }
        if (!seen.insert(problem.id).second) {
            return ContestError{ErrorCategory::Configuration,
                                "Duplicate problem id: " + problem.id, "duplicate_problem_id"};
        }
    }
    std::stable_sort(problems.begin(), problems.end(), [](const Problem& a, const Problem& b) {
        return problem_id_less(a.id, b.id);
    });
    return problems;
}

BuiltinProblemSource::BuiltinProblemSource(const std::uint32_t timeout_s,
                                           const std::uint32_t memory_limit_mb)
    : timeout_s_(timeout_s), memory_limit_mb_(memory_limit_mb) {}

core::errors::Result<std::vector<Problem>> BuiltinProblemSource::load() {
    std::vector<Problem> problems;
    problems.push_back(make_problem(
        "001", "add_numbers(a, b)", "Write a function that adds two numbers.",
        "    lambda: add_numbers(5, 3) == 8,\n"
        "    lambda: add_numbers(-2, 2) == 0,\n"
        "    lambda: add_numbers(0, 0) == 0,\n",
        timeout_s_, memory_limit_mb_));
    problems.push_back(make_problem(
        "002", "string_length(text)", "Write a function that returns the length of a string.",
        "    lambda: string_length('hello') == 5,\n"
        "    lambda: string_length('') == 0,\n"
        "    lambda: string_length('a b') == 3,\n",
        timeout_s_, memory_limit_mb_));
    problems.push_back(make_problem(
        "003", "is_even(n)", "Write a function that checks if a number is even.",
        "    lambda: is_even(4) is True,\n"
        "    lambda: is_even(7) is False,\n"
        "    lambda: is_even(0) is True,\n",
        timeout_s_, memory_limit_mb_));
    problems.push_back(make_problem(
        "004", "find_max(numbers)", "Write a function that finds the maximum in a list.",
        "    lambda: find_max([1, 5, 3, 9, 2]) == 9,\n"
        "    lambda: find_max([-4, -1, -7]) == -1,\n"
        "    lambda: find_max([42]) == 42,\n",
        timeout_s_, memory_limit_mb_));
    problems.push_back(make_problem(
        "005", "reverse_string(text)", "Write a function that reverses a string.",
        "    lambda: reverse_string('hello') == 'olleh',\n"
        "    lambda: reverse_string('') == '',\n"
        "    lambda: reverse_string('ab') == 'ba',\n",
        timeout_s_, memory_limit_mb_));
    return problems;
}

JsonProblemSource::JsonProblemSource(std::filesystem::path file) : file_(std::move(file)) {}

core::errors::Result<std::vector<Problem>> JsonProblemSource::load() {
    std::ifstream in(file_);
    if (!in.is_open()) {
        return ContestError{ErrorCategory::Input,
                            "Unable to open problems file: " + file_.string(),
                            "problems_file_unreadable"};
    }

    json document;
    try {
        in >> document;
    } catch (const json::exception& e) {
        return ContestError{ErrorCategory::Input,
                            "Problems file is not valid JSON: " + std::string(e.what()),
                            "problems_file_invalid"};
    }
    if (!document.is_array()) {
        return ContestError{ErrorCategory::Input, "Problems file must hold a JSON array.",
                            "problems_file_invalid"};
    }

    std::vector<Problem> problems;
    try {
        for (const auto& entry : document) {
            Problem problem;
            problem.id = entry.at("id").get<std::string>();
            problem.stub = entry.value("stub", std::string());
            problem.harness = entry.at("harness").get<std::string>();
            problem.description = entry.value("description", std::string());
            problem.timeout_s = entry.value("timeout_s", 1u);
            problem.memory_limit_mb = entry.value("memory_limit_mb", 256u);
            if (problem.timeout_s == 0 || problem.memory_limit_mb == 0) {
                return ContestError{ErrorCategory::Input,
                                    "Problem " + problem.id + " needs positive limits.",
                                    "problems_file_invalid"};
            }
            problems.push_back(std::move(problem));
        }
    } catch (const json::exception& e) {
        return ContestError{ErrorCategory::Input,
                            "Malformed problem entry: " + std::string(e.what()),
                            "problems_file_invalid",
                            "Each problem needs at least \"id\" and \"harness\"."};
    }
    return problems;
}

}  // namespace arena::contest
