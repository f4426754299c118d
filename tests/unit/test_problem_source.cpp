#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "contest/problem_source.hpp"
#include "core/config/contest_id.hpp"
#include "submission/extractor.hpp"

namespace {

using arena::contest::BuiltinProblemSource;
using arena::contest::JsonProblemSource;
using arena::contest::order_problems;
using arena::contest::problem_id_less;
using arena::core::errors::get_error;
using arena::core::errors::get_value;
using arena::core::errors::is_error;
using arena::protocol::Problem;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_problem_source_" + arena::core::config::generate_contest_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        const auto path = root_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

private:
    std::filesystem::path root_;
};

Problem with_id(const std::string& id) {
    Problem problem;
    problem.id = id;
    return problem;
}

TEST(ProblemSourceTest, BuiltinSetHasFiveOrderedProblems) {
    BuiltinProblemSource source(2, 128);
    auto loaded = source.load();
    ASSERT_FALSE(is_error(loaded));
    const auto& problems = get_value(loaded);
    ASSERT_EQ(problems.size(), 5u);
    EXPECT_EQ(problems[0].id, "001");
    EXPECT_EQ(problems[4].id, "005");
    EXPECT_EQ(arena::submission::entry_point_from_stub(problems[0].stub), "add_numbers");
    EXPECT_EQ(arena::submission::entry_point_from_stub(problems[3].stub), "find_max");
    for (const auto& problem : problems) {
        EXPECT_EQ(problem.timeout_s, 2u);
        EXPECT_EQ(problem.memory_limit_mb, 128u);
        EXPECT_FALSE(problem.released_at_ms.has_value());
        EXPECT_NE(problem.harness.find("passed"), std::string::npos);
    }
}

TEST(ProblemSourceTest, NumericIdsCompareNumerically) {
    EXPECT_TRUE(problem_id_less("2", "10"));
    EXPECT_FALSE(problem_id_less("10", "2"));
    EXPECT_TRUE(problem_id_less("002", "10"));
    EXPECT_TRUE(problem_id_less("abc", "abd"));
}

TEST(ProblemSourceTest, OrderProblemsSortsById) {
    auto ordered = order_problems({with_id("10"), with_id("2"), with_id("1")});
    ASSERT_FALSE(is_error(ordered));
    const auto& problems = get_value(ordered);
    ASSERT_EQ(problems.size(), 3u);
    EXPECT_EQ(problems[0].id, "1");
    EXPECT_EQ(problems[1].id, "2");
    EXPECT_EQ(problems[2].id, "10");
}

TEST(ProblemSourceTest, MixedIdsPutNumericIdsFirst) {
    EXPECT_TRUE(problem_id_less("2", "10"));
    EXPECT_TRUE(problem_id_less("10", "1a"));
    EXPECT_FALSE(problem_id_less("1a", "2"));
    EXPECT_TRUE(problem_id_less("2", "1a"));
    EXPECT_FALSE(problem_id_less("1a", "1a"));
    EXPECT_TRUE(problem_id_less("2", "002") != problem_id_less("002", "2"));

    auto ordered = order_problems(
        {with_id("b"), with_id("10"), with_id("1a"), with_id("2"), with_id("a"), with_id("002")});
    ASSERT_FALSE(is_error(ordered));
    std::vector<std::string> ids;
    for (const auto& problem : get_value(ordered)) {
        ids.push_back(problem.id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"002", "2", "10", "1a", "a", "b"}));
}

TEST(ProblemSourceTest, OrderProblemsRejectsDuplicatesAndEmptyIds) {
    auto duplicate = order_problems({with_id("1"), with_id("1")});
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_problem_id");

    auto empty = order_problems({with_id("")});
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "invalid_problem_id");
}

TEST(ProblemSourceTest, JsonSourceLoadsProblems) {
    TempWorkspace workspace;
    const auto file = workspace.write(
        "problems.json",
        R"([{"id": "7", "stub": "def f():\n    pass", "harness": "echo 1 passed",
             "description": "seven", "timeout_s": 3, "memory_limit_mb": 64},
            {"id": "3", "harness": "echo 1 passed"}])");
    JsonProblemSource source(file);
    auto loaded = source.load();
    ASSERT_FALSE(is_error(loaded));
    const auto& problems = get_value(loaded);
    ASSERT_EQ(problems.size(), 2u);
    EXPECT_EQ(problems[0].id, "7");
    EXPECT_EQ(problems[0].timeout_s, 3u);
    EXPECT_EQ(problems[0].memory_limit_mb, 64u);
    EXPECT_EQ(problems[1].timeout_s, 1u);
    EXPECT_EQ(problems[1].memory_limit_mb, 256u);
}

TEST(ProblemSourceTest, JsonSourceReportsBadFiles) {
    TempWorkspace workspace;
    JsonProblemSource missing(workspace.write("placeholder", "").parent_path() / "nope.json");
    auto unreadable = missing.load();
    ASSERT_TRUE(is_error(unreadable));
    EXPECT_EQ(get_error(unreadable).code, "problems_file_unreadable");

    JsonProblemSource garbage(workspace.write("bad.json", "{not json"));
    auto invalid = garbage.load();
    ASSERT_TRUE(is_error(invalid));
    EXPECT_EQ(get_error(invalid).code, "problems_file_invalid");

    JsonProblemSource no_harness(workspace.write("partial.json", R"([{"id": "1"}])"));
    auto partial = no_harness.load();
    ASSERT_TRUE(is_error(partial));
    EXPECT_EQ(get_error(partial).code, "problems_file_invalid");
}

}  // namespace
