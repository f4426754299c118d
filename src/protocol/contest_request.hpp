#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <optional>

namespace arena::protocol {

    // Represents the validated user input required to run a contest
    struct ContestRequest {
        std::optional<std::filesystem::path> problems_file; // builtin problems when unset
        std::filesystem::path agents_file;
        std::filesystem::path artifacts_directory = std::filesystem::current_path() / ".arena_runs";
        std::string interpreter = "python3";
        uint32_t response_budget_ms = 30000;
        uint32_t round_pause_ms = 0;
        bool verbose = false;
    };

} // namespace arena::protocol
