#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace arena::app::cli {

    using namespace arena::core::errors;
    using arena::protocol::ContestRequest;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> problems;
            std::optional<std::string> agents;
            std::optional<std::string> response_budget_ms;
            std::optional<std::string> interpreter;
            std::optional<std::string> artifacts;
            std::optional<std::string> round_pause_ms;
            bool verbose = false;
        };

        // Exception-free integer parsing with inclusive bounds
        Result<uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                       uint32_t min_value, uint32_t max_value) {
            uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return ContestError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (value < min_value || value > max_value) {
                return ContestError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                    "Must be between " + std::to_string(min_value) + " and " + std::to_string(max_value) + "."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_file(const std::string& flag, const std::string& text) {
            std::filesystem::path p(text);
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return ContestError{ErrorCategory::Input, "File for " + flag + " does not exist: " + text, "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return ContestError{ErrorCategory::Input, "Failed to canonicalize " + flag + " path", "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<ContestRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ContestError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: arena_cli run --agents agents.json"};
        }

        std::string command = argv[1];
        if (command != "run") {
            return ContestError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* target = nullptr;
            if (args[i] == "--problems") {
                target = &raw.problems;
            } else if (args[i] == "--agents") {
                target = &raw.agents;
            } else if (args[i] == "--response-budget-ms") {
                target = &raw.response_budget_ms;
            } else if (args[i] == "--interpreter") {
                target = &raw.interpreter;
            } else if (args[i] == "--artifacts") {
                target = &raw.artifacts;
            } else if (args[i] == "--round-pause-ms") {
                target = &raw.round_pause_ms;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return ContestError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }

            if (i + 1 >= args.size()) {
                return ContestError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *target = args[++i];
        }

        // 3. Validator Phase: Enforce logic and bounds
        ContestRequest req;
        req.verbose = raw.verbose;

        if (!raw.agents.has_value()) {
            return ContestError{ErrorCategory::Input, "Must provide --agents", "missing_required_flag", "Pass a JSON array of scripted agents."};
        }
        auto agents = existing_file("--agents", raw.agents.value());
        if (is_error(agents)) {
            return get_error(agents);
        }
        req.agents_file = get_value(agents);

        if (raw.problems) {
            auto problems = existing_file("--problems", raw.problems.value());
            if (is_error(problems)) {
                return get_error(problems);
            }
            req.problems_file = get_value(problems);
        }

        if (raw.response_budget_ms) {
            auto budget = parse_bounded("--response-budget-ms", raw.response_budget_ms.value(), 1, 600000);
            if (is_error(budget)) {
                return get_error(budget);
            }
            req.response_budget_ms = get_value(budget);
        }

        if (raw.round_pause_ms) {
            auto pause = parse_bounded("--round-pause-ms", raw.round_pause_ms.value(), 0, 600000);
            if (is_error(pause)) {
                return get_error(pause);
            }
            req.round_pause_ms = get_value(pause);
        }

        if (raw.interpreter) {
            if (raw.interpreter->empty()) {
                return ContestError{ErrorCategory::Input, "--interpreter cannot be empty", "invalid_value"};
            }
            req.interpreter = raw.interpreter.value();
        }

        if (raw.artifacts) {
            std::filesystem::path p(raw.artifacts.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (!path_ec && exists && !std::filesystem::is_directory(p, path_ec)) {
                return ContestError{ErrorCategory::Input, "Artifacts path exists and is not a directory", "invalid_path"};
            }
            req.artifacts_directory = std::filesystem::absolute(p, path_ec);
            if (path_ec) {
                return ContestError{ErrorCategory::Input, "Failed to resolve artifacts directory", "invalid_path"};
            }
        }

        return req;
    }

} // namespace arena::app::cli
