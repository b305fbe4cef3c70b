#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace shellbench::app::cli {

    using namespace shellbench::core::errors;
    using shellbench::protocol::EvaluateRequest;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> scenario;
            std::optional<std::string> action;
            std::optional<std::string> report;
            std::optional<std::string> timeout_sec;
            std::optional<std::string> max_commands;
            bool measure_regressions = false;
            bool verbose = false;
        };

        Result<uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                       uint32_t min_value, uint32_t max_value) {
            uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return BenchError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min_value || value > max_value) {
                return BenchError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(min_value) + " and " + std::to_string(max_value) + "."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_file(const std::string& flag, const std::string& text) {
            std::filesystem::path p(text);
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return BenchError{ErrorCategory::Input, flag + " does not exist or is not a regular file: " + text, "invalid_path"};
            }
            return p;
        }

    } // namespace

    Result<EvaluateRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BenchError{ErrorCategory::Input, "No command provided.", "missing_command",
                              "Usage: shellbench run --scenario <file> --action <file>"};
        }

        std::string command = argv[1];
        if (command != "run") {
            return BenchError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--scenario") {
                if (i + 1 < args.size()) raw.scenario = args[++i];
                else return BenchError{ErrorCategory::Input, "Missing value for --scenario", "missing_value"};
            } else if (args[i] == "--action") {
                if (i + 1 < args.size()) raw.action = args[++i];
                else return BenchError{ErrorCategory::Input, "Missing value for --action", "missing_value"};
            } else if (args[i] == "--report") {
                if (i + 1 < args.size()) raw.report = args[++i];
                else return BenchError{ErrorCategory::Input, "Missing value for --report", "missing_value"};
            } else if (args[i] == "--timeout-sec") {
                if (i + 1 < args.size()) raw.timeout_sec = args[++i];
                else return BenchError{ErrorCategory::Input, "Missing value for --timeout-sec", "missing_value"};
            } else if (args[i] == "--max-commands") {
                if (i + 1 < args.size()) raw.max_commands = args[++i];
                else return BenchError{ErrorCategory::Input, "Missing value for --max-commands", "missing_value"};
            } else if (args[i] == "--measure-regressions") {
                raw.measure_regressions = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return BenchError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        EvaluateRequest req;
        req.verbose = raw.verbose;
        req.measure_regressions = raw.measure_regressions;

        if (!raw.scenario.has_value()) {
            return BenchError{ErrorCategory::Input, "Must provide --scenario", "missing_required_flag"};
        }
        if (!raw.action.has_value()) {
            return BenchError{ErrorCategory::Input, "Must provide --action", "missing_required_flag"};
        }

        // Exception-free integer parsing
        if (raw.timeout_sec) {
            auto timeout = parse_bounded("--timeout-sec", raw.timeout_sec.value(), 1, 3600);
            if (is_error(timeout)) return get_error(timeout);
            req.timeout_sec = get_value(timeout);
        }
        if (raw.max_commands) {
            auto max_commands = parse_bounded("--max-commands", raw.max_commands.value(), 1, 1000);
            if (is_error(max_commands)) return get_error(max_commands);
            req.max_commands = get_value(max_commands);
        }

        // Path validation
        auto scenario_file = existing_file("--scenario", raw.scenario.value());
        if (is_error(scenario_file)) return get_error(scenario_file);
        req.scenario_file = get_value(scenario_file);

        auto action_file = existing_file("--action", raw.action.value());
        if (is_error(action_file)) return get_error(action_file);
        req.action_file = get_value(action_file);

        if (raw.report) {
            if (raw.report->empty()) {
                return BenchError{ErrorCategory::Input, "Report path cannot be empty", "invalid_path"};
            }
            req.report_file = std::filesystem::path(raw.report.value());
        }

        return req;
    }

} // namespace shellbench::app::cli
