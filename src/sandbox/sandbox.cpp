#include "sandbox/sandbox.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "policy/command_validator.hpp"

namespace shellbench::sandbox {

namespace fs = std::filesystem;

using core::errors::BenchError;
using core::errors::ErrorCategory;
using protocol::CommandFault;
using protocol::CommandOutcome;
using protocol::ExecutionResult;

namespace {

constexpr std::size_t kTranscriptExcerpt = 500;
constexpr std::size_t kErrorExcerpt = 500;
constexpr const char* kStderrMarker = "\nSTDERR: ";

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

bool has_shell_operator(const std::string& command) {
    return command.find_first_of("|&;<>") != std::string::npos;
}

std::string format_seconds(const std::chrono::milliseconds duration) {
    if (duration.count() % 1000 == 0) {
        return std::to_string(duration.count() / 1000);
    }
    std::ostringstream out;
    out << static_cast<double>(duration.count()) / 1000.0;
    return out.str();
}

bool is_resource_signal(const int signal_number) {
    return signal_number == SIGXCPU || signal_number == SIGXFSZ;
}

// Signal behind a failed command, when the command itself was killed or the
// shell reported one of its children dying from a resource limit. A plain
// `exit 153` is an ordinary exit code.
int resource_signal_of(const ProcessCapture& capture) {
    if (capture.term_signal != 0) {
        return is_resource_signal(capture.term_signal) ? capture.term_signal : 0;
    }
    const int reported = capture.exit_code - 128;
    if (is_resource_signal(reported) &&
        capture.stderr_text.find("limit exceeded") != std::string::npos) {
        return reported;
    }
    return 0;
}

void restrict_directories(const fs::path& root, fs::path dir) {
    std::error_code ec;
    while (!dir.empty() && dir != root && policy::PolicyGuard::is_within_root(root, dir)) {
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        dir = dir.parent_path();
    }
}

// Second removal pass for trees whose directories lost their owner bits.
void force_remove_tree(const fs::path& path) {
    std::error_code ec;
    const fs::file_status status = fs::symlink_status(path, ec);
    if (ec || status.type() == fs::file_type::not_found) {
        return;
    }

    if (status.type() == fs::file_type::directory) {
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);
        std::vector<fs::path> children;
        for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
            children.push_back(it->path());
        }
        for (const auto& child : children) {
            force_remove_tree(child);
        }
    }
    fs::remove(path, ec);
}

BenchError security_fault(const BenchError& cause) {
    return BenchError{ErrorCategory::Security,
                      "Sandbox security fault: " + cause.message, cause.code,
                      "Scenario file paths must be relative and stay inside the "
                      "sandbox."};
}

}  // namespace

SandboxOptions sandbox_options_from(const core::config::EpisodeConfig& config) {
    SandboxOptions options;
    options.command_timeout = config.command_timeout;
    options.max_output_bytes = config.max_output_bytes;
    options.resource_limits = config.resource_limits;
    return options;
}

std::string combine_output(const ProcessCapture& capture, const std::size_t max_bytes) {
    std::string combined = capture.stdout_text;
    std::size_t total_bytes = capture.stdout_total_bytes;
    if (capture.stderr_total_bytes > 0) {
        combined += kStderrMarker;
        combined += capture.stderr_text;
        total_bytes += std::strlen(kStderrMarker) + capture.stderr_total_bytes;
    }

    const bool dropped = capture.stdout_text.size() < capture.stdout_total_bytes ||
                         capture.stderr_text.size() < capture.stderr_total_bytes;
    if (combined.size() > max_bytes || dropped) {
        combined.resize(std::min(combined.size(), max_bytes));
        combined += "\n... (truncated, " + std::to_string(total_bytes) + " total bytes)";
    }
    return combined;
}

core::errors::Result<std::unique_ptr<Sandbox>> Sandbox::create(
    const std::vector<protocol::ScenarioFile>& files, SandboxOptions options) {
    std::error_code ec;
    fs::path parent = options.temp_directory;
    if (parent.empty()) {
        parent = fs::temp_directory_path(ec);
        if (ec) {
            return BenchError{ErrorCategory::Internal,
                              "No usable temp directory: " + ec.message(),
                              "sandbox_create_failed"};
        }
    }

    std::string name_template = (parent / "shellbench_XXXXXX").string();
    std::vector<char> buffer(name_template.begin(), name_template.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return BenchError{ErrorCategory::Internal,
                          "Failed to create sandbox directory under " + parent.string() +
                              ": " + std::strerror(errno),
                          "sandbox_create_failed"};
    }

    fs::path root(buffer.data());
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::replace, ec);
    const fs::path canonical_root = fs::canonical(root, ec);
    if (ec) {
        fs::remove_all(root, ec);
        return BenchError{ErrorCategory::Internal,
                          "Unable to resolve sandbox directory: " + root.string(),
                          "sandbox_create_failed"};
    }
    root = canonical_root;

    // Resolve every path before writing anything.
    const policy::PolicyGuard guard;
    std::vector<fs::path> targets;
    targets.reserve(files.size());
    for (const auto& file : files) {
        const fs::path relative(file.path);
        if (file.path.empty() || relative.is_absolute()) {
            fs::remove_all(root, ec);
            return security_fault(BenchError{ErrorCategory::Security,
                                             "Scenario file path is not relative: '" +
                                                 file.path + "'",
                                             "path_outside_sandbox"});
        }
        auto resolved = guard.resolve_in_root(root, relative);
        if (core::errors::is_error(resolved)) {
            const BenchError cause = core::errors::get_error(resolved);
            fs::remove_all(root, ec);
            LOG_WARN("Sandbox: refused scenario file '" + file.path + "'");
            return security_fault(cause);
        }
        fs::path target = core::errors::get_value(resolved);
        if (target == root) {
            fs::remove_all(root, ec);
            return security_fault(BenchError{ErrorCategory::Security,
                                             "Scenario file path names the sandbox root: '" +
                                                 file.path + "'",
                                             "path_outside_sandbox"});
        }
        targets.push_back(std::move(target));
    }

    for (std::size_t i = 0; i < files.size(); ++i) {
        const fs::path& target = targets[i];
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            const std::string reason = ec.message();
            fs::remove_all(root, ec);
            return BenchError{ErrorCategory::Internal,
                              "Failed to create directory for " + files[i].path + ": " +
                                  reason,
                              "sandbox_write_failed"};
        }
        restrict_directories(root, target.parent_path());

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << files[i].content;
        out.close();
        if (!out) {
            fs::remove_all(root, ec);
            return BenchError{ErrorCategory::Internal,
                              "Failed to write scenario file: " + files[i].path,
                              "sandbox_write_failed"};
        }
        fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
    }

    fs::path original_cwd = fs::current_path(ec);
    if (ec) {
        original_cwd.clear();
    }

    LOG_INFO("Sandbox: created " + root.string() + " with " +
             std::to_string(files.size()) + " files");
    return std::make_unique<Sandbox>(ConstructionKey{}, std::move(root),
                                     std::move(original_cwd), std::move(options));
}

Sandbox::Sandbox(ConstructionKey, fs::path root, fs::path original_cwd,
                 SandboxOptions options)
    : root_(std::move(root)),
      cwd_(root_),
      original_cwd_(std::move(original_cwd)),
      options_(std::move(options)),
      limiter_(make_platform_resource_limiter(options_.resource_limits)) {}

Sandbox::~Sandbox() {
    release();
}

void Sandbox::release() {
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        LOG_WARN("Sandbox: removal of " + root_.string() + " failed (" + ec.message() +
                 "), forcing permissions");
        force_remove_tree(root_);
    }

    std::error_code exists_ec;
    if (fs::exists(fs::symlink_status(root_, exists_ec)) && !exists_ec) {
        LOG_ERROR("Sandbox: could not remove " + root_.string());
    } else {
        LOG_DEBUG("Sandbox: released " + root_.string());
    }

    if (!original_cwd_.empty()) {
        std::error_code cwd_ec;
        fs::current_path(original_cwd_, cwd_ec);
        if (cwd_ec) {
            LOG_WARN("Sandbox: could not restore working directory " +
                     original_cwd_.string());
        }
    }
}

Environment Sandbox::environment() const {
    return make_sandbox_environment(root_, cwd_);
}

ExecutionResult Sandbox::execute_commands(const std::vector<std::string>& commands) {
    ExecutionResult result;
    const auto started = std::chrono::steady_clock::now();

    for (const auto& command : commands) {
        CommandOutcome outcome = execute_command(command);

        result.transcript.push_back("$ " + command);
        if (outcome.success) {
            if (!outcome.output.empty()) {
                result.transcript.push_back(outcome.output.substr(0, kTranscriptExcerpt));
            }
        } else {
            result.all_successful = false;
            result.transcript.push_back("Error: " + outcome.error);
            LOG_WARN("Sandbox: command failed [" + protocol::to_string(outcome.fault) +
                     "]: " + command);
        }
        result.results.push_back(std::move(outcome));
    }

    result.total_time =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return result;
}

CommandOutcome Sandbox::execute_command(const std::string& raw_command) {
    const std::string command = trim(raw_command);
    if (!has_shell_operator(command)) {
        const auto split = policy::split_shell_words(command);
        const std::vector<std::string> words = split ? *split : std::vector<std::string>{};
        if (!words.empty() && words.front() == "cd") {
            return change_directory(command,
                                    std::vector<std::string>(words.begin() + 1, words.end()));
        }
        if (words.size() == 1 && words.front() == "pwd") {
            CommandOutcome outcome;
            outcome.command = command;
            outcome.success = true;
            outcome.output = cwd_.string();
            return outcome;
        }
    }
    return run_in_shell(command);
}

CommandOutcome Sandbox::change_directory(const std::string& command,
                                         const std::vector<std::string>& args) {
    CommandOutcome outcome;
    outcome.command = command;

    if (args.empty()) {
        cwd_ = root_;
        outcome.success = true;
        return outcome;
    }
    if (args.size() > 1) {
        outcome.fault = CommandFault::NavigationDenied;
        outcome.exit_code = 1;
        outcome.error = "cd: too many arguments";
        return outcome;
    }

    const std::string& target = args.front();
    auto resolved = policy_guard_.resolve_in_root(root_, target, cwd_);
    if (core::errors::is_error(resolved)) {
        outcome.fault = CommandFault::NavigationDenied;
        outcome.exit_code = 1;
        outcome.error = "cd: " + target + ": outside the sandbox";
        return outcome;
    }

    const fs::path destination = core::errors::get_value(resolved);
    std::error_code ec;
    if (!fs::is_directory(destination, ec) || ec) {
        outcome.fault = CommandFault::NavigationDenied;
        outcome.exit_code = 1;
        outcome.error = "cd: " + target + ": No such directory";
        return outcome;
    }

    cwd_ = destination;
    outcome.success = true;
    return outcome;
}

CommandOutcome Sandbox::run_in_shell(const std::string& command) {
    CommandOutcome outcome;
    outcome.command = command;

    ProcessRequest request;
    request.working_directory = cwd_;
    request.environment = environment();
    request.timeout = options_.command_timeout;
    request.max_output_bytes = options_.max_output_bytes;
    request.limiter = limiter_.get();

    auto run = run_shell(command, std::move(request));
    if (core::errors::is_error(run)) {
        const auto& err = core::errors::get_error(run);
        outcome.fault = CommandFault::SpawnFailed;
        outcome.exit_code = -1;
        outcome.error = err.message;
        return outcome;
    }

    const ProcessCapture& capture = core::errors::get_value(run);
    outcome.elapsed_seconds = capture.duration_seconds;
    outcome.exit_code = capture.exit_code;
    outcome.output = combine_output(capture, options_.max_output_bytes);

    if (capture.timed_out) {
        outcome.fault = CommandFault::Timeout;
        outcome.error = "Command timed out after " +
                        format_seconds(options_.command_timeout) + "s";
        return outcome;
    }
    if (capture.exit_code == 0) {
        outcome.success = true;
        return outcome;
    }

    const int signal_number = resource_signal_of(capture);
    if (signal_number != 0) {
        outcome.fault = CommandFault::ResourceLimitExceeded;
        outcome.error = "Resource limit exceeded (signal " +
                        std::to_string(signal_number) + ")";
        return outcome;
    }

    outcome.fault = CommandFault::NonZeroExit;
    outcome.error = "Command failed with code " + std::to_string(capture.exit_code) + ": " +
                    outcome.output.substr(0, kErrorExcerpt);
    return outcome;
}

}  // namespace shellbench::sandbox
