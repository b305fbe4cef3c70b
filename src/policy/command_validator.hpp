#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/episode_config.hpp"
#include "core/errors/bench_errors.hpp"
#include "protocol/command_batch.hpp"

namespace shellbench::policy {

struct CommandPolicy {
    std::set<std::string> allowed_commands = {
        // file viewing
        "cat", "head", "tail", "less", "more", "nl",
        // listing and file info
        "ls", "find", "tree", "file", "stat", "du",
        // search
        "grep", "egrep", "fgrep",
        // text transforms
        "sed", "awk", "cut", "tr", "sort", "uniq", "wc", "paste", "join", "rev",
        // file operations
        "cp", "mv", "rm", "mkdir", "rmdir", "touch", "chmod", "ln",
        // text output
        "echo", "printf", "tee",
        // comparison and patching
        "diff", "cmp", "comm", "patch",
        // archiving
        "tar", "gzip", "gunzip", "zip", "unzip",
        // checksums
        "md5sum", "sha1sum", "sha256sum",
        // navigation
        "cd", "pwd",
        // version control
        "git",
        // interpreters and test runners
        "python", "python3", "node", "pytest", "npm",
        // shell
        "bash", "sh",
        // other utilities
        "xargs", "basename", "dirname", "which", "type", "realpath", "true", "false"};

    // Tools whose quoted arguments are patterns rather than paths.
    std::set<std::string> text_processing_commands = {
        "sed", "awk", "grep", "egrep", "fgrep", "tr", "cut"};

    // Tools allowed to name absolute paths and home references.
    std::set<std::string> absolute_path_exempt = {"find", "grep", "ls", "git"};

    // Tools allowed to use `..` segments. `cd` only when it stands alone.
    std::set<std::string> parent_path_exempt = {"cd", "ls", "find"};
};

// Shell words with quotes and escapes removed. Operators come back as their
// own entries. Empty on an unterminated quote.
std::optional<std::vector<std::string>> split_shell_words(const std::string& command);

class CommandValidator {
public:
    explicit CommandValidator(
        core::config::HostPlatform host_platform = core::config::detect_host_platform(),
        std::size_t max_commands = 50, CommandPolicy command_policy = {});

    core::errors::Result<protocol::CommandBatch> parse_action(
        const nlohmann::json& action) const;

    core::errors::Result<protocol::CommandBatch> parse_action(
        const std::string& action_text) const;

    // Returns the command, trimmed and with the `sed -i` spelling adjusted to
    // the host platform.
    core::errors::Result<std::string> validate_command(
        const std::string& command) const;

    const CommandPolicy& policy() const { return command_policy_; }

private:
    std::string normalize_in_place_edit(const std::string& command) const;

    core::config::HostPlatform host_platform_;
    std::size_t max_commands_;
    CommandPolicy command_policy_;
};

}  // namespace shellbench::policy
