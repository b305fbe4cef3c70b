#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shellbench::sandbox {

using Environment = std::map<std::string, std::string>;

// Variables that let a command inject code into tools it launches.
const std::vector<std::string>& injection_variables();

Environment capture_process_environment();

// Copy of the process environment with HOME and the temp variables pointing
// at `root`, PWD at `cwd`, and injection variables removed.
Environment make_sandbox_environment(const std::filesystem::path& root,
                                     const std::filesystem::path& cwd);

// "KEY=VALUE" strings in the layout execve expects.
std::vector<std::string> to_envp(const Environment& environment);

// Searches PATH from `environment` for an executable regular file.
std::optional<std::filesystem::path> find_executable(const std::string& name,
                                                     const Environment& environment);

}  // namespace shellbench::sandbox
