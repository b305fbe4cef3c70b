#include "sandbox/environment.hpp"

#include <system_error>
#include <unistd.h>

extern char** environ;

namespace shellbench::sandbox {

const std::vector<std::string>& injection_variables() {
    static const std::vector<std::string> kVariables = {
        "LD_PRELOAD",    "LD_LIBRARY_PATH", "LD_AUDIT",
        "DYLD_INSERT_LIBRARIES", "DYLD_LIBRARY_PATH", "PYTHONPATH",
        "PYTHONSTARTUP", "PYTHONHOME",      "NODE_OPTIONS",
        "BASH_ENV",      "ENV"};
    return kVariables;
}

Environment capture_process_environment() {
    Environment environment;
    if (environ == nullptr) {
        return environment;
    }
    for (char** entry = environ; *entry != nullptr; ++entry) {
        const std::string pair(*entry);
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        environment[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return environment;
}

Environment make_sandbox_environment(const std::filesystem::path& root,
                                     const std::filesystem::path& cwd) {
    Environment environment = capture_process_environment();
    for (const auto& name : injection_variables()) {
        environment.erase(name);
    }

    const std::string root_text = root.string();
    environment["HOME"] = root_text;
    environment["TMPDIR"] = root_text;
    environment["TMP"] = root_text;
    environment["TEMP"] = root_text;
    environment["PWD"] = cwd.string();
    if (environment.find("PATH") == environment.end()) {
        environment["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    }
    return environment;
}

std::vector<std::string> to_envp(const Environment& environment) {
    std::vector<std::string> envp;
    envp.reserve(environment.size());
    for (const auto& [key, value] : environment) {
        envp.push_back(key + "=" + value);
    }
    return envp;
}

std::optional<std::filesystem::path> find_executable(const std::string& name,
                                                     const Environment& environment) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }

    const auto path_it = environment.find("PATH");
    if (path_it == environment.end()) {
        return std::nullopt;
    }

    const std::string& search_path = path_it->second;
    std::size_t start = 0;
    while (start <= search_path.size()) {
        const std::size_t colon = search_path.find(':', start);
        const std::size_t stop = colon == std::string::npos ? search_path.size() : colon;
        const std::string dir = search_path.substr(start, stop - start);
        if (!dir.empty()) {
            const std::filesystem::path candidate = std::filesystem::path(dir) / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) && !ec &&
                access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return std::nullopt;
}

}  // namespace shellbench::sandbox
