#include "verifier/verifier.hpp"

#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <system_error>

namespace shellbench::verifier {

namespace fs = std::filesystem;

using protocol::BaselineDiffResult;

namespace {

constexpr fs::perms kMaterializedMode = fs::perms::owner_read | fs::perms::owner_write;

bool read_file(const fs::path& path, std::string& content) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
    return !in.bad();
}

}  // namespace

std::optional<protocol::VerifierResult> BaselineDiffVerifier::verify(
    const VerifierContext& context) const {
    BaselineDiffResult result;

    std::map<std::string, const protocol::ScenarioFile*> baseline_files;
    std::set<std::string> baseline_directories;
    for (const auto& file : context.scenario.files) {
        const fs::path relative = fs::path(file.path).lexically_normal();
        baseline_files[relative.generic_string()] = &file;
        for (fs::path dir = relative.parent_path(); !dir.empty(); dir = dir.parent_path()) {
            baseline_directories.insert(dir.generic_string());
        }
    }

    std::set<std::string> live_files;
    std::set<std::string> live_directories;
    std::error_code ec;
    fs::recursive_directory_iterator it(
        context.root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        result.error = "Unable to walk sandbox: " + ec.message();
        return result;
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            result.error = "Unable to walk sandbox: " + ec.message();
            break;
        }
        const std::string relative =
            it->path().lexically_relative(context.root).generic_string();
        std::error_code status_ec;
        const fs::file_status status = it->symlink_status(status_ec);
        if (fs::is_directory(status)) {
            live_directories.insert(relative);
            if (it->path().filename() == ".git") {
                it.disable_recursion_pending();
            }
        } else {
            live_files.insert(relative);
        }
    }

    for (const auto& [path, file] : baseline_files) {
        if (live_files.count(path) == 0) {
            result.deleted_files.push_back(path);
            continue;
        }
        const fs::path live_path = context.root / path;
        std::string content;
        std::error_code status_ec;
        const fs::file_status status = fs::symlink_status(live_path, status_ec);
        const bool mode_changed =
            status_ec || (status.permissions() & fs::perms::mask) != kMaterializedMode;
        if (mode_changed || !fs::is_regular_file(status) || !read_file(live_path, content) ||
            content != file->content) {
            result.modified_files.push_back(path);
        }
    }
    for (const auto& path : live_files) {
        if (baseline_files.count(path) == 0) {
            result.created_files.push_back(path);
        }
    }
    for (const auto& dir : live_directories) {
        if (baseline_directories.count(dir) == 0) {
            result.created_directories.push_back(dir);
        }
    }
    for (const auto& dir : baseline_directories) {
        if (live_directories.count(dir) == 0) {
            result.deleted_directories.push_back(dir);
        }
    }

    result.success = !result.created_files.empty() || !result.modified_files.empty() ||
                     !result.deleted_files.empty() ||
                     !result.created_directories.empty() ||
                     !result.deleted_directories.empty();
    return result;
}

}  // namespace shellbench::verifier
