#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include "core/config/episode_id.hpp"

namespace shellbench::testing {

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& prefix = "workspace") {
        static std::mt19937 gen{std::random_device{}()};
        root_ = std::filesystem::current_path() /
                (".tmp_" + prefix + "_" + core::config::generate_episode_id(gen));
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace shellbench::testing
