#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

namespace stash::testing {

// RAII temp directory, removed with its contents on destruction
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path() /
               ("stash_test_" + std::to_string(getpid()) + "_" +
                std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path.string(); }

    void write_file(const std::string& rel, const std::string& content) const {
        auto full = path / rel;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
    }

    std::string read_file(const std::string& rel) const {
        std::ifstream f(path / rel, std::ios::binary);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    bool exists(const std::string& rel) const {
        return std::filesystem::exists(path / rel);
    }
};

} // namespace stash::testing
