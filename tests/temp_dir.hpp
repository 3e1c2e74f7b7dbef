#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

// RAII temp directory for tests that build rule trees on disk.
// The path is canonical so it compares equal to resolver output.
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        namespace fs = std::filesystem;
        static std::atomic<unsigned> counter{0};
        const char* build = std::getenv("RECLINT_TEST_TMP");
        fs::path base = build ? fs::path(build) : fs::temp_directory_path();
        path = base / ("reclint_test_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
            "_" + std::to_string(counter++));
        fs::create_directories(path);
        path = fs::canonical(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    void write_file(const std::string& rel, const std::string& content) {
        std::filesystem::path full = path / rel;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
    }

    void mkdir(const std::string& rel) {
        std::filesystem::create_directories(path / rel);
    }
};
