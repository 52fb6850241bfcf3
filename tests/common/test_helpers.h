#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <random>
#include <string>
#include <system_error>
#include <thread>

#include <unistd.h>

namespace omnifetch::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "omnifetch_test_") {
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(rd()));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

/**
 * Temporary directory removed on scope exit.
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "omnifetch_test_") : path_(make_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << data;
    return p;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

/**
 * Deterministic pseudo-random payload.
 */
inline std::string make_payload(std::size_t size, std::uint32_t seed = 42) {
    std::mt19937 gen(seed);
    std::string out(size, '\0');
    for (auto& c : out) {
        c = static_cast<char>(gen() & 0xFF);
    }
    return out;
}

/**
 * Poll `pred` every few milliseconds until it holds or `timeout` elapses.
 */
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace omnifetch::tests
