// tests/test_support/TempDir.h
//
// Unique scratch directory per test case, removed on scope exit.
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace gw2util::test {

class TempDir
{
public:
    explicit TempDir(const std::string& tag)
    {
        static std::atomic<unsigned> counter{0};

        std::error_code ec;
        std::filesystem::path base = std::filesystem::temp_directory_path(ec);
        if (ec || base.empty())
            base = std::filesystem::path(".");

        const auto stamp = static_cast<long long>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());

        path_ = base / ("gw2util_tests_" + tag + "_" + std::to_string(stamp) + "_" +
                        std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_, ec);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& p, const std::string& bytes)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

inline std::string ReadFile(const std::filesystem::path& p)
{
    std::ifstream f(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

} // namespace gw2util::test
