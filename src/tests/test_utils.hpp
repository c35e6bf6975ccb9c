#ifndef BXFER_TEST_UTILS_HPP
#define BXFER_TEST_UTILS_HPP

#include <chrono>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>
#include "logger/logger.hpp"

// Console logging for test runs, warnings and above unless BXFER_TEST_LOG_LEVEL is set
inline void init_logging() {
    bxfer::logging::LogOptions options;
    const char* level = std::getenv("BXFER_TEST_LOG_LEVEL");
    options.level = level ? level : "warning";
    bxfer::logging::init_logging(options);
}

// Fresh directory below the system temp directory, removed on destruction
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix) {
        static std::mt19937_64 engine(std::random_device{}());
        path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
             "_" + std::to_string(engine()));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// Deterministic pseudo random content
inline std::vector<uint8_t> make_test_data(std::size_t size, uint32_t seed = 42) {
    std::mt19937 engine(seed);
    std::uniform_int_distribution<int> distribution(0, 255);
    std::vector<uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(distribution(engine));
    }
    return data;
}

inline void write_test_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<uint8_t> read_test_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

#endif // BXFER_TEST_UTILS_HPP
