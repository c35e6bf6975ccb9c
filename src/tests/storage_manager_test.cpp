#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <iterator>
#include <thread>
#include "store/storage_manager.hpp"
#include "test_utils.hpp"

using namespace bxfer::store;

class StorageManagerTest : public ::testing::Test {
protected:
    TempDirectory dir{"storage_manager_test"};
    StorageManager storage{dir.path() / "root"};
    bxfer::crypto::ChecksumService checksum;

    // Writes data split into parts of part_size bytes
    std::vector<std::filesystem::path> write_parts(const std::vector<uint8_t>& data, std::size_t part_size) {
        std::vector<std::filesystem::path> parts;
        for (std::size_t offset = 0, index = 0; offset < data.size() || parts.empty(); offset += part_size, ++index) {
            const auto end = std::min(data.size(), offset + part_size);
            auto path = dir / ("parts/" + std::to_string(index) + ".chunk");
            write_test_file(path, std::vector<uint8_t>(data.begin() + offset, data.begin() + end));
            parts.push_back(path);
        }
        return parts;
    }
};

TEST_F(StorageManagerTest, CreatesBaseDirectory) {
    EXPECT_TRUE(std::filesystem::is_directory(dir / "root"));
}

TEST_F(StorageManagerTest, RejectsEscapingTargets) {
    EXPECT_THROW(storage.resolve_target_directory("/etc"), StoreError);
    EXPECT_THROW(storage.resolve_target_directory("../outside"), StoreError);
    EXPECT_THROW(storage.resolve_target_directory("backups/../../outside"), StoreError);

    EXPECT_EQ(storage.resolve_target_directory("backups/daily"),
              (dir.path() / "root" / "backups" / "daily").lexically_normal());
}

TEST_F(StorageManagerTest, PrepareCreatesDirectory) {
    auto directory = storage.prepare_target_directory("backups/daily");
    EXPECT_TRUE(std::filesystem::is_directory(directory));

    write_test_file(dir / "root" / "occupied", make_test_data(4));
    EXPECT_THROW(storage.prepare_target_directory("occupied"), StoreError);
}

TEST_F(StorageManagerTest, FileNameValidation) {
    EXPECT_TRUE(StorageManager::is_valid_file_name("backup.tar.gz"));
    EXPECT_FALSE(StorageManager::is_valid_file_name(""));
    EXPECT_FALSE(StorageManager::is_valid_file_name(".."));
    EXPECT_FALSE(StorageManager::is_valid_file_name("a/b"));
    EXPECT_FALSE(StorageManager::is_valid_file_name("a\\b"));
    EXPECT_FALSE(StorageManager::is_valid_file_name(std::string(256, 'a')));
}

// Free space must cover the declared size plus ten percent
TEST_F(StorageManagerTest, SpaceCheckIncludesBuffer) {
    storage.set_space_query([](const std::filesystem::path&) { return std::uintmax_t{1100}; });
    EXPECT_TRUE(storage.has_space_for(dir.path(), 1000));
    EXPECT_FALSE(storage.has_space_for(dir.path(), 1001));

    storage.set_space_query([](const std::filesystem::path& path) -> std::uintmax_t {
        throw std::filesystem::filesystem_error("space", path, std::make_error_code(std::errc::io_error));
    });
    EXPECT_FALSE(storage.has_space_for(dir.path(), 1));
}

TEST_F(StorageManagerTest, FinalizeAssemblesParts) {
    const auto data = make_test_data(10000);
    auto parts = write_parts(data, 3000);
    auto directory = storage.prepare_target_directory("backups");

    auto outcome = storage.finalize(directory, "archive.bin", parts, checksum.digest(data));
    EXPECT_EQ(outcome.final_path, directory / "archive.bin");
    EXPECT_EQ(outcome.file_digest, checksum.digest(data));
    EXPECT_EQ(read_test_file(outcome.final_path), data);
}

TEST_F(StorageManagerTest, ChecksumMismatchLeavesNothing) {
    const auto data = make_test_data(5000);
    auto parts = write_parts(data, 1000);
    auto directory = storage.prepare_target_directory("backups");

    try {
        storage.finalize(directory, "archive.bin", parts, checksum.digest(make_test_data(5000, 7)));
        FAIL() << "Expected ChecksumMismatchError";
    } catch (const ChecksumMismatchError& e) {
        EXPECT_EQ(e.actual_digest(), checksum.digest(data));
    }
    EXPECT_TRUE(std::filesystem::is_empty(directory));
}

TEST_F(StorageManagerTest, MissingPartLeavesNothing) {
    auto parts = write_parts(make_test_data(2000), 1000);
    std::filesystem::remove(parts[1]);
    auto directory = storage.prepare_target_directory("backups");

    EXPECT_THROW(storage.finalize(directory, "archive.bin", parts, std::string(64, '0')), StoreError);
    EXPECT_TRUE(std::filesystem::is_empty(directory));
}

// Existing files are never overwritten
TEST_F(StorageManagerTest, UniqueNameOnCollision) {
    const auto data = make_test_data(100);
    auto parts = write_parts(data, 100);
    auto directory = storage.prepare_target_directory("");
    const auto digest = checksum.digest(data);

    write_test_file(directory / "archive.tar.gz", make_test_data(3));

    auto first = storage.finalize(directory, "archive.tar.gz", parts, digest);
    auto second = storage.finalize(directory, "archive.tar.gz", parts, digest);
    EXPECT_EQ(first.final_path.filename(), "archive.tar_1.gz");
    EXPECT_EQ(second.final_path.filename(), "archive.tar_2.gz");
    EXPECT_EQ(read_test_file(directory / "archive.tar.gz").size(), 3u);
}

TEST_F(StorageManagerTest, ConcurrentFinalizeToSameName) {
    const auto data = make_test_data(4096);
    auto parts = write_parts(data, 1024);
    auto directory = storage.prepare_target_directory("shared");
    const auto digest = checksum.digest(data);

    std::vector<std::thread> threads;
    std::atomic<int> finished{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            storage.finalize(directory, "archive.bin", parts, digest);
            ++finished;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(finished.load(), 4);
    EXPECT_EQ(std::distance(std::filesystem::directory_iterator(directory), std::filesystem::directory_iterator()), 4);
}

TEST_F(StorageManagerTest, InvalidNameIsRejected) {
    auto parts = write_parts(make_test_data(10), 10);
    EXPECT_THROW(storage.finalize(dir.path(), "../escape", parts, std::string(64, '0')), StoreError);
}
