#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>
#include "transfer/file_chunker.hpp"
#include "test_utils.hpp"

using namespace bxfer::transfer;

TEST(FileChunkerPlanTest, EvenSplit) {
    auto chunks = FileChunker::plan(10 * 1024 * 1024, 1024 * 1024);
    ASSERT_EQ(chunks.size(), 10u);
    for (uint32_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].offset, static_cast<uint64_t>(i) * 1024 * 1024);
        EXPECT_EQ(chunks[i].size, 1024u * 1024u);
    }
}

TEST(FileChunkerPlanTest, ShortLastChunk) {
    auto chunks = FileChunker::plan(2500, 1000);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].offset, 2000u);
    EXPECT_EQ(chunks[2].size, 500u);

    const auto total = std::accumulate(chunks.begin(), chunks.end(), uint64_t{0},
                                       [](uint64_t sum, const ChunkDescriptor& c) { return sum + c.size; });
    EXPECT_EQ(total, 2500u);
}

TEST(FileChunkerPlanTest, EmptyFileHasOneEmptyChunk) {
    auto chunks = FileChunker::plan(0, 1000);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].size, 0u);
}

class FileChunkerTest : public ::testing::Test {
protected:
    TempDirectory dir{"file_chunker_test"};
    bxfer::crypto::ChecksumService checksum;
};

TEST_F(FileChunkerTest, ReadsChunksWithChecksums) {
    const auto data = make_test_data(2500);
    const auto path = dir / "source.bin";
    write_test_file(path, data);

    FileChunker chunker(path, 1000);
    EXPECT_EQ(chunker.file_size(), 2500u);
    EXPECT_EQ(chunker.chunk_count(), 3u);

    // Out of order reads are fine
    auto last = chunker.read_chunk(2, checksum);
    auto first = chunker.read_chunk(0, checksum);

    EXPECT_EQ(first.index, 0u);
    EXPECT_EQ(first.size, 1000u);
    EXPECT_EQ(first.payload, std::vector<uint8_t>(data.begin(), data.begin() + 1000));
    EXPECT_EQ(first.checksum, checksum.digest(first.payload));

    EXPECT_EQ(last.size, 500u);
    EXPECT_EQ(last.payload, std::vector<uint8_t>(data.begin() + 2000, data.end()));

    EXPECT_THROW(chunker.read_chunk(3, checksum), std::out_of_range);
}

TEST_F(FileChunkerTest, EmptyFile) {
    const auto path = dir / "empty.bin";
    write_test_file(path, {});

    FileChunker chunker(path, 1000);
    ASSERT_EQ(chunker.chunk_count(), 1u);
    auto chunk = chunker.read_chunk(0, checksum);
    EXPECT_TRUE(chunk.payload.empty());
    EXPECT_EQ(chunk.checksum, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(FileChunkerTest, InvalidArguments) {
    const auto path = dir / "source.bin";
    write_test_file(path, make_test_data(10));

    EXPECT_THROW(FileChunker(path, 0), std::invalid_argument);
    EXPECT_THROW(FileChunker(dir / "missing.bin", 1000), std::runtime_error);
}
