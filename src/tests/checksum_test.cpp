#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include "crypto/checksum.hpp"
#include "test_utils.hpp"

using namespace bxfer::crypto;

class ChecksumTest : public ::testing::Test {
protected:
    ChecksumService checksum;

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    static std::string upper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }
};

// Known SHA-256 vectors
TEST_F(ChecksumTest, KnownDigests) {
    EXPECT_EQ(checksum.digest(bytes("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(checksum.digest(bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(checksum.digest(bytes("abc")).size(), ChecksumService::DIGEST_HEX_LENGTH);
}

TEST_F(ChecksumTest, VerifyAcceptsUppercaseAndRejectsMismatch) {
    const auto data = make_test_data(4096);
    const auto digest = checksum.digest(data);

    EXPECT_TRUE(checksum.verify(data, digest));
    EXPECT_TRUE(checksum.verify(data, upper(digest)));

    auto tampered = data;
    tampered[100] ^= 0x01;
    EXPECT_FALSE(checksum.verify(tampered, digest));
    EXPECT_FALSE(checksum.verify(data, ""));
    EXPECT_FALSE(checksum.verify(data, digest.substr(0, 63)));
}

TEST_F(ChecksumTest, DigestsEqual) {
    const std::string digest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    EXPECT_TRUE(ChecksumService::digests_equal(digest, upper(digest)));
    EXPECT_FALSE(ChecksumService::digests_equal(digest, std::string(64, '0')));
    EXPECT_FALSE(ChecksumService::digests_equal("", ""));
}

// Incremental and streaming digests agree with the one-shot digest
TEST_F(ChecksumTest, StreamingMatchesOneShot) {
    TempDirectory dir("checksum_test");
    const auto data = make_test_data(300 * 1024 + 17);
    const auto path = dir / "data.bin";
    write_test_file(path, data);

    const auto expected = checksum.digest(data);
    EXPECT_EQ(checksum.digest_file(path), expected);
    EXPECT_TRUE(checksum.verify_file(path, expected));

    DigestContext context;
    context.update(data.data(), 1000);
    context.update(data.data() + 1000, data.size() - 1000);
    EXPECT_EQ(context.final_hex(), expected);
}

TEST_F(ChecksumTest, MissingFile) {
    TempDirectory dir("checksum_test");
    EXPECT_THROW(checksum.digest_file(dir / "missing.bin"), DigestError);
}
