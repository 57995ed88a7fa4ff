#include <gtest/gtest.h>
#include <assetsync/integrity/content_hasher.h>
#include "test_helpers.h"

using namespace assetsync;
using namespace assetsync::integrity;
using namespace assetsync::test;

class ContentHasherTest : public AssetSyncTest {};

TEST_F(ContentHasherTest, KnownVectors) {
    EXPECT_EQ(ContentHasher::hash(HashAlgorithm::Md5, {}), TestVectors::EMPTY_MD5);
    EXPECT_EQ(ContentHasher::hash(HashAlgorithm::Md5, bytesOf("abc")), TestVectors::ABC_MD5);
    EXPECT_EQ(ContentHasher::hash(HashAlgorithm::Sha256, {}), TestVectors::EMPTY_SHA256);
    EXPECT_EQ(ContentHasher::hash(HashAlgorithm::Sha256, bytesOf("abc")), TestVectors::ABC_SHA256);
}

TEST_F(ContentHasherTest, StreamingMatchesOneShot) {
    auto data = generateRandomBytes(100000);
    ContentHasher hasher(HashAlgorithm::Sha256);
    std::span<const std::byte> all(data);
    hasher.update(all.subspan(0, 12345));
    hasher.update(all.subspan(12345));
    EXPECT_EQ(hasher.finalize(), ContentHasher::hash(HashAlgorithm::Sha256, data));

    // reusable after finalize
    hasher.update(bytesOf("abc"));
    EXPECT_EQ(hasher.finalize(), TestVectors::ABC_SHA256);
}

TEST_F(ContentHasherTest, HashFileReportsProgress) {
    auto data = generateRandomBytes(300 * 1024);
    auto path = createTestFileWithContent(data, "blob.bin");
    ContentHasher hasher;
    std::uint64_t last = 0, total = 0;
    hasher.setProgressCallback([&](std::uint64_t done, std::uint64_t size) {
        last = done;
        total = size;
    });
    auto digest = hasher.hashFile(path);
    ASSERT_TRUE(digest) << digest.error().message;
    EXPECT_EQ(digest.value(), md5Of(data));
    EXPECT_EQ(last, data.size());
    EXPECT_EQ(total, data.size());
}

TEST_F(ContentHasherTest, HashFileErrors) {
    ContentHasher hasher;
    EXPECT_THAT(hasher.hashFile(testDir / "absent"), HasErrorCode(ErrorCode::FileNotFound));

    auto path = createTestFile(1024 * 1024, "big.bin");
    EXPECT_THAT(hasher.hashFile(path, [] { return true; }),
                HasErrorCode(ErrorCode::OperationCancelled));
}

TEST_F(ContentHasherTest, AlgorithmFollowsDigestLength) {
    EXPECT_EQ(detectAlgorithm(std::string(32, 'a')), HashAlgorithm::Md5);
    EXPECT_EQ(detectAlgorithm(std::string(40, 'b')), HashAlgorithm::Sha1);
    EXPECT_EQ(detectAlgorithm(std::string(64, 'C')), HashAlgorithm::Sha256);
    EXPECT_EQ(detectAlgorithm(std::string(128, '0')), HashAlgorithm::Sha512);
    EXPECT_FALSE(detectAlgorithm("abc").has_value());
    EXPECT_FALSE(detectAlgorithm(std::string(32, 'z')).has_value());
}

TEST_F(ContentHasherTest, HashFileForPicksAlgorithm) {
    auto path = createTestFileWithContent(bytesOf("abc"), "abc.txt");
    auto md5 = ContentHasher::hashFileFor(path, TestVectors::ABC_MD5);
    ASSERT_TRUE(md5);
    EXPECT_EQ(md5.value(), TestVectors::ABC_MD5);
    auto sha = ContentHasher::hashFileFor(path, TestVectors::ABC_SHA256);
    ASSERT_TRUE(sha);
    EXPECT_EQ(sha.value(), TestVectors::ABC_SHA256);
    EXPECT_THAT(ContentHasher::hashFileFor(path, "short"), HasErrorCode(ErrorCode::InvalidArgument));
}

TEST_F(ContentHasherTest, DigestComparisonIgnoresCase) {
    EXPECT_TRUE(digestsEqual("ABCdef", "abcDEF"));
    EXPECT_FALSE(digestsEqual("abc", "abd"));
    EXPECT_FALSE(digestsEqual("abc", "abcd"));
}
