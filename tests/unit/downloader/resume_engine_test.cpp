#include <gtest/gtest.h>
#include <assetsync/downloader/resume_engine.h>
#include "test_helpers.h"

using namespace assetsync;
using namespace assetsync::downloader;
using namespace assetsync::test;

namespace {
constexpr const char* kUrl = "https://cdn.test/assets/blob-abc.bin";
constexpr std::uint64_t kMinResume = 1024;
} // namespace

class ResumeEngineTest : public AssetSyncTest {
protected:
    void SetUp() override {
        AssetSyncTest::SetUp();
        body = generateRandomBytes(64 * 1024);
        http.serve(kUrl, body);
        partial = testDir / "blob-abc.bin.part";
    }

    void writePartial(std::size_t n) {
        createTestFileWithContent(std::vector<std::byte>(body.begin(), body.begin() + n),
                                  partial.filename().string());
    }

    FakeHttpAdapter http;
    std::vector<std::byte> body;
    std::filesystem::path partial;
    RequestOptions options;
};

TEST_F(ResumeEngineTest, DecisionRequiresUsefulPartial) {
    ResumeEngine engine(http, kMinResume);
    FileRecord rec("blob.bin", "abc");
    EXPECT_FALSE(engine.shouldResume(rec, partial).resume);

    writePartial(100);
    EXPECT_FALSE(engine.shouldResume(rec, partial).resume);

    writePartial(4096);
    EXPECT_TRUE(engine.shouldResume(rec, partial).resume);

    rec.sizeBytes = 4096;
    EXPECT_FALSE(engine.shouldResume(rec, partial).resume);
}

TEST_F(ResumeEngineTest, AppendedTailEqualsFullBody) {
    writePartial(20000);
    ResumeEngine engine(http, kMinResume);
    FileRecord rec("blob.bin", "abc");

    std::uint64_t lastReported = 0;
    auto res = engine.resumeDownload(rec, kUrl, partial, options, {},
                                     [&](std::uint64_t done, auto) { lastReported = done; });
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_TRUE(res.value());
    EXPECT_TRUE(verifyFileContent(partial, body));
    EXPECT_EQ(rec.sizeBytes, body.size());
    EXPECT_EQ(rec.downloadedBytes, body.size());
    EXPECT_EQ(lastReported, body.size());

    auto reqs = http.requests();
    ASSERT_FALSE(reqs.empty());
    ASSERT_TRUE(reqs.back().range.has_value());
    EXPECT_EQ(reqs.back().range->offset, 20000u);
    EXPECT_FALSE(reqs.back().acceptCompressed);
}

TEST_F(ResumeEngineTest, RangeNotSatisfiableMeansAlreadyComplete) {
    writePartial(body.size());
    ResumeEngine engine(http, kMinResume);
    FileRecord rec("blob.bin", "abc");
    auto res = engine.resumeDownload(rec, kUrl, partial, options, {});
    ASSERT_TRUE(res);
    EXPECT_TRUE(res.value());
    EXPECT_TRUE(verifyFileContent(partial, body));
}

TEST_F(ResumeEngineTest, UnsupportedRangeFallsBack) {
    http.setRangeSupported(false);
    writePartial(20000);
    ResumeEngine engine(http, kMinResume);
    FileRecord rec("blob.bin", "abc");
    auto res = engine.resumeDownload(rec, kUrl, partial, options, {});
    ASSERT_TRUE(res);
    EXPECT_FALSE(res.value());
    EXPECT_EQ(std::filesystem::file_size(partial), 20000u);
}

TEST_F(ResumeEngineTest, ProbeIsCachedPerHost) {
    ResumeEngine engine(http, kMinResume);
    auto first = engine.probeResumeSupport(kUrl, options);
    EXPECT_TRUE(first.supportsRange);
    EXPECT_EQ(first.contentLength, body.size());
    const auto heads = http.headCount();

    http.serve("https://cdn.test/other.bin", body);
    auto second = engine.probeResumeSupport("https://cdn.test/other.bin", options);
    EXPECT_TRUE(second.supportsRange);
    EXPECT_EQ(http.headCount(), heads);

    engine.clearProbeCache();
    engine.probeResumeSupport(kUrl, options);
    EXPECT_EQ(http.headCount(), heads + 1);
}

TEST_F(ResumeEngineTest, CancelledResumeKeepsPartial) {
    writePartial(20000);
    http.setChunkSize(1024);
    ResumeEngine engine(http, kMinResume);
    FileRecord rec("blob.bin", "abc");
    std::atomic<bool> stop{false};
    http.onBytesDelivered(kUrl, 4096, [&] { stop = true; });

    auto res = engine.resumeDownload(rec, kUrl, partial, options, [&] { return stop.load(); });
    EXPECT_THAT(res, HasErrorCode(ErrorCode::OperationCancelled));
    auto size = std::filesystem::file_size(partial);
    EXPECT_GT(size, 20000u);
    EXPECT_LT(size, body.size());
}

TEST(ResumeEngineHostKeyTest, ExtractsSchemeAndHost) {
    EXPECT_EQ(ResumeEngine::hostKey("https://a.example:8443/x/y"), "https://a.example:8443");
    EXPECT_EQ(ResumeEngine::hostKey("http://b.example"), "http://b.example");
    EXPECT_EQ(ResumeEngine::hostKey("relative/path"), "relative/path");
}
