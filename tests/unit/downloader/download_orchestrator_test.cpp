#include <gtest/gtest.h>
#include <assetsync/downloader/download_orchestrator.h>
#include "test_helpers.h"

#include <mutex>

using namespace assetsync;
using namespace assetsync::downloader;
using namespace assetsync::test;

namespace {
constexpr const char* kBase = "https://cdn.test/assets";
}

class DownloadOrchestratorTest : public AssetSyncTest {
protected:
    void SetUp() override {
        AssetSyncTest::SetUp();
        outDir = testDir / "out";
        settings.baseUrl = kBase;
        settings.retryDelay = std::chrono::milliseconds(1);
        settings.maxRetries = 3;
        settings.minResumeSize = 1024;
    }

    static std::string urlOf(const FileRecord& r) { return std::string(kBase) + "/" + r.localName(); }

    // Register a served body and a matching pending record
    FileRecord& addFile(const std::string& name, std::vector<std::byte> body) {
        FileRecord r(name, md5Of(body));
        http.serve(urlOf(r), body);
        bodies[name] = std::move(body);
        records.push_back(std::move(r));
        return records.back();
    }

    void addFiles(std::size_t n, std::size_t size) {
        records.reserve(records.size() + n);
        for (std::size_t i = 0; i < n; ++i)
            addFile("asset" + std::to_string(i) + ".bin", generateRandomBytes(size));
    }

    FileRecord* find(const std::string& name) {
        for (auto& r : records)
            if (r.filename == name)
                return &r;
        return nullptr;
    }

    std::filesystem::path outDir;
    config::DownloadSettings settings;
    FakeHttpAdapter http;
    std::vector<FileRecord> records;
    std::map<std::string, std::vector<std::byte>> bodies;
};

TEST_F(DownloadOrchestratorTest, DownloadsAndVerifiesEverything) {
    addFiles(12, 3000);
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report) << report.error().message;

    EXPECT_EQ(report.value().succeeded, 12u);
    EXPECT_EQ(report.value().failed, 0u);
    EXPECT_FALSE(report.value().wasCancelled);
    for (const auto& r : records) {
        EXPECT_EQ(r.status, DownloadStatus::Completed) << r.filename;
        EXPECT_EQ(r.hashVerifyStatus, HashVerifyStatus::VerifiedSuccess) << r.filename;
        EXPECT_EQ(r.progress, 100.0);
        EXPECT_TRUE(r.diskVerified);
        EXPECT_EQ(r.sizeBytes, 3000u);
        EXPECT_TRUE(verifyFileContent(r.pathIn(outDir), bodies[r.filename]));
        EXPECT_FALSE(std::filesystem::exists(r.pathIn(outDir).string() + ".part"));
    }
}

TEST_F(DownloadOrchestratorTest, InFlightNeverExceedsConfiguredConcurrency) {
    settings.concurrentDownloads = 4;
    http.setLatency(std::chrono::milliseconds(20));
    addFiles(40, 512);
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().succeeded, 40u);
    EXPECT_LE(http.peakConcurrent(), 4u);
    EXPECT_GE(http.peakConcurrent(), 2u);
    EXPECT_LE(report.value().peakInFlight, 4u);
    EXPECT_LE(report.value().concurrency, 4u);
}

TEST_F(DownloadOrchestratorTest, ExistingFilesAreNotFetchedAgain) {
    addFiles(100, 256);
    for (std::size_t i = 0; i < 95; ++i) {
        const auto& r = records[i];
        createTestFileWithContent(bodies[r.filename], "out/" + r.localName());
    }
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(http.getCount(), 5u);
    EXPECT_EQ(report.value().alreadyPresent, 95u);
    EXPECT_EQ(report.value().succeeded, 5u);
    for (const auto& r : records)
        EXPECT_EQ(r.status, DownloadStatus::Completed);
}

TEST_F(DownloadOrchestratorTest, EmptyFileCompletes) {
    auto& rec = addFile("empty.txt", {});
    EXPECT_EQ(rec.contentHash, TestVectors::EMPTY_MD5);
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(records[0].status, DownloadStatus::Completed);
    EXPECT_EQ(records[0].sizeBytes, 0u);
    EXPECT_EQ(std::filesystem::file_size(records[0].pathIn(outDir)), 0u);
}

TEST_F(DownloadOrchestratorTest, TransientErrorsAreRetried) {
    auto& rec = addFile("flaky.png", generateRandomBytes(1000));
    http.failNext(urlOf(rec), {ErrorCode::NetworkError, 0}, 1);
    http.failNext(urlOf(rec), {std::nullopt, 503}, 1);
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(http.getCount(), 3u);
    EXPECT_EQ(records[0].status, DownloadStatus::Completed);
}

TEST_F(DownloadOrchestratorTest, GivesUpAfterMaxRetries) {
    settings.maxRetries = 2;
    auto& rec = addFile("down.png", generateRandomBytes(100));
    http.failNext(urlOf(rec), {std::nullopt, 503}, 5);
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(http.getCount(), 3u);
    EXPECT_EQ(report.value().failed, 1u);
    EXPECT_EQ(records[0].status, DownloadStatus::Failed);
    ASSERT_TRUE(records[0].errorMessage);
    EXPECT_NE(records[0].errorMessage->find("503"), std::string::npos);
}

TEST_F(DownloadOrchestratorTest, ZeroRetriesMeansSingleAttempt) {
    settings.maxRetries = 0;
    auto& rec = addFile("once.png", generateRandomBytes(100));
    http.failNext(urlOf(rec), {std::nullopt, 503}, 1);
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(http.getCount(), 1u);
    EXPECT_EQ(records[0].status, DownloadStatus::Failed);
}

TEST_F(DownloadOrchestratorTest, LargeFileTimeoutFollowsSize) {
    settings.timeout = std::chrono::seconds(10);
    settings.stallTimeout = std::chrono::seconds(7);
    settings.enableResume = false;
    auto& rec = addFile("movie.mp4", generateRandomBytes(4096));
    rec.sizeBytes = 64ull * 1024 * 1024; // 640 s estimate
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);

    auto reqs = http.requests();
    ASSERT_FALSE(reqs.empty());
    EXPECT_EQ(reqs.front().timeout, std::chrono::seconds(640));
    EXPECT_EQ(reqs.front().stallTimeout, std::chrono::seconds(7));
}

TEST_F(DownloadOrchestratorTest, NotFoundFailsWithoutRetry) {
    records.emplace_back("missing.png", "0123456789abcdef0123456789abcdef");
    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(http.getCount(), 1u);
    EXPECT_EQ(records[0].status, DownloadStatus::Failed);
    EXPECT_FALSE(report.value().results.at("missing.png"));
    EXPECT_FALSE(std::filesystem::exists(records[0].pathIn(outDir).string() + ".part"));
}

TEST_F(DownloadOrchestratorTest, CorruptBodyIsRefetchedOnce) {
    auto body = generateRandomBytes(2048);
    auto& rec = addFile("img.png", body);
    auto corrupt = body;
    corrupt[100] ^= std::byte{0xff};
    http.serveOnceInstead(urlOf(rec), corrupt);

    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(http.getCount(), 2u);
    EXPECT_EQ(records[0].status, DownloadStatus::Completed);
    EXPECT_TRUE(verifyFileContent(records[0].pathIn(outDir), body));
}

TEST_F(DownloadOrchestratorTest, TruncatedThenGoodBodyCompletes) {
    auto body = generateRandomBytes(2048);
    auto& rec = addFile("img.png", body);
    http.serveOnceInstead(urlOf(rec), std::vector<std::byte>(body.begin(), body.begin() + 700));

    DownloadOrchestrator orch(settings, http);
    ASSERT_TRUE(orch.downloadFiles(records, outDir));
    EXPECT_EQ(records[0].status, DownloadStatus::Completed);
    EXPECT_EQ(records[0].sizeBytes, 2048u);
}

TEST_F(DownloadOrchestratorTest, RepeatedCorruptionMarksVerifyFailed) {
    auto body = generateRandomBytes(2048);
    auto& rec = addFile("img.png", body);
    auto corrupt = body;
    corrupt[0] ^= std::byte{0x01};
    http.serveOnceInstead(urlOf(rec), corrupt);
    http.serveOnceInstead(urlOf(rec), corrupt);

    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().verifyFailed, 1u);
    EXPECT_EQ(records[0].status, DownloadStatus::VerifyFailed);
    EXPECT_EQ(records[0].hashVerifyStatus, HashVerifyStatus::VerifiedFailed);
    EXPECT_FALSE(std::filesystem::exists(records[0].pathIn(outDir)));
    EXPECT_FALSE(std::filesystem::exists(records[0].pathIn(outDir).string() + ".part"));
}

TEST_F(DownloadOrchestratorTest, SkippedAndVerifyFailedRecordsAreLeftAlone) {
    addFile("a.png", generateRandomBytes(10)).markSkipped("not needed");
    addFile("b.png", generateRandomBytes(10)).status = DownloadStatus::VerifyFailed;
    addFile("c.png", generateRandomBytes(10));

    DownloadOrchestrator orch(settings, http);
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().skipped, 1u);
    EXPECT_EQ(report.value().heldVerifyFailed, 1u);
    EXPECT_EQ(report.value().succeeded, 1u);
    EXPECT_EQ(http.getCount(), 1u);
    EXPECT_EQ(records[0].status, DownloadStatus::Skipped);
    EXPECT_EQ(records[1].status, DownloadStatus::VerifyFailed);
}

TEST_F(DownloadOrchestratorTest, RedownloadReplacesOnlyVerifyFailedFiles) {
    auto body = generateRandomBytes(4000);
    auto& bad = addFile("bad.png", body);
    bad.status = DownloadStatus::VerifyFailed;
    bad.hashVerifyStatus = HashVerifyStatus::VerifiedFailed;
    createTestFileWithContent(generateRandomBytes(4000), "out/" + bad.localName());
    addFile("other.png", generateRandomBytes(10));

    DownloadOrchestrator orch(settings, http);
    auto report = orch.redownloadVerifyFailed(records, outDir);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report.value().succeeded, 1u);
    EXPECT_EQ(http.getCount(), 1u);
    EXPECT_EQ(records[0].status, DownloadStatus::Completed);
    EXPECT_EQ(records[0].hashVerifyStatus, HashVerifyStatus::VerifiedSuccess);
    EXPECT_TRUE(verifyFileContent(records[0].pathIn(outDir), body));
    EXPECT_EQ(records[1].status, DownloadStatus::Pending);
}

TEST_F(DownloadOrchestratorTest, CancelKeepsPartialAndResumeFinishesIt) {
    http.setChunkSize(1024);
    auto body = generateRandomBytes(64 * 1024);
    auto& rec = addFile("video.mp4", body);
    const auto url = urlOf(rec);

    DownloadOrchestrator orch(settings, http);
    http.onBytesDelivered(url, 4096, [&] { orch.cancel(); });
    auto first = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(first);
    EXPECT_TRUE(first.value().wasCancelled);
    EXPECT_EQ(first.value().cancelled, 1u);
    EXPECT_EQ(records[0].status, DownloadStatus::Pending);

    const auto partial = records[0].pathIn(outDir).string() + std::string(kPartialSuffix);
    ASSERT_TRUE(std::filesystem::exists(partial));
    const auto kept = std::filesystem::file_size(partial);
    EXPECT_GE(kept, 4096u);
    EXPECT_LT(kept, body.size());

    orch.resetCancel();
    auto second = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(second);
    EXPECT_EQ(records[0].status, DownloadStatus::Completed);
    EXPECT_TRUE(verifyFileContent(records[0].pathIn(outDir), body));

    bool sawResume = false;
    for (const auto& req : http.requests())
        if (req.range && req.range->offset == kept)
            sawResume = true;
    EXPECT_TRUE(sawResume);
}

TEST_F(DownloadOrchestratorTest, CancelledBeforeStartTouchesNothing) {
    addFiles(5, 100);
    DownloadOrchestrator orch(settings, http);
    orch.cancel();
    auto report = orch.downloadFiles(records, outDir);
    ASSERT_TRUE(report);
    EXPECT_TRUE(report.value().wasCancelled);
    EXPECT_EQ(http.getCount(), 0u);
    for (const auto& r : records)
        EXPECT_EQ(r.status, DownloadStatus::Pending);
}

TEST_F(DownloadOrchestratorTest, TextAssetsRequestCompression) {
    addFile("data.json", bytesOf(R"({"k": 1})"));
    addFile("image.png", generateRandomBytes(50));
    http.setContentEncodingFor(urlOf(records[0]), "gzip");

    DownloadOrchestrator orch(settings, http);
    ASSERT_TRUE(orch.downloadFiles(records, outDir));
    for (const auto& req : http.requests()) {
        if (req.url == urlOf(records[0]))
            EXPECT_TRUE(req.acceptCompressed);
        else
            EXPECT_FALSE(req.acceptCompressed);
    }
    EXPECT_EQ(records[0].status, DownloadStatus::Completed);
    EXPECT_EQ(records[1].status, DownloadStatus::Completed);
}

TEST_F(DownloadOrchestratorTest, UnwritableOutputIsPermissionDenied) {
    auto blocker = createTestFile(4, "blocker");
    addFiles(1, 10);
    DownloadOrchestrator orch(settings, http);
    EXPECT_THAT(orch.downloadFiles(records, blocker / "out"),
                HasErrorCode(ErrorCode::PermissionDenied));
    EXPECT_THAT(DownloadOrchestrator::ensureWritable(blocker),
                HasErrorCode(ErrorCode::PermissionDenied));
    EXPECT_EQ(records[0].status, DownloadStatus::Pending);
}

TEST_F(DownloadOrchestratorTest, BuildsUrlFromLocalName) {
    settings.baseUrl = "https://cdn.test/assets///";
    DownloadOrchestrator orch(settings, http);
    FileRecord r("dir/Hero.PNG", "abc");
    EXPECT_EQ(orch.buildUrl(r), "https://cdn.test/assets/Hero-abc.png");
}

TEST_F(DownloadOrchestratorTest, PublishesLifecycleEvents) {
    std::mutex m;
    std::vector<EventKind> kinds;
    EventChannel events([&](const ProgressEvent& ev) {
        std::lock_guard lock(m);
        kinds.push_back(ev.kind);
    });
    addFiles(3, 100);
    DownloadOrchestrator orch(settings, http, nullptr, &events);
    ASSERT_TRUE(orch.downloadFiles(records, outDir));
    events.flush();

    std::lock_guard lock(m);
    ASSERT_FALSE(kinds.empty());
    EXPECT_EQ(kinds.front(), EventKind::Started);
    EXPECT_EQ(kinds.back(), EventKind::Finished);
    EXPECT_EQ(std::count(kinds.begin(), kinds.end(), EventKind::FileCompleted), 3);
}
