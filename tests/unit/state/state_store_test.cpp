#include <gtest/gtest.h>
#include <assetsync/state/state_store.h>
#include "test_helpers.h"

#include <nlohmann/json.hpp>

using namespace assetsync;
using namespace assetsync::state;
using namespace assetsync::test;

class StateStoreTest : public AssetSyncTest {
protected:
    std::filesystem::path statePath() const { return testDir / "state" / "state.json"; }

    std::vector<FileRecord> sampleRecords() {
        std::vector<FileRecord> recs;
        recs.emplace_back("a.png", "aaa");
        recs.back().status = DownloadStatus::Completed;
        recs.back().progress = 100.0;
        recs.back().sizeBytes = 1024;
        recs.back().downloadedBytes = 1024;
        recs.back().diskVerified = true;
        recs.back().mtime = 123456789;
        recs.back().hashVerifyStatus = HashVerifyStatus::VerifiedSuccess;
        recs.back().calculatedHash = "aaa";
        recs.emplace_back("b.json", "bbb");
        recs.back().status = DownloadStatus::Failed;
        recs.back().errorMessage = "HTTP 404";
        recs.emplace_back("c.txt", "ccc");
        return recs;
    }
};

TEST_F(StateStoreTest, MissingFileGivesEmptySnapshot) {
    StateStore store(statePath());
    auto snap = store.load();
    ASSERT_TRUE(snap);
    EXPECT_TRUE(snap.value().records.empty());
    EXPECT_FALSE(snap.value().outputDir.has_value());
}

TEST_F(StateStoreTest, SaveThenLoadPreservesRecords) {
    StateStore store(statePath());
    auto recs = sampleRecords();
    ASSERT_TRUE(store.save(recs, testDir / "out"));
    EXPECT_FALSE(std::filesystem::exists(statePath().string() + ".tmp"));

    auto snap = store.load();
    ASSERT_TRUE(snap) << snap.error().message;
    const auto& loaded = snap.value();
    ASSERT_EQ(loaded.records.size(), 3u);
    EXPECT_EQ(loaded.outputDir, (testDir / "out").string());
    EXPECT_TRUE(loaded.lastFullScan.has_value());

    const auto& a = loaded.records[0];
    EXPECT_EQ(a.filename, "a.png");
    EXPECT_EQ(a.status, DownloadStatus::Completed);
    EXPECT_EQ(a.sizeBytes, 1024u);
    EXPECT_EQ(a.mtime, 123456789);
    EXPECT_TRUE(a.diskVerified);
    EXPECT_EQ(a.hashVerifyStatus, HashVerifyStatus::VerifiedSuccess);
    EXPECT_EQ(loaded.records[1].errorMessage, "HTTP 404");
    EXPECT_EQ(loaded.records[2].status, DownloadStatus::Pending);
}

TEST_F(StateStoreTest, WritesDocumentedTags) {
    StateStore store(statePath());
    ASSERT_TRUE(store.save(sampleRecords(), std::nullopt));
    auto doc = nlohmann::json::parse(std::ifstream(statePath()));
    EXPECT_EQ(doc["metadataVersion"], "2.0");
    EXPECT_EQ(doc["totalFiles"], 3);
    EXPECT_TRUE(doc["outputDir"].is_null());
    EXPECT_EQ(doc["files"][0]["status"], "completed");
    EXPECT_EQ(doc["files"][0]["hashVerifyStatus"], "verified_success");
    EXPECT_EQ(doc["files"][1]["status"], "failed");
}

TEST_F(StateStoreTest, InterruptedDownloadsLoadAsPending) {
    StateStore store(statePath());
    std::vector<FileRecord> recs;
    recs.emplace_back("x.bin", "h");
    recs.back().status = DownloadStatus::Downloading;
    recs.back().hashVerifyStatus = HashVerifyStatus::Verifying;
    ASSERT_TRUE(store.save(recs, std::nullopt));

    auto snap = store.load();
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap.value().records[0].status, DownloadStatus::Pending);
    EXPECT_EQ(snap.value().records[0].hashVerifyStatus, HashVerifyStatus::NotVerified);
}

TEST_F(StateStoreTest, AcceptsLegacyKeys) {
    std::filesystem::create_directories(statePath().parent_path());
    writeText(statePath(), R"({
        "output_dir": "/data/assets",
        "files": [
            {"filename": "old.png", "md5": "abc", "status": "completed",
             "size": 77, "downloaded_size": 77, "local_path": "/data/assets/old-abc.png"}
        ]
    })");
    StateStore store(statePath());
    auto snap = store.load();
    ASSERT_TRUE(snap) << snap.error().message;
    EXPECT_EQ(snap.value().outputDir, "/data/assets");
    const auto& r = snap.value().records.at(0);
    EXPECT_EQ(r.contentHash, "abc");
    EXPECT_EQ(r.sizeBytes, 77u);
    EXPECT_EQ(r.downloadedBytes, 77u);
    EXPECT_EQ(r.localPath, "/data/assets/old-abc.png");
}

TEST_F(StateStoreTest, MalformedFileIsParseError) {
    std::filesystem::create_directories(statePath().parent_path());
    writeText(statePath(), "{\"files\": [");
    StateStore store(statePath());
    EXPECT_THAT(store.load(), HasErrorCode(ErrorCode::ParseError));
}

TEST_F(StateStoreTest, LoadListenerSeesRecords) {
    StateStore store(statePath());
    ASSERT_TRUE(store.save(sampleRecords(), std::nullopt));
    std::size_t seen = 0;
    store.setLoadListener([&](const std::vector<FileRecord>& r) { seen = r.size(); });
    ASSERT_TRUE(store.load());
    EXPECT_EQ(seen, 3u);
}

TEST_F(StateStoreTest, ClearRemovesFile) {
    StateStore store(statePath());
    ASSERT_TRUE(store.save(sampleRecords(), std::nullopt));
    ASSERT_TRUE(store.clear());
    EXPECT_FALSE(std::filesystem::exists(statePath()));
    EXPECT_TRUE(store.clear());
}

TEST_F(StateStoreTest, CancelledSaveLeavesPreviousState) {
    StateStore store(statePath());
    ASSERT_TRUE(store.save(sampleRecords(), std::nullopt));

    std::vector<FileRecord> many;
    for (int i = 0; i < 5000; ++i)
        many.emplace_back("f" + std::to_string(i), "h");
    auto r = store.save(many, std::nullopt, [] { return true; });
    EXPECT_THAT(r, HasErrorCode(ErrorCode::OperationCancelled));

    auto snap = store.load();
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap.value().records.size(), 3u);
}

TEST_F(StateStoreTest, StatisticsAndTotals) {
    auto recs = sampleRecords();
    auto c = StateStore::getStatistics(recs);
    EXPECT_EQ(c.total, 3u);
    EXPECT_EQ(c.completed, 1u);
    EXPECT_EQ(c.failed, 1u);
    EXPECT_EQ(c.pending, 1u);
    EXPECT_EQ(c.hashVerified, 1u);

    auto t = StateStore::getTotalSize(recs);
    EXPECT_EQ(t.total, 1024u);
    EXPECT_EQ(t.downloaded, 1024u);
}

TEST_F(StateStoreTest, FilterByStatusAndText) {
    auto recs = sampleRecords();
    EXPECT_EQ(StateStore::filterRecords(recs).size(), 3u);
    EXPECT_EQ(StateStore::filterRecords(recs, DownloadStatus::Failed).size(), 1u);

    auto byName = StateStore::filterRecords(recs, std::nullopt, "A.PNG");
    ASSERT_EQ(byName.size(), 1u);
    EXPECT_EQ(byName[0]->filename, "a.png");

    EXPECT_EQ(StateStore::filterRecords(recs, std::nullopt, "ccc").size(), 1u);
    EXPECT_TRUE(StateStore::filterRecords(recs, DownloadStatus::Completed, "ccc").empty());
}

TEST_F(StateStoreTest, FormatSize) {
    EXPECT_EQ(StateStore::formatSize(0), "0 B");
    EXPECT_EQ(StateStore::formatSize(512), "512.00 B");
    EXPECT_EQ(StateStore::formatSize(1536), "1.50 KB");
    EXPECT_EQ(StateStore::formatSize(5ull * 1024 * 1024 * 1024), "5.00 GB");
}

TEST_F(StateStoreTest, ReliabilityRecommendsFullScanWithoutVerifiedRecords) {
    auto rel = StateStore::analyzeCacheReliability(std::vector<FileRecord>{}, testDir);
    EXPECT_EQ(rel.recommendation, CacheRecommendation::FullScan);
    EXPECT_EQ(rel.sampled, 0u);
}

TEST_F(StateStoreTest, ReliabilityTrustsIntactFiles) {
    std::vector<FileRecord> recs;
    for (int i = 0; i < 20; ++i) {
        FileRecord r("f" + std::to_string(i) + ".bin", "h");
        auto path = createTestFile(32, r.localName());
        r.markCompleted(path);
        recs.push_back(std::move(r));
    }
    auto rel = StateStore::analyzeCacheReliability(recs, testDir);
    EXPECT_EQ(rel.sampled, 10u);
    EXPECT_DOUBLE_EQ(rel.score, 1.0);
    EXPECT_EQ(rel.recommendation, CacheRecommendation::CacheReliable);
}

TEST_F(StateStoreTest, ReliabilityDropsWhenFilesVanish) {
    std::vector<FileRecord> recs;
    for (int i = 0; i < 10; ++i) {
        FileRecord r("f" + std::to_string(i) + ".bin", "h");
        auto path = createTestFile(32, r.localName());
        r.markCompleted(path);
        if (i < 5)
            std::filesystem::remove(path);
        recs.push_back(std::move(r));
    }
    auto rel = StateStore::analyzeCacheReliability(recs, testDir);
    EXPECT_EQ(rel.sampled, 10u);
    EXPECT_DOUBLE_EQ(rel.score, 0.5);
    EXPECT_EQ(rel.recommendation, CacheRecommendation::FullScan);
}
