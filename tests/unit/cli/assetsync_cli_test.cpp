#include <gtest/gtest.h>
#include <assetsync/cli/assetsync_cli.h>
#include <assetsync/state/state_store.h>
#include "test_helpers.h"

#include <string>
#include <vector>

using namespace assetsync;
using namespace assetsync::cli;
using namespace assetsync::test;

class AssetSyncCLITest : public AssetSyncTest {
protected:
    void SetUp() override {
        AssetSyncTest::SetUp();
        statePath = testDir / "state.json";
        configPath = testDir / "config.toml";
        writeText(configPath, "[log]\nlevel = \"off\"\n");
    }

    int run(std::vector<std::string> args) {
        std::vector<std::string> argv = {"assetsync", "--config", configPath.string(), "--state",
                                         statePath.string()};
        argv.insert(argv.end(), args.begin(), args.end());
        std::vector<char*> raw;
        for (auto& a : argv)
            raw.push_back(a.data());
        AssetSyncCLI cli;
        return cli.run(static_cast<int>(raw.size()), raw.data());
    }

    void seedState(std::vector<FileRecord> records) {
        state::StateStore store(statePath);
        ASSERT_TRUE(store.save(records, std::nullopt));
    }

    std::filesystem::path statePath;
    std::filesystem::path configPath;
};

TEST_F(AssetSyncCLITest, StatusOnEmptyStateSucceeds) {
    EXPECT_EQ(run({"status"}), 0);
    EXPECT_EQ(run({"status", "--format", "json", "--filter", "failed"}), 0);
}

TEST_F(AssetSyncCLITest, StatusRejectsUnknownFilter) {
    EXPECT_NE(run({"status", "--filter", "bogus"}), 0);
}

TEST_F(AssetSyncCLITest, SubcommandIsRequired) {
    EXPECT_NE(run({}), 0);
}

TEST_F(AssetSyncCLITest, SyncRequiresExistingManifest) {
    EXPECT_NE(run({"sync", "--manifest", (testDir / "missing.json").string()}), 0);
}

TEST_F(AssetSyncCLITest, SyncWithoutOutputDirFails) {
    auto manifest = testDir / "manifest.json";
    writeText(manifest, R"({"a.png": "900150983cd24fb0d6963f7d28e17f72"})");
    EXPECT_EQ(run({"sync", "--manifest", manifest.string()}), 1);
    // The merged manifest is still saved
    state::StateStore store(statePath);
    auto snap = store.load();
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap.value().records.size(), 1u);
}

TEST_F(AssetSyncCLITest, VerifyReportsMismatchAsFailure) {
    auto out = testDir / "out";
    FileRecord good("good.txt", std::string(TestVectors::ABC_MD5));
    FileRecord bad("bad.txt", std::string(TestVectors::ABC_MD5));
    createTestFileWithContent(bytesOf("abc"), "out/" + good.localName());
    createTestFileWithContent(bytesOf("abd"), "out/" + bad.localName());
    good.markCompleted(good.pathIn(out));
    bad.markCompleted(bad.pathIn(out));
    seedState({good, bad});

    EXPECT_EQ(run({"verify", "--out", out.string()}), 1);

    state::StateStore store(statePath);
    auto snap = store.load();
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap.value().records[0].hashVerifyStatus, HashVerifyStatus::VerifiedSuccess);
    EXPECT_EQ(snap.value().records[1].status, DownloadStatus::VerifyFailed);
}

TEST_F(AssetSyncCLITest, ClearDeletesStateFile) {
    seedState({FileRecord("a.png", "abc")});
    ASSERT_TRUE(std::filesystem::exists(statePath));
    EXPECT_EQ(run({"clear"}), 0);
    EXPECT_FALSE(std::filesystem::exists(statePath));
}
