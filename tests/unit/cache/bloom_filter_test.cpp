#include <gtest/gtest.h>
#include <assetsync/cache/bloom_filter.h>
#include "test_helpers.h"

#include <cmath>

using namespace assetsync;
using namespace assetsync::cache;
using namespace assetsync::test;

TEST(BloomFilterTest, SizingFollowsFormula) {
    BloomFilter f(1000, 0.01);
    const double m = -1000.0 * std::log(0.01) / (std::log(2.0) * std::log(2.0));
    EXPECT_NEAR(static_cast<double>(f.bitCount()), m, 64.0);
    EXPECT_EQ(f.hashFunctions(), 7u);
}

TEST(BloomFilterTest, NoFalseNegatives) {
    BloomFilter f(5000, 0.01);
    for (int i = 0; i < 5000; ++i)
        f.add("asset-" + std::to_string(i) + ".png");
    for (int i = 0; i < 5000; ++i)
        EXPECT_TRUE(f.mightContain("asset-" + std::to_string(i) + ".png")) << i;
    EXPECT_EQ(f.size(), 5000u);
}

TEST(BloomFilterTest, FalsePositiveRateNearTarget) {
    BloomFilter f(10000, 0.01);
    for (int i = 0; i < 10000; ++i)
        f.add("present-" + std::to_string(i));

    int falsePositives = 0;
    constexpr int kProbes = 20000;
    for (int i = 0; i < kProbes; ++i) {
        if (f.mightContain("absent-" + std::to_string(i)))
            ++falsePositives;
    }
    const double rate = static_cast<double>(falsePositives) / kProbes;
    EXPECT_LE(rate, 0.02);
    EXPECT_NEAR(f.estimatedFalsePositiveRate(), 0.01, 0.005);
}

TEST(BloomFilterTest, ClearEmpties) {
    BloomFilter f(100, 0.01);
    f.add("x");
    f.clear();
    EXPECT_EQ(f.size(), 0u);
    EXPECT_FALSE(f.mightContain("x"));
}

TEST(BloomFilterTest, EnsureCapacityGrowsOnly) {
    BloomFilter f(100, 0.01);
    const auto bits = f.bitCount();
    f.ensureCapacity(10);
    EXPECT_EQ(f.bitCount(), bits);
    f.ensureCapacity(100000);
    EXPECT_GT(f.bitCount(), bits);
    EXPECT_EQ(f.expectedItems(), 100000u);
}

TEST(FileBloomFilterTest, BuildsOnlyFromVerifiedCompletedRecords) {
    std::vector<FileRecord> recs;
    recs.emplace_back("done.png", "a");
    recs.back().status = DownloadStatus::Completed;
    recs.back().diskVerified = true;
    recs.emplace_back("unverified.png", "b");
    recs.back().status = DownloadStatus::Completed;
    recs.emplace_back("pending.png", "c");

    FileBloomFilter bloom(100, 0.01);
    EXPECT_FALSE(bloom.isValid());
    auto info = bloom.buildFromCompleted(recs);
    EXPECT_EQ(info.completedFiles, 1u);
    EXPECT_TRUE(bloom.isValid());
    EXPECT_TRUE(bloom.mightContain(recs[0]));
}

TEST(FileBloomFilterTest, PreFilterSplitsWithoutLosingRecords) {
    std::vector<FileRecord> recs;
    for (int i = 0; i < 200; ++i) {
        recs.emplace_back("f" + std::to_string(i) + ".bin", "h");
        if (i < 100) {
            recs.back().status = DownloadStatus::Completed;
            recs.back().diskVerified = true;
        }
    }
    FileBloomFilter bloom(200, 0.01);
    bloom.buildFromCompleted(recs);

    std::vector<FileRecord*> all;
    for (auto& r : recs)
        all.push_back(&r);
    auto pre = bloom.fastPreFilter(all);
    EXPECT_EQ(pre.likelyExisting.size() + pre.definitelyNew.size(), 200u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_NE(std::find(pre.likelyExisting.begin(), pre.likelyExisting.end(), &recs[i]),
                  pre.likelyExisting.end());
    }
    EXPECT_GE(pre.definitelyNew.size(), 90u);
}
