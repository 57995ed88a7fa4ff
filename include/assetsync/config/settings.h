#pragma once

#include <assetsync/core/file_record.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace assetsync::config {

// Sampling and freshness parameters for the existence-cache tiers
struct CacheSettings {
    double sampleRatio = 0.05;
    std::size_t minSample = 10;
    double reliableThreshold = 0.95;
    double incrementalThreshold = 0.80;
    std::chrono::seconds freshness{std::chrono::hours(24)};
    std::size_t incrementalWorkers = 8;
    std::size_t incrementalBatch = 50;
    double bloomFpRate = 0.01;
};

struct LogSettings {
    std::string level = "info";
    std::string file; // empty: console only
};

struct DownloadSettings {
    std::string baseUrl = "https://assets.example.com/assets";
    std::size_t concurrentDownloads = 80;
    std::chrono::seconds timeout{180};
    // Abort a transfer that moves no bytes for this long
    std::chrono::seconds stallTimeout{60};
    std::size_t batchSize = 50;
    std::chrono::milliseconds retryDelay{300};
    int maxRetries = 5; // retries after the first attempt
    std::size_t chunkSize = 32768;

    std::uint64_t smallFileThreshold = 100000;
    std::uint64_t largeFileThreshold = 2000000;

    bool useHttp2 = true;
    std::size_t connectionLimit = 150;
    std::size_t connectionLimitPerHost = 80;

    bool enableResume = true;
    std::uint64_t minResumeSize = 2ull * 1024 * 1024;
    std::chrono::seconds resumeTimeout{60};
    std::chrono::seconds probeCacheTtl{std::chrono::hours(1)};

    bool verifyIntegrity = true;
    bool compressTextAssets = true;

    CacheSettings cache;
    LogSettings log;

    // Clamp nonsensical values to usable minimums
    void normalize();
};

// Batch size scaled by pending count, skip ratio and file-size mix
std::size_t optimalBatchSize(const DownloadSettings& s, std::size_t totalFiles,
                             std::size_t filesToDownload,
                             const std::vector<const FileRecord*>& pending = {});

// Concurrency derived from the batch size; never above concurrentDownloads
std::size_t optimalConcurrency(const DownloadSettings& s, std::size_t totalFiles,
                               std::size_t filesToDownload,
                               const std::vector<const FileRecord*>& pending = {});

std::chrono::seconds adaptiveTimeout(const DownloadSettings& s, const FileRecord& record);
std::size_t adaptiveChunkSize(const DownloadSettings& s, const FileRecord& record);
std::chrono::seconds connectTimeout(const DownloadSettings& s);

// Bounded batch size for marking already-present files complete
std::size_t completionBatchSize(std::size_t existingCount);

// Defaults overlaid with [downloader], [cache] and [log] from the config file
DownloadSettings loadSettings(const std::filesystem::path& configPath);

} // namespace assetsync::config
