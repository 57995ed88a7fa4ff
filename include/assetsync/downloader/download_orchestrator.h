#pragma once

#include <assetsync/cache/bloom_filter.h>
#include <assetsync/cache/existence_checker.h>
#include <assetsync/config/settings.h>
#include <assetsync/core/event_channel.h>
#include <assetsync/core/file_record.h>
#include <assetsync/core/types.h>
#include <assetsync/downloader/http_adapter.h>
#include <assetsync/downloader/resume_engine.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace assetsync::downloader {

inline constexpr std::string_view kPartialSuffix = ".part";

struct DownloadReport {
    std::map<std::string, bool> results;
    std::size_t succeeded = 0;      // downloaded in this run
    std::size_t alreadyPresent = 0; // found on disk and marked complete
    std::size_t failed = 0;
    std::size_t verifyFailed = 0;   // second integrity failure in this run
    std::size_t skipped = 0;        // explicitly skipped records, left alone
    std::size_t heldVerifyFailed = 0; // awaiting an explicit redownload, left alone
    std::size_t cancelled = 0;      // in flight when cancel arrived, reverted to pending
    bool wasCancelled = false;
    std::size_t peakInFlight = 0;
    std::size_t concurrency = 0;
    std::size_t batchSize = 0;
    cache::ExistenceTier tier = cache::ExistenceTier::FullScan;
};

/**
 * @brief Runs a whole download session over the record list.
 *
 * Existing files are detected through the existence tiers and marked complete; the rest
 * are fetched in sequential batches on a worker pool whose size is the hard bound on
 * in-flight transfers. Each transfer lands in "<localName>.part" and is renamed into place
 * only after its size and hash check out. Per-file failures never abort the run.
 *
 * The record vector must not be touched by anyone else while a run is in progress.
 */
class DownloadOrchestrator {
public:
    DownloadOrchestrator(config::DownloadSettings settings, IHttpAdapter& http,
                         const cache::FileBloomFilter* bloom = nullptr,
                         EventChannel* events = nullptr);

    // PermissionDenied when outputDir cannot be created or written
    Result<DownloadReport> downloadFiles(std::vector<FileRecord>& records,
                                         const std::filesystem::path& outputDir);

    // Delete the files of VERIFY_FAILED records, requeue them and download only those
    Result<DownloadReport> redownloadVerifyFailed(std::vector<FileRecord>& records,
                                                  const std::filesystem::path& outputDir);

    void cancel() { cancelled_ = true; }
    void resetCancel() { cancelled_ = false; }
    bool isCancelled() const { return cancelled_.load(); }
    bool isDownloading() const { return running_.load(); }

    std::size_t inFlight() const { return inFlight_.load(); }
    std::size_t peakInFlight() const { return peakInFlight_.load(); }

    std::string buildUrl(const FileRecord& record) const;

    static Result<void> ensureWritable(const std::filesystem::path& dir);

private:
    enum class Outcome { NotStarted, Downloaded, AlreadyPresent, Failed, VerifyFailed, Cancelled };

    struct TransferResult {
        bool contentEncoded = false;
        bool resumed = false;
    };

    Result<DownloadReport> execute(std::vector<FileRecord*> work,
                                   const std::filesystem::path& outputDir, DownloadReport report,
                                   bool checkExistence);
    void markExisting(const std::vector<FileRecord*>& existing, const std::filesystem::path& dir,
                      DownloadReport& report);

    Outcome downloadOne(FileRecord& record, const std::filesystem::path& dir);
    Result<TransferResult> transfer(FileRecord& record, const std::string& url,
                                    const std::filesystem::path& partial, bool allowResume);
    Result<void> verifyDownloaded(const FileRecord& record, const std::filesystem::path& path,
                                  bool contentEncoded, std::string* calculated) const;
    bool presentAndIntact(const FileRecord& record, const std::filesystem::path& path) const;
    bool sleepUnlessCancelled(std::chrono::milliseconds delay) const;

    RequestOptions requestOptionsFor(const FileRecord& record) const;
    void emit(ProgressEvent ev) const;
    void trackStart();
    void trackEnd();

    config::DownloadSettings settings_;
    IHttpAdapter& http_;
    const cache::FileBloomFilter* bloom_;
    EventChannel* events_;
    ResumeEngine resume_;

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> inFlight_{0};
    std::atomic<std::size_t> peakInFlight_{0};
    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> total_{0};
};

} // namespace assetsync::downloader
