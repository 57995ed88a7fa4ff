#pragma once

#include <assetsync/cache/bloom_filter.h>
#include <assetsync/config/settings.h>
#include <assetsync/core/event_channel.h>
#include <assetsync/core/file_record.h>
#include <assetsync/core/types.h>
#include <assetsync/downloader/download_orchestrator.h>
#include <assetsync/downloader/http_adapter.h>
#include <assetsync/integrity/parallel_verifier.h>
#include <assetsync/integrity/verification_cache.h>
#include <assetsync/manifest/manifest_loader.h>
#include <assetsync/state/state_store.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace assetsync::session {

/**
 * @brief Everything one sync run needs, owned in one place.
 *
 * The session holds the record list, the output directory, the Bloom filter, the state
 * store and the workers that operate on the records. Progress leaves through a single
 * EventChannel. Operations run one at a time; cancel() may be called from any thread,
 * including a signal-watching one.
 */
class Session {
public:
    Session(config::DownloadSettings settings, std::filesystem::path stateFile,
            std::unique_ptr<downloader::IHttpAdapter> http = nullptr,
            EventListener listener = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Replace the records with the saved state; rebuilds the Bloom filter
    Result<void> loadState();

    // Merge a manifest into the current records
    Result<manifest::DiffCounts> loadManifest(const std::filesystem::path& path);

    // Creates the directory; PermissionDenied when it cannot be written
    Result<void> setOutputDir(const std::filesystem::path& dir);
    const std::optional<std::filesystem::path>& outputDir() const { return outputDir_; }

    Result<void> saveState();
    Result<void> clearState();

    Result<downloader::DownloadReport> download();
    Result<integrity::VerifySummary> verify();
    Result<downloader::DownloadReport> redownloadVerifyFailed();

    // Mark matching unfinished records SKIPPED; returns how many changed
    std::size_t skip(const std::vector<std::string>& filenames, const std::string& reason);

    void cancel();
    void resetCancel();
    bool isCancelled() const;

    state::StatusCounts statistics() const;
    state::SizeTotals totalSize() const;

    const std::vector<FileRecord>& records() const { return records_; }
    std::vector<FileRecord>& records() { return records_; }
    const cache::FileBloomFilter& bloom() const { return bloom_; }
    EventChannel& events() { return *events_; }
    const config::DownloadSettings& settings() const { return settings_; }
    const state::StateStore& store() const { return store_; }

    // Digest memo kept next to the state file
    std::filesystem::path verificationCachePath() const;

private:
    Result<std::filesystem::path> requireOutputDir() const;
    void rebuildBloom();

    config::DownloadSettings settings_;
    state::StateStore store_;
    std::vector<FileRecord> records_;
    std::optional<std::filesystem::path> outputDir_;
    cache::FileBloomFilter bloom_;
    integrity::VerificationCache verificationCache_;
    std::unique_ptr<EventChannel> events_;
    std::unique_ptr<downloader::IHttpAdapter> http_;
    std::unique_ptr<downloader::DownloadOrchestrator> orchestrator_;
    std::unique_ptr<integrity::ParallelVerifier> verifier_;
};

} // namespace assetsync::session
