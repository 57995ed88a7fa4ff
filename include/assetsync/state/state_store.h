#pragma once

#include <assetsync/config/settings.h>
#include <assetsync/core/file_record.h>
#include <assetsync/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assetsync::state {

inline constexpr std::string_view kMetadataVersion = "2.0";

struct StateSnapshot {
    std::vector<FileRecord> records;
    std::optional<std::string> outputDir;
    std::optional<std::string> lastFullScan;
};

struct StatusCounts {
    std::size_t total = 0;
    std::size_t pending = 0;
    std::size_t downloading = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    std::size_t skipped = 0;
    std::size_t verifyFailed = 0;
    std::size_t hashVerified = 0;
    std::size_t hashMismatched = 0;
};

struct SizeTotals {
    std::uint64_t total = 0;
    std::uint64_t downloaded = 0;
};

enum class CacheRecommendation { CacheReliable, IncrementalCheck, FullScan };

std::string_view toTag(CacheRecommendation r);

struct ReliabilityPolicy {
    double sampleRatio = 0.05;
    std::size_t minSample = 10;
    double reliableThreshold = 0.95;
    double incrementalThreshold = 0.80;
    std::chrono::seconds freshness{std::chrono::hours(24)};

    static ReliabilityPolicy from(const config::CacheSettings& cache);
};

struct CacheReliability {
    double score = 0.0;
    CacheRecommendation recommendation = CacheRecommendation::FullScan;
    std::size_t sampled = 0;
    std::size_t valid = 0;
};

/**
 * @brief JSON persistence of the record list between runs.
 *
 * The document is written to a sibling temp file and renamed into place, so a crash
 * mid-save leaves the previous state intact.
 */
class StateStore {
public:
    using LoadListener = std::function<void(const std::vector<FileRecord>&)>;

    explicit StateStore(std::filesystem::path stateFile);

    const std::filesystem::path& path() const { return stateFile_; }

    // Invoked after every successful load (used to rebuild process-wide caches)
    void setLoadListener(LoadListener listener) { onLoaded_ = std::move(listener); }

    // Missing file yields an empty snapshot; malformed JSON is a ParseError
    Result<StateSnapshot> load() const;

    Result<void> save(const std::vector<FileRecord>& records,
                      const std::optional<std::filesystem::path>& outputDir,
                      const ShouldCancel& shouldCancel = {}) const;

    Result<void> clear() const;

    static StatusCounts getStatistics(const std::vector<FileRecord>& records);
    static SizeTotals getTotalSize(const std::vector<FileRecord>& records);

    static CacheReliability analyzeCacheReliability(const std::vector<FileRecord>& records,
                                                    const std::filesystem::path& dir,
                                                    const ReliabilityPolicy& policy = {});
    static CacheReliability analyzeCacheReliability(const std::vector<const FileRecord*>& records,
                                                    const std::filesystem::path& dir,
                                                    const ReliabilityPolicy& policy = {});

    // Case-insensitive match of searchText against filename or hash
    static std::vector<const FileRecord*>
    filterRecords(const std::vector<FileRecord>& records,
                  std::optional<DownloadStatus> status = std::nullopt,
                  std::string_view searchText = {});

    static std::string formatSize(std::uint64_t bytes);

private:
    std::filesystem::path stateFile_;
    LoadListener onLoaded_;
};

} // namespace assetsync::state
