#pragma once

#include <assetsync/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace assetsync {

inline constexpr std::string_view kCacheSchemaVersion = "1.0";

enum class DownloadStatus {
    Pending,
    Downloading,
    Completed,
    Failed,
    Cancelled,
    Skipped,
    VerifyFailed
};

enum class HashVerifyStatus { NotVerified, Verifying, VerifiedSuccess, VerifiedFailed };

// Stable wire tags (persisted); never localized
std::string_view toTag(DownloadStatus status);
std::string_view toTag(HashVerifyStatus status);
std::optional<DownloadStatus> downloadStatusFromTag(std::string_view tag);
std::optional<HashVerifyStatus> hashVerifyStatusFromTag(std::string_view tag);

// Human-readable labels for presentation only
std::string_view displayLabel(DownloadStatus status);
std::string_view displayLabel(HashVerifyStatus status);

// ISO-8601 UTC, second precision ("2024-05-01T12:00:00Z")
std::string formatIsoTimestamp(TimePoint tp);
std::optional<TimePoint> parseIsoTimestamp(std::string_view text);

std::string toLowerAscii(std::string_view in);

/**
 * @brief One manifest entry and everything known about its local copy.
 *
 * Identity is (filename, contentHash). The remaining fields are mutated by the
 * pipeline phases, one phase at a time and one worker per record inside a phase.
 */
struct FileRecord {
    std::string filename;
    std::string contentHash;

    DownloadStatus status = DownloadStatus::Pending;
    double progress = 0.0;
    std::optional<std::uint64_t> sizeBytes;
    std::uint64_t downloadedBytes = 0;
    std::optional<std::string> localPath;
    std::optional<std::string> errorMessage;
    std::optional<std::string> downloadUrl;

    // Disk cache; mtime is in file_time_type ticks and only compared for equality
    std::optional<std::int64_t> mtime;
    bool diskVerified = false;
    std::optional<std::string> lastCheckedAt;
    std::string cacheSchemaVersion{kCacheSchemaVersion};

    HashVerifyStatus hashVerifyStatus = HashVerifyStatus::NotVerified;
    std::optional<std::string> hashVerifiedAt;
    std::optional<std::string> calculatedHash;

    FileRecord() = default;
    FileRecord(std::string name, std::string hash)
        : filename(std::move(name)), contentHash(std::move(hash)) {}

    // Lower-cased extension including the dot, empty when there is none
    std::string extension() const;
    // File name without directories and extension
    std::string baseName() const;
    // "<stem>-<hash><ext>", the name used locally and on the asset server
    std::string localName() const;
    std::filesystem::path pathIn(const std::filesystem::path& dir) const { return dir / localName(); }
    bool isBinary() const;
    bool isJson() const { return extension() == ".json"; }

    void resetProgress();
    void markCompleted(const std::filesystem::path& path);
    void markFailed(std::string message);
    void markSkipped(std::string reason);
    void markCancelled();
    void markHashVerified(std::string calculated, bool matches);
    void resetForRedownload();

    // Refresh size/mtime/lastCheckedAt from disk; returns false if the file is gone
    bool updateDiskMetadata(const std::filesystem::path& path);

    // True when the cached metadata is fresh and still matches the file on disk
    bool isCacheValid(const std::filesystem::path& path,
                      std::chrono::seconds maxAge = std::chrono::hours(24)) const;

    // True when lastCheckedAt lies within maxAge of now
    bool isFresh(std::chrono::seconds maxAge) const;
};

} // namespace assetsync
