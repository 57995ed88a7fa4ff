#include <assetsync/core/file_record.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <ctime>
#include <system_error>

namespace assetsync {

namespace {

constexpr std::array<std::string_view, 30> kBinaryExtensions = {
    ".png",  ".jpg", ".jpeg", ".gif",  ".bmp",  ".webp",  ".ico",   ".tga", ".dds", ".ktx",
    ".astc", ".mp3", ".wav",  ".ogg",  ".m4a",  ".flac",  ".mp4",   ".webm", ".mov", ".zip",
    ".gz",   ".7z",  ".bin",  ".ttf",  ".otf",  ".woff",  ".woff2", ".pdf",  ".skel", ".unity3d"};

bool parseInt(std::string_view text, int& out) {
    auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    return res.ec == std::errc() && res.ptr == text.data() + text.size();
}

} // namespace

std::string_view toTag(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Pending: return "pending";
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Completed: return "completed";
        case DownloadStatus::Failed: return "failed";
        case DownloadStatus::Cancelled: return "cancelled";
        case DownloadStatus::Skipped: return "skipped";
        case DownloadStatus::VerifyFailed: return "verify_failed";
    }
    return "pending";
}

std::string_view toTag(HashVerifyStatus status) {
    switch (status) {
        case HashVerifyStatus::NotVerified: return "not_verified";
        case HashVerifyStatus::Verifying: return "verifying";
        case HashVerifyStatus::VerifiedSuccess: return "verified_success";
        case HashVerifyStatus::VerifiedFailed: return "verified_failed";
    }
    return "not_verified";
}

std::optional<DownloadStatus> downloadStatusFromTag(std::string_view tag) {
    for (auto s : {DownloadStatus::Pending, DownloadStatus::Downloading, DownloadStatus::Completed,
                   DownloadStatus::Failed, DownloadStatus::Cancelled, DownloadStatus::Skipped,
                   DownloadStatus::VerifyFailed}) {
        if (toTag(s) == tag)
            return s;
    }
    return std::nullopt;
}

std::optional<HashVerifyStatus> hashVerifyStatusFromTag(std::string_view tag) {
    for (auto s : {HashVerifyStatus::NotVerified, HashVerifyStatus::Verifying,
                   HashVerifyStatus::VerifiedSuccess, HashVerifyStatus::VerifiedFailed}) {
        if (toTag(s) == tag)
            return s;
    }
    return std::nullopt;
}

std::string_view displayLabel(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Pending: return "Pending";
        case DownloadStatus::Downloading: return "Downloading";
        case DownloadStatus::Completed: return "Completed";
        case DownloadStatus::Failed: return "Failed";
        case DownloadStatus::Cancelled: return "Cancelled";
        case DownloadStatus::Skipped: return "Skipped";
        case DownloadStatus::VerifyFailed: return "Verify failed";
    }
    return "Pending";
}

std::string_view displayLabel(HashVerifyStatus status) {
    switch (status) {
        case HashVerifyStatus::NotVerified: return "Not verified";
        case HashVerifyStatus::Verifying: return "Verifying";
        case HashVerifyStatus::VerifiedSuccess: return "Verified";
        case HashVerifyStatus::VerifiedFailed: return "Verification failed";
    }
    return "Not verified";
}

std::string formatIsoTimestamp(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::optional<TimePoint> parseIsoTimestamp(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS, optionally followed by fractional seconds and/or 'Z'
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parseInt(text.substr(0, 4), year) || !parseInt(text.substr(5, 2), month) ||
        !parseInt(text.substr(8, 2), day) || !parseInt(text.substr(11, 2), hour) ||
        !parseInt(text.substr(14, 2), minute) || !parseInt(text.substr(17, 2), second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

std::string toLowerAscii(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string FileRecord::extension() const {
    return toLowerAscii(std::filesystem::path(filename).extension().string());
}

std::string FileRecord::baseName() const {
    return std::filesystem::path(filename).stem().string();
}

std::string FileRecord::localName() const {
    return baseName() + "-" + contentHash + extension();
}

bool FileRecord::isBinary() const {
    auto ext = extension();
    return std::find(kBinaryExtensions.begin(), kBinaryExtensions.end(), ext) !=
           kBinaryExtensions.end();
}

void FileRecord::resetProgress() {
    progress = 0.0;
    downloadedBytes = 0;
    errorMessage.reset();
}

void FileRecord::markCompleted(const std::filesystem::path& path) {
    status = DownloadStatus::Completed;
    progress = 100.0;
    localPath = path.string();
    errorMessage.reset();
    if (updateDiskMetadata(path) && sizeBytes) {
        downloadedBytes = *sizeBytes;
    }
}

void FileRecord::markFailed(std::string message) {
    status = DownloadStatus::Failed;
    errorMessage = std::move(message);
}

void FileRecord::markSkipped(std::string reason) {
    status = DownloadStatus::Skipped;
    errorMessage = std::move(reason);
}

void FileRecord::markCancelled() {
    status = DownloadStatus::Cancelled;
}

void FileRecord::markHashVerified(std::string calculated, bool matches) {
    calculatedHash = std::move(calculated);
    hashVerifiedAt = formatIsoTimestamp(std::chrono::system_clock::now());
    if (matches) {
        hashVerifyStatus = HashVerifyStatus::VerifiedSuccess;
    } else {
        hashVerifyStatus = HashVerifyStatus::VerifiedFailed;
        status = DownloadStatus::VerifyFailed;
        errorMessage = "hash mismatch";
    }
}

void FileRecord::resetForRedownload() {
    status = DownloadStatus::Pending;
    hashVerifyStatus = HashVerifyStatus::NotVerified;
    hashVerifiedAt.reset();
    calculatedHash.reset();
    diskVerified = false;
    mtime.reset();
    lastCheckedAt.reset();
    resetProgress();
}

bool FileRecord::updateDiskMetadata(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        diskVerified = false;
        return false;
    }
    auto lwt = std::filesystem::last_write_time(path, ec);
    if (ec) {
        diskVerified = false;
        return false;
    }
    sizeBytes = size;
    mtime = static_cast<std::int64_t>(lwt.time_since_epoch().count());
    lastCheckedAt = formatIsoTimestamp(std::chrono::system_clock::now());
    cacheSchemaVersion = std::string(kCacheSchemaVersion);
    diskVerified = true;
    return true;
}

bool FileRecord::isFresh(std::chrono::seconds maxAge) const {
    if (!lastCheckedAt)
        return false;
    auto checked = parseIsoTimestamp(*lastCheckedAt);
    if (!checked)
        return false;
    return std::chrono::system_clock::now() - *checked <= maxAge;
}

bool FileRecord::isCacheValid(const std::filesystem::path& path,
                              std::chrono::seconds maxAge) const {
    if (!diskVerified || !sizeBytes || !mtime || !isFresh(maxAge))
        return false;
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size != *sizeBytes)
        return false;
    auto lwt = std::filesystem::last_write_time(path, ec);
    if (ec)
        return false;
    return static_cast<std::int64_t>(lwt.time_since_epoch().count()) == *mtime;
}

} // namespace assetsync
