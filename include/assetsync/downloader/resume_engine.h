#pragma once

#include <assetsync/core/file_record.h>
#include <assetsync/core/types.h>
#include <assetsync/downloader/http_adapter.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace assetsync::downloader {

struct ResumeDecision {
    bool resume = false;
    std::string reason;
};

struct ResumeSupport {
    bool supportsRange = false;
    std::optional<std::uint64_t> contentLength;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    long statusCode = 0;
    std::optional<std::string> error;
};

// (bytes on disk so far, expected total if known)
using BytesCallback = std::function<void(std::uint64_t, std::optional<std::uint64_t>)>;

/**
 * @brief Continues interrupted transfers with a ranged GET appended to the partial file.
 *
 * Range support is probed once per scheme+host and cached for a TTL. A resumed file is
 * not trusted until the caller has verified its size and hash.
 */
class ResumeEngine {
public:
    ResumeEngine(IHttpAdapter& http, std::uint64_t minResumeSize,
                 std::chrono::seconds probeTtl = std::chrono::hours(1));

    // Partial exists, is at least minResumeSize and smaller than the expected size
    ResumeDecision shouldResume(const FileRecord& record,
                                const std::filesystem::path& partialPath) const;

    // HEAD, then a confirming "Range: bytes=0-511" GET that must come back 206
    ResumeSupport probeResumeSupport(const std::string& url, const RequestOptions& options);

    /**
     * @brief Append the missing tail of a partial file.
     *
     * @return true when the file is now complete (206 appended, or 416 meaning nothing was
     *         missing); false when the caller should fall back to a full download;
     *         OperationCancelled when the cancel predicate fired mid-transfer
     */
    Result<bool> resumeDownload(FileRecord& record, const std::string& url,
                                const std::filesystem::path& partialPath,
                                const RequestOptions& options, const ShouldCancel& shouldCancel,
                                const BytesCallback& onBytes = {});

    void clearProbeCache();

    // "scheme://host[:port]" of a URL; the whole URL when it has no scheme
    static std::string hostKey(std::string_view url);

private:
    struct CachedProbe {
        ResumeSupport support;
        std::chrono::steady_clock::time_point probedAt;
    };

    IHttpAdapter& http_;
    std::uint64_t minResumeSize_;
    std::chrono::seconds probeTtl_;
    std::mutex cacheMutex_;
    std::map<std::string, CachedProbe> probeCache_;
};

} // namespace assetsync::downloader
