#include <assetsync/downloader/resume_engine.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <system_error>

namespace assetsync::downloader {

namespace {

constexpr std::uint64_t kProbeBytes = 512;

} // namespace

ResumeEngine::ResumeEngine(IHttpAdapter& http, std::uint64_t minResumeSize,
                           std::chrono::seconds probeTtl)
    : http_(http), minResumeSize_(minResumeSize), probeTtl_(probeTtl) {}

std::string ResumeEngine::hostKey(std::string_view url) {
    auto scheme = url.find("://");
    if (scheme == std::string_view::npos)
        return std::string(url);
    auto hostEnd = url.find('/', scheme + 3);
    return std::string(url.substr(0, hostEnd));
}

ResumeDecision ResumeEngine::shouldResume(const FileRecord& record,
                                          const std::filesystem::path& partialPath) const {
    std::error_code ec;
    auto localSize = std::filesystem::file_size(partialPath, ec);
    if (ec)
        return {false, "no partial file"};
    if (localSize < minResumeSize_)
        return {false, "partial file below resume threshold"};
    if (record.sizeBytes && localSize >= *record.sizeBytes)
        return {false, "partial file already at expected size"};
    return {true, "resuming from byte " + std::to_string(localSize)};
}

ResumeSupport ResumeEngine::probeResumeSupport(const std::string& url,
                                               const RequestOptions& options) {
    const auto key = hostKey(url);
    {
        std::lock_guard lock(cacheMutex_);
        auto it = probeCache_.find(key);
        if (it != probeCache_.end() &&
            std::chrono::steady_clock::now() - it->second.probedAt < probeTtl_) {
            return it->second.support;
        }
    }

    ResumeSupport support;
    auto headRes = http_.head(url, options);
    if (!headRes) {
        support.error = headRes.error().message;
        spdlog::debug("Resume probe HEAD {} failed: {}", url, headRes.error().message);
    } else {
        const auto& meta = headRes.value();
        support.statusCode = meta.status;
        support.contentLength = meta.contentLength;
        support.etag = meta.etag;
        support.lastModified = meta.lastModified;
    }

    // Accept-Ranges is only a hint; a real ranged response is the proof
    auto confirm = http_.get(
        url, options, ByteRange{0, kProbeBytes},
        [](std::span<const std::byte>) -> Result<void> { return {}; }, {});
    if (confirm) {
        support.supportsRange = confirm.value().status == 206;
        if (support.statusCode == 0)
            support.statusCode = confirm.value().status;
    } else if (!support.error) {
        support.error = confirm.error().message;
    }

    // Transport failures are not cached so the next file probes again
    if (!support.error || support.statusCode != 0) {
        std::lock_guard lock(cacheMutex_);
        probeCache_[key] = CachedProbe{support, std::chrono::steady_clock::now()};
    }
    spdlog::debug("Resume probe for {}: range {}", key,
                  support.supportsRange ? "supported" : "unsupported");
    return support;
}

Result<bool> ResumeEngine::resumeDownload(FileRecord& record, const std::string& url,
                                          const std::filesystem::path& partialPath,
                                          const RequestOptions& options,
                                          const ShouldCancel& shouldCancel,
                                          const BytesCallback& onBytes) {
    auto decision = shouldResume(record, partialPath);
    if (!decision.resume) {
        return false;
    }
    auto support = probeResumeSupport(url, options);
    if (!support.supportsRange) {
        spdlog::debug("{}: server does not honour ranges, full download", record.filename);
        return false;
    }

    std::error_code ec;
    const auto localSize = std::filesystem::file_size(partialPath, ec);
    if (ec) {
        return false;
    }

    std::ofstream out(partialPath, std::ios::binary | std::ios::app);
    if (!out) {
        spdlog::warn("{}: cannot append to '{}'", record.filename, partialPath.string());
        return false;
    }

    // Ranged transfers are never content-encoded so offsets stay byte-exact
    RequestOptions ranged = options;
    ranged.acceptCompressed = false;

    std::uint64_t onDisk = localSize;
    auto sink = [&](std::span<const std::byte> bytes) -> Result<void> {
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Error{ErrorCode::IoError, "append to partial file failed"};
        }
        onDisk += bytes.size();
        record.downloadedBytes = onDisk;
        if (onBytes)
            onBytes(onDisk, record.sizeBytes);
        return {};
    };

    spdlog::debug("{}: {}", record.filename, decision.reason);
    auto res = http_.get(url, ranged, ByteRange{localSize, std::nullopt}, sink, shouldCancel);
    out.flush();
    if (!res) {
        if (res.error().code == ErrorCode::OperationCancelled) {
            return res.error();
        }
        spdlog::debug("{}: resume failed ({}), falling back", record.filename,
                      res.error().message);
        return false;
    }

    const auto& meta = res.value();
    if (meta.status == 416) {
        // Nothing beyond what is already on disk
        return true;
    }
    if (meta.status != 206) {
        return false;
    }
    if (!out) {
        return false;
    }
    if (!record.sizeBytes && meta.contentRange) {
        auto slash = meta.contentRange->rfind('/');
        if (slash != std::string::npos) {
            // "*" or a malformed total leaves the size unknown
            std::uint64_t total = 0;
            const char* first = meta.contentRange->data() + slash + 1;
            const char* last = meta.contentRange->data() + meta.contentRange->size();
            auto parsed = std::from_chars(first, last, total);
            if (parsed.ec == std::errc() && parsed.ptr == last)
                record.sizeBytes = total;
        }
    }
    spdlog::debug("{}: resumed {} bytes", record.filename, meta.bytesReceived);
    return true;
}

void ResumeEngine::clearProbeCache() {
    std::lock_guard lock(cacheMutex_);
    probeCache_.clear();
}

} // namespace assetsync::downloader
