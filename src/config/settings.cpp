#include <assetsync/config/config_helpers.h>
#include <assetsync/config/settings.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace assetsync::config {

namespace {

struct SizeMix {
    double largeRatio = 0.0;
    double smallRatio = 0.0;
    double jsonRatio = 0.0;
    double pngRatio = 0.0;
};

SizeMix computeMix(const DownloadSettings& s, const std::vector<const FileRecord*>& pending) {
    SizeMix mix;
    if (pending.empty())
        return mix;
    std::size_t large = 0, small = 0, json = 0, png = 0;
    for (const auto* r : pending) {
        if (r->sizeBytes && *r->sizeBytes > 0) {
            if (*r->sizeBytes > s.largeFileThreshold)
                ++large;
            else if (*r->sizeBytes < s.smallFileThreshold)
                ++small;
        }
        auto ext = r->extension();
        if (ext == ".json")
            ++json;
        else if (ext == ".png")
            ++png;
    }
    const double n = static_cast<double>(pending.size());
    mix.largeRatio = large / n;
    mix.smallRatio = small / n;
    mix.jsonRatio = json / n;
    mix.pngRatio = png / n;
    return mix;
}

} // namespace

void DownloadSettings::normalize() {
    if (concurrentDownloads == 0)
        concurrentDownloads = 1;
    if (timeout.count() <= 0)
        timeout = std::chrono::seconds(60);
    if (stallTimeout.count() <= 0)
        stallTimeout = std::chrono::seconds(60);
    if (batchSize == 0)
        batchSize = 1;
    if (maxRetries < 0)
        maxRetries = 0;
    if (chunkSize < 1024)
        chunkSize = 1024;
    if (cache.bloomFpRate <= 0.0 || cache.bloomFpRate >= 1.0)
        cache.bloomFpRate = 0.01;
    if (cache.sampleRatio <= 0.0 || cache.sampleRatio > 1.0)
        cache.sampleRatio = 0.05;
    if (cache.incrementalWorkers == 0)
        cache.incrementalWorkers = 1;
    if (cache.incrementalBatch == 0)
        cache.incrementalBatch = 1;
    while (!baseUrl.empty() && baseUrl.back() == '/')
        baseUrl.pop_back();
}

std::size_t optimalBatchSize(const DownloadSettings& s, std::size_t totalFiles,
                             std::size_t filesToDownload,
                             const std::vector<const FileRecord*>& pending) {
    if (filesToDownload == 0)
        return 1;

    std::size_t batch = s.batchSize;
    if (filesToDownload <= 10) {
        batch = std::min<std::size_t>(5, filesToDownload);
    } else if (filesToDownload <= 50) {
        batch = std::min<std::size_t>(15, batch);
    } else if (filesToDownload <= 200) {
        batch = std::min<std::size_t>(30, batch);
    }

    const double skipRatio =
        totalFiles > 0 ? static_cast<double>(totalFiles - std::min(totalFiles, filesToDownload)) /
                             static_cast<double>(totalFiles)
                       : 0.0;
    if (skipRatio > 0.95) {
        batch = std::max<std::size_t>(10, batch / 3);
    } else if (skipRatio > 0.8) {
        batch = std::max<std::size_t>(15, batch / 2);
    } else if (skipRatio > 0.5) {
        batch = std::max<std::size_t>(20, batch * 2 / 3);
    }

    if (!pending.empty()) {
        auto mix = computeMix(s, pending);
        if (mix.largeRatio > 0.3) {
            batch = std::max<std::size_t>(10, batch / 2);
        } else if (mix.smallRatio > 0.8) {
            batch = std::min<std::size_t>(100, batch * 2);
        }
    }

    return std::max<std::size_t>(1, batch);
}

std::size_t optimalConcurrency(const DownloadSettings& s, std::size_t totalFiles,
                               std::size_t filesToDownload,
                               const std::vector<const FileRecord*>& pending) {
    if (filesToDownload == 0)
        return 1;
    const auto batch = optimalBatchSize(s, totalFiles, filesToDownload, pending);

    if (filesToDownload <= 5)
        return std::min(filesToDownload, s.concurrentDownloads);

    std::size_t concurrent = s.concurrentDownloads;
    if (filesToDownload <= 20) {
        concurrent = std::min(batch * 2, concurrent);
    } else if (filesToDownload <= 100) {
        concurrent = std::min(batch * 3, concurrent);
    } else {
        concurrent = std::min(batch * 4, concurrent);
    }

    if (!pending.empty()) {
        auto mix = computeMix(s, pending);
        if (mix.largeRatio > 0.5) {
            concurrent = std::max<std::size_t>(20, concurrent / 2);
        } else if (mix.smallRatio > 0.8) {
            concurrent = std::min<std::size_t>(120, concurrent * 3 / 2);
        }
        if (mix.jsonRatio > 0.7) {
            concurrent = std::min<std::size_t>(100, concurrent * 4 / 3);
        } else if (mix.pngRatio > 0.7) {
            concurrent = std::max<std::size_t>(30, concurrent * 3 / 4);
        }
    }

    return std::max<std::size_t>(1, std::min(std::max<std::size_t>(5, concurrent),
                                             s.concurrentDownloads));
}

std::chrono::seconds adaptiveTimeout(const DownloadSettings& s, const FileRecord& record) {
    const auto base = s.timeout;
    if (!record.sizeBytes || *record.sizeBytes == 0)
        return base;
    const auto size = *record.sizeBytes;
    if (size > s.largeFileThreshold) {
        // 10 seconds per MiB, never below the base timeout; stalls are caught by stallTimeout
        auto estimated = std::chrono::seconds(static_cast<long long>(size / (1024 * 1024) * 10));
        return std::max(base, estimated);
    }
    if (size < s.smallFileThreshold) {
        return std::max(base / 2, std::min(base, std::chrono::seconds(60)));
    }
    return base;
}

std::size_t adaptiveChunkSize(const DownloadSettings& s, const FileRecord& record) {
    if (!record.sizeBytes || *record.sizeBytes == 0)
        return s.chunkSize;
    if (*record.sizeBytes > s.largeFileThreshold)
        return std::min<std::size_t>(65536, s.chunkSize * 2);
    if (*record.sizeBytes < s.smallFileThreshold)
        return std::max<std::size_t>(8192, s.chunkSize / 2);
    return s.chunkSize;
}

std::chrono::seconds connectTimeout(const DownloadSettings& s) {
    return std::min(std::chrono::seconds(30), std::max(std::chrono::seconds(1), s.timeout / 6));
}

std::size_t completionBatchSize(std::size_t existingCount) {
    if (existingCount <= 500)
        return 100;
    if (existingCount <= 2000)
        return 500;
    if (existingCount <= 5000)
        return 1000;
    if (existingCount <= 20000)
        return 5000;
    return 10000;
}

DownloadSettings loadSettings(const std::filesystem::path& configPath) {
    DownloadSettings s;
    std::error_code ec;
    if (configPath.empty() || !std::filesystem::exists(configPath, ec)) {
        spdlog::debug("No config at '{}', using defaults", configPath.string());
        s.normalize();
        return s;
    }

    const std::string dl = "downloader";
    if (auto v = parse_config_value(configPath, dl, "base_url"); !v.empty())
        s.baseUrl = v;
    if (auto v = parse_config_int(configPath, dl, "concurrency"); v && *v > 0)
        s.concurrentDownloads = static_cast<std::size_t>(*v);
    if (auto v = parse_config_int(configPath, dl, "timeout_s"); v && *v > 0)
        s.timeout = std::chrono::seconds(*v);
    if (auto v = parse_config_int(configPath, dl, "stall_timeout_s"); v && *v > 0)
        s.stallTimeout = std::chrono::seconds(*v);
    if (auto v = parse_config_int(configPath, dl, "batch_size"); v && *v > 0)
        s.batchSize = static_cast<std::size_t>(*v);
    if (auto v = parse_config_int(configPath, dl, "retry_delay_ms"); v && *v >= 0)
        s.retryDelay = std::chrono::milliseconds(*v);
    if (auto v = parse_config_int(configPath, dl, "max_retries"); v && *v >= 0)
        s.maxRetries = static_cast<int>(*v);
    if (auto v = parse_config_int(configPath, dl, "chunk_size"); v && *v > 0)
        s.chunkSize = static_cast<std::size_t>(*v);
    if (auto v = parse_config_bool(configPath, dl, "use_http2"))
        s.useHttp2 = *v;
    if (auto v = parse_config_bool(configPath, dl, "enable_resume"))
        s.enableResume = *v;
    if (auto v = parse_config_int(configPath, dl, "min_resume_size"); v && *v >= 0)
        s.minResumeSize = static_cast<std::uint64_t>(*v);
    if (auto v = parse_config_bool(configPath, dl, "verify_integrity"))
        s.verifyIntegrity = *v;
    if (auto v = parse_config_bool(configPath, dl, "compress_text_assets"))
        s.compressTextAssets = *v;
    if (auto v = parse_config_double(configPath, dl, "bloom_fp_rate"))
        s.cache.bloomFpRate = *v;

    const std::string cache = "cache";
    if (auto v = parse_config_double(configPath, cache, "sample_ratio"))
        s.cache.sampleRatio = *v;
    if (auto v = parse_config_int(configPath, cache, "min_sample"); v && *v >= 0)
        s.cache.minSample = static_cast<std::size_t>(*v);
    if (auto v = parse_config_double(configPath, cache, "reliable_threshold"))
        s.cache.reliableThreshold = *v;
    if (auto v = parse_config_double(configPath, cache, "incremental_threshold"))
        s.cache.incrementalThreshold = *v;
    if (auto v = parse_config_int(configPath, cache, "freshness_hours"); v && *v > 0)
        s.cache.freshness = std::chrono::hours(*v);

    if (auto v = parse_config_value(configPath, "log", "level"); !v.empty())
        s.log.level = v;
    if (auto v = parse_config_value(configPath, "log", "file"); !v.empty())
        s.log.file = expand_tilde(v).string();

    s.normalize();
    spdlog::debug("Loaded settings from '{}': concurrency={}, batch={}, retries={}",
                  configPath.string(), s.concurrentDownloads, s.batchSize, s.maxRetries);
    return s;
}

} // namespace assetsync::config
