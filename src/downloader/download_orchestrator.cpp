#include <assetsync/downloader/download_orchestrator.h>

#include <assetsync/core/worker_pool.h>
#include <assetsync/integrity/content_hasher.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace assetsync::downloader {

namespace fs = std::filesystem;

namespace {

constexpr auto kMaxBackoff = std::chrono::milliseconds(16000);
constexpr auto kCancelPollInterval = std::chrono::milliseconds(50);
constexpr double kFileProgressStep = 5.0;

class RunGuard {
public:
    explicit RunGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunGuard() { flag_ = false; }
    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

std::chrono::milliseconds backoffFor(std::chrono::milliseconds base, int attempt) {
    auto delay = base;
    for (int i = 1; i < attempt && delay < kMaxBackoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, kMaxBackoff);
}

fs::path partialPathFor(const FileRecord& record, const fs::path& dir) {
    return dir / (record.localName() + std::string(kPartialSuffix));
}

} // namespace

DownloadOrchestrator::DownloadOrchestrator(config::DownloadSettings settings, IHttpAdapter& http,
                                           const cache::FileBloomFilter* bloom,
                                           EventChannel* events)
    : settings_(std::move(settings)),
      http_(http),
      bloom_(bloom),
      events_(events),
      resume_(http, settings_.minResumeSize, settings_.probeCacheTtl) {
    settings_.normalize();
}

std::string DownloadOrchestrator::buildUrl(const FileRecord& record) const {
    std::string base = settings_.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + record.localName();
}

Result<void> DownloadOrchestrator::ensureWritable(const fs::path& dir) {
    if (dir.empty()) {
        return Error{ErrorCode::InvalidArgument, "output directory not set"};
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "cannot create output directory " + dir.string() + ": " + ec.message()};
    }
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::PermissionDenied, dir.string() + " is not a directory"};
    }

    const auto probe = dir / ".assetsync-write-probe";
    {
        std::ofstream out(probe, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::PermissionDenied,
                         "output directory is not writable: " + dir.string()};
        }
    }
    fs::remove(probe, ec);
    return {};
}

Result<DownloadReport> DownloadOrchestrator::downloadFiles(std::vector<FileRecord>& records,
                                                           const fs::path& outputDir) {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidArgument, "a download is already in progress"};
    }
    RunGuard guard(running_);

    if (auto ok = ensureWritable(outputDir); !ok) {
        return ok.error();
    }

    DownloadReport report;
    std::vector<FileRecord*> work;
    work.reserve(records.size());
    for (auto& record : records) {
        if (record.status == DownloadStatus::Skipped) {
            ++report.skipped;
        } else if (record.status == DownloadStatus::VerifyFailed) {
            ++report.heldVerifyFailed;
        } else {
            work.push_back(&record);
        }
    }
    if (report.heldVerifyFailed > 0) {
        spdlog::info("{} file(s) failed verification earlier and wait for redownload-failed",
                     report.heldVerifyFailed);
    }
    return execute(std::move(work), outputDir, std::move(report), true);
}

Result<DownloadReport>
DownloadOrchestrator::redownloadVerifyFailed(std::vector<FileRecord>& records,
                                             const fs::path& outputDir) {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidArgument, "a download is already in progress"};
    }
    RunGuard guard(running_);

    if (auto ok = ensureWritable(outputDir); !ok) {
        return ok.error();
    }

    std::vector<FileRecord*> work;
    for (auto& record : records) {
        if (record.status != DownloadStatus::VerifyFailed)
            continue;
        std::error_code ec;
        fs::remove(record.pathIn(outputDir), ec);
        if (ec) {
            spdlog::warn("{}: could not remove corrupt file: {}", record.filename, ec.message());
        }
        fs::remove(partialPathFor(record, outputDir), ec);
        record.resetForRedownload();
        work.push_back(&record);
    }
    spdlog::info("Redownloading {} file(s) that failed verification", work.size());
    return execute(std::move(work), outputDir, DownloadReport{}, false);
}

Result<DownloadReport> DownloadOrchestrator::execute(std::vector<FileRecord*> work,
                                                     const fs::path& outputDir,
                                                     DownloadReport report, bool checkExistence) {
    const auto started = std::chrono::steady_clock::now();
    inFlight_ = 0;
    peakInFlight_ = 0;
    completed_ = 0;
    total_ = work.size();

    emit({EventKind::Started, {}, 0.0, true,
          fmt::format("{} file(s) to process", work.size()), 0, work.size()});

    auto shouldCancel = [this] { return cancelled_.load(); };
    std::vector<FileRecord*> toDownload;

    if (checkExistence) {
        cache::ExistenceChecker checker(settings_.cache, bloom_);
        auto existence = checker.partition(
            work, outputDir, shouldCancel, [this](std::size_t checked, std::size_t total) {
                double pct = total ? 100.0 * static_cast<double>(checked) / total : 100.0;
                emit({EventKind::CheckProgress, {}, pct, true, {}, checked, total});
            });
        report.tier = existence.tier;
        spdlog::info("Existence check ({}): {} present, {} to download",
                     cache::toTag(existence.tier), existence.existing.size(),
                     existence.toDownload.size());
        markExisting(existence.existing, outputDir, report);
        toDownload = std::move(existence.toDownload);
    } else {
        toDownload = std::move(work);
    }

    if (!toDownload.empty() && !cancelled_) {
        std::vector<const FileRecord*> pending(toDownload.begin(), toDownload.end());
        const auto totalFiles = static_cast<std::size_t>(total_.load());
        report.batchSize =
            config::optimalBatchSize(settings_, totalFiles, toDownload.size(), pending);
        report.concurrency =
            config::optimalConcurrency(settings_, totalFiles, toDownload.size(), pending);
        const auto batches = (toDownload.size() + report.batchSize - 1) / report.batchSize;
        spdlog::info("Downloading {} file(s) in {} batch(es) of {} with concurrency {}",
                     toDownload.size(), batches, report.batchSize, report.concurrency);

        WorkerPool pool(report.concurrency);
        for (std::size_t start = 0, batchNo = 1; start < toDownload.size();
             start += report.batchSize, ++batchNo) {
            if (cancelled_)
                break;
            const auto end = std::min(start + report.batchSize, toDownload.size());
            std::vector<Outcome> outcomes(end - start, Outcome::NotStarted);

            for (std::size_t i = start; i < end; ++i) {
                pool.enqueue([this, &outcomes, &toDownload, &outputDir, i, start] {
                    outcomes[i - start] = downloadOne(*toDownload[i], outputDir);
                });
            }
            pool.waitIdle();

            std::size_t batchOk = 0;
            std::size_t batchFailed = 0;
            for (std::size_t i = start; i < end; ++i) {
                const auto& record = *toDownload[i];
                switch (outcomes[i - start]) {
                    case Outcome::Downloaded:
                        ++report.succeeded;
                        ++batchOk;
                        report.results[record.filename] = true;
                        break;
                    case Outcome::AlreadyPresent:
                        ++report.alreadyPresent;
                        ++batchOk;
                        report.results[record.filename] = true;
                        break;
                    case Outcome::Failed:
                        ++report.failed;
                        ++batchFailed;
                        report.results[record.filename] = false;
                        break;
                    case Outcome::VerifyFailed:
                        ++report.verifyFailed;
                        ++batchFailed;
                        report.results[record.filename] = false;
                        break;
                    case Outcome::Cancelled:
                        ++report.cancelled;
                        break;
                    case Outcome::NotStarted:
                        break;
                }
            }

            emit({EventKind::Statistics, {}, 0.0, batchFailed == 0,
                  fmt::format("batch {}/{}: {} ok, {} failed", batchNo, batches, batchOk,
                              batchFailed),
                  completed_.load(), total_.load()});
            spdlog::debug("Batch {}/{} done: {} ok, {} failed", batchNo, batches, batchOk,
                          batchFailed);

            if (end < toDownload.size() && !sleepUnlessCancelled(settings_.retryDelay))
                break;
        }
    }

    report.wasCancelled = cancelled_.load();
    report.peakInFlight = peakInFlight_.load();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto summary = fmt::format(
        "{} downloaded, {} already present, {} failed, {} failed verification, {} skipped in {} ms",
        report.succeeded, report.alreadyPresent, report.failed, report.verifyFailed,
        report.skipped, elapsed.count());
    if (report.wasCancelled) {
        spdlog::warn("Download cancelled: {}", summary);
        emit({EventKind::Cancelled, {}, 0.0, false, "download cancelled", completed_.load(),
              total_.load()});
    } else {
        spdlog::info("Download finished: {}", summary);
    }
    emit({EventKind::Finished, {}, 100.0, report.failed == 0 && report.verifyFailed == 0,
          summary, completed_.load(), total_.load()});
    return report;
}

void DownloadOrchestrator::markExisting(const std::vector<FileRecord*>& existing,
                                        const fs::path& dir, DownloadReport& report) {
    if (existing.empty())
        return;
    const auto batch = config::completionBatchSize(existing.size());
    for (std::size_t start = 0; start < existing.size(); start += batch) {
        const auto end = std::min(start + batch, existing.size());
        for (std::size_t i = start; i < end; ++i) {
            auto& record = *existing[i];
            record.markCompleted(record.pathIn(dir));
            report.results[record.filename] = true;
        }
        report.alreadyPresent += end - start;
        const auto done = completed_.fetch_add(end - start) + (end - start);
        emit({EventKind::OverallProgress, {}, 100.0 * static_cast<double>(done) / total_.load(),
              true, {}, done, total_.load()});
        std::this_thread::yield();
    }
}

DownloadOrchestrator::Outcome DownloadOrchestrator::downloadOne(FileRecord& record,
                                                                const fs::path& dir) {
    if (cancelled_)
        return Outcome::NotStarted;

    const auto finalPath = record.pathIn(dir);
    const auto partial = partialPathFor(record, dir);

    auto finish = [&](Outcome outcome) {
        if (outcome != Outcome::Cancelled) {
            const auto done = completed_.fetch_add(1) + 1;
            const auto total = total_.load();
            const bool ok = outcome == Outcome::Downloaded || outcome == Outcome::AlreadyPresent;
            emit({EventKind::FileCompleted, record.filename, ok ? 100.0 : record.progress, ok,
                  ok ? std::string{} : record.errorMessage.value_or(std::string{}), done, total});
            emit({EventKind::OverallProgress, {},
                  total ? 100.0 * static_cast<double>(done) / total : 100.0, true, {}, done,
                  total});
        }
        return outcome;
    };

    // Another process or an earlier pass may have produced the file meanwhile
    if (presentAndIntact(record, finalPath)) {
        record.markCompleted(finalPath);
        spdlog::debug("{}: already present", record.filename);
        return finish(Outcome::AlreadyPresent);
    }

    trackStart();
    struct InFlight {
        DownloadOrchestrator* self;
        ~InFlight() { self->trackEnd(); }
    } inFlightGuard{this};

    const auto url = buildUrl(record);
    record.status = DownloadStatus::Downloading;
    record.resetProgress();
    record.downloadUrl = url;

    auto revert = [&] {
        record.status = DownloadStatus::Pending;
        spdlog::debug("{}: cancelled, partial kept for resume", record.filename);
        return finish(Outcome::Cancelled);
    };

    bool allowResume = settings_.enableResume;
    bool integrityRetried = false;
    int attempt = 0;

    while (true) {
        if (cancelled_)
            return revert();

        auto transferred = transfer(record, url, partial, allowResume);
        if (!transferred) {
            const auto& err = transferred.error();
            if (err.code == ErrorCode::OperationCancelled)
                return revert();
            if (isRetryable(err.code) && attempt < settings_.maxRetries) {
                ++attempt;
                const auto delay = backoffFor(settings_.retryDelay, attempt);
                spdlog::debug("{}: {} (attempt {}/{}), retrying in {} ms", record.filename,
                              err.message, attempt, settings_.maxRetries, delay.count());
                if (!sleepUnlessCancelled(delay))
                    return revert();
                continue;
            }
            spdlog::warn("{}: download failed: {}", record.filename, err.message);
            record.markFailed(err.message);
            return finish(Outcome::Failed);
        }

        std::string calculated;
        auto verified =
            verifyDownloaded(record, partial, transferred.value().contentEncoded, &calculated);
        if (!verified) {
            const auto& err = verified.error();
            if (err.code == ErrorCode::OperationCancelled)
                return revert();

            std::error_code ec;
            fs::remove(partial, ec);
            if (!integrityRetried) {
                spdlog::warn("{}: {}, downloading again from scratch", record.filename,
                             err.message);
                integrityRetried = true;
                allowResume = false;
                record.sizeBytes.reset();
                record.resetProgress();
                continue;
            }

            spdlog::error("{}: integrity check failed twice: {}", record.filename, err.message);
            if (!calculated.empty()) {
                record.markHashVerified(calculated, false);
            } else {
                record.status = DownloadStatus::VerifyFailed;
                record.hashVerifyStatus = HashVerifyStatus::VerifiedFailed;
            }
            record.errorMessage = err.message;
            return finish(Outcome::VerifyFailed);
        }

        std::error_code ec;
        fs::rename(partial, finalPath, ec);
        if (ec) {
            record.markFailed("cannot move into place: " + ec.message());
            spdlog::warn("{}: {}", record.filename, *record.errorMessage);
            return finish(Outcome::Failed);
        }

        record.markCompleted(finalPath);
        if (!calculated.empty()) {
            record.markHashVerified(std::move(calculated), true);
        }
        spdlog::debug("{}: completed{}", record.filename,
                      transferred.value().resumed ? " (resumed)" : "");
        return finish(Outcome::Downloaded);
    }
}

Result<DownloadOrchestrator::TransferResult>
DownloadOrchestrator::transfer(FileRecord& record, const std::string& url,
                               const fs::path& partial, bool allowResume) {
    auto options = requestOptionsFor(record);
    auto shouldCancel = [this] { return cancelled_.load(); };

    double lastPublished = -kFileProgressStep;
    auto onBytes = [&](std::uint64_t onDisk, std::optional<std::uint64_t> total) {
        record.downloadedBytes = onDisk;
        if (!total || *total == 0)
            return;
        record.progress = std::min(100.0, 100.0 * static_cast<double>(onDisk) / *total);
        if (record.progress - lastPublished >= kFileProgressStep || record.progress >= 100.0) {
            lastPublished = record.progress;
            emit({EventKind::FileProgress, record.filename, record.progress, true, {},
                  static_cast<std::size_t>(onDisk), static_cast<std::size_t>(*total)});
        }
    };

    if (allowResume) {
        std::error_code ec;
        const auto onDisk = fs::file_size(partial, ec);
        if (!ec && record.sizeBytes && onDisk == *record.sizeBytes && onDisk > 0) {
            // A previous run fetched everything but was stopped before verification
            return TransferResult{false, true};
        }
        auto resumed = resume_.resumeDownload(record, url, partial, options, shouldCancel, onBytes);
        if (!resumed)
            return resumed.error();
        if (resumed.value())
            return TransferResult{false, true};
    }

    options.acceptCompressed = settings_.compressTextAssets && !record.isBinary();

    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "cannot open " + partial.string() + " for writing"};
    }

    std::uint64_t written = 0;
    auto sink = [&](std::span<const std::byte> bytes) -> Result<void> {
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Error{ErrorCode::IoError, "write to " + partial.string() + " failed"};
        }
        written += bytes.size();
        onBytes(written, record.sizeBytes);
        return {};
    };

    auto res = http_.get(url, options, std::nullopt, sink, shouldCancel);
    out.close();
    if (!res)
        return res.error();

    const auto& meta = res.value();
    if (meta.status < 200 || meta.status >= 300) {
        std::error_code ec;
        fs::remove(partial, ec);
        return Error{classifyHttpStatus(meta.status),
                     fmt::format("HTTP {} for {}", meta.status, record.localName())};
    }
    if (out.fail()) {
        return Error{ErrorCode::IoError, "failed to finish writing " + partial.string()};
    }

    TransferResult result;
    result.contentEncoded = meta.contentEncoding.has_value();
    if (!result.contentEncoded && meta.contentLength && !record.sizeBytes) {
        record.sizeBytes = meta.contentLength;
    }
    record.downloadedBytes = written;
    return result;
}

Result<void> DownloadOrchestrator::verifyDownloaded(const FileRecord& record,
                                                    const fs::path& path, bool contentEncoded,
                                                    std::string* calculated) const {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "downloaded file missing: " + ec.message()};
    }
    if (!contentEncoded && record.sizeBytes && size != *record.sizeBytes) {
        return Error{ErrorCode::HashMismatch,
                     fmt::format("size mismatch: expected {} bytes, got {}", *record.sizeBytes,
                                 size)};
    }
    if (!settings_.verifyIntegrity)
        return {};

    auto algo = integrity::detectAlgorithm(record.contentHash);
    if (!algo) {
        spdlog::debug("{}: hash '{}' has no known digest length, not verified", record.filename,
                      record.contentHash);
        return {};
    }

    try {
        integrity::ContentHasher hasher(*algo);
        auto digest = hasher.hashFile(path, [this] { return cancelled_.load(); });
        if (!digest)
            return digest.error();
        *calculated = digest.value();
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    if (!integrity::digestsEqual(*calculated, record.contentHash)) {
        return Error{ErrorCode::HashMismatch,
                     fmt::format("{} mismatch: expected {}, got {}",
                                 integrity::algorithmName(*algo), record.contentHash,
                                 *calculated)};
    }
    return {};
}

bool DownloadOrchestrator::presentAndIntact(const FileRecord& record,
                                            const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return false;
    if (record.sizeBytes) {
        const auto size = fs::file_size(path, ec);
        return !ec && size == *record.sizeBytes;
    }
    auto digest = integrity::ContentHasher::hashFileFor(path, record.contentHash);
    return digest && integrity::digestsEqual(digest.value(), record.contentHash);
}

bool DownloadOrchestrator::sleepUnlessCancelled(std::chrono::milliseconds delay) const {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (!cancelled_) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(kCancelPollInterval, deadline - now));
    }
    return false;
}

RequestOptions DownloadOrchestrator::requestOptionsFor(const FileRecord& record) const {
    RequestOptions options;
    options.timeout = config::adaptiveTimeout(settings_, record);
    options.connectTimeout = config::connectTimeout(settings_);
    options.stallTimeout = settings_.stallTimeout;
    options.useHttp2 = settings_.useHttp2;
    options.bufferSize = config::adaptiveChunkSize(settings_, record);
    return options;
}

void DownloadOrchestrator::emit(ProgressEvent ev) const {
    if (events_)
        events_->publish(std::move(ev));
}

void DownloadOrchestrator::trackStart() {
    const auto now = inFlight_.fetch_add(1) + 1;
    auto peak = peakInFlight_.load();
    while (now > peak && !peakInFlight_.compare_exchange_weak(peak, now)) {
    }
}

void DownloadOrchestrator::trackEnd() {
    inFlight_.fetch_sub(1);
}

} // namespace assetsync::downloader
