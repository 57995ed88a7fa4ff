#include <assetsync/integrity/parallel_verifier.h>

#include <assetsync/core/worker_pool.h>
#include <assetsync/integrity/content_hasher.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace assetsync::integrity {

ParallelVerifier::ParallelVerifier(VerificationCache* cache) : cache_(cache) {}

std::size_t ParallelVerifier::optimalThreads(std::size_t fileCount, std::size_t cpuCores) {
    if (cpuCores == 0)
        cpuCores = 4;
    const std::size_t base = std::min<std::size_t>(cpuCores * 4, 32);
    if (fileCount < 10)
        return std::max<std::size_t>(1, std::min<std::size_t>(fileCount, 4));
    if (fileCount < 100)
        return std::max<std::size_t>(1, std::min<std::size_t>(base / 2, 16));
    return base;
}

std::size_t ParallelVerifier::optimalBatchSize(std::size_t fileCount) {
    if (fileCount < 20)
        return std::max<std::size_t>(1, std::min<std::size_t>(fileCount, 10));
    if (fileCount < 200)
        return std::min<std::size_t>(50, fileCount);
    if (fileCount < 1000)
        return 30;
    if (fileCount < 5000)
        return 20;
    return 15;
}

VerifySummary ParallelVerifier::verifyParallel(const std::vector<FileRecord*>& records,
                                               const std::filesystem::path& dir,
                                               const ResultCallback& onResult) {
    VerifySummary summary;
    summary.total = records.size();
    if (records.empty())
        return summary;

    const auto started = std::chrono::steady_clock::now();
    summary.threads = optimalThreads(records.size(), std::thread::hardware_concurrency());
    summary.batchSize = optimalBatchSize(records.size());
    spdlog::info("Verifying {} file(s) with {} threads, batch size {}", records.size(),
                 summary.threads, summary.batchSize);

    for (auto* record : records) {
        record->hashVerifyStatus = HashVerifyStatus::Verifying;
    }

    std::mutex resultMutex;
    WorkerPool pool(summary.threads);
    std::size_t next = 0;
    for (; next < records.size(); next += summary.batchSize) {
        if (cancelled_)
            break;
        const auto end = std::min(next + summary.batchSize, records.size());
        for (std::size_t i = next; i < end; ++i) {
            pool.enqueue([this, &records, &dir, &resultMutex, &summary, &onResult, i] {
                auto& record = *records[i];
                if (cancelled_) {
                    record.hashVerifyStatus = HashVerifyStatus::NotVerified;
                    return;
                }
                auto outcome = verifyOne(record, dir);

                std::lock_guard lock(resultMutex);
                ++summary.processed;
                if (outcome.fromCache)
                    ++summary.cacheHits;
                else
                    summary.bytesHashed += outcome.fileSize;
                if (outcome.missing)
                    ++summary.missing;
                else if (!outcome.error.empty() && outcome.calculated.empty())
                    ++summary.errors;
                else if (outcome.matched)
                    ++summary.matched;
                else
                    ++summary.mismatched;
                if (onResult)
                    onResult(outcome);
            });
        }
        pool.waitIdle();
        std::this_thread::yield();
    }

    // Records never reached keep their previous verification state
    for (std::size_t i = next; i < records.size(); ++i) {
        if (records[i]->hashVerifyStatus == HashVerifyStatus::Verifying)
            records[i]->hashVerifyStatus = HashVerifyStatus::NotVerified;
    }

    summary.cancelled = cancelled_.load();
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    const double seconds = static_cast<double>(summary.duration.count()) / 1000.0;
    const double mbps =
        seconds > 0 ? static_cast<double>(summary.bytesHashed) / (1024.0 * 1024.0) / seconds : 0.0;
    spdlog::info("Verification {}: {} matched, {} mismatched, {} missing, {} errors, "
                 "{} cache hits ({:.1f} MB/s)",
                 summary.cancelled ? "cancelled" : "finished", summary.matched,
                 summary.mismatched, summary.missing, summary.errors, summary.cacheHits, mbps);
    return summary;
}

VerifyOutcome ParallelVerifier::verifyOne(FileRecord& record,
                                          const std::filesystem::path& dir) const {
    VerifyOutcome outcome;
    outcome.filename = record.filename;
    outcome.expected = toLowerAscii(record.contentHash);

    const auto path = record.pathIn(dir);
    auto stat = VerificationCache::statFile(path);
    if (!stat) {
        outcome.missing = true;
        outcome.error = "file missing";
        record.hashVerifyStatus = HashVerifyStatus::NotVerified;
        record.diskVerified = false;
        record.status = DownloadStatus::Pending;
        record.errorMessage = outcome.error;
        if (cache_)
            cache_->erase(path.string());
        return outcome;
    }
    outcome.fileSize = stat->size;

    std::optional<std::string> digest;
    if (cache_) {
        digest = cache_->lookup(path.string(), stat->size, stat->mtime);
        outcome.fromCache = digest.has_value();
    }

    if (!digest) {
        auto hashed = ContentHasher::hashFileFor(path, record.contentHash,
                                                 [this] { return cancelled_.load(); });
        if (!hashed) {
            outcome.error = hashed.error().message;
            record.hashVerifyStatus = HashVerifyStatus::NotVerified;
            if (hashed.error().code != ErrorCode::OperationCancelled) {
                spdlog::warn("{}: cannot verify: {}", record.filename, outcome.error);
            }
            return outcome;
        }
        digest = std::move(hashed).value();
        if (cache_)
            cache_->store(path.string(), stat->size, stat->mtime, *digest);
    }

    outcome.calculated = *digest;
    outcome.matched = digestsEqual(outcome.calculated, outcome.expected);
    record.markHashVerified(outcome.calculated, outcome.matched);
    if (outcome.matched) {
        if (record.status == DownloadStatus::VerifyFailed) {
            record.status = DownloadStatus::Completed;
            record.errorMessage.reset();
        }
    } else {
        outcome.error = "hash mismatch: expected " + outcome.expected + ", got " +
                        outcome.calculated;
        spdlog::warn("{}: {}", record.filename, outcome.error);
    }
    return outcome;
}

} // namespace assetsync::integrity
