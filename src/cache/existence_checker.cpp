#include <assetsync/cache/existence_checker.h>
#include <assetsync/core/worker_pool.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <system_error>

namespace assetsync::cache {

namespace {

constexpr std::size_t kProgressEvery = 200;

bool cancelled(const ShouldCancel& shouldCancel) {
    return shouldCancel && shouldCancel();
}

// Everything from index `from` onwards was never checked
void spillRemainder(ExistenceResult& out, const std::vector<FileRecord*>& records,
                    std::size_t from) {
    for (std::size_t i = from; i < records.size(); ++i)
        out.toDownload.push_back(records[i]);
    out.cancelled = true;
}

} // namespace

std::string_view toTag(ExistenceTier tier) {
    switch (tier) {
        case ExistenceTier::BloomOnly: return "bloom";
        case ExistenceTier::CacheBased: return "cache";
        case ExistenceTier::Incremental: return "incremental";
        case ExistenceTier::FullScan: return "full_scan";
    }
    return "full_scan";
}

ExistenceChecker::ExistenceChecker(config::CacheSettings settings, const FileBloomFilter* bloom)
    : settings_(std::move(settings)), bloom_(bloom) {}

bool ExistenceChecker::trusted(const FileRecord& record) const {
    // Pending records are never taken on the cache's word
    return record.status == DownloadStatus::Completed && record.diskVerified &&
           record.isFresh(settings_.freshness);
}

bool ExistenceChecker::presentOnDisk(const FileRecord& record, const std::filesystem::path& dir) {
    std::error_code ec;
    auto size = std::filesystem::file_size(record.pathIn(dir), ec);
    if (ec)
        return false;
    return !record.sizeBytes || *record.sizeBytes == size;
}

std::unordered_map<std::string, std::uint64_t>
ExistenceChecker::scanDirectory(const std::filesystem::path& dir) {
    std::unordered_map<std::string, std::uint64_t> listing;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::debug("Scan of '{}' skipped: {}", dir.string(), ec.message());
        return listing;
    }
    for (const auto& entry : it) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc))
            continue;
        auto size = entry.file_size(entryEc);
        if (entryEc)
            continue;
        listing.emplace(entry.path().filename().string(), size);
    }
    return listing;
}

ExistenceResult ExistenceChecker::partition(const std::vector<FileRecord*>& records,
                                            const std::filesystem::path& dir,
                                            const ShouldCancel& shouldCancel,
                                            const CheckProgress& progress) const {
    ExistenceResult out;
    std::vector<FileRecord*> candidates = records;

    if (bloom_ && bloom_->isValid()) {
        auto pre = bloom_->fastPreFilter(records);
        out.bloomDefinitelyNew = pre.definitelyNew.size();
        out.toDownload = std::move(pre.definitelyNew);
        candidates = std::move(pre.likelyExisting);
        out.tier = ExistenceTier::BloomOnly;
        spdlog::info("Bloom prefilter: {} definitely new, {} need a closer look",
                     out.bloomDefinitelyNew, candidates.size());
    }
    if (candidates.empty()) {
        if (progress)
            progress(records.size(), records.size());
        return out;
    }

    std::vector<const FileRecord*> view(candidates.begin(), candidates.end());
    auto reliability = state::StateStore::analyzeCacheReliability(
        view, dir, state::ReliabilityPolicy::from(settings_));

    ExistenceResult tierResult;
    switch (reliability.recommendation) {
        case state::CacheRecommendation::CacheReliable:
            tierResult = cacheBasedCheck(candidates, dir, shouldCancel, progress);
            break;
        case state::CacheRecommendation::IncrementalCheck:
            tierResult = smartIncrementalCheck(candidates, dir, shouldCancel, progress);
            break;
        case state::CacheRecommendation::FullScan:
            tierResult = fullScan(candidates, dir, shouldCancel, progress);
            break;
    }

    out.tier = tierResult.tier;
    out.reliability = reliability;
    out.cancelled = tierResult.cancelled;
    out.existing = std::move(tierResult.existing);
    out.toDownload.insert(out.toDownload.end(), tierResult.toDownload.begin(),
                          tierResult.toDownload.end());
    spdlog::info("Existence check ({}): {} present, {} to download", toTag(out.tier),
                 out.existing.size(), out.toDownload.size());
    return out;
}

ExistenceResult ExistenceChecker::cacheBasedCheck(const std::vector<FileRecord*>& records,
                                                  const std::filesystem::path& dir,
                                                  const ShouldCancel& shouldCancel,
                                                  const CheckProgress& progress) const {
    ExistenceResult out;
    out.tier = ExistenceTier::CacheBased;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (i % kProgressEvery == 0) {
            if (cancelled(shouldCancel)) {
                spillRemainder(out, records, i);
                return out;
            }
            if (progress)
                progress(i, records.size());
        }
        FileRecord* r = records[i];
        (presentOnDisk(*r, dir) ? out.existing : out.toDownload).push_back(r);
    }
    if (progress)
        progress(records.size(), records.size());
    return out;
}

ExistenceResult ExistenceChecker::smartIncrementalCheck(const std::vector<FileRecord*>& records,
                                                        const std::filesystem::path& dir,
                                                        const ShouldCancel& shouldCancel,
                                                        const CheckProgress& progress) const {
    ExistenceResult out;
    out.tier = ExistenceTier::Incremental;

    std::vector<FileRecord*> uncertain;
    for (auto* r : records) {
        if (trusted(*r)) {
            // Trusted records still get a size re-stat
            if (presentOnDisk(*r, dir))
                out.existing.push_back(r);
            else
                out.toDownload.push_back(r);
        } else {
            uncertain.push_back(r);
        }
    }
    spdlog::debug("Incremental check: {} trusted from cache, {} to verify on disk",
                  records.size() - uncertain.size(), uncertain.size());
    if (uncertain.empty()) {
        if (progress)
            progress(records.size(), records.size());
        return out;
    }

    const std::size_t workers = std::min(settings_.incrementalWorkers, uncertain.size());
    const std::size_t batch = settings_.incrementalBatch;
    // One slot per record so workers never share state
    auto found = std::make_unique<bool[]>(uncertain.size());
    WorkerPool pool(workers);

    std::size_t checked = records.size() - uncertain.size();
    for (std::size_t start = 0; start < uncertain.size(); start += batch) {
        if (cancelled(shouldCancel)) {
            spillRemainder(out, uncertain, start);
            return out;
        }
        const std::size_t end = std::min(uncertain.size(), start + batch);
        for (std::size_t i = start; i < end; ++i) {
            pool.enqueue([&found, &uncertain, &dir, i] {
                found[i] = presentOnDisk(*uncertain[i], dir);
            });
        }
        pool.waitIdle();
        for (std::size_t i = start; i < end; ++i)
            (found[i] ? out.existing : out.toDownload).push_back(uncertain[i]);
        checked += end - start;
        if (progress)
            progress(checked, records.size());
    }
    return out;
}

ExistenceResult ExistenceChecker::fullScan(const std::vector<FileRecord*>& records,
                                           const std::filesystem::path& dir,
                                           const ShouldCancel& shouldCancel,
                                           const CheckProgress& progress) const {
    ExistenceResult out;
    out.tier = ExistenceTier::FullScan;

    auto scan = std::async(std::launch::async, [dir] { return scanDirectory(dir); });
    while (scan.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (cancelled(shouldCancel)) {
            // The scan thread is joined by the future's destructor
            spillRemainder(out, records, 0);
            return out;
        }
    }
    const auto listing = scan.get();
    spdlog::debug("Full scan of '{}' found {} files", dir.string(), listing.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        if (i % kProgressEvery == 0) {
            if (cancelled(shouldCancel)) {
                spillRemainder(out, records, i);
                return out;
            }
            if (progress)
                progress(i, records.size());
        }
        FileRecord* r = records[i];
        auto it = listing.find(r->localName());
        const bool present =
            it != listing.end() && (!r->sizeBytes || *r->sizeBytes == it->second);
        (present ? out.existing : out.toDownload).push_back(r);
    }
    if (progress)
        progress(records.size(), records.size());
    return out;
}

} // namespace assetsync::cache
