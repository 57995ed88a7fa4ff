#include <assetsync/session/session.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <unordered_set>
#include <utility>

namespace assetsync::session {

namespace fs = std::filesystem;

Session::Session(config::DownloadSettings settings, fs::path stateFile,
                 std::unique_ptr<downloader::IHttpAdapter> http, EventListener listener)
    : settings_(std::move(settings)),
      store_(std::move(stateFile)),
      bloom_(cache::kDefaultExpectedFiles, settings_.cache.bloomFpRate),
      events_(std::make_unique<EventChannel>(std::move(listener))),
      http_(std::move(http)) {
    settings_.normalize();
    if (!http_) {
        http_ = downloader::makeCurlHttpAdapter(settings_.connectionLimit);
    }
    orchestrator_ = std::make_unique<downloader::DownloadOrchestrator>(settings_, *http_, &bloom_,
                                                                       events_.get());
    verifier_ = std::make_unique<integrity::ParallelVerifier>(&verificationCache_);
    store_.setLoadListener([this](const std::vector<FileRecord>& loaded) {
        auto info = bloom_.buildFromCompleted(loaded);
        spdlog::debug("Bloom filter rebuilt from {} completed file(s), {} bits",
                      info.completedFiles, info.filter.bitCount);
    });
}

Session::~Session() {
    events_->close();
}

fs::path Session::verificationCachePath() const {
    auto p = store_.path();
    p.replace_extension(".verify-cache.json");
    return p;
}

Result<void> Session::loadState() {
    auto snapshot = store_.load();
    if (!snapshot) {
        return snapshot.error();
    }
    records_ = std::move(snapshot.value().records);
    if (!outputDir_ && snapshot.value().outputDir) {
        outputDir_ = fs::path(*snapshot.value().outputDir);
    }

    if (auto cached = verificationCache_.load(verificationCachePath()); !cached) {
        spdlog::warn("Ignoring verification cache: {}", cached.error().message);
        verificationCache_.clear();
    }

    events_->log(fmt::format("loaded {} record(s) from {}", records_.size(),
                             store_.path().string()));
    return {};
}

Result<manifest::DiffCounts> Session::loadManifest(const fs::path& path) {
    auto diff = manifest::loadMappingWithDiff(path, records_);
    if (!diff) {
        return diff.error();
    }
    records_ = std::move(diff.value().merged);
    const auto counts = diff.value().counts;
    auto line = fmt::format("manifest {}: {} known, {} new, {} updated, {} removed",
                            path.filename().string(), counts.existing, counts.added,
                            counts.updated, counts.removed);
    spdlog::info("{}", line);
    events_->log(std::move(line));
    return counts;
}

Result<void> Session::setOutputDir(const fs::path& dir) {
    if (auto ok = downloader::DownloadOrchestrator::ensureWritable(dir); !ok) {
        return ok.error();
    }
    std::error_code ec;
    auto absolute = fs::absolute(dir, ec);
    outputDir_ = ec ? dir : absolute;
    return {};
}

Result<void> Session::saveState() {
    return store_.save(records_, outputDir_);
}

Result<void> Session::clearState() {
    records_.clear();
    verificationCache_.clear();
    rebuildBloom();
    std::error_code ec;
    fs::remove(verificationCachePath(), ec);
    return store_.clear();
}

Result<fs::path> Session::requireOutputDir() const {
    if (!outputDir_) {
        return Error{ErrorCode::InvalidArgument, "no output directory selected"};
    }
    return *outputDir_;
}

Result<downloader::DownloadReport> Session::download() {
    auto dir = requireOutputDir();
    if (!dir) {
        return dir.error();
    }
    auto report = orchestrator_->downloadFiles(records_, dir.value());
    rebuildBloom();
    return report;
}

Result<downloader::DownloadReport> Session::redownloadVerifyFailed() {
    auto dir = requireOutputDir();
    if (!dir) {
        return dir.error();
    }
    for (const auto& record : records_) {
        if (record.status == DownloadStatus::VerifyFailed) {
            verificationCache_.erase(record.pathIn(dir.value()).string());
        }
    }
    auto report = orchestrator_->redownloadVerifyFailed(records_, dir.value());
    rebuildBloom();
    return report;
}

Result<integrity::VerifySummary> Session::verify() {
    auto dir = requireOutputDir();
    if (!dir) {
        return dir.error();
    }

    std::vector<FileRecord*> targets;
    for (auto& record : records_) {
        if (record.status == DownloadStatus::Completed ||
            record.status == DownloadStatus::VerifyFailed) {
            targets.push_back(&record);
        }
    }

    const auto total = targets.size();
    std::size_t done = 0;
    events_->publish({EventKind::Started, {}, 0.0, true,
                      fmt::format("verifying {} file(s)", total), 0, total});
    auto summary =
        verifier_->verifyParallel(targets, dir.value(), [&](const integrity::VerifyOutcome& o) {
            ++done;
            events_->publish({EventKind::VerifyResult, o.filename, 100.0, o.matched,
                              o.matched ? std::string{} : o.error, done, total});
            events_->publish({EventKind::OverallProgress, {},
                              100.0 * static_cast<double>(done) / static_cast<double>(total),
                              true, {}, done, total});
        });

    if (auto saved = verificationCache_.save(verificationCachePath()); !saved) {
        spdlog::warn("Could not persist verification cache: {}", saved.error().message);
    }
    rebuildBloom();

    if (summary.cancelled) {
        events_->publish({EventKind::Cancelled, {}, 0.0, false, "verification cancelled",
                          summary.processed, total});
    }
    events_->publish({EventKind::Finished, {}, 100.0, summary.mismatched == 0,
                      fmt::format("{} matched, {} mismatched, {} missing", summary.matched,
                                  summary.mismatched, summary.missing),
                      summary.processed, total});
    return summary;
}

std::size_t Session::skip(const std::vector<std::string>& filenames, const std::string& reason) {
    std::unordered_set<std::string> wanted(filenames.begin(), filenames.end());
    std::size_t changed = 0;
    for (auto& record : records_) {
        if (!wanted.count(record.filename) || record.status == DownloadStatus::Completed ||
            record.status == DownloadStatus::Skipped)
            continue;
        record.markSkipped(reason);
        ++changed;
    }
    if (changed > 0) {
        spdlog::info("Skipped {} file(s): {}", changed, reason);
    }
    return changed;
}

void Session::cancel() {
    orchestrator_->cancel();
    verifier_->cancel();
}

void Session::resetCancel() {
    orchestrator_->resetCancel();
    verifier_->resetCancel();
}

bool Session::isCancelled() const {
    return orchestrator_->isCancelled() || verifier_->isCancelled();
}

state::StatusCounts Session::statistics() const {
    return state::StateStore::getStatistics(records_);
}

state::SizeTotals Session::totalSize() const {
    return state::StateStore::getTotalSize(records_);
}

void Session::rebuildBloom() {
    auto info = bloom_.buildFromCompleted(records_);
    spdlog::debug("Bloom filter rebuilt from {} completed file(s)", info.completedFiles);
}

} // namespace assetsync::session
