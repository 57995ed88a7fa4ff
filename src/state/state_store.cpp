#include <assetsync/state/state_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>

namespace assetsync::state {

using json = nlohmann::json;

namespace {

constexpr std::size_t kSaveChunk = 2000;
constexpr std::size_t kCompactAbove = 1000;

template <typename T> void putOptional(json& j, const char* key, const std::optional<T>& v) {
    if (v)
        j[key] = *v;
    else
        j[key] = nullptr;
}

json toJson(const FileRecord& r) {
    json j;
    j["filename"] = r.filename;
    j["contentHash"] = r.contentHash;
    j["status"] = std::string(toTag(r.status));
    j["progress"] = r.progress;
    putOptional(j, "sizeBytes", r.sizeBytes);
    j["downloadedBytes"] = r.downloadedBytes;
    putOptional(j, "localPath", r.localPath);
    putOptional(j, "errorMessage", r.errorMessage);
    putOptional(j, "downloadUrl", r.downloadUrl);
    putOptional(j, "mtime", r.mtime);
    j["diskVerified"] = r.diskVerified;
    putOptional(j, "lastCheckedAt", r.lastCheckedAt);
    j["cacheSchemaVersion"] = r.cacheSchemaVersion;
    j["hashVerifyStatus"] = std::string(toTag(r.hashVerifyStatus));
    putOptional(j, "hashVerifiedAt", r.hashVerifiedAt);
    putOptional(j, "calculatedHash", r.calculatedHash);
    return j;
}

// First present, non-null key among the candidates (camelCase first, legacy snake_case after)
const json* field(const json& j, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = j.find(k);
        if (it != j.end() && !it->is_null())
            return &*it;
    }
    return nullptr;
}

std::optional<std::string> optString(const json& j, std::initializer_list<const char*> keys) {
    const json* v = field(j, keys);
    if (v && v->is_string())
        return v->get<std::string>();
    return std::nullopt;
}

Result<FileRecord> fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::ParseError, "file entry is not an object"};
    }
    auto name = optString(j, {"filename"});
    auto hash = optString(j, {"contentHash", "md5"});
    if (!name || !hash) {
        return Error{ErrorCode::ParseError, "file entry lacks filename or contentHash"};
    }

    FileRecord r(*name, *hash);
    if (auto tag = optString(j, {"status"})) {
        r.status = downloadStatusFromTag(*tag).value_or(DownloadStatus::Pending);
    }
    if (const json* v = field(j, {"progress"}); v && v->is_number())
        r.progress = v->get<double>();
    if (const json* v = field(j, {"sizeBytes", "size"}); v && v->is_number_unsigned())
        r.sizeBytes = v->get<std::uint64_t>();
    if (const json* v = field(j, {"downloadedBytes", "downloaded_size"}); v && v->is_number_unsigned())
        r.downloadedBytes = v->get<std::uint64_t>();
    r.localPath = optString(j, {"localPath", "local_path"});
    r.errorMessage = optString(j, {"errorMessage", "error_message"});
    r.downloadUrl = optString(j, {"downloadUrl", "download_url"});
    if (const json* v = field(j, {"mtime"}); v && v->is_number_integer())
        r.mtime = v->get<std::int64_t>();
    if (const json* v = field(j, {"diskVerified"}); v && v->is_boolean())
        r.diskVerified = v->get<bool>();
    r.lastCheckedAt = optString(j, {"lastCheckedAt"});
    if (auto v = optString(j, {"cacheSchemaVersion"}))
        r.cacheSchemaVersion = *v;
    if (auto tag = optString(j, {"hashVerifyStatus"})) {
        r.hashVerifyStatus = hashVerifyStatusFromTag(*tag).value_or(HashVerifyStatus::NotVerified);
    }
    r.hashVerifiedAt = optString(j, {"hashVerifiedAt"});
    r.calculatedHash = optString(j, {"calculatedHash"});

    // A record left mid-transfer by a crash is pending again
    if (r.status == DownloadStatus::Downloading)
        r.status = DownloadStatus::Pending;
    if (r.hashVerifyStatus == HashVerifyStatus::Verifying)
        r.hashVerifyStatus = HashVerifyStatus::NotVerified;
    return r;
}

} // namespace

std::string_view toTag(CacheRecommendation r) {
    switch (r) {
        case CacheRecommendation::CacheReliable: return "cache_reliable";
        case CacheRecommendation::IncrementalCheck: return "incremental_check";
        case CacheRecommendation::FullScan: return "full_scan";
    }
    return "full_scan";
}

ReliabilityPolicy ReliabilityPolicy::from(const config::CacheSettings& cache) {
    ReliabilityPolicy p;
    p.sampleRatio = cache.sampleRatio;
    p.minSample = cache.minSample;
    p.reliableThreshold = cache.reliableThreshold;
    p.incrementalThreshold = cache.incrementalThreshold;
    p.freshness = cache.freshness;
    return p;
}

StateStore::StateStore(std::filesystem::path stateFile) : stateFile_(std::move(stateFile)) {}

Result<StateSnapshot> StateStore::load() const {
    StateSnapshot snapshot;
    std::error_code ec;
    if (!std::filesystem::exists(stateFile_, ec)) {
        spdlog::debug("No state file at '{}'", stateFile_.string());
        if (onLoaded_)
            onLoaded_(snapshot.records);
        return snapshot;
    }

    std::ifstream in(stateFile_, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot open state file: " + stateFile_.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto doc = json::parse(ss.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::ParseError, "state file is not a JSON object: " +
                                                stateFile_.string()};
    }

    snapshot.outputDir = optString(doc, {"outputDir", "output_dir"});
    snapshot.lastFullScan = optString(doc, {"lastFullScan"});

    if (const json* files = field(doc, {"files"})) {
        if (!files->is_array()) {
            return Error{ErrorCode::ParseError, "state 'files' is not an array"};
        }
        snapshot.records.reserve(files->size());
        for (const auto& entry : *files) {
            auto rec = fromJson(entry);
            if (!rec) {
                return rec.error();
            }
            snapshot.records.push_back(std::move(rec).value());
        }
    }

    spdlog::info("Loaded state '{}' with {} records", stateFile_.string(),
                 snapshot.records.size());
    if (onLoaded_)
        onLoaded_(snapshot.records);
    return snapshot;
}

Result<void> StateStore::save(const std::vector<FileRecord>& records,
                              const std::optional<std::filesystem::path>& outputDir,
                              const ShouldCancel& shouldCancel) const {
    json doc;
    doc["outputDir"] = outputDir ? json(outputDir->string()) : json(nullptr);
    doc["metadataVersion"] = std::string(kMetadataVersion);
    doc["lastFullScan"] = formatIsoTimestamp(std::chrono::system_clock::now());
    doc["totalFiles"] = records.size();

    json files = json::array();
    for (std::size_t start = 0; start < records.size(); start += kSaveChunk) {
        const std::size_t end = std::min(records.size(), start + kSaveChunk);
        for (std::size_t i = start; i < end; ++i) {
            files.push_back(toJson(records[i]));
        }
        if (end < records.size()) {
            if (shouldCancel && shouldCancel()) {
                return Error{ErrorCode::OperationCancelled, "state save cancelled"};
            }
            std::this_thread::yield();
        }
    }
    doc["files"] = std::move(files);

    std::string text;
    try {
        text = records.size() > kCompactAbove ? doc.dump() : doc.dump(2);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InternalError, std::string("state encoding failed: ") + e.what()};
    }

    std::error_code ec;
    if (stateFile_.has_parent_path()) {
        std::filesystem::create_directories(stateFile_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "cannot create state directory: " + ec.message()};
        }
    }

    auto tmp = stateFile_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "cannot write state file: " + tmp.string()};
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            std::filesystem::remove(tmp, ec);
            return Error{ErrorCode::IoError, "failed writing state file: " + tmp.string()};
        }
    }
    std::filesystem::rename(tmp, stateFile_, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        return Error{ErrorCode::IoError, "failed to replace state file: " + ec.message()};
    }

    spdlog::debug("Saved {} records to '{}'", records.size(), stateFile_.string());
    return {};
}

Result<void> StateStore::clear() const {
    std::error_code ec;
    std::filesystem::remove(stateFile_, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "failed to delete state file: " + ec.message()};
    }
    spdlog::info("Cleared state file '{}'", stateFile_.string());
    return {};
}

StatusCounts StateStore::getStatistics(const std::vector<FileRecord>& records) {
    StatusCounts c;
    c.total = records.size();
    for (const auto& r : records) {
        switch (r.status) {
            case DownloadStatus::Pending: ++c.pending; break;
            case DownloadStatus::Downloading: ++c.downloading; break;
            case DownloadStatus::Completed: ++c.completed; break;
            case DownloadStatus::Failed: ++c.failed; break;
            case DownloadStatus::Cancelled: ++c.cancelled; break;
            case DownloadStatus::Skipped: ++c.skipped; break;
            case DownloadStatus::VerifyFailed: ++c.verifyFailed; break;
        }
        if (r.hashVerifyStatus == HashVerifyStatus::VerifiedSuccess)
            ++c.hashVerified;
        else if (r.hashVerifyStatus == HashVerifyStatus::VerifiedFailed)
            ++c.hashMismatched;
    }
    return c;
}

SizeTotals StateStore::getTotalSize(const std::vector<FileRecord>& records) {
    SizeTotals t;
    for (const auto& r : records) {
        if (r.sizeBytes)
            t.total += *r.sizeBytes;
        t.downloaded += r.downloadedBytes;
    }
    return t;
}

CacheReliability StateStore::analyzeCacheReliability(const std::vector<FileRecord>& records,
                                                     const std::filesystem::path& dir,
                                                     const ReliabilityPolicy& policy) {
    std::vector<const FileRecord*> all;
    all.reserve(records.size());
    for (const auto& r : records)
        all.push_back(&r);
    return analyzeCacheReliability(all, dir, policy);
}

CacheReliability StateStore::analyzeCacheReliability(const std::vector<const FileRecord*>& records,
                                                     const std::filesystem::path& dir,
                                                     const ReliabilityPolicy& policy) {
    CacheReliability out;
    std::vector<const FileRecord*> pool;
    for (const auto* r : records) {
        if (r->status == DownloadStatus::Completed && r->diskVerified)
            pool.push_back(r);
    }
    if (pool.empty()) {
        spdlog::debug("Cache reliability: no verified records, recommending full scan");
        return out;
    }

    const auto byRatio =
        static_cast<std::size_t>(std::ceil(static_cast<double>(pool.size()) * policy.sampleRatio));
    const std::size_t sampleSize = std::min(pool.size(), std::max(policy.minSample, byRatio));

    std::vector<const FileRecord*> sample;
    sample.reserve(sampleSize);
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::sample(pool.begin(), pool.end(), std::back_inserter(sample), sampleSize, rng);

    for (const auto* r : sample) {
        std::error_code ec;
        auto size = std::filesystem::file_size(r->pathIn(dir), ec);
        if (ec)
            continue;
        if (r->sizeBytes && size == *r->sizeBytes && r->isFresh(policy.freshness))
            ++out.valid;
    }
    out.sampled = sample.size();
    out.score = static_cast<double>(out.valid) / static_cast<double>(out.sampled);

    if (out.score >= policy.reliableThreshold) {
        out.recommendation = CacheRecommendation::CacheReliable;
    } else if (out.score >= policy.incrementalThreshold) {
        out.recommendation = CacheRecommendation::IncrementalCheck;
    } else {
        out.recommendation = CacheRecommendation::FullScan;
    }
    spdlog::info("Cache reliability {:.2f} ({}/{} sampled valid): {}", out.score, out.valid,
                 out.sampled, toTag(out.recommendation));
    return out;
}

std::vector<const FileRecord*> StateStore::filterRecords(const std::vector<FileRecord>& records,
                                                         std::optional<DownloadStatus> status,
                                                         std::string_view searchText) {
    const std::string needle = toLowerAscii(searchText);
    std::vector<const FileRecord*> out;
    for (const auto& r : records) {
        if (status && r.status != *status)
            continue;
        if (!needle.empty() && toLowerAscii(r.filename).find(needle) == std::string::npos &&
            toLowerAscii(r.contentHash).find(needle) == std::string::npos) {
            continue;
        }
        out.push_back(&r);
    }
    return out;
}

std::string StateStore::formatSize(std::uint64_t bytes) {
    if (bytes == 0)
        return "0 B";
    static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit < std::size(kUnits) - 1) {
        size /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", size, kUnits[unit]);
}

} // namespace assetsync::state
