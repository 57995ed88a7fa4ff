#pragma once

#include <assetsync/cache/bloom_filter.h>
#include <assetsync/config/settings.h>
#include <assetsync/core/file_record.h>
#include <assetsync/core/types.h>
#include <assetsync/state/state_store.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace assetsync::cache {

enum class ExistenceTier { BloomOnly, CacheBased, Incremental, FullScan };

std::string_view toTag(ExistenceTier tier);

struct ExistenceResult {
    std::vector<FileRecord*> existing;
    std::vector<FileRecord*> toDownload;
    ExistenceTier tier = ExistenceTier::FullScan;
    state::CacheReliability reliability;
    std::size_t bloomDefinitelyNew = 0;
    bool cancelled = false;
};

// (checked, total) as the check advances
using CheckProgress = std::function<void(std::size_t, std::size_t)>;

/**
 * @brief Decides which records are already present in the output directory.
 *
 * Tiers cascade from cheapest to most expensive: the Bloom prefilter sends definitely-new
 * records straight to the download queue, the reliability sampler picks between trusting
 * cached disk metadata and re-checking it, and a one-shot directory scan is the fallback.
 * The result always partitions the input: every record lands in exactly one list.
 * Records are only read here; marking them complete is the caller's job.
 */
class ExistenceChecker {
public:
    ExistenceChecker(config::CacheSettings settings, const FileBloomFilter* bloom);

    ExistenceResult partition(const std::vector<FileRecord*>& records,
                              const std::filesystem::path& dir, const ShouldCancel& shouldCancel = {},
                              const CheckProgress& progress = {}) const;

    // Trust fresh verified records after an existence re-check; stat the rest in line
    ExistenceResult cacheBasedCheck(const std::vector<FileRecord*>& records,
                                    const std::filesystem::path& dir,
                                    const ShouldCancel& shouldCancel = {},
                                    const CheckProgress& progress = {}) const;

    // Trust fresh verified records; stat the uncertain subset on a bounded pool
    ExistenceResult smartIncrementalCheck(const std::vector<FileRecord*>& records,
                                          const std::filesystem::path& dir,
                                          const ShouldCancel& shouldCancel = {},
                                          const CheckProgress& progress = {}) const;

    // Scan the directory once and match every record against the listing
    ExistenceResult fullScan(const std::vector<FileRecord*>& records,
                             const std::filesystem::path& dir, const ShouldCancel& shouldCancel = {},
                             const CheckProgress& progress = {}) const;

    // File name to size for every regular file directly inside dir
    static std::unordered_map<std::string, std::uint64_t>
    scanDirectory(const std::filesystem::path& dir);

    // Exists and, when the expected size is known, has that size
    static bool presentOnDisk(const FileRecord& record, const std::filesystem::path& dir);

private:
    bool trusted(const FileRecord& record) const;

    config::CacheSettings settings_;
    const FileBloomFilter* bloom_;
};

} // namespace assetsync::cache
