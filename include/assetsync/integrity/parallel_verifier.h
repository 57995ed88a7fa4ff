#pragma once

#include <assetsync/core/file_record.h>
#include <assetsync/integrity/verification_cache.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace assetsync::integrity {

/**
 * Outcome of verifying one file against its manifest digest
 */
struct VerifyOutcome {
    std::string filename;
    bool matched = false;
    bool missing = false;
    bool fromCache = false;
    std::string expected;
    std::string calculated;
    std::string error;
    std::uint64_t fileSize = 0;
};

struct VerifySummary {
    std::size_t total = 0;
    std::size_t processed = 0;
    std::size_t matched = 0;
    std::size_t mismatched = 0;
    std::size_t missing = 0;
    std::size_t errors = 0;
    std::size_t cacheHits = 0;
    std::uint64_t bytesHashed = 0;
    std::size_t threads = 0;
    std::size_t batchSize = 0;
    bool cancelled = false;
    std::chrono::milliseconds duration{0};
};

/**
 * Hashes completed files on a worker pool and records the verification result on each
 * record.
 *
 * Records move to VERIFYING while queued and end in VERIFIED_SUCCESS or VERIFIED_FAILED;
 * a mismatch also sets VERIFY_FAILED so a normal sync leaves the file for an explicit
 * redownload. Files are never deleted here. A missing file sends its record back to
 * PENDING. Results are handed to the callback one at a time and are not accumulated.
 */
class ParallelVerifier {
public:
    using ResultCallback = std::function<void(const VerifyOutcome&)>;

    explicit ParallelVerifier(VerificationCache* cache = nullptr);

    VerifySummary verifyParallel(const std::vector<FileRecord*>& records,
                                 const std::filesystem::path& dir,
                                 const ResultCallback& onResult = {});

    // The file being hashed finishes; nothing new is started
    void cancel() { cancelled_ = true; }
    void resetCancel() { cancelled_ = false; }
    bool isCancelled() const { return cancelled_.load(); }

    static std::size_t optimalThreads(std::size_t fileCount, std::size_t cpuCores);
    static std::size_t optimalBatchSize(std::size_t fileCount);

private:
    VerifyOutcome verifyOne(FileRecord& record, const std::filesystem::path& dir) const;

    VerificationCache* cache_;
    std::atomic<bool> cancelled_{false};
};

} // namespace assetsync::integrity
