#pragma once

#include <assetsync/core/file_record.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace assetsync::cache {

inline constexpr std::size_t kDefaultExpectedFiles = 50000;
inline constexpr double kDefaultFalsePositiveRate = 0.01;

struct BloomFilterInfo {
    std::size_t expectedItems = 0;
    std::size_t itemCount = 0;
    std::size_t bitCount = 0;
    std::size_t hashFunctions = 0;
    std::size_t memoryBytes = 0;
    double targetFalsePositiveRate = 0.0;
    double estimatedFalsePositiveRate = 0.0;
};

/**
 * @brief Classic bit-array Bloom filter using double hashing.
 *
 * Sized as m = -n ln(p) / ln(2)^2 bits with k = (m / n) ln(2) probes. Membership
 * queries may return false positives but never false negatives.
 */
class BloomFilter {
public:
    explicit BloomFilter(std::size_t expectedItems = kDefaultExpectedFiles,
                         double falsePositiveRate = kDefaultFalsePositiveRate);

    void add(std::string_view item);
    bool mightContain(std::string_view item) const;
    void clear();

    // Re-size for at least expectedItems, discarding contents; never shrinks
    void ensureCapacity(std::size_t expectedItems);

    std::size_t size() const { return itemCount_; }
    std::size_t bitCount() const { return bitCount_; }
    std::size_t hashFunctions() const { return hashCount_; }
    std::size_t expectedItems() const { return expectedItems_; }

    // (1 - e^(-kn/m))^k for the current item count
    double estimatedFalsePositiveRate() const;
    BloomFilterInfo info() const;

private:
    void allocate();
    std::pair<std::uint64_t, std::uint64_t> hashPair(std::string_view item) const;

    std::size_t expectedItems_;
    double fpRate_;
    std::size_t bitCount_ = 0;
    std::size_t hashCount_ = 0;
    std::size_t itemCount_ = 0;
    std::vector<std::uint64_t> words_;
};

struct BloomBuildInfo {
    BloomFilterInfo filter;
    std::size_t completedFiles = 0;
    std::string builtAt;
};

struct PreFilterResult {
    std::vector<FileRecord*> likelyExisting;
    std::vector<FileRecord*> definitelyNew;
};

// Bloom filter over the local names of files known to be complete on disk
class FileBloomFilter {
public:
    explicit FileBloomFilter(std::size_t expectedFiles = kDefaultExpectedFiles,
                             double falsePositiveRate = kDefaultFalsePositiveRate);

    // Rebuild from COMPLETED + diskVerified records, replacing previous contents
    BloomBuildInfo buildFromCompleted(const std::vector<FileRecord>& records);

    PreFilterResult fastPreFilter(const std::vector<FileRecord*>& records) const;

    bool mightContain(const FileRecord& record) const {
        return filter_.mightContain(record.localName());
    }

    // Built at least once and holding items
    bool isValid() const { return built_ && filter_.size() > 0; }

    const BloomFilter& filter() const { return filter_; }

private:
    BloomFilter filter_;
    bool built_ = false;
};

} // namespace assetsync::cache
