#include <assetsync/cache/bloom_filter.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace assetsync::cache {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

std::uint64_t fnv1a64(std::string_view s) {
    std::uint64_t h = kFnvOffset;
    for (unsigned char c : s) {
        h ^= c;
        h *= kFnvPrime;
    }
    return h;
}

std::uint64_t splitmix64(std::uint64_t x) {
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}

} // namespace

BloomFilter::BloomFilter(std::size_t expectedItems, double falsePositiveRate)
    : expectedItems_(std::max<std::size_t>(1, expectedItems)),
      fpRate_(falsePositiveRate > 0.0 && falsePositiveRate < 1.0 ? falsePositiveRate
                                                                  : kDefaultFalsePositiveRate) {
    allocate();
}

void BloomFilter::allocate() {
    const double ln2 = std::log(2.0);
    const double n = static_cast<double>(expectedItems_);
    bitCount_ = static_cast<std::size_t>(std::ceil(-(n * std::log(fpRate_)) / (ln2 * ln2)));
    bitCount_ = std::max<std::size_t>(64, bitCount_);
    hashCount_ = static_cast<std::size_t>(
        std::ceil(static_cast<double>(bitCount_) / n * ln2));
    hashCount_ = std::max<std::size_t>(1, hashCount_);
    words_.assign((bitCount_ + 63) / 64, 0);
    itemCount_ = 0;
}

std::pair<std::uint64_t, std::uint64_t> BloomFilter::hashPair(std::string_view item) const {
    const std::uint64_t h1 = fnv1a64(item);
    // Odd step so successive probes cycle through distinct positions
    const std::uint64_t h2 = splitmix64(h1 ^ 0x5bd1e995ull) | 1ull;
    return {h1, h2};
}

void BloomFilter::add(std::string_view item) {
    auto [h1, h2] = hashPair(item);
    for (std::size_t i = 0; i < hashCount_; ++i) {
        const std::uint64_t bit = (h1 + i * h2) % bitCount_;
        words_[bit / 64] |= (1ull << (bit % 64));
    }
    ++itemCount_;
}

bool BloomFilter::mightContain(std::string_view item) const {
    if (itemCount_ == 0)
        return false;
    auto [h1, h2] = hashPair(item);
    for (std::size_t i = 0; i < hashCount_; ++i) {
        const std::uint64_t bit = (h1 + i * h2) % bitCount_;
        if ((words_[bit / 64] & (1ull << (bit % 64))) == 0)
            return false;
    }
    return true;
}

void BloomFilter::clear() {
    std::fill(words_.begin(), words_.end(), 0);
    itemCount_ = 0;
}

void BloomFilter::ensureCapacity(std::size_t expectedItems) {
    if (expectedItems <= expectedItems_) {
        clear();
        return;
    }
    expectedItems_ = expectedItems;
    allocate();
}

double BloomFilter::estimatedFalsePositiveRate() const {
    if (itemCount_ == 0)
        return 0.0;
    const double k = static_cast<double>(hashCount_);
    const double exponent =
        -k * static_cast<double>(itemCount_) / static_cast<double>(bitCount_);
    return std::pow(1.0 - std::exp(exponent), k);
}

BloomFilterInfo BloomFilter::info() const {
    BloomFilterInfo i;
    i.expectedItems = expectedItems_;
    i.itemCount = itemCount_;
    i.bitCount = bitCount_;
    i.hashFunctions = hashCount_;
    i.memoryBytes = words_.size() * sizeof(std::uint64_t);
    i.targetFalsePositiveRate = fpRate_;
    i.estimatedFalsePositiveRate = estimatedFalsePositiveRate();
    return i;
}

FileBloomFilter::FileBloomFilter(std::size_t expectedFiles, double falsePositiveRate)
    : filter_(expectedFiles, falsePositiveRate) {}

BloomBuildInfo FileBloomFilter::buildFromCompleted(const std::vector<FileRecord>& records) {
    std::vector<const FileRecord*> completed;
    for (const auto& r : records) {
        if (r.status == DownloadStatus::Completed && r.diskVerified)
            completed.push_back(&r);
    }

    filter_.ensureCapacity(completed.size());
    for (const auto* r : completed) {
        filter_.add(r->localName());
    }
    built_ = true;

    BloomBuildInfo out;
    out.filter = filter_.info();
    out.completedFiles = completed.size();
    out.builtAt = formatIsoTimestamp(std::chrono::system_clock::now());
    spdlog::debug("Bloom filter rebuilt: {} items, {} bits, {} hashes, est. FP {:.4f}",
                  out.filter.itemCount, out.filter.bitCount, out.filter.hashFunctions,
                  out.filter.estimatedFalsePositiveRate);
    return out;
}

PreFilterResult FileBloomFilter::fastPreFilter(const std::vector<FileRecord*>& records) const {
    PreFilterResult out;
    for (auto* r : records) {
        if (filter_.mightContain(r->localName()))
            out.likelyExisting.push_back(r);
        else
            out.definitelyNew.push_back(r);
    }
    return out;
}

} // namespace assetsync::cache
