#pragma once

#include <assetsync/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace assetsync::integrity {

/**
 * Digest memo keyed by file path and invalidated by size or mtime changes.
 *
 * A hit means the file has not been touched since it was last hashed, so
 * re-verification can skip reading it. Safe for concurrent readers and writers.
 */
class VerificationCache {
public:
    struct Entry {
        std::uint64_t size = 0;
        std::int64_t mtime = 0; // file_time_type ticks
        std::string digest;
    };

    std::optional<std::string> lookup(const std::string& path, std::uint64_t size,
                                      std::int64_t mtime) const;
    void store(const std::string& path, std::uint64_t size, std::int64_t mtime,
               std::string digest);
    void erase(const std::string& path);
    void clear();
    std::size_t size() const;

    // A missing file leaves the cache empty and is not an error
    Result<void> load(const std::filesystem::path& file);
    Result<void> save(const std::filesystem::path& file) const;

    // Size and mtime ticks of a file on disk, if it can be stat'ed
    static std::optional<Entry> statFile(const std::filesystem::path& path);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace assetsync::integrity
