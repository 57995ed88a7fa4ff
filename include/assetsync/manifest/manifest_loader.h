#pragma once

#include <assetsync/core/file_record.h>
#include <assetsync/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace assetsync::manifest {

struct DiffCounts {
    std::size_t existing = 0; // identical (filename, hash) already known
    std::size_t added = 0;
    std::size_t updated = 0; // same filename, new hash
    std::size_t removed = 0; // known keys absent from the new manifest
};

struct ManifestDiff {
    std::vector<FileRecord> merged;
    DiffCounts counts;
};

/**
 * @brief Parse a flat {"filename": "hexhash", ...} manifest.
 *
 * Entries come back in manifest order as fresh PENDING records. A trailing comma before
 * the closing brace, a trailing comma at the end of the text and one dangling extra
 * closing brace are repaired before parsing.
 *
 * @return ParseError for a non-object root, a non-string value or unparseable text
 */
Result<std::vector<FileRecord>> parseMapping(std::string_view text);

// Read and parse a manifest file
Result<std::vector<FileRecord>> loadMapping(const std::filesystem::path& path);

/**
 * @brief Load a manifest and merge it against previously known records.
 *
 * Records whose (filename, hash) key is already known keep their status, progress and
 * verification fields. Everything else starts fresh. Nothing on disk is touched.
 */
Result<ManifestDiff> loadMappingWithDiff(const std::filesystem::path& path,
                                         const std::vector<FileRecord>& prior);

// The merge step of loadMappingWithDiff on an already-parsed manifest
ManifestDiff diffAgainst(std::vector<FileRecord> fresh, const std::vector<FileRecord>& prior);

} // namespace assetsync::manifest
