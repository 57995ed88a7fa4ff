#include <assetsync/manifest/manifest_loader.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace assetsync::manifest {

namespace {

using ordered_json = nlohmann::ordered_json;

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string trimmed(std::string_view in) {
    std::size_t b = 0, e = in.size();
    while (b < e && isSpace(in[b]))
        ++b;
    while (e > b && isSpace(in[e - 1]))
        --e;
    return std::string(in.substr(b, e - b));
}

// Remove a comma that directly precedes the final closing brace, and a trailing comma
void repairTrailingComma(std::string& content) {
    if (!content.empty() && content.back() == ',') {
        content.pop_back();
        while (!content.empty() && isSpace(content.back()))
            content.pop_back();
    }
    if (content.empty() || content.back() != '}')
        return;
    std::size_t i = content.size() - 1;
    while (i > 0 && isSpace(content[i - 1]))
        --i;
    if (i > 0 && content[i - 1] == ',') {
        content.erase(i - 1, 1);
    }
}

// "...}}" where the last brace closes nothing
bool dropDanglingBrace(std::string& content) {
    if (content.size() < 2 || content.back() != '}')
        return false;
    std::size_t i = content.size() - 1;
    while (i > 0 && isSpace(content[i - 1]))
        --i;
    if (i == 0 || content[i - 1] != '}')
        return false;
    content.erase(i);
    repairTrailingComma(content);
    return true;
}

} // namespace

Result<std::vector<FileRecord>> parseMapping(std::string_view text) {
    std::string content = trimmed(text);
    if (content.empty()) {
        return Error{ErrorCode::ParseError, "manifest is empty"};
    }
    repairTrailingComma(content);

    auto doc = ordered_json::parse(content, nullptr, false);
    if (doc.is_discarded() && dropDanglingBrace(content)) {
        doc = ordered_json::parse(content, nullptr, false);
    }
    if (doc.is_discarded()) {
        return Error{ErrorCode::ParseError, "manifest is not valid JSON"};
    }
    if (!doc.is_object()) {
        return Error{ErrorCode::ParseError, "manifest root must be an object"};
    }

    std::vector<FileRecord> records;
    records.reserve(doc.size());
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_string()) {
            return Error{ErrorCode::ParseError,
                         "manifest value for '" + it.key() + "' is not a string"};
        }
        if (it.key().empty()) {
            return Error{ErrorCode::ParseError, "manifest contains an empty filename"};
        }
        records.emplace_back(it.key(), it.value().get<std::string>());
    }
    return records;
}

Result<std::vector<FileRecord>> loadMapping(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "manifest not found: " + path.string()};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot open manifest: " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "failed reading manifest: " + path.string()};
    }

    auto parsed = parseMapping(ss.str());
    if (!parsed) {
        spdlog::error("Failed to load manifest '{}': {}", path.string(), parsed.error().message);
        return parsed.error();
    }
    spdlog::info("Loaded manifest '{}' with {} entries", path.string(), parsed.value().size());
    return parsed;
}

ManifestDiff diffAgainst(std::vector<FileRecord> fresh, const std::vector<FileRecord>& prior) {
    std::map<std::pair<std::string, std::string>, const FileRecord*> byKey;
    std::unordered_map<std::string, const FileRecord*> byName;
    for (const auto& r : prior) {
        byKey.emplace(std::make_pair(r.filename, r.contentHash), &r);
        byName.emplace(r.filename, &r);
    }

    ManifestDiff diff;
    diff.merged.reserve(fresh.size());
    std::set<std::pair<std::string, std::string>> freshKeys;

    for (auto& rec : fresh) {
        auto key = std::make_pair(rec.filename, rec.contentHash);
        freshKeys.insert(key);
        if (auto it = byKey.find(key); it != byKey.end()) {
            diff.merged.push_back(*it->second);
            ++diff.counts.existing;
        } else if (byName.count(rec.filename) != 0) {
            diff.merged.push_back(std::move(rec));
            ++diff.counts.updated;
        } else {
            diff.merged.push_back(std::move(rec));
            ++diff.counts.added;
        }
    }

    for (const auto& [key, _] : byKey) {
        if (freshKeys.count(key) == 0)
            ++diff.counts.removed;
    }
    return diff;
}

Result<ManifestDiff> loadMappingWithDiff(const std::filesystem::path& path,
                                         const std::vector<FileRecord>& prior) {
    auto fresh = loadMapping(path);
    if (!fresh) {
        return fresh.error();
    }
    auto diff = diffAgainst(std::move(fresh).value(), prior);
    spdlog::info("Manifest diff: {} existing, {} added, {} updated, {} removed",
                 diff.counts.existing, diff.counts.added, diff.counts.updated,
                 diff.counts.removed);
    return diff;
}

} // namespace assetsync::manifest
