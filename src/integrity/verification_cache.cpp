#include <assetsync/integrity/verification_cache.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>

namespace assetsync::integrity {

using json = nlohmann::json;

namespace {
constexpr int kCacheFormatVersion = 1;
}

std::optional<std::string> VerificationCache::lookup(const std::string& path, std::uint64_t size,
                                                     std::int64_t mtime) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end() || it->second.size != size || it->second.mtime != mtime) {
        return std::nullopt;
    }
    return it->second.digest;
}

void VerificationCache::store(const std::string& path, std::uint64_t size, std::int64_t mtime,
                              std::string digest) {
    std::unique_lock lock(mutex_);
    entries_[path] = Entry{size, mtime, std::move(digest)};
}

void VerificationCache::erase(const std::string& path) {
    std::unique_lock lock(mutex_);
    entries_.erase(path);
}

void VerificationCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

std::size_t VerificationCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

Result<void> VerificationCache::load(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        clear();
        return {};
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot open verification cache " + file.string()};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("entries") ||
        !doc["entries"].is_array()) {
        return Error{ErrorCode::ParseError, "malformed verification cache " + file.string()};
    }

    std::unordered_map<std::string, Entry> loaded;
    for (const auto& item : doc["entries"]) {
        if (!item.is_object())
            continue;
        auto path = item.value("path", std::string{});
        auto digest = item.value("digest", std::string{});
        if (path.empty() || digest.empty())
            continue;
        loaded[path] = Entry{item.value("size", std::uint64_t{0}),
                             item.value("mtime", std::int64_t{0}), std::move(digest)};
    }

    std::unique_lock lock(mutex_);
    entries_ = std::move(loaded);
    spdlog::debug("Loaded {} verification cache entries from {}", entries_.size(),
                  file.string());
    return {};
}

Result<void> VerificationCache::save(const std::filesystem::path& file) const {
    json doc;
    doc["version"] = kCacheFormatVersion;
    auto entries = json::array();
    {
        std::shared_lock lock(mutex_);
        for (const auto& [path, entry] : entries_) {
            entries.push_back(json{{"path", path},
                                   {"size", entry.size},
                                   {"mtime", entry.mtime},
                                   {"digest", entry.digest}});
        }
    }
    doc["entries"] = std::move(entries);

    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
    }
    auto tmp = file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "cannot write " + tmp.string()};
        }
        out << doc.dump();
        if (!out) {
            return Error{ErrorCode::IoError, "failed writing " + tmp.string()};
        }
    }
    std::filesystem::rename(tmp, file, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "cannot replace " + file.string() + ": " + ec.message()};
    }
    return {};
}

std::optional<VerificationCache::Entry>
VerificationCache::statFile(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec)
        return std::nullopt;
    auto lwt = std::filesystem::last_write_time(path, ec);
    if (ec)
        return std::nullopt;
    return Entry{size, static_cast<std::int64_t>(lwt.time_since_epoch().count()), {}};
}

} // namespace assetsync::integrity
