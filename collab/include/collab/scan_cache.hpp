#pragma once
// ScanCache: resolved region trees keyed by (path, content hash)
//
// Entries are immutable once stored. A store replaces the whole entry, so
// a reader holding a shared_ptr sees either the old tree or the new one.

#include "region_index.hpp"
#include "scanner.hpp"
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace collab {

namespace fs = std::filesystem;

// djb2 over the whole content, mixed with its length, as 16 hex digits
inline std::string content_hash(std::string_view content) {
    uint64_t hash = 5381;
    for (unsigned char c : content) {
        hash = ((hash << 5) + hash) + c;
    }
    hash ^= static_cast<uint64_t>(content.size()) * 0x9E3779B97F4A7C15ULL;

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

struct CachedScan {
    std::string hash;
    ScanResult result;
    RegionIndex index;
};

class ScanCache {
public:
    using Entry = std::shared_ptr<const CachedScan>;

    // Entry for path if it was built from content with this hash
    Entry lookup(const std::string& path, const std::string& hash) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(normalize_path(path));
        if (it == entries_.end() || it->second->hash != hash) {
            ++misses_;
            return nullptr;
        }
        ++hits_;
        return it->second;
    }

    void store(const std::string& path, Entry entry) {
        std::unique_lock lock(mutex_);
        entries_[normalize_path(path)] = std::move(entry);
    }

    // Cached tree, or scan now and cache the result
    Entry get_or_scan(const std::string& path, const std::string& language,
                      std::string_view content) {
        std::string hash = content_hash(content);
        if (auto hit = lookup(path, hash)) return hit;

        auto built = std::make_shared<CachedScan>();
        built->hash = hash;
        built->result = scan(path, language, content);
        built->index = RegionIndex(built->result.regions);
        Entry entry = std::move(built);
        store(path, entry);
        return entry;
    }

    bool invalidate(const std::string& path) {
        std::unique_lock lock(mutex_);
        return entries_.erase(normalize_path(path)) > 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }

    static std::string normalize_path(const std::string& path) {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(path, ec);
        if (ec) return fs::path(path).lexically_normal().string();
        return canonical.string();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
};

} // namespace collab
