#include <retrace/cache/MemoryCacheBackend.hpp>

namespace RT::Cache {

MemoryCacheBackend::MemoryCacheBackend()
    : MemoryCacheBackend(Limits{}) {}

MemoryCacheBackend::MemoryCacheBackend(Limits limits)
    : limits_(limits) {}

auto MemoryCacheBackend::get(std::string const& key) -> Expected<std::optional<std::vector<std::byte>>> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        found = index_.find(key);
    if (found == index_.end()) {
        return std::optional<std::vector<std::byte>>{};
    }
    auto it = found->second;
    if (limits_.ttl.count() > 0 && Clock::now() - it->storedAt > limits_.ttl) {
        eraseLocked(it);
        ++expiredEntries_;
        return std::optional<std::vector<std::byte>>{};
    }
    lru_.splice(lru_.begin(), lru_, it);
    return std::optional<std::vector<std::byte>>{it->bytes};
}

auto MemoryCacheBackend::put(std::string const& key, std::span<const std::byte> bytes) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto found = index_.find(key); found != index_.end()) {
        eraseLocked(found->second);
    }
    lru_.push_front(Entry{key, std::vector<std::byte>(bytes.begin(), bytes.end()), Clock::now()});
    index_.emplace(key, lru_.begin());
    totalBytes_ += bytes.size();
    enforceLimitsLocked();
    return {};
}

auto MemoryCacheBackend::evict(std::string const& key) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto found = index_.find(key); found != index_.end()) {
        eraseLocked(found->second);
    }
    return {};
}

auto MemoryCacheBackend::evictSession(std::string_view session) -> Expected<std::size_t> {
    std::string prefix{session};
    prefix.push_back('/');

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        auto next = std::next(it);
        if (it->key.starts_with(prefix)) {
            eraseLocked(it);
            ++removed;
        }
        it = next;
    }
    return removed;
}

auto MemoryCacheBackend::clear() -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
    totalBytes_ = 0;
    return {};
}

auto MemoryCacheBackend::stats() const -> Stats {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{index_.size(), totalBytes_, evictedEntries_, expiredEntries_};
}

void MemoryCacheBackend::eraseLocked(EntryList::iterator it) {
    totalBytes_ -= it->bytes.size();
    index_.erase(it->key);
    lru_.erase(it);
}

void MemoryCacheBackend::enforceLimitsLocked() {
    // The newest entry sits at the front and is kept even when it alone exceeds maxBytes.
    while (lru_.size() > 1) {
        bool const overEntries = limits_.maxEntries > 0 && lru_.size() > limits_.maxEntries;
        bool const overBytes   = limits_.maxBytes > 0 && totalBytes_ > limits_.maxBytes;
        if (!overEntries && !overBytes) {
            break;
        }
        eraseLocked(std::prev(lru_.end()));
        ++evictedEntries_;
    }
}

} // namespace RT::Cache
