#pragma once

#include <retrace/cache/CacheBackend.hpp>

#include <chrono>
#include <list>
#include <mutex>
#include <unordered_map>

namespace RT::Cache {

// In-process byte store with least-recently-used eviction.
class MemoryCacheBackend final : public CacheBackend {
public:
    struct Limits {
        std::size_t               maxEntries = 0; // 0 == unlimited
        std::size_t               maxBytes   = 0; // 0 == unlimited
        std::chrono::milliseconds ttl{0};         // 0 == entries never expire
    };

    struct Stats {
        std::size_t entries        = 0;
        std::size_t bytes          = 0;
        std::size_t evictedEntries = 0;
        std::size_t expiredEntries = 0;
    };

    MemoryCacheBackend();
    explicit MemoryCacheBackend(Limits limits);

    [[nodiscard]] auto get(std::string const& key) -> Expected<std::optional<std::vector<std::byte>>> override;
    auto put(std::string const& key, std::span<const std::byte> bytes) -> Expected<void> override;
    auto evict(std::string const& key) -> Expected<void> override;
    auto evictSession(std::string_view session) -> Expected<std::size_t> override;
    auto clear() -> Expected<void> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "memory"; }
    [[nodiscard]] auto limits() const -> Limits const& { return limits_; }
    [[nodiscard]] auto stats() const -> Stats;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string            key;
        std::vector<std::byte> bytes;
        Clock::time_point      storedAt;
    };
    using EntryList = std::list<Entry>;

    void eraseLocked(EntryList::iterator it);
    void enforceLimitsLocked();

    Limits                                               limits_;
    mutable std::mutex                                   mutex_;
    EntryList                                            lru_; // front == most recently used
    std::unordered_map<std::string, EntryList::iterator> index_;
    std::size_t                                          totalBytes_     = 0;
    std::size_t                                          evictedEntries_ = 0;
    std::size_t                                          expiredEntries_ = 0;
};

} // namespace RT::Cache
