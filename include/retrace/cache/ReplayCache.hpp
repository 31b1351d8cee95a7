#pragma once

#include <retrace/cache/CacheBackend.hpp>
#include <retrace/cache/CacheKey.hpp>
#include <retrace/core/Error.hpp>
#include <retrace/image/ImageBuffer.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace RT::Cache {

enum class LookupSource {
    RamHit,     // served from the in-process tier
    BackendHit, // decoded from the storage backend
    Computed,   // this caller ran the compute function
    Coalesced,  // waited on another caller's computation of the same key
};

[[nodiscard]] auto lookupSourceName(LookupSource source) -> std::string_view;

struct Lookup {
    BufferPtr            buffer;
    LookupSource         source = LookupSource::Computed;
    std::optional<Error> storeError; // backend write failure; the buffer is still correct
};

using ComputeFn = std::function<Expected<BufferPtr>()>;

/**
 * Content-addressed store of resolved buffers with single-flight computation.
 *
 * getOrCompute() answers from a RAM tier of shared buffers, then from the byte
 * backend, and only then runs `compute`. For any key at most one computation
 * runs at a time: concurrent callers for the same key wait on the first
 * caller's result instead of computing it again. A caller that stops waiting
 * does not cancel the shared computation.
 *
 * Failed computations are returned to every waiter and never stored.
 */
class ReplayCache {
public:
    struct Options {
        std::size_t ramCacheEntries = 64; // 0 disables the RAM tier
    };

    struct Stats {
        std::size_t ramHits            = 0;
        std::size_t backendHits        = 0;
        std::size_t misses             = 0;
        std::size_t computations       = 0;
        std::size_t computeFailures    = 0;
        std::size_t coalescedWaits     = 0;
        std::size_t backendReadErrors  = 0;
        std::size_t backendWriteErrors = 0;
        std::size_t corruptEntries     = 0;
        std::size_t ramEntries         = 0;
    };

    explicit ReplayCache(std::shared_ptr<CacheBackend> backend);
    ReplayCache(std::shared_ptr<CacheBackend> backend, Options options);
    ~ReplayCache();

    ReplayCache(ReplayCache const&)                    = delete;
    auto operator=(ReplayCache const&) -> ReplayCache& = delete;

    [[nodiscard]] auto getOrCompute(CacheKey const& key, ComputeFn const& compute) -> Expected<Lookup>;

    // Drops the RAM tier and backend entries of one session.
    auto evictSession(std::string_view session) -> Expected<std::size_t>;
    auto clear() -> Expected<void>;

    [[nodiscard]] auto stats() const -> Stats;
    [[nodiscard]] auto options() const -> Options const& { return options_; }
    [[nodiscard]] auto backend() const -> CacheBackend& { return *backend_; }

private:
    struct InFlight;
    struct InFlightTable;

    auto lead(std::string const& key, ComputeFn const& compute) -> Expected<Lookup>;
    auto loadFromBackend(std::string const& key) -> std::optional<BufferPtr>;

    auto ramGet(std::string const& key) -> std::optional<BufferPtr>;
    void ramPut(std::string const& key, BufferPtr buffer);

    std::shared_ptr<CacheBackend>  backend_;
    Options                        options_;
    std::unique_ptr<InFlightTable> inFlight_;

    using RamList = std::list<std::pair<std::string, BufferPtr>>;
    mutable std::mutex                                 ramMutex_;
    RamList                                            ramLru_; // front == most recently used
    std::unordered_map<std::string, RamList::iterator> ramIndex_;

    std::atomic<std::size_t> ramHits_{0};
    std::atomic<std::size_t> backendHits_{0};
    std::atomic<std::size_t> misses_{0};
    std::atomic<std::size_t> computations_{0};
    std::atomic<std::size_t> computeFailures_{0};
    std::atomic<std::size_t> coalescedWaits_{0};
    std::atomic<std::size_t> backendReadErrors_{0};
    std::atomic<std::size_t> backendWriteErrors_{0};
    std::atomic<std::size_t> corruptEntries_{0};
};

} // namespace RT::Cache
