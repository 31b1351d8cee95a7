#include <retrace/cache/ReplayCache.hpp>

#include <retrace/cache/BufferCodec.hpp>

#include "log/TaggedLogger.hpp"

#include <parallel_hashmap/phmap.h>

#include <exception>
#include <future>

namespace RT::Cache {

auto lookupSourceName(LookupSource source) -> std::string_view {
    switch (source) {
    case LookupSource::RamHit:
        return "ram";
    case LookupSource::BackendHit:
        return "backend";
    case LookupSource::Computed:
        return "computed";
    case LookupSource::Coalesced:
        return "coalesced";
    }
    return "unknown";
}

struct ReplayCache::InFlight {
    std::promise<Expected<Lookup>>     promise;
    std::shared_future<Expected<Lookup>> result{promise.get_future().share()};
};

struct ReplayCache::InFlightTable {
    // Tunable shard count; the map locks one submap per operation.
    static constexpr int DefaultSubmaps = 12;

    using Map = phmap::parallel_node_hash_map<std::string,
                                              std::shared_ptr<InFlight>,
                                              std::hash<std::string>,
                                              std::equal_to<>,
                                              std::allocator<std::pair<const std::string, std::shared_ptr<InFlight>>>,
                                              DefaultSubmaps,
                                              std::mutex>;
    Map entries;
};

ReplayCache::ReplayCache(std::shared_ptr<CacheBackend> backend)
    : ReplayCache(std::move(backend), Options{}) {}

ReplayCache::ReplayCache(std::shared_ptr<CacheBackend> backend, Options options)
    : backend_(std::move(backend)), options_(options), inFlight_(std::make_unique<InFlightTable>()) {}

ReplayCache::~ReplayCache() = default;

auto ReplayCache::getOrCompute(CacheKey const& key, ComputeFn const& compute) -> Expected<Lookup> {
    auto const keyString = key.str();

    if (auto cached = ramGet(keyString)) {
        ramHits_.fetch_add(1, std::memory_order_relaxed);
        rt_log("RAM hit " + keyString, "ReplayCacheHit");
        return Lookup{std::move(*cached), LookupSource::RamHit, std::nullopt};
    }

    std::shared_ptr<InFlight> flight;
    bool                      leader = false;
    inFlight_->entries.lazy_emplace_l(
        keyString,
        [&](auto& existing) { flight = existing.second; },
        [&](auto const& ctor) {
            flight = std::make_shared<InFlight>();
            leader = true;
            ctor(keyString, flight);
        });

    if (!leader) {
        coalescedWaits_.fetch_add(1, std::memory_order_relaxed);
        rt_log("Waiting on in-flight computation " + keyString, "ReplayCache");
        auto const& shared = flight->result.get();
        if (!shared) {
            return std::unexpected(shared.error());
        }
        return Lookup{shared->buffer, LookupSource::Coalesced, std::nullopt};
    }

    Expected<Lookup> result = lead(keyString, compute);
    flight->promise.set_value(result);
    inFlight_->entries.erase_if(keyString, [&](auto& entry) { return entry.second == flight; });
    return result;
}

auto ReplayCache::lead(std::string const& key, ComputeFn const& compute) -> Expected<Lookup> {
    // A previous leader may have published the key between our RAM check and
    // taking the in-flight slot.
    if (auto cached = ramGet(key)) {
        ramHits_.fetch_add(1, std::memory_order_relaxed);
        return Lookup{std::move(*cached), LookupSource::RamHit, std::nullopt};
    }
    if (auto stored = loadFromBackend(key)) {
        backendHits_.fetch_add(1, std::memory_order_relaxed);
        ramPut(key, *stored);
        return Lookup{std::move(*stored), LookupSource::BackendHit, std::nullopt};
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    rt_log("Computing " + key, "ReplayCache");

    Expected<BufferPtr> computed = std::unexpected(Error{Error::Code::UnknownError, "compute did not run"});
    try {
        computed = compute();
    } catch (std::exception const& ex) {
        computed = std::unexpected(Error{Error::Code::UnknownError, std::string{"compute threw: "} + ex.what()});
    } catch (...) {
        computed = std::unexpected(Error{Error::Code::UnknownError, "compute threw a non-standard exception"});
    }
    if (computed && !*computed) {
        computed = std::unexpected(Error{Error::Code::UnknownError, "compute produced no buffer"});
    }
    if (!computed) {
        computeFailures_.fetch_add(1, std::memory_order_relaxed);
        rt_log("Computation failed for " + key + ": " + describeError(computed.error()), "ReplayCache", "Error");
        return std::unexpected(computed.error());
    }
    computations_.fetch_add(1, std::memory_order_relaxed);

    Lookup lookup{*computed, LookupSource::Computed, std::nullopt};
    auto   encoded = encodeBuffer(*lookup.buffer);
    if (!encoded) {
        lookup.storeError = encoded.error();
    } else if (auto stored = backend_->put(key, *encoded); !stored) {
        lookup.storeError = stored.error();
    }
    if (lookup.storeError) {
        backendWriteErrors_.fetch_add(1, std::memory_order_relaxed);
        rt_log("Backend write failed for " + key + ": " + describeError(*lookup.storeError), "ReplayCache", "Error");
    }
    ramPut(key, lookup.buffer);
    return lookup;
}

auto ReplayCache::loadFromBackend(std::string const& key) -> std::optional<BufferPtr> {
    auto bytes = backend_->get(key);
    if (!bytes) {
        backendReadErrors_.fetch_add(1, std::memory_order_relaxed);
        rt_log("Backend read failed for " + key + ": " + describeError(bytes.error()), "ReplayCache", "Error");
        return std::nullopt;
    }
    if (!bytes->has_value()) {
        return std::nullopt;
    }
    auto decoded = decodeBuffer(**bytes);
    if (!decoded) {
        corruptEntries_.fetch_add(1, std::memory_order_relaxed);
        rt_log("Dropping undecodable entry " + key + ": " + describeError(decoded.error()), "ReplayCache", "Error");
        if (auto evicted = backend_->evict(key); !evicted) {
            backendWriteErrors_.fetch_add(1, std::memory_order_relaxed);
        }
        return std::nullopt;
    }
    return std::make_shared<ImageBuffer const>(std::move(*decoded));
}

auto ReplayCache::ramGet(std::string const& key) -> std::optional<BufferPtr> {
    if (options_.ramCacheEntries == 0) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(ramMutex_);
    auto                        found = ramIndex_.find(key);
    if (found == ramIndex_.end()) {
        return std::nullopt;
    }
    ramLru_.splice(ramLru_.begin(), ramLru_, found->second);
    return found->second->second;
}

void ReplayCache::ramPut(std::string const& key, BufferPtr buffer) {
    if (options_.ramCacheEntries == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(ramMutex_);
    if (auto found = ramIndex_.find(key); found != ramIndex_.end()) {
        ramLru_.splice(ramLru_.begin(), ramLru_, found->second);
        return;
    }
    ramLru_.emplace_front(key, std::move(buffer));
    ramIndex_.emplace(key, ramLru_.begin());
    while (ramLru_.size() > options_.ramCacheEntries) {
        ramIndex_.erase(ramLru_.back().first);
        ramLru_.pop_back();
    }
}

auto ReplayCache::evictSession(std::string_view session) -> Expected<std::size_t> {
    std::string prefix{session};
    prefix.push_back('/');
    {
        std::lock_guard<std::mutex> lock(ramMutex_);
        for (auto it = ramLru_.begin(); it != ramLru_.end();) {
            if (it->first.starts_with(prefix)) {
                ramIndex_.erase(it->first);
                it = ramLru_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return backend_->evictSession(session);
}

auto ReplayCache::clear() -> Expected<void> {
    {
        std::lock_guard<std::mutex> lock(ramMutex_);
        ramLru_.clear();
        ramIndex_.clear();
    }
    return backend_->clear();
}

auto ReplayCache::stats() const -> Stats {
    Stats stats;
    stats.ramHits            = ramHits_.load(std::memory_order_relaxed);
    stats.backendHits        = backendHits_.load(std::memory_order_relaxed);
    stats.misses             = misses_.load(std::memory_order_relaxed);
    stats.computations       = computations_.load(std::memory_order_relaxed);
    stats.computeFailures    = computeFailures_.load(std::memory_order_relaxed);
    stats.coalescedWaits     = coalescedWaits_.load(std::memory_order_relaxed);
    stats.backendReadErrors  = backendReadErrors_.load(std::memory_order_relaxed);
    stats.backendWriteErrors = backendWriteErrors_.load(std::memory_order_relaxed);
    stats.corruptEntries     = corruptEntries_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(ramMutex_);
        stats.ramEntries = ramLru_.size();
    }
    return stats;
}

} // namespace RT::Cache
