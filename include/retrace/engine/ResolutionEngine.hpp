#pragma once

#include <retrace/cache/CacheKey.hpp>
#include <retrace/cache/ReplayCache.hpp>
#include <retrace/core/Error.hpp>
#include <retrace/history/Action.hpp>
#include <retrace/image/ImageBuffer.hpp>
#include <retrace/ops/OperationAdapter.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace RT::Engine {

// The session-level inputs every cache key of a resolution is derived from.
struct SourceImage {
    std::string session;
    std::string signature;
    BufferPtr   buffer;
};

struct Resolution {
    BufferPtr                buffer;
    std::size_t              prefixLength = 0;
    std::size_t              computedPrefixes = 0; // prefixes this call ran the adapter for
    std::chrono::nanoseconds resolveTime{0};
    std::vector<Error>       warnings;            // cache writes that failed along the way
};

/**
 * Resolves the buffer of an action-stack prefix.
 *
 * resolve(0) is the source buffer. resolve(i) looks prefix i up in the replay
 * cache and, on a miss, resolves prefix i-1 the same way, resolves action
 * i-1's selection against that buffer and applies the action through the
 * adapter. Only the uncached suffix of a stack is ever recomputed.
 *
 * Errors from action i-1 abort prefixes >= i, carry actionIndex i-1 and are
 * never cached.
 */
class ResolutionEngine {
public:
    ResolutionEngine(std::shared_ptr<Cache::ReplayCache> cache, std::shared_ptr<Ops::OperationAdapter> adapter);

    [[nodiscard]] auto resolve(SourceImage const& source, std::span<History::Action const> actions)
        -> Expected<Resolution>;
    // OutOfRange when length > actions.size().
    [[nodiscard]] auto resolvePrefix(SourceImage const& source,
                                     std::span<History::Action const> actions,
                                     std::size_t length) -> Expected<Resolution>;

    [[nodiscard]] static auto keyFor(SourceImage const& source, std::string prefixDigest) -> Cache::CacheKey;

    [[nodiscard]] auto cache() const -> Cache::ReplayCache& { return *cache_; }
    [[nodiscard]] auto adapter() const -> Ops::OperationAdapter& { return *adapter_; }

private:
    struct Pass;

    auto resolveLevel(Pass& pass, std::size_t level) -> Expected<BufferPtr>;

    std::shared_ptr<Cache::ReplayCache>    cache_;
    std::shared_ptr<Ops::OperationAdapter> adapter_;
};

} // namespace RT::Engine
