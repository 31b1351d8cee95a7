#include <retrace/engine/ResolutionEngine.hpp>

#include <retrace/history/ActionStack.hpp>
#include <retrace/region/RegionResolver.hpp>

#include "log/TaggedLogger.hpp"

namespace RT::Engine {

struct ResolutionEngine::Pass {
    SourceImage const&               source;
    std::span<History::Action const> actions;
    std::vector<std::string>         digests;
    std::size_t                      computed = 0;
    std::vector<Error>               warnings;
};

ResolutionEngine::ResolutionEngine(std::shared_ptr<Cache::ReplayCache> cache,
                                   std::shared_ptr<Ops::OperationAdapter> adapter)
    : cache_(std::move(cache)), adapter_(std::move(adapter)) {}

auto ResolutionEngine::keyFor(SourceImage const& source, std::string prefixDigest) -> Cache::CacheKey {
    return Cache::CacheKey{source.session, source.signature, std::move(prefixDigest)};
}

auto ResolutionEngine::resolve(SourceImage const& source, std::span<History::Action const> actions)
    -> Expected<Resolution> {
    return resolvePrefix(source, actions, actions.size());
}

auto ResolutionEngine::resolvePrefix(SourceImage const& source,
                                     std::span<History::Action const> actions,
                                     std::size_t length) -> Expected<Resolution> {
    auto const started = std::chrono::steady_clock::now();

    if (length > actions.size()) {
        return std::unexpected(Error{Error::Code::OutOfRange,
                                     "prefix length " + std::to_string(length) + " exceeds stack size "
                                         + std::to_string(actions.size())});
    }
    if (!source.buffer || !source.buffer->valid()) {
        return std::unexpected(Error{Error::Code::ValidationError, "session has no usable source buffer"});
    }

    auto prefix  = actions.first(length);
    auto digests = History::prefixDigests(prefix);
    if (!digests) {
        return std::unexpected(digests.error());
    }

    Pass pass{source, prefix, std::move(*digests), 0, {}};
    auto buffer = resolveLevel(pass, length);
    if (!buffer) {
        rt_log("Resolution of session " + source.session + " failed: " + describeError(buffer.error()),
               "ResolutionEngine",
               "Error");
        return std::unexpected(buffer.error());
    }

    Resolution resolution;
    resolution.buffer           = std::move(*buffer);
    resolution.prefixLength     = length;
    resolution.computedPrefixes = pass.computed;
    resolution.warnings         = std::move(pass.warnings);
    resolution.resolveTime      = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    return resolution;
}

auto ResolutionEngine::resolveLevel(Pass& pass, std::size_t level) -> Expected<BufferPtr> {
    if (level == 0) {
        return pass.source.buffer;
    }

    auto const actionIndex = level - 1;
    auto       compute     = [&]() -> Expected<BufferPtr> {
        auto parent = resolveLevel(pass, level - 1);
        if (!parent) {
            return std::unexpected(parent.error());
        }
        auto const& input  = **parent;
        auto const& action = pass.actions[actionIndex];

        auto region = Region::resolveSelection(action.selection(), input.width, input.height);
        if (!region) {
            return std::unexpected(withActionIndex(region.error(), actionIndex));
        }
        auto output = adapter_->apply(input, *region, action.operation());
        if (!output) {
            return std::unexpected(withActionIndex(output.error(), actionIndex));
        }
        if (!output->sameCanvas(input) || !output->valid()) {
            return std::unexpected(withActionIndex(
                Error{Error::Code::ValidationError, "operation changed the canvas size"}, actionIndex));
        }
        ++pass.computed;
        return std::make_shared<ImageBuffer const>(std::move(*output));
    };

    auto lookup = cache_->getOrCompute(keyFor(pass.source, pass.digests[level]), compute);
    if (!lookup) {
        return std::unexpected(withActionIndex(lookup.error(), actionIndex));
    }
    if (lookup->storeError) {
        pass.warnings.push_back(withActionIndex(*lookup->storeError, actionIndex));
    }
    return std::move(lookup->buffer);
}

} // namespace RT::Engine
