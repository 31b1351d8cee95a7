#include <retrace/service/EditService.hpp>

#include <retrace/history/ActionCodec.hpp>
#include <retrace/history/ActionStack.hpp>
#include <retrace/image/ImageCodec.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

namespace RT::Service {

namespace {

auto signature_mismatch(std::string const& sessionId) -> Error {
    return Error{Error::Code::ValidationError, "image signature does not belong to session '" + sessionId + "'"};
}

} // namespace

EditService::EditService(std::shared_ptr<Cache::ReplayCache> cache,
                         std::shared_ptr<Ops::OperationAdapter> adapter,
                         Session::SessionConfig sessionConfig,
                         Session::SessionRegistry::ClockFn clock)
    : cache_(cache), engine_(std::move(cache), std::move(adapter)), registry_(sessionConfig, std::move(clock)) {
    registry_.setExpiryHook([this](std::string const& id) { dropCachedBuffers(id); });
}

EditService::~EditService() {
    registry_.setExpiryHook({});
}

void EditService::dropCachedBuffers(std::string const& sessionId) {
    auto evicted = cache_->evictSession(sessionId);
    if (!evicted) {
        rt_log("Failed to drop cached buffers of " + sessionId + ": " + describeError(evicted.error()),
               "EditService",
               "Error");
        return;
    }
    rt_log("Dropped " + std::to_string(*evicted) + " cached buffers of " + sessionId, "EditService");
}

auto EditService::resetSession(std::span<const std::uint8_t> imageBytes) -> Expected<std::string> {
    auto image = Image::decodeImage(imageBytes);
    if (!image) {
        return std::unexpected(image.error());
    }
    return openSession(std::move(*image), Image::imageSignature(imageBytes));
}

auto EditService::resetSession(std::string const& sessionId, std::span<const std::uint8_t> imageBytes)
    -> Expected<std::uint64_t> {
    auto image = Image::decodeImage(imageBytes);
    if (!image) {
        return std::unexpected(image.error());
    }
    auto version = registry_.resetImage(sessionId,
                                        std::make_shared<ImageBuffer const>(std::move(*image)),
                                        Image::imageSignature(imageBytes));
    if (version) {
        dropCachedBuffers(sessionId);
    }
    return version;
}

auto EditService::openSession(ImageBuffer image, std::string signature) -> Expected<std::string> {
    if (signature.empty()) {
        return std::unexpected(Error{Error::Code::ValidationError, "a session needs an image signature"});
    }
    return registry_.create(std::make_shared<ImageBuffer const>(std::move(image)), std::move(signature));
}

auto EditService::closeSession(std::string const& sessionId) -> Expected<void> {
    auto closed = registry_.close(sessionId);
    if (closed) {
        dropCachedBuffers(sessionId);
    }
    return closed;
}

auto EditService::appendAction(std::string const& sessionId, History::Action action) -> Expected<std::uint64_t> {
    return registry_.mutateStack(sessionId, [&](History::ActionStack& stack) -> Expected<std::uint64_t> {
        return stack.append(std::move(action));
    });
}

auto EditService::appendRecord(std::string const& sessionId, nlohmann::json const& record)
    -> Expected<std::uint64_t> {
    return registry_.mutateStack(sessionId,
                                 [&](History::ActionStack& stack) { return stack.appendRecord(record); });
}

auto EditService::truncate(std::string const& sessionId, std::size_t n) -> Expected<std::uint64_t> {
    return registry_.mutateStack(sessionId, [&](History::ActionStack& stack) { return stack.truncate(n); });
}

auto EditService::replaceStack(std::string const& sessionId, std::string_view serializedStack)
    -> Expected<std::uint64_t> {
    auto actions = History::deserializeActions(serializedStack);
    if (!actions) {
        return std::unexpected(actions.error());
    }
    return registry_.mutateStack(sessionId, [&](History::ActionStack& stack) -> Expected<std::uint64_t> {
        return stack.replace(std::move(*actions));
    });
}

auto EditService::resolve(std::string const& sessionId, std::optional<std::string> const& expectedSignature)
    -> Expected<ResolvedImage> {
    auto session = registry_.snapshot(sessionId);
    if (!session) {
        return std::unexpected(session.error());
    }
    if (expectedSignature && *expectedSignature != session->signature) {
        return std::unexpected(signature_mismatch(sessionId));
    }

    Engine::SourceImage source{session->id, session->signature, session->source};
    auto                resolution = engine_.resolve(source, session->stack.actions());
    if (!resolution) {
        return std::unexpected(resolution.error());
    }

    ResolvedImage image;
    image.buffer           = std::move(resolution->buffer);
    image.resolveTime      = resolution->resolveTime;
    image.stackVersion     = session->stack.version();
    image.stackLength      = session->stack.size();
    image.computedPrefixes = resolution->computedPrefixes;
    image.warnings         = std::move(resolution->warnings);
    return image;
}

auto EditService::describe(std::string const& sessionId) -> Expected<SessionInfo> {
    auto session = registry_.snapshot(sessionId);
    if (!session) {
        return std::unexpected(session.error());
    }
    SessionInfo info;
    info.id              = session->id;
    info.signature       = session->signature;
    info.width           = session->source->width;
    info.height          = session->source->height;
    info.stackLength     = session->stack.size();
    info.stackVersion    = session->stack.version();
    info.serializedStack = session->stack.serialize();
    return info;
}

auto EditService::render(RenderRequest const& request) -> Expected<RenderResponse> {
    auto session = registry_.snapshot(request.sessionId);
    if (!session) {
        return std::unexpected(session.error());
    }
    if (request.imageSignature != session->signature) {
        return std::unexpected(signature_mismatch(request.sessionId));
    }

    auto actions = History::deserializeActions(request.serializedStack.empty() ? std::string_view{"[]"}
                                                                               : std::string_view{request.serializedStack});
    if (!actions) {
        return std::unexpected(actions.error());
    }

    // A new filter goes on before a new enhancement of the same request.
    if (request.filter) {
        auto action = History::Action::filter(*request.filter, request.selection);
        if (!action) {
            return std::unexpected(withActionIndex(action.error(), actions->size()));
        }
        actions->push_back(std::move(*action));
    }
    if (request.enhancement) {
        auto action = History::Action::enhance(request.enhancement->name, request.enhancement->factor, request.selection);
        if (!action) {
            return std::unexpected(withActionIndex(action.error(), actions->size()));
        }
        actions->push_back(std::move(*action));
    }

    Engine::SourceImage source{session->id, session->signature, session->source};
    auto                resolution = engine_.resolve(source, *actions);
    if (!resolution) {
        return std::unexpected(resolution.error());
    }

    RenderResponse response;
    response.buffer          = std::move(resolution->buffer);
    response.serializedStack = History::serializeActions(*actions);
    response.resolveTime     = resolution->resolveTime;
    response.warnings        = std::move(resolution->warnings);

    auto stored = registry_.mutateStack(request.sessionId, [&](History::ActionStack& stack) -> Expected<std::uint64_t> {
        return stack.replace(std::move(*actions));
    });
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return response;
}

auto EditService::purgeExpired() -> std::size_t {
    return registry_.purgeExpired().size();
}

} // namespace RT::Service
