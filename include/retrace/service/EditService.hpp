#pragma once

#include <retrace/cache/ReplayCache.hpp>
#include <retrace/core/Error.hpp>
#include <retrace/engine/ResolutionEngine.hpp>
#include <retrace/history/Action.hpp>
#include <retrace/image/ImageBuffer.hpp>
#include <retrace/ops/OperationAdapter.hpp>
#include <retrace/session/SessionRegistry.hpp>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace RT::Service {

struct ResolvedImage {
    BufferPtr                buffer;
    std::chrono::nanoseconds resolveTime{0};
    std::uint64_t            stackVersion     = 0;
    std::size_t              stackLength      = 0;
    std::size_t              computedPrefixes = 0;
    std::vector<Error>       warnings;
};

struct SessionInfo {
    std::string   id;
    std::string   signature;
    std::uint32_t width        = 0;
    std::uint32_t height       = 0;
    std::size_t   stackLength  = 0;
    std::uint64_t stackVersion = 0;
    std::string   serializedStack;
};

struct EnhancementRequest {
    std::string name;
    double      factor = 1.0;
};

// One request of the stateless path: the client carries the stack it has seen.
struct RenderRequest {
    std::string                       sessionId;
    std::string                       imageSignature;
    std::string                       serializedStack; // empty means "[]"
    std::optional<std::string>        filter;
    std::optional<EnhancementRequest> enhancement;
    Region::SelectionDescriptor       selection;
};

struct RenderResponse {
    BufferPtr                buffer;
    std::string              serializedStack;
    std::chrono::nanoseconds resolveTime{0};
    std::vector<Error>       warnings;
};

/**
 * Facade over sessions, the resolution engine and the replay cache.
 *
 * Appends within one session are expected to be serialized by the caller;
 * everything else may be called concurrently. Resolutions never hold the
 * session lock: they work on a snapshot of the session.
 */
class EditService {
public:
    EditService(std::shared_ptr<Cache::ReplayCache> cache,
                std::shared_ptr<Ops::OperationAdapter> adapter,
                Session::SessionConfig sessionConfig,
                Session::SessionRegistry::ClockFn clock = {});
    ~EditService();

    EditService(EditService const&)                    = delete;
    auto operator=(EditService const&) -> EditService& = delete;

    // New session from uploaded bytes; DecodeError for undecodable images.
    [[nodiscard]] auto resetSession(std::span<const std::uint8_t> imageBytes) -> Expected<std::string>;
    // Swaps the image of an existing session; the stack is emptied and its cached buffers dropped.
    auto resetSession(std::string const& sessionId, std::span<const std::uint8_t> imageBytes)
        -> Expected<std::uint64_t>;
    // New session from an already decoded image.
    [[nodiscard]] auto openSession(ImageBuffer image, std::string signature) -> Expected<std::string>;
    auto closeSession(std::string const& sessionId) -> Expected<void>;

    auto appendAction(std::string const& sessionId, History::Action action) -> Expected<std::uint64_t>;
    auto appendRecord(std::string const& sessionId, nlohmann::json const& record) -> Expected<std::uint64_t>;
    auto truncate(std::string const& sessionId, std::size_t n) -> Expected<std::uint64_t>;
    auto replaceStack(std::string const& sessionId, std::string_view serializedStack) -> Expected<std::uint64_t>;

    // ValidationError when expectedSignature is given and differs from the session's.
    [[nodiscard]] auto resolve(std::string const& sessionId,
                               std::optional<std::string> const& expectedSignature = std::nullopt)
        -> Expected<ResolvedImage>;
    [[nodiscard]] auto describe(std::string const& sessionId) -> Expected<SessionInfo>;

    [[nodiscard]] auto render(RenderRequest const& request) -> Expected<RenderResponse>;

    auto purgeExpired() -> std::size_t;

    [[nodiscard]] auto cache() const -> Cache::ReplayCache& { return *cache_; }
    [[nodiscard]] auto sessions() -> Session::SessionRegistry& { return registry_; }
    [[nodiscard]] auto engine() -> Engine::ResolutionEngine& { return engine_; }

private:
    void dropCachedBuffers(std::string const& sessionId);

    std::shared_ptr<Cache::ReplayCache> cache_;
    Engine::ResolutionEngine            engine_;
    Session::SessionRegistry            registry_;
};

} // namespace RT::Service
