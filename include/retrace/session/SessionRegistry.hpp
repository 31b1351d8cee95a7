#pragma once

#include <retrace/core/Error.hpp>
#include <retrace/history/ActionStack.hpp>
#include <retrace/image/ImageBuffer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace RT::Session {

struct SessionConfig {
    std::chrono::seconds idleTimeout{std::chrono::seconds{1800}};      // 0 == never
    std::chrono::seconds absoluteTimeout{std::chrono::seconds{28800}}; // 0 == never
    std::size_t          maxSessions = 0;                              // 0 == unlimited
};

using Clock = std::chrono::steady_clock;

struct SessionState {
    std::string          id;
    std::string          signature;
    BufferPtr            source;
    History::ActionStack stack;
    Clock::time_point    createdAt{};
    Clock::time_point    lastSeen{};
};

/**
 * Owner of all live editing sessions.
 *
 * Callers never hold references into the registry: snapshot() copies a
 * session out (buffers are shared, not copied) and stack mutations run under
 * the registry lock through mutateStack(). Expired sessions are dropped the
 * next time they are touched or by purgeExpired(); the expiry hook then runs
 * outside the lock with each dropped id.
 */
class SessionRegistry {
public:
    using ClockFn     = std::function<Clock::time_point()>;
    using ExpiryHook  = std::function<void(std::string const& id)>;
    using StackMutator = std::function<Expected<std::uint64_t>(History::ActionStack& stack)>;

    explicit SessionRegistry(SessionConfig config, ClockFn clock = {});

    // CapacityExceeded when maxSessions live sessions already exist.
    [[nodiscard]] auto create(BufferPtr source, std::string signature) -> Expected<std::string>;
    // The following fail with NoSuchSession for unknown or expired ids and refresh lastSeen otherwise.
    [[nodiscard]] auto snapshot(std::string const& id) -> Expected<SessionState>;
    auto mutateStack(std::string const& id, StackMutator const& mutator) -> Expected<std::uint64_t>;
    auto resetImage(std::string const& id, BufferPtr source, std::string signature) -> Expected<std::uint64_t>;
    auto close(std::string const& id) -> Expected<void>;

    auto purgeExpired() -> std::vector<std::string>;
    void setExpiryHook(ExpiryHook hook);

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto config() const -> SessionConfig const& { return config_; }

    // 128 random bits as 32 lowercase hex characters.
    [[nodiscard]] static auto generateToken() -> std::string;

private:
    [[nodiscard]] auto now() const -> Clock::time_point;
    [[nodiscard]] auto isExpired(SessionState const& state, Clock::time_point at) const -> bool;
    // Returns the live session or nullptr; an expired one is erased and its id appended to `expired`.
    auto findLiveLocked(std::string const& id, Clock::time_point at, std::vector<std::string>& expired)
        -> SessionState*;
    auto purgeLocked(Clock::time_point at) -> std::vector<std::string>;
    void notifyExpired(std::vector<std::string> const& ids);

    SessionConfig                                 config_;
    ClockFn                                       clock_;
    ExpiryHook                                    expiryHook_;
    std::unordered_map<std::string, SessionState> sessions_;
    mutable std::mutex                            mutex_;
};

} // namespace RT::Session
