#include <retrace/session/SessionRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace RT::Session {

namespace {

auto make_missing_error(std::string const& id) -> Error {
    return Error{Error::Code::NoSuchSession, "no live session '" + id + "'"};
}

} // namespace

SessionRegistry::SessionRegistry(SessionConfig config, ClockFn clock)
    : config_{config}, clock_{std::move(clock)} {}

auto SessionRegistry::generateToken() -> std::string {
    std::array<unsigned char, 16> buffer{};
    std::random_device            device;
    for (auto& byte : buffer) {
        byte = static_cast<unsigned char>(device());
    }

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (auto byte : buffer) {
        stream << std::setw(2) << static_cast<int>(byte);
    }
    return stream.str();
}

auto SessionRegistry::now() const -> Clock::time_point {
    return clock_ ? clock_() : Clock::now();
}

auto SessionRegistry::isExpired(SessionState const& state, Clock::time_point at) const -> bool {
    if (config_.absoluteTimeout.count() > 0 && (at - state.createdAt) > config_.absoluteTimeout) {
        return true;
    }
    if (config_.idleTimeout.count() > 0 && (at - state.lastSeen) > config_.idleTimeout) {
        return true;
    }
    return false;
}

auto SessionRegistry::findLiveLocked(std::string const& id, Clock::time_point at, std::vector<std::string>& expired)
    -> SessionState* {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    if (isExpired(it->second, at)) {
        expired.push_back(id);
        sessions_.erase(it);
        return nullptr;
    }
    it->second.lastSeen = at;
    return &it->second;
}

auto SessionRegistry::purgeLocked(Clock::time_point at) -> std::vector<std::string> {
    std::vector<std::string> expired;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (isExpired(it->second, at)) {
            expired.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

void SessionRegistry::notifyExpired(std::vector<std::string> const& ids) {
    if (ids.empty()) {
        return;
    }
    ExpiryHook hook;
    {
        std::lock_guard const lock{mutex_};
        hook = expiryHook_;
    }
    for (auto const& id : ids) {
        rt_log("Session " + id + " expired", "Session");
        if (hook) {
            hook(id);
        }
    }
}

auto SessionRegistry::create(BufferPtr source, std::string signature) -> Expected<std::string> {
    if (!source || !source->valid()) {
        return std::unexpected(Error{Error::Code::ValidationError, "a session needs a non-empty source image"});
    }

    std::vector<std::string> expired;
    std::string              id;
    bool                     full = false;
    {
        std::lock_guard const lock{mutex_};
        auto const            at = now();
        expired                  = purgeLocked(at);
        full                     = config_.maxSessions > 0 && sessions_.size() >= config_.maxSessions;
        if (!full) {
            do {
                id = generateToken();
            } while (sessions_.contains(id));

            SessionState state;
            state.id        = id;
            state.signature = std::move(signature);
            state.source    = std::move(source);
            state.createdAt = at;
            state.lastSeen  = at;
            sessions_.emplace(id, std::move(state));
        }
    }
    notifyExpired(expired);
    if (full) {
        return std::unexpected(Error{Error::Code::CapacityExceeded,
                                     "session limit of " + std::to_string(config_.maxSessions) + " reached"});
    }
    rt_log("Created session " + id, "Session");
    return id;
}

auto SessionRegistry::snapshot(std::string const& id) -> Expected<SessionState> {
    std::vector<std::string> expired;
    Expected<SessionState>   result = std::unexpected(make_missing_error(id));
    {
        std::lock_guard const lock{mutex_};
        if (auto* state = findLiveLocked(id, now(), expired)) {
            result = *state;
        }
    }
    notifyExpired(expired);
    return result;
}

auto SessionRegistry::mutateStack(std::string const& id, StackMutator const& mutator) -> Expected<std::uint64_t> {
    std::vector<std::string> expired;
    Expected<std::uint64_t>  result = std::unexpected(make_missing_error(id));
    {
        std::lock_guard const lock{mutex_};
        if (auto* state = findLiveLocked(id, now(), expired)) {
            result = mutator(state->stack);
        }
    }
    notifyExpired(expired);
    return result;
}

auto SessionRegistry::resetImage(std::string const& id, BufferPtr source, std::string signature)
    -> Expected<std::uint64_t> {
    if (!source || !source->valid()) {
        return std::unexpected(Error{Error::Code::ValidationError, "a session needs a non-empty source image"});
    }
    std::vector<std::string> expired;
    Expected<std::uint64_t>  result = std::unexpected(make_missing_error(id));
    {
        std::lock_guard const lock{mutex_};
        if (auto* state = findLiveLocked(id, now(), expired)) {
            state->source    = std::move(source);
            state->signature = std::move(signature);
            result           = state->stack.clear();
        }
    }
    notifyExpired(expired);
    if (result) {
        rt_log("Reset session " + id, "Session");
    }
    return result;
}

auto SessionRegistry::close(std::string const& id) -> Expected<void> {
    std::lock_guard const lock{mutex_};
    if (sessions_.erase(id) == 0) {
        return std::unexpected(make_missing_error(id));
    }
    return {};
}

auto SessionRegistry::purgeExpired() -> std::vector<std::string> {
    std::vector<std::string> expired;
    {
        std::lock_guard const lock{mutex_};
        expired = purgeLocked(now());
    }
    notifyExpired(expired);
    return expired;
}

void SessionRegistry::setExpiryHook(ExpiryHook hook) {
    std::lock_guard const lock{mutex_};
    expiryHook_ = std::move(hook);
}

auto SessionRegistry::size() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return sessions_.size();
}

} // namespace RT::Session
