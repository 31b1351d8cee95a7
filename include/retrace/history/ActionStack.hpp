#pragma once

#include <retrace/core/Error.hpp>
#include <retrace/history/Action.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace RT::History {

/**
 * Ordered, versioned record of the edits of one session. Insertion order is
 * application order. The only mutations are appending at the tail and
 * replacing the sequence wholesale (truncate for undo, replace/clear for a
 * client-carried stack or a new upload). Every successful mutation bumps
 * version(); failed ones leave the stack untouched.
 */
class ActionStack {
public:
    ActionStack() = default;
    explicit ActionStack(std::vector<Action> actions);

    auto append(Action action) -> std::uint64_t;
    // Decodes one wire record (canonical or legacy shape) and appends it.
    auto appendRecord(nlohmann::json const& record) -> Expected<std::uint64_t>;
    // Keeps the first n actions; OutOfRange when n > size().
    auto truncate(std::size_t n) -> Expected<std::uint64_t>;
    auto replace(std::vector<Action> actions) -> std::uint64_t;
    auto clear() -> std::uint64_t;

    [[nodiscard]] auto size() const -> std::size_t { return actions_.size(); }
    [[nodiscard]] auto empty() const -> bool { return actions_.empty(); }
    [[nodiscard]] auto version() const -> std::uint64_t { return version_; }
    [[nodiscard]] auto at(std::size_t index) const -> Expected<Action>;
    [[nodiscard]] auto actions() const -> std::span<Action const> { return actions_; }
    // First min(i, size()) actions.
    [[nodiscard]] auto prefix(std::size_t i) const -> std::span<Action const>;

    [[nodiscard]] auto serialize() const -> std::string;
    [[nodiscard]] auto serializePrefix(std::size_t i) const -> Expected<std::string>;
    [[nodiscard]] auto prefixDigest(std::size_t i) const -> Expected<std::string>;

    [[nodiscard]] static auto deserialize(std::string_view text) -> Expected<ActionStack>;

private:
    std::vector<Action> actions_;
    std::uint64_t       version_ = 0;
};

/*
 * Digests of every prefix of a sequence: element i is the lowercase hex
 * SHA-256 of serializeActions(actions.first(i)), for i in [0, actions.size()].
 * Computed in one pass over the canonical encoding.
 */
[[nodiscard]] auto prefixDigests(std::span<Action const> actions) -> Expected<std::vector<std::string>>;

} // namespace RT::History
