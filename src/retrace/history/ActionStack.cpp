#include <retrace/history/ActionStack.hpp>

#include <retrace/core/Digest.hpp>
#include <retrace/history/ActionCodec.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace RT::History {

namespace {

auto make_range_error(std::size_t requested, std::size_t size) -> Error {
    return Error{Error::Code::OutOfRange,
                 "prefix length " + std::to_string(requested) + " exceeds stack size " + std::to_string(size)};
}

} // namespace

ActionStack::ActionStack(std::vector<Action> actions)
    : actions_(std::move(actions)) {}

auto ActionStack::append(Action action) -> std::uint64_t {
    actions_.push_back(std::move(action));
    return ++version_;
}

auto ActionStack::appendRecord(nlohmann::json const& record) -> Expected<std::uint64_t> {
    auto action = actionFromJson(record);
    if (!action) {
        return std::unexpected(withActionIndex(action.error(), actions_.size()));
    }
    return append(std::move(*action));
}

auto ActionStack::truncate(std::size_t n) -> Expected<std::uint64_t> {
    if (n > actions_.size()) {
        return std::unexpected(make_range_error(n, actions_.size()));
    }
    actions_.erase(actions_.begin() + static_cast<std::ptrdiff_t>(n), actions_.end());
    return ++version_;
}

auto ActionStack::replace(std::vector<Action> actions) -> std::uint64_t {
    actions_ = std::move(actions);
    return ++version_;
}

auto ActionStack::clear() -> std::uint64_t {
    actions_.clear();
    return ++version_;
}

auto ActionStack::at(std::size_t index) const -> Expected<Action> {
    if (index >= actions_.size()) {
        return std::unexpected(Error{Error::Code::OutOfRange,
                                     "action index " + std::to_string(index) + " outside stack of "
                                         + std::to_string(actions_.size())});
    }
    return actions_[index];
}

auto ActionStack::prefix(std::size_t i) const -> std::span<Action const> {
    return std::span<Action const>{actions_}.first(std::min(i, actions_.size()));
}

auto ActionStack::serialize() const -> std::string {
    return serializeActions(actions_);
}

auto ActionStack::serializePrefix(std::size_t i) const -> Expected<std::string> {
    if (i > actions_.size()) {
        return std::unexpected(make_range_error(i, actions_.size()));
    }
    return serializeActions(prefix(i));
}

auto ActionStack::prefixDigest(std::size_t i) const -> Expected<std::string> {
    auto text = serializePrefix(i);
    if (!text) {
        return std::unexpected(text.error());
    }
    return sha256Hex(std::string_view{*text});
}

auto ActionStack::deserialize(std::string_view text) -> Expected<ActionStack> {
    auto actions = deserializeActions(text);
    if (!actions) {
        return std::unexpected(actions.error());
    }
    return ActionStack{std::move(*actions)};
}

auto prefixDigests(std::span<Action const> actions) -> Expected<std::vector<std::string>> {
    // The serialized prefix i is "[" r0 "," r1 ... r(i-1) "]", so one running
    // context fed "[" and the records covers every prefix; each digest closes a
    // copy of it with "]".
    Sha256Stream stream;
    if (auto fed = stream.update("["); !fed) {
        return std::unexpected(fed.error());
    }

    std::vector<std::string> digests;
    digests.reserve(actions.size() + 1);
    for (std::size_t i = 0; i <= actions.size(); ++i) {
        auto digest = stream.snapshotHex("]");
        if (!digest) {
            return std::unexpected(digest.error());
        }
        digests.push_back(std::move(*digest));
        if (i == actions.size()) {
            break;
        }
        std::string record = actionToJson(actions[i]).dump();
        if (i > 0) {
            record.insert(record.begin(), ',');
        }
        if (auto fed = stream.update(record); !fed) {
            return std::unexpected(fed.error());
        }
    }
    return digests;
}

} // namespace RT::History
