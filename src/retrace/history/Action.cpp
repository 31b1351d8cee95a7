#include <retrace/history/Action.hpp>

#include <retrace/region/RegionResolver.hpp>

#include <string>

namespace RT::History {

auto actionKindName(ActionKind kind) -> std::string_view {
    switch (kind) {
    case ActionKind::Filter:
        return "filter";
    case ActionKind::Enhance:
        return "enhance";
    }
    return "unknown";
}

auto parseActionKind(std::string_view name) -> Expected<ActionKind> {
    if (name == "filter")
        return ActionKind::Filter;
    if (name == "enhance")
        return ActionKind::Enhance;
    return std::unexpected(Error{Error::Code::ValidationError, "unrecognized action kind '" + std::string{name} + "'"});
}

Action::Action(Ops::Operation operation, Region::SelectionDescriptor selection)
    : operation_(std::move(operation)), selection_(std::move(selection)) {}

auto Action::make(Ops::Operation operation, Region::SelectionDescriptor selection) -> Expected<Action> {
    if (auto valid = Ops::validateOperation(operation); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = Region::validateSelection(selection); !valid) {
        // A malformed selection makes the whole action malformed.
        return std::unexpected(Error{Error::Code::ValidationError, valid.error().message.value_or("invalid selection")});
    }
    return Action{std::move(operation), std::move(selection)};
}

auto Action::filter(std::string_view name, Region::SelectionDescriptor selection) -> Expected<Action> {
    auto kind = Ops::parseFilterKind(name);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    return make(Ops::FilterOp{*kind}, std::move(selection));
}

auto Action::enhance(std::string_view name, double factor, Region::SelectionDescriptor selection)
    -> Expected<Action> {
    auto kind = Ops::parseEnhanceKind(name);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    return make(Ops::EnhanceOp{*kind, factor}, std::move(selection));
}

} // namespace RT::History
