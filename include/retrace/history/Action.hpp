#pragma once

#include <retrace/core/Error.hpp>
#include <retrace/ops/Operation.hpp>
#include <retrace/region/Selection.hpp>

#include <cstdint>
#include <string_view>

namespace RT::History {

enum class ActionKind : std::uint8_t {
    Filter  = 0,
    Enhance = 1,
};

[[nodiscard]] auto actionKindName(ActionKind kind) -> std::string_view;
[[nodiscard]] auto parseActionKind(std::string_view name) -> Expected<ActionKind>;

/**
 * One recorded edit step: an operation plus the selection the user had drawn
 * when it was recorded. Actions are immutable; the factories are the only way
 * to build one, so every Action in existence names a known operation and
 * carries a structurally valid selection.
 */
class Action {
public:
    [[nodiscard]] static auto filter(std::string_view name, Region::SelectionDescriptor selection = {})
        -> Expected<Action>;
    [[nodiscard]] static auto enhance(std::string_view name,
                                      double factor,
                                      Region::SelectionDescriptor selection = {}) -> Expected<Action>;
    [[nodiscard]] static auto make(Ops::Operation operation, Region::SelectionDescriptor selection)
        -> Expected<Action>;

    [[nodiscard]] auto kind() const -> ActionKind {
        return std::holds_alternative<Ops::FilterOp>(operation_) ? ActionKind::Filter : ActionKind::Enhance;
    }
    [[nodiscard]] auto operation() const -> Ops::Operation const& { return operation_; }
    [[nodiscard]] auto selection() const -> Region::SelectionDescriptor const& { return selection_; }

    auto operator==(Action const&) const -> bool = default;

private:
    Action(Ops::Operation operation, Region::SelectionDescriptor selection);

    Ops::Operation              operation_;
    Region::SelectionDescriptor selection_;
};

} // namespace RT::History
