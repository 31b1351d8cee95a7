#pragma once

#include <retrace/core/Error.hpp>
#include <retrace/history/Action.hpp>

#include <nlohmann/json_fwd.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace RT::History {

/*
 * Canonical action-stack encoding: a JSON array of
 *   {"kind": "filter"|"enhance",
 *    "operation": {"name": <string>} | {"factor": <number>, "name": <string>},
 *    "selection": null | {"range": ...} | {"lassoPoints": ...}}
 * Objects are emitted with sorted keys and arrays keep their order, so equal
 * stacks always produce equal bytes. The serialized prefix is the cache-key
 * material of every resolved buffer.
 *
 * Decoding also accepts the viewer's original record shape ("type",
 * "selectedData", bare filter names, "enhancement"/"enhancement_factor").
 */

[[nodiscard]] auto actionToJson(Action const& action) -> nlohmann::json;
[[nodiscard]] auto actionFromJson(nlohmann::json const& record) -> Expected<Action>;

[[nodiscard]] auto serializeActions(std::span<Action const> actions) -> std::string;
[[nodiscard]] auto deserializeActions(std::string_view text) -> Expected<std::vector<Action>>;
[[nodiscard]] auto actionsFromJson(nlohmann::json const& records) -> Expected<std::vector<Action>>;

} // namespace RT::History
