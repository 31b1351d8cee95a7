#include <retrace/history/ActionCodec.hpp>

#include <retrace/region/RegionResolver.hpp>

#include <nlohmann/json.hpp>

namespace RT::History {

namespace {

using json = nlohmann::json;

auto make_validation_error(std::string message) -> Error {
    return Error{Error::Code::ValidationError, std::move(message)};
}

auto find_either(json const& record, char const* key, char const* legacyKey) -> json const* {
    if (auto it = record.find(key); it != record.end()) {
        return &*it;
    }
    if (auto it = record.find(legacyKey); it != record.end()) {
        return &*it;
    }
    return nullptr;
}

auto decode_filter(json const& operation) -> Expected<Ops::Operation> {
    json const* name = &operation;
    if (operation.is_object()) {
        auto it = operation.find("name");
        if (it == operation.end()) {
            return std::unexpected(make_validation_error("filter operation is missing 'name'"));
        }
        name = &*it;
    }
    if (!name->is_string()) {
        return std::unexpected(make_validation_error("filter name must be a string"));
    }
    auto kind = Ops::parseFilterKind(name->get_ref<std::string const&>());
    if (!kind) {
        return std::unexpected(kind.error());
    }
    return Ops::Operation{Ops::FilterOp{*kind}};
}

auto decode_enhance(json const& operation) -> Expected<Ops::Operation> {
    if (!operation.is_object()) {
        return std::unexpected(make_validation_error("enhance operation must be an object"));
    }
    auto const* name   = find_either(operation, "name", "enhancement");
    auto const* factor = find_either(operation, "factor", "enhancement_factor");
    if (!name || !name->is_string()) {
        return std::unexpected(make_validation_error("enhance operation needs a string 'name'"));
    }
    if (!factor || !factor->is_number()) {
        return std::unexpected(make_validation_error("enhance operation needs a numeric 'factor'"));
    }
    auto kind = Ops::parseEnhanceKind(name->get_ref<std::string const&>());
    if (!kind) {
        return std::unexpected(kind.error());
    }
    return Ops::Operation{Ops::EnhanceOp{*kind, factor->get<double>()}};
}

} // namespace

auto actionToJson(Action const& action) -> json {
    json operation = std::visit(
        [](auto const& op) -> json {
            using T = std::decay_t<decltype(op)>;
            if constexpr (std::is_same_v<T, Ops::FilterOp>) {
                return json{{"name", Ops::filterName(op.filter)}};
            } else {
                return json{{"name", Ops::enhanceName(op.enhancement)}, {"factor", op.factor}};
            }
        },
        action.operation());

    return json{{"kind", actionKindName(action.kind())},
                {"operation", std::move(operation)},
                {"selection", Region::selectionToJson(action.selection())}};
}

auto actionFromJson(json const& record) -> Expected<Action> {
    if (!record.is_object()) {
        return std::unexpected(make_validation_error("action record must be an object"));
    }
    auto const* kindField = find_either(record, "kind", "type");
    if (!kindField || !kindField->is_string()) {
        return std::unexpected(make_validation_error("action record needs a string 'kind'"));
    }
    auto kind = parseActionKind(kindField->get_ref<std::string const&>());
    if (!kind) {
        return std::unexpected(kind.error());
    }

    auto const* operationField = record.contains("operation") ? &record.at("operation") : nullptr;
    if (!operationField) {
        return std::unexpected(make_validation_error("action record is missing 'operation'"));
    }
    auto operation = *kind == ActionKind::Filter ? decode_filter(*operationField) : decode_enhance(*operationField);
    if (!operation) {
        return std::unexpected(operation.error());
    }

    Region::SelectionDescriptor selection;
    if (auto const* selectionField = find_either(record, "selection", "selectedData")) {
        auto parsed = Region::parseSelection(*selectionField);
        if (!parsed) {
            return std::unexpected(make_validation_error(parsed.error().message.value_or("malformed selection")));
        }
        selection = std::move(*parsed);
    }

    return Action::make(std::move(*operation), std::move(selection));
}

auto actionsFromJson(json const& records) -> Expected<std::vector<Action>> {
    if (!records.is_array()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "action stack must be a JSON array"});
    }
    std::vector<Action> actions;
    actions.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        auto action = actionFromJson(records[i]);
        if (!action) {
            return std::unexpected(withActionIndex(action.error(), i));
        }
        actions.push_back(std::move(*action));
    }
    return actions;
}

auto serializeActions(std::span<Action const> actions) -> std::string {
    json records = json::array();
    for (auto const& action : actions) {
        records.push_back(actionToJson(action));
    }
    return records.dump();
}

auto deserializeActions(std::string_view text) -> Expected<std::vector<Action>> {
    auto payload = json::parse(text.begin(), text.end(), nullptr, false);
    if (payload.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "action stack payload is not valid JSON"});
    }
    return actionsFromJson(payload);
}

} // namespace RT::History
