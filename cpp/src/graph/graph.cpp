#include "typegraph/graph/graph.hpp"
#include "typegraph/types.hpp"

#include <type_traits>

namespace typegraph {

const char* edge_direction_name(EdgeDirection direction) {
    switch (direction) {
        case EdgeDirection::Out: return "OUT";
        case EdgeDirection::In: return "IN";
        case EdgeDirection::Both: return "BOTH";
    }
    return "UNKNOWN";
}

PersistedValue to_persisted(const Scalar& scalar) {
    return std::visit([](const auto& v) -> PersistedValue { return v; }, scalar);
}

PersistedValue PropertyVertex::property(const std::string& key) const {
    auto it = properties_.find(key);
    return it == properties_.end() ? PersistedValue{} : it->second;
}

std::vector<std::string> PropertyVertex::property_keys() const {
    std::vector<std::string> keys;
    keys.reserve(properties_.size());
    for (const auto& entry : properties_) {
        keys.push_back(entry.first);
    }
    return keys;
}

void PropertyVertex::set_property(const std::string& key, PersistedValue value) {
    if (is_null(value)) {
        properties_.erase(key);
        return;
    }
    properties_[key] = std::move(value);
}

void PropertyVertex::add_property_value(const std::string& key, Scalar value) {
    PersistedValue& slot = properties_[key];
    if (auto* list = std::get_if<ScalarList>(&slot)) {
        list->push_back(std::move(value));
        return;
    }
    ScalarList list;
    if (!is_null(slot) && !std::holds_alternative<VertexPtr>(slot)) {
        // Promote an existing single value to the head of the list.
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (!std::is_same_v<T, ScalarList> && !std::is_same_v<T, VertexPtr>) {
                list.push_back(v);
            }
        }, slot);
    }
    list.push_back(std::move(value));
    slot = std::move(list);
}

bool Graph::is_property_value_conversion_needed(const DataType&) const {
    return false;
}

TraversalExpression Graph::generate_persistent_to_logical_conversion_expression(
    const TraversalExpression& expr, const DataType&) const {
    return expr;
}

} // namespace typegraph
