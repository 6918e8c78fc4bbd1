#include "typegraph/graph/graph_helper.hpp"
#include "typegraph/constants.hpp"
#include "typegraph/error.hpp"

#include <limits>
#include <type_traits>

namespace typegraph::graph_helper {

namespace {

ConversionError wrong_shape(const GraphVertex& vertex, const std::string& key,
                            const char* wanted, const PersistedValue& value) {
    return ConversionError("Property " + key + " on vertex " + vertex.id() + " holds " +
                           persisted_kind_name(value) + ", expected " + wanted);
}

} // namespace

const char* persisted_kind_name(const PersistedValue& value) {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        case 5: return "list";
        case 6: return "vertex";
        default: return "unknown";
    }
}

template<>
std::optional<std::string> get_single_valued_property<std::string>(const GraphVertex& vertex,
                                                                   const std::string& key) {
    PersistedValue value = vertex.property(key);
    if (is_null(value)) return std::nullopt;
    if (auto* s = std::get_if<std::string>(&value)) return *s;
    throw wrong_shape(vertex, key, "string", value);
}

template<>
std::optional<std::int64_t> get_single_valued_property<std::int64_t>(const GraphVertex& vertex,
                                                                     const std::string& key) {
    PersistedValue value = vertex.property(key);
    if (is_null(value)) return std::nullopt;
    if (auto* i = std::get_if<std::int64_t>(&value)) return *i;
    throw wrong_shape(vertex, key, "int", value);
}

template<>
std::optional<int> get_single_valued_property<int>(const GraphVertex& vertex, const std::string& key) {
    std::optional<std::int64_t> wide = get_single_valued_property<std::int64_t>(vertex, key);
    if (!wide) return std::nullopt;
    if (*wide < std::numeric_limits<int>::min() || *wide > std::numeric_limits<int>::max()) {
        throw ConversionError("Property " + key + " on vertex " + vertex.id() +
                              " does not fit an int: " + std::to_string(*wide));
    }
    return static_cast<int>(*wide);
}

template<>
std::optional<bool> get_single_valued_property<bool>(const GraphVertex& vertex, const std::string& key) {
    PersistedValue value = vertex.property(key);
    if (is_null(value)) return std::nullopt;
    if (auto* b = std::get_if<bool>(&value)) return *b;
    throw wrong_shape(vertex, key, "bool", value);
}

template<>
std::optional<double> get_single_valued_property<double>(const GraphVertex& vertex,
                                                         const std::string& key) {
    PersistedValue value = vertex.property(key);
    if (is_null(value)) return std::nullopt;
    if (auto* d = std::get_if<double>(&value)) return *d;
    if (auto* i = std::get_if<std::int64_t>(&value)) return static_cast<double>(*i);
    throw wrong_shape(vertex, key, "double", value);
}

std::vector<std::string> get_string_list_property(const GraphVertex& vertex, const std::string& key) {
    PersistedValue value = vertex.property(key);
    std::vector<std::string> result;
    if (is_null(value)) return result;
    if (auto* s = std::get_if<std::string>(&value)) {
        result.push_back(*s);
        return result;
    }
    auto* list = std::get_if<ScalarList>(&value);
    if (!list) {
        throw wrong_shape(vertex, key, "list of strings", value);
    }
    for (const auto& entry : *list) {
        auto* s = std::get_if<std::string>(&entry);
        if (!s) {
            throw ConversionError("Property " + key + " on vertex " + vertex.id() +
                                  " contains a non-string entry");
        }
        result.push_back(*s);
    }
    return result;
}

std::optional<std::string> get_guid(const GraphVertex& vertex) {
    return get_single_valued_property<std::string>(vertex, constants::GUID_PROPERTY_KEY);
}

std::optional<std::string> get_type_name(const GraphVertex& vertex) {
    return get_single_valued_property<std::string>(vertex, constants::ENTITY_TYPE_PROPERTY_KEY);
}

std::optional<std::string> get_state(const GraphVertex& vertex) {
    return get_single_valued_property<std::string>(vertex, constants::STATE_PROPERTY_KEY);
}

std::optional<int> get_version(const GraphVertex& vertex) {
    return get_single_valued_property<int>(vertex, constants::VERSION_PROPERTY_KEY);
}

std::vector<std::string> get_trait_names(const GraphVertex& vertex) {
    return get_string_list_property(vertex, constants::TRAIT_NAMES_PROPERTY_KEY);
}

std::vector<std::string> get_super_type_names(const GraphVertex& vertex) {
    return get_string_list_property(vertex, constants::SUPER_TYPES_PROPERTY_KEY);
}

Id get_id_from_vertex(const GraphVertex& vertex) {
    return get_id_from_vertex(get_type_name(vertex).value_or(""), vertex);
}

Id get_id_from_vertex(const std::string& type_name, const GraphVertex& vertex) {
    Id id;
    id.guid = get_guid(vertex).value_or("");
    id.type_name = type_name;
    id.version = get_version(vertex).value_or(0);
    id.state = get_state(vertex);
    return id;
}

Value to_value(const Scalar& scalar) {
    return std::visit([](const auto& v) -> Value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return Value();
        } else {
            return Value(v);
        }
    }, scalar);
}

Value to_value(const PersistedValue& value) {
    return std::visit([](const auto& v) -> Value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return Value();
        } else if constexpr (std::is_same_v<T, ScalarList>) {
            Value::List list;
            list.reserve(v.size());
            for (const auto& entry : v) {
                list.push_back(to_value(entry));
            }
            return Value(std::move(list));
        } else if constexpr (std::is_same_v<T, VertexPtr>) {
            throw ConversionError("Expected a scalar property value but got vertex " +
                                  (v ? v->id() : std::string("<null>")));
        } else {
            return Value(v);
        }
    }, value);
}

VertexPtr as_vertex(const PersistedValue& value) {
    if (is_null(value)) return nullptr;
    if (auto* vertex = std::get_if<VertexPtr>(&value)) return *vertex;
    throw ConversionError(std::string("Expected a vertex but got ") + persisted_kind_name(value));
}

} // namespace typegraph::graph_helper
