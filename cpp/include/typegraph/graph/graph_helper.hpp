/**
 * @file graph_helper.hpp
 * @brief Typed reads of reserved and attribute properties from graph vertices
 *
 * All readers return std::nullopt when the property is absent and throw
 * ConversionError when it holds a value of the wrong shape.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "typegraph/graph/graph.hpp"
#include "typegraph/value.hpp"

namespace typegraph::graph_helper {

template<typename T>
std::optional<T> get_single_valued_property(const GraphVertex& vertex, const std::string& key);

template<> std::optional<std::string> get_single_valued_property<std::string>(const GraphVertex& vertex, const std::string& key);
template<> std::optional<std::int64_t> get_single_valued_property<std::int64_t>(const GraphVertex& vertex, const std::string& key);
template<> std::optional<int> get_single_valued_property<int>(const GraphVertex& vertex, const std::string& key);
template<> std::optional<bool> get_single_valued_property<bool>(const GraphVertex& vertex, const std::string& key);
template<> std::optional<double> get_single_valued_property<double>(const GraphVertex& vertex, const std::string& key);

// Multi-valued property; a single scalar reads as a one-element list.
std::vector<std::string> get_string_list_property(const GraphVertex& vertex, const std::string& key);

std::optional<std::string> get_guid(const GraphVertex& vertex);
std::optional<std::string> get_type_name(const GraphVertex& vertex);
std::optional<std::string> get_state(const GraphVertex& vertex);
std::optional<int> get_version(const GraphVertex& vertex);
std::vector<std::string> get_trait_names(const GraphVertex& vertex);
std::vector<std::string> get_super_type_names(const GraphVertex& vertex);

// Identity stamped on the vertex; the type name is taken from the vertex.
Id get_id_from_vertex(const GraphVertex& vertex);
Id get_id_from_vertex(const std::string& type_name, const GraphVertex& vertex);

// Scalars and lists map directly; a vertex handle is a ConversionError.
Value to_value(const PersistedValue& value);
Value to_value(const Scalar& scalar);

// Expect a vertex handle; null when the value is null, ConversionError otherwise.
VertexPtr as_vertex(const PersistedValue& value);

const char* persisted_kind_name(const PersistedValue& value);

} // namespace typegraph::graph_helper
