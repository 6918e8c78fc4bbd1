#pragma once

namespace typegraph::constants {

// Reserved vertex property keys written by the repository.
inline constexpr const char* GUID_PROPERTY_KEY = "__guid";
inline constexpr const char* ENTITY_TYPE_PROPERTY_KEY = "__typeName";
inline constexpr const char* SUPER_TYPES_PROPERTY_KEY = "__superTypeNames";
inline constexpr const char* TRAIT_NAMES_PROPERTY_KEY = "__traitNames";
inline constexpr const char* STATE_PROPERTY_KEY = "__state";
inline constexpr const char* VERSION_PROPERTY_KEY = "__version";

// Attribute edges are labelled "__<DeclaringType>.<attribute>".
inline constexpr const char* EDGE_LABEL_PREFIX = "__";
inline constexpr char QUALIFIED_NAME_SEPARATOR = '.';

} // namespace typegraph::constants
