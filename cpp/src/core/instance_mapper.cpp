#include "typegraph/instance_mapper.hpp"
#include "typegraph/error.hpp"
#include "typegraph/graph/graph_helper.hpp"
#include "typegraph/logging.hpp"

#include <type_traits>
#include <variant>

namespace typegraph {

GraphInstanceMapper::GraphInstanceMapper(std::shared_ptr<const Graph> graph, const TypeRegistry& types,
                                         std::shared_ptr<const NamingPolicy> naming)
    : graph_(std::move(graph)), types_(types), naming_(std::move(naming)) {
    TYPEGRAPH_CHECK_POINTER(graph_.get(), "graph");
}

// =============================================================================
// Field mapping
// =============================================================================

void GraphInstanceMapper::map_vertex_to_instance(RequestContext& ctx, const GraphVertex& vertex,
                                                 StructInstance& instance, const FieldMapping& fields) {
    TYPEGRAPH_LOG_DEBUG("Mapping vertex ", vertex.id(), " to ", instance.type_name());
    for (const auto& attr : fields.fields) {
        DataTypePtr attr_type = types_.get(attr.type_name);
        map_attribute(ctx, vertex, instance, attr, *attr_type);
    }
}

void GraphInstanceMapper::map_attribute(RequestContext& ctx, const GraphVertex& vertex,
                                        StructInstance& instance, const AttributeInfo& attr,
                                        const DataType& attr_type) {
    switch (attr_type.category()) {
        case TypeCategory::Primitive:
        case TypeCategory::Enum: {
            PersistedValue raw = vertex.property(naming_.field_name_in_vertex(instance.type(), attr));
            if (is_null(raw)) return;
            instance.set(attr.name, attr_type.convert(graph_helper::to_value(raw), attr.multiplicity));
            return;
        }
        case TypeCategory::Array: {
            PersistedValue raw = vertex.property(naming_.field_name_in_vertex(instance.type(), attr));
            if (is_null(raw)) return;
            instance.set(attr.name, map_array(ctx, raw, attr, static_cast<const ArrayType&>(attr_type)));
            return;
        }
        case TypeCategory::Map:
        case TypeCategory::Trait:
            // Not stored as attributes.
            return;
        case TypeCategory::Struct: {
            VertexPtr target = follow_out_edge(vertex, naming_.edge_label(instance.type(), attr));
            if (!target) return;
            instance.set(attr.name, map_struct_vertex(ctx, *target, static_cast<const StructType&>(attr_type)));
            return;
        }
        case TypeCategory::Class: {
            VertexPtr target = follow_out_edge(vertex, naming_.edge_label(instance.type(), attr));
            if (!target) return;
            auto referenced = resolve_class_vertex(ctx, target);
            instance.set(attr.name, attr_type.convert(Value(referenced), attr.multiplicity));
            return;
        }
    }
    throw UnsupportedCategoryError("Unknown category for attribute " + attr.name, "map_attribute");
}

Value GraphInstanceMapper::map_array(RequestContext& ctx, const PersistedValue& raw,
                                     const AttributeInfo& attr, const ArrayType& array_type) {
    ScalarList entries;
    if (const auto* list = std::get_if<ScalarList>(&raw)) {
        entries = *list;
    } else if (std::holds_alternative<VertexPtr>(raw)) {
        throw ConversionError("Array attribute " + attr.name + " holds a vertex", "map_array");
    } else {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (!std::is_same_v<T, ScalarList> && !std::is_same_v<T, VertexPtr>) {
                entries.push_back(v);
            }
        }, raw);
    }

    Value::List values;
    values.reserve(entries.size());
    for (const auto& entry : entries) {
        Value value = map_collection_entry(ctx, entry, array_type.element_type());
        if (!value.is_null()) {
            values.push_back(std::move(value));
        }
    }
    return Value(std::move(values));
}

Value GraphInstanceMapper::map_collection_entry(RequestContext& ctx, const Scalar& entry,
                                                const DataType& element_type) {
    switch (element_type.category()) {
        case TypeCategory::Primitive:
        case TypeCategory::Enum:
            return element_type.convert(graph_helper::to_value(entry), Multiplicity::OPTIONAL);
        case TypeCategory::Struct:
        case TypeCategory::Class: {
            const auto* edge_id = std::get_if<std::string>(&entry);
            if (!edge_id) {
                throw ConversionError("Expected an edge id for an element of " + element_type.name(),
                                      "map_collection_entry");
            }
            return get_referred_entity(ctx, *edge_id, element_type);
        }
        case TypeCategory::Array:
        case TypeCategory::Map:
        case TypeCategory::Trait:
            return Value();
    }
    throw UnsupportedCategoryError("Unknown element category of " + element_type.name(),
                                   "map_collection_entry");
}

std::shared_ptr<StructInstance> GraphInstanceMapper::map_struct_vertex(RequestContext& ctx,
                                                                       const GraphVertex& vertex,
                                                                       const StructType& type) {
    auto instance = type.create_instance();
    map_vertex_to_instance(ctx, vertex, *instance, type.field_mapping());
    return instance;
}

std::shared_ptr<ReferenceableInstance> GraphInstanceMapper::resolve_class_vertex(RequestContext& ctx,
                                                                                 const VertexPtr& vertex) {
    auto guid = graph_helper::get_guid(*vertex);
    if (!guid) {
        throw MappingError("Vertex " + vertex->id() + " has no guid", "resolve_class_vertex");
    }
    if (auto cached = ctx.get_instance(*guid)) {
        return cached;
    }
    return map_graph_to_typed_instance(ctx, *guid, vertex);
}

// =============================================================================
// Class instances
// =============================================================================

std::shared_ptr<ReferenceableInstance> GraphInstanceMapper::map_graph_to_typed_instance(
    RequestContext& ctx, const std::string& guid, const VertexPtr& vertex) {
    if (!vertex) {
        throw MappingError("No vertex for guid " + guid, "map_graph_to_typed_instance");
    }
    if (auto cached = ctx.get_instance(guid)) {
        return cached;
    }

    auto type_name = graph_helper::get_type_name(*vertex);
    if (!type_name) {
        throw MappingError("Vertex " + vertex->id() + " has no type name", "map_graph_to_typed_instance");
    }
    auto class_type = types_.class_type(*type_name);

    Id id = naming_.id_from_vertex(*type_name, *vertex);
    id.guid = guid;

    auto instance = class_type->create_instance(std::move(id), naming_.trait_names(*vertex));
    size_t mark = ctx.size();
    ctx.cache(instance);

    try {
        map_vertex_to_instance(ctx, *vertex, *instance, class_type->field_mapping());
        map_traits(ctx, *vertex, *class_type, *instance);
    } catch (const DataError&) {
        // Nothing half-built stays visible to later lookups in this operation.
        ctx.rollback(mark);
        throw;
    }
    return instance;
}

void GraphInstanceMapper::map_traits(RequestContext& ctx, const GraphVertex& vertex, const ClassType& type,
                                     ReferenceableInstance& instance) {
    for (const auto& trait_name : instance.trait_names()) {
        auto trait_type = types_.trait_type(trait_name);
        VertexPtr trait_vertex = follow_out_edge(vertex, naming_.trait_label(type, trait_name));
        if (!trait_vertex) {
            TYPEGRAPH_LOG_WARN("Trait ", trait_name, " of ", instance.id().to_string(), " has no trait vertex");
            continue;
        }
        instance.set_trait(trait_name, map_struct_vertex(ctx, *trait_vertex, *trait_type));
    }
}

Value GraphInstanceMapper::get_referred_entity(RequestContext& ctx, const std::string& edge_id,
                                               const DataType& type) {
    EdgePtr edge = graph_->edge(edge_id);
    if (!edge) {
        TYPEGRAPH_LOG_DEBUG("Edge ", edge_id, " not found");
        return Value();
    }
    VertexPtr target = edge_target(*edge);

    switch (type.category()) {
        case TypeCategory::Struct:
            return Value(map_struct_vertex(ctx, *target, static_cast<const StructType&>(type)));
        case TypeCategory::Class:
            return Value(resolve_class_vertex(ctx, target));
        case TypeCategory::Primitive:
        case TypeCategory::Enum:
        case TypeCategory::Array:
        case TypeCategory::Map:
        case TypeCategory::Trait:
            throw MappingError(std::string("Edge references are not supported for ") +
                               type_category_name(type.category()) + " type " + type.name(),
                               "get_referred_entity");
    }
    throw UnsupportedCategoryError("Unknown category of " + type.name(), "get_referred_entity");
}

// =============================================================================
// Graph traversal
// =============================================================================

VertexPtr GraphInstanceMapper::follow_out_edge(const GraphVertex& vertex, const std::string& label) const {
    auto edges = graph_->edges(vertex, EdgeDirection::Out, label);
    if (edges.empty()) {
        return nullptr;
    }
    if (edges.size() > 1) {
        TYPEGRAPH_LOG_WARN("Vertex ", vertex.id(), " has ", edges.size(), " edges labelled ", label,
                           ", using the first");
    }
    return edge_target(*edges.front());
}

VertexPtr GraphInstanceMapper::edge_target(const GraphEdge& edge) const {
    VertexPtr target = graph_->vertex(edge.in_vertex_id);
    if (!target) {
        throw MappingError("Edge " + edge.id + " points to missing vertex " + edge.in_vertex_id,
                           "edge_target");
    }
    return target;
}

} // namespace typegraph
