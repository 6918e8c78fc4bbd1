#include "typegraph/materializer.hpp"
#include "typegraph/constants.hpp"
#include "typegraph/error.hpp"
#include "typegraph/graph/graph_helper.hpp"
#include "typegraph/logging.hpp"

namespace typegraph {

MaterializeResult MaterializeResult::of(Value value) {
    MaterializeResult result;
    result.status = value.is_null() ? MaterializeStatus::Absent : MaterializeStatus::Present;
    result.value = std::move(value);
    return result;
}

MaterializeResult MaterializeResult::failure(std::string error) {
    MaterializeResult result;
    result.status = MaterializeStatus::Failed;
    result.error = std::move(error);
    return result;
}

// =============================================================================
// CollectionEntryResolver
// =============================================================================

Value CollectionEntryResolver::construct_collection_entry(RequestContext& ctx, const DataType& element_type,
                                                          const Scalar& entry) {
    switch (element_type.category()) {
        case TypeCategory::Primitive:
        case TypeCategory::Enum:
            return materializer_.construct_instance(ctx, element_type, to_persisted(entry));

        case TypeCategory::Struct:
        case TypeCategory::Class: {
            const auto* edge_id = std::get_if<std::string>(&entry);
            if (!edge_id) {
                throw ConversionError("Collection entry of " + element_type.name() + " is not an edge id",
                                      "construct_collection_entry");
            }
            return mapper_.get_referred_entity(ctx, *edge_id, element_type);
        }

        case TypeCategory::Array:
        case TypeCategory::Map:
        case TypeCategory::Trait:
            return Value();
    }
    throw UnsupportedCategoryError("Unsupported element type " + element_type.name(),
                                   "construct_collection_entry");
}

// =============================================================================
// InstanceMaterializer
// =============================================================================

InstanceMaterializer::InstanceMaterializer(const TypeRegistry& types, InstanceMapper& mapper)
    : types_(types), mapper_(mapper), collection_resolver_(*this, mapper) {}

MaterializeResult InstanceMaterializer::materialize(RequestContext& ctx, const DataType& type,
                                                    const PersistedValue& value) {
    try {
        return MaterializeResult::of(construct(ctx, type, value));
    } catch (const DataError& e) {
        TYPEGRAPH_LOG_ERROR("error while constructing an instance of ", type.name(), ": ", e.message(),
                            e.context().empty() ? "" : " (" + e.context() + ")");
        return MaterializeResult::failure(e.message());
    }
}

Value InstanceMaterializer::construct_instance(RequestContext& ctx, const DataType& type,
                                               const PersistedValue& value) {
    return materialize(ctx, type, value).value;
}

Value InstanceMaterializer::construct(RequestContext& ctx, const DataType& type, const PersistedValue& value) {
    switch (type.category()) {
        case TypeCategory::Primitive:
        case TypeCategory::Enum:
            return type.convert(graph_helper::to_value(value), Multiplicity::OPTIONAL);

        case TypeCategory::Array:
            return construct_array(ctx, static_cast<const ArrayType&>(type), value);

        case TypeCategory::Map:
            // Maps are not materialized.
            return Value();

        case TypeCategory::Struct: {
            VertexPtr vertex = graph_helper::as_vertex(value);
            if (!vertex) return Value();
            return construct_struct(ctx, static_cast<const StructType&>(type), *vertex);
        }

        case TypeCategory::Trait: {
            VertexPtr vertex = graph_helper::as_vertex(value);
            if (!vertex) return Value();
            return construct_trait(ctx, static_cast<const TraitType&>(type), *vertex);
        }

        case TypeCategory::Class: {
            VertexPtr vertex = graph_helper::as_vertex(value);
            if (!vertex) return Value();
            return construct_class(ctx, static_cast<const ClassType&>(type), vertex);
        }
    }
    throw UnsupportedCategoryError("Unsupported type category " +
                                   std::to_string(static_cast<int>(type.category())) + " of " + type.name(),
                                   "construct_instance");
}

Value InstanceMaterializer::construct_array(RequestContext& ctx, const ArrayType& type,
                                            const PersistedValue& value) {
    if (is_null(value)) return Value();
    const auto* entries = std::get_if<ScalarList>(&value);
    if (!entries) {
        throw ConversionError(std::string("Expected a list for ") + type.name() + " but got " +
                              graph_helper::persisted_kind_name(value), "construct_array");
    }

    Value::List values;
    values.reserve(entries->size());
    for (const auto& entry : *entries) {
        Value element = collection_resolver_.construct_collection_entry(ctx, type.element_type(), entry);
        if (!element.is_null()) {
            values.push_back(std::move(element));
        }
    }
    return Value(std::move(values));
}

Value InstanceMaterializer::construct_struct(RequestContext& ctx, const StructType& type,
                                             const GraphVertex& vertex) {
    if (type.name() == types_.id_type().name()) {
        return construct_identity(vertex);
    }
    auto instance = type.create_instance();
    mapper_.map_vertex_to_instance(ctx, vertex, *instance, type.field_mapping());
    return type.convert(Value(instance), Multiplicity::OPTIONAL);
}

Value InstanceMaterializer::construct_identity(const GraphVertex& vertex) const {
    using graph_helper::get_single_valued_property;

    const StructType& id_type = types_.id_type();
    auto instance = id_type.create_instance();

    auto type_name = get_single_valued_property<std::string>(vertex, constants::ENTITY_TYPE_PROPERTY_KEY);
    auto guid = get_single_valued_property<std::string>(vertex, constants::GUID_PROPERTY_KEY);
    auto state = get_single_valued_property<std::string>(vertex, constants::STATE_PROPERTY_KEY);
    auto version = get_single_valued_property<int>(vertex, constants::VERSION_PROPERTY_KEY);

    instance->set(id_type::TYPE_NAME, type_name ? Value(*type_name) : Value());
    instance->set(id_type::GUID, guid ? Value(*guid) : Value());
    if (state) {
        instance->set(id_type::STATE, Value(*state));
    }
    instance->set(id_type::VERSION, version ? Value(*version) : Value());

    return id_type.convert(Value(instance), Multiplicity::OPTIONAL);
}

Value InstanceMaterializer::construct_trait(RequestContext& ctx, const TraitType& type,
                                            const GraphVertex& vertex) {
    // Fields are populated so malformed trait data still fails, but a bare
    // trait is not a result; the owning class instance is not materialized.
    auto instance = type.create_instance();
    mapper_.map_vertex_to_instance(ctx, vertex, *instance, type.field_mapping());
    return Value();
}

Value InstanceMaterializer::construct_class(RequestContext& ctx, const ClassType& type, const VertexPtr& vertex) {
    auto guid = graph_helper::get_guid(*vertex);
    if (!guid) {
        throw MappingError("Vertex " + vertex->id() + " has no guid", "construct_class");
    }

    auto instance = ctx.get_instance(*guid);
    if (!instance) {
        // The mapper caches the instance in ctx.
        instance = mapper_.map_graph_to_typed_instance(ctx, *guid, vertex);
    }
    return type.convert(Value(instance), Multiplicity::OPTIONAL);
}

// =============================================================================
// IdentityConstructor
// =============================================================================

std::shared_ptr<ReferenceableInstance> IdentityConstructor::construct_class_instance_id(
    const ClassType& type, const PersistedValue& value) const {
    try {
        VertexPtr vertex = graph_helper::as_vertex(value);
        if (!vertex) return nullptr;

        auto instance = type.create_instance(graph_helper::get_id_from_vertex(*vertex));
        Value converted = type.convert(Value(instance), Multiplicity::OPTIONAL);
        return converted.is_null() ? nullptr : converted.as_referenceable();
    } catch (const DataError& e) {
        TYPEGRAPH_LOG_ERROR("error while constructing an instance id of ", type.name(), ": ", e.message());
        return nullptr;
    }
}

} // namespace typegraph
