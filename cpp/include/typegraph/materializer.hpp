/**
 * @file materializer.hpp
 * @brief Turns raw persisted graph values into typed instances
 *
 * Dispatch is strictly by type category. Data errors (conversion, mapping,
 * unknown types) are logged and reported as "absent"; schema errors such as
 * an out-of-set category propagate to the caller.
 */

#pragma once

#include <memory>
#include <string>

#include "typegraph/graph/graph.hpp"
#include "typegraph/instance_mapper.hpp"
#include "typegraph/request_context.hpp"
#include "typegraph/type_registry.hpp"

namespace typegraph {

class InstanceMaterializer;

enum class MaterializeStatus {
    Present,
    Absent,
    Failed
};

// Outcome of one materialization. `value` is null unless the status is Present.
struct MaterializeResult {
    MaterializeStatus status = MaterializeStatus::Absent;
    Value value;
    std::string error;

    static MaterializeResult of(Value value);
    static MaterializeResult failure(std::string error);

    bool has_value() const { return status == MaterializeStatus::Present; }
    bool failed() const { return status == MaterializeStatus::Failed; }
};

// Resolves one raw entry of an array attribute against the element type.
class CollectionEntryResolver {
public:
    CollectionEntryResolver(InstanceMaterializer& materializer, InstanceMapper& mapper)
        : materializer_(materializer), mapper_(mapper) {}

    /**
     * Primitive and enum entries are materialized as scalars; struct and
     * class entries are edge ids resolved through the mapper. Nested
     * collections and traits are not modelled and yield null.
     *
     * @throws DataError when a struct/class entry is not an edge id or the
     *         referenced entity cannot be mapped.
     * @throws UnsupportedCategoryError for a category outside the closed set.
     */
    Value construct_collection_entry(RequestContext& ctx, const DataType& element_type,
                                     const Scalar& entry);

private:
    InstanceMaterializer& materializer_;
    InstanceMapper& mapper_;
};

class InstanceMaterializer {
public:
    InstanceMaterializer(const TypeRegistry& types, InstanceMapper& mapper);

    InstanceMaterializer(const InstanceMaterializer&) = delete;
    InstanceMaterializer& operator=(const InstanceMaterializer&) = delete;

    /**
     * Materialize `value` as an instance of `type`.
     *
     * Class vertices are looked up in `ctx` by guid first; on a miss the
     * mapper materializes and caches them.
     *
     * @return Present with the value, Absent for null input, map types and
     *         traits (whose fields are still read), Failed (logged) when a
     *         data error occurred.
     * @throws UnsupportedCategoryError, NamingError
     */
    MaterializeResult materialize(RequestContext& ctx, const DataType& type, const PersistedValue& value);

    // Same as materialize() but folds failures into a null result.
    Value construct_instance(RequestContext& ctx, const DataType& type, const PersistedValue& value);

    CollectionEntryResolver& collection_entry_resolver() { return collection_resolver_; }

private:
    Value construct(RequestContext& ctx, const DataType& type, const PersistedValue& value);

    Value construct_array(RequestContext& ctx, const ArrayType& type, const PersistedValue& value);
    Value construct_struct(RequestContext& ctx, const StructType& type, const GraphVertex& vertex);
    Value construct_identity(const GraphVertex& vertex) const;
    Value construct_trait(RequestContext& ctx, const TraitType& type, const GraphVertex& vertex);
    Value construct_class(RequestContext& ctx, const ClassType& type, const VertexPtr& vertex);

    const TypeRegistry& types_;
    InstanceMapper& mapper_;
    CollectionEntryResolver collection_resolver_;
};

// Builds reference handles: a class instance carrying only its identity.
class IdentityConstructor {
public:
    // Id is read from the vertex, including its stored type name.
    // nullptr (logged) when the value is not a usable vertex.
    std::shared_ptr<ReferenceableInstance> construct_class_instance_id(const ClassType& type,
                                                                       const PersistedValue& value) const;
};

} // namespace typegraph
