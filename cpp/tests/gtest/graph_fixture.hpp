// =============================================================================
// Shared fixture: a small catalog model on an in-memory graph
// =============================================================================

#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "typegraph/constants.hpp"
#include "typegraph/graph/memory_graph.hpp"
#include "typegraph/instance_mapper.hpp"
#include "typegraph/logging.hpp"
#include "typegraph/materializer.hpp"
#include "typegraph/naming.hpp"
#include "typegraph/request_context.hpp"
#include "typegraph/type_registry.hpp"

namespace typegraph::test {

// A descriptor whose category lies outside the closed set.
class RogueType final : public DataType {
public:
    RogueType() : DataType("rogue", static_cast<TypeCategory>(42)) {}
    Value convert(const Value& value, const Multiplicity&) const override { return value; }
};

/**
 * Model:
 *   enum   Tier     {GOLD=1, SILVER=2}
 *   struct Address  {street: string, zip: int}
 *   trait  PII      {level: int}
 *   class  Person   {name, age: int, tier: Tier, address: Address,
 *                    manager: Person, friends: array<Person>,
 *                    nicknames: array<string>, labels: map<string,string>}
 *   class  Employee extends Person {badge: string}
 */
class GraphFixture : public ::testing::Test {
protected:
    void SetUp() override {
        types.define_enum("Tier", {{"GOLD", 1}, {"SILVER", 2}});
        types.define_struct("Address", {
            AttributeInfo("street", "string"),
            AttributeInfo("zip", "int"),
        });
        types.define_trait("PII", {}, {AttributeInfo("level", "int")});
        types.define_class("Person", {}, {
            AttributeInfo("name", "string", Multiplicity::REQUIRED),
            AttributeInfo("age", "int"),
            AttributeInfo("tier", "Tier"),
            AttributeInfo("address", "Address", Multiplicity::OPTIONAL, true),
            AttributeInfo("manager", "Person"),
            AttributeInfo("friends", "array<Person>", Multiplicity::COLLECTION),
            AttributeInfo("nicknames", "array<string>", Multiplicity::COLLECTION),
            AttributeInfo("labels", "map<string,string>"),
        });
        types.define_class("Employee", {"Person"}, {AttributeInfo("badge", "string")});

        graph = std::make_shared<MemoryGraph>();
        naming = std::make_shared<DefaultNamingPolicy>();
        mapper = std::make_shared<GraphInstanceMapper>(graph, types, naming);
        materializer = std::make_unique<InstanceMaterializer>(types, *mapper);
    }

    // Class vertex with the reserved identity properties stamped on it.
    std::shared_ptr<PropertyVertex> add_class_vertex(const std::string& vertex_id, const std::string& type_name,
                                                     const std::string& guid, int version = 0) {
        auto vertex = graph->add_vertex(vertex_id);
        vertex->set_property(constants::GUID_PROPERTY_KEY, std::string(guid));
        vertex->set_property(constants::ENTITY_TYPE_PROPERTY_KEY, std::string(type_name));
        vertex->set_property(constants::VERSION_PROPERTY_KEY, std::int64_t{version});
        return vertex;
    }

    std::shared_ptr<PropertyVertex> add_person(const std::string& vertex_id, const std::string& guid,
                                               const std::string& name) {
        auto vertex = add_class_vertex(vertex_id, "Person", guid);
        vertex->set_property("Person.name", std::string(name));
        return vertex;
    }

    void link(const std::string& edge_id, const std::string& from, const std::string& to,
              const std::string& label) {
        graph->add_edge(edge_id, from, to, label);
    }

    const DataType& type(const std::string& name) { return *types.get(name); }

    PersistedValue vertex_value(const std::string& vertex_id) {
        return PersistedValue(graph->vertex(vertex_id));
    }

    TypeRegistry types;
    std::shared_ptr<MemoryGraph> graph;
    std::shared_ptr<DefaultNamingPolicy> naming;
    std::shared_ptr<GraphInstanceMapper> mapper;
    std::unique_ptr<InstanceMaterializer> materializer;
    RequestContext ctx;
    std::stringstream log;
    ScopedLogOutput capture{log};
};

} // namespace typegraph::test
