// =============================================================================
// PostgreSQL Graph Tests
// =============================================================================

#include <gtest/gtest.h>

#include <iostream>
#include <memory>

#include "typegraph/constants.hpp"
#include "typegraph/db/connection.hpp"
#include "typegraph/db/helpers.hpp"
#include "typegraph/db/pg_graph.hpp"
#include "typegraph/error.hpp"
#include "typegraph/persistence_strategy.hpp"

using namespace typegraph;
using namespace typegraph::db;

class PgGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConnectionConfig config;
        conn = std::make_shared<Connection>(config.to_conninfo() + " connect_timeout=5");
        if (!conn->ok()) {
            GTEST_SKIP() << "Database connection failed: " << conn->error();
        }

        // Each test works in a private schema that is dropped afterwards.
        exec_checked(*conn, "DROP SCHEMA IF EXISTS typegraph_test CASCADE");
        exec_checked(*conn, "CREATE SCHEMA typegraph_test");
        exec_checked(*conn, "SET search_path TO typegraph_test");
        PgGraphSchema::create(*conn);

        writer = std::make_unique<PgGraphWriter>(conn);
        graph = std::make_shared<PgGraph>(conn);
    }

    void TearDown() override {
        if (conn && conn->ok()) {
            Result res = exec(*conn, "DROP SCHEMA IF EXISTS typegraph_test CASCADE");
            if (!res.ok()) {
                std::cerr << "Cleanup failed: " << res.error_message() << std::endl;
            }
        }
    }

    void add_person(const std::string& vertex_id, const std::string& guid, const std::string& name) {
        writer->add_vertex(vertex_id);
        writer->set_property(vertex_id, constants::GUID_PROPERTY_KEY, std::string(guid));
        writer->set_property(vertex_id, constants::ENTITY_TYPE_PROPERTY_KEY, std::string("Person"));
        writer->set_property(vertex_id, "Person.name", std::string(name));
    }

    std::shared_ptr<Connection> conn;
    std::unique_ptr<PgGraphWriter> writer;
    std::shared_ptr<PgGraph> graph;
};

TEST_F(PgGraphTest, SchemaCreationIsIdempotent) {
    EXPECT_NO_THROW(PgGraphSchema::create(*conn));
}

TEST_F(PgGraphTest, MissingVertexAndEdgeAreNull) {
    EXPECT_EQ(graph->vertex("nope"), nullptr);
    EXPECT_EQ(graph->edge("nope"), nullptr);
}

TEST_F(PgGraphTest, PropertiesRoundTripByKind) {
    writer->add_vertex("v1");
    writer->set_property("v1", "flag", true);
    writer->set_property("v1", "count", std::int64_t{-12});
    writer->set_property("v1", "ratio", 0.25);
    writer->set_property("v1", "name", std::string("it's"));
    writer->set_property("v1", "tags", ScalarList{std::string("a"), std::string("b"), std::string("c")});

    auto vertex = graph->vertex("v1");
    ASSERT_NE(vertex, nullptr);
    EXPECT_EQ(std::get<bool>(vertex->property("flag")), true);
    EXPECT_EQ(std::get<std::int64_t>(vertex->property("count")), -12);
    EXPECT_DOUBLE_EQ(std::get<double>(vertex->property("ratio")), 0.25);
    EXPECT_EQ(std::get<std::string>(vertex->property("name")), "it's");

    const auto& tags = std::get<ScalarList>(vertex->property("tags"));
    ASSERT_EQ(tags.size(), 3u);
    EXPECT_EQ(std::get<std::string>(tags[0]), "a");
    EXPECT_EQ(std::get<std::string>(tags[2]), "c");

    writer->set_property("v1", "name", PersistedValue{});
    EXPECT_TRUE(is_null(graph->vertex("v1")->property("name")));
}

TEST_F(PgGraphTest, EdgesByDirectionAndLabel) {
    writer->add_vertex("a");
    writer->add_vertex("b");
    writer->add_vertex("c");
    writer->add_edge("e1", "a", "b", "knows");
    writer->add_edge("e2", "a", "c", "owns");
    writer->add_edge("e3", "c", "a", "knows");

    auto a = graph->vertex("a");
    EXPECT_EQ(graph->edges(*a, EdgeDirection::Out, "").size(), 2u);
    EXPECT_EQ(graph->edges(*a, EdgeDirection::In, "").size(), 1u);
    EXPECT_EQ(graph->edges(*a, EdgeDirection::Both, "knows").size(), 2u);

    auto out = graph->edges(*a, EdgeDirection::Out, "owns");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out.front()->id, "e2");
    EXPECT_EQ(out.front()->in_vertex_id, "c");
}

TEST_F(PgGraphTest, RejectsVertexHandlesAsValues) {
    writer->add_vertex("v1");
    auto vertex = graph->vertex("v1");
    EXPECT_THROW(writer->set_property("v1", "self", PersistedValue(vertex)), InvalidArgumentError);
}

TEST_F(PgGraphTest, QueryFailureIsDatabaseError) {
    EXPECT_THROW(exec_checked(*conn, "SELECT * FROM no_such_table"), DatabaseError);
}

TEST_F(PgGraphTest, MaterializesFromPostgres) {
    TypeRegistry types;
    types.define_class("Person", {}, {
        AttributeInfo("name", "string"),
        AttributeInfo("manager", "Person"),
    });
    add_person("p1", "G1", "alice");
    add_person("p2", "G2", "bob");
    writer->add_edge("e1", "p1", "p2", "__Person.manager");
    writer->add_edge("e2", "p2", "p1", "__Person.manager");

    auto strategy = PersistenceStrategy::create_default(graph, types);
    RequestContext ctx;
    Value alice = strategy->construct_instance(ctx, *types.get("Person"), PersistedValue(graph->vertex("p1")));
    ASSERT_TRUE(alice.is_referenceable());
    const auto& bob = alice.as_referenceable()->get("manager").as_referenceable();
    EXPECT_EQ(bob->get("name").as_string(), "bob");
    EXPECT_EQ(bob->get("manager").as_referenceable().get(), alice.as_referenceable().get());
}
