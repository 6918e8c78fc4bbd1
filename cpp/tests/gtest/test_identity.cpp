// =============================================================================
// Identity Constructor Tests
// =============================================================================

#include "graph_fixture.hpp"

using namespace typegraph;
using typegraph::test::GraphFixture;

class IdentityConstructorTest : public GraphFixture {
protected:
    IdentityConstructor identity;
};

TEST_F(IdentityConstructorTest, BuildsFieldlessReference) {
    auto vertex = add_person("p1", "G42", "alice");
    vertex->set_property(constants::VERSION_PROPERTY_KEY, std::int64_t{5});
    vertex->set_property(constants::STATE_PROPERTY_KEY, std::string("ACTIVE"));

    auto ref = identity.construct_class_instance_id(*types.class_type("Person"), vertex_value("p1"));
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->id().guid, "G42");
    EXPECT_EQ(ref->id().type_name, "Person");
    EXPECT_EQ(ref->id().version, 5);
    ASSERT_TRUE(ref->id().state.has_value());
    EXPECT_EQ(*ref->id().state, "ACTIVE");
    EXPECT_TRUE(ref->values().empty());
    EXPECT_TRUE(ref->trait_names().empty());
}

// The stored type name wins over the declared class it is read as
TEST_F(IdentityConstructorTest, SubtypeVertexKeepsItsOwnTypeName) {
    add_class_vertex("e1", "Employee", "G7", 2);

    auto ref = identity.construct_class_instance_id(*types.class_type("Person"), vertex_value("e1"));
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->id().guid, "G7");
    EXPECT_EQ(ref->id().type_name, "Employee");
    EXPECT_EQ(ref->id().version, 2);
}

TEST_F(IdentityConstructorTest, DoesNotTouchTheRequestCache) {
    add_person("p1", "G1", "alice");
    auto ref = identity.construct_class_instance_id(*types.class_type("Person"), vertex_value("p1"));
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ctx.size(), 0u);
}

TEST_F(IdentityConstructorTest, NullValueIsAbsent) {
    EXPECT_EQ(identity.construct_class_instance_id(*types.class_type("Person"), PersistedValue{}), nullptr);
}

TEST_F(IdentityConstructorTest, NonVertexIsLoggedAndAbsent) {
    auto ref = identity.construct_class_instance_id(*types.class_type("Person"),
                                                    PersistedValue(std::string("p1")));
    EXPECT_EQ(ref, nullptr);
    EXPECT_NE(log.str().find("EROR"), std::string::npos);
}

TEST_F(IdentityConstructorTest, MalformedVersionIsLoggedAndAbsent) {
    auto vertex = add_person("p1", "G1", "alice");
    vertex->set_property(constants::VERSION_PROPERTY_KEY, std::string("seven"));

    EXPECT_EQ(identity.construct_class_instance_id(*types.class_type("Person"), vertex_value("p1")), nullptr);
}
