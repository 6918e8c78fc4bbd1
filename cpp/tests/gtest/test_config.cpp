// =============================================================================
// Configuration, Logging and Error Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "typegraph/config.hpp"
#include "typegraph/db/connection.hpp"
#include "typegraph/error.hpp"
#include "typegraph/logging.hpp"

using namespace typegraph;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "typegraph_config_test.env";
    }

    void TearDown() override {
        std::remove(path.c_str());
        for (const char* key : {"test.int", "test.flag", "test.text", "query.collect_type_instances"}) {
            Config::getInstance().erase(key);
        }
    }

    std::string path;
};

TEST_F(ConfigTest, TypedGetters) {
    Config& config = Config::getInstance();
    config.set("test.int", "42");
    config.set("test.flag", "On");
    config.set("test.text", "hello");

    EXPECT_EQ(config.get<int>("test.int"), 42);
    EXPECT_TRUE(config.get<bool>("test.flag"));
    EXPECT_EQ(config.get<std::string>("test.text"), "hello");
    EXPECT_EQ(config.get<int>("test.missing", 7), 7);
    EXPECT_FALSE(config.has("test.missing"));
}

TEST_F(ConfigTest, UnparsableValueFallsBackToDefault) {
    Config& config = Config::getInstance();
    config.set("test.int", "forty-two");
    EXPECT_EQ(config.get<int>("test.int", 3), 3);
}

TEST_F(ConfigTest, LoadsKeyValueFileOverEnvironment) {
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "db.host = graphdb.internal\n";
        out << "query.collect_type_instances=false\n";
        out << "log.level = verbose\n";
    }

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(path));
    EXPECT_EQ(config.get<std::string>("db.host"), "graphdb.internal");
    EXPECT_FALSE(config.get<bool>("query.collect_type_instances", true));
    // Unknown levels are reset during validation.
    EXPECT_EQ(config.get<std::string>("log.level"), "info");

    db::ConnectionConfig conn = db::ConnectionConfig::from_config(config);
    EXPECT_EQ(conn.host, "graphdb.internal");
    EXPECT_NE(conn.to_conninfo().find("host=graphdb.internal"), std::string::npos);

    config.load();
}

// Non-ASCII bytes survive trimming; only the surrounding blanks go
TEST_F(ConfigTest, TrimsAroundUtf8Values) {
    {
        std::ofstream out(path);
        out << "test.text = \xC3\xA9t\xC3\xA9 \t\n";
        out << "test.flag=\xE2\x9C\x93\n";
    }

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(path));
    EXPECT_EQ(config.get<std::string>("test.text"), "\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(config.get<std::string>("test.flag"), "\xE2\x9C\x93");

    config.load();
}

TEST_F(ConfigTest, InvalidPortFailsValidation) {
    {
        std::ofstream out(path);
        out << "db.port=99999\n";
    }
    std::stringstream sink;
    {
        ScopedLogOutput capture(sink);
        EXPECT_FALSE(Config::getInstance().load(path));
    }
    EXPECT_NE(sink.str().find("Invalid database port"), std::string::npos);

    Config::getInstance().load();
}

// =============================================================================
// Logger
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level = Logger::getInstance().level();
    }
    void TearDown() override {
        set_log_level(saved_level);
    }

    LogLevel saved_level = LogLevel::INFO;
    std::stringstream sink;
    ScopedLogOutput capture{sink};
};

TEST_F(LoggerTest, FiltersBelowLevel) {
    set_log_level(LogLevel::WARN);
    TYPEGRAPH_LOG_INFO("hidden");
    EXPECT_TRUE(sink.str().empty());

    TYPEGRAPH_LOG_ERROR("visible ", 42);
    std::string line = sink.str();
    EXPECT_NE(line.find("EROR"), std::string::npos);
    EXPECT_NE(line.find("test_config.cpp"), std::string::npos);
    EXPECT_NE(line.find("visible 42"), std::string::npos);
}

TEST_F(LoggerTest, EnabledFollowsLevel) {
    set_log_level(LogLevel::ERROR);
    EXPECT_FALSE(Logger::getInstance().enabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::getInstance().enabled(LogLevel::ERROR));
    EXPECT_TRUE(Logger::getInstance().enabled(LogLevel::FATAL));
}

TEST_F(LoggerTest, ScopedOutputRestoresPreviousStream) {
    std::stringstream inner;
    {
        ScopedLogOutput nested(inner);
        TYPEGRAPH_LOG_WARN("inner line");
    }
    TYPEGRAPH_LOG_WARN("outer line");
    EXPECT_NE(inner.str().find("inner line"), std::string::npos);
    EXPECT_EQ(inner.str().find("outer line"), std::string::npos);
    EXPECT_NE(sink.str().find("outer line"), std::string::npos);
}

TEST(LogLevelTest, PrefixCarriesTagFileAndFunction) {
    std::string prefix = format_log_prefix(LogLevel::WARN, "/src/core/materializer.cpp", 42, "materialize");
    EXPECT_EQ(prefix.front(), '[');
    EXPECT_NE(prefix.find("] WARN materializer.cpp:42 materialize() - "), std::string::npos);
    EXPECT_STREQ(log_level_tag(LogLevel::ERROR), "EROR");
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

// =============================================================================
// Errors
// =============================================================================

TEST(ErrorTest, MessageCarriesCodeContextAndSuggestion) {
    TypeNotFoundError e("Ghost", "lookup");
    std::string what = e.what();
    EXPECT_EQ(e.code(), ErrorCode::TYPE_NOT_FOUND);
    EXPECT_NE(what.find("[100]"), std::string::npos);
    EXPECT_NE(what.find("Unknown type: Ghost"), std::string::npos);
    EXPECT_NE(what.find("lookup"), std::string::npos);
    EXPECT_FALSE(e.suggestion().empty());
}

TEST(ErrorTest, DataAndSchemaErrorsAreDistinct) {
    EXPECT_THROW(throw ConversionError("bad"), DataError);
    EXPECT_THROW(throw RepositoryError("down"), DataError);
    EXPECT_THROW(throw UnsupportedCategoryError("odd"), SchemaError);
    EXPECT_THROW(throw NamingError(RepositoryError("down")), SchemaError);

    NamingError wrapped(RepositoryError("store offline", "", "retry later"), "edge_label");
    EXPECT_EQ(wrapped.message(), "store offline");
    EXPECT_EQ(wrapped.suggestion(), "retry later");
    EXPECT_EQ(wrapped.code(), ErrorCode::NAMING_FAILED);
}

TEST(ErrorTest, CheckMacros) {
    int value = 1;
    EXPECT_NO_THROW(TYPEGRAPH_CHECK_ARGUMENT(value == 1, "fine"));
    EXPECT_THROW(TYPEGRAPH_CHECK_ARGUMENT(value == 2, "bad"), InvalidArgumentError);
    EXPECT_THROW(TYPEGRAPH_CHECK_POINTER(static_cast<int*>(nullptr), "ptr"), InvalidArgumentError);
    EXPECT_THROW(TYPEGRAPH_CHECK(false, ErrorCode::INTERNAL_ERROR, "broken"), TypegraphException);
}
