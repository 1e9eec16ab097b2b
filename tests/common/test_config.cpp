#include <gtest/gtest.h>
#include "common/config.hpp"
#include "test_utils.hpp"

#include <stdexcept>

using en::Config;

TEST(Config, MissingFileGivesDefaults) {
    testutil::TempFile tf("missing");
    Config config = Config::load_from_file(tf.path());
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.pattern, "[%Y-%m-%d %H:%M:%S.%f] [%l] %v");
    ASSERT_EQ(config.tables.size(), 3u);
    EXPECT_EQ(config.tables[0].name, "message_type");
    EXPECT_EQ(config.tables[1].name, "side");
    EXPECT_EQ(config.tables[2].name, "book_action");
}

TEST(Config, LoadsLoggingAndTables) {
    testutil::TempFile tf("tables");
    tf.write(R"({
        "logging": { "level": "debug" },
        "tables": {
            "status": { "-1": "UNKNOWN", "0": "OK", "1": "FAILED" },
            "color": { "2": "BLUE", "1": "GREEN", "0": "RED" }
        }
    })");

    Config config = Config::load_from_file(tf.path());
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.pattern, Config::default_config().logging.pattern);

    // Object members come back sorted by table name.
    ASSERT_EQ(config.tables.size(), 2u);
    EXPECT_EQ(config.tables[0].name, "color");
    EXPECT_EQ(config.tables[0].entries.size(), 3u);
    EXPECT_EQ(config.tables[1].name, "status");

    bool found_negative = false;
    for (const auto& [key, name] : config.tables[1].entries) {
        if (key == -1) {
            found_negative = true;
            EXPECT_EQ(name, "UNKNOWN");
        }
    }
    EXPECT_TRUE(found_negative);
}

TEST(Config, EmptyTablesObjectClearsDefaults) {
    Config config = Config::load_from_string(R"({"tables": {}})");
    EXPECT_TRUE(config.tables.empty());
}

TEST(Config, KeepsDefaultTablesWhenOnlyLoggingGiven) {
    Config config = Config::load_from_string(R"({"logging": {"pattern": "%v"}})");
    EXPECT_EQ(config.logging.pattern, "%v");
    EXPECT_EQ(config.tables.size(), 3u);
}

TEST(Config, RejectsNonIntegerKeys) {
    EXPECT_THROW(Config::load_from_string(R"({"tables": {"t": {"one": "A"}}})"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string(R"({"tables": {"t": {"1x": "A"}}})"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string(R"({"tables": {"t": {"": "A"}}})"), std::runtime_error);
}

TEST(Config, RejectsWrongTypes) {
    EXPECT_THROW(Config::load_from_string(R"({"tables": {"t": {"1": 5}}})"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string(R"({"tables": {"t": ["A"]}})"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string(R"({"logging": {"level": 3}})"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string(R"({"logging": 3})"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string(R"({"logging": "debug"})"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string(R"({"tables": 5})"), std::runtime_error);
}

TEST(Config, RejectsNonObjectRoot) {
    EXPECT_THROW(Config::load_from_string("[1,2]"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string("5"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string("null"), std::runtime_error);
}

TEST(Config, MalformedFileThrowsWithPath) {
    testutil::TempFile tf("broken");
    tf.write("{ not json");
    try {
        Config::load_from_file(tf.path());
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(tf.path()), std::string::npos) << e.what();
    }
}
