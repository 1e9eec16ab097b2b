#include <gtest/gtest.h>
#include "common/config.hpp"
#include "common/table_registry.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using en::TableConfig;
using en::TableRegistry;

TEST(TableRegistry, BuildsDefaultTables) {
    TableRegistry registry(en::Config::default_config().tables);
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry.table_names(),
              (std::vector<std::string>{"book_action", "message_type", "side"}));

    const auto& types = registry.at("message_type");
    EXPECT_EQ(types.get_name_or(3, ""), "TRADE");
    EXPECT_EQ(types.get_key("CONTROL_ACK"), int64_t{5});
    EXPECT_EQ(registry.at("side").to_display_string(), "EnumNameMap[0:BID 1:ASK]");
}

TEST(TableRegistry, FindMissingTable) {
    TableRegistry registry(en::Config::default_config().tables);
    EXPECT_EQ(registry.find("nope"), nullptr);
    EXPECT_THROW(registry.at("nope"), std::out_of_range);
    EXPECT_NE(registry.find("side"), nullptr);
}

TEST(TableRegistry, EmptyTableIsAllowed) {
    TableRegistry registry({TableConfig{"empty", {}}});
    ASSERT_NE(registry.find("empty"), nullptr);
    EXPECT_EQ(registry.at("empty").size(), 0u);
}

TEST(TableRegistry, RejectsGapWithoutAborting) {
    std::vector<TableConfig> tables{{"gappy", {{1, "A"}, {3, "C"}}}};
    try {
        TableRegistry registry(tables);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("gappy"), std::string::npos) << message;
        EXPECT_NE(message.find("non-contiguous"), std::string::npos) << message;
    }
}

TEST(TableRegistry, RejectsDuplicateNames) {
    std::vector<TableConfig> tables{{"dupes", {{0, "SAME"}, {1, "SAME"}}}};
    EXPECT_THROW(TableRegistry registry(tables), std::invalid_argument);
}

TEST(TableRegistry, RejectsDuplicateTables) {
    std::vector<TableConfig> tables{
        {"side", {{0, "BID"}}},
        {"side", {{0, "ASK"}}},
    };
    EXPECT_THROW(TableRegistry registry(tables), std::invalid_argument);
}
