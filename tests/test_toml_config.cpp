#include <gtest/gtest.h>
#include "../platform/desktop/TomlConfig.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace evhistory;

TEST(TomlConfigTest, ParsesHistorySection) {
    auto config = TomlConfig::loadFromString(R"(
# recorder settings
[history]
max_entries = 500
start_active = true     # record immediately
format = "html"
verbose = 1
)");

    EXPECT_EQ(config.maxEntries, 500u);
    EXPECT_TRUE(config.startActive);
    EXPECT_EQ(config.format, OutputFormat::Html);
    EXPECT_TRUE(config.verbose);
}

TEST(TomlConfigTest, DefaultsWhenEmpty) {
    auto config = TomlConfig::loadFromString("");

    EXPECT_EQ(config.maxEntries, 0u);
    EXPECT_FALSE(config.startActive);
    EXPECT_EQ(config.format, OutputFormat::Text);
    EXPECT_FALSE(config.verbose);
    EXPECT_TRUE(config.types.empty());
}

TEST(TomlConfigTest, TypesKeepDeclarationOrder) {
    auto config = TomlConfig::loadFromString(R"(
[types]
ui.Event = "Event"
"ui.Click" = "ui.Event"
io.Event = ""
)");

    ASSERT_EQ(config.types.size(), 3u);
    EXPECT_EQ(config.types[0].name, "ui.Event");
    EXPECT_EQ(config.types[0].parent, "Event");
    EXPECT_EQ(config.types[1].name, "ui.Click");
    EXPECT_EQ(config.types[1].parent, "ui.Event");
    EXPECT_TRUE(config.types[2].parent.empty());

    TypeRegistry registry;
    applyTypeDeclarations(config, registry);
    auto click = registry.resolve("ui.Click");
    EXPECT_TRUE(registry.resolve("ui.Event").isAssignableFrom(click));
    EXPECT_EQ(registry.resolve("io.Event").parent(), registry.root());
}

TEST(TomlConfigTest, TypeWithUndeclaredParentFails) {
    auto config = TomlConfig::loadFromString("[types]\nui.Click = \"ui.Event\"\n");

    TypeRegistry registry;
    EXPECT_THROW(applyTypeDeclarations(config, registry), std::invalid_argument);
}

TEST(TomlConfigTest, MalformedValuesThrow) {
    EXPECT_THROW(TomlConfig::loadFromString("[history]\nmax_entries = lots\n"), std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[history]\nmax_entries = -1\n"), std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[history]\nstart_active = maybe\n"), std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[history]\nformat = \"xml\"\n"), std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[history\n"), std::runtime_error);
}

TEST(TomlConfigTest, UnknownSectionsAreIgnored) {
    auto config = TomlConfig::loadFromString(R"(
[application]
name = "host # not a comment"
[history]
max_entries = 3
)");
    EXPECT_EQ(config.maxEntries, 3u);
}

TEST(TomlConfigTest, MissingFileGivesDefaults) {
    auto config = TomlConfig::loadFromFile("/nonexistent/evhistory.toml");
    EXPECT_EQ(config.maxEntries, 0u);
    EXPECT_EQ(config.format, OutputFormat::Text);
}

TEST(TomlConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "evhistory_config_test.toml";
    {
        std::ofstream out(path);
        out << "[history]\nformat = \"jsonl\"\n[types]\nnet.Event = \"Event\"\n";
    }

    auto config = TomlConfig::loadFromFile(path);
    std::remove(path.c_str());

    EXPECT_EQ(config.format, OutputFormat::JsonLines);
    ASSERT_EQ(config.types.size(), 1u);
    EXPECT_EQ(config.types[0].name, "net.Event");
}

TEST(HistoryConfigTest, FormatNames) {
    EXPECT_EQ(formatToString(OutputFormat::Text), "text");
    EXPECT_EQ(formatToString(OutputFormat::Html), "html");
    EXPECT_EQ(formatToString(OutputFormat::JsonLines), "jsonl");
    EXPECT_EQ(stringToFormat("json"), OutputFormat::JsonLines);
    EXPECT_THROW(stringToFormat("yaml"), std::runtime_error);
}
