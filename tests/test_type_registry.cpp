#include <gtest/gtest.h>
#include "../core/EventType.hpp"
#include "../core/TypeMatcher.hpp"
#include <stdexcept>
#include <thread>
#include <vector>

using namespace evhistory;

class TypeRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ui_ = registry_.declare("ui.Event");
        click_ = registry_.declare("ui.Click", "ui.Event");
        doubleClick_ = registry_.declare("ui.DoubleClick", click_);
        io_ = registry_.declare("io.Event");
    }

    TypeRegistry registry_;
    TypeHandle ui_;
    TypeHandle click_;
    TypeHandle doubleClick_;
    TypeHandle io_;
};

TEST_F(TypeRegistryTest, RootIsAncestorOfEverything) {
    auto root = registry_.root();
    EXPECT_TRUE(root.isRoot());
    EXPECT_EQ(root.name(), "Event");

    for (const auto& type : registry_.types()) {
        EXPECT_TRUE(root.isAssignableFrom(type)) << type.name();
    }
}

TEST_F(TypeRegistryTest, AssignabilityFollowsHierarchy) {
    EXPECT_TRUE(ui_.isAssignableFrom(ui_));
    EXPECT_TRUE(ui_.isAssignableFrom(click_));
    EXPECT_TRUE(ui_.isAssignableFrom(doubleClick_));
    EXPECT_TRUE(click_.isAssignableFrom(doubleClick_));

    // Subtypes never cover their parents, and siblings never cover each other
    EXPECT_FALSE(click_.isAssignableFrom(ui_));
    EXPECT_FALSE(doubleClick_.isAssignableFrom(click_));
    EXPECT_FALSE(io_.isAssignableFrom(click_));
    EXPECT_FALSE(ui_.isAssignableFrom(io_));
}

TEST_F(TypeRegistryTest, LineageRunsFromSelfToRoot) {
    auto lineage = doubleClick_.lineage();
    ASSERT_EQ(lineage.size(), 4u);
    EXPECT_EQ(lineage[0], doubleClick_);
    EXPECT_EQ(lineage[1], click_);
    EXPECT_EQ(lineage[2], ui_);
    EXPECT_EQ(lineage[3], registry_.root());
    EXPECT_EQ(doubleClick_.depth(), 3u);
}

TEST_F(TypeRegistryTest, RedeclarationReturnsSameHandle) {
    EXPECT_EQ(registry_.declare("ui.Click", "ui.Event"), click_);
    EXPECT_EQ(registry_.declare("ui.Event"), ui_);
    EXPECT_EQ(registry_.size(), 5u);
}

TEST_F(TypeRegistryTest, RejectsInvalidDeclarations) {
    EXPECT_THROW(registry_.declare("ui.Click", "io.Event"), std::invalid_argument);
    EXPECT_THROW(registry_.declare("net.Packet", "net.Event"), std::invalid_argument);
    EXPECT_THROW(registry_.declare(""), std::invalid_argument);
    EXPECT_THROW(registry_.declare("Event", "ui.Event"), std::invalid_argument);

    TypeRegistry other;
    auto foreign = other.declare("ui.Event");
    EXPECT_THROW(registry_.declare("ui.Hover", foreign), std::invalid_argument);
    EXPECT_THROW(registry_.declare("ui.Hover", TypeHandle()), std::invalid_argument);
}

TEST_F(TypeRegistryTest, HandlesFromDifferentRegistriesAreDistinct) {
    TypeRegistry other;
    auto otherUi = other.declare("ui.Event");

    EXPECT_NE(otherUi, ui_);
    EXPECT_FALSE(ui_.isAssignableFrom(otherUi));
}

TEST_F(TypeRegistryTest, LookupByName) {
    EXPECT_EQ(registry_.find("ui.Click"), click_);
    EXPECT_FALSE(registry_.find("ui.Missing").has_value());
    EXPECT_EQ(registry_.resolve("io.Event"), io_);
    EXPECT_THROW(registry_.resolve("ui.Missing"), std::out_of_range);

    auto set = registry_.resolveAll({"ui.Click", "io.Event", "ui.Click"});
    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(set.count(click_), 1u);
    EXPECT_EQ(set.count(io_), 1u);
    EXPECT_THROW(registry_.resolveAll({"ui.Click", "nope"}), std::out_of_range);
}

TEST_F(TypeRegistryTest, InvalidHandleCoversNothing) {
    TypeHandle invalid;
    EXPECT_FALSE(invalid.valid());
    EXPECT_TRUE(invalid.name().empty());
    EXPECT_FALSE(invalid.isAssignableFrom(ui_));
    EXPECT_FALSE(ui_.isAssignableFrom(invalid));
    EXPECT_TRUE(invalid.lineage().empty());
}

TEST_F(TypeRegistryTest, ConcurrentDeclarationsOfSameNameAgree) {
    std::vector<TypeHandle> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([this, &results, i]() {
            results[i] = registry_.declare("ui.Scroll", "ui.Event");
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& handle : results) {
        EXPECT_EQ(handle, results.front());
    }
    EXPECT_EQ(registry_.size(), 6u);
}

TEST_F(TypeRegistryTest, MatcherCoversAncestorOrSelf) {
    EXPECT_TRUE(TypeMatcher::covers({ui_}, ui_));
    EXPECT_TRUE(TypeMatcher::covers({ui_}, click_));
    EXPECT_TRUE(TypeMatcher::covers({ui_}, doubleClick_));
    EXPECT_TRUE(TypeMatcher::covers({io_, click_}, doubleClick_));
    EXPECT_TRUE(TypeMatcher::covers({registry_.root()}, io_));

    EXPECT_FALSE(TypeMatcher::covers({click_}, ui_));
    EXPECT_FALSE(TypeMatcher::covers({io_}, click_));
}

TEST_F(TypeRegistryTest, MatcherWithEmptySetCoversNothing) {
    EXPECT_FALSE(TypeMatcher::covers({}, ui_));
    EXPECT_FALSE(TypeMatcher::covers({}, registry_.root()));
    EXPECT_FALSE(TypeMatcher::covers({ui_}, TypeHandle()));
}
