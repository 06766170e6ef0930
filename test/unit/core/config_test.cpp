#include <gtest/gtest.h>
#include "tiermem/core/config.h"
#include "tiermem/core/types.h"

namespace tiermem {
namespace core {
namespace {

TEST(ConfigTest, DefaultsValidate) {
    auto config = EngineConfig::Default();
    auto result = config.validate();
    EXPECT_TRUE(result.ok());
}

TEST(ConfigTest, DefaultValues) {
    auto config = EngineConfig::Default();
    EXPECT_DOUBLE_EQ(config.importance.novelty_weight, 0.35);
    EXPECT_DOUBLE_EQ(config.importance.sentiment_weight, 0.30);
    EXPECT_DOUBLE_EQ(config.importance.feedback_weight, 0.20);
    EXPECT_DOUBLE_EQ(config.importance.recurrence_weight, 0.80);
    EXPECT_EQ(config.hot.capacity_per_owner, 20u);
    EXPECT_DOUBLE_EQ(config.controller.warm_threshold, 5.0);
    EXPECT_DOUBLE_EQ(config.controller.retention_floor, 2.0);
    EXPECT_DOUBLE_EQ(config.hot.hot_floor, config.controller.warm_threshold);
    EXPECT_EQ(config.warm.retention, 7LL * 24 * 3600 * 1000);
    EXPECT_EQ(config.privacy.placeholder, "[REDACTED]");
    EXPECT_EQ(config.controller.serialization_mode, SerializationMode::QUEUE);
}

TEST(ConfigTest, ZeroCapacityRejected) {
    auto config = EngineConfig::Default();
    config.hot.capacity_per_owner = 0;
    auto result = config.validate();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_NE(result.error().find("invalid configuration"), std::string::npos);
}

TEST(ConfigTest, ThresholdOrderingEnforced) {
    auto config = EngineConfig::Default();
    config.controller.retention_floor = 6.0;
    config.controller.warm_threshold = 5.0;
    EXPECT_FALSE(config.validate().ok());

    config.controller.retention_floor = -1.0;
    config.controller.warm_threshold = 5.0;
    EXPECT_FALSE(config.validate().ok());

    config.controller.retention_floor = 5.0;
    EXPECT_TRUE(config.validate().ok());
}

TEST(ConfigTest, DeltaThresholdRange) {
    auto config = EngineConfig::Default();
    config.cold.delta_similarity_threshold = 0.0;
    EXPECT_FALSE(config.validate().ok());
    config.cold.delta_similarity_threshold = 1.5;
    EXPECT_FALSE(config.validate().ok());
    config.cold.delta_similarity_threshold = 1.0;
    EXPECT_TRUE(config.validate().ok());
}

TEST(ConfigTest, EdgeStrengthRange) {
    auto config = EngineConfig::Default();
    config.warm.mention_strength = 1.2;
    EXPECT_FALSE(config.validate().ok());
}

TEST(ConfigTest, EmptyPlaceholderRejected) {
    auto config = EngineConfig::Default();
    config.privacy.placeholder.clear();
    EXPECT_FALSE(config.validate().ok());
}

TEST(ConfigTest, AccessBonusMustNotBeNegative) {
    auto config = EngineConfig::Default();
    EXPECT_DOUBLE_EQ(config.controller.access_bonus_rate, 0.1);
    EXPECT_DOUBLE_EQ(config.controller.access_bonus_cap, 2.0);
    config.controller.access_bonus_cap = -0.5;
    EXPECT_FALSE(config.validate().ok());
    config.controller.access_bonus_cap = 0.0;
    EXPECT_TRUE(config.validate().ok());
}

TEST(ConfigTest, MaintenanceIntervalCheckedOnlyWhenEnabled) {
    auto config = EngineConfig::Default();
    config.controller.maintenance_interval = std::chrono::milliseconds(0);
    EXPECT_TRUE(config.validate().ok());
    config.controller.enable_background_maintenance = true;
    EXPECT_FALSE(config.validate().ok());
}

TEST(TypesTest, TierTraits) {
    EXPECT_STREQ(tier_name(Tier::HOT), "hot");
    EXPECT_STREQ(tier_name(Tier::WARM), "warm");
    EXPECT_STREQ(tier_name(Tier::COLD), "cold");
    EXPECT_FALSE(tier_traits(Tier::HOT).durable);
    EXPECT_TRUE(tier_traits(Tier::COLD).durable);
    EXPECT_GT(tier_traits(Tier::HOT).recall_bonus, tier_traits(Tier::WARM).recall_bonus);
    EXPECT_GT(tier_traits(Tier::WARM).recall_bonus, tier_traits(Tier::COLD).recall_bonus);
}

TEST(TypesTest, NormalizeLabel) {
    EXPECT_EQ(normalize_label("  Project Apollo "), "project apollo");
    EXPECT_EQ(normalize_label("   "), "");
}

TEST(TypesTest, MentionsSearchesTextEntitiesAndTopics) {
    MemoryItem item;
    item.content.text = "We talked about the Launch";
    item.content.entities = {"Alice"};
    item.content.topics = {"budget"};
    EXPECT_TRUE(item.mentions("launch"));
    EXPECT_TRUE(item.mentions("ALICE"));
    EXPECT_TRUE(item.mentions("Budget"));
    EXPECT_FALSE(item.mentions("weather"));
    EXPECT_FALSE(item.mentions(""));
}

} // namespace
} // namespace core
} // namespace tiermem
