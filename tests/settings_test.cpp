#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "settings.hpp"
#include "test_support.hpp"

TEST(NormalizeKeywordsTest, TrimsLowersAndDeduplicates) {
    const auto keywords = NormalizeKeywords({"  Bank ", "bank", "", "   ", "HEALTH", "health\t"});
    ASSERT_EQ(keywords.size(), 2u);
    EXPECT_EQ(keywords[0], "bank");
    EXPECT_EQ(keywords[1], "health");
}

TEST(NormalizeKeywordsTest, KeepsAtMostFifty) {
    std::vector<std::string> many;
    for (int i = 0; i < 80; ++i) {
        many.push_back("kw" + std::to_string(i));
    }
    const auto keywords = NormalizeKeywords(many);
    ASSERT_EQ(keywords.size(), kMaxExcludedKeywords);
    EXPECT_EQ(keywords.front(), "kw0");
    EXPECT_EQ(keywords.back(), "kw49");
}

class SettingsStoreTest : public StoreTest {};

TEST_F(SettingsStoreTest, DefaultsWhenNothingIsStored) {
    SettingsStore settings(Store(), 6);
    const AnalyticsSettings loaded = settings.Load();
    EXPECT_TRUE(loaded.excluded_keywords.empty());
    EXPECT_EQ(loaded.day_start_hour, 6);
}

TEST_F(SettingsStoreTest, SavesNormalizedValues) {
    SettingsStore settings(Store(), kDefaultDayStartHour);
    std::string error;
    ASSERT_TRUE(settings.SaveExcludedKeywords({"Bank", " bank ", "Clinic"}, error)) << error;
    ASSERT_TRUE(settings.SaveDayStartHour(30, error)) << error;

    const AnalyticsSettings loaded = settings.Load();
    EXPECT_EQ(loaded.excluded_keywords, (std::vector<std::string>{"bank", "clinic"}));
    EXPECT_EQ(loaded.day_start_hour, 23);
    EXPECT_EQ(Store().GetSetting("excludedKeywords"), R"(["bank","clinic"])");

    ASSERT_TRUE(settings.SaveDayStartHour(-2, error)) << error;
    EXPECT_EQ(settings.Load().day_start_hour, 0);
}

TEST_F(SettingsStoreTest, GetterReadsCurrentValues) {
    SettingsStore settings(Store(), kDefaultDayStartHour);
    const SettingsGetter getter = settings.Getter();
    EXPECT_TRUE(getter().excluded_keywords.empty());

    std::string error;
    ASSERT_TRUE(settings.SaveExcludedKeywords({"bank"}, error)) << error;
    EXPECT_EQ(getter().excluded_keywords.size(), 1u);
}

TEST_F(SettingsStoreTest, NonArrayKeywordsAreIgnored) {
    std::string error;
    ASSERT_TRUE(Store().SetSetting("excludedKeywords", R"({"bank": true})", error)) << error;
    ASSERT_TRUE(Store().SetSetting("dayStartHour", R"("seven")", error)) << error;

    SettingsStore settings(Store(), 5);
    const AnalyticsSettings loaded = settings.Load();
    EXPECT_TRUE(loaded.excluded_keywords.empty());
    EXPECT_EQ(loaded.day_start_hour, 5);
}

TEST_F(SettingsStoreTest, CorruptValueThrows) {
    std::string error;
    ASSERT_TRUE(Store().SetSetting("excludedKeywords", "[not json", error)) << error;

    SettingsStore settings(Store(), kDefaultDayStartHour);
    EXPECT_THROW(settings.Load(), nlohmann::json::exception);
}
