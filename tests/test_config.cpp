#include <gtest/gtest.h>
#include <reel/core/config.hpp>
#include <reel/media/media_stream.hpp>
#include "test_helpers.hpp"

namespace reel::test {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        Config::getInstance().setValidator(nullptr);
    }

    void TearDown() override {
        Config::getInstance().clear();
        Config::getInstance().setValidator(nullptr);
    }

    Config& config = Config::getInstance();
};

TEST_F(ConfigTest, DefaultsCoverLibraryKeys) {
    config.loadDefaults();

    EXPECT_EQ(config.get<int>("stream.cacheCapacity"), DefaultConfig::kCacheCapacity);
    EXPECT_EQ(config.get<int>("sequence.frameRate"), DefaultConfig::kSequenceFrameRate);
    EXPECT_EQ(config.get<std::string>("image.background"), std::string(DefaultConfig::kBackground));
    EXPECT_EQ(config.get<std::string>("logging.level"), std::string(DefaultConfig::kLogLevel));
    EXPECT_FALSE(config.get<bool>("image.normalize", true));
}

TEST_F(ConfigTest, SetCreatesNestedKeys) {
    EXPECT_FALSE(config.has("a.b.c"));
    EXPECT_TRUE(config.set("a.b.c", 42));
    EXPECT_TRUE(config.has("a.b.c"));
    EXPECT_EQ(config.get<int>("a.b.c"), 42);
    EXPECT_EQ(config.getKeys("a"), std::vector<std::string>({"a.b"}));
}

TEST_F(ConfigTest, MissingOrMistypedKeyGivesDefault) {
    EXPECT_EQ(config.get<int>("no.such.key", 5), 5);

    config.set("stream.cacheCapacity", std::string("many"));
    EXPECT_EQ(config.get<int>("stream.cacheCapacity", 3), 3);
}

TEST_F(ConfigTest, RemoveDeletesOnlyTheKey) {
    config.set("stream.cacheCapacity", 4);
    config.set("stream.other", 1);

    EXPECT_TRUE(config.remove("stream.cacheCapacity"));
    EXPECT_FALSE(config.remove("stream.cacheCapacity"));
    EXPECT_FALSE(config.has("stream.cacheCapacity"));
    EXPECT_TRUE(config.has("stream.other"));
}

TEST_F(ConfigTest, ValidatorRejectsValues) {
    config.setValidator([](const std::string& key, const nlohmann::json& value) {
        return key != "stream.cacheCapacity" || value.get<int>() > 0;
    });

    EXPECT_FALSE(config.set("stream.cacheCapacity", -1));
    EXPECT_FALSE(config.has("stream.cacheCapacity"));
    EXPECT_TRUE(config.set("stream.cacheCapacity", -1, false));
    EXPECT_EQ(config.get<int>("stream.cacheCapacity"), -1);
}

TEST_F(ConfigTest, LoadFromJsonMergesOrReplaces) {
    config.loadDefaults();
    config.loadFromJson({{"stream", {{"cacheCapacity", 8}}}});
    EXPECT_EQ(config.get<int>("stream.cacheCapacity"), 8);
    EXPECT_EQ(config.get<int>("sequence.frameRate"), DefaultConfig::kSequenceFrameRate);

    config.loadFromJson({{"stream", {{"cacheCapacity", 2}}}}, false);
    EXPECT_FALSE(config.has("sequence.frameRate"));
}

TEST_F(ConfigTest, SaveAndLoadFile) {
    TempDir dir;
    auto file = (dir.path() / "reel.json").string();

    config.loadDefaults();
    config.set("stream.cacheCapacity", 6);
    config.saveToFile(file);

    config.clear();
    config.loadFromFile(file);
    EXPECT_EQ(config.get<int>("stream.cacheCapacity"), 6);

    EXPECT_THROW(config.loadFromFile((dir.path() / "missing.json").string()), std::runtime_error);
}

TEST_F(ConfigTest, StreamOptionsFromConfig) {
    config.loadDefaults();
    config.set("stream.cacheCapacity", 5);
    config.set("sequence.frameRate", 24);
    config.set("image.background", std::string("r"));
    config.set("image.normalize", true);

    auto options = media::StreamOptions::fromConfig(config);
    ASSERT_TRUE(options.ok()) << options.error().what();
    EXPECT_EQ(options.value().cacheCapacity, 5u);
    EXPECT_EQ(options.value().sequenceFrameRate.num, 24);
    EXPECT_EQ(options.value().sequenceFrameRate.den, 1);
    EXPECT_TRUE(options.value().normalizeRgb);
    ASSERT_TRUE(options.value().background.has_value());
    EXPECT_EQ(*options.value().background, (media::Rgb{255, 0, 0}));
}

TEST_F(ConfigTest, StreamOptionsRejectBadValues) {
    config.loadDefaults();
    config.set("image.background", std::string("purple"));
    auto badBackground = media::StreamOptions::fromConfig(config);
    ASSERT_FALSE(badBackground.ok());
    EXPECT_EQ(badBackground.error().code(), ErrorCode::InvalidArgument);

    config.loadDefaults();
    config.set("sequence.frameRate", 0);
    auto badRate = media::StreamOptions::fromConfig(config);
    ASSERT_FALSE(badRate.ok());
    EXPECT_EQ(badRate.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, StreamOptionsClampCapacity) {
    config.set("stream.cacheCapacity", 0);
    auto options = media::StreamOptions::fromConfig(config);
    ASSERT_TRUE(options.ok());
    EXPECT_EQ(options.value().cacheCapacity, 1u);
    EXPECT_FALSE(options.value().background.has_value());
}

} // namespace reel::test
