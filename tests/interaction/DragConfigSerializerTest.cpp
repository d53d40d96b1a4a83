#include <gtest/gtest.h>
#include <pagecraft/interaction/DragConfig.h>
#include <pagecraft/common/Errors.h>

using namespace pagecraft;

TEST(DragConfigSerializerTest, CustomValuesSurviveSaveAndLoad) {
    DragConfig config;
    config.snapToGrid = false;
    config.gridSize = 4.0f;
    config.enableDropValidation = false;
    config.canvasBounds = {10, 20, 800, 600};
    config.insideMargin = 6.0f;

    DragConfig loaded = DragConfigSerializer::fromJson(DragConfigSerializer::toJson(config));

    EXPECT_FALSE(loaded.snapToGrid);
    EXPECT_FLOAT_EQ(loaded.gridSize, 4.0f);
    EXPECT_FALSE(loaded.enableDropValidation);
    EXPECT_EQ(loaded.canvasBounds, (Rect{10, 20, 800, 600}));
    EXPECT_FLOAT_EQ(loaded.insideMargin, 6.0f);
    EXPECT_FLOAT_EQ(loaded.gapWidth, 10.0f);
}

TEST(DragConfigSerializerTest, MissingKeysKeepDefaults) {
    DragConfig loaded = DragConfigSerializer::fromJson(R"({"canvas": {"width": 640}})");

    EXPECT_TRUE(loaded.snapToGrid);
    EXPECT_FLOAT_EQ(loaded.gridSize, 8.0f);
    EXPECT_FLOAT_EQ(loaded.canvasBounds.width, 640.0f);
    EXPECT_FLOAT_EQ(loaded.canvasBounds.height, 800.0f);
}

TEST(DragConfigSerializerTest, MalformedJsonThrowsConfigError) {
    EXPECT_THROW(DragConfigSerializer::fromJson("{\"gridSize\": "), ConfigError);
    EXPECT_THROW(DragConfigSerializer::fromJson("42"), ConfigError);
}

TEST(DragConfigSerializerTest, WrongValueTypeThrowsConfigError) {
    EXPECT_THROW(DragConfigSerializer::fromJson(R"({"gridSize": "big"})"), ConfigError);
    EXPECT_THROW(DragConfigSerializer::fromJson(R"({"canvas": [0, 0]})"), ConfigError);
}

TEST(DragConfigSerializerTest, NonPositiveSizesThrowConfigError) {
    EXPECT_THROW(DragConfigSerializer::fromJson(R"({"gridSize": 0})"), ConfigError);
    EXPECT_THROW(DragConfigSerializer::fromJson(R"({"canvas": {"height": -5}})"), ConfigError);
}
