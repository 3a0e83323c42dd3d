#include <gtest/gtest.h>
#include <canvascore/config/CanvasConfig.h>

#include <filesystem>

using namespace canvascore;

TEST(CanvasConfigTest, DefaultsAreValid) {
    CanvasConfig config;

    EXPECT_TRUE(config.isValid());
    EXPECT_EQ(config.persistence.debounceMs, 300u);
    EXPECT_EQ(config.history.coalesceWindowMs, 500u);
    EXPECT_EQ(config.routing.gestureHoldMs, 200u);
    EXPECT_EQ(config.routing.gestureReleaseMs, 500u);
    EXPECT_EQ(config.graph.minNodeSize, Size(120, 80));
}

TEST(CanvasConfigTest, ValidateReportsEachProblem) {
    CanvasConfig config;
    config.routing.gestureReleaseMs = 100;
    config.persistence.maxDeferMs = 10;
    config.viewport.minZoom = 0.0f;

    auto problems = config.validate();

    EXPECT_EQ(problems.size(), 3u);
    EXPECT_FALSE(config.isValid());
}

TEST(CanvasConfigSerializerTest, PartialDocumentKeepsDefaults) {
    CanvasConfig config = CanvasConfigSerializer::fromJson(R"({
        "history": {"capacity": 50},
        "persistence": {"databasePath": "board.db"},
        "logging": {"level": "debug"}
    })");

    EXPECT_EQ(config.history.capacity, 50u);
    EXPECT_EQ(config.history.coalesceWindowMs, 500u);
    EXPECT_EQ(config.persistence.databasePath, "board.db");
    EXPECT_EQ(config.persistence.debounceMs, DEFAULT_WRITE_DEBOUNCE_MS);
    EXPECT_EQ(config.logging.level, LogLevel::Debug);
}

TEST(CanvasConfigSerializerTest, MalformedDocumentYieldsDefaults) {
    CanvasConfig config = CanvasConfigSerializer::fromJson("{\"history\": ");

    EXPECT_EQ(config.history.capacity, HistoryConfig{}.capacity);
    EXPECT_TRUE(config.isValid());
}

TEST(CanvasConfigSerializerTest, WrongTypesIgnored) {
    CanvasConfig config = CanvasConfigSerializer::fromJson(
        R"({"routing": {"gestureHoldMs": "fast"}, "graph": {"maxNodeSize": 12}})");

    EXPECT_EQ(config.routing.gestureHoldMs, 200u);
    EXPECT_EQ(config.graph.maxNodeSize, GraphLimits{}.maxNodeSize);
}

TEST(CanvasConfigSerializerTest, FileRoundTrip) {
    CanvasConfig config;
    config.graph.maxNodes = 42;
    config.viewport.maxZoom = 5.0f;
    config.logging.level = LogLevel::Error;

    std::string path = (std::filesystem::temp_directory_path() / "canvascore_config_test.json").string();
    ASSERT_TRUE(CanvasConfigSerializer::saveToFile(config, path));

    CanvasConfig loaded;
    ASSERT_TRUE(CanvasConfigSerializer::loadFromFile(path, loaded));
    EXPECT_EQ(loaded.graph.maxNodes, 42u);
    EXPECT_FLOAT_EQ(loaded.viewport.maxZoom, 5.0f);
    EXPECT_EQ(loaded.logging.level, LogLevel::Error);

    std::filesystem::remove(path);
    EXPECT_FALSE(CanvasConfigSerializer::loadFromFile(path, loaded));
    EXPECT_EQ(loaded.graph.maxNodes, GraphLimits{}.maxNodes);
}
