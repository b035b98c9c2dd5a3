/**
 * @file test_configuration.cpp
 * @brief Unit tests for the YAML configuration loader
 */

#include <gtest/gtest.h>
#include <gest/core/Configuration.hpp>
#include <gest/core/Logger.hpp>
#include <gest/core/exception.h>

#include <cstdio>
#include <fstream>

using namespace gest::core;
using gest::action::ActionKind;
using gest::action::MouseButton;
using gest::gesture::FeatureLayout;
using gest::gesture::ModelKind;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLevel(LogLevel::ERROR);
    }
};

TEST_F(ConfigurationTest, EmptyDocumentGivesDefaults) {
    GestConfig config = ConfigLoader::from_string("");

    EXPECT_EQ(config.camera.devices, std::vector<std::string>{"0"});
    EXPECT_EQ(config.camera.width, 640);
    EXPECT_EQ(config.features.layout, FeatureLayout::COORDINATES);
    EXPECT_EQ(config.classifier.kind, ModelKind::SVM);
    EXPECT_FLOAT_EQ(config.stability.confidence_threshold, 0.7f);
    EXPECT_EQ(config.stability.min_streak, 5);
    EXPECT_EQ(config.stability.release_frames, 3);
    EXPECT_EQ(config.dispatcher.queue_capacity, 16u);
    EXPECT_EQ(config.dispatcher.backend, "command");
    EXPECT_TRUE(config.actions.empty());
}

TEST_F(ConfigurationTest, ParsesFullDocument) {
    GestConfig config = ConfigLoader::from_string(R"(
logging:
  level: debug
  console: false
  max_file_size: 512KB
  backup_count: 2
camera:
  devices: ["/dev/video2", "0"]
  width: 320
  height: 240
  failure_threshold: 4
  backoff_initial_ms: 50
  backoff_max_ms: 400
detection:
  max_hands: 2
  model_complexity: 0
features:
  layout_version: 2
  rotation_invariant: true
classifier:
  kind: random_forest
  model_path: models/hand.yml
  confidence_threshold: 0.85
  svm:
    kernel: LINEAR
    c: 2.5
  forest:
    trees: 60
stability:
  min_streak: 7
  release_frames: 2
training:
  dataset_path: data/samples.csv
  test_fraction: 0.25
  seed: 9
dispatcher:
  queue_capacity: 4
  backend: log
actions:
  thumbs_up:
    kind: key_press
    keys: ctrl+shift+t
  fist:
    kind: key
    keys: [alt, F4]
    cooldown_ms: 1500
  pinch:
    kind: click
    button: right
    clicks: 2
  point_down:
    kind: mouse_scroll
    amount: -3
  open_palm:
    kind: custom_command
    command: "notify-send hello"
)");

    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.logging.console);
    EXPECT_EQ(config.logging.max_file_size, "512KB");
    EXPECT_EQ(config.logging.backup_count, 2);

    const std::vector<std::string> devices = {"/dev/video2", "0"};
    EXPECT_EQ(config.camera.devices, devices);
    EXPECT_EQ(config.camera.width, 320);
    EXPECT_EQ(config.camera.failure_threshold, 4);
    EXPECT_EQ(config.camera.backoff_max_ms, 400);

    EXPECT_EQ(config.detection.max_hands, 2);
    EXPECT_EQ(config.features.layout, FeatureLayout::COORDINATES_AND_ANGLES);
    EXPECT_TRUE(config.features.rotation_invariant);

    EXPECT_EQ(config.classifier.kind, ModelKind::RANDOM_FOREST);
    EXPECT_EQ(config.classifier.model_path, "models/hand.yml");
    EXPECT_FLOAT_EQ(config.stability.confidence_threshold, 0.85f);
    EXPECT_EQ(config.training.fit.svm.kernel, "linear");
    EXPECT_DOUBLE_EQ(config.training.fit.svm.c, 2.5);
    EXPECT_EQ(config.training.fit.forest.trees, 60);

    EXPECT_EQ(config.stability.min_streak, 7);
    EXPECT_EQ(config.stability.release_frames, 2);

    EXPECT_EQ(config.training.dataset_path, "data/samples.csv");
    EXPECT_DOUBLE_EQ(config.training.test_fraction, 0.25);
    EXPECT_EQ(config.training.seed, 9u);
    EXPECT_EQ(config.training.features, config.features);

    EXPECT_EQ(config.dispatcher.queue_capacity, 4u);
    EXPECT_EQ(config.dispatcher.backend, "log");

    ASSERT_EQ(config.actions.size(), 5u);
    const auto& thumbs = config.actions.at("thumbs_up");
    EXPECT_EQ(thumbs.kind, ActionKind::KEY_PRESS);
    EXPECT_EQ(thumbs.keys, (std::vector<std::string>{"ctrl", "shift", "t"}));

    const auto& fist = config.actions.at("fist");
    EXPECT_EQ(fist.keys, (std::vector<std::string>{"alt", "F4"}));
    EXPECT_EQ(fist.cooldown_ms, 1500);

    const auto& pinch = config.actions.at("pinch");
    EXPECT_EQ(pinch.kind, ActionKind::MOUSE_CLICK);
    EXPECT_EQ(pinch.button, MouseButton::RIGHT);
    EXPECT_EQ(pinch.clicks, 2);

    EXPECT_EQ(config.actions.at("point_down").amount, -3);
    EXPECT_EQ(config.actions.at("open_palm").kind, ActionKind::CUSTOM_COMMAND);
    EXPECT_EQ(config.actions.at("open_palm").command, "notify-send hello");
}

TEST_F(ConfigurationTest, UnknownKeysAreIgnored) {
    GestConfig config = ConfigLoader::from_string("camera:\n  width: 800\n  colour: blue\nextra: 1\n");
    EXPECT_EQ(config.camera.width, 800);
}

TEST_F(ConfigurationTest, RejectsInvalidValues) {
    EXPECT_THROW(ConfigLoader::from_string("features:\n  layout_version: 3\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("camera:\n  width: wide\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("camera:\n  devices: []\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("classifier:\n  kind: knn\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("classifier:\n  confidence_threshold: 1.5\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("stability:\n  min_streak: 0\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("training:\n  test_fraction: 1.0\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("dispatcher:\n  backend: x\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("logging:\n  level: loud\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("logging:\n  max_file_size: 0MB\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("logging:\n  max_file_size: lots\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("logging:\n  backup_count: -1\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("camera:\n  backoff_max_ms: 2000000000\n"), ConfigException);
}

TEST_F(ConfigurationTest, RejectsInvalidActions) {
    EXPECT_THROW(ConfigLoader::from_string("actions:\n  wave:\n    kind: teleport\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("actions:\n  wave:\n    keys: a\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("actions:\n  wave:\n    kind: key_press\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("actions:\n  wave:\n    kind: click\n    button: side\n"),
                 ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("actions:\n  wave: ctrl+c\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("actions:\n  wave:\n    kind: mouse_scroll\n    amount: -2147483648\n"),
                 ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("actions:\n  wave:\n    kind: mouse_scroll\n    amount: 101\n"),
                 ConfigException);
    EXPECT_NO_THROW(ConfigLoader::from_string("actions:\n  wave:\n    kind: mouse_scroll\n    amount: -100\n"));
}

TEST_F(ConfigurationTest, RejectsMalformedDocuments) {
    EXPECT_THROW(ConfigLoader::from_string("- a\n- b\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("camera: [1, 2]\n"), ConfigException);
    EXPECT_THROW(ConfigLoader::from_string("camera: {width: 1\n"), ConfigException);
}

TEST_F(ConfigurationTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "gest_config_test.yaml";
    {
        std::ofstream out(path);
        out << "stability:\n  min_streak: 3\n";
    }
    GestConfig config = ConfigLoader::from_file(path);
    std::remove(path.c_str());
    EXPECT_EQ(config.stability.min_streak, 3);

    EXPECT_THROW(ConfigLoader::from_file(::testing::TempDir() + "gest_no_such_config.yaml"), ConfigException);
}
