#pragma once

#include <string>
#include "gest/action/ActionTypes.hpp"
#include "gest/camera/CameraTypes.hpp"
#include "gest/gesture/FeatureProcessor.hpp"
#include "gest/gesture/MediaPipeLandmarkSource.hpp"
#include "gest/gesture/ModelArtifact.hpp"
#include "gest/gesture/ModelFamily.hpp"
#include "gest/gesture/StabilityFilter.hpp"
#include "gest/training/TrainingPipeline.hpp"

namespace YAML {
class Node;
}

namespace gest {
namespace core {

struct LoggingConfig {
    std::string level = "info";
    bool console = true;
    std::string directory;      ///< Empty disables the log files
    std::string max_file_size = "10MB";  ///< Rotation threshold, e.g. 512KB or 10MB
    int backup_count = 5;       ///< Rotated files kept per log, 0 truncates in place
};

struct ClassifierConfig {
    gesture::ModelKind kind = gesture::ModelKind::SVM;
    std::string model_path = "gest_model.yml";
};

struct DispatcherConfig {
    size_t queue_capacity = 16;
    std::string backend = "command";   ///< "command" or "log"
    std::string xdotool_path = "xdotool";
};

/**
 * Complete application configuration
 *
 * Every field has a default, so an empty document is a valid configuration.
 * classifier.confidence_threshold lands in stability.confidence_threshold,
 * classifier.svm / classifier.forest in training.fit, and
 * the features section in training.features.
 */
struct GestConfig {
    LoggingConfig logging;
    camera::CameraConfig camera;
    gesture::DetectionConfig detection;
    gesture::FeatureConfig features;
    ClassifierConfig classifier;
    gesture::StabilityConfig stability;
    training::TrainingConfig training;
    DispatcherConfig dispatcher;
    action::ActionMapping actions;
};

/**
 * YAML configuration loader
 *
 * Unknown keys are logged as warnings. Malformed values, out-of-range
 * numbers and unknown enumerated options throw ConfigException.
 */
class ConfigLoader {
public:
    /**
     * @throws ConfigException if the file cannot be read or is invalid
     */
    static GestConfig from_file(const std::string& path);

    /**
     * @throws ConfigException if the document is invalid
     */
    static GestConfig from_string(const std::string& yaml);

    static GestConfig from_node(const YAML::Node& root);

    /**
     * Apply level, console and file settings to the Logger singleton
     */
    static void apply_logging(const LoggingConfig& logging);
};

} // namespace core
} // namespace gest
