#include "gest/core/Configuration.hpp"
#include "gest/core/Logger.hpp"
#include "gest/core/exception.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <set>

namespace gest {
namespace core {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void warnUnknownKeys(const YAML::Node& node, const std::set<std::string>& known, const std::string& section) {
    if (!node || !node.IsMap()) {
        return;
    }
    for (const auto& entry : node) {
        const std::string key = entry.first.as<std::string>();
        if (known.count(key) == 0) {
            LOG_WARNING("ConfigLoader: ignoring unknown key '" + (section.empty() ? key : section + "." + key) + "'");
        }
    }
}

YAML::Node section(const YAML::Node& root, const std::string& name) {
    YAML::Node node = root[name];
    if (node && !node.IsNull() && !node.IsMap()) {
        GEST_THROW(ConfigException, "'" + name + "' must be a mapping");
    }
    return node;
}

template<typename T>
void read(const YAML::Node& node, const std::string& key, T& value, const std::string& path) {
    if (!node || !node.IsMap()) {
        return;
    }
    const YAML::Node item = node[key];
    if (!item || item.IsNull()) {
        return;
    }
    try {
        value = item.as<T>();
    } catch (const YAML::Exception& e) {
        GEST_THROW(ConfigException, "Invalid value for '" + path + "." + key + "': " + e.what());
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        GEST_THROW(ConfigException, message);
    }
}

std::vector<std::string> readStringList(const YAML::Node& item, const std::string& path) {
    std::vector<std::string> values;
    try {
        if (item.IsSequence()) {
            for (const auto& element : item) {
                values.push_back(element.as<std::string>());
            }
        } else if (item.IsScalar()) {
            values.push_back(item.as<std::string>());
        } else {
            GEST_THROW(ConfigException, "'" + path + "' must be a string or a list");
        }
    } catch (const YAML::Exception& e) {
        GEST_THROW(ConfigException, "Invalid value for '" + path + "': " + e.what());
    }
    return values;
}

void loadLogging(const YAML::Node& root, LoggingConfig& logging) {
    const YAML::Node node = section(root, "logging");
    warnUnknownKeys(node, {"level", "console", "directory", "max_file_size", "backup_count"}, "logging");
    read(node, "level", logging.level, "logging");
    read(node, "console", logging.console, "logging");
    read(node, "directory", logging.directory, "logging");
    read(node, "max_file_size", logging.max_file_size, "logging");
    read(node, "backup_count", logging.backup_count, "logging");

    LogLevel level;
    require(parseLogLevel(logging.level, level), "Unknown logging.level '" + logging.level + "'");
    size_t bytes = 0;
    require(parseByteSize(logging.max_file_size, bytes),
            "logging.max_file_size must be a positive size such as 512KB or 10MB, got '" +
            logging.max_file_size + "'");
    require(logging.backup_count >= 0, "logging.backup_count must be non-negative");
}

void loadCamera(const YAML::Node& root, camera::CameraConfig& camera) {
    const YAML::Node node = section(root, "camera");
    warnUnknownKeys(node, {"devices", "width", "height", "fps", "read_timeout_ms", "failure_threshold",
                           "max_recovery_attempts", "backoff_initial_ms", "backoff_max_ms", "strict_format"},
                    "camera");
    if (node && node["devices"] && !node["devices"].IsNull()) {
        camera.devices = readStringList(node["devices"], "camera.devices");
    }
    read(node, "width", camera.width, "camera");
    read(node, "height", camera.height, "camera");
    read(node, "fps", camera.fps, "camera");
    read(node, "read_timeout_ms", camera.read_timeout_ms, "camera");
    read(node, "failure_threshold", camera.failure_threshold, "camera");
    read(node, "max_recovery_attempts", camera.max_recovery_attempts, "camera");
    read(node, "backoff_initial_ms", camera.backoff_initial_ms, "camera");
    read(node, "backoff_max_ms", camera.backoff_max_ms, "camera");
    read(node, "strict_format", camera.strict_format, "camera");

    require(camera.is_valid(), "Invalid camera section (devices, positive format, timeouts and "
                               "backoff_initial_ms <= backoff_max_ms <= " +
                               std::to_string(camera::MAX_BACKOFF_MS) + " required)");
}

void loadDetection(const YAML::Node& root, gesture::DetectionConfig& detection) {
    const YAML::Node node = section(root, "detection");
    warnUnknownKeys(node, {"min_detection_confidence", "min_tracking_confidence", "max_hands", "model_complexity"},
                    "detection");
    read(node, "min_detection_confidence", detection.min_detection_confidence, "detection");
    read(node, "min_tracking_confidence", detection.min_tracking_confidence, "detection");
    read(node, "max_hands", detection.max_hands, "detection");
    read(node, "model_complexity", detection.model_complexity, "detection");

    require(detection.is_valid(), "Invalid detection section (confidences in [0,1], max_hands 1-4, "
                                  "model_complexity 0 or 1)");
}

void loadFeatures(const YAML::Node& root, gesture::FeatureConfig& features) {
    const YAML::Node node = section(root, "features");
    warnUnknownKeys(node, {"layout_version", "rotation_invariant", "mirror_left_hand"}, "features");

    int layout = static_cast<int>(features.layout);
    read(node, "layout_version", layout, "features");
    require(gesture::parse_feature_layout(layout, features.layout), "features.layout_version must be 1 or 2");

    read(node, "rotation_invariant", features.rotation_invariant, "features");
    read(node, "mirror_left_hand", features.mirror_left_hand, "features");
}

void loadClassifier(const YAML::Node& root, ClassifierConfig& classifier,
                    gesture::StabilityConfig& stability, gesture::FitParameters& fit) {
    const YAML::Node node = section(root, "classifier");
    warnUnknownKeys(node, {"kind", "model_path", "confidence_threshold", "svm", "forest"}, "classifier");

    std::string kind = gesture::model_kind_to_string(classifier.kind);
    read(node, "kind", kind, "classifier");
    require(gesture::parse_model_kind(kind, classifier.kind), "Unknown classifier.kind '" + kind + "'");

    read(node, "model_path", classifier.model_path, "classifier");
    read(node, "confidence_threshold", stability.confidence_threshold, "classifier");
    require(stability.confidence_threshold >= 0.0f && stability.confidence_threshold <= 1.0f,
            "classifier.confidence_threshold must be in [0, 1]");

    if (node) {
        const YAML::Node svm = node["svm"];
        warnUnknownKeys(svm, {"kernel", "c", "gamma"}, "classifier.svm");
        read(svm, "kernel", fit.svm.kernel, "classifier.svm");
        read(svm, "c", fit.svm.c, "classifier.svm");
        read(svm, "gamma", fit.svm.gamma, "classifier.svm");

        const YAML::Node forest = node["forest"];
        warnUnknownKeys(forest, {"trees", "max_depth", "min_sample_count"}, "classifier.forest");
        read(forest, "trees", fit.forest.trees, "classifier.forest");
        read(forest, "max_depth", fit.forest.max_depth, "classifier.forest");
        read(forest, "min_sample_count", fit.forest.min_sample_count, "classifier.forest");
    }

    fit.svm.kernel = lower(fit.svm.kernel);
    require(fit.svm.kernel == "rbf" || fit.svm.kernel == "linear",
            "classifier.svm.kernel must be 'rbf' or 'linear'");
    require(fit.svm.c > 0.0, "classifier.svm.c must be > 0");
    require(fit.forest.trees > 0, "classifier.forest.trees must be > 0");
    require(fit.forest.max_depth > 0, "classifier.forest.max_depth must be > 0");
    require(fit.forest.min_sample_count >= 1, "classifier.forest.min_sample_count must be >= 1");
}

void loadStability(const YAML::Node& root, gesture::StabilityConfig& stability) {
    const YAML::Node node = section(root, "stability");
    warnUnknownKeys(node, {"min_streak", "release_frames"}, "stability");
    read(node, "min_streak", stability.min_streak, "stability");
    read(node, "release_frames", stability.release_frames, "stability");

    require(stability.is_valid(), "stability.min_streak and stability.release_frames must be >= 1");
}

void loadTraining(const YAML::Node& root, training::TrainingConfig& training) {
    const YAML::Node node = section(root, "training");
    warnUnknownKeys(node, {"dataset_path", "min_samples_per_label", "test_fraction", "max_attempt_factor", "seed"},
                    "training");
    read(node, "dataset_path", training.dataset_path, "training");

    int min_samples = static_cast<int>(training.min_samples_per_label);
    read(node, "min_samples_per_label", min_samples, "training");
    require(min_samples >= 1, "training.min_samples_per_label must be >= 1");
    training.min_samples_per_label = static_cast<size_t>(min_samples);

    read(node, "test_fraction", training.test_fraction, "training");
    require(training.test_fraction >= 0.0 && training.test_fraction < 1.0,
            "training.test_fraction must be in [0, 1)");

    read(node, "max_attempt_factor", training.max_attempt_factor, "training");
    require(training.max_attempt_factor >= 1, "training.max_attempt_factor must be >= 1");

    unsigned int seed = training.seed;
    read(node, "seed", seed, "training");
    training.seed = seed;

    require(!training.dataset_path.empty(), "training.dataset_path must not be empty");
}

void loadDispatcher(const YAML::Node& root, DispatcherConfig& dispatcher) {
    const YAML::Node node = section(root, "dispatcher");
    warnUnknownKeys(node, {"queue_capacity", "backend", "xdotool_path"}, "dispatcher");

    int capacity = static_cast<int>(dispatcher.queue_capacity);
    read(node, "queue_capacity", capacity, "dispatcher");
    require(capacity >= 1, "dispatcher.queue_capacity must be >= 1");
    dispatcher.queue_capacity = static_cast<size_t>(capacity);

    read(node, "backend", dispatcher.backend, "dispatcher");
    dispatcher.backend = lower(dispatcher.backend);
    require(dispatcher.backend == "command" || dispatcher.backend == "log",
            "dispatcher.backend must be 'command' or 'log'");

    read(node, "xdotool_path", dispatcher.xdotool_path, "dispatcher");
}

action::ActionDescriptor loadAction(const std::string& label, const YAML::Node& node) {
    const std::string path = "actions." + label;
    require(node.IsMap(), "'" + path + "' must be a mapping");
    warnUnknownKeys(node, {"kind", "keys", "button", "clicks", "amount", "command", "cooldown_ms"}, path);

    action::ActionDescriptor descriptor;

    std::string kind;
    read(node, "kind", kind, path);
    require(!kind.empty(), "'" + path + ".kind' is required");
    require(action::parse_action_kind(kind, descriptor.kind), "Unknown " + path + ".kind '" + kind + "'");

    if (node["keys"] && !node["keys"].IsNull()) {
        const YAML::Node keys = node["keys"];
        if (keys.IsScalar()) {
            // "ctrl+shift+t" shorthand
            const std::string combo = keys.as<std::string>();
            size_t start = 0;
            while (start <= combo.size()) {
                const size_t plus = combo.find('+', start);
                descriptor.keys.push_back(combo.substr(start, plus == std::string::npos ? std::string::npos
                                                                                         : plus - start));
                if (plus == std::string::npos) {
                    break;
                }
                start = plus + 1;
            }
        } else {
            descriptor.keys = readStringList(keys, path + ".keys");
        }
    }

    std::string button = "left";
    read(node, "button", button, path);
    require(action::parse_mouse_button(button, descriptor.button), "Unknown " + path + ".button '" + button + "'");

    read(node, "clicks", descriptor.clicks, path);
    read(node, "amount", descriptor.amount, path);
    read(node, "command", descriptor.command, path);
    read(node, "cooldown_ms", descriptor.cooldown_ms, path);

    auto valid = action::validate_descriptor(descriptor);
    require(valid.isSuccess(), "Invalid " + path + ": " + valid.message);
    return descriptor;
}

void loadActions(const YAML::Node& root, action::ActionMapping& actions) {
    const YAML::Node node = section(root, "actions");
    if (!node || node.IsNull()) {
        return;
    }
    for (const auto& entry : node) {
        const std::string label = entry.first.as<std::string>();
        require(!label.empty(), "Empty action label");
        actions[label] = loadAction(label, entry.second);
    }
}

} // namespace

GestConfig ConfigLoader::from_node(const YAML::Node& root) {
    GestConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    require(root.IsMap(), "Configuration root must be a mapping");

    warnUnknownKeys(root, {"logging", "camera", "detection", "features", "classifier",
                           "stability", "training", "dispatcher", "actions"}, "");

    loadLogging(root, config.logging);
    loadCamera(root, config.camera);
    loadDetection(root, config.detection);
    loadFeatures(root, config.features);
    loadClassifier(root, config.classifier, config.stability, config.training.fit);
    loadStability(root, config.stability);
    loadTraining(root, config.training);
    loadDispatcher(root, config.dispatcher);
    loadActions(root, config.actions);

    config.training.features = config.features;
    return config;
}

GestConfig ConfigLoader::from_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        GEST_THROW(ConfigException, std::string("YAML parse error: ") + e.what());
    }
    return from_node(root);
}

GestConfig ConfigLoader::from_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        GEST_THROW(ConfigException, "Cannot read configuration file " + path);
    } catch (const YAML::Exception& e) {
        GEST_THROW(ConfigException, "YAML parse error in " + path + ": " + e.what());
    }

    GestConfig config = from_node(root);
    LOG_INFO("ConfigLoader: loaded " + path);
    return config;
}

void ConfigLoader::apply_logging(const LoggingConfig& logging) {
    Logger& logger = Logger::getInstance();

    LogLevel level = LogLevel::INFO;
    if (!parseLogLevel(logging.level, level)) {
        LOG_WARNING("ConfigLoader: unknown log level '" + logging.level + "', using info");
    }

    LogRotation rotation;
    if (!parseByteSize(logging.max_file_size, rotation.maxBytes)) {
        LOG_WARNING("ConfigLoader: invalid log size '" + logging.max_file_size + "', using 10MB");
    }
    rotation.backupCount = std::max(logging.backup_count, 0);
    logger.setRotation(rotation);

    logger.setConsoleOutput(logging.console);
    if (!logging.directory.empty()) {
        if (!logger.initializeWithTimestamp(logging.directory, level)) {
            LOG_WARNING("ConfigLoader: file logging unavailable in " + logging.directory);
        }
    }
    logger.setLevel(level);
}

} // namespace core
} // namespace gest
