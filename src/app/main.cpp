/**
 * @file main.cpp
 * @brief gest command line: live recognition, recording, training, evaluation
 */

#include <gest/action/ActionBackend.hpp>
#include <gest/action/ActionDispatcher.hpp>
#include <gest/camera/CameraManager.hpp>
#include <gest/core/Configuration.hpp>
#include <gest/core/Logger.hpp>
#include <gest/core/StopSignal.hpp>
#include <gest/core/exception.h>
#include <gest/gesture/FeatureProcessor.hpp>
#include <gest/gesture/GestureClassifier.hpp>
#include <gest/gesture/MediaPipeLandmarkSource.hpp>
#include <gest/gesture/RecognitionPipeline.hpp>
#include <gest/gesture/StabilityFilter.hpp>
#include <gest/training/Dataset.hpp>
#include <gest/training/FeatureSource.hpp>
#include <gest/training/TrainingPipeline.hpp>

#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace gest;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

core::StopSignal g_stop;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop.request_stop();
    }
}

struct Options {
    std::string command;
    std::string config_path;
    std::string label;
    size_t count = 0;
    std::string model_path;
    std::string dataset_path;
    std::string kind;
    double test_fraction = -1.0;
    bool dry_run = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run        Live recognition, dispatching mapped actions\n"
              << "  record     Record labeled samples into the dataset\n"
              << "  train      Fit a model from the dataset and save it\n"
              << "  evaluate   Score a saved model against the dataset\n"
              << "  info       Show configuration, dataset and model summary\n\n"
              << "Options:\n"
              << "  -c, --config <file>       YAML configuration\n"
              << "  -l, --label <name>        Label to record (record)\n"
              << "  -n, --count <n>           Samples to record (record)\n"
              << "  -m, --model <file>        Model artifact path (overrides classifier.model_path)\n"
              << "  -d, --dataset <file>      Dataset path (overrides training.dataset_path)\n"
              << "  -k, --kind <svm|random_forest>  Model family (train)\n"
              << "  -t, --test-fraction <f>   Held-out fraction (train)\n"
              << "      --dry-run             Log actions instead of executing them (run)\n"
              << "  -h, --help                Show this help\n";
}

bool parse_arguments(int argc, char** argv, Options& options) {
    if (argc < 2) {
        return false;
    }
    options.command = argv[1];
    if (options.command == "--help" || options.command == "-h") {
        return false;
    }

    for (int i = 2; i < argc; i++) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string text;
        if (arg == "--config" || arg == "-c") {
            if (!value(options.config_path)) return false;
        } else if (arg == "--label" || arg == "-l") {
            if (!value(options.label)) return false;
        } else if (arg == "--count" || arg == "-n") {
            if (!value(text)) return false;
            try {
                const long count = std::stol(text);
                options.count = count > 0 ? static_cast<size_t>(count) : 0;
            } catch (const std::logic_error&) {
                std::cerr << "Invalid count '" << text << "'" << std::endl;
                return false;
            }
        } else if (arg == "--model" || arg == "-m") {
            if (!value(options.model_path)) return false;
        } else if (arg == "--dataset" || arg == "-d") {
            if (!value(options.dataset_path)) return false;
        } else if (arg == "--kind" || arg == "-k") {
            if (!value(options.kind)) return false;
        } else if (arg == "--test-fraction" || arg == "-t") {
            if (!value(text)) return false;
            try {
                options.test_fraction = std::stod(text);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid test fraction '" << text << "'" << std::endl;
                return false;
            }
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

std::shared_ptr<action::ActionBackend> make_backend(const core::GestConfig& config, bool dry_run) {
    if (dry_run || config.dispatcher.backend == "log") {
        return std::make_shared<action::LoggingActionBackend>();
    }
    if (!action::executable_available(config.dispatcher.xdotool_path)) {
        LOG_WARNING("gest: " + config.dispatcher.xdotool_path +
                    " not found, keyboard and mouse actions will fail");
    }
    return std::make_shared<action::CommandActionBackend>(config.dispatcher.xdotool_path);
}

void print_report(const training::EvaluationReport& report) {
    std::cout << report.summary() << std::endl;
    if (report.labels.empty()) {
        return;
    }

    std::cout << "\nConfusion matrix (rows = true, cols = predicted):\n";
    std::cout << std::setw(16) << " ";
    for (const auto& label : report.labels) {
        std::cout << std::setw(12) << label.substr(0, 11);
    }
    std::cout << "\n";
    for (int r = 0; r < report.confusion.rows; ++r) {
        std::cout << std::left << std::setw(16) << report.labels[r].substr(0, 15) << std::right;
        for (int c = 0; c < report.confusion.cols; ++c) {
            std::cout << std::setw(12) << report.confusion.at<int>(r, c);
        }
        std::cout << "\n";
    }
}

int command_run(const core::GestConfig& config, const Options& options) {
    gesture::FeatureProcessor processor(config.features);
    gesture::GestureClassifier classifier(processor.feature_length());

    auto loaded = classifier.load_file(config.classifier.model_path);
    if (!loaded) {
        std::cerr << "Cannot load model: " << loaded.message << std::endl;
        return EXIT_FAILED;
    }

    camera::CameraManager camera;
    camera.configure(config.camera);
    gesture::MediaPipeLandmarkSource landmarks(config.detection);
    gesture::StabilityFilter stability(config.stability);
    action::ActionDispatcher dispatcher(config.actions, make_backend(config, options.dry_run),
                                        config.dispatcher.queue_capacity);

    gesture::RecognitionPipeline pipeline(camera, landmarks, processor, classifier, stability,
                                          dispatcher, config.detection.max_hands);
    pipeline.set_event_callback([](const gesture::GestureEvent& event) {
        std::cout << "[gesture] " << event.label << " (" << gesture::hand_side_to_string(event.hand)
                  << ", " << std::fixed << std::setprecision(2) << event.confidence
                  << ", frame " << event.frame_index << ")" << std::endl;
    });

    std::cout << "Recognition running, press Ctrl+C to stop" << std::endl;
    const gesture::RunOutcome outcome = pipeline.run(g_stop);

    std::cout << "\n" << gesture::run_exit_to_string(outcome.exit) << ": " << outcome.message
              << " (" << outcome.frames << " frames, " << outcome.events << " events)" << std::endl;
    return outcome.is_error() ? EXIT_FAILED : EXIT_OK;
}

int command_record(const core::GestConfig& config, const Options& options) {
    if (options.label.empty() || options.count == 0) {
        std::cerr << "record needs --label and a positive --count" << std::endl;
        return EXIT_USAGE;
    }

    camera::CameraManager camera;
    camera.configure(config.camera);
    auto lease = camera.tryAcquire("recording");
    if (!lease) {
        std::cerr << "Camera busy (held by " << camera.getHolder() << ")" << std::endl;
        return EXIT_FAILED;
    }

    auto opened = lease->camera().open();
    if (!opened) {
        std::cerr << "Cannot open camera: " << opened.message << std::endl;
        return EXIT_FAILED;
    }

    gesture::FeatureProcessor processor(config.features);
    gesture::MediaPipeLandmarkSource landmarks(config.detection);
    training::CameraFeatureSource source(lease->camera(), landmarks, processor);

    auto store = std::make_shared<training::DatasetStore>(config.training.dataset_path, config.features);
    training::TrainingPipeline pipeline(config.training, store);

    std::cout << "Recording " << options.count << " samples of '" << options.label
              << "', hold the gesture in front of the camera (Ctrl+C to stop)" << std::endl;
    const training::RecordingResult result = pipeline.record_session(options.label, options.count, source, g_stop);

    std::cout << training::recording_stop_to_string(result.stop) << ": " << result.samples.size() << "/"
              << options.count << " samples in " << result.attempts << " attempts, saved to "
              << store->path() << std::endl;
    return result.completed() ? EXIT_OK : EXIT_FAILED;
}

bool load_dataset(const core::GestConfig& config, training::Dataset& dataset) {
    training::DatasetStore store(config.training.dataset_path);
    if (!store.load(dataset)) {
        std::cerr << "Cannot load dataset: " << store.last_error() << std::endl;
        return false;
    }
    return true;
}

int command_train(const core::GestConfig& config, const Options& options) {
    gesture::ModelKind kind = config.classifier.kind;
    if (!options.kind.empty() && !gesture::parse_model_kind(options.kind, kind)) {
        std::cerr << "Unknown model kind '" << options.kind << "'" << std::endl;
        return EXIT_USAGE;
    }

    training::Dataset dataset;
    if (!load_dataset(config, dataset)) {
        return EXIT_FAILED;
    }
    std::cout << "Dataset: " << dataset.summary() << "\n" << std::endl;

    training::TrainingPipeline pipeline(config.training);
    const double test_fraction = options.test_fraction >= 0.0 ? options.test_fraction
                                                               : config.training.test_fraction;
    auto trained = pipeline.train(dataset, kind, test_fraction);
    if (!trained) {
        std::cerr << "Training failed [" << training::training_error_to_string(*trained.error) << "]: "
                  << trained.message << std::endl;
        return EXIT_FAILED;
    }

    std::cout << "Trained " << trained.data.artifact->version << " on " << trained.data.train_samples
              << " samples, evaluated on " << trained.data.test_samples << "\n" << std::endl;
    print_report(trained.data.report);

    auto saved = gesture::save_artifact(*trained.data.artifact, config.classifier.model_path);
    if (!saved) {
        std::cerr << "Cannot save model: " << saved.message << std::endl;
        return EXIT_FAILED;
    }
    std::cout << "\nModel saved to " << config.classifier.model_path << std::endl;
    return EXIT_OK;
}

int command_evaluate(const core::GestConfig& config) {
    auto artifact = gesture::load_artifact(config.classifier.model_path);
    if (!artifact) {
        std::cerr << "Cannot load model: " << artifact.message << std::endl;
        return EXIT_FAILED;
    }

    training::Dataset dataset;
    if (!load_dataset(config, dataset)) {
        return EXIT_FAILED;
    }
    if (dataset.feature_config() && *dataset.feature_config() != artifact.data->features) {
        std::cerr << "Dataset was recorded with " << gesture::feature_config_to_string(*dataset.feature_config())
                  << ", model was trained on " << gesture::feature_config_to_string(artifact.data->features)
                  << std::endl;
        return EXIT_FAILED;
    }

    print_report(training::TrainingPipeline::evaluate(artifact.data, dataset));
    return EXIT_OK;
}

int command_info(const core::GestConfig& config) {
    gesture::FeatureProcessor processor(config.features);

    std::cout << "Camera:     ";
    for (const auto& device : config.camera.devices) {
        std::cout << device << " ";
    }
    std::cout << config.camera.width << "x" << config.camera.height << " @ " << config.camera.fps << " fps\n";
    std::cout << "Features:   " << gesture::feature_layout_to_string(config.features.layout) << " ("
              << processor.feature_length() << " values)\n";
    std::cout << "Stability:  min_streak " << config.stability.min_streak << ", release_frames "
              << config.stability.release_frames << ", threshold " << config.stability.confidence_threshold << "\n";
    std::cout << "Actions:\n";
    for (const auto& entry : config.actions) {
        std::cout << "  " << std::left << std::setw(20) << entry.first << entry.second.describe() << "\n";
    }

    training::DatasetStore store(config.training.dataset_path);
    training::Dataset dataset;
    if (store.exists() && store.load(dataset)) {
        std::cout << "Dataset:    " << dataset.summary() << "\n";
    } else {
        std::cout << "Dataset:    none at " << config.training.dataset_path << "\n";
    }

    auto artifact = gesture::load_artifact(config.classifier.model_path);
    if (artifact) {
        const auto& model = *artifact.data;
        std::cout << "Model:      " << model.version << " (" << gesture::model_kind_to_string(model.kind) << ", "
                  << model.feature_length << " features, labels:";
        for (const auto& label : model.labels) {
            std::cout << " " << label;
        }
        std::cout << ")";
        if (model.features != config.features) {
            std::cout << "\n            trained on " << gesture::feature_config_to_string(model.features)
                      << ", current settings differ";
        }
        std::cout << "\n";
    } else {
        std::cout << "Model:      " << artifact.message << "\n";
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Options options;
    if (!parse_arguments(argc, argv, options)) {
        print_usage(argv[0]);
        return argc < 2 ? EXIT_USAGE : (options.command == "--help" || options.command == "-h" ? EXIT_OK : EXIT_USAGE);
    }

    core::GestConfig config;
    try {
        config = options.config_path.empty() ? core::GestConfig{} : core::ConfigLoader::from_file(options.config_path);
    } catch (const core::ConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
    core::ConfigLoader::apply_logging(config.logging);

    if (!options.model_path.empty()) {
        config.classifier.model_path = options.model_path;
    }
    if (!options.dataset_path.empty()) {
        config.training.dataset_path = options.dataset_path;
    }

    try {
        if (options.command == "run") {
            return command_run(config, options);
        }
        if (options.command == "record") {
            return command_record(config, options);
        }
        if (options.command == "train") {
            return command_train(config, options);
        }
        if (options.command == "evaluate") {
            return command_evaluate(config);
        }
        if (options.command == "info") {
            return command_info(config);
        }
    } catch (const core::Exception& e) {
        LOG_CRITICAL(std::string("gest: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }

    std::cerr << "Unknown command '" << options.command << "'" << std::endl;
    print_usage(argv[0]);
    return EXIT_USAGE;
}
