/**
 * @file Dataset.cpp
 * @brief Dataset summary and CSV store
 */

#include "gest/training/Dataset.hpp"
#include "gest/core/Logger.hpp"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

namespace gest {
namespace training {

namespace {

constexpr const char* HEADER_FIRST_FIELD = "timestamp_ms";
constexpr const char* FEATURES_LINE_PREFIX = "# features";
constexpr int FIXED_COLUMNS = 3;

std::string format_features_line(const gesture::FeatureConfig& config) {
    return std::string(FEATURES_LINE_PREFIX) +
           " layout_version=" + std::to_string(static_cast<int>(config.layout)) +
           " rotation_invariant=" + (config.rotation_invariant ? "1" : "0") +
           " mirror_left_hand=" + (config.mirror_left_hand ? "1" : "0");
}

// Unknown keys are skipped; layout_version is mandatory
bool parse_features_line(const std::string& line, gesture::FeatureConfig& config) {
    std::istringstream in(line.substr(std::strlen(FEATURES_LINE_PREFIX)));
    std::string token;
    bool has_layout = false;
    while (in >> token) {
        const size_t eq = token.find('=');
        if (eq == std::string::npos) {
            return false;
        }
        const std::string key = token.substr(0, eq);
        const std::string value = token.substr(eq + 1);

        if (key == "layout_version") {
            int version = 0;
            try {
                version = std::stoi(value);
            } catch (const std::logic_error&) {
                return false;
            }
            if (!gesture::parse_feature_layout(version, config.layout)) {
                return false;
            }
            has_layout = true;
        } else if (key == "rotation_invariant" || key == "mirror_left_hand") {
            if (value != "0" && value != "1") {
                return false;
            }
            bool& flag = key == "rotation_invariant" ? config.rotation_invariant : config.mirror_left_hand;
            flag = value == "1";
        }
    }
    return has_layout;
}

bool is_features_line(const std::string& line) {
    return line.rfind(FEATURES_LINE_PREFIX, 0) == 0;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream stream(line);
    std::string field;
    while (std::getline(stream, field, ',')) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

} // namespace

// ============================================================================
// Dataset
// ============================================================================

void Dataset::add(Sample sample) {
    samples_.push_back(std::move(sample));
}

std::map<std::string, size_t> Dataset::label_counts() const {
    std::map<std::string, size_t> counts;
    for (const auto& sample : samples_) {
        counts[sample.label]++;
    }
    return counts;
}

std::vector<std::string> Dataset::labels() const {
    std::vector<std::string> labels;
    for (const auto& entry : label_counts()) {
        labels.push_back(entry.first);
    }
    return labels;
}

std::string Dataset::summary() const {
    std::ostringstream out;
    const auto counts = label_counts();
    out << samples_.size() << " samples, " << counts.size() << " labels";
    if (feature_config_) {
        out << " (" << gesture::feature_config_to_string(*feature_config_) << ")";
    }
    for (const auto& entry : counts) {
        out << "\n  " << std::left << std::setw(20) << entry.first << entry.second;
    }
    return out.str();
}

// ============================================================================
// DatasetStore
// ============================================================================

DatasetStore::DatasetStore(std::string path)
    : path_(std::move(path)) {
}

DatasetStore::DatasetStore(std::string path, const gesture::FeatureConfig& features)
    : path_(std::move(path)), features_(features) {
}

DatasetStore::~DatasetStore() {
    if (out_.is_open()) {
        out_.close();
    }
}

bool DatasetStore::is_storable_label(const std::string& label) {
    return !label.empty() && label.find_first_of(",\r\n\"") == std::string::npos;
}

bool DatasetStore::exists() const {
    std::ifstream in(path_);
    return in.good();
}

bool DatasetStore::append(const Sample& sample) {
    if (!is_storable_label(sample.label) || sample.session_id.find_first_of(",\r\n") != std::string::npos) {
        last_error_ = "Label or session id cannot be stored: '" + sample.label + "'";
        return false;
    }

    if (!out_.is_open() && !open_for_append(sample.features.size())) {
        return false;
    }

    out_ << sample.timestamp_ms << ',' << sample.session_id << ',' << sample.label;
    for (float value : sample.features) {
        out_ << ',' << value;
    }
    out_ << '\n';
    out_.flush();

    if (!out_) {
        last_error_ = "Write to " + path_ + " failed";
        return false;
    }
    return true;
}

bool DatasetStore::open_for_append(size_t feature_count) {
    const bool fresh = !exists();

    if (!fresh && features_) {
        std::ifstream in(path_);
        std::string first;
        while (std::getline(in, first)) {
            if (!first.empty() && first.back() == '\r') {
                first.pop_back();
            }
            if (!first.empty()) {
                break;
            }
        }

        gesture::FeatureConfig recorded;
        if (!is_features_line(first)) {
            LOG_WARNING("DatasetStore: " + path_ + " records no feature settings, appending " +
                        gesture::feature_config_to_string(*features_) + " vectors");
        } else if (!parse_features_line(first, recorded)) {
            last_error_ = path_ + ":1: malformed feature settings line";
            return false;
        } else if (recorded != *features_) {
            last_error_ = path_ + " was recorded with " + gesture::feature_config_to_string(recorded) +
                          ", current settings are " + gesture::feature_config_to_string(*features_);
            return false;
        }
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        last_error_ = "Cannot open dataset " + path_ + " for appending";
        return false;
    }
    if (fresh) {
        if (features_) {
            out_ << format_features_line(*features_) << "\n";
        }
        out_ << HEADER_FIRST_FIELD << ",session_id,label";
        for (size_t i = 0; i < feature_count; ++i) {
            out_ << ",f" << i;
        }
        out_ << "\n";
    }
    out_ << std::setprecision(std::numeric_limits<float>::max_digits10);
    return true;
}

bool DatasetStore::load(Dataset& dataset) const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        last_error_ = "Cannot open dataset " + path_;
        return false;
    }

    std::string line;
    size_t line_number = 0;
    bool seen_record = false;
    while (std::getline(in, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        if (line.front() == '#') {
            if (is_features_line(line)) {
                gesture::FeatureConfig recorded;
                if (seen_record || !parse_features_line(line, recorded)) {
                    last_error_ = path_ + ":" + std::to_string(line_number) + ": malformed feature settings line";
                    return false;
                }
                dataset.set_feature_config(recorded);
            }
            continue;
        }

        const std::vector<std::string> fields = split_fields(line);
        if (!seen_record && !fields.empty() && fields[0] == HEADER_FIRST_FIELD) {
            continue;
        }
        seen_record = true;

        if (fields.size() <= static_cast<size_t>(FIXED_COLUMNS)) {
            last_error_ = path_ + ":" + std::to_string(line_number) + ": expected features after label";
            return false;
        }

        Sample sample;
        try {
            sample.timestamp_ms = std::stoll(fields[0]);
            sample.session_id = fields[1];
            sample.label = fields[2];
            sample.features.reserve(fields.size() - FIXED_COLUMNS);
            for (size_t i = FIXED_COLUMNS; i < fields.size(); ++i) {
                const float value = std::stof(fields[i]);
                if (!std::isfinite(value)) {
                    last_error_ = path_ + ":" + std::to_string(line_number) + ": non-finite feature";
                    return false;
                }
                sample.features.push_back(value);
            }
        } catch (const std::logic_error& e) {
            last_error_ = path_ + ":" + std::to_string(line_number) + ": malformed record (" + e.what() + ")";
            return false;
        }

        if (sample.label.empty()) {
            last_error_ = path_ + ":" + std::to_string(line_number) + ": empty label";
            return false;
        }

        dataset.add(std::move(sample));
    }

    LOG_INFO("DatasetStore: loaded " + std::to_string(dataset.size()) + " samples from " + path_);
    return true;
}

} // namespace training
} // namespace gest
