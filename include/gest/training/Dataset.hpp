/**
 * @file Dataset.hpp
 * @brief Labeled samples and their append-only CSV store
 */

#ifndef GEST_TRAINING_DATASET_HPP
#define GEST_TRAINING_DATASET_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "gest/gesture/FeatureProcessor.hpp"
#include "gest/gesture/GestureTypes.hpp"

namespace gest {
namespace training {

/**
 * @brief One labeled feature vector; immutable once recorded
 */
struct Sample {
    gesture::FeatureVector features;
    std::string label;
    int64_t timestamp_ms = 0;    ///< Capture time, ms since epoch
    std::string session_id;
};

/**
 * @brief Ordered collection of samples
 */
class Dataset {
public:
    void add(Sample sample);

    const std::vector<Sample>& samples() const { return samples_; }

    size_t size() const { return samples_.size(); }

    bool empty() const { return samples_.empty(); }

    /**
     * @brief Sample count per label, ordered by label
     */
    std::map<std::string, size_t> label_counts() const;

    /**
     * @brief Distinct labels in sorted order
     */
    std::vector<std::string> labels() const;

    /**
     * @brief Human-readable per-label summary
     */
    std::string summary() const;

    /**
     * @brief Extraction settings the vectors were recorded with, if known
     */
    const std::optional<gesture::FeatureConfig>& feature_config() const { return feature_config_; }

    void set_feature_config(const gesture::FeatureConfig& config) { feature_config_ = config; }

private:
    std::vector<Sample> samples_;
    std::optional<gesture::FeatureConfig> feature_config_;
};

/**
 * @brief CSV dataset file: timestamp_ms,session_id,label,f0,...,fN-1
 *
 * A store created with extraction settings starts a new file with the line
 * "# features layout_version=N rotation_invariant=0|1 mirror_left_hand=0|1"
 * and refuses to append to a file recorded with other settings. The column
 * header follows. Records are only ever appended, and each one is flushed
 * as it is written so an interrupted recording keeps every captured sample.
 */
class DatasetStore {
public:
    explicit DatasetStore(std::string path);

    /**
     * @param features Settings of the vectors this store appends
     */
    DatasetStore(std::string path, const gesture::FeatureConfig& features);
    ~DatasetStore();

    DatasetStore(const DatasetStore&) = delete;
    DatasetStore& operator=(const DatasetStore&) = delete;

    /**
     * @brief Append one record
     * @return false on I/O error, a label that cannot be stored in CSV or a
     *         file recorded with other extraction settings
     */
    bool append(const Sample& sample);

    /**
     * @brief Read every record
     * @return false if the file is unreadable or a record is malformed
     */
    bool load(Dataset& dataset) const;

    bool exists() const;

    const std::string& path() const { return path_; }

    const std::string& last_error() const { return last_error_; }

    /**
     * @brief True if a label can be stored without quoting
     */
    static bool is_storable_label(const std::string& label);

private:
    bool open_for_append(size_t feature_count);

    std::string path_;
    std::optional<gesture::FeatureConfig> features_;
    std::ofstream out_;
    mutable std::string last_error_;
};

} // namespace training
} // namespace gest

#endif // GEST_TRAINING_DATASET_HPP
