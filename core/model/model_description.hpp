#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gamcoach {

enum class FeatureType {
    Continuous,
    Categorical,
    Interaction
};

std::string featureTypeToString(FeatureType type);
FeatureType parseFeatureType(const std::string& value);

// ─── Feature Config ───────────────────────────────────────────
// Per-feature user-facing constraints shipped with the model file.

struct FeatureConfig {
    /// Continuous: [min, max]. Categorical: allowed level codes.
    std::optional<std::vector<double>> acceptable_range;
    bool requires_increasing = false;
    bool requires_decreasing = false;
    int difficulty = 3;                        // 1 very easy .. 5 very hard, 6 locked
    std::optional<std::string> uses_transform; // e.g. "log10"
    bool requires_int = false;
};

// ─── Main Feature ─────────────────────────────────────────────

struct FeatureDef {
    std::string name;
    FeatureType type = FeatureType::Continuous;
    std::vector<double> bin_edges;   // continuous, including the trailing upper edge
    std::vector<double> bin_labels;  // categorical level codes
    std::vector<double> additive;    // one score per bin
    FeatureConfig config;
    double importance = 0.0;
};

// ─── Interaction Term ─────────────────────────────────────────
// Pairwise term over two main features, indexed into feature_names.

struct InteractionDef {
    std::string name;
    std::size_t index1 = 0;
    std::size_t index2 = 0;
    std::vector<double> bin_labels1;
    std::vector<double> bin_labels2;
    std::vector<std::vector<double>> additive;  // [bin1][bin2]
};

// ─── Model Description ────────────────────────────────────────
// Decoded form of a trained additive model data file.

struct ModelDescription {
    std::vector<std::string> feature_names;
    std::vector<FeatureType> feature_types;
    std::vector<FeatureDef> features;          // same order as feature_names
    std::vector<InteractionDef> interactions;

    /// feature -> (label -> code)
    std::unordered_map<std::string, std::unordered_map<std::string, int>> label_encoder;

    double intercept = 0.0;
    bool is_classifier = true;
    std::vector<std::string> class_names;
    std::string regression_name;

    /// Median absolute deviation per continuous feature.
    std::unordered_map<std::string, double> cont_mads;
    /// feature -> (level label -> distance of moving to that level)
    std::unordered_map<std::string, std::unordered_map<std::string, double>> cat_distances;

    std::optional<std::size_t> featureIndex(const std::string& name) const;

    /// Parse and validate a model description. Throws std::invalid_argument
    /// on structural errors (missing keys, mismatched bin/score lengths).
    static ModelDescription fromJson(const nlohmann::json& j);

    /// Read a model data file from disk. Throws std::runtime_error when the
    /// file cannot be opened or parsed.
    static ModelDescription loadFile(const std::string& path);
};

} // namespace gamcoach
