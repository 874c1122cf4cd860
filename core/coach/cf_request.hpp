#pragma once

#include "model/feature_value.hpp"
#include "scoring/scoring_model.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace gamcoach {

// ─── Coach Config ─────────────────────────────────────────────
// Tuning constants of the counterfactual search.

struct CoachConfig {
    double sim_threshold_factor = 0.005;  // default similarity threshold scale
    double epsilon = 1e-6;                // offset that keeps left-bin targets inside
    double class_flip_margin = 1e-4;      // log-odds margin past the decision boundary

    nlohmann::json toJson() const;
    static CoachConfig fromJson(const nlohmann::json& j);
};

// ─── Feature Range ────────────────────────────────────────────
// Values a feature may take in a counterfactual: a closed interval for
// continuous features, a set of level labels for categorical ones.

struct FeatureRange {
    std::optional<std::pair<double, double>> interval;
    std::set<std::string> levels;

    static FeatureRange between(double lo, double hi) {
        FeatureRange r;
        r.interval = std::make_pair(lo, hi);
        return r;
    }

    static FeatureRange oneOf(std::set<std::string> labels) {
        FeatureRange r;
        r.levels = std::move(labels);
        return r;
    }

    bool admits(const FeatureValue& value) const;
};

// ─── Counterfactual Request ───────────────────────────────────
// Input of CounterfactualCoach::generateCfs. Features are referenced by
// index into the model's feature list.

struct CfRequest {
    Sample sample;
    int total_cfs = 1;

    /// Regression only: desired score interval. Infinite ends are allowed.
    std::optional<std::pair<double, double>> target_range;

    /// Empty: derived from the model's additive ranges.
    std::optional<double> sim_threshold;

    /// Multiplier applied to categorical distances. Empty: rescale so that
    /// mean categorical and mean continuous distances match.
    std::optional<double> categorical_weight;

    /// Empty: every feature may change.
    std::optional<std::vector<std::size_t>> features_to_vary;

    std::map<std::size_t, FeatureRange> feature_ranges;
    std::map<std::size_t, double> feature_weight_multipliers;
    std::optional<int> max_num_features_to_vary;
    std::set<std::size_t> continuous_integer_features;

    /// Decode a request. Feature names are resolved against the model;
    /// unknown names, malformed values or a sample of the wrong length
    /// throw std::invalid_argument.
    static CfRequest fromJson(const nlohmann::json& j, const ScoringModel& model);
    nlohmann::json toJson(const ScoringModel& model) const;
};

} // namespace gamcoach
