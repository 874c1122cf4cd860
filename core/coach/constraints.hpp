#pragma once

#include "coach/cf_request.hpp"
#include "scoring/scoring_model.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace gamcoach {

/// How hard a user finds it to change a feature. Lock removes the feature
/// from the search entirely.
enum class Difficulty {
    VeryEasy = 1,
    Easy = 2,
    Neutral = 3,
    Hard = 4,
    VeryHard = 5,
    Lock = 6
};

Difficulty difficultyFromLevel(int level);

/// Distance multiplier of a difficulty; Neutral and Lock have none.
std::optional<double> difficultyMultiplier(Difficulty difficulty);

// ─── Plan Constraints ─────────────────────────────────────────
// User-facing constraints per feature, seeded from the `config` block
// of the model file and turned into the corresponding CfRequest fields.

class PlanConstraints {
public:
    static constexpr int kDefaultMaxNumFeatures = 4;

    /// Seed from the model's per-feature config for one sample.
    static PlanConstraints fromModel(const ScoringModel& model, const Sample& sample);

    void setDifficulty(std::size_t feature, Difficulty difficulty) { difficulties_[feature] = difficulty; }
    void setRange(std::size_t feature, FeatureRange range) { ranges_[feature] = std::move(range); }
    void clearRange(std::size_t feature) { ranges_.erase(feature); }
    void setMaxNumFeatures(int n) { max_num_features_ = n; }

    Difficulty difficulty(std::size_t feature) const;

    /// Empty when no feature is locked: everything may vary.
    std::optional<std::vector<std::size_t>> featuresToVary() const;
    std::map<std::size_t, double> featureWeightMultipliers() const;
    const std::map<std::size_t, FeatureRange>& featureRanges() const { return ranges_; }
    int maxNumFeatures() const { return max_num_features_; }

    /// Request for `total_cfs` plans with these constraints applied.
    CfRequest toRequest(const Sample& sample, int total_cfs) const;

    /// Merge these constraints into an existing request. Locked features
    /// leave the vary set, ranges and multipliers replace the request's
    /// entries for the same feature, integer features are added and the
    /// feature cap is overwritten. Target range, similarity threshold and
    /// categorical weight are left alone.
    void applyTo(CfRequest& request) const;

private:
    std::size_t feature_count_ = 0;
    std::map<std::size_t, Difficulty> difficulties_;
    std::map<std::size_t, FeatureRange> ranges_;
    int max_num_features_ = kDefaultMaxNumFeatures;
    std::set<std::size_t> integer_features_;
};

/// Continuous features whose values must stay integral: no transform and
/// the requiresInt flag set.
std::set<std::size_t> continuousIntegerFeatures(const ModelDescription& description);

} // namespace gamcoach
