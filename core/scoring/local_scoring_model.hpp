#pragma once

#include "scoring/scoring_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gamcoach {

// ─── Local Scoring Model ──────────────────────────────────────
// A ScoringModel bound to one sample. Caches the per-term scores so
// that changing a single feature only recomputes its main effect and
// the interaction terms that reference it.
//
// The ScoringModel must outlive this object.

class LocalScoringModel {
public:
    LocalScoringModel(const ScoringModel& model, Sample sample);

    /// Set one feature to a new value and refresh the cached prediction.
    /// Throws std::invalid_argument for an unknown feature name.
    void updateFeature(const std::string& name, const FeatureValue& value);
    void updateFeature(std::size_t feature, const FeatureValue& value);

    const Sample& sample() const { return sample_; }
    const ScoreBreakdown& scores() const { return scores_; }

    /// Intercept plus all contributions.
    double rawScore() const { return raw_score_; }

    /// Classifier label or regression value, as ScoringModel::predict.
    double prediction() const { return model_.scoreToPrediction(raw_score_, false); }

    /// Classifier probability, or the raw score for regressors.
    double probability() const {
        return model_.isClassifier() ? ScoringModel::sigmoid(raw_score_) : raw_score_;
    }

private:
    const ScoringModel& model_;
    Sample sample_;
    std::vector<double> encoded_;
    ScoreBreakdown scores_;
    double raw_score_ = 0.0;

    void refreshInteraction(std::size_t term);
    void refreshTotal();
};

} // namespace gamcoach
