#pragma once

#include "model/feature_value.hpp"
#include "model/model_description.hpp"
#include "scoring/label_encoder.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gamcoach {

// ─── Score Breakdown ──────────────────────────────────────────
// Per-term additive contributions. The total excludes the intercept.

struct ScoreBreakdown {
    std::vector<double> main;         // one entry per main feature
    std::vector<double> interaction;  // one entry per interaction term

    double total() const {
        double sum = 0.0;
        for (double s : main) sum += s;
        for (double s : interaction) sum += s;
        return sum;
    }
};

// ─── Lookup Tables ────────────────────────────────────────────

struct MainTerm {
    std::string name;
    FeatureType type = FeatureType::Continuous;
    std::vector<double> edges;   // continuous: bin lower edges; categorical: level codes
    std::vector<double> scores;
    double upper_edge = 0.0;     // continuous: upper edge of the last bin
};

struct InteractionTerm {
    std::string name;
    std::size_t index1 = 0;
    std::size_t index2 = 0;
    FeatureType type1 = FeatureType::Continuous;
    FeatureType type2 = FeatureType::Continuous;
    std::vector<double> edges1;
    std::vector<double> edges2;
    std::vector<std::vector<double>> scores;  // [bin1][bin2]
};

/// Index of the bin whose lower edge is the largest edge <= value.
/// Values below the first edge clamp to bin 0, values past the last
/// edge clamp to the last bin.
std::size_t searchSortedLowerBound(const std::vector<double>& edges, double value);

// ─── Scoring Model ────────────────────────────────────────────
// Additive model: prediction = intercept + sum of per-feature bin
// scores + sum of pairwise interaction bin scores.

class ScoringModel {
public:
    explicit ScoringModel(ModelDescription description);

    /// Per-term contributions for one sample.
    ScoreBreakdown countScore(const Sample& sample) const;

    /// Same as countScore, keyed by feature / interaction name.
    std::unordered_map<std::string, double> countScoreByName(const Sample& sample) const;

    /// Intercept plus all contributions (log-odds for classifiers).
    double rawScore(const Sample& sample) const;

    /// Classifier: predicted label (0/1), or log-odds when raw is true.
    /// Regressor: raw score.
    std::vector<double> predict(const std::vector<Sample>& samples, bool raw = false) const;

    /// Classifier: probability of the positive class. Regressor: raw score.
    std::vector<double> predictProb(const std::vector<Sample>& samples) const;

    /// Map a raw score to a label (classifier) or pass it through.
    double scoreToPrediction(double raw_score, bool raw) const;

    /// Logistic function rounded to 5 decimal places.
    static double sigmoid(double x);

    // ── Lookups shared with LocalScoringModel / OptionGenerator ──

    /// Numeric encoding of a value: the number itself for continuous
    /// features, the level code for categorical ones. Unseen levels map to
    /// code 0 and emit a warning.
    double encode(std::size_t feature, const FeatureValue& value) const;

    /// Main-effect bin of an encoded value. Empty for a categorical code
    /// that matches no level.
    std::optional<std::size_t> binIndex(std::size_t feature, double encoded) const;

    /// Bin along one axis (0 or 1) of an interaction term.
    std::optional<std::size_t> axisBin(std::size_t term, int axis, double encoded) const;

    double mainScore(std::size_t feature, std::optional<std::size_t> bin) const;
    double interactionScore(std::size_t term,
                            std::optional<std::size_t> bin1,
                            std::optional<std::size_t> bin2) const;

    /// Interaction terms that reference a main feature.
    const std::vector<std::size_t>& interactionsOf(std::size_t feature) const {
        return feature_interactions_[feature];
    }

    std::optional<std::size_t> featureIndex(const std::string& name) const {
        return description_.featureIndex(name);
    }

    std::size_t featureCount() const { return main_terms_.size(); }
    std::size_t interactionCount() const { return interaction_terms_.size(); }

    const MainTerm& mainTerm(std::size_t feature) const { return main_terms_[feature]; }
    const InteractionTerm& interactionTerm(std::size_t term) const {
        return interaction_terms_[term];
    }

    const ModelDescription& description() const { return description_; }
    const LabelEncoder& labelEncoder() const { return encoder_; }
    double intercept() const { return description_.intercept; }
    bool isClassifier() const { return description_.is_classifier; }

private:
    ModelDescription description_;
    std::vector<MainTerm> main_terms_;
    std::vector<InteractionTerm> interaction_terms_;
    std::vector<std::vector<std::size_t>> feature_interactions_;
    LabelEncoder encoder_;

    std::optional<std::size_t> lookupBin(FeatureType type,
                                         const std::vector<double>& edges,
                                         double encoded) const;
};

} // namespace gamcoach
