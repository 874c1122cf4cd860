#include "scoring/local_scoring_model.hpp"

#include <stdexcept>

namespace gamcoach {

LocalScoringModel::LocalScoringModel(const ScoringModel& model, Sample sample)
    : model_(model), sample_(std::move(sample)) {
    if (sample_.size() != model_.featureCount()) {
        throw std::invalid_argument("Sample has " + std::to_string(sample_.size()) +
                                    " values, model expects " +
                                    std::to_string(model_.featureCount()));
    }

    encoded_.resize(sample_.size());
    scores_.main.resize(sample_.size(), 0.0);
    for (size_t i = 0; i < sample_.size(); i++) {
        encoded_[i] = model_.encode(i, sample_[i]);
        scores_.main[i] = model_.mainScore(i, model_.binIndex(i, encoded_[i]));
    }

    scores_.interaction.resize(model_.interactionCount(), 0.0);
    for (size_t t = 0; t < model_.interactionCount(); t++) {
        refreshInteraction(t);
    }
    refreshTotal();
}

void LocalScoringModel::updateFeature(const std::string& name, const FeatureValue& value) {
    auto index = model_.featureIndex(name);
    if (!index) {
        throw std::invalid_argument("Unknown feature: " + name);
    }
    updateFeature(*index, value);
}

void LocalScoringModel::updateFeature(size_t feature, const FeatureValue& value) {
    if (feature >= sample_.size()) {
        throw std::invalid_argument("Feature index out of range: " + std::to_string(feature));
    }

    sample_[feature] = value;
    encoded_[feature] = model_.encode(feature, value);
    scores_.main[feature] = model_.mainScore(feature, model_.binIndex(feature, encoded_[feature]));

    for (size_t term : model_.interactionsOf(feature)) {
        refreshInteraction(term);
    }
    refreshTotal();
}

void LocalScoringModel::refreshInteraction(size_t term) {
    const InteractionTerm& inter = model_.interactionTerm(term);
    scores_.interaction[term] = model_.interactionScore(term,
        model_.axisBin(term, 0, encoded_[inter.index1]),
        model_.axisBin(term, 1, encoded_[inter.index2]));
}

void LocalScoringModel::refreshTotal() {
    raw_score_ = model_.intercept() + scores_.total();
}

} // namespace gamcoach
