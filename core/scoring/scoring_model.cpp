#include "scoring/scoring_model.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gamcoach {

size_t searchSortedLowerBound(const std::vector<double>& edges, double value) {
    if (edges.empty()) return 0;
    if (value < edges.front()) return 0;

    // Binary search for the last edge that is <= value.
    size_t lo = 0;
    size_t hi = edges.size() - 1;
    while (lo < hi) {
        size_t mid = lo + (hi - lo + 1) / 2;
        if (edges[mid] <= value) {
            lo = mid;
        } else {
            hi = mid - 1;
        }
    }
    return lo;
}

ScoringModel::ScoringModel(ModelDescription description)
    : description_(std::move(description)) {

    main_terms_.reserve(description_.features.size());
    for (const auto& f : description_.features) {
        MainTerm term;
        term.name = f.name;
        term.type = f.type;
        term.scores = f.additive;
        if (f.type == FeatureType::Continuous) {
            term.edges = f.bin_edges;
            term.upper_edge = f.bin_edges.back();
            // Drop the trailing upper edge so edges and scores are parallel.
            if (term.edges.size() == term.scores.size() + 1) {
                term.edges.pop_back();
            }
        } else {
            term.edges = f.bin_labels;
        }
        main_terms_.push_back(std::move(term));
    }

    feature_interactions_.assign(main_terms_.size(), {});
    for (const auto& inter : description_.interactions) {
        InteractionTerm term;
        term.name = inter.name;
        term.index1 = inter.index1;
        term.index2 = inter.index2;
        term.type1 = description_.feature_types[inter.index1];
        term.type2 = description_.feature_types[inter.index2];
        term.edges1 = inter.bin_labels1;
        term.edges2 = inter.bin_labels2;
        term.scores = inter.additive;
        if (term.edges1.size() == term.scores.size() + 1) {
            term.edges1.pop_back();
        }
        if (term.edges2.size() == term.scores.front().size() + 1) {
            term.edges2.pop_back();
        }

        const size_t index = interaction_terms_.size();
        feature_interactions_[term.index1].push_back(index);
        feature_interactions_[term.index2].push_back(index);
        interaction_terms_.push_back(std::move(term));
    }

    for (const auto& [feature, mapping] : description_.label_encoder) {
        for (const auto& [label, code] : mapping) {
            encoder_.add(feature, label, code);
        }
    }
}

double ScoringModel::sigmoid(double x) {
    double p = 1.0 / (1.0 + std::exp(-x));
    return std::round(p * 1e5) / 1e5;
}

double ScoringModel::encode(size_t feature, const FeatureValue& value) const {
    const MainTerm& term = main_terms_.at(feature);
    if (term.type == FeatureType::Continuous) {
        return asNumber(value);
    }

    if (isNumeric(value)) {
        return std::get<double>(value);
    }

    const std::string& label = std::get<std::string>(value);
    auto code = encoder_.encode(term.name, label);
    if (!code) {
        GCLOG_WARN("scoring", "ScoringModel::encode", "unseen_categorical_level",
                   (nlohmann::json{{"feature", term.name}, {"level", label}}));
        return 0.0;
    }
    return static_cast<double>(*code);
}

std::optional<size_t> ScoringModel::lookupBin(FeatureType type,
                                              const std::vector<double>& edges,
                                              double encoded) const {
    if (edges.empty()) return std::nullopt;
    if (type == FeatureType::Continuous) {
        return searchSortedLowerBound(edges, encoded);
    }
    auto it = std::find(edges.begin(), edges.end(), encoded);
    if (it == edges.end()) return std::nullopt;
    return static_cast<size_t>(it - edges.begin());
}

std::optional<size_t> ScoringModel::binIndex(size_t feature, double encoded) const {
    const MainTerm& term = main_terms_.at(feature);
    return lookupBin(term.type, term.edges, encoded);
}

std::optional<size_t> ScoringModel::axisBin(size_t term_index, int axis, double encoded) const {
    const InteractionTerm& term = interaction_terms_.at(term_index);
    if (axis == 0) return lookupBin(term.type1, term.edges1, encoded);
    return lookupBin(term.type2, term.edges2, encoded);
}

double ScoringModel::mainScore(size_t feature, std::optional<size_t> bin) const {
    if (!bin) return 0.0;
    return main_terms_.at(feature).scores.at(*bin);
}

double ScoringModel::interactionScore(size_t term,
                                      std::optional<size_t> bin1,
                                      std::optional<size_t> bin2) const {
    if (!bin1 || !bin2) return 0.0;
    return interaction_terms_.at(term).scores.at(*bin1).at(*bin2);
}

ScoreBreakdown ScoringModel::countScore(const Sample& sample) const {
    if (sample.size() != main_terms_.size()) {
        throw std::invalid_argument("Sample has " + std::to_string(sample.size()) +
                                    " values, model expects " +
                                    std::to_string(main_terms_.size()));
    }

    std::vector<double> encoded(sample.size());
    for (size_t i = 0; i < sample.size(); i++) {
        encoded[i] = encode(i, sample[i]);
    }

    ScoreBreakdown bd;
    bd.main.resize(main_terms_.size(), 0.0);
    for (size_t i = 0; i < main_terms_.size(); i++) {
        bd.main[i] = mainScore(i, binIndex(i, encoded[i]));
    }

    bd.interaction.resize(interaction_terms_.size(), 0.0);
    for (size_t t = 0; t < interaction_terms_.size(); t++) {
        const InteractionTerm& term = interaction_terms_[t];
        bd.interaction[t] = interactionScore(t,
            axisBin(t, 0, encoded[term.index1]),
            axisBin(t, 1, encoded[term.index2]));
    }
    return bd;
}

std::unordered_map<std::string, double> ScoringModel::countScoreByName(const Sample& sample) const {
    ScoreBreakdown bd = countScore(sample);
    std::unordered_map<std::string, double> out;
    for (size_t i = 0; i < main_terms_.size(); i++) {
        out[main_terms_[i].name] = bd.main[i];
    }
    for (size_t t = 0; t < interaction_terms_.size(); t++) {
        out[interaction_terms_[t].name] = bd.interaction[t];
    }
    return out;
}

double ScoringModel::rawScore(const Sample& sample) const {
    return description_.intercept + countScore(sample).total();
}

double ScoringModel::scoreToPrediction(double raw_score, bool raw) const {
    if (!description_.is_classifier || raw) return raw_score;
    return sigmoid(raw_score) >= 0.5 ? 1.0 : 0.0;
}

std::vector<double> ScoringModel::predict(const std::vector<Sample>& samples, bool raw) const {
    std::vector<double> out;
    out.reserve(samples.size());
    for (const auto& s : samples) {
        out.push_back(scoreToPrediction(rawScore(s), raw));
    }
    return out;
}

std::vector<double> ScoringModel::predictProb(const std::vector<Sample>& samples) const {
    std::vector<double> out;
    out.reserve(samples.size());
    for (const auto& s : samples) {
        double score = rawScore(s);
        out.push_back(description_.is_classifier ? sigmoid(score) : score);
    }
    return out;
}

} // namespace gamcoach
