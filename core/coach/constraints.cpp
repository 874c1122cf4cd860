#include "coach/constraints.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace gamcoach {

Difficulty difficultyFromLevel(int level) {
    if (level < 1 || level > 6) {
        throw std::invalid_argument("Difficulty level must be within 1..6, got " + std::to_string(level));
    }
    return static_cast<Difficulty>(level);
}

std::optional<double> difficultyMultiplier(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::VeryEasy: return 0.1;
        case Difficulty::Easy:     return 0.5;
        case Difficulty::Hard:     return 2.0;
        case Difficulty::VeryHard: return 10.0;
        case Difficulty::Neutral:
        case Difficulty::Lock:     return std::nullopt;
    }
    return std::nullopt;
}

std::set<std::size_t> continuousIntegerFeatures(const ModelDescription& description) {
    std::set<std::size_t> out;
    for (std::size_t i = 0; i < description.features.size(); i++) {
        const FeatureDef& f = description.features[i];
        if (f.type == FeatureType::Continuous && !f.config.uses_transform && f.config.requires_int) {
            out.insert(i);
        }
    }
    return out;
}

PlanConstraints PlanConstraints::fromModel(const ScoringModel& model, const Sample& sample) {
    if (sample.size() != model.featureCount()) {
        throw std::invalid_argument("Sample length does not match the model");
    }

    PlanConstraints c;
    c.feature_count_ = model.featureCount();
    c.integer_features_ = continuousIntegerFeatures(model.description());

    for (std::size_t i = 0; i < model.featureCount(); i++) {
        const FeatureConfig& config = model.description().features[i].config;
        const MainTerm& term = model.mainTerm(i);

        const Difficulty d = difficultyFromLevel(config.difficulty);
        if (d != Difficulty::Neutral) c.difficulties_[i] = d;

        if (term.type == FeatureType::Categorical) {
            if (config.acceptable_range) {
                std::set<std::string> labels;
                for (double code : *config.acceptable_range) {
                    auto label = model.labelEncoder().decode(term.name, static_cast<int>(code));
                    labels.insert(label ? *label : asLabel(code));
                }
                c.ranges_[i] = FeatureRange::oneOf(std::move(labels));
            }
            continue;
        }

        double lo = term.edges.empty() ? 0.0 : term.edges.front();
        double hi = term.upper_edge;
        bool bounded = false;
        if (config.acceptable_range && config.acceptable_range->size() == 2) {
            lo = (*config.acceptable_range)[0];
            hi = (*config.acceptable_range)[1];
            bounded = true;
        }
        if (config.requires_increasing) {
            lo = std::max(lo, asNumber(sample[i]));
            bounded = true;
        }
        if (config.requires_decreasing) {
            hi = std::min(hi, asNumber(sample[i]));
            bounded = true;
        }
        if (bounded) c.ranges_[i] = FeatureRange::between(lo, hi);
    }
    return c;
}

Difficulty PlanConstraints::difficulty(std::size_t feature) const {
    auto it = difficulties_.find(feature);
    return it == difficulties_.end() ? Difficulty::Neutral : it->second;
}

std::optional<std::vector<std::size_t>> PlanConstraints::featuresToVary() const {
    std::vector<std::size_t> out;
    bool any_locked = false;
    for (std::size_t i = 0; i < feature_count_; i++) {
        if (difficulty(i) == Difficulty::Lock) {
            any_locked = true;
        } else {
            out.push_back(i);
        }
    }
    if (!any_locked) return std::nullopt;
    return out;
}

std::map<std::size_t, double> PlanConstraints::featureWeightMultipliers() const {
    std::map<std::size_t, double> out;
    for (const auto& [feature, d] : difficulties_) {
        if (auto m = difficultyMultiplier(d)) out[feature] = *m;
    }
    return out;
}

CfRequest PlanConstraints::toRequest(const Sample& sample, int total_cfs) const {
    CfRequest r;
    r.sample = sample;
    r.total_cfs = total_cfs;
    r.features_to_vary = featuresToVary();
    r.feature_ranges = ranges_;
    r.feature_weight_multipliers = featureWeightMultipliers();
    r.max_num_features_to_vary = max_num_features_;
    r.continuous_integer_features = integer_features_;
    return r;
}

void PlanConstraints::applyTo(CfRequest& request) const {
    if (request.sample.size() != feature_count_) {
        throw std::invalid_argument("Sample length does not match the constraints");
    }

    if (auto vary = featuresToVary()) {
        if (request.features_to_vary) {
            std::vector<std::size_t> kept;
            for (std::size_t f : *request.features_to_vary) {
                if (difficulty(f) != Difficulty::Lock) kept.push_back(f);
            }
            request.features_to_vary = std::move(kept);
        } else {
            request.features_to_vary = std::move(vary);
        }
    }
    for (const auto& [feature, range] : ranges_) {
        request.feature_ranges[feature] = range;
    }
    for (const auto& [feature, multiplier] : featureWeightMultipliers()) {
        request.feature_weight_multipliers[feature] = multiplier;
    }
    request.continuous_integer_features.insert(integer_features_.begin(), integer_features_.end());
    request.max_num_features_to_vary = max_num_features_;
}

} // namespace gamcoach
