#include "options/option_generator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace gamcoach {

OptionGenerator::OptionGenerator(const ScoringModel& model, const Sample& sample)
    : model_(model), sample_(sample) {
    encoded_.resize(sample_.size());
    bins_.resize(sample_.size());
    for (size_t i = 0; i < sample_.size(); i++) {
        encoded_[i] = model_.encode(i, sample_[i]);
        bins_[i] = model_.binIndex(i, encoded_[i]);
    }

    current_interaction_.resize(model_.interactionCount(), 0.0);
    for (size_t t = 0; t < model_.interactionCount(); t++) {
        const InteractionTerm& term = model_.interactionTerm(t);
        current_interaction_[t] = model_.interactionScore(t,
            model_.axisBin(t, 0, encoded_[term.index1]),
            model_.axisBin(t, 1, encoded_[term.index2]));
    }
}

bool OptionGenerator::passesFilter(double gain, const OptionFilter& filter) {
    if (filter.filter_direction && gain * filter.direction <= 0.0) {
        return false;
    }
    if (filter.score_gain_bound) {
        if (filter.direction > 0 && gain > *filter.score_gain_bound) return false;
        if (filter.direction < 0 && gain < *filter.score_gain_bound) return false;
    }
    return true;
}

InteractionGains OptionGenerator::interactionDeltas(size_t feature, double new_encoded) const {
    InteractionGains gains;
    for (size_t t : model_.interactionsOf(feature)) {
        const InteractionTerm& term = model_.interactionTerm(t);
        std::optional<size_t> bin1;
        std::optional<size_t> bin2;
        if (term.index1 == feature) {
            bin1 = model_.axisBin(t, 0, new_encoded);
            bin2 = model_.axisBin(t, 1, encoded_[term.index2]);
        } else {
            bin1 = model_.axisBin(t, 0, encoded_[term.index1]);
            bin2 = model_.axisBin(t, 1, new_encoded);
        }
        gains[t] = model_.interactionScore(t, bin1, bin2) - current_interaction_[t];
    }
    return gains;
}

double OptionGenerator::scoreGain(size_t feature, size_t new_bin, double new_encoded,
                                  InteractionGains& gains) const {
    double gain = model_.mainScore(feature, new_bin) - model_.mainScore(feature, bins_[feature]);
    gains = interactionDeltas(feature, new_encoded);
    for (const auto& [_, delta] : gains) {
        gain += delta;
    }
    return gain;
}

std::vector<ContinuousOption> OptionGenerator::continuousOptions(size_t feature,
                                                                 const OptionFilter& filter,
                                                                 double sim_threshold,
                                                                 bool integer_only,
                                                                 double epsilon) const {
    const MainTerm& term = model_.mainTerm(feature);
    const std::vector<double>& edges = term.edges;
    const double value = encoded_[feature];
    const size_t cur_bin = bins_[feature].value_or(0);

    double mad = 0.0;
    auto mad_it = model_.description().cont_mads.find(term.name);
    if (mad_it != model_.description().cont_mads.end()) {
        mad = mad_it->second;
    }

    std::vector<ContinuousOption> options;
    for (size_t i = 0; i < edges.size(); i++) {
        if (i == cur_bin) continue;

        const double upper = (i + 1 < edges.size()) ? edges[i + 1] : term.upper_edge;
        const bool last_bin = (i + 1 == edges.size());
        double target = 0.0;

        if (i < cur_bin) {
            // Left of the current bin: stay just below the next bin's edge.
            if (integer_only) {
                target = std::ceil(upper) - 1.0;
                if (target < edges[i]) continue;
            } else {
                // The offset vanishes next to large edges.
                target = std::min(upper - epsilon,
                                  std::nextafter(upper, -std::numeric_limits<double>::infinity()));
            }
        } else {
            // Right of the current bin: move onto this bin's lower edge.
            if (integer_only) {
                target = std::ceil(edges[i]);
                if (last_bin ? target > upper : target >= upper) continue;
            } else {
                target = edges[i];
            }
        }

        if (model_.binIndex(feature, target) != i) continue;

        ContinuousOption option;
        option.target = target;
        option.bin = i;
        option.distance = std::abs(target - value);
        if (mad > 0.0) {
            option.distance /= mad;
        }
        option.score_gain = scoreGain(feature, i, target, option.interaction_gains);

        if (!passesFilter(option.score_gain, filter)) continue;
        options.push_back(std::move(option));
    }

    pruneRedundant(options, sim_threshold);
    return options;
}

std::vector<CategoricalOption> OptionGenerator::categoricalOptions(size_t feature,
                                                                   const OptionFilter& filter) const {
    const MainTerm& term = model_.mainTerm(feature);
    const auto& desc = model_.description();

    const std::unordered_map<std::string, double>* distances = nullptr;
    auto dist_it = desc.cat_distances.find(term.name);
    if (dist_it != desc.cat_distances.end()) {
        distances = &dist_it->second;
    }

    std::vector<CategoricalOption> options;
    for (size_t i = 0; i < term.edges.size(); i++) {
        if (bins_[feature] && *bins_[feature] == i) continue;

        const double code = term.edges[i];
        auto label = model_.labelEncoder().decode(term.name, static_cast<int>(code));

        CategoricalOption option;
        option.level = label ? *label : asLabel(code);
        option.level_code = code;
        option.bin = i;
        option.distance = 1.0;
        if (distances) {
            auto d = distances->find(option.level);
            if (d != distances->end()) {
                option.distance = d->second;
            }
        }
        option.score_gain = scoreGain(feature, i, code, option.interaction_gains);

        if (!passesFilter(option.score_gain, filter)) continue;
        options.push_back(std::move(option));
    }
    return options;
}

std::vector<InteractionOption> OptionGenerator::interactionOptions(size_t term_index,
                                                                   const OptionSet& parents) const {
    const InteractionTerm& term = model_.interactionTerm(term_index);
    const std::vector<MainOptionView> options1 = parents.mainOptions(term.index1);
    const std::vector<MainOptionView> options2 = parents.mainOptions(term.index2);

    // Categorical parents are located by their bin's level code.
    auto encodedTarget = [this](size_t feature, const MainOptionView& view) {
        const MainTerm& parent = model_.mainTerm(feature);
        if (parent.type == FeatureType::Categorical) return parent.edges.at(view.id.bin);
        return asNumber(view.target);
    };

    std::vector<InteractionOption> out;
    out.reserve(options1.size() * options2.size());

    for (const auto& o1 : options1) {
        const std::optional<size_t> axis1 =
            model_.axisBin(term_index, 0, encodedTarget(term.index1, o1));
        const double share1 = o1.interaction_gains && o1.interaction_gains->count(term_index)
            ? o1.interaction_gains->at(term_index) : 0.0;

        for (const auto& o2 : options2) {
            const std::optional<size_t> axis2 =
                model_.axisBin(term_index, 1, encodedTarget(term.index2, o2));
            // A parent without a recorded share for this term contributes no offset.
            const double share2 = o2.interaction_gains && o2.interaction_gains->count(term_index)
                ? o2.interaction_gains->at(term_index) : 0.0;

            const double raw_gain = model_.interactionScore(term_index, axis1, axis2) -
                                    current_interaction_[term_index];

            InteractionOption option;
            option.term = term_index;
            option.feature1 = term.index1;
            option.bin1 = o1.id.bin;
            option.feature2 = term.index2;
            option.bin2 = o2.id.bin;
            option.target1 = o1.target;
            option.target2 = o2.target;
            option.score_gain = raw_gain - share1 - share2;
            option.distance = 0.0;
            out.push_back(std::move(option));
        }
    }
    return out;
}

double OptionGenerator::defaultSimThreshold(double factor) const {
    double range_sum = 0.0;
    size_t count = 0;
    for (size_t i = 0; i < model_.featureCount(); i++) {
        const MainTerm& term = model_.mainTerm(i);
        if (term.type != FeatureType::Continuous || term.scores.empty()) continue;
        auto [lo, hi] = std::minmax_element(term.scores.begin(), term.scores.end());
        range_sum += *hi - *lo;
        count++;
    }
    if (count == 0) return 0.0;
    return range_sum / static_cast<double>(count) * factor;
}

void OptionGenerator::pruneRedundant(std::vector<ContinuousOption>& options, double sim_threshold) {
    std::stable_sort(options.begin(), options.end(),
        [](const ContinuousOption& a, const ContinuousOption& b) {
            return a.distance < b.distance;
        });

    size_t i = 0;
    while (i < options.size()) {
        size_t j = i + 1;
        while (j < options.size()) {
            if (std::abs(options[j].score_gain - options[i].score_gain) < sim_threshold) {
                options.erase(options.begin() + static_cast<std::ptrdiff_t>(j));
            } else {
                j++;
            }
        }
        i++;
    }
}

} // namespace gamcoach
