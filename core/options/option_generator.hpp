#pragma once

#include "options/option.hpp"
#include "scoring/scoring_model.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace gamcoach {

/// Which options survive generation.
struct OptionFilter {
    int direction = 1;                      // +1 increase score, -1 decrease
    bool filter_direction = true;           // drop gains that move the wrong way
    std::optional<double> score_gain_bound; // drop gains past this bound
};

// ─── Option Generator ─────────────────────────────────────────
// Enumerates candidate replacement values for one sample.
//
// Continuous: one option per other bin. Targets sit just inside the
// bin nearest the current value; integer features snap to the closest
// valid integer inside the bin or skip it. Distance is |target - value|
// scaled by the feature's MAD. Redundant options (similar gain, higher
// cost) are pruned.
//
// Categorical: one option per other level, distance from the model's
// categorical distance table.
//
// Interaction: cross product of the two parents' options, with the
// parents' own share of the interaction subtracted out.

class OptionGenerator {
public:
    static constexpr double kDefaultEpsilon = 1e-6;

    OptionGenerator(const ScoringModel& model, const Sample& sample);

    std::vector<ContinuousOption> continuousOptions(std::size_t feature,
                                                    const OptionFilter& filter,
                                                    double sim_threshold,
                                                    bool integer_only = false,
                                                    double epsilon = kDefaultEpsilon) const;

    std::vector<CategoricalOption> categoricalOptions(std::size_t feature,
                                                      const OptionFilter& filter) const;

    std::vector<InteractionOption> interactionOptions(std::size_t term,
                                                      const OptionSet& parents) const;

    /// Mean (max - min) additive range over continuous features, times factor.
    double defaultSimThreshold(double factor) const;

    /// Sort by ascending distance, then drop every later option whose gain
    /// is within sim_threshold of an earlier kept one. The scan splices in
    /// place, so which entries go depends on the sorted order.
    static void pruneRedundant(std::vector<ContinuousOption>& options, double sim_threshold);

    double currentEncoded(std::size_t feature) const { return encoded_[feature]; }
    std::optional<std::size_t> currentBin(std::size_t feature) const { return bins_[feature]; }

private:
    const ScoringModel& model_;
    Sample sample_;
    std::vector<double> encoded_;
    std::vector<std::optional<std::size_t>> bins_;
    std::vector<double> current_interaction_;

    /// Score change of every interaction touching `feature` when it moves
    /// to `new_encoded` while all other features stay put.
    InteractionGains interactionDeltas(std::size_t feature, double new_encoded) const;

    double scoreGain(std::size_t feature, std::size_t new_bin, double new_encoded,
                     InteractionGains& gains) const;

    static bool passesFilter(double gain, const OptionFilter& filter);
};

} // namespace gamcoach
