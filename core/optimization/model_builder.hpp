#pragma once

#include "optimization/mip_problem.hpp"
#include "options/option.hpp"
#include "scoring/scoring_model.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gamcoach {

/// What the built problem must achieve.
struct ModelConstraints {
    int direction = 1;                           // +1: gain >= threshold, -1: gain <= threshold
    double score_threshold = 0.0;
    std::vector<std::size_t> features_to_vary;   // features allowed to change
    std::optional<int> max_num_features;         // cap on changed features
};

/// A built problem plus the bridge between its variable names and the
/// typed option identifiers.
struct BuiltModel {
    MipProblem problem;
    std::unordered_map<std::string, OptionId> variables;
    std::map<OptionId, std::string> names;
    std::size_t main_variable_count = 0;
    std::size_t interaction_variable_count = 0;

    /// Identifier of a variable name, if it belongs to this model.
    std::optional<OptionId> idOf(const std::string& name) const {
        auto it = variables.find(name);
        if (it == variables.end()) return std::nullopt;
        return it->second;
    }
};

// ─── Optimization Model Builder ───────────────────────────────
// Builds the 0-1 program:
//
//   min  sum distance_i * x_i
//   s.t. sum_{i in feature f} x_i <= 1                  for every feature
//        sum_i x_i <= max_num_features                   (optional)
//        z <= x1,  z <= x2,  x1 + x2 - z <= 1            for every interaction option
//        sum gain_i * x_i + sum gain_k * z_k  >= / <= threshold
//
// x are binaries over main-effect options, z in [0, 1] stand for "both
// parents selected". z only appears on the benefit side of the gain row,
// so no optimal solution sets it below the logical AND.

class OptimizationModelBuilder {
public:
    explicit OptimizationModelBuilder(const ScoringModel& model) : model_(model) {}

    /// Build a problem over all non-muted options of the allowed features.
    BuiltModel build(const OptionSet& options,
                     const ModelConstraints& constraints,
                     const OptionIdSet& muted = {}) const;

    /// Stable variable name: "feature:bin" for main effects,
    /// "featureA:binA x featureB:binB" for interaction options.
    std::string variableName(const OptionId& id) const;

private:
    const ScoringModel& model_;
};

} // namespace gamcoach
