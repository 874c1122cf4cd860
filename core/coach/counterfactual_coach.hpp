#pragma once

#include "coach/cf_request.hpp"
#include "optimization/model_builder.hpp"
#include "optimization/solver.hpp"
#include "options/option.hpp"
#include "scoring/scoring_model.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gamcoach {

/// Direction and size of the score change a counterfactual must reach.
struct SearchTarget {
    int direction = 1;                        // +1 raise the score, -1 lower it
    double score_threshold = 0.0;             // required total score gain
    std::optional<double> score_gain_bound;   // regression: gain that overshoots the range
};

// ─── Counterfactual Plan ──────────────────────────────────────

/// One feature changed by a plan.
struct ChangedFeature {
    std::size_t feature = 0;
    std::string name;
    FeatureValue original;
    FeatureValue value;
    std::optional<std::pair<double, double>> bin_range;  // continuous: [lo, hi)
    std::optional<std::string> level;                   // categorical
    double score_gain = 0.0;                            // main effect plus its interactions
};

struct CounterfactualPlan {
    Sample data;
    double distance = 0.0;
    std::vector<ChangedFeature> changes;

    /// Selected options, main effects first. score_gains is parallel.
    std::vector<OptionId> active_variables;
    std::vector<std::string> active_names;
    std::vector<double> score_gains;

    double totalScoreGain() const;

    /// Per changed feature: [lo, hi] of the covering bin or the level label.
    nlohmann::json targetRangesJson() const;
};

// ─── Resume State ─────────────────────────────────────────────
// Everything needed to draw further solutions for the same sample
// without regenerating options. Values are immutable once built: each
// search step returns a new state with a larger `used` set.

struct ResumeState {
    Sample sample;
    SearchTarget target;
    std::vector<std::size_t> features_to_vary;
    std::shared_ptr<const OptionSet> options;
    std::optional<int> max_num_features;
    OptionIdSet used;

    nlohmann::json toJson(const ScoringModel& model) const;
};

/// Outcome of one search step.
struct SearchStep {
    std::optional<CounterfactualPlan> plan;   // empty when the solver failed
    ResumeState next;
    SolveStatus status = SolveStatus::Undefined;
};

// ─── Counterfactual Batch ─────────────────────────────────────

struct CfBatch {
    std::vector<CounterfactualPlan> plans;
    std::size_t requested = 0;
    std::vector<std::size_t> failed;   // indices of requested plans that were not produced
    bool is_successful = true;
    ResumeState resume_state;

    nlohmann::json toJson(const ScoringModel& model) const;
};

// ─── Counterfactual Coach ─────────────────────────────────────
// Finds minimal-distance sets of feature changes that move a sample's
// score to the desired side of the decision boundary (classifier) or
// into a target range (regressor).
//
// Process:
// 1. Direction and required score gain from the current score
// 2. Options for every feature allowed to vary, filtered by ranges
// 3. Interaction options from the surviving main options
// 4. Distance reweighting (categorical rescale, per-feature multipliers)
// 5. Build + solve repeatedly, muting the options of earlier solutions
//
// The solver is borrowed and must outlive the coach.

class CounterfactualCoach {
public:
    CounterfactualCoach(const ScoringModel& model, MipSolver& solver, CoachConfig config = {});

    /// Generate up to request.total_cfs diverse plans. Throws
    /// std::invalid_argument for a regression request without a usable
    /// target range.
    CfBatch generateCfs(const CfRequest& request);

    /// Draw one more plan from an earlier batch's resume state.
    CfBatch generateSubCfs(const ResumeState& state);

    /// Single diversification step: solve with state.used muted.
    SearchStep nextSolution(const ResumeState& state);

    /// Step 1 of the search, exposed for callers that pre-check requests.
    SearchTarget searchTarget(double raw_score,
                              const std::optional<std::pair<double, double>>& target_range) const;

    /// Steps 2-4: all options for a request, already reweighted.
    OptionSet generateOptions(const CfRequest& request, const SearchTarget& target) const;

    const CoachConfig& config() const { return config_; }

private:
    const ScoringModel& model_;
    MipSolver& solver_;
    CoachConfig config_;
    OptimizationModelBuilder builder_;

    CounterfactualPlan decode(const ResumeState& state,
                              const BuiltModel& built,
                              const SolveResult& result) const;

    /// Collect plans until `count` are drawn or the solver fails.
    CfBatch runBatch(ResumeState state, std::size_t count);
};

} // namespace gamcoach
