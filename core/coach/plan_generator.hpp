#pragma once

#include "coach/counterfactual_coach.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <set>

namespace gamcoach {

/// Plans of one round, keyed by plan index.
struct PlanSet {
    std::map<int, CounterfactualPlan> plans;
    std::set<int> failed;
    int next_index = 0;
    ResumeState resume_state;

    bool complete() const { return failed.empty(); }
    nlohmann::json toJson(const ScoringModel& model) const;
};

// ─── Plan Generator ───────────────────────────────────────────
// Draws a round of plans one solution at a time. A plan that changes a
// single feature already changed on its own by an earlier plan of the
// round is dropped and redrawn, so single-feature plans never repeat a
// feature. When the solver fails, the remaining slots are marked failed.

class PlanGenerator {
public:
    static constexpr int kDefaultPlansPerRound = 5;
    static constexpr int kDefaultMaxRedraws = 20;

    explicit PlanGenerator(CounterfactualCoach& coach,
                           int plans_per_round = kDefaultPlansPerRound,
                           int max_redraws = kDefaultMaxRedraws);

    /// Generate one round for a request. Its total_cfs is ignored.
    PlanSet generate(const CfRequest& request, int first_index = 0);

    int plansPerRound() const { return plans_per_round_; }

private:
    CounterfactualCoach& coach_;
    int plans_per_round_;
    int max_redraws_;
};

} // namespace gamcoach
