#include "coach/plan_generator.hpp"
#include "common/logging.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace gamcoach {

nlohmann::json PlanSet::toJson(const ScoringModel& model) const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& [index, plan] : plans) {
        out.push_back({
            {"index", index},
            {"data", sampleToJson(plan.data)},
            {"distance", plan.distance},
            {"targetRanges", plan.targetRangesJson()},
            {"scoreGains", plan.score_gains},
            {"activeVariables", plan.active_names}
        });
    }
    return {
        {"plans", out},
        {"failed", failed},
        {"nextIndex", next_index},
        {"resumeState", resume_state.toJson(model)}
    };
}

PlanGenerator::PlanGenerator(CounterfactualCoach& coach, int plans_per_round, int max_redraws)
    : coach_(coach), plans_per_round_(plans_per_round), max_redraws_(max_redraws) {
    if (plans_per_round_ < 1) {
        throw std::invalid_argument("plans_per_round must be at least 1");
    }
}

PlanSet PlanGenerator::generate(const CfRequest& request, int first_index) {
    PlanSet set;
    set.next_index = first_index;

    CfRequest first = request;
    first.total_cfs = 1;
    CfBatch batch = coach_.generateCfs(first);
    set.resume_state = batch.resume_state;

    std::set<std::size_t> single_features;
    int accepted = 0;
    int redraws = 0;

    auto markRemainingFailed = [&]() {
        for (int k = accepted; k < plans_per_round_; k++) {
            set.failed.insert(first_index + k);
        }
    };

    std::optional<CounterfactualPlan> candidate;
    if (batch.is_successful && !batch.plans.empty()) {
        candidate = std::move(batch.plans.front());
    }

    while (accepted < plans_per_round_) {
        if (!candidate) {
            markRemainingFailed();
            break;
        }

        bool repeat = false;
        if (candidate->changes.size() == 1) {
            repeat = !single_features.insert(candidate->changes.front().feature).second;
        }

        if (repeat) {
            if (++redraws > max_redraws_) {
                GCLOG_WARN("coach", "PlanGenerator::generate", "redraw_limit",
                           (nlohmann::json{{"accepted", accepted}, {"redraws", redraws}}));
                markRemainingFailed();
                break;
            }
        } else {
            set.plans[first_index + accepted] = std::move(*candidate);
            accepted++;
        }
        candidate.reset();
        if (accepted == plans_per_round_) break;

        CfBatch next = coach_.generateSubCfs(set.resume_state);
        set.resume_state = next.resume_state;
        if (next.is_successful && !next.plans.empty()) {
            candidate = std::move(next.plans.front());
        }
    }

    set.next_index = first_index + plans_per_round_;
    GCLOG_INFO("coach", "PlanGenerator::generate", "round_finished",
               (nlohmann::json{{"accepted", accepted},
                               {"failed", set.failed.size()},
                               {"redraws", redraws}}));
    return set;
}

} // namespace gamcoach
