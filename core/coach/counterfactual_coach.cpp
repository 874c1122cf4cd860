#include "coach/counterfactual_coach.hpp"
#include "common/logging.hpp"
#include "options/option_generator.hpp"
#include "scoring/local_scoring_model.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace gamcoach {

namespace {

const ContinuousOption* findContinuous(const OptionSet& options, std::size_t feature, std::size_t bin) {
    auto it = options.continuous.find(feature);
    if (it == options.continuous.end()) return nullptr;
    for (const auto& o : it->second) {
        if (o.bin == bin) return &o;
    }
    return nullptr;
}

const CategoricalOption* findCategorical(const OptionSet& options, std::size_t feature, std::size_t bin) {
    auto it = options.categorical.find(feature);
    if (it == options.categorical.end()) return nullptr;
    for (const auto& o : it->second) {
        if (o.bin == bin) return &o;
    }
    return nullptr;
}

const InteractionOption* findInteraction(const OptionSet& options, const OptionId& id) {
    for (const auto& [_, term_options] : options.interaction) {
        for (const auto& o : term_options) {
            if (o.id() == id) return &o;
        }
    }
    return nullptr;
}

nlohmann::json boundToJson(double value) {
    if (std::isinf(value)) return nullptr;
    return value;
}

} // namespace

// ─── Plan / State Serialization ───────────────────────────────

double CounterfactualPlan::totalScoreGain() const {
    return std::accumulate(score_gains.begin(), score_gains.end(), 0.0);
}

nlohmann::json CounterfactualPlan::targetRangesJson() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& change : changes) {
        if (change.bin_range) {
            out[change.name] = {boundToJson(change.bin_range->first),
                                boundToJson(change.bin_range->second)};
        } else if (change.level) {
            out[change.name] = *change.level;
        }
    }
    return out;
}

nlohmann::json ResumeState::toJson(const ScoringModel& model) const {
    nlohmann::json vary = nlohmann::json::array();
    for (std::size_t f : features_to_vary) vary.push_back(model.mainTerm(f).name);

    nlohmann::json muted = nlohmann::json::array();
    for (const auto& id : used) muted.push_back(id.toString());

    nlohmann::json j = {
        {"direction", target.direction},
        {"scoreThreshold", target.score_threshold},
        {"featuresToVary", vary},
        {"usedOptions", muted},
        {"mainOptionCount", options ? options->mainOptionCount() : 0},
        {"interactionOptionCount", options ? options->interactionOptionCount() : 0}
    };
    if (target.score_gain_bound) j["scoreGainBound"] = *target.score_gain_bound;
    if (max_num_features) j["maxNumFeatures"] = *max_num_features;
    return j;
}

nlohmann::json CfBatch::toJson(const ScoringModel& model) const {
    nlohmann::json data = nlohmann::json::array();
    nlohmann::json distances = nlohmann::json::array();
    nlohmann::json ranges = nlohmann::json::array();
    nlohmann::json gains = nlohmann::json::array();
    nlohmann::json active = nlohmann::json::array();

    for (const auto& plan : plans) {
        data.push_back(sampleToJson(plan.data));
        distances.push_back(plan.distance);
        ranges.push_back(plan.targetRangesJson());
        gains.push_back(plan.score_gains);
        active.push_back(plan.active_names);
    }

    return {
        {"data", data},
        {"distances", distances},
        {"targetRanges", ranges},
        {"scoreGains", gains},
        {"isSuccessful", is_successful},
        {"activeVariables", active},
        {"failed", failed},
        {"resumeState", resume_state.toJson(model)}
    };
}

// ─── Counterfactual Coach ─────────────────────────────────────

CounterfactualCoach::CounterfactualCoach(const ScoringModel& model, MipSolver& solver, CoachConfig config)
    : model_(model), solver_(solver), config_(config), builder_(model) {}

SearchTarget CounterfactualCoach::searchTarget(
    double raw_score, const std::optional<std::pair<double, double>>& target_range) const {

    SearchTarget t;
    if (model_.isClassifier()) {
        // Score 0 already predicts the positive class, so it has to go down.
        t.direction = raw_score >= 0.0 ? -1 : 1;
        t.score_threshold = -raw_score + t.direction * config_.class_flip_margin;
        return t;
    }

    if (!target_range) {
        throw std::invalid_argument("Regression counterfactuals require a target range");
    }
    const double lo = target_range->first;
    const double hi = target_range->second;
    if (raw_score >= lo && raw_score <= hi) {
        throw std::invalid_argument("Current score " + std::to_string(raw_score) +
                                    " already lies inside the target range");
    }

    if (raw_score < lo) {
        t.direction = 1;
        t.score_threshold = lo - raw_score;
        if (std::isfinite(hi)) t.score_gain_bound = hi - raw_score;
    } else {
        t.direction = -1;
        t.score_threshold = hi - raw_score;
        if (std::isfinite(lo)) t.score_gain_bound = lo - raw_score;
    }
    return t;
}

OptionSet CounterfactualCoach::generateOptions(const CfRequest& request, const SearchTarget& target) const {
    OptionGenerator generator(model_, request.sample);

    const double sim_threshold = request.sim_threshold
        ? *request.sim_threshold
        : generator.defaultSimThreshold(config_.sim_threshold_factor);

    OptionFilter filter;
    filter.direction = target.direction;
    filter.score_gain_bound = target.score_gain_bound;

    std::vector<std::size_t> features;
    if (request.features_to_vary) {
        features = *request.features_to_vary;
    } else {
        features.resize(model_.featureCount());
        std::iota(features.begin(), features.end(), 0);
    }

    OptionSet options;
    for (std::size_t f : features) {
        auto range = request.feature_ranges.find(f);
        const FeatureRange* allowed = range != request.feature_ranges.end() ? &range->second : nullptr;

        if (model_.mainTerm(f).type == FeatureType::Categorical) {
            auto generated = generator.categoricalOptions(f, filter);
            if (allowed) {
                generated.erase(std::remove_if(generated.begin(), generated.end(),
                    [allowed](const CategoricalOption& o) { return !allowed->admits(o.level); }),
                    generated.end());
            }
            if (!generated.empty()) options.categorical[f] = std::move(generated);
        } else {
            const bool integer_only = request.continuous_integer_features.count(f) > 0;
            auto generated = generator.continuousOptions(f, filter, sim_threshold,
                                                         integer_only, config_.epsilon);
            if (allowed) {
                generated.erase(std::remove_if(generated.begin(), generated.end(),
                    [allowed](const ContinuousOption& o) { return !allowed->admits(o.target); }),
                    generated.end());
            }
            if (!generated.empty()) options.continuous[f] = std::move(generated);
        }
    }

    for (std::size_t t = 0; t < model_.interactionCount(); t++) {
        auto generated = generator.interactionOptions(t, options);
        if (!generated.empty()) options.interaction[t] = std::move(generated);
    }

    // Categorical distances live on a different scale than MAD-normalized
    // continuous ones.
    double cat_weight = 1.0;
    if (request.categorical_weight) {
        cat_weight = *request.categorical_weight;
    } else {
        double cont_sum = 0.0, cat_sum = 0.0;
        std::size_t cont_n = 0, cat_n = 0;
        for (const auto& [_, list] : options.continuous) {
            for (const auto& o : list) { cont_sum += o.distance; cont_n++; }
        }
        for (const auto& [_, list] : options.categorical) {
            for (const auto& o : list) { cat_sum += o.distance; cat_n++; }
        }
        if (cont_n > 0 && cat_n > 0 && cat_sum > 0.0) {
            cat_weight = (cont_sum / cont_n) / (cat_sum / cat_n);
        }
    }
    for (auto& [_, list] : options.categorical) {
        for (auto& o : list) o.distance *= cat_weight;
    }

    for (const auto& [f, multiplier] : request.feature_weight_multipliers) {
        auto cont = options.continuous.find(f);
        if (cont != options.continuous.end()) {
            for (auto& o : cont->second) o.distance *= multiplier;
        }
        auto cat = options.categorical.find(f);
        if (cat != options.categorical.end()) {
            for (auto& o : cat->second) o.distance *= multiplier;
        }
    }

    GCLOG_DEBUG("coach", "CounterfactualCoach::generateOptions", "options_generated",
                (nlohmann::json{{"features", features.size()},
                                {"main", options.mainOptionCount()},
                                {"interaction", options.interactionOptionCount()},
                                {"simThreshold", sim_threshold},
                                {"categoricalWeight", cat_weight}}));
    return options;
}

CfBatch CounterfactualCoach::generateCfs(const CfRequest& request) {
    if (request.sample.size() != model_.featureCount()) {
        throw std::invalid_argument("Sample has " + std::to_string(request.sample.size()) +
                                    " values, model expects " +
                                    std::to_string(model_.featureCount()));
    }

    LocalScoringModel local(model_, request.sample);
    const SearchTarget target = searchTarget(local.rawScore(), request.target_range);

    ResumeState state;
    state.sample = request.sample;
    state.target = target;
    if (request.features_to_vary) {
        state.features_to_vary = *request.features_to_vary;
    } else {
        state.features_to_vary.resize(model_.featureCount());
        std::iota(state.features_to_vary.begin(), state.features_to_vary.end(), 0);
    }
    state.options = std::make_shared<const OptionSet>(generateOptions(request, target));
    state.max_num_features = request.max_num_features_to_vary;

    const std::size_t count = request.total_cfs > 0 ? static_cast<std::size_t>(request.total_cfs) : 0;
    CfBatch batch = runBatch(std::move(state), count);

    GCLOG_INFO("coach", "CounterfactualCoach::generateCfs", "batch_finished",
               (nlohmann::json{{"requested", batch.requested},
                               {"found", batch.plans.size()},
                               {"successful", batch.is_successful},
                               {"direction", target.direction},
                               {"scoreThreshold", target.score_threshold},
                               {"solver", solver_.name()}}));
    return batch;
}

CfBatch CounterfactualCoach::generateSubCfs(const ResumeState& state) {
    if (!state.options) {
        throw std::invalid_argument("Resume state carries no options");
    }
    return runBatch(state, 1);
}

CfBatch CounterfactualCoach::runBatch(ResumeState state, std::size_t count) {
    CfBatch batch;
    batch.requested = count;

    for (std::size_t i = 0; i < count; i++) {
        SearchStep step = nextSolution(state);
        state = std::move(step.next);
        if (!step.plan) {
            batch.is_successful = false;
            for (std::size_t k = i; k < count; k++) batch.failed.push_back(k);
            GCLOG_WARN("coach", "CounterfactualCoach::runBatch", "solver_failed",
                       (nlohmann::json{{"index", i},
                                       {"status", solveStatusToString(step.status)},
                                       {"remaining", count - i}}));
            break;
        }
        batch.plans.push_back(std::move(*step.plan));
    }

    batch.resume_state = std::move(state);
    return batch;
}

SearchStep CounterfactualCoach::nextSolution(const ResumeState& state) {
    ModelConstraints constraints;
    constraints.direction = state.target.direction;
    constraints.score_threshold = state.target.score_threshold;
    constraints.features_to_vary = state.features_to_vary;
    constraints.max_num_features = state.max_num_features;

    const BuiltModel built = builder_.build(*state.options, constraints, state.used);
    const SolveResult result = solver_.solve(built.problem);

    SearchStep step;
    step.status = result.status;
    step.next = state;
    if (!result.isOptimal()) {
        return step;
    }

    CounterfactualPlan plan = decode(state, built, result);
    for (const auto& id : plan.active_variables) {
        step.next.used.insert(id);
    }
    step.plan = std::move(plan);
    return step;
}

CounterfactualPlan CounterfactualCoach::decode(const ResumeState& state,
                                               const BuiltModel& built,
                                               const SolveResult& result) const {
    CounterfactualPlan plan;
    plan.data = state.sample;
    plan.distance = result.objective_value;

    std::vector<OptionId> main_ids;
    std::vector<OptionId> interaction_ids;
    for (const auto& name : result.activeVariables()) {
        auto id = built.idOf(name);
        if (!id) {
            GCLOG_WARN("coach", "CounterfactualCoach::decode", "unknown_variable",
                       (nlohmann::json{{"name", name}}));
            continue;
        }
        (id->isInteraction() ? interaction_ids : main_ids).push_back(*id);
    }

    const OptionSet& options = *state.options;
    for (const auto& id : main_ids) {
        const MainTerm& term = model_.mainTerm(id.feature);
        ChangedFeature change;
        change.feature = id.feature;
        change.name = term.name;
        change.original = state.sample[id.feature];

        if (id.kind == OptionKind::Categorical) {
            const CategoricalOption* o = findCategorical(options, id.feature, id.bin);
            if (!o) throw std::logic_error("Solver selected unknown option " + id.toString());
            change.value = o->level;
            change.level = o->level;
            change.score_gain = o->score_gain;
        } else {
            const ContinuousOption* o = findContinuous(options, id.feature, id.bin);
            if (!o) throw std::logic_error("Solver selected unknown option " + id.toString());
            change.value = o->target;
            const double hi = id.bin + 1 < term.edges.size() ? term.edges[id.bin + 1] : term.upper_edge;
            change.bin_range = std::make_pair(term.edges[id.bin], hi);
            change.score_gain = o->score_gain;
        }

        plan.data[id.feature] = change.value;
        plan.active_variables.push_back(id);
        plan.active_names.push_back(built.names.at(id));
        plan.score_gains.push_back(change.score_gain);
        plan.changes.push_back(std::move(change));
    }

    // Interaction selections follow from their parents and change no value.
    for (const auto& id : interaction_ids) {
        const InteractionOption* o = findInteraction(options, id);
        if (!o) throw std::logic_error("Solver selected unknown option " + id.toString());
        plan.active_variables.push_back(id);
        plan.active_names.push_back(built.names.at(id));
        plan.score_gains.push_back(o->score_gain);
    }
    return plan;
}

} // namespace gamcoach
