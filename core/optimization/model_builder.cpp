#include "optimization/model_builder.hpp"

#include <algorithm>
#include <set>

namespace gamcoach {

std::string OptimizationModelBuilder::variableName(const OptionId& id) const {
    std::string name = model_.mainTerm(id.feature).name + ":" + std::to_string(id.bin);
    if (id.isInteraction()) {
        name += " x " + model_.mainTerm(id.feature2).name + ":" + std::to_string(id.bin2);
    }
    return name;
}

BuiltModel OptimizationModelBuilder::build(const OptionSet& options,
                                           const ModelConstraints& constraints,
                                           const OptionIdSet& muted) const {
    BuiltModel built;
    MipProblem& p = built.problem;
    p.name = "counterfactual";
    p.direction = ObjectiveDirection::Minimize;

    MipConstraint gain_row;
    gain_row.name = "score_gain";
    gain_row.bounds = constraints.direction > 0
        ? RowBounds::lower(constraints.score_threshold)
        : RowBounds::upper(constraints.score_threshold);

    MipConstraint cardinality;
    cardinality.name = "max_num_features";
    cardinality.bounds = RowBounds::upper(
        static_cast<double>(constraints.max_num_features.value_or(0)));

    std::set<size_t> allowed(constraints.features_to_vary.begin(),
                             constraints.features_to_vary.end());

    // ── Main-effect binaries ──
    for (size_t feature : allowed) {
        MipConstraint select_one;
        select_one.name = "select_one_" + model_.mainTerm(feature).name;
        select_one.bounds = RowBounds::upper(1.0);

        for (const MainOptionView& view : options.mainOptions(feature)) {
            if (muted.count(view.id)) continue;

            const std::string name = variableName(view.id);
            built.variables[name] = view.id;
            built.names[view.id] = name;
            built.main_variable_count++;

            p.binaries.push_back(name);
            p.objective.push_back({name, view.distance});
            select_one.vars.push_back({name, 1.0});
            gain_row.vars.push_back({name, view.score_gain});
            cardinality.vars.push_back({name, 1.0});
        }

        if (!select_one.vars.empty()) {
            p.subject_to.push_back(std::move(select_one));
        }
    }

    auto kindOf = [this](size_t feature) {
        return model_.mainTerm(feature).type == FeatureType::Categorical
            ? OptionKind::Categorical : OptionKind::Continuous;
    };

    // ── Interaction auxiliaries (AND linearization) ──
    for (const auto& [term, term_options] : options.interaction) {
        for (const InteractionOption& option : term_options) {
            const OptionId parent1 = OptionId::mainEffect(kindOf(option.feature1), option.feature1, option.bin1);
            const OptionId parent2 = OptionId::mainEffect(kindOf(option.feature2), option.feature2, option.bin2);

            auto x1 = built.names.find(parent1);
            auto x2 = built.names.find(parent2);
            if (x1 == built.names.end() || x2 == built.names.end()) continue;

            const OptionId id = option.id();
            if (muted.count(id)) {
                // Without z the gain row would miss this pair's net gain.
                p.subject_to.push_back({"exclude " + variableName(id),
                                        {{x1->second, 1.0}, {x2->second, 1.0}},
                                        RowBounds::upper(1.0)});
                continue;
            }

            const std::string z = variableName(id);
            built.variables[z] = id;
            built.names[id] = z;
            built.interaction_variable_count++;

            p.bounds.push_back({z, 0.0, 1.0});
            p.subject_to.push_back({z + " <= x1", {{z, 1.0}, {x1->second, -1.0}}, RowBounds::upper(0.0)});
            p.subject_to.push_back({z + " <= x2", {{z, 1.0}, {x2->second, -1.0}}, RowBounds::upper(0.0)});
            p.subject_to.push_back({z + " >= x1 + x2 - 1",
                                    {{x1->second, 1.0}, {x2->second, 1.0}, {z, -1.0}},
                                    RowBounds::upper(1.0)});
            gain_row.vars.push_back({z, option.score_gain});
        }
    }

    p.subject_to.push_back(std::move(gain_row));
    if (constraints.max_num_features) {
        p.subject_to.push_back(std::move(cardinality));
    }
    return built;
}

} // namespace gamcoach
