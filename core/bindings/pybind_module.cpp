// PyBind11 bindings for the gamcoach C++ core.
// Exposes model loading, scoring and counterfactual generation to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DGAMCOACH_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "model/model_description.hpp"
#include "scoring/scoring_model.hpp"
#include "scoring/local_scoring_model.hpp"
#include "optimization/solver.hpp"
#include "optimization/glpk_solver.hpp"
#include "coach/cf_request.hpp"
#include "coach/constraints.hpp"
#include "coach/counterfactual_coach.hpp"
#include "coach/plan_generator.hpp"
#include "common/logging.hpp"

namespace py = pybind11;

PYBIND11_MODULE(gamcoach_bindings, m) {
    m.doc() = "gamcoach C++ Core Bindings";

    // ── ModelDescription ──
    py::class_<gamcoach::ModelDescription>(m, "ModelDescription")
        .def_static("load_file", &gamcoach::ModelDescription::loadFile)
        .def_static("from_json", [](const std::string& text) {
            return gamcoach::ModelDescription::fromJson(nlohmann::json::parse(text));
        })
        .def_readonly("feature_names", &gamcoach::ModelDescription::feature_names)
        .def_readonly("intercept", &gamcoach::ModelDescription::intercept)
        .def_readonly("is_classifier", &gamcoach::ModelDescription::is_classifier)
        .def("feature_index", &gamcoach::ModelDescription::featureIndex);

    // ── ScoringModel ──
    py::class_<gamcoach::ScoringModel>(m, "ScoringModel")
        .def(py::init<gamcoach::ModelDescription>())
        .def("count_score", &gamcoach::ScoringModel::countScoreByName)
        .def("raw_score", &gamcoach::ScoringModel::rawScore)
        .def("predict", &gamcoach::ScoringModel::predict,
             py::arg("samples"), py::arg("raw") = false)
        .def("predict_prob", &gamcoach::ScoringModel::predictProb)
        .def("feature_count", &gamcoach::ScoringModel::featureCount)
        .def("interaction_count", &gamcoach::ScoringModel::interactionCount)
        .def("is_classifier", &gamcoach::ScoringModel::isClassifier);

    // ── LocalScoringModel ──
    py::class_<gamcoach::LocalScoringModel>(m, "LocalScoringModel")
        .def(py::init<const gamcoach::ScoringModel&, gamcoach::Sample>(),
             py::keep_alive<1, 2>())
        .def("update_feature",
             py::overload_cast<const std::string&, const gamcoach::FeatureValue&>(
                 &gamcoach::LocalScoringModel::updateFeature))
        .def("sample", &gamcoach::LocalScoringModel::sample)
        .def("raw_score", &gamcoach::LocalScoringModel::rawScore)
        .def("prediction", &gamcoach::LocalScoringModel::prediction)
        .def("probability", &gamcoach::LocalScoringModel::probability);

    // ── Configs ──
    py::class_<gamcoach::CoachConfig>(m, "CoachConfig")
        .def(py::init<>())
        .def_readwrite("sim_threshold_factor", &gamcoach::CoachConfig::sim_threshold_factor)
        .def_readwrite("epsilon", &gamcoach::CoachConfig::epsilon)
        .def_readwrite("class_flip_margin", &gamcoach::CoachConfig::class_flip_margin);

    py::class_<gamcoach::SolverConfig>(m, "SolverConfig")
        .def(py::init<>())
        .def_readwrite("time_limit_seconds", &gamcoach::SolverConfig::time_limit_seconds)
        .def_readwrite("mip_gap", &gamcoach::SolverConfig::mip_gap)
        .def_readwrite("presolve", &gamcoach::SolverConfig::presolve)
        .def_readwrite("verbose", &gamcoach::SolverConfig::verbose);

    // ── Solvers ──
    py::class_<gamcoach::MipSolver>(m, "MipSolver")
        .def("name", &gamcoach::MipSolver::name);

    py::class_<gamcoach::GlpkSolver, gamcoach::MipSolver>(m, "GlpkSolver")
        .def(py::init<gamcoach::SolverConfig>(), py::arg("config") = gamcoach::SolverConfig{})
        .def("config", &gamcoach::GlpkSolver::config);

    // ── Requests ──
    py::class_<gamcoach::CfRequest>(m, "CfRequest")
        .def_static("from_json", [](const std::string& text, const gamcoach::ScoringModel& model) {
            return gamcoach::CfRequest::fromJson(nlohmann::json::parse(text), model);
        })
        .def_readwrite("sample", &gamcoach::CfRequest::sample)
        .def_readwrite("total_cfs", &gamcoach::CfRequest::total_cfs)
        .def_readwrite("target_range", &gamcoach::CfRequest::target_range)
        .def_readwrite("max_num_features_to_vary", &gamcoach::CfRequest::max_num_features_to_vary)
        .def("to_json", [](const gamcoach::CfRequest& self, const gamcoach::ScoringModel& model) {
            return self.toJson(model).dump();
        });

    py::class_<gamcoach::PlanConstraints>(m, "PlanConstraints")
        .def_static("from_model", &gamcoach::PlanConstraints::fromModel)
        .def("set_max_num_features", &gamcoach::PlanConstraints::setMaxNumFeatures)
        .def("max_num_features", &gamcoach::PlanConstraints::maxNumFeatures)
        .def("to_request", &gamcoach::PlanConstraints::toRequest,
             py::arg("sample"), py::arg("total_cfs") = 1)
        .def("apply_to", &gamcoach::PlanConstraints::applyTo, py::arg("request"));

    // ── Results ──
    py::class_<gamcoach::ChangedFeature>(m, "ChangedFeature")
        .def_readonly("feature", &gamcoach::ChangedFeature::feature)
        .def_readonly("name", &gamcoach::ChangedFeature::name)
        .def_readonly("original", &gamcoach::ChangedFeature::original)
        .def_readonly("value", &gamcoach::ChangedFeature::value)
        .def_readonly("bin_range", &gamcoach::ChangedFeature::bin_range)
        .def_readonly("level", &gamcoach::ChangedFeature::level)
        .def_readonly("score_gain", &gamcoach::ChangedFeature::score_gain);

    py::class_<gamcoach::CounterfactualPlan>(m, "CounterfactualPlan")
        .def_readonly("data", &gamcoach::CounterfactualPlan::data)
        .def_readonly("distance", &gamcoach::CounterfactualPlan::distance)
        .def_readonly("changes", &gamcoach::CounterfactualPlan::changes)
        .def_readonly("active_names", &gamcoach::CounterfactualPlan::active_names)
        .def_readonly("score_gains", &gamcoach::CounterfactualPlan::score_gains)
        .def("total_score_gain", &gamcoach::CounterfactualPlan::totalScoreGain);

    py::class_<gamcoach::ResumeState>(m, "ResumeState")
        .def("to_json", [](const gamcoach::ResumeState& self, const gamcoach::ScoringModel& model) {
            return self.toJson(model).dump();
        });

    py::class_<gamcoach::CfBatch>(m, "CfBatch")
        .def_readonly("plans", &gamcoach::CfBatch::plans)
        .def_readonly("requested", &gamcoach::CfBatch::requested)
        .def_readonly("failed", &gamcoach::CfBatch::failed)
        .def_readonly("is_successful", &gamcoach::CfBatch::is_successful)
        .def_readonly("resume_state", &gamcoach::CfBatch::resume_state)
        .def("to_json", [](const gamcoach::CfBatch& self, const gamcoach::ScoringModel& model) {
            return self.toJson(model).dump();
        });

    // ── CounterfactualCoach ──
    py::class_<gamcoach::CounterfactualCoach>(m, "CounterfactualCoach")
        .def(py::init<const gamcoach::ScoringModel&, gamcoach::MipSolver&, gamcoach::CoachConfig>(),
             py::arg("model"), py::arg("solver"), py::arg("config") = gamcoach::CoachConfig{},
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("generate_cfs", &gamcoach::CounterfactualCoach::generateCfs)
        .def("generate_sub_cfs", &gamcoach::CounterfactualCoach::generateSubCfs);

    // ── PlanGenerator ──
    py::class_<gamcoach::PlanSet>(m, "PlanSet")
        .def_readonly("plans", &gamcoach::PlanSet::plans)
        .def_readonly("failed", &gamcoach::PlanSet::failed)
        .def_readonly("next_index", &gamcoach::PlanSet::next_index)
        .def("complete", &gamcoach::PlanSet::complete)
        .def("to_json", [](const gamcoach::PlanSet& self, const gamcoach::ScoringModel& model) {
            return self.toJson(model).dump();
        });

    py::class_<gamcoach::PlanGenerator>(m, "PlanGenerator")
        .def(py::init<gamcoach::CounterfactualCoach&, int, int>(),
             py::arg("coach"),
             py::arg("plans_per_round") = gamcoach::PlanGenerator::kDefaultPlansPerRound,
             py::arg("max_redraws") = gamcoach::PlanGenerator::kDefaultMaxRedraws,
             py::keep_alive<1, 2>())
        .def("generate", &gamcoach::PlanGenerator::generate,
             py::arg("request"), py::arg("first_index") = 0);

    m.def("set_log_level", [](const std::string& level) {
        auto parsed = gamcoach::logging::parseLevel(level);
        if (!parsed) throw py::value_error("Unknown log level: " + level);
        gamcoach::logging::setMinLevel(*parsed);
    });

    m.def("generate_cfs", [](const gamcoach::ScoringModel& model, const std::string& request_json) {
        gamcoach::GlpkSolver solver;
        gamcoach::CounterfactualCoach coach(model, solver);
        gamcoach::CfBatch batch = coach.generateCfs(
            gamcoach::CfRequest::fromJson(nlohmann::json::parse(request_json), model));
        return batch.toJson(model).dump();
    }, py::arg("model"), py::arg("request_json"));
}
