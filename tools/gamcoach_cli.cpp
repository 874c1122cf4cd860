// Command-line front end: reads a model file and a request file, prints the
// counterfactual batch (or a round of plans) as JSON on stdout.

#include "coach/constraints.hpp"
#include "coach/counterfactual_coach.hpp"
#include "coach/plan_generator.hpp"
#include "common/logging.hpp"
#include "model/model_description.hpp"
#include "optimization/glpk_solver.hpp"
#include "scoring/scoring_model.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " --model <model.json> --request <request.json>"
                 " [--config <config.json>] [--plans N] [--model-constraints]"
                 " [--log-level debug|info|warn|error]\n";
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Cannot parse " + path + ": " + e.what());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string model_path;
    std::string request_path;
    std::string config_path;
    int plans = 0;
    bool model_constraints = false;
    gamcoach::logging::LogLevel level = gamcoach::logging::LogLevel::Warn;

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " expects a value");
            }
            return argv[++i];
        };

        try {
            if (arg == "--model") {
                model_path = next();
            } else if (arg == "--request") {
                request_path = next();
            } else if (arg == "--config") {
                config_path = next();
            } else if (arg == "--plans") {
                plans = std::stoi(next());
            } else if (arg == "--model-constraints") {
                model_constraints = true;
            } else if (arg == "--log-level") {
                const std::string value = next();
                auto parsed = gamcoach::logging::parseLevel(value);
                if (!parsed) throw std::invalid_argument("Unknown log level: " + value);
                level = *parsed;
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (model_path.empty() || request_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    gamcoach::logging::initLogging("gamcoach-cli", level);

    try {
        gamcoach::ScoringModel model(gamcoach::ModelDescription::loadFile(model_path));
        const nlohmann::json request_json = readJsonFile(request_path);

        gamcoach::CoachConfig coach_config;
        gamcoach::SolverConfig solver_config;
        if (!config_path.empty()) {
            const nlohmann::json config = readJsonFile(config_path);
            if (config.contains("coach")) coach_config = gamcoach::CoachConfig::fromJson(config["coach"]);
            if (config.contains("solver")) solver_config = gamcoach::SolverConfig::fromJson(config["solver"]);
        }

        gamcoach::CfRequest request = gamcoach::CfRequest::fromJson(request_json, model);
        if (model_constraints) {
            gamcoach::PlanConstraints::fromModel(model, request.sample).applyTo(request);
        }

        gamcoach::GlpkSolver solver(solver_config);
        gamcoach::CounterfactualCoach coach(model, solver, coach_config);

        if (plans > 0) {
            gamcoach::PlanGenerator generator(coach, plans);
            std::cout << generator.generate(request).toJson(model).dump(2) << "\n";
        } else {
            std::cout << coach.generateCfs(request).toJson(model).dump(2) << "\n";
        }
    } catch (const std::exception& e) {
        GCLOG_ERROR("cli", "main", "run_failed", (nlohmann::json{{"error", e.what()}}));
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
