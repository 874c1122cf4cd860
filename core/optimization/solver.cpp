#include "optimization/solver.hpp"
#include "common/logging.hpp"

#include <stdexcept>

namespace gamcoach {

SolveResult JsonTransportSolver::solve(const MipProblem& problem) {
    const nlohmann::json request = problem.toJson();
    const nlohmann::json reply = transport_(request);

    try {
        return SolveResult::fromJson(reply);
    } catch (const std::invalid_argument& e) {
        GCLOG_ERROR("optimization", "JsonTransportSolver::solve", "malformed_solver_reply",
                    (nlohmann::json{{"error", e.what()}, {"problem", problem.name}}));
    }
    SolveResult failed;
    failed.status = SolveStatus::Undefined;
    return failed;
}

} // namespace gamcoach
