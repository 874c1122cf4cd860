#pragma once

#include "optimization/mip_problem.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace gamcoach {

// ─── MIP Solver ───────────────────────────────────────────────
// Collaborator that solves one problem record. Implementations report
// anything short of a proven optimum through SolveResult::status rather
// than by throwing.

class MipSolver {
public:
    virtual ~MipSolver() = default;

    virtual SolveResult solve(const MipProblem& problem) = 0;

    /// Human-readable name of this solver.
    virtual std::string name() const = 0;
};

// ─── JSON Transport Solver ────────────────────────────────────
// Bridges to an external solver service that speaks the JSON problem
// record. The transport sends the request and blocks for the reply.

class JsonTransportSolver : public MipSolver {
public:
    using Transport = std::function<nlohmann::json(const nlohmann::json& request)>;

    explicit JsonTransportSolver(Transport transport) : transport_(std::move(transport)) {}

    SolveResult solve(const MipProblem& problem) override;
    std::string name() const override { return "json_transport"; }

private:
    Transport transport_;
};

} // namespace gamcoach
