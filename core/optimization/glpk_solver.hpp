#pragma once

#include "optimization/solver.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace gamcoach {

/// Limits and switches of one GLPK branch-and-cut run.
struct SolverConfig {
    double time_limit_seconds = 30.0;  // <= 0: no limit
    double mip_gap = 0.0;              // relative gap accepted as optimal
    bool presolve = true;
    bool verbose = false;              // GLPK terminal output

    nlohmann::json toJson() const;
    static SolverConfig fromJson(const nlohmann::json& j);
};

// ─── GLPK Solver ──────────────────────────────────────────────
// Loads a problem record into a GLPK problem object and runs its
// branch-and-cut MIP driver. Binaries become GLP_BV columns, entries of
// `bounds` become continuous double-bounded columns, and any other
// variable is continuous and non-negative.
//
// Solver outcomes are reported through SolveResult::status. Only records
// GLPK cannot load (non-finite coefficients or bounds) throw.

class GlpkSolver : public MipSolver {
public:
    explicit GlpkSolver(SolverConfig config = {}) : config_(config) {}

    SolveResult solve(const MipProblem& problem) override;
    std::string name() const override { return "glpk"; }

    const SolverConfig& config() const { return config_; }

private:
    SolverConfig config_;
};

} // namespace gamcoach
