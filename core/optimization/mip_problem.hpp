#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace gamcoach {

// ─── Problem Record ───────────────────────────────────────────
// Solver-neutral description of a linear program with binary
// variables. Serializes to the JSON record exchanged with external
// solver services:
//
//   {name, objective: {direction, name, vars: [{name, coef}]},
//    subjectTo: [{name, vars: [{name, coef}], bnds: {type, lb, ub}}],
//    binaries: [name], bounds: [{name, type, lb, ub}]}
//
// Bound types follow GLPK: "up" (<= ub), "lo" (>= lb), "db" (both),
// "fx" (== lb).

struct LinearTerm {
    std::string name;
    double coef = 0.0;
};

enum class BoundType {
    Upper,
    Lower,
    Double,
    Fixed
};

struct RowBounds {
    BoundType type = BoundType::Upper;
    double lb = 0.0;
    double ub = 0.0;

    static RowBounds upper(double ub) { return {BoundType::Upper, 0.0, ub}; }
    static RowBounds lower(double lb) { return {BoundType::Lower, lb, 0.0}; }
    static RowBounds between(double lb, double ub) { return {BoundType::Double, lb, ub}; }

    /// Whether a row activity satisfies the bounds, within tolerance.
    bool admits(double activity, double tolerance = 1e-9) const;
};

struct MipConstraint {
    std::string name;
    std::vector<LinearTerm> vars;
    RowBounds bounds;
};

struct VariableBounds {
    std::string name;
    double lb = 0.0;
    double ub = 1.0;
};

enum class ObjectiveDirection {
    Minimize,
    Maximize
};

struct MipProblem {
    std::string name;
    ObjectiveDirection direction = ObjectiveDirection::Minimize;
    std::vector<LinearTerm> objective;
    std::vector<MipConstraint> subject_to;
    std::vector<std::string> binaries;
    std::vector<VariableBounds> bounds;

    nlohmann::json toJson() const;
    static MipProblem fromJson(const nlohmann::json& j);

    /// Objective value of an assignment. Missing variables count as 0.
    double evaluate(const std::unordered_map<std::string, double>& assignment) const;

    /// Names of constraints violated by an assignment.
    std::vector<std::string> violations(const std::unordered_map<std::string, double>& assignment,
                                        double tolerance = 1e-6) const;
};

// ─── Solve Result ─────────────────────────────────────────────

enum class SolveStatus {
    Optimal,
    Feasible,         // incumbent found but optimality not proven
    Infeasible,
    Unbounded,
    Undefined,
    BudgetExhausted   // no incumbent before the budget ran out
};

std::string solveStatusToString(SolveStatus status);
SolveStatus parseSolveStatus(const nlohmann::json& value);

struct SolveResult {
    SolveStatus status = SolveStatus::Undefined;
    std::unordered_map<std::string, double> assignment;
    double objective_value = 0.0;

    bool isOptimal() const { return status == SolveStatus::Optimal; }

    /// Variables set to 1 (rounded), in name order.
    std::vector<std::string> activeVariables() const;

    nlohmann::json toJson() const;
    static SolveResult fromJson(const nlohmann::json& j);
};

} // namespace gamcoach
