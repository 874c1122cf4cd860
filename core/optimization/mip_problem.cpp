#include "optimization/mip_problem.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gamcoach {

namespace {

std::string boundTypeToString(BoundType type) {
    switch (type) {
        case BoundType::Upper:  return "up";
        case BoundType::Lower:  return "lo";
        case BoundType::Double: return "db";
        case BoundType::Fixed:  return "fx";
    }
    return "up";
}

BoundType parseBoundType(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        // GLPK numeric codes: GLP_LO=2, GLP_UP=3, GLP_DB=4, GLP_FX=5
        switch (value.get<int>()) {
            case 2: return BoundType::Lower;
            case 3: return BoundType::Upper;
            case 4: return BoundType::Double;
            case 5: return BoundType::Fixed;
            default: break;
        }
        throw std::invalid_argument("Unsupported bound type code: " + value.dump());
    }
    const std::string s = value.get<std::string>();
    if (s == "up") return BoundType::Upper;
    if (s == "lo") return BoundType::Lower;
    if (s == "db") return BoundType::Double;
    if (s == "fx") return BoundType::Fixed;
    throw std::invalid_argument("Unsupported bound type: " + s);
}

nlohmann::json termsToJson(const std::vector<LinearTerm>& terms) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& t : terms) {
        out.push_back({{"name", t.name}, {"coef", t.coef}});
    }
    return out;
}

std::vector<LinearTerm> termsFromJson(const nlohmann::json& j) {
    std::vector<LinearTerm> out;
    for (const auto& t : j) {
        out.push_back({t.at("name").get<std::string>(), t.at("coef").get<double>()});
    }
    return out;
}

double activity(const std::vector<LinearTerm>& terms,
                const std::unordered_map<std::string, double>& assignment) {
    double sum = 0.0;
    for (const auto& t : terms) {
        auto it = assignment.find(t.name);
        if (it != assignment.end()) {
            sum += t.coef * it->second;
        }
    }
    return sum;
}

} // namespace

bool RowBounds::admits(double value, double tolerance) const {
    switch (type) {
        case BoundType::Upper:  return value <= ub + tolerance;
        case BoundType::Lower:  return value >= lb - tolerance;
        case BoundType::Double: return value >= lb - tolerance && value <= ub + tolerance;
        case BoundType::Fixed:  return std::abs(value - lb) <= tolerance;
    }
    return false;
}

nlohmann::json MipProblem::toJson() const {
    nlohmann::json j;
    j["name"] = name;
    j["objective"] = {
        {"direction", direction == ObjectiveDirection::Minimize ? "min" : "max"},
        {"name", "obj"},
        {"vars", termsToJson(objective)}
    };

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& c : subject_to) {
        rows.push_back({
            {"name", c.name},
            {"vars", termsToJson(c.vars)},
            {"bnds", {{"type", boundTypeToString(c.bounds.type)},
                      {"lb", c.bounds.lb},
                      {"ub", c.bounds.ub}}}
        });
    }
    j["subjectTo"] = rows;
    j["binaries"] = binaries;

    nlohmann::json bnds = nlohmann::json::array();
    for (const auto& b : bounds) {
        bnds.push_back({{"name", b.name}, {"type", "db"}, {"lb", b.lb}, {"ub", b.ub}});
    }
    j["bounds"] = bnds;
    return j;
}

MipProblem MipProblem::fromJson(const nlohmann::json& j) {
    MipProblem p;
    try {
        p.name = j.value("name", std::string());
        const auto& obj = j.at("objective");
        const std::string dir = obj.value("direction", std::string("min"));
        p.direction = (dir == "max") ? ObjectiveDirection::Maximize : ObjectiveDirection::Minimize;
        p.objective = termsFromJson(obj.at("vars"));

        for (const auto& row : j.at("subjectTo")) {
            MipConstraint c;
            c.name = row.value("name", std::string());
            c.vars = termsFromJson(row.at("vars"));
            const auto& b = row.at("bnds");
            c.bounds.type = parseBoundType(b.at("type"));
            c.bounds.lb = b.value("lb", 0.0);
            c.bounds.ub = b.value("ub", 0.0);
            p.subject_to.push_back(std::move(c));
        }

        if (j.contains("binaries")) {
            p.binaries = j["binaries"].get<std::vector<std::string>>();
        }
        if (j.contains("bounds")) {
            for (const auto& b : j["bounds"]) {
                p.bounds.push_back({b.at("name").get<std::string>(),
                                    b.value("lb", 0.0), b.value("ub", 1.0)});
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed problem record: ") + e.what());
    }
    return p;
}

double MipProblem::evaluate(const std::unordered_map<std::string, double>& assignment) const {
    return activity(objective, assignment);
}

std::vector<std::string> MipProblem::violations(
    const std::unordered_map<std::string, double>& assignment, double tolerance) const {
    std::vector<std::string> out;
    for (const auto& c : subject_to) {
        if (!c.bounds.admits(activity(c.vars, assignment), tolerance)) {
            out.push_back(c.name);
        }
    }
    return out;
}

// ─── Solve Result ─────────────────────────────────────────────

std::string solveStatusToString(SolveStatus status) {
    switch (status) {
        case SolveStatus::Optimal:         return "optimal";
        case SolveStatus::Feasible:        return "feasible";
        case SolveStatus::Infeasible:      return "infeasible";
        case SolveStatus::Unbounded:       return "unbounded";
        case SolveStatus::Undefined:       return "undefined";
        case SolveStatus::BudgetExhausted: return "budget_exhausted";
    }
    return "undefined";
}

SolveStatus parseSolveStatus(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        // GLPK codes: GLP_UNDEF=1, GLP_FEAS=2, GLP_INFEAS=3, GLP_NOFEAS=4,
        // GLP_OPT=5, GLP_UNBND=6
        switch (value.get<int>()) {
            case 2: return SolveStatus::Feasible;
            case 3:
            case 4: return SolveStatus::Infeasible;
            case 5: return SolveStatus::Optimal;
            case 6: return SolveStatus::Unbounded;
            default: return SolveStatus::Undefined;
        }
    }
    if (!value.is_string()) return SolveStatus::Undefined;

    const std::string s = value.get<std::string>();
    if (s == "optimal") return SolveStatus::Optimal;
    if (s == "feasible") return SolveStatus::Feasible;
    if (s == "infeasible") return SolveStatus::Infeasible;
    if (s == "unbounded") return SolveStatus::Unbounded;
    if (s == "budget_exhausted") return SolveStatus::BudgetExhausted;
    return SolveStatus::Undefined;
}

std::vector<std::string> SolveResult::activeVariables() const {
    std::vector<std::string> out;
    for (const auto& [name, value] : assignment) {
        if (std::round(value) == 1.0) {
            out.push_back(name);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

nlohmann::json SolveResult::toJson() const {
    nlohmann::json vars = nlohmann::json::object();
    for (const auto& [name, value] : assignment) {
        vars[name] = value;
    }
    return {
        {"status", solveStatusToString(status)},
        {"variableAssignment", vars},
        {"objectiveValue", objective_value}
    };
}

SolveResult SolveResult::fromJson(const nlohmann::json& j) {
    SolveResult r;
    try {
        r.status = parseSolveStatus(j.at("status"));
        if (j.contains("variableAssignment")) {
            for (const auto& [name, value] : j["variableAssignment"].items()) {
                r.assignment[name] = value.get<double>();
            }
        }
        r.objective_value = j.value("objectiveValue", 0.0);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed solver reply: ") + e.what());
    }
    return r;
}

} // namespace gamcoach
