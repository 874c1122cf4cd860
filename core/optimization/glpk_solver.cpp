#include "optimization/glpk_solver.hpp"
#include "common/logging.hpp"

#include <glpk.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace gamcoach {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

struct ProblemDeleter {
    void operator()(glp_prob* lp) const { glp_delete_prob(lp); }
};
using ProblemPtr = std::unique_ptr<glp_prob, ProblemDeleter>;

struct ColumnSpec {
    double lo = 0.0;
    double hi = kInf;
    bool binary = false;
};

void requireNumber(double value, const std::string& what) {
    if (std::isnan(value)) {
        throw std::invalid_argument(what + " is NaN");
    }
}

void requireFinite(double value, const std::string& what) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(what + " must be finite");
    }
}

/// GLPK bound type for an interval whose missing ends are infinite.
int boundType(double lo, double hi) {
    const bool has_lo = std::isfinite(lo);
    const bool has_hi = std::isfinite(hi);
    if (has_lo && has_hi) return lo == hi ? GLP_FX : GLP_DB;
    if (has_lo) return GLP_LO;
    if (has_hi) return GLP_UP;
    return GLP_FR;
}

std::pair<double, double> rowInterval(const RowBounds& b) {
    switch (b.type) {
        case BoundType::Upper:  return {-kInf, b.ub};
        case BoundType::Lower:  return {b.lb, kInf};
        case BoundType::Double: return {b.lb, b.ub};
        case BoundType::Fixed:  return {b.lb, b.lb};
    }
    return {-kInf, kInf};
}

SolveStatus fromMipStatus(int status) {
    switch (status) {
        case GLP_OPT:    return SolveStatus::Optimal;
        case GLP_FEAS:   return SolveStatus::Feasible;
        case GLP_NOFEAS: return SolveStatus::Infeasible;
        default:         return SolveStatus::Undefined;
    }
}

} // namespace

nlohmann::json SolverConfig::toJson() const {
    return {
        {"timeLimitSeconds", time_limit_seconds},
        {"mipGap", mip_gap},
        {"presolve", presolve},
        {"verbose", verbose}
    };
}

SolverConfig SolverConfig::fromJson(const nlohmann::json& j) {
    SolverConfig c;
    c.time_limit_seconds = j.value("timeLimitSeconds", c.time_limit_seconds);
    c.mip_gap = j.value("mipGap", c.mip_gap);
    c.presolve = j.value("presolve", c.presolve);
    c.verbose = j.value("verbose", c.verbose);
    if (c.mip_gap < 0.0) {
        throw std::invalid_argument("mipGap must not be negative");
    }
    return c;
}

SolveResult GlpkSolver::solve(const MipProblem& problem) {
    const auto started = std::chrono::steady_clock::now();
    SolveResult result;

    // ── Columns ──
    std::vector<std::string> names;
    std::unordered_map<std::string, int> index;
    std::vector<ColumnSpec> specs;
    auto column = [&](const std::string& name) {
        auto it = index.find(name);
        if (it != index.end()) return it->second;
        names.push_back(name);
        specs.emplace_back();
        const int j = static_cast<int>(names.size());
        index.emplace(name, j);
        return j;
    };

    for (const auto& name : problem.binaries) {
        specs[column(name) - 1].binary = true;
    }
    for (const auto& b : problem.bounds) {
        requireNumber(b.lb, "Lower bound of " + b.name);
        requireNumber(b.ub, "Upper bound of " + b.name);
        ColumnSpec& spec = specs[column(b.name) - 1];
        spec.lo = b.lb;
        spec.hi = b.ub;
    }
    for (const auto& t : problem.objective) column(t.name);
    for (const auto& c : problem.subject_to) {
        for (const auto& t : c.vars) column(t.name);
    }

    bool empty_domain = false;
    for (auto& spec : specs) {
        if (spec.binary) {
            spec.lo = std::ceil(std::max(spec.lo, 0.0));
            spec.hi = std::floor(std::min(spec.hi, 1.0));
        }
        if (spec.lo > spec.hi) empty_domain = true;
    }

    if (names.empty() || empty_domain) {
        // Nothing to load: only term-free rows can still be violated.
        bool feasible = !empty_domain;
        for (const auto& c : problem.subject_to) {
            if (!c.bounds.admits(0.0)) feasible = false;
        }
        result.status = feasible ? SolveStatus::Optimal : SolveStatus::Infeasible;
        return result;
    }

    const int n = static_cast<int>(names.size());
    const int m = static_cast<int>(problem.subject_to.size());

    ProblemPtr lp(glp_create_prob());
    glp_set_obj_dir(lp.get(), problem.direction == ObjectiveDirection::Maximize ? GLP_MAX : GLP_MIN);

    glp_add_cols(lp.get(), n);
    for (int j = 1; j <= n; j++) {
        const ColumnSpec& spec = specs[j - 1];
        if (spec.binary) {
            glp_set_col_kind(lp.get(), j, GLP_BV);
        }
        glp_set_col_bnds(lp.get(), j, boundType(spec.lo, spec.hi), spec.lo, spec.hi);
    }

    std::vector<double> cost(n + 1, 0.0);
    for (const auto& t : problem.objective) {
        requireFinite(t.coef, "Objective coefficient of " + t.name);
        cost[index.at(t.name)] += t.coef;
    }
    for (int j = 1; j <= n; j++) {
        glp_set_obj_coef(lp.get(), j, cost[j]);
    }

    // ── Rows ──
    if (m > 0) glp_add_rows(lp.get(), m);
    for (int i = 1; i <= m; i++) {
        const MipConstraint& c = problem.subject_to[i - 1];

        std::map<int, double> merged;
        for (const auto& t : c.vars) {
            requireFinite(t.coef, "Coefficient of " + t.name + " in " + c.name);
            merged[index.at(t.name)] += t.coef;
        }
        // GLPK arrays are 1-based.
        std::vector<int> ind(1, 0);
        std::vector<double> val(1, 0.0);
        for (const auto& [j, coef] : merged) {
            if (coef == 0.0) continue;
            ind.push_back(j);
            val.push_back(coef);
        }
        const int len = static_cast<int>(ind.size()) - 1;
        if (len > 0) glp_set_mat_row(lp.get(), i, len, ind.data(), val.data());

        const auto [lo, hi] = rowInterval(c.bounds);
        requireNumber(lo, "Lower bound of " + c.name);
        requireNumber(hi, "Upper bound of " + c.name);
        if (lo > hi) {
            result.status = SolveStatus::Infeasible;
            return result;
        }
        glp_set_row_bnds(lp.get(), i, boundType(lo, hi), lo, hi);
    }

    const int msg_lev = config_.verbose ? GLP_MSG_ON : GLP_MSG_OFF;

    // Without the MIP presolver glp_intopt needs an optimal LP basis.
    if (!config_.presolve) {
        glp_smcp smcp;
        glp_init_smcp(&smcp);
        smcp.msg_lev = msg_lev;
        const int ret = glp_simplex(lp.get(), &smcp);
        const int lp_status = glp_get_status(lp.get());
        if (ret != 0 || lp_status != GLP_OPT) {
            if (ret == 0 && lp_status == GLP_NOFEAS) {
                result.status = SolveStatus::Infeasible;
            } else if (ret == 0 && lp_status == GLP_UNBND) {
                result.status = SolveStatus::Unbounded;
            } else {
                GCLOG_ERROR("optimization", "GlpkSolver::solve", "relaxation_failed",
                            (nlohmann::json{{"problem", problem.name},
                                            {"code", ret},
                                            {"lpStatus", lp_status}}));
                result.status = SolveStatus::Undefined;
            }
            return result;
        }
    }

    glp_iocp iocp;
    glp_init_iocp(&iocp);
    iocp.msg_lev = msg_lev;
    iocp.presolve = config_.presolve ? GLP_ON : GLP_OFF;
    iocp.mip_gap = config_.mip_gap;
    if (config_.time_limit_seconds > 0.0) {
        const double ms = std::min(config_.time_limit_seconds * 1000.0,
                                   static_cast<double>(INT_MAX));
        iocp.tm_lim = std::max(1, static_cast<int>(ms));
    }

    const int ret = glp_intopt(lp.get(), &iocp);
    const int mip_status = glp_mip_status(lp.get());
    switch (ret) {
        case 0:
            result.status = fromMipStatus(mip_status);
            break;
        case GLP_ENOPFS:
            result.status = SolveStatus::Infeasible;
            break;
        case GLP_ENODFS:
            result.status = SolveStatus::Unbounded;
            break;
        case GLP_EMIPGAP:
            result.status = mip_status == GLP_FEAS ? SolveStatus::Optimal : SolveStatus::BudgetExhausted;
            break;
        case GLP_ETMLIM:
        case GLP_ESTOP:
            result.status = mip_status == GLP_FEAS ? SolveStatus::Feasible : SolveStatus::BudgetExhausted;
            GCLOG_WARN("optimization", "GlpkSolver::solve", "time_limit_reached",
                       (nlohmann::json{{"problem", problem.name},
                                       {"timeLimitSeconds", config_.time_limit_seconds},
                                       {"incumbent", mip_status == GLP_FEAS}}));
            break;
        default:
            GCLOG_ERROR("optimization", "GlpkSolver::solve", "intopt_failed",
                        (nlohmann::json{{"problem", problem.name}, {"code", ret}}));
            result.status = SolveStatus::Undefined;
            break;
    }

    if (result.status == SolveStatus::Optimal || result.status == SolveStatus::Feasible) {
        for (int j = 1; j <= n; j++) {
            double value = glp_mip_col_val(lp.get(), j);
            if (specs[j - 1].binary) value = std::round(value);
            result.assignment[names[j - 1]] = value;
        }
        result.objective_value = glp_mip_obj_val(lp.get());
    }

    const double seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    GCLOG_DEBUG("optimization", "GlpkSolver::solve", "solve_finished",
                (nlohmann::json{{"problem", problem.name},
                                {"columns", n},
                                {"rows", m},
                                {"status", solveStatusToString(result.status)},
                                {"seconds", seconds}}));
    return result;
}

} // namespace gamcoach
