#include "scheduler/cp_sat_solver.h"
#include "scheduler/errors.h"

#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model_solver.h"

#include <trantor/utils/Logger.h>

#include <cmath>
#include <sstream>

namespace sat = operations_research::sat;
using namespace std;

namespace lexsched
{
    namespace
    {
        constexpr double EPS = 1e-9;

        sat::LinearExpr to_cp_expr(const LinearExpression &expression, const vector<sat::BoolVar> &vars)
        {
            sat::LinearExpr expr(expression.constant());
            for (const auto &t : expression.terms())
                expr += sat::LinearExpr(vars.at(t.var)) * t.coeff;
            return expr;
        }

        // Expressions have integer coefficients over binaries, so a real bound
        // can be tightened to the nearest integer without losing solutions.
        void add_constraint(sat::CpModelBuilder &builder, const LinearConstraint &c, const vector<sat::BoolVar> &vars)
        {
            sat::LinearExpr expr = to_cp_expr(c.expression, vars);
            switch (c.relation)
            {
            case Relation::LessOrEqual:
                builder.AddLessOrEqual(expr, static_cast<int64_t>(floor(c.rhs + EPS))).WithName(c.name);
                break;
            case Relation::GreaterOrEqual:
                builder.AddGreaterOrEqual(expr, static_cast<int64_t>(ceil(c.rhs - EPS))).WithName(c.name);
                break;
            case Relation::Equal:
            {
                double rounded = round(c.rhs);
                if (fabs(rounded - c.rhs) > EPS)
                    throw SolverError("Equality '" + c.name + "' has a non-integral right-hand side");
                builder.AddEquality(expr, static_cast<int64_t>(rounded)).WithName(c.name);
                break;
            }
            }
        }
    } // anonymous namespace

    string sat_parameters_text(const SolverOptions &options)
    {
        ostringstream oss;
        oss << "max_time_in_seconds:" << options.max_time_in_seconds
            << " num_search_workers:" << options.num_search_workers
            << " log_search_progress:" << (options.log_search_progress ? "true" : "false");
        return oss.str();
    }

    CpSatSolver::CpSatSolver(SolverOptions options)
        : options_(options)
    {
        if (options_.max_time_in_seconds <= 0.0)
            throw invalid_argument("max_time_in_seconds must be positive");
        if (options_.num_search_workers < 1)
            throw invalid_argument("num_search_workers must be at least 1");
    }

    SolveResult CpSatSolver::solve(const Model &model)
    {
        sat::CpModelBuilder builder;

        // ---------- Variables ----------
        vector<sat::BoolVar> vars;
        vars.reserve(model.variable_count());
        for (VarIndex i = 0; i < model.variable_count(); ++i)
            vars.push_back(builder.NewBoolVar().WithName(model.variable_name(i)));

        // ---------- Constraints ----------
        for (const auto &c : model.constraints())
            add_constraint(builder, c, vars);

        // ---------- Objective ----------
        if (model.has_objective())
        {
            sat::LinearExpr objective = to_cp_expr(model.objective(), vars);
            if (model.objective_sense() == Sense::Minimize)
                builder.Minimize(objective);
            else
                builder.Maximize(objective);
        }

        // ---------- Solve with solver parameters ----------
        sat::Model sat_model;
        sat_model.Add(sat::NewSatParameters(sat_parameters_text(options_)));

        const sat::CpSolverResponse response = sat::SolveCpModel(builder.Build(), &sat_model);

        LOG_DEBUG << "CP-SAT status: " << sat::CpSolverStatus_Name(response.status())
                  << ", wall time " << response.wall_time() << "s";

        SolveResult result;
        switch (response.status())
        {
        case sat::CpSolverStatus::OPTIMAL:
        {
            result.status = SolverStatus::Optimal;
            vector<int64_t> values(vars.size(), 0);
            for (size_t i = 0; i < vars.size(); ++i)
                values[i] = sat::SolutionBooleanValue(response, vars[i]) ? 1 : 0;
            result.values = std::move(values);
            if (model.has_objective())
                result.objective_value = response.objective_value();
            break;
        }
        case sat::CpSolverStatus::INFEASIBLE:
            result.status = SolverStatus::Infeasible;
            break;
        case sat::CpSolverStatus::FEASIBLE:
        case sat::CpSolverStatus::UNKNOWN:
            // limit reached before optimality was proven
            result.status = SolverStatus::Timeout;
            break;
        case sat::CpSolverStatus::MODEL_INVALID:
            throw SolverError("CP-SAT rejected the model as invalid");
        default:
            throw SolverError("Unexpected CP-SAT status: " + sat::CpSolverStatus_Name(response.status()));
        }
        return result;
    }
}
