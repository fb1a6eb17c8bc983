#include "scheduler/lexicographic.h"

#include <trantor/utils/Logger.h>

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace std;

namespace lexsched
{
    string state_name(EngineState state)
    {
        switch (state)
        {
        case EngineState::Idle:
            return "idle";
        case EngineState::Solving:
            return "solving";
        case EngineState::Constraining:
            return "constraining";
        case EngineState::Done:
            return "done";
        case EngineState::Failed:
            return "failed";
        }
        return "unknown";
    }

    LexicographicEngine::LexicographicEngine(const Catalog &catalog, const AssignmentSpace &space,
                                             const Model &base, SolverAdapter &solver)
        : catalog_(catalog), space_(space), base_(base), solver_(solver), model_(base)
    {
    }

    double LexicographicEngine::frozen_bound(Sense sense, double value, double tolerance)
    {
        // |value| keeps the bound on the relaxing side for negative optima too
        double slack = tolerance * fabs(value);
        return sense == Sense::Minimize ? value + slack : value - slack;
    }

    FailureContext LexicographicEngine::failure(const string &objective_name) const
    {
        FailureContext fc;
        fc.stage = stage_;
        fc.objective_name = objective_name;
        fc.completed = completed_;
        return fc;
    }

    void LexicographicEngine::fail_solve(SolverStatus status, const string &objective_name)
    {
        state_ = EngineState::Failed;
        LOG_DEBUG << "Engine " << state_name(state_) << " at stage " << stage_ << " (" << status_name(status) << ")";
        ostringstream where;
        where << "stage " << stage_ << " (" << (objective_name.empty() ? "constraint satisfaction" : objective_name) << ")";

        switch (status)
        {
        case SolverStatus::Infeasible:
            if (stage_ <= 1 || completed_.empty())
            {
                throw InfeasibleModelError("Hard constraints admit no solution at " + where.str(),
                                           failure(objective_name));
            }
            else
            {
                const StageOutcome &prev = completed_.back();
                ostringstream msg;
                msg << "Stage " << stage_ << " (" << objective_name << ") is infeasible under the bound frozen by stage "
                    << prev.index << " (" << prev.name << "): expression "
                    << (prev.sense == Sense::Minimize ? "<= " : ">= ") << prev.bound
                    << " with tolerance " << prev.tolerance;
                throw StagedInfeasibilityError(msg.str(), failure(objective_name), prev.index, prev.bound);
            }
        case SolverStatus::Timeout:
            throw SolverTimeoutError("Solver exceeded its resource budget at " + where.str(), failure(objective_name));
        case SolverStatus::Unbounded:
            throw SolverFailureError("Objective is unbounded at " + where.str(), failure(objective_name));
        case SolverStatus::Optimal:
            break;
        }
        throw SolverFailureError("Solver returned an unexpected status at " + where.str(), failure(objective_name));
    }

    LexicographicResult LexicographicEngine::satisfy()
    {
        stage_ = 0;
        state_ = EngineState::Solving;
        model_.clear_objective();

        SolveResult result;
        try
        {
            result = solver_.solve(model_);
        }
        catch (const SolverError &e)
        {
            state_ = EngineState::Failed;
            throw SolverFailureError(string("Solver failed on the base model: ") + e.what(), failure(""));
        }
        if (result.status != SolverStatus::Optimal)
            fail_solve(result.status, "");
        if (!result.values)
        {
            state_ = EngineState::Failed;
            throw SolverFailureError("Solver reported a solution without an assignment", failure(""));
        }

        state_ = EngineState::Done;
        LexicographicResult out;
        out.values = std::move(*result.values);
        out.schedule = Schedule::from_solution(catalog_, space_, out.values);
        return out;
    }

    LexicographicResult LexicographicEngine::optimize(const vector<ObjectivePtr> &objectives)
    {
        for (const auto &o : objectives)
            if (!o)
                throw invalid_argument("optimize: null objective plugin");

        // fresh run from the same base
        model_ = base_;
        completed_.clear();
        stage_ = 0;
        state_ = EngineState::Idle;

        if (objectives.empty())
        {
            LOG_WARN << "No objectives specified, using constraint satisfaction only";
            return satisfy();
        }

        const size_t n = objectives.size();
        LOG_INFO << "=== Lexicographic optimization: " << n << " objectives ===";

        vector<int64_t> best;
        for (size_t i = 0; i < n; ++i)
        {
            const ObjectivePlugin &objective = *objectives[i];
            const string &name = objective.name();
            stage_ = i + 1;
            state_ = EngineState::Solving;
            LOG_INFO << "[" << stage_ << "/" << n << "] Optimizing: " << name;

            LinearExpression expr;
            try
            {
                ModelContext context(catalog_, space_, model_, stage_);
                expr = objective.evaluate(context);
            }
            catch (const exception &e)
            {
                state_ = EngineState::Failed;
                throw PluginEvaluationError("Objective '" + name + "' failed at stage " + std::to_string(stage_) + ": " + e.what(),
                                            failure(name), name);
            }

            model_.set_objective(expr, objective.sense());
            const size_t constraint_count = model_.constraints().size();

            SolveResult result;
            try
            {
                result = solver_.solve(model_);
            }
            catch (const SolverError &e)
            {
                state_ = EngineState::Failed;
                throw SolverFailureError("Solver failed at stage " + std::to_string(stage_) + ": " + e.what(), failure(name));
            }

            if (result.status != SolverStatus::Optimal)
            {
                LOG_ERROR << "  No solution found (status: " << status_name(result.status) << ")";
                fail_solve(result.status, name);
            }
            if (!result.values)
            {
                state_ = EngineState::Failed;
                throw SolverFailureError("Solver reported optimal without an assignment at stage " + std::to_string(stage_),
                                         failure(name));
            }

            const double value = result.objective_value ? *result.objective_value
                                                        : static_cast<double>(expr.evaluate(*result.values));
            best = *result.values;
            LOG_INFO << "  Optimal value: " << value;

            // ---------- freeze ----------
            state_ = EngineState::Constraining;
            StageOutcome outcome;
            outcome.index = stage_;
            outcome.name = name;
            outcome.sense = objective.sense();
            outcome.value = value;
            outcome.tolerance = objective.tolerance();
            outcome.bound = frozen_bound(objective.sense(), value, objective.tolerance());
            outcome.constraint_count = constraint_count;

            // the last objective constrains nothing
            if (i + 1 < n)
            {
                string lock_name = "lock_objective_" + std::to_string(stage_);
                if (objective.sense() == Sense::Minimize)
                    model_.add_constraint(make_less_or_equal(lock_name, expr, outcome.bound));
                else
                    model_.add_constraint(make_greater_or_equal(lock_name, expr, outcome.bound));
                outcome.frozen = true;
                LOG_DEBUG << "    " << describe(model_.constraints().back());

                if (objective.tolerance() > 0.0)
                    LOG_INFO << "    Constraining: value " << (objective.sense() == Sense::Minimize ? "<= " : ">= ")
                             << outcome.bound << " (tolerance: " << objective.tolerance() * 100.0 << "%)";
                else
                    LOG_INFO << "    Constraining: value " << (objective.sense() == Sense::Minimize ? "<= " : ">= ")
                             << outcome.bound;
            }
            completed_.push_back(outcome);
        }

        state_ = EngineState::Done;
        LOG_INFO << "=== Optimization complete ===";

        LexicographicResult out;
        out.schedule = Schedule::from_solution(catalog_, space_, best);
        out.stages = completed_;
        out.values = std::move(best);
        return out;
    }
}
