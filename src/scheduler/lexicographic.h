#pragma once

#include "scheduler/errors.h"
#include "scheduler/model.h"
#include "scheduler/objectives.h"
#include "scheduler/schedule.h"
#include "scheduler/solver.h"
#include "scheduler/stage.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lexsched
{
    enum class EngineState
    {
        Idle,
        Solving,
        Constraining,
        Done,
        Failed
    };

    std::string state_name(EngineState state);

    struct LexicographicResult
    {
        Schedule schedule;
        std::vector<StageOutcome> stages;
        std::vector<std::int64_t> values; // final assignment, one per model variable
    };

    /**
     * Sequential multi-objective optimization over a fixed base model.
     *
     * For objective i (1-based): solve with Oi as the objective, record its
     * optimum vi, then append
     *   minimize: expr(Oi) <= vi + tol*|vi|
     *   maximize: expr(Oi) >= vi - tol*|vi|
     * before solving Oi+1. The first failing stage aborts the run.
     *
     * Each optimize() call works on a fresh copy of the base model; the copy
     * from the latest call stays available through last_model().
     */
    class LexicographicEngine
    {
    public:
        LexicographicEngine(const Catalog &catalog, const AssignmentSpace &space,
                            const Model &base, SolverAdapter &solver);

        LexicographicResult optimize(const std::vector<ObjectivePtr> &objectives);

        EngineState state() const { return state_; }
        std::size_t stage() const { return stage_; }
        const Model &last_model() const { return model_; }

        // bound frozen for later stages after an optimum of value
        static double frozen_bound(Sense sense, double value, double tolerance);

    private:
        LexicographicResult satisfy();
        FailureContext failure(const std::string &objective_name) const;
        [[noreturn]] void fail_solve(SolverStatus status, const std::string &objective_name);

        const Catalog &catalog_;
        const AssignmentSpace &space_;
        const Model &base_;
        SolverAdapter &solver_;

        Model model_;
        EngineState state_ = EngineState::Idle;
        std::size_t stage_ = 0;
        std::vector<StageOutcome> completed_;
    };
}
