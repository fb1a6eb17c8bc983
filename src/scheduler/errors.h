#pragma once

#include "scheduler/stage.h"

#include <stdexcept>
#include <string>

namespace lexsched
{
    class SchedulingError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Catalog referential-integrity or record-shape violation.
    class LoadError : public SchedulingError
    {
    public:
        using SchedulingError::SchedulingError;
    };

    class ConfigError : public SchedulingError
    {
    public:
        using SchedulingError::SchedulingError;
    };

    // Raised by a solver adapter that cannot process a model.
    class SolverError : public SchedulingError
    {
    public:
        using SchedulingError::SchedulingError;
    };

    /**
     * Failure of one stage of a lexicographic run. The context names the
     * stage, the objective attempted there and every objective value solved
     * before it.
     */
    class StageError : public SchedulingError
    {
    public:
        StageError(const std::string &what, FailureContext context);

        const FailureContext &context() const noexcept { return context_; }
        std::size_t stage() const noexcept { return context_.stage; }
        virtual const char *kind() const noexcept = 0;

    private:
        FailureContext context_;
    };

    // The hard constraints alone admit no solution.
    class InfeasibleModelError : public StageError
    {
    public:
        using StageError::StageError;
        const char *kind() const noexcept override { return "infeasible_model"; }
    };

    // A stage became infeasible because of a bound frozen by an earlier stage.
    class StagedInfeasibilityError : public StageError
    {
    public:
        StagedInfeasibilityError(const std::string &what, FailureContext context,
                                 std::size_t frozen_stage, double frozen_bound);

        std::size_t frozen_stage() const noexcept { return frozen_stage_; }
        double frozen_bound() const noexcept { return frozen_bound_; }
        const char *kind() const noexcept override { return "staged_infeasibility"; }

    private:
        std::size_t frozen_stage_;
        double frozen_bound_;
    };

    class SolverTimeoutError : public StageError
    {
    public:
        using StageError::StageError;
        const char *kind() const noexcept override { return "solver_timeout"; }
    };

    class PluginEvaluationError : public StageError
    {
    public:
        PluginEvaluationError(const std::string &what, FailureContext context, std::string plugin);

        const std::string &plugin() const noexcept { return plugin_; }
        const char *kind() const noexcept override { return "plugin_evaluation"; }

    private:
        std::string plugin_;
    };

    // Unbounded objective or adapter failure while solving a stage.
    class SolverFailureError : public StageError
    {
    public:
        using StageError::StageError;
        const char *kind() const noexcept override { return "solver_failure"; }
    };
}
