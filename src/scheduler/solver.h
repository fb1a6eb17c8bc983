#pragma once

#include "scheduler/model.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lexsched
{
    enum class SolverStatus
    {
        Optimal,
        Infeasible,
        Unbounded,
        Timeout
    };

    std::string status_name(SolverStatus status);

    struct SolveResult
    {
        SolverStatus status = SolverStatus::Infeasible;
        std::optional<std::vector<std::int64_t>> values; // one per model variable, iff optimal
        std::optional<double> objective_value;           // iff optimal and the model has an objective
    };

    /**
     * Opaque ILP solving capability. solve() reads the model's variables,
     * constraint log and objective; it must not keep the model beyond the call.
     * Adapters throw SolverError when they cannot process a model at all.
     */
    class SolverAdapter
    {
    public:
        virtual ~SolverAdapter() = default;

        virtual SolveResult solve(const Model &model) = 0;
    };
}
