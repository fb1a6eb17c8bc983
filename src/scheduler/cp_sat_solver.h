#pragma once

#include "scheduler/solver.h"

#include <string>

namespace lexsched
{
    struct SolverOptions
    {
        double max_time_in_seconds = 30.0;
        int num_search_workers = 8;
        bool log_search_progress = false;
    };

    // SatParameters text, e.g. "max_time_in_seconds:30 num_search_workers:8 log_search_progress:false"
    std::string sat_parameters_text(const SolverOptions &options);

    // Solver adapter backed by OR-Tools CP-SAT.
    class CpSatSolver : public SolverAdapter
    {
    public:
        explicit CpSatSolver(SolverOptions options = {});

        const SolverOptions &options() const { return options_; }

        SolveResult solve(const Model &model) override;

    private:
        SolverOptions options_;
    };
}
