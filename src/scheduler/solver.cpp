#include "scheduler/solver.h"

namespace lexsched
{
    std::string status_name(SolverStatus status)
    {
        switch (status)
        {
        case SolverStatus::Optimal:
            return "optimal";
        case SolverStatus::Infeasible:
            return "infeasible";
        case SolverStatus::Unbounded:
            return "unbounded";
        case SolverStatus::Timeout:
            return "timeout";
        }
        return "unknown";
    }
}
