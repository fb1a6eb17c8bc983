#pragma once

#include "scheduler/cp_sat_solver.h"
#include "scheduler/registry.h"
#include "scheduler/solver.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>

namespace lexsched
{
    struct ScheduleResponse
    {
        int status_code = 200;
        nlohmann::json body;
    };

    using SolverFactory = std::function<std::unique_ptr<SolverAdapter>(const SolverOptions &)>;

    SolverFactory cp_sat_factory();

    /**
     * Solves one POST /schedule request body:
     *   { rooms, courses, time_slots, instructors?, constraints?, objectives?, solver? }
     * "solver" overrides fields of defaults. Every failure becomes an error
     * body { status: "error", kind, message, stage?, objective?, completed? }:
     *   400 malformed request, load or config error
     *   422 infeasible model or staged infeasibility
     *   504 solver timeout
     *   500 anything else
     */
    ScheduleResponse handle_schedule_request(const std::string &body,
                                             const PluginRegistry &registry,
                                             const SolverOptions &defaults,
                                             const SolverFactory &make_solver = cp_sat_factory());
}
