#pragma once

#include "scheduler/cp_sat_solver.h"
#include "scheduler/registry.h"

#include <drogon/HttpController.h>

#include <functional>

// Registered by hand (not auto-created) so it can carry the solver defaults.
class ScheduleController : public drogon::HttpController<ScheduleController, false>
{
public:
    ScheduleController(lexsched::SolverOptions solver, lexsched::PluginRegistry registry);

    METHOD_LIST_BEGIN
    // POST /schedule
    ADD_METHOD_TO(ScheduleController::schedule, "/schedule", drogon::Post);
    METHOD_LIST_END

    void schedule(const drogon::HttpRequestPtr &req,
                  std::function<void(const drogon::HttpResponsePtr &)> &&callback);

private:
    lexsched::SolverOptions solver_;
    lexsched::PluginRegistry registry_;
};
