#include "catalog/ingest.h"
#include "config/config.h"
#include "controller/ScheduleController.h"
#include "scheduler/cp_sat_solver.h"
#include "scheduler/errors.h"
#include "scheduler/registry.h"
#include "scheduler/schedule.h"
#include "scheduler/session.h"

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <iostream>
#include <memory>
#include <string>

ABSL_FLAG(std::string, config, "", "Path to the JSON scheduler configuration.");
ABSL_FLAG(bool, serve, false, "Serve POST /schedule over HTTP instead of solving once.");
ABSL_FLAG(bool, json, false, "Print the solution and stage audit as JSON.");

using namespace lexsched;
using namespace std;

namespace
{
    int solve_once(const SchedulerConfig &cfg, const PluginRegistry &registry)
    {
        vector<ConstraintPtr> constraints = registry.make_constraints(cfg.constraints);
        vector<ObjectivePtr> objectives = registry.make_objectives(cfg.objectives);

        SchedulingSession session(load_catalog(cfg.data), constraints);
        CpSatSolver solver(cfg.solver);
        LexicographicResult result = session.lexicographic_optimize(objectives, solver);

        if (absl::GetFlag(FLAGS_json))
        {
            nlohmann::json out;
            out["assignments"] = schedule_to_json(result.schedule);
            out["stages"] = stages_to_json(result.stages);
            cout << out.dump(2) << endl;
        }
        else
        {
            print_stages(cout, result.stages);
            cout << "\n";
            print_schedule(cout, result.schedule);
        }
        return 0;
    }

    int serve(const SchedulerConfig &cfg, PluginRegistry registry)
    {
        LOG_INFO << "Listening on " << cfg.server.address << ":" << cfg.server.port;
        drogon::app()
            .addListener(cfg.server.address, cfg.server.port)
            .setThreadNum(cfg.server.threads)
            .registerController(make_shared<ScheduleController>(cfg.solver, std::move(registry)))
            .run();
        return 0;
    }
}

int main(int argc, char **argv)
{
    absl::SetProgramUsageMessage("Lexicographic course scheduler. Usage: lexsched --config=config.json [--serve] [--json]");
    absl::ParseCommandLine(argc, argv);

    const string config_path = absl::GetFlag(FLAGS_config);
    if (config_path.empty())
    {
        cerr << "--config is required" << endl;
        return 2;
    }

    try
    {
        SchedulerConfig cfg = load_config(config_path);
        apply_log_level(cfg.log_level);

        PluginRegistry registry = PluginRegistry::with_builtins();
        if (absl::GetFlag(FLAGS_serve))
            return serve(cfg, std::move(registry));
        return solve_once(cfg, registry);
    }
    catch (const StageError &e)
    {
        LOG_ERROR << "Scheduling failed (" << e.kind() << ") at stage " << e.stage() << ": " << e.what();
        const FailureContext &ctx = e.context();
        if (!ctx.objective_name.empty())
            cerr << "Failed objective: " << ctx.objective_name << " (stage " << ctx.stage << ")\n";
        if (!ctx.completed.empty())
        {
            cerr << "Solved before the failure:\n";
            print_stages(cerr, ctx.completed);
        }
        return 1;
    }
    catch (const SchedulingError &e)
    {
        LOG_ERROR << e.what();
        return 1;
    }
    catch (const exception &e)
    {
        LOG_ERROR << "Unexpected error: " << e.what();
        return 1;
    }
}
