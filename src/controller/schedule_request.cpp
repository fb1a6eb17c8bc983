#include "controller/schedule_request.h"
#include "catalog/ingest.h"
#include "config/config.h"
#include "scheduler/errors.h"
#include "scheduler/schedule.h"
#include "scheduler/session.h"

#include <trantor/utils/Logger.h>

#include <algorithm>

using json = nlohmann::json;
using namespace std;

namespace lexsched
{
    namespace
    {
        ScheduleResponse error_response(int code, const string &kind, const string &message)
        {
            ScheduleResponse resp;
            resp.status_code = code;
            resp.body["status"] = "error";
            resp.body["kind"] = kind;
            resp.body["message"] = message;
            return resp;
        }

        ScheduleResponse stage_error_response(int code, const StageError &e)
        {
            ScheduleResponse resp = error_response(code, e.kind(), e.what());
            resp.body.update(failure_to_json(e.context()));
            return resp;
        }

        const vector<string> REQUEST_KEYS = {"rooms", "courses", "time_slots", "instructors",
                                             "constraints", "objectives", "solver"};
    } // anonymous namespace

    SolverFactory cp_sat_factory()
    {
        return [](const SolverOptions &options) -> unique_ptr<SolverAdapter>
        { return make_unique<CpSatSolver>(options); };
    }

    ScheduleResponse handle_schedule_request(const string &body, const PluginRegistry &registry,
                                             const SolverOptions &defaults, const SolverFactory &make_solver)
    {
        if (body.empty())
        {
            LOG_WARN << "[Schedule] Empty body";
            return error_response(400, "bad_request", "empty body");
        }

        json jin;
        try
        {
            jin = json::parse(body);
        }
        catch (const json::parse_error &e)
        {
            LOG_WARN << "[Schedule] Malformed JSON: " << e.what();
            return error_response(400, "bad_request", string("malformed JSON: ") + e.what());
        }
        LOG_INFO << "[Schedule] JSON parsed successfully";

        try
        {
            if (!jin.is_object())
                throw ConfigError("request body must be a JSON object");
            for (auto it = jin.begin(); it != jin.end(); ++it)
            {
                if (find(REQUEST_KEYS.begin(), REQUEST_KEYS.end(), it.key()) == REQUEST_KEYS.end())
                    throw ConfigError("Unknown request key '" + it.key() + "'");
            }

            SolverOptions options = jin.contains("solver") ? solver_options_from_json(jin["solver"], defaults) : defaults;
            vector<ConstraintPtr> constraints = registry.make_constraints(jin.value("constraints", json()));
            vector<ObjectivePtr> objectives = registry.make_objectives(jin.value("objectives", json()));

            SchedulingSession session(catalog_from_json(jin), constraints);
            LOG_INFO << "[Schedule] Session ready: " << session.catalog().courses().size() << " courses, "
                     << session.space().size() << " assignment keys";

            unique_ptr<SolverAdapter> solver = make_solver(options);
            LexicographicResult result = session.lexicographic_optimize(objectives, *solver);
            LOG_INFO << "[Schedule] Optimization finished with " << result.stages.size() << " stages";

            ScheduleResponse resp;
            resp.body["status"] = "success";
            resp.body["solution"] = json::object();
            resp.body["solution"]["assignments"] = schedule_to_json(result.schedule);
            resp.body["solution"]["stages"] = stages_to_json(result.stages);
            return resp;
        }
        catch (const InfeasibleModelError &e)
        {
            LOG_WARN << "[Schedule] " << e.what();
            return stage_error_response(422, e);
        }
        catch (const StagedInfeasibilityError &e)
        {
            LOG_WARN << "[Schedule] " << e.what();
            return stage_error_response(422, e);
        }
        catch (const SolverTimeoutError &e)
        {
            LOG_WARN << "[Schedule] " << e.what();
            return stage_error_response(504, e);
        }
        catch (const StageError &e)
        {
            LOG_ERROR << "[Schedule] " << e.what();
            return stage_error_response(500, e);
        }
        catch (const LoadError &e)
        {
            LOG_WARN << "[Schedule] " << e.what();
            return error_response(400, "load_error", e.what());
        }
        catch (const ConfigError &e)
        {
            LOG_WARN << "[Schedule] " << e.what();
            return error_response(400, "config_error", e.what());
        }
        catch (const SolverError &e)
        {
            LOG_ERROR << "[Schedule] " << e.what();
            return error_response(500, "solver_error", e.what());
        }
        catch (const json::exception &e)
        {
            LOG_WARN << "[Schedule] " << e.what();
            return error_response(400, "bad_request", e.what());
        }
        catch (const exception &e)
        {
            LOG_ERROR << "[Schedule] Exception: " << e.what();
            return error_response(500, "internal_error", e.what());
        }
    }
}
