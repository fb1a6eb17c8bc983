#include "controller/ScheduleController.h"
#include "controller/schedule_request.h"

#include <drogon/drogon.h>

#include <string>
#include <utility>

using namespace drogon;
using namespace std;

ScheduleController::ScheduleController(lexsched::SolverOptions solver, lexsched::PluginRegistry registry)
    : solver_(solver), registry_(std::move(registry))
{
}

void ScheduleController::schedule(const HttpRequestPtr &req,
                                  function<void(const HttpResponsePtr &)> &&callback)
{
    string body(req->getBody());
    lexsched::ScheduleResponse out = lexsched::handle_schedule_request(body, registry_, solver_);

    auto resp = HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<HttpStatusCode>(out.status_code));
    resp->setContentTypeCode(CT_APPLICATION_JSON);
    resp->setBody(out.body.dump());
    callback(resp);

    LOG_INFO << "[Schedule] Response " << out.status_code << " sent to client";
}
