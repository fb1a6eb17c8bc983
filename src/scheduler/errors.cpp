#include "scheduler/errors.h"

#include <utility>

namespace lexsched
{
    StageError::StageError(const std::string &what, FailureContext context)
        : SchedulingError(what), context_(std::move(context))
    {
    }

    StagedInfeasibilityError::StagedInfeasibilityError(const std::string &what, FailureContext context,
                                                       std::size_t frozen_stage, double frozen_bound)
        : StageError(what, std::move(context)), frozen_stage_(frozen_stage), frozen_bound_(frozen_bound)
    {
    }

    PluginEvaluationError::PluginEvaluationError(const std::string &what, FailureContext context,
                                                 std::string plugin)
        : StageError(what, std::move(context)), plugin_(std::move(plugin))
    {
    }
}
