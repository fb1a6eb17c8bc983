#include "scheduler/session.h"
#include "scheduler/model_builder.h"

#include <utility>

using namespace std;

namespace lexsched
{
    SchedulingSession::SchedulingSession(Catalog catalog, const vector<ConstraintPtr> &constraints)
        : catalog_(std::move(catalog)),
          space_(AssignmentSpace::build(catalog_)),
          base_(ModelBuilder(constraints).build(catalog_, space_))
    {
    }

    LexicographicResult SchedulingSession::lexicographic_optimize(const vector<ObjectivePtr> &objectives,
                                                                  SolverAdapter &solver)
    {
        engine_ = make_unique<LexicographicEngine>(catalog_, space_, base_, solver);
        return engine_->optimize(objectives);
    }
}
