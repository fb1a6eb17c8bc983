#pragma once

#include "catalog/catalog.h"
#include "scheduler/assignment_space.h"
#include "scheduler/constraints.h"
#include "scheduler/lexicographic.h"
#include "scheduler/model.h"
#include "scheduler/objectives.h"
#include "scheduler/solver.h"

#include <memory>
#include <vector>

namespace lexsched
{
    /**
     * One scheduling session: the catalog, its assignment space and the base
     * model built from the hard constraints, all fixed at construction.
     * Every lexicographic_optimize() call starts from the same base model.
     *
     * The space and model refer to the catalog held here, so a session is
     * neither copyable nor movable.
     */
    class SchedulingSession
    {
    public:
        SchedulingSession(Catalog catalog, const std::vector<ConstraintPtr> &constraints);

        SchedulingSession(const SchedulingSession &) = delete;
        SchedulingSession &operator=(const SchedulingSession &) = delete;

        const Catalog &catalog() const { return catalog_; }
        const AssignmentSpace &space() const { return space_; }
        const Model &base_model() const { return base_; }

        LexicographicResult lexicographic_optimize(const std::vector<ObjectivePtr> &objectives, SolverAdapter &solver);

        // engine of the latest run (nullptr before the first one)
        const LexicographicEngine *last_run() const { return engine_.get(); }

    private:
        Catalog catalog_;
        AssignmentSpace space_;
        Model base_;
        std::unique_ptr<LexicographicEngine> engine_;
    };
}
