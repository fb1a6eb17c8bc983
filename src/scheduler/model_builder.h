#pragma once

#include "scheduler/constraints.h"
#include "scheduler/model.h"

#include <vector>

namespace lexsched
{
    // Assembles the base model: one binary per key plus every hard constraint.
    class ModelBuilder
    {
    public:
        explicit ModelBuilder(std::vector<ConstraintPtr> constraints);

        const std::vector<ConstraintPtr> &constraints() const { return constraints_; }

        // Plugin failures are rethrown as PluginEvaluationError (stage 0).
        Model build(const Catalog &catalog, const AssignmentSpace &space) const;

    private:
        std::vector<ConstraintPtr> constraints_;
    };
}
