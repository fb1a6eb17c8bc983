#include "scheduler/model_builder.h"
#include "scheduler/errors.h"

#include <trantor/utils/Logger.h>

#include <stdexcept>
#include <utility>

using namespace std;

namespace lexsched
{
    ModelBuilder::ModelBuilder(vector<ConstraintPtr> constraints)
        : constraints_(std::move(constraints))
    {
        for (const auto &c : constraints_)
            if (!c)
                throw invalid_argument("ModelBuilder: null constraint plugin");
    }

    Model ModelBuilder::build(const Catalog &catalog, const AssignmentSpace &space) const
    {
        Model model(space);
        ModelContext context(catalog, space, model, 0);

        for (const auto &plugin : constraints_)
        {
            vector<LinearConstraint> relations;
            try
            {
                relations = plugin->generate(context);
            }
            catch (const exception &e)
            {
                FailureContext fc;
                fc.stage = 0;
                throw PluginEvaluationError("Constraint plugin '" + plugin->name() + "' failed: " + e.what(),
                                            std::move(fc), plugin->name());
            }

            LOG_DEBUG << "Constraint '" << plugin->name() << "' generated " << relations.size() << " relations";
            for (auto &r : relations)
                model.add_constraint(std::move(r));
        }

        LOG_INFO << "Base model: " << model.variable_count() << " binary variables, "
                 << model.constraints().size() << " constraints";
        return model;
    }
}
