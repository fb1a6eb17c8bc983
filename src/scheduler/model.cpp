#include "scheduler/model.h"

#include <utility>

using namespace std;

namespace lexsched
{
    Model::Model(const AssignmentSpace &space)
        : decision_count_(space.size())
    {
        names_.reserve(space.size());
        for (VarIndex i = 0; i < space.size(); ++i)
            names_.push_back(space.variable_name(i));
    }

    VarIndex Model::add_auxiliary(string name)
    {
        names_.push_back(std::move(name));
        return names_.size() - 1;
    }

    void Model::add_constraint(LinearConstraint constraint)
    {
        constraints_.push_back(std::move(constraint));
    }

    void Model::set_objective(LinearExpression expression, Sense sense)
    {
        objective_ = std::move(expression);
        sense_ = sense;
    }

    void Model::clear_objective()
    {
        objective_.reset();
        sense_ = Sense::Minimize;
    }

    vector<string> Model::violated_constraints(const vector<int64_t> &values) const
    {
        vector<string> violated;
        for (const auto &c : constraints_)
            if (!is_satisfied(c, values))
                violated.push_back(c.name);
        return violated;
    }

    ModelContext::ModelContext(const Catalog &catalog, const AssignmentSpace &space, Model &model, size_t stage)
        : catalog_(catalog), space_(space), model_(model), stage_(stage)
    {
    }

    VarIndex ModelContext::indicator(const string &name, const vector<VarIndex> &covered)
    {
        VarIndex y = model_.add_auxiliary(name);
        for (VarIndex x : covered)
        {
            // y - x >= 0
            LinearExpression link;
            link.add_term(y, 1).add_term(x, -1);
            model_.add_constraint(make_greater_or_equal(name + "_covers_" + model_.variable_name(x), std::move(link), 0.0));
        }
        return y;
    }
}
