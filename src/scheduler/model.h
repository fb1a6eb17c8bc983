#pragma once

#include "catalog/catalog.h"
#include "scheduler/assignment_space.h"
#include "scheduler/key_filter.h"
#include "scheduler/linear.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lexsched
{
    /**
     * Binary ILP handed to a solver adapter.
     *
     * Variables 0 .. decision_count()-1 are the decision variables of the
     * assignment space (same order); auxiliary indicator variables added by
     * plugins follow them. Constraints form an append-only log: base hard
     * constraints first, then whatever later stages append.
     */
    class Model
    {
    public:
        explicit Model(const AssignmentSpace &space);

        std::size_t variable_count() const { return names_.size(); }
        std::size_t decision_count() const { return decision_count_; }
        const std::string &variable_name(VarIndex var) const { return names_.at(var); }

        VarIndex add_auxiliary(std::string name);
        void add_constraint(LinearConstraint constraint);
        const std::vector<LinearConstraint> &constraints() const { return constraints_; }

        void set_objective(LinearExpression expression, Sense sense);
        void clear_objective();
        bool has_objective() const { return objective_.has_value(); }
        const LinearExpression &objective() const { return *objective_; }
        Sense objective_sense() const { return sense_; }

        // names of the constraints violated by a full value vector
        std::vector<std::string> violated_constraints(const std::vector<std::int64_t> &values) const;

    private:
        std::size_t decision_count_;
        std::vector<std::string> names_;
        std::vector<LinearConstraint> constraints_;
        std::optional<LinearExpression> objective_;
        Sense sense_ = Sense::Minimize;
    };

    /**
     * What a constraint or objective plugin sees: read-only catalog and
     * assignment space, the stage being built (0 = base model) and a factory
     * for auxiliary indicator variables in the model under construction.
     */
    class ModelContext
    {
    public:
        ModelContext(const Catalog &catalog, const AssignmentSpace &space, Model &model, std::size_t stage);

        const Catalog &catalog() const { return catalog_; }
        const AssignmentSpace &space() const { return space_; }
        std::size_t stage() const { return stage_; }

        LinearExpression sum(const KeyPredicate &predicate) const { return space_.sum(predicate); }

        /**
         * New binary y with y >= x for every covered variable x, so y is 1
         * whenever any covered variable is. Minimizing y drives it to 0 when
         * no covered variable is selected.
         */
        VarIndex indicator(const std::string &name, const std::vector<VarIndex> &covered);

    private:
        const Catalog &catalog_;
        const AssignmentSpace &space_;
        Model &model_;
        std::size_t stage_;
    };
}
