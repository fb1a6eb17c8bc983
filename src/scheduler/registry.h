#pragma once

#include "scheduler/constraints.h"
#include "scheduler/objectives.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lexsched
{
    /**
     * Builds plugins from JSON specs of the form { "type": "<name>", ... }.
     *
     * Built-in types are registered by with_builtins(); other code adds its
     * own plugins with add_constraint() / add_objective(). Unknown types,
     * unknown or mistyped parameters and rejected values raise ConfigError.
     */
    class PluginRegistry
    {
    public:
        using ConstraintFactory = std::function<ConstraintPtr(const nlohmann::json &)>;
        using ObjectiveFactory = std::function<ObjectivePtr(const nlohmann::json &)>;

        static PluginRegistry with_builtins();

        void add_constraint(const std::string &type, ConstraintFactory factory);
        void add_objective(const std::string &type, ObjectiveFactory factory);

        bool has_constraint(const std::string &type) const { return constraints_.count(type) > 0; }
        bool has_objective(const std::string &type) const { return objectives_.count(type) > 0; }

        ConstraintPtr make_constraint(const nlohmann::json &spec) const;
        ObjectivePtr make_objective(const nlohmann::json &spec) const;

        // null specs: default_constraints() / no objectives
        std::vector<ConstraintPtr> make_constraints(const nlohmann::json &specs) const;
        std::vector<ObjectivePtr> make_objectives(const nlohmann::json &specs) const;

    private:
        std::map<std::string, ConstraintFactory> constraints_;
        std::map<std::string, ObjectiveFactory> objectives_;
    };

    // Rejects keys of spec outside allowed ("type" is always allowed).
    void check_spec_keys(const nlohmann::json &spec, const std::vector<std::string> &allowed);
}
