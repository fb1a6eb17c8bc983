#include "scheduler/registry.h"
#include "scheduler/errors.h"

#include <trantor/utils/Logger.h>

#include <memory>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;
using namespace std;

namespace lexsched
{
    namespace
    {
        string spec_type(const json &spec, const char *what)
        {
            if (!spec.is_object())
                throw ConfigError(string(what) + " spec must be a JSON object, got " + spec.dump());
            if (!spec.contains("type") || !spec["type"].is_string())
                throw ConfigError(string(what) + " spec is missing string field 'type': " + spec.dump());
            return spec["type"].get<string>();
        }

        template <typename T>
        T param(const json &spec, const char *key, const T &fallback)
        {
            if (!spec.contains(key) || spec.at(key).is_null())
                return fallback;
            return spec.at(key).get<T>();
        }

        template <typename T>
        T required_param(const json &spec, const char *key)
        {
            if (!spec.contains(key))
                throw ConfigError("missing parameter '" + string(key) + "'");
            return spec.at(key).get<T>();
        }

        ObjectiveScope scope_from(const json &spec)
        {
            ObjectiveScope scope;
            if (spec.contains("instructor") && !spec["instructor"].is_null())
                scope.instructor = spec["instructor"].get<string>();
            if (spec.contains("course_type") && !spec["course_type"].is_null())
                scope.course_type = spec["course_type"].get<string>();
            return scope;
        }

        Sense sense_from(const json &spec, Sense fallback)
        {
            if (!spec.contains("sense"))
                return fallback;
            return parse_sense(spec.at("sense").get<string>());
        }

        // Runs a factory and reports every rejection as ConfigError naming the type.
        template <typename Ptr, typename Factory>
        Ptr build_plugin(const Factory &factory, const json &spec, const string &type, const char *what)
        {
            Ptr plugin;
            try
            {
                plugin = factory(spec);
            }
            catch (const ConfigError &e)
            {
                throw ConfigError(string(what) + " '" + type + "': " + e.what());
            }
            catch (const json::exception &e)
            {
                throw ConfigError(string(what) + " '" + type + "' has a mistyped parameter: " + e.what());
            }
            catch (const invalid_argument &e)
            {
                throw ConfigError(string(what) + " '" + type + "': " + e.what());
            }
            if (!plugin)
                throw ConfigError(string(what) + " factory for '" + type + "' returned nothing");
            return plugin;
        }
    } // anonymous namespace

    void check_spec_keys(const json &spec, const vector<string> &allowed)
    {
        for (auto it = spec.begin(); it != spec.end(); ++it)
        {
            if (it.key() == "type")
                continue;
            bool known = false;
            for (const auto &a : allowed)
                known = known || a == it.key();
            if (!known)
                throw ConfigError("unknown parameter '" + it.key() + "'");
        }
    }

    void PluginRegistry::add_constraint(const string &type, ConstraintFactory factory)
    {
        if (!factory)
            throw invalid_argument("empty factory for constraint type '" + type + "'");
        constraints_[type] = std::move(factory);
    }

    void PluginRegistry::add_objective(const string &type, ObjectiveFactory factory)
    {
        if (!factory)
            throw invalid_argument("empty factory for objective type '" + type + "'");
        objectives_[type] = std::move(factory);
    }

    ConstraintPtr PluginRegistry::make_constraint(const json &spec) const
    {
        string type = spec_type(spec, "Constraint");
        auto it = constraints_.find(type);
        if (it == constraints_.end())
            throw ConfigError("Unknown constraint type '" + type + "'");
        return build_plugin<ConstraintPtr>(it->second, spec, type, "Constraint");
    }

    ObjectivePtr PluginRegistry::make_objective(const json &spec) const
    {
        string type = spec_type(spec, "Objective");
        auto it = objectives_.find(type);
        if (it == objectives_.end())
            throw ConfigError("Unknown objective type '" + type + "'");
        return build_plugin<ObjectivePtr>(it->second, spec, type, "Objective");
    }

    vector<ConstraintPtr> PluginRegistry::make_constraints(const json &specs) const
    {
        if (specs.is_null())
            return default_constraints();
        if (!specs.is_array())
            throw ConfigError("'constraints' must be a JSON array");
        vector<ConstraintPtr> out;
        for (const auto &spec : specs)
            out.push_back(make_constraint(spec));
        return out;
    }

    vector<ObjectivePtr> PluginRegistry::make_objectives(const json &specs) const
    {
        if (specs.is_null())
            return {};
        if (!specs.is_array())
            throw ConfigError("'objectives' must be a JSON array");
        vector<ObjectivePtr> out;
        for (const auto &spec : specs)
            out.push_back(make_objective(spec));
        LOG_DEBUG << "Built " << out.size() << " objectives";
        return out;
    }

    PluginRegistry PluginRegistry::with_builtins()
    {
        PluginRegistry r;

        // ---------- constraints ----------
        r.add_constraint("assign_all_courses", [](const json &spec) -> ConstraintPtr
                         {
                             check_spec_keys(spec, {});
                             return make_shared<AssignAllCourses>(); });
        r.add_constraint("no_instructor_overlap", [](const json &spec) -> ConstraintPtr
                         {
                             check_spec_keys(spec, {"buffer_minutes"});
                             return make_shared<NoInstructorOverlap>(param<int>(spec, "buffer_minutes", 15)); });
        r.add_constraint("no_room_overlap", [](const json &spec) -> ConstraintPtr
                         {
                             check_spec_keys(spec, {"buffer_minutes"});
                             return make_shared<NoRoomOverlap>(param<int>(spec, "buffer_minutes", 15)); });
        r.add_constraint("force_rooms", [](const json &spec) -> ConstraintPtr
                         {
                             check_spec_keys(spec, {});
                             return make_shared<ForceRooms>(); });
        r.add_constraint("force_time_slots", [](const json &spec) -> ConstraintPtr
                         {
                             check_spec_keys(spec, {});
                             return make_shared<ForceTimeSlots>(); });

        // ---------- objectives ----------
        r.add_objective("minimize_classes_before", [](const json &spec) -> ObjectivePtr
                        {
                            check_spec_keys(spec, {"time", "instructor", "course_type", "sense", "tolerance"});
                            return make_shared<MinimizeClassesBefore>(required_param<string>(spec, "time"), scope_from(spec),
                                                                      sense_from(spec, Sense::Minimize),
                                                                      param<double>(spec, "tolerance", 0.0)); });
        r.add_objective("minimize_classes_after", [](const json &spec) -> ObjectivePtr
                        {
                            check_spec_keys(spec, {"time", "instructor", "course_type", "sense", "tolerance"});
                            return make_shared<MinimizeClassesAfter>(required_param<string>(spec, "time"), scope_from(spec),
                                                                     sense_from(spec, Sense::Minimize),
                                                                     param<double>(spec, "tolerance", 0.0)); });
        r.add_objective("maximize_preferred_rooms", [](const json &spec) -> ObjectivePtr
                        {
                            check_spec_keys(spec, {"rooms", "instructor", "course_type", "tolerance"});
                            return make_shared<MaximizePreferredRooms>(required_param<vector<string>>(spec, "rooms"),
                                                                       scope_from(spec), param<double>(spec, "tolerance", 0.0)); });
        r.add_objective("maximize_preferred_time_slots", [](const json &spec) -> ObjectivePtr
                        {
                            check_spec_keys(spec, {"time_slots", "instructor", "course_type", "tolerance"});
                            return make_shared<MaximizePreferredTimeSlots>(required_param<vector<string>>(spec, "time_slots"),
                                                                           scope_from(spec), param<double>(spec, "tolerance", 0.0)); });
        r.add_objective("minimize_room_changes", [](const json &spec) -> ObjectivePtr
                        {
                            check_spec_keys(spec, {"instructor", "course_type", "tolerance"});
                            return make_shared<MinimizeRoomChanges>(scope_from(spec), param<double>(spec, "tolerance", 0.0)); });
        r.add_objective("maximize_enrollment_in_rooms", [](const json &spec) -> ObjectivePtr
                        {
                            check_spec_keys(spec, {"rooms", "sense", "tolerance"});
                            return make_shared<MaximizeEnrollmentInRooms>(required_param<vector<string>>(spec, "rooms"),
                                                                          sense_from(spec, Sense::Maximize),
                                                                          param<double>(spec, "tolerance", 0.0)); });
        return r;
    }
}
