#include "scheduler/objectives.h"
#include "catalog/time_utils.h"

#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

using namespace std;

namespace lexsched
{
    namespace
    {
        string capitalized(Sense sense)
        {
            return sense == Sense::Minimize ? "Minimize" : "Maximize";
        }

        string scope_suffix(const ObjectiveScope &scope)
        {
            string s;
            if (scope.instructor)
                s += " for " + *scope.instructor;
            if (scope.course_type)
                s += " (" + *scope.course_type + ")";
            return s;
        }

        string joined(const vector<string> &items)
        {
            string s;
            for (const auto &item : items)
                s += (s.empty() ? "" : ", ") + item;
            return s;
        }
    } // anonymous namespace

    ObjectivePlugin::ObjectivePlugin(string name, Sense sense, double tolerance)
        : name_(std::move(name)), sense_(sense), tolerance_(tolerance)
    {
        if (!std::isfinite(tolerance) || tolerance < 0.0)
            throw invalid_argument("tolerance must be non-negative, got " + std::to_string(tolerance));
    }

    KeyPredicate scope_predicate(const Catalog &catalog, const ObjectiveScope &scope)
    {
        vector<KeyPredicate> parts;
        if (scope.instructor)
            parts.push_back(taught_by(catalog, *scope.instructor));
        if (scope.course_type)
            parts.push_back(of_course_type(catalog, *scope.course_type));
        return all_of_predicates(std::move(parts));
    }

    // ---------- time of day ----------

    MinimizeClassesBefore::MinimizeClassesBefore(const string &time, ObjectiveScope scope, Sense sense, double tolerance)
        : ObjectivePlugin(capitalized(sense) + " classes before " + time + scope_suffix(scope), sense, tolerance),
          time_minutes_(time_to_minutes(time)),
          scope_(std::move(scope))
    {
    }

    LinearExpression MinimizeClassesBefore::evaluate(ModelContext &context) const
    {
        const Catalog &catalog = context.catalog();
        return context.sum(all_of_predicates({starts_before(catalog, time_minutes_), scope_predicate(catalog, scope_)}));
    }

    MinimizeClassesAfter::MinimizeClassesAfter(const string &time, ObjectiveScope scope, Sense sense, double tolerance)
        : ObjectivePlugin(capitalized(sense) + " classes after " + time + scope_suffix(scope), sense, tolerance),
          time_minutes_(time_to_minutes(time)),
          scope_(std::move(scope))
    {
    }

    LinearExpression MinimizeClassesAfter::evaluate(ModelContext &context) const
    {
        const Catalog &catalog = context.catalog();
        return context.sum(all_of_predicates({starts_after(catalog, time_minutes_), scope_predicate(catalog, scope_)}));
    }

    // ---------- preferences ----------

    MaximizePreferredRooms::MaximizePreferredRooms(const vector<string> &rooms, ObjectiveScope scope, double tolerance)
        : ObjectivePlugin("Maximize preferred rooms (" + joined(rooms) + ")" + scope_suffix(scope), Sense::Maximize, tolerance),
          rooms_(rooms),
          scope_(std::move(scope))
    {
    }

    LinearExpression MaximizePreferredRooms::evaluate(ModelContext &context) const
    {
        set<string> preferred(rooms_.begin(), rooms_.end());
        return context.sum(all_of_predicates({in_rooms(std::move(preferred)), scope_predicate(context.catalog(), scope_)}));
    }

    MaximizePreferredTimeSlots::MaximizePreferredTimeSlots(const vector<string> &time_slots, ObjectiveScope scope, double tolerance)
        : ObjectivePlugin("Maximize preferred time slots (" + joined(time_slots) + ")" + scope_suffix(scope), Sense::Maximize, tolerance),
          time_slots_(time_slots),
          scope_(std::move(scope))
    {
    }

    LinearExpression MaximizePreferredTimeSlots::evaluate(ModelContext &context) const
    {
        set<string> preferred(time_slots_.begin(), time_slots_.end());
        return context.sum(all_of_predicates({in_time_slots(std::move(preferred)), scope_predicate(context.catalog(), scope_)}));
    }

    // ---------- room changes ----------

    MinimizeRoomChanges::MinimizeRoomChanges(ObjectiveScope scope, double tolerance)
        : ObjectivePlugin("Minimize room changes" + scope_suffix(scope), Sense::Minimize, tolerance),
          scope_(std::move(scope))
    {
    }

    LinearExpression MinimizeRoomChanges::evaluate(ModelContext &context) const
    {
        const Catalog &catalog = context.catalog();
        const AssignmentSpace &space = context.space();
        KeyPredicate in_scope = scope_predicate(catalog, scope_);

        LinearExpression expr;
        for (const auto &instructor : catalog.instructors())
        {
            if (scope_.instructor && *scope_.instructor != instructor.id)
                continue;

            // room -> decision variables of this instructor's keys in that room
            map<string, vector<VarIndex>> by_room;
            for (VarIndex var : space.filter_indices(all_of_predicates({taught_by(catalog, instructor.id), in_scope})))
                by_room[space.key(var).room].push_back(var);
            if (by_room.empty())
                continue;

            for (const auto &entry : by_room)
            {
                string name = "rooms_used[" + instructor.id + "," + entry.first + "]@" + std::to_string(context.stage());
                expr.add_term(context.indicator(name, entry.second));
            }
            // the first room is free
            expr.add_constant(-1);
        }
        return expr;
    }

    // ---------- enrollment ----------

    MaximizeEnrollmentInRooms::MaximizeEnrollmentInRooms(const vector<string> &rooms, Sense sense, double tolerance)
        : ObjectivePlugin(capitalized(sense) + " enrollment in rooms (" + joined(rooms) + ")", sense, tolerance),
          rooms_(rooms)
    {
    }

    LinearExpression MaximizeEnrollmentInRooms::evaluate(ModelContext &context) const
    {
        const Catalog &catalog = context.catalog();
        set<string> subset(rooms_.begin(), rooms_.end());
        return context.space().weighted_sum(in_rooms(std::move(subset)),
                                            [&catalog](const AssignmentKey &k)
                                            { return static_cast<int64_t>(catalog.enrollment(k.course)); });
    }
}
