#include "scheduler/constraints.h"

#include <trantor/utils/Logger.h>

using namespace std;

namespace lexsched
{
    vector<LinearConstraint> AssignAllCourses::generate(ModelContext &context) const
    {
        vector<LinearConstraint> out;
        for (const auto &course : context.catalog().courses())
        {
            // an empty sum keeps the course unsatisfiable instead of silently dropping it
            out.push_back(make_equal("assign_course[" + course.id + "]",
                                     context.sum(match_course(course.id)), 1.0));
        }
        return out;
    }

    vector<LinearConstraint> NoInstructorOverlap::generate(ModelContext &context) const
    {
        const Catalog &catalog = context.catalog();
        vector<LinearConstraint> out;
        for (const auto &instructor : catalog.instructors())
        {
            if (catalog.courses_of(instructor.id).empty())
                continue;
            KeyPredicate teaches = taught_by(catalog, instructor.id);
            for (const auto &slot : catalog.time_slots())
            {
                LinearExpression busy = context.sum(all_of_predicates(
                    {teaches, overlaps_slot(catalog, slot.id, buffer_minutes_)}));
                // a single binary term can never exceed 1
                if (busy.terms().size() < 2)
                    continue;
                out.push_back(make_less_or_equal("no_instructor_overlap[" + instructor.id + "," + slot.id + "]",
                                                 std::move(busy), 1.0));
            }
        }
        return out;
    }

    vector<LinearConstraint> NoRoomOverlap::generate(ModelContext &context) const
    {
        const Catalog &catalog = context.catalog();
        vector<LinearConstraint> out;
        for (const auto &room : catalog.rooms())
        {
            for (const auto &slot : catalog.time_slots())
            {
                LinearExpression occupied = context.sum(overlaps_slot(catalog, slot.id, buffer_minutes_, room.id));
                if (occupied.terms().size() < 2)
                    continue;
                out.push_back(make_less_or_equal("no_room_overlap[" + room.id + "," + slot.id + "]",
                                                 std::move(occupied), 1.0));
            }
        }
        return out;
    }

    vector<LinearConstraint> ForceRooms::generate(ModelContext &context) const
    {
        vector<LinearConstraint> out;
        for (const auto &course : context.catalog().courses())
        {
            if (course.force_room.empty())
                continue;
            LinearExpression placed = context.sum(matches({course.id, course.force_room, nullopt}));
            if (!placed.has_terms())
            {
                LOG_WARN << "Course '" << course.id << "' is forced into room '" << course.force_room
                         << "' but does not fit there";
            }
            out.push_back(make_equal("force_room[" + course.id + "]", std::move(placed), 1.0));
        }
        return out;
    }

    vector<LinearConstraint> ForceTimeSlots::generate(ModelContext &context) const
    {
        vector<LinearConstraint> out;
        for (const auto &course : context.catalog().courses())
        {
            if (course.force_time_slot.empty())
                continue;
            LinearExpression placed = context.sum(matches({course.id, nullopt, course.force_time_slot}));
            if (!placed.has_terms())
            {
                LOG_WARN << "Course '" << course.id << "' is forced into time slot '" << course.force_time_slot
                         << "' but has no key there";
            }
            out.push_back(make_equal("force_time_slot[" + course.id + "]", std::move(placed), 1.0));
        }
        return out;
    }

    vector<ConstraintPtr> default_constraints(int buffer_minutes)
    {
        return {
            make_shared<AssignAllCourses>(),
            make_shared<NoInstructorOverlap>(buffer_minutes),
            make_shared<NoRoomOverlap>(buffer_minutes),
            make_shared<ForceRooms>(),
            make_shared<ForceTimeSlots>(),
        };
    }
}
