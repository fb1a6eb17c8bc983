#include "scheduler/assignment_space.h"

#include <trantor/utils/Logger.h>

using namespace std;

namespace lexsched
{
    namespace
    {
        bool types_compatible(const Course &course, const TimeSlot &slot)
        {
            return course.type.empty() || slot.type.empty() || course.type == slot.type;
        }
    }

    AssignmentSpace AssignmentSpace::build(const Catalog &catalog)
    {
        AssignmentSpace space;

        // ---------- Variables ----------
        // x[course,room,slot] : course is taught in room at slot
        // created only for combinations passing the structural filters
        for (const auto &course : catalog.courses())
        {
            size_t before = space.keys_.size();
            for (const auto &room : catalog.rooms())
            {
                if (course.enrollment > room.capacity)
                    continue;
                for (const auto &slot : catalog.time_slots())
                {
                    if (!types_compatible(course, slot))
                        continue;
                    VarIndex var = space.keys_.size();
                    AssignmentKey key{course.id, room.id, slot.id};
                    space.index_.emplace(key, var);
                    space.keys_.push_back(std::move(key));
                    space.names_.push_back("x[" + course.id + "," + room.id + "," + slot.id + "]");
                }
            }
            if (space.keys_.size() == before)
            {
                LOG_WARN << "Course '" << course.id << "' (enrollment " << course.enrollment
                         << ") has no room/slot combination it fits";
            }
        }

        LOG_INFO << "Assignment space built: " << space.keys_.size() << " keys for "
                 << catalog.courses().size() << " courses";
        return space;
    }

    optional<VarIndex> AssignmentSpace::index_of(const AssignmentKey &key) const
    {
        auto it = index_.find(key);
        if (it == index_.end())
            return nullopt;
        return it->second;
    }

    vector<AssignmentKey> AssignmentSpace::filter_keys(const KeyPredicate &predicate) const
    {
        vector<AssignmentKey> out;
        for (const auto &k : keys_)
            if (predicate(k))
                out.push_back(k);
        return out;
    }

    vector<VarIndex> AssignmentSpace::filter_indices(const KeyPredicate &predicate) const
    {
        vector<VarIndex> out;
        for (VarIndex i = 0; i < keys_.size(); ++i)
            if (predicate(keys_[i]))
                out.push_back(i);
        return out;
    }

    LinearExpression AssignmentSpace::sum(const KeyPredicate &predicate) const
    {
        LinearExpression expr;
        for (VarIndex i = 0; i < keys_.size(); ++i)
            if (predicate(keys_[i]))
                expr.add_term(i);
        return expr;
    }

    LinearExpression AssignmentSpace::weighted_sum(const KeyPredicate &predicate, const KeyWeight &weight) const
    {
        LinearExpression expr;
        for (VarIndex i = 0; i < keys_.size(); ++i)
            if (predicate(keys_[i]))
                expr.add_term(i, weight(keys_[i]));
        return expr;
    }
}
