#include "scheduler/key_filter.h"

#include <utility>

using namespace std;

namespace lexsched
{
    vector<AssignmentKey> filter_keys(const vector<AssignmentKey> &keys, const KeyPredicate &predicate)
    {
        vector<AssignmentKey> out;
        for (const auto &k : keys)
            if (predicate(k))
                out.push_back(k);
        return out;
    }

    vector<AssignmentKey> filter_keys(const vector<AssignmentKey> &keys, const KeyMatch &match)
    {
        return filter_keys(keys, matches(match));
    }

    KeyPredicate matches(const KeyMatch &match)
    {
        return [match](const AssignmentKey &k)
        {
            if (match.course && k.course != *match.course)
                return false;
            if (match.room && k.room != *match.room)
                return false;
            if (match.time_slot && k.time_slot != *match.time_slot)
                return false;
            return true;
        };
    }

    KeyPredicate match_everything()
    {
        return [](const AssignmentKey &)
        { return true; };
    }

    KeyPredicate match_course(string course)
    {
        return [course = std::move(course)](const AssignmentKey &k)
        { return k.course == course; };
    }

    KeyPredicate match_room(string room)
    {
        return [room = std::move(room)](const AssignmentKey &k)
        { return k.room == room; };
    }

    KeyPredicate match_time_slot(string time_slot)
    {
        return [time_slot = std::move(time_slot)](const AssignmentKey &k)
        { return k.time_slot == time_slot; };
    }

    KeyPredicate in_rooms(set<string> rooms)
    {
        return [rooms = std::move(rooms)](const AssignmentKey &k)
        { return rooms.count(k.room) != 0; };
    }

    KeyPredicate in_time_slots(set<string> time_slots)
    {
        return [time_slots = std::move(time_slots)](const AssignmentKey &k)
        { return time_slots.count(k.time_slot) != 0; };
    }

    KeyPredicate taught_by(const Catalog &catalog, string instructor)
    {
        const Catalog *cat = &catalog;
        return [cat, instructor = std::move(instructor)](const AssignmentKey &k)
        { return cat->instructor(k.course) == instructor; };
    }

    KeyPredicate of_course_type(const Catalog &catalog, string type)
    {
        const Catalog *cat = &catalog;
        return [cat, type = std::move(type)](const AssignmentKey &k)
        { return cat->course(k.course).type == type; };
    }

    KeyPredicate starts_before(const Catalog &catalog, int minutes)
    {
        const Catalog *cat = &catalog;
        return [cat, minutes](const AssignmentKey &k)
        { return cat->time_slot(k.time_slot).start_minutes < minutes; };
    }

    KeyPredicate starts_after(const Catalog &catalog, int minutes)
    {
        const Catalog *cat = &catalog;
        return [cat, minutes](const AssignmentKey &k)
        { return cat->time_slot(k.time_slot).start_minutes > minutes; };
    }

    KeyPredicate overlaps_slot(const Catalog &catalog, const string &time_slot,
                               int buffer_minutes, optional<string> room)
    {
        const Catalog *cat = &catalog;
        const TimeSlot &ref = catalog.time_slot(time_slot);
        int ref_start = ref.start_minutes;
        DayMask ref_days = ref.day_mask;

        return [cat, ref_start, ref_days, buffer_minutes, room = std::move(room)](const AssignmentKey &k)
        {
            if (room && k.room != *room)
                return false;
            const TimeSlot &s = cat->time_slot(k.time_slot);
            if (!days_intersect(s.day_mask, ref_days))
                return false;
            return s.start_minutes <= ref_start && s.end_minutes > ref_start - buffer_minutes;
        };
    }

    KeyPredicate all_of_predicates(vector<KeyPredicate> predicates)
    {
        return [predicates = std::move(predicates)](const AssignmentKey &k)
        {
            for (const auto &p : predicates)
                if (!p(k))
                    return false;
            return true;
        };
    }

    KeyPredicate any_of_predicates(vector<KeyPredicate> predicates)
    {
        return [predicates = std::move(predicates)](const AssignmentKey &k)
        {
            for (const auto &p : predicates)
                if (p(k))
                    return true;
            return false;
        };
    }

    KeyPredicate negated(KeyPredicate predicate)
    {
        return [predicate = std::move(predicate)](const AssignmentKey &k)
        { return !predicate(k); };
    }
}
