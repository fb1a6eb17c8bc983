#include "catalog/catalog.h"
#include "scheduler/errors.h"

#include <trantor/utils/Logger.h>

#include <set>
#include <stdexcept>
#include <utility>

using namespace std;

namespace lexsched
{
    namespace
    {
        template <typename T>
        unordered_map<string, size_t> index_by_id(const vector<T> &items, const string &what)
        {
            unordered_map<string, size_t> index;
            set<string> duplicates;
            for (size_t i = 0; i < items.size(); ++i)
            {
                if (items[i].id.empty())
                    throw LoadError("Empty " + what + " id at position " + std::to_string(i));
                if (!index.emplace(items[i].id, i).second)
                    duplicates.insert(items[i].id);
            }
            if (!duplicates.empty())
            {
                string list;
                for (const auto &d : duplicates)
                    list += (list.empty() ? "" : ", ") + d;
                throw LoadError("Duplicate " + what + " ids found: " + list);
            }
            return index;
        }

        void normalize_slot(TimeSlot &slot)
        {
            try
            {
                slot.day_mask = parse_days(slot.days);
                slot.start_minutes = time_to_minutes(slot.start);
                slot.end_minutes = time_to_minutes(slot.end);
            }
            catch (const invalid_argument &e)
            {
                throw LoadError("Time slot '" + slot.id + "': " + e.what());
            }
            if (slot.start_minutes >= slot.end_minutes)
                throw LoadError("Time slot '" + slot.id + "' ends before it starts");
        }
    } // anonymous namespace

    Catalog Catalog::load(vector<Course> courses,
                          vector<Room> rooms,
                          vector<TimeSlot> time_slots,
                          vector<Instructor> instructors)
    {
        Catalog catalog;
        catalog.course_index_ = index_by_id(courses, "course");
        catalog.room_index_ = index_by_id(rooms, "room");
        catalog.slot_index_ = index_by_id(time_slots, "time slot");
        index_by_id(instructors, "instructor");

        for (const auto &ins : instructors)
            catalog.courses_by_instructor_[ins.id];

        for (auto &slot : time_slots)
            normalize_slot(slot);

        for (const auto &room : rooms)
        {
            if (room.capacity < 0)
                throw LoadError("Room '" + room.id + "' has negative capacity");
        }

        // ---------- referential integrity ----------
        for (const auto &c : courses)
        {
            if (c.enrollment < 0)
                throw LoadError("Course '" + c.id + "' has negative enrollment");

            auto it = catalog.courses_by_instructor_.find(c.instructor);
            if (it == catalog.courses_by_instructor_.end())
                throw LoadError("Course '" + c.id + "' references unknown instructor '" + c.instructor + "'");
            it->second.push_back(c.id);

            if (!c.force_room.empty() && !catalog.room_index_.count(c.force_room))
                throw LoadError("Course '" + c.id + "' is forced into unknown room '" + c.force_room + "'");
            if (!c.force_time_slot.empty() && !catalog.slot_index_.count(c.force_time_slot))
                throw LoadError("Course '" + c.id + "' is forced into unknown time slot '" + c.force_time_slot + "'");
        }

        catalog.courses_ = std::move(courses);
        catalog.rooms_ = std::move(rooms);
        catalog.time_slots_ = std::move(time_slots);
        catalog.instructors_ = std::move(instructors);

        LOG_INFO << "Catalog loaded: " << catalog.courses_.size() << " courses, "
                 << catalog.rooms_.size() << " rooms, "
                 << catalog.time_slots_.size() << " time slots, "
                 << catalog.instructors_.size() << " instructors";
        return catalog;
    }

    const Course &Catalog::course(const string &id) const
    {
        auto it = course_index_.find(id);
        if (it == course_index_.end())
            throw out_of_range("Unknown course '" + id + "'");
        return courses_[it->second];
    }

    const Room &Catalog::room(const string &id) const
    {
        auto it = room_index_.find(id);
        if (it == room_index_.end())
            throw out_of_range("Unknown room '" + id + "'");
        return rooms_[it->second];
    }

    const TimeSlot &Catalog::time_slot(const string &id) const
    {
        auto it = slot_index_.find(id);
        if (it == slot_index_.end())
            throw out_of_range("Unknown time slot '" + id + "'");
        return time_slots_[it->second];
    }

    const vector<string> &Catalog::courses_of(const string &instructor) const
    {
        static const vector<string> none;
        auto it = courses_by_instructor_.find(instructor);
        return it == courses_by_instructor_.end() ? none : it->second;
    }
}
