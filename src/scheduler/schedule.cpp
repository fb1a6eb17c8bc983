#include "scheduler/schedule.h"

#include <algorithm>
#include <iomanip>
#include <stdexcept>
#include <tuple>

using json = nlohmann::json;
using namespace std;

namespace lexsched
{
    Schedule Schedule::from_solution(const Catalog &catalog, const AssignmentSpace &space,
                                     const vector<int64_t> &values)
    {
        if (values.size() < space.size())
            throw invalid_argument("Solution has " + std::to_string(values.size()) + " values for " +
                                   std::to_string(space.size()) + " decision variables");

        Schedule schedule;
        for (VarIndex i = 0; i < space.size(); ++i)
        {
            if (values[i] != 1)
                continue;
            const AssignmentKey &k = space.key(i);
            const Course &course = catalog.course(k.course);
            const TimeSlot &slot = catalog.time_slot(k.time_slot);

            ScheduledCourse sc;
            sc.course = course.id;
            sc.instructor = course.instructor;
            sc.room = k.room;
            sc.time_slot = slot.id;
            sc.days = slot.days;
            sc.start = slot.start;
            sc.end = slot.end;
            sc.enrollment = course.enrollment;
            schedule.entries_.push_back(std::move(sc));
        }

        // day pattern, then start time, then room
        sort(schedule.entries_.begin(), schedule.entries_.end(),
             [&catalog](const ScheduledCourse &a, const ScheduledCourse &b)
             {
                 const TimeSlot &sa = catalog.time_slot(a.time_slot);
                 const TimeSlot &sb = catalog.time_slot(b.time_slot);
                 return tie(sa.days, sa.start_minutes, a.room, a.course) <
                        tie(sb.days, sb.start_minutes, b.room, b.course);
             });
        return schedule;
    }

    const ScheduledCourse *Schedule::find(const string &course) const
    {
        for (const auto &e : entries_)
            if (e.course == course)
                return &e;
        return nullptr;
    }

    void print_schedule(ostream &os, const Schedule &schedule)
    {
        if (schedule.empty())
        {
            os << "No assignments in schedule.\n";
            return;
        }

        os << "Optimized Schedule:\n";
        os << left << setw(16) << "Course" << setw(14) << "Room" << setw(8) << "Days"
           << setw(8) << "Start" << setw(8) << "End" << setw(16) << "Instructor" << "Enrollment\n";
        for (const auto &e : schedule.entries())
        {
            os << left << setw(16) << e.course << setw(14) << e.room << setw(8) << e.days
               << setw(8) << e.start << setw(8) << e.end << setw(16) << e.instructor << e.enrollment << "\n";
        }
    }

    void print_stages(ostream &os, const vector<StageOutcome> &stages)
    {
        for (const auto &s : stages)
        {
            os << "[" << s.index << "] " << s.name << ": " << s.value;
            if (s.frozen)
                os << " (frozen " << (s.sense == Sense::Minimize ? "<= " : ">= ") << s.bound
                   << ", tolerance " << s.tolerance * 100.0 << "%)";
            os << "\n";
        }
    }

    json schedule_to_json(const Schedule &schedule)
    {
        json out = json::array();
        for (const auto &e : schedule.entries())
        {
            json ja;
            ja["course"] = e.course;
            ja["instructor"] = e.instructor;
            ja["room"] = e.room;
            ja["time_slot"] = e.time_slot;
            ja["days"] = e.days;
            ja["start"] = e.start;
            ja["end"] = e.end;
            ja["enrollment"] = e.enrollment;
            out.push_back(ja);
        }
        return out;
    }

    json stages_to_json(const vector<StageOutcome> &stages)
    {
        json out = json::array();
        for (const auto &s : stages)
        {
            json js;
            js["index"] = s.index;
            js["objective"] = s.name;
            js["sense"] = sense_name(s.sense);
            js["value"] = s.value;
            js["tolerance"] = s.tolerance;
            js["bound"] = s.bound;
            js["frozen"] = s.frozen;
            out.push_back(js);
        }
        return out;
    }

    json failure_to_json(const FailureContext &context)
    {
        json out;
        out["stage"] = context.stage;
        if (!context.objective_name.empty())
            out["objective"] = context.objective_name;
        out["completed"] = stages_to_json(context.completed);
        return out;
    }
}
