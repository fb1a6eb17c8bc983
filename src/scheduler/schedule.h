#pragma once

#include "catalog/catalog.h"
#include "scheduler/assignment_space.h"
#include "scheduler/stage.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace lexsched
{
    struct ScheduledCourse
    {
        std::string course;
        std::string instructor;
        std::string room;
        std::string time_slot;
        std::string days;
        std::string start;
        std::string end;
        int enrollment = 0;
    };

    // Read-only view of a solved schedule: where each course was placed.
    class Schedule
    {
    public:
        Schedule() = default;

        // values holds at least one entry per decision variable (auxiliaries ignored)
        static Schedule from_solution(const Catalog &catalog, const AssignmentSpace &space,
                                      const std::vector<std::int64_t> &values);

        const std::vector<ScheduledCourse> &entries() const { return entries_; }
        bool empty() const { return entries_.empty(); }
        std::size_t size() const { return entries_.size(); }

        // nullptr when the course is not in the schedule
        const ScheduledCourse *find(const std::string &course) const;

    private:
        std::vector<ScheduledCourse> entries_;
    };

    void print_schedule(std::ostream &os, const Schedule &schedule);
    void print_stages(std::ostream &os, const std::vector<StageOutcome> &stages);

    nlohmann::json schedule_to_json(const Schedule &schedule);
    nlohmann::json stages_to_json(const std::vector<StageOutcome> &stages);

    // { stage, objective?, completed: [...] }
    nlohmann::json failure_to_json(const FailureContext &context);
}
