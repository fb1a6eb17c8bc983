#pragma once

#include "catalog/time_utils.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace lexsched
{
    struct Course
    {
        std::string id;
        std::string instructor;
        int enrollment = 0;
        std::string type;            // e.g. "Lecture", "Lab"; empty = any slot type
        std::string force_room;      // optional pinned room
        std::string force_time_slot; // optional pinned slot
    };

    struct Room
    {
        std::string id;
        int capacity = 0;
    };

    struct TimeSlot
    {
        std::string id;
        std::string days;  // day pattern, e.g. "MWF"
        std::string start; // "H:MM"
        std::string end;
        std::string type;

        // derived by Catalog::load
        DayMask day_mask = 0;
        int start_minutes = 0;
        int end_minutes = 0;
    };

    struct Instructor
    {
        std::string id;
        std::string name;
    };

    /**
     * Immutable, validated set of courses, rooms, time slots and instructors
     * with the lookups the model needs. Built once per scheduling session.
     */
    class Catalog
    {
    public:
        // Throws LoadError on duplicate or empty ids, unknown instructor / forced
        // room / forced slot references, negative sizes and malformed slots.
        static Catalog load(std::vector<Course> courses,
                            std::vector<Room> rooms,
                            std::vector<TimeSlot> time_slots,
                            std::vector<Instructor> instructors);

        const std::vector<Course> &courses() const { return courses_; }
        const std::vector<Room> &rooms() const { return rooms_; }
        const std::vector<TimeSlot> &time_slots() const { return time_slots_; }
        const std::vector<Instructor> &instructors() const { return instructors_; }

        bool has_room(const std::string &id) const { return room_index_.count(id) != 0; }
        bool has_instructor(const std::string &id) const { return courses_by_instructor_.count(id) != 0; }

        // Lookups throw std::out_of_range for unknown ids.
        const Course &course(const std::string &id) const;
        const Room &room(const std::string &id) const;
        const TimeSlot &time_slot(const std::string &id) const;

        int enrollment(const std::string &course) const { return this->course(course).enrollment; }
        int capacity(const std::string &room) const { return this->room(room).capacity; }
        const std::string &instructor(const std::string &course) const { return this->course(course).instructor; }
        const std::vector<std::string> &courses_of(const std::string &instructor) const;

    private:
        Catalog() = default;

        std::vector<Course> courses_;
        std::vector<Room> rooms_;
        std::vector<TimeSlot> time_slots_;
        std::vector<Instructor> instructors_;

        std::unordered_map<std::string, std::size_t> course_index_;
        std::unordered_map<std::string, std::size_t> room_index_;
        std::unordered_map<std::string, std::size_t> slot_index_;
        std::unordered_map<std::string, std::vector<std::string>> courses_by_instructor_;
    };
}
