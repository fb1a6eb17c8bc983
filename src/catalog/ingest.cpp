#include "catalog/ingest.h"
#include "config/config.h"
#include "scheduler/errors.h"

#include <trantor/utils/Logger.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>

using json = nlohmann::json;
using namespace std;

namespace lexsched
{
    namespace
    {
        template <typename T>
        T required(const json &j, const char *key, const string &what)
        {
            if (!j.contains(key))
                throw LoadError(what + " is missing field '" + key + "'");
            try
            {
                return j.at(key).get<T>();
            }
            catch (const json::exception &e)
            {
                throw LoadError(what + " field '" + key + "': " + e.what());
            }
        }

        int required_int(const json &j, const char *key, const string &what)
        {
            if (!j.contains(key))
                throw LoadError(what + " is missing field '" + key + "'");
            const json &v = j.at(key);
            if (!v.is_number_integer())
                throw LoadError(what + " field '" + key + "' must be an integer");
            bool in_range = v.is_number_unsigned()
                                ? v.get<uint64_t>() <= static_cast<uint64_t>(numeric_limits<int>::max())
                                : v.get<int64_t>() >= numeric_limits<int>::min() &&
                                      v.get<int64_t>() <= numeric_limits<int>::max();
            if (!in_range)
                throw LoadError(what + " field '" + key + "' is out of range");
            return static_cast<int>(v.get<int64_t>());
        }

        template <typename T>
        T optional_field(const json &j, const char *key, const T &fallback, const string &what)
        {
            if (!j.contains(key) || j.at(key).is_null())
                return fallback;
            try
            {
                return j.at(key).get<T>();
            }
            catch (const json::exception &e)
            {
                throw LoadError(what + " field '" + key + "': " + e.what());
            }
        }

        const json &require_array(const json &j, const string &what)
        {
            if (!j.is_array())
                throw LoadError(what + " must be a JSON array");
            return j;
        }

        string record_name(const string &kind, size_t pos, const json &j)
        {
            if (j.is_object() && j.contains("id") && j["id"].is_string())
                return kind + " '" + j["id"].get<string>() + "'";
            return kind + " #" + std::to_string(pos);
        }

        void require_object(const json &j, const string &what)
        {
            if (!j.is_object())
                throw LoadError(what + " must be a JSON object");
        }
    } // anonymous namespace

    vector<Course> courses_from_json(const json &j_courses)
    {
        vector<Course> courses;
        size_t pos = 0;
        for (const auto &jc : require_array(j_courses, "courses"))
        {
            string what = record_name("course", pos++, jc);
            require_object(jc, what);

            Course c;
            c.id = required<string>(jc, "id", what);
            c.instructor = required<string>(jc, "instructor", what);
            c.enrollment = required_int(jc, "enrollment", what);
            c.type = optional_field<string>(jc, "type", "", what);
            c.force_room = optional_field<string>(jc, "force_room", "", what);
            c.force_time_slot = optional_field<string>(jc, "force_time_slot", "", what);
            courses.push_back(std::move(c));
        }
        return courses;
    }

    vector<Room> rooms_from_json(const json &j_rooms)
    {
        vector<Room> rooms;
        size_t pos = 0;
        for (const auto &jr : require_array(j_rooms, "rooms"))
        {
            string what = record_name("room", pos++, jr);
            require_object(jr, what);

            Room r;
            r.id = required<string>(jr, "id", what);
            r.capacity = required_int(jr, "capacity", what);
            rooms.push_back(std::move(r));
        }
        return rooms;
    }

    vector<TimeSlot> time_slots_from_json(const json &j_slots)
    {
        vector<TimeSlot> slots;
        size_t pos = 0;
        for (const auto &js : require_array(j_slots, "time_slots"))
        {
            string what = record_name("time slot", pos++, js);
            require_object(js, what);

            TimeSlot s;
            s.id = required<string>(js, "id", what);
            s.days = required<string>(js, "days", what);
            s.start = required<string>(js, "start", what);
            s.end = required<string>(js, "end", what);
            s.type = optional_field<string>(js, "type", "", what);
            slots.push_back(std::move(s));
        }
        return slots;
    }

    vector<Instructor> instructors_from_json(const json &j_instructors)
    {
        vector<Instructor> instructors;
        size_t pos = 0;
        for (const auto &ji : require_array(j_instructors, "instructors"))
        {
            // plain strings are accepted as bare ids
            if (ji.is_string())
            {
                instructors.push_back({ji.get<string>(), ""});
                ++pos;
                continue;
            }
            string what = record_name("instructor", pos++, ji);
            require_object(ji, what);

            Instructor ins;
            ins.id = required<string>(ji, "id", what);
            ins.name = optional_field<string>(ji, "name", "", what);
            instructors.push_back(std::move(ins));
        }
        return instructors;
    }

    vector<Instructor> derive_instructors(const vector<Course> &courses)
    {
        vector<Instructor> instructors;
        set<string> seen;
        for (const auto &c : courses)
        {
            if (c.instructor.empty() || !seen.insert(c.instructor).second)
                continue;
            instructors.push_back({c.instructor, ""});
        }
        return instructors;
    }

    Catalog catalog_from_json(const json &j_problem)
    {
        if (!j_problem.is_object() || !j_problem.contains("rooms") || !j_problem.contains("courses") || !j_problem.contains("time_slots"))
        {
            throw LoadError("Input JSON must contain keys: rooms, courses, time_slots");
        }

        vector<Course> courses = courses_from_json(j_problem["courses"]);
        vector<Room> rooms = rooms_from_json(j_problem["rooms"]);
        vector<TimeSlot> slots = time_slots_from_json(j_problem["time_slots"]);
        vector<Instructor> instructors = j_problem.contains("instructors")
                                             ? instructors_from_json(j_problem["instructors"])
                                             : derive_instructors(courses);

        return Catalog::load(std::move(courses), std::move(rooms), std::move(slots), std::move(instructors));
    }

    json read_json_file(const string &filename)
    {
        ifstream f(filename);
        if (!f.is_open())
        {
            throw LoadError("Cannot open file: " + filename);
        }
        try
        {
            json j;
            f >> j;
            return j;
        }
        catch (const json::exception &e)
        {
            throw LoadError("Malformed JSON in " + filename + ": " + e.what());
        }
    }

    Catalog load_catalog(const DataSources &sources)
    {
        if (sources.rooms.empty() || sources.courses.empty() || sources.time_slots.empty())
            throw LoadError("Data sources for rooms, courses and time_slots must all be configured");

        vector<Room> rooms = rooms_from_json(read_json_file(sources.rooms));
        LOG_INFO << "Loaded " << rooms.size() << " rooms from " << sources.rooms;
        vector<Course> courses = courses_from_json(read_json_file(sources.courses));
        LOG_INFO << "Loaded " << courses.size() << " courses from " << sources.courses;
        vector<TimeSlot> slots = time_slots_from_json(read_json_file(sources.time_slots));
        LOG_INFO << "Loaded " << slots.size() << " time slots from " << sources.time_slots;

        vector<Instructor> instructors;
        if (!sources.instructors.empty())
        {
            instructors = instructors_from_json(read_json_file(sources.instructors));
            LOG_INFO << "Loaded " << instructors.size() << " instructors from " << sources.instructors;
        }
        else
        {
            instructors = derive_instructors(courses);
            LOG_DEBUG << "No instructor source configured, derived " << instructors.size() << " from courses";
        }

        return Catalog::load(std::move(courses), std::move(rooms), std::move(slots), std::move(instructors));
    }
}
