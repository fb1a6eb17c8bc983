#pragma once

#include "catalog/catalog.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lexsched
{
    struct DataSources;

    // Record arrays -> typed records. Missing or mistyped fields raise LoadError.
    std::vector<Course> courses_from_json(const nlohmann::json &j_courses);
    std::vector<Room> rooms_from_json(const nlohmann::json &j_rooms);
    std::vector<TimeSlot> time_slots_from_json(const nlohmann::json &j_slots);
    std::vector<Instructor> instructors_from_json(const nlohmann::json &j_instructors);

    // One instructor per distinct course instructor id, in order of first appearance.
    std::vector<Instructor> derive_instructors(const std::vector<Course> &courses);

    // Combined problem document: { rooms, courses, time_slots, instructors? }
    Catalog catalog_from_json(const nlohmann::json &j_problem);

    // Reads every source named by the configuration.
    Catalog load_catalog(const DataSources &sources);

    nlohmann::json read_json_file(const std::string &filename);
}
