#pragma once

#include "scheduler/cp_sat_solver.h"

#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>

#include <cstdint>
#include <string>

namespace lexsched
{
    // Where the catalog records come from. instructors may be empty.
    struct DataSources
    {
        std::string rooms;
        std::string courses;
        std::string time_slots;
        std::string instructors;
    };

    struct ServerOptions
    {
        std::string address = "0.0.0.0";
        std::uint16_t port = 8080;
        std::size_t threads = 1;
    };

    struct SchedulerConfig
    {
        DataSources data;
        SolverOptions solver;
        nlohmann::json constraints; // null = default hard constraints
        nlohmann::json objectives = nlohmann::json::array();
        ServerOptions server;
        std::string log_level = "info";
    };

    /**
     * Parses a configuration document. Relative data paths are resolved
     * against base_dir when it is non-empty. Unknown keys, mistyped values
     * and out-of-range numbers raise ConfigError.
     */
    SchedulerConfig config_from_json(const nlohmann::json &j_config, const std::string &base_dir = "");

    SchedulerConfig load_config(const std::string &path);

    // { max_time_in_seconds?, num_search_workers?, log_search_progress? } over fallback
    SolverOptions solver_options_from_json(const nlohmann::json &j_solver, SolverOptions fallback = {});

    trantor::Logger::LogLevel parse_log_level(const std::string &level);
    void apply_log_level(const std::string &level);
}
