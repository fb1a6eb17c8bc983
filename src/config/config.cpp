#include "config/config.h"
#include "catalog/ingest.h"
#include "scheduler/errors.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

using json = nlohmann::json;
using namespace std;
namespace fs = std::filesystem;

namespace lexsched
{
    namespace
    {
        void reject_unknown_keys(const json &j, const vector<string> &allowed, const string &section)
        {
            if (!j.is_object())
                throw ConfigError("'" + section + "' must be a JSON object");
            for (auto it = j.begin(); it != j.end(); ++it)
            {
                if (find(allowed.begin(), allowed.end(), it.key()) == allowed.end())
                    throw ConfigError("Unknown configuration key '" + (section.empty() ? "" : section + ".") + it.key() + "'");
            }
        }

        template <typename T>
        T value_of(const json &j, const char *key, const T &fallback, const string &section)
        {
            if (!j.contains(key) || j.at(key).is_null())
                return fallback;
            try
            {
                return j.at(key).get<T>();
            }
            catch (const json::exception &e)
            {
                throw ConfigError("Configuration key '" + section + "." + key + "' has the wrong type: " + e.what());
            }
        }

        string resolve(const string &path, const string &base_dir)
        {
            if (path.empty() || base_dir.empty() || fs::path(path).is_absolute())
                return path;
            return (fs::path(base_dir) / path).lexically_normal().string();
        }
    } // anonymous namespace

    SolverOptions solver_options_from_json(const json &j_solver, SolverOptions fallback)
    {
        reject_unknown_keys(j_solver, {"max_time_in_seconds", "num_search_workers", "log_search_progress"}, "solver");

        SolverOptions options = fallback;
        options.max_time_in_seconds = value_of<double>(j_solver, "max_time_in_seconds", options.max_time_in_seconds, "solver");
        options.num_search_workers = value_of<int>(j_solver, "num_search_workers", options.num_search_workers, "solver");
        options.log_search_progress = value_of<bool>(j_solver, "log_search_progress", options.log_search_progress, "solver");

        if (options.max_time_in_seconds <= 0.0)
            throw ConfigError("solver.max_time_in_seconds must be positive");
        if (options.num_search_workers < 1)
            throw ConfigError("solver.num_search_workers must be at least 1");
        return options;
    }

    SchedulerConfig config_from_json(const json &j_config, const string &base_dir)
    {
        reject_unknown_keys(j_config, {"data", "solver", "constraints", "objectives", "server", "log_level"}, "");

        SchedulerConfig cfg;

        // ---------- data ----------
        if (j_config.contains("data"))
        {
            const json &jd = j_config["data"];
            reject_unknown_keys(jd, {"rooms", "courses", "time_slots", "instructors"}, "data");
            cfg.data.rooms = resolve(value_of<string>(jd, "rooms", "", "data"), base_dir);
            cfg.data.courses = resolve(value_of<string>(jd, "courses", "", "data"), base_dir);
            cfg.data.time_slots = resolve(value_of<string>(jd, "time_slots", "", "data"), base_dir);
            cfg.data.instructors = resolve(value_of<string>(jd, "instructors", "", "data"), base_dir);
        }

        // ---------- solver ----------
        if (j_config.contains("solver"))
            cfg.solver = solver_options_from_json(j_config["solver"]);

        // ---------- plugins ----------
        if (j_config.contains("constraints") && !j_config["constraints"].is_null())
        {
            if (!j_config["constraints"].is_array())
                throw ConfigError("'constraints' must be a JSON array");
            cfg.constraints = j_config["constraints"];
        }
        if (j_config.contains("objectives") && !j_config["objectives"].is_null())
        {
            if (!j_config["objectives"].is_array())
                throw ConfigError("'objectives' must be a JSON array");
            cfg.objectives = j_config["objectives"];
        }

        // ---------- server ----------
        if (j_config.contains("server"))
        {
            const json &js = j_config["server"];
            reject_unknown_keys(js, {"address", "port", "threads"}, "server");
            cfg.server.address = value_of<string>(js, "address", cfg.server.address, "server");
            int port = value_of<int>(js, "port", cfg.server.port, "server");
            if (port < 1 || port > 65535)
                throw ConfigError("server.port must be within 1..65535");
            cfg.server.port = static_cast<uint16_t>(port);
            int threads = value_of<int>(js, "threads", static_cast<int>(cfg.server.threads), "server");
            if (threads < 1)
                throw ConfigError("server.threads must be at least 1");
            cfg.server.threads = static_cast<size_t>(threads);
        }

        if (j_config.contains("log_level"))
        {
            if (!j_config["log_level"].is_string())
                throw ConfigError("'log_level' must be a string");
            cfg.log_level = j_config["log_level"].get<string>();
            parse_log_level(cfg.log_level);
        }
        return cfg;
    }

    SchedulerConfig load_config(const string &path)
    {
        json j;
        try
        {
            j = read_json_file(path);
        }
        catch (const LoadError &e)
        {
            throw ConfigError(e.what());
        }
        string base_dir = fs::path(path).parent_path().string();
        return config_from_json(j, base_dir);
    }

    trantor::Logger::LogLevel parse_log_level(const string &level)
    {
        string l = level;
        transform(l.begin(), l.end(), l.begin(), [](unsigned char c)
                  { return static_cast<char>(tolower(c)); });
        if (l == "trace")
            return trantor::Logger::kTrace;
        if (l == "debug")
            return trantor::Logger::kDebug;
        if (l == "info")
            return trantor::Logger::kInfo;
        if (l == "warn" || l == "warning")
            return trantor::Logger::kWarn;
        if (l == "error")
            return trantor::Logger::kError;
        throw ConfigError("Unknown log level '" + level + "' (expected trace, debug, info, warn or error)");
    }

    void apply_log_level(const string &level)
    {
        trantor::Logger::setLogLevel(parse_log_level(level));
    }
}
