#include "config.hpp"
#include "util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace cronreg {

nlohmann::json Config::defaults_json() {
    return {
        {"project_path", "/app"},
        {"interpreter_path", "python"},
        {"environment", ScheduleTable::kDevelopment},
        {"schedules", {
            {ScheduleTable::kProduction, ScheduleTable::kProductionSchedule},
            {ScheduleTable::kDevelopment, ScheduleTable::kDevelopmentSchedule}
        }},
        {"fallback_tier", ScheduleTable::kDevelopment},
        {"strict_environment", false},
        {"adopt_legacy_entries", true},
        {"crontab_command", "crontab"},
        {"lock_path", ""},
        {"lock_timeout_ms", 30000},
        {"temp_dir", ""},
        {"job", {
            {"label", "review_processing"},
            {"entry_point", "manage.py process_reviews"},
            {"args", nlohmann::json::array()},
            {"log_subdir", "logs"},
            {"log_file", "review_processing.log"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object() && key != "schedules") {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string())
        out = j[key].get<std::string>();
}

static void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean())
        out = j[key].get<bool>();
}

static ScheduleTable parse_schedules(const nlohmann::json& j) {
    std::string fallback = ScheduleTable::kDevelopment;
    read_string(j, "fallback_tier", fallback);
    if (fallback.empty()) fallback = ScheduleTable::kDevelopment;

    ScheduleTable table({{fallback, ScheduleTable::kDevelopmentSchedule}}, fallback);

    if (j.contains("schedules") && j["schedules"].is_object()) {
        for (const auto& [mode, expr] : j["schedules"].items()) {
            if (!expr.is_string() || !table.set_tier(mode, expr.get<std::string>())) {
                std::cerr << "[config] Ignoring invalid schedule for tier '" << mode
                          << "': " << expr.dump() << "\n";
            }
        }
    }
    return table;
}

Config Config::from_json(const nlohmann::json& source) {
    nlohmann::json j = merge_defaults(source, defaults_json());
    Config cfg;

    read_string(j, "project_path", cfg.project_path);
    read_string(j, "interpreter_path", cfg.interpreter_path);
    read_string(j, "environment", cfg.environment);
    read_bool(j, "strict_environment", cfg.strict_environment);
    read_bool(j, "adopt_legacy_entries", cfg.adopt_legacy_entries);
    read_string(j, "crontab_command", cfg.crontab_command);
    read_string(j, "lock_path", cfg.lock_path);
    read_string(j, "temp_dir", cfg.temp_dir);
    if (j.contains("lock_timeout_ms") && j["lock_timeout_ms"].is_number_unsigned())
        cfg.lock_timeout_ms = j["lock_timeout_ms"].get<uint32_t>();

    cfg.schedules = parse_schedules(j);

    if (j.contains("job") && j["job"].is_object()) {
        auto& job = j["job"];
        read_string(job, "label", cfg.job.label);
        read_string(job, "entry_point", cfg.job.entry_point);
        read_string(job, "log_subdir", cfg.job.log_subdir);
        read_string(job, "log_file", cfg.job.log_file);
        if (job.contains("args") && job["args"].is_array()) {
            cfg.job.args.clear();
            for (const auto& arg : job["args"]) {
                if (arg.is_string())
                    cfg.job.args.push_back(arg.get<std::string>());
            }
        }
    }

    if (cfg.job.label.empty() || cfg.job.entry_point.empty()) {
        throw ConfigError("job.label and job.entry_point must not be empty");
    }

    return cfg;
}

std::string config_file_path() {
    if (auto v = env_value("CRONREG_CONFIG"))
        return expand_home(*v);
    return expand_home("~/.cronreg/config.json");
}

Config Config::load() {
    std::string path = config_file_path();
    nlohmann::json j = nlohmann::json::object();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[config] Malformed config " << path << ", using defaults: "
                      << e.what() << "\n";
            j = nlohmann::json::object();
        }
        if (!j.is_object()) {
            std::cerr << "[config] Config " << path << " is not a JSON object, using defaults\n";
            j = nlohmann::json::object();
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override the config file
    if (auto v = env_value("DJANGO_PROJECT_PATH"))
        project_path = *v;
    if (auto v = env_value("PYTHON_PATH"))
        interpreter_path = *v;
    if (auto v = env_value("ENVIRONMENT"))
        environment = *v;
    if (auto v = env_value("CRONREG_CRONTAB"))
        crontab_command = *v;
    if (auto v = env_value("CRONREG_LOCK_PATH"))
        lock_path = *v;
}

std::string Config::log_dir() const {
    return join_path(project_path, job.log_subdir);
}

std::string Config::log_path() const {
    return join_path(log_dir(), job.log_file);
}

std::string Config::resolved_temp_dir() const {
    if (!temp_dir.empty()) return expand_home(temp_dir);
    return std::filesystem::temp_directory_path().string();
}

std::string Config::resolved_lock_path() const {
    if (!lock_path.empty()) return expand_home(lock_path);

    // XDG_RUNTIME_DIR is owned by the user and mode 0700
    if (auto v = env_value("XDG_RUNTIME_DIR")) {
        if (!v->empty() && v->front() == '/')
            return join_path(*v, "cronreg.lock");
    }

    std::string home = expand_home("~");
    if (home.empty() || home.front() != '/') {
        throw ConfigError("Cannot determine a per-user lock location; set CRONREG_LOCK_PATH");
    }
    return join_path(join_path(home, ".cronreg"), "cronreg.lock");
}

} // namespace cronreg
