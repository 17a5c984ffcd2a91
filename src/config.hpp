#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "schedule.hpp"

namespace cronreg {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The scheduled job itself. The entry point doubles as the identifying
// text for entries written before marker tags existed.
struct JobConfig {
    std::string label = "review_processing";
    std::string entry_point = "manage.py process_reviews";
    std::vector<std::string> args;
    std::string log_subdir = "logs";
    std::string log_file = "review_processing.log";
};

struct Config {
    std::string project_path = "/app";
    std::string interpreter_path = "python";
    std::string environment = ScheduleTable::kDevelopment;

    ScheduleTable schedules;
    bool strict_environment = false;   // unknown mode is an error instead of a fallback
    bool adopt_legacy_entries = true;  // also replace untagged lines naming the entry point

    std::string crontab_command = "crontab";
    std::string lock_path;  // empty = $XDG_RUNTIME_DIR/cronreg.lock or ~/.cronreg/cronreg.lock
    uint32_t lock_timeout_ms = 30000;
    std::string temp_dir;   // empty = system temp directory

    JobConfig job;

    // Load from $CRONREG_CONFIG or ~/.cronreg/config.json, then env vars
    static Config load();

    // Build from an already-parsed JSON document (missing keys keep defaults)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply DJANGO_PROJECT_PATH, PYTHON_PATH, ENVIRONMENT and CRONREG_* overrides
    void apply_env();

    std::string log_dir() const;
    std::string log_path() const;
    std::string resolved_temp_dir() const;
    // Never in a shared directory such as /tmp; throws ConfigError if no
    // per-user location can be determined.
    std::string resolved_lock_path() const;
};

// Path of the config file load() reads
std::string config_file_path();

} // namespace cronreg
