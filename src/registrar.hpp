#pragma once
#include "config.hpp"
#include "crontab.hpp"
#include "crontab_table.hpp"
#include "file_lock.hpp"
#include <string>

namespace cronreg {

// What an install would put in the table for the current config
struct InstallPlan {
    std::string environment;  // mode as requested
    std::string tier;         // tier actually selected
    bool fallback = false;
    std::string schedule;
    std::string command;
    std::string entry;        // full crontab line
    std::string log_dir;
    std::string log_path;
};

struct InstallReport {
    InstallPlan plan;
    bool changed = false;      // false if the table already matched
    CrontabLines installed;    // this job's entries after the install
};

// Installs, replaces and removes the job's crontab entry.
// Every table mutation runs as read-filter-write under the config's lock file.
class Registrar {
public:
    Registrar(const Config& config, CrontabStore& store);

    // Throws ConfigError if strict_environment is set and the mode is unknown
    InstallPlan plan() const;

    // Idempotent install: exactly one entry for the job afterwards, all other
    // lines untouched. Throws on failure, leaving the table as it was.
    InstallReport install();

    // Remove the job's entries; returns how many were removed
    size_t remove();

    CrontabLines status();

    // Table text install() would write, without touching anything
    std::string preview();

    // Manual uninstall command printed for operators
    std::string removal_command() const;

private:
    FileLock acquire_lock() const;

    const Config& config_;
    CrontabStore& store_;
};

} // namespace cronreg
