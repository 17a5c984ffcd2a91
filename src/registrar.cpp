#include "registrar.hpp"
#include "file_lock.hpp"
#include "job.hpp"
#include "util.hpp"

#include <filesystem>
#include <system_error>

namespace cronreg {

Registrar::Registrar(const Config& config, CrontabStore& store)
    : config_(config), store_(store) {}

InstallPlan Registrar::plan() const {
    if (config_.strict_environment && !config_.schedules.has_tier(config_.environment)) {
        throw ConfigError("Unknown environment mode '" + config_.environment +
                          "' (strict_environment is enabled)");
    }

    ScheduleChoice choice = config_.schedules.select(config_.environment);

    InstallPlan p;
    p.environment = config_.environment;
    p.tier = choice.tier;
    p.fallback = choice.fallback;
    p.schedule = choice.schedule;
    p.command = compose_command(config_);
    p.entry = entry_line(choice.schedule, config_);
    p.log_dir = config_.log_dir();
    p.log_path = config_.log_path();
    return p;
}

static void ensure_log_dir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory " + dir + ": " +
                                 ec.message());
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        throw std::runtime_error("Log directory path is not a directory: " + dir);
    }
}

FileLock Registrar::acquire_lock() const {
    return FileLock(config_.resolved_lock_path(),
                    std::chrono::milliseconds(config_.lock_timeout_ms));
}

InstallReport Registrar::install() {
    InstallReport report;
    report.plan = plan();

    ensure_log_dir(report.plan.log_dir);

    {
        FileLock lock = acquire_lock();

        std::string before = store_.read();
        std::string after = render_table(
            replace_job_entries(parse_table(before), config_.job, report.plan.entry,
                                config_.adopt_legacy_entries));

        if (after != before) {
            store_.write(after);
            report.changed = true;
        }
    }

    report.installed = status();
    return report;
}

size_t Registrar::remove() {
    FileLock lock = acquire_lock();

    CrontabLines lines = parse_table(store_.read());
    CrontabLines kept = remove_job_entries(lines, config_.job,
                                           config_.adopt_legacy_entries);
    size_t removed = lines.size() - kept.size();
    if (removed > 0) {
        store_.write(render_table(kept));
    }
    return removed;
}

CrontabLines Registrar::status() {
    return find_job_entries(parse_table(store_.read()), config_.job,
                            config_.adopt_legacy_entries);
}

std::string Registrar::preview() {
    InstallPlan p = plan();
    return render_table(replace_job_entries(parse_table(store_.read()), config_.job,
                                            p.entry, config_.adopt_legacy_entries));
}

std::string Registrar::removal_command() const {
    std::string tool = shell_quote(config_.crontab_command);
    return tool + " -l | grep -v " + shell_quote(identifying_text(config_.job)) +
           " | " + tool + " -";
}

} // namespace cronreg
