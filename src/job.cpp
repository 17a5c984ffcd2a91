#include "job.hpp"
#include "util.hpp"

namespace cronreg {

static std::string strip_trailing_slashes(const std::string& path) {
    std::string out = path;
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

// A newline (or any control character) would split the crontab line even
// inside quotes, so such values never reach the table.
static void reject_control_chars(const char* what, const std::string& value) {
    for (unsigned char c : value) {
        if (c < 0x20 || c == 0x7f) {
            throw ConfigError(std::string(what) + " contains a control character: " +
                              replace_all(value, "\n", "\\n"));
        }
    }
}

std::string compose_command(const Config& cfg) {
    reject_control_chars("project_path", cfg.project_path);
    reject_control_chars("interpreter_path", cfg.interpreter_path);
    reject_control_chars("job.entry_point", cfg.job.entry_point);
    reject_control_chars("job.log_subdir", cfg.job.log_subdir);
    reject_control_chars("job.log_file", cfg.job.log_file);
    for (const auto& arg : cfg.job.args) {
        reject_control_chars("job.args", arg);
    }

    // The entry point is a command fragment ("manage.py process_reviews"),
    // emitted verbatim; paths and extra args are quoted when needed.
    std::string cmd = "cd " + shell_quote(strip_trailing_slashes(cfg.project_path)) +
                      " && " + shell_quote(cfg.interpreter_path) +
                      " " + cfg.job.entry_point;
    for (const auto& arg : cfg.job.args) {
        cmd += " " + shell_quote(arg);
    }
    cmd += " >> " + shell_quote(cfg.log_path()) + " 2>&1";
    return cmd;
}

std::string marker_tag(const JobConfig& job) {
    return std::string(kMarkerPrefix) + job.label;
}

std::string entry_line(const std::string& schedule, const Config& cfg) {
    return schedule + " " + replace_all(compose_command(cfg), "%", "\\%") +
           " " + marker_tag(cfg.job);
}

const std::string& identifying_text(const JobConfig& job) {
    return job.entry_point;
}

} // namespace cronreg
