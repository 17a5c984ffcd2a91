#pragma once
#include "config.hpp"
#include <string>

namespace cronreg {

// Prefix of the trailing shell comment that tags managed entries
inline constexpr const char* kMarkerPrefix = "# cronreg:";

// cd <project> && <interpreter> <entry point> [args] >> <log path> 2>&1
// Throws ConfigError if any part contains a control character.
std::string compose_command(const Config& cfg);

// "# cronreg:<label>"
std::string marker_tag(const JobConfig& job);

// Full crontab line: "<schedule> <command> # cronreg:<label>".
// '%' is escaped because cron turns a bare '%' into a newline.
std::string entry_line(const std::string& schedule, const Config& cfg);

// Text naming the job inside a command, used to recognise untagged entries
const std::string& identifying_text(const JobConfig& job);

} // namespace cronreg
