#pragma once
#include "config.hpp"
#include <string>
#include <vector>

namespace cronreg {

using CrontabLines = std::vector<std::string>;

// Split crontab text into lines; a trailing newline does not add an empty line
CrontabLines parse_table(const std::string& text);

// Join lines with '\n' plus a final newline (crontab requires one).
// An empty table renders as "".
std::string render_table(const CrontabLines& lines);

// True if the line is one of this job's entries: it carries the job's marker
// tag, or (with adopt_legacy) it is an untagged non-comment line containing
// the job's identifying text.
bool is_job_entry(const std::string& line, const JobConfig& job, bool adopt_legacy);

// Drop every entry of the job, keep all other lines in order, append new_entry
CrontabLines replace_job_entries(const CrontabLines& lines, const JobConfig& job,
                                 const std::string& new_entry, bool adopt_legacy);

// Drop every entry of the job; returns the remaining lines
CrontabLines remove_job_entries(const CrontabLines& lines, const JobConfig& job,
                                bool adopt_legacy);

CrontabLines find_job_entries(const CrontabLines& lines, const JobConfig& job,
                              bool adopt_legacy);

} // namespace cronreg
