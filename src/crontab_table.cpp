#include "crontab_table.hpp"
#include "job.hpp"
#include "util.hpp"

namespace cronreg {

CrontabLines parse_table(const std::string& text) {
    CrontabLines lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string render_table(const CrontabLines& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

static bool has_marker(const std::string& line, const std::string& marker) {
    // The marker must be the last token; "# cronreg:review" must not match
    // "# cronreg:review_processing".
    std::string trimmed = trim(line);
    if (trimmed.size() < marker.size()) return false;
    if (trimmed.compare(trimmed.size() - marker.size(), marker.size(), marker) != 0)
        return false;
    if (trimmed.size() == marker.size()) return false;  // bare comment line, not an entry
    char before = trimmed[trimmed.size() - marker.size() - 1];
    return before == ' ' || before == '\t';
}

bool is_job_entry(const std::string& line, const JobConfig& job, bool adopt_legacy) {
    if (has_marker(line, marker_tag(job))) return true;
    if (!adopt_legacy) return false;

    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#') return false;
    // Untagged lines carrying another label's marker belong to that label
    if (trimmed.find(kMarkerPrefix) != std::string::npos) return false;
    return trimmed.find(identifying_text(job)) != std::string::npos;
}

CrontabLines remove_job_entries(const CrontabLines& lines, const JobConfig& job,
                                bool adopt_legacy) {
    CrontabLines kept;
    kept.reserve(lines.size());
    for (const auto& line : lines) {
        if (!is_job_entry(line, job, adopt_legacy)) {
            kept.push_back(line);
        }
    }
    return kept;
}

CrontabLines replace_job_entries(const CrontabLines& lines, const JobConfig& job,
                                 const std::string& new_entry, bool adopt_legacy) {
    CrontabLines result = remove_job_entries(lines, job, adopt_legacy);
    result.push_back(new_entry);
    return result;
}

CrontabLines find_job_entries(const CrontabLines& lines, const JobConfig& job,
                              bool adopt_legacy) {
    CrontabLines found;
    for (const auto& line : lines) {
        if (is_job_entry(line, job, adopt_legacy)) {
            found.push_back(line);
        }
    }
    return found;
}

} // namespace cronreg
