#include "schedule.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cronreg {

bool validate_schedule(const std::string& schedule) {
    // Split by whitespace, expect exactly 5 fields
    std::istringstream stream(schedule);
    std::vector<std::string> fields;
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }

    if (fields.size() != 5) return false;

    for (const auto& f : fields) {
        if (f.empty()) return false;
        for (char c : f) {
            if (!((c >= '0' && c <= '9') || c == '*' || c == '/' ||
                  c == '-' || c == ',')) {
                return false;
            }
        }
    }
    return true;
}

ScheduleTable::ScheduleTable()
    : tiers_{{kProduction, kProductionSchedule},
             {kDevelopment, kDevelopmentSchedule}},
      fallback_tier_(kDevelopment) {}

ScheduleTable::ScheduleTable(std::map<std::string, std::string> tiers,
                             std::string fallback_tier)
    : tiers_(std::move(tiers)), fallback_tier_(std::move(fallback_tier)) {
    for (const auto& [mode, schedule] : tiers_) {
        if (!validate_schedule(schedule)) {
            throw std::invalid_argument("Invalid cron schedule for tier " + mode +
                                        ": " + schedule);
        }
    }
    if (tiers_.find(fallback_tier_) == tiers_.end()) {
        throw std::invalid_argument("Fallback tier not in schedule table: " +
                                    fallback_tier_);
    }
}

bool ScheduleTable::set_tier(const std::string& mode, const std::string& schedule) {
    if (mode.empty() || !validate_schedule(schedule)) return false;
    tiers_[mode] = schedule;
    return true;
}

bool ScheduleTable::has_tier(const std::string& mode) const {
    return tiers_.find(mode) != tiers_.end();
}

ScheduleChoice ScheduleTable::select(const std::string& mode) const {
    auto it = tiers_.find(mode);
    if (it != tiers_.end()) {
        return ScheduleChoice{it->first, it->second, false};
    }
    return ScheduleChoice{fallback_tier_, tiers_.at(fallback_tier_), true};
}

} // namespace cronreg
