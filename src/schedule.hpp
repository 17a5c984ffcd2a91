#pragma once
#include <map>
#include <string>

namespace cronreg {

// Validate a five-field cron schedule (minute hour day-of-month month day-of-week).
// Each field may contain only 0-9 * / - ,
bool validate_schedule(const std::string& schedule);

struct ScheduleChoice {
    std::string tier;      // tier actually used
    std::string schedule;
    bool fallback = false; // requested mode was not in the table
};

// Schedule expressions keyed by environment mode, with one fallback tier
// for every mode the table does not know.
class ScheduleTable {
public:
    static constexpr const char* kProduction = "production";
    static constexpr const char* kDevelopment = "development";
    static constexpr const char* kProductionSchedule = "0 2 * * *";    // daily at 02:00
    static constexpr const char* kDevelopmentSchedule = "*/5 * * * *"; // every 5 minutes

    // Built-in table: production daily, everything else every 5 minutes
    ScheduleTable();

    ScheduleTable(std::map<std::string, std::string> tiers, std::string fallback_tier);

    // Returns false (and leaves the table unchanged) if the schedule is invalid
    bool set_tier(const std::string& mode, const std::string& schedule);

    bool has_tier(const std::string& mode) const;

    ScheduleChoice select(const std::string& mode) const;

    const std::string& fallback_tier() const { return fallback_tier_; }
    const std::map<std::string, std::string>& tiers() const { return tiers_; }

private:
    std::map<std::string, std::string> tiers_;
    std::string fallback_tier_;
};

} // namespace cronreg
