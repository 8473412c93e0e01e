#pragma once

#include <bitset>
#include <ctime>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace focusguard {

/**
 * CronSchedule is a parsed five-field cron expression:
 *   minute hour day-of-month month day-of-week
 *
 * Each field accepts "*", single values, ranges "a-b", lists "a,b" and a
 * "/n" step suffix on "*" or a range. Months and weekdays also accept
 * three-letter English names, and weekday 7 is Sunday. When both day fields are restricted a time
 * matches if either one matches, as in classic cron.
 */
class CronSchedule {
public:
    // Returns nullopt and fills error when the expression is malformed.
    static std::optional<CronSchedule> parse(const std::string &expression,
                                             std::string *error = nullptr);

    bool matches(const std::tm &localTime) const;
    // Evaluated in the process's local time zone at minute granularity.
    bool matches(TimePoint time) const;

private:
    CronSchedule() = default;

    std::bitset<60> m_minutes;
    std::bitset<24> m_hours;
    std::bitset<32> m_daysOfMonth;
    std::bitset<13> m_months;
    std::bitset<7> m_daysOfWeek;
    bool m_dayOfMonthRestricted = false;
    bool m_dayOfWeekRestricted = false;
};

} // namespace focusguard
