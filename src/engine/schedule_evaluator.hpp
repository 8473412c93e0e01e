#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/cron_schedule.hpp"

namespace focusguard {

// ScheduleEvaluator decides whether rules are in force at a given instant.
// Parsed cron expressions are cached; an expression that fails to parse is
// logged once and treated as never active.
class ScheduleEvaluator {
public:
    bool isRuleActiveNow(const BlockRule &rule, TimePoint now, bool hasActiveSession) const;

    // True when any enabled, active rule resolves to a target covering the
    // given domain or process name.
    bool isBlockingActiveFor(const std::vector<BlockRule> &rules,
                             const std::string &target,
                             TimePoint now,
                             bool hasActiveSession) const;

    static bool ruleCoversTarget(const BlockRule &rule, const std::string &target);

private:
    std::optional<CronSchedule> scheduleFor(const CronExpression &cron) const;

    mutable std::mutex m_cacheMutex;
    mutable std::map<std::string, std::optional<CronSchedule>> m_cache;
};

} // namespace focusguard
