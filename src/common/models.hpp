#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "common/enums.hpp"
#include "common/identifiers.hpp"

namespace focusguard {

using TimePoint = std::chrono::system_clock::time_point;

// What a rule blocks. The alternative held decides the rule type.
using RuleTarget = std::variant<Domain, AppName, CategoryId>;

// A concrete thing an enforcer can act on; categories expand into these.
using BlockTarget = std::variant<Domain, AppName>;

struct BlockRule {
    RuleId id;
    bool enabled = true;
    Strictness strictness = Strictness::Medium;
    TimePoint createdAt;
    RuleTarget target;
    ScheduleType scheduleType = ScheduleType::Always;
    std::optional<CronExpression> scheduleCron;

    RuleType type() const;
    const std::string &targetValue() const;
};

inline RuleType ruleTypeOf(const RuleTarget &target)
{
    return std::visit([](const auto &value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Domain>) {
            return RuleType::Website;
        } else if constexpr (std::is_same_v<T, AppName>) {
            return RuleType::App;
        } else {
            static_assert(std::is_same_v<T, CategoryId>, "unhandled rule target");
            return RuleType::Category;
        }
    }, target);
}

inline const std::string &targetValueOf(const RuleTarget &target)
{
    return std::visit([](const auto &value) -> const std::string & {
        return value.value();
    }, target);
}

inline RuleType BlockRule::type() const
{
    return ruleTypeOf(target);
}

inline const std::string &BlockRule::targetValue() const
{
    return targetValueOf(target);
}

// Builds the target alternative for a rule type; throws on a malformed value.
inline RuleTarget makeRuleTarget(RuleType type, const std::string &raw)
{
    switch (type) {
    case RuleType::Website:
        return Domain(raw);
    case RuleType::App:
        return AppName(raw);
    case RuleType::Category:
        return CategoryId(raw);
    }
    return Domain(raw);
}

struct CreateRuleRequest {
    RuleType ruleType = RuleType::Website;
    std::string target;
    ScheduleType scheduleType = ScheduleType::Always;
    std::optional<std::string> scheduleCron;
    std::optional<Strictness> strictness;
    bool enabled = true;
};

struct RuleFilter {
    std::optional<RuleType> ruleType;
    std::optional<bool> enabled;
};

struct Unlocked {
};

struct StrictMode {
    std::string sessionId;
    bool canDisable = false;
    TimePoint startedAt;
};

struct Nuclear {
    TimePoint startedAt;
    TimePoint endsAt;
    int durationMinutes = 0;
};

using EnforcementLock = std::variant<Unlocked, StrictMode, Nuclear>;

struct StrictModeStatus {
    bool enabled = false;
    std::optional<std::string> sessionId;
    std::optional<TimePoint> startedAt;
    bool canDisable = true;
};

struct NuclearStatus {
    bool active = false;
    int durationMinutes = 0;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> endsAt;
    std::optional<long long> remainingSeconds;
};

struct BlockAttempt {
    std::string ruleId;
    std::string target;
    TimePoint blockedAt;
    bool wasBypassed = false;
    std::optional<std::string> sessionId;
    std::optional<std::string> processName;
};

// Append-only; never mutated once written.
struct BlockEvent {
    std::string id;
    RuleId ruleId;
    TimePoint blockedAt;
    std::string target;
    bool wasBypassed = false;
    TimePoint createdAt;
    std::optional<std::string> sessionId;
    std::optional<std::string> processName;
};

struct BypassRequest {
    std::string id;
    std::string ruleId;
    TimePoint requestedAt;
    std::optional<std::string> bypassCode;
    std::optional<std::string> reason;
};

struct RuleStats {
    std::string ruleId;
    long long totalBlocks = 0;
    long long bypasses = 0;
    std::optional<TimePoint> lastTriggered;
    double avgBlocksPerDay = 0.0;
};

struct BlockedTargetStats {
    std::string target;
    long long count = 0;
    TimePoint lastAttempt;
};

struct BlockStatistics {
    long long totalAttempts = 0;
    long long attemptsToday = 0;
    long long attemptsThisWeek = 0;
    long long attemptsThisMonth = 0;
    std::vector<BlockedTargetStats> topBlocked;
    std::vector<long long> attemptsByHour;
    std::vector<BlockEvent> recentBlocks;
};

struct PermissionStatus {
    bool hostsFileWritable = false;
    std::optional<std::string> hostsFileError;
    std::string hostsFilePath;
    bool processMonitoringAvailable = false;
    std::optional<std::string> processMonitoringError;
    bool processTerminationAvailable = false;
    std::optional<std::string> processTerminationError;
    OverallPermissionStatus overallStatus = OverallPermissionStatus::NonFunctional;
    std::vector<std::string> recommendations;
    std::string platform;
};

struct PermissionMethod {
    std::string name;
    std::vector<std::string> steps;
    bool isPermanent = false;
    bool isRecommended = false;
    std::vector<std::string> grants;
};

struct PlatformInstructions {
    std::string platform;
    PermissionMethod primaryMethod;
    std::vector<PermissionMethod> alternativeMethods;
    bool requiresRestart = false;
    std::vector<std::string> securityNotes;
};

} // namespace focusguard
