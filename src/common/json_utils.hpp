#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace focusguard {

inline std::string toIso8601Utc(TimePoint timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline TimePoint fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return TimePoint{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return TimePoint{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toRuleTypeString(RuleType type)
{
    switch (type) {
    case RuleType::Website:
        return "website";
    case RuleType::App:
        return "app";
    case RuleType::Category:
        return "category";
    }
    return "website";
}

inline std::optional<RuleType> parseRuleTypeString(const std::string &value)
{
    if (value == "website") {
        return RuleType::Website;
    }
    if (value == "app") {
        return RuleType::App;
    }
    if (value == "category") {
        return RuleType::Category;
    }
    return std::nullopt;
}

inline std::string toStrictnessString(Strictness strictness)
{
    switch (strictness) {
    case Strictness::Soft:
        return "soft";
    case Strictness::Medium:
        return "medium";
    case Strictness::Hard:
        return "hard";
    }
    return "medium";
}

inline std::optional<Strictness> parseStrictnessString(const std::string &value)
{
    if (value == "soft") {
        return Strictness::Soft;
    }
    if (value == "medium") {
        return Strictness::Medium;
    }
    if (value == "hard") {
        return Strictness::Hard;
    }
    return std::nullopt;
}

inline std::string toScheduleTypeString(ScheduleType type)
{
    switch (type) {
    case ScheduleType::Always:
        return "always";
    case ScheduleType::FocusOnly:
        return "focus_only";
    case ScheduleType::Scheduled:
        return "scheduled";
    }
    return "always";
}

inline std::optional<ScheduleType> parseScheduleTypeString(const std::string &value)
{
    if (value == "always") {
        return ScheduleType::Always;
    }
    if (value == "focus_only") {
        return ScheduleType::FocusOnly;
    }
    if (value == "scheduled") {
        return ScheduleType::Scheduled;
    }
    return std::nullopt;
}

inline std::string toOverallStatusString(OverallPermissionStatus status)
{
    switch (status) {
    case OverallPermissionStatus::FullyFunctional:
        return "fully_functional";
    case OverallPermissionStatus::Degraded:
        return "degraded";
    case OverallPermissionStatus::NonFunctional:
        return "non_functional";
    }
    return "non_functional";
}

inline void to_json(nlohmann::json &j, const RuleType &type)
{
    j = toRuleTypeString(type);
}

inline void from_json(const nlohmann::json &j, RuleType &type)
{
    const auto parsed = j.is_string() ? parseRuleTypeString(j.get<std::string>()) : std::nullopt;
    if (!parsed) {
        throw BlockingError::validation("ruleType", "Unknown rule type: " + j.dump());
    }
    type = *parsed;
}

inline void to_json(nlohmann::json &j, const Strictness &strictness)
{
    j = toStrictnessString(strictness);
}

inline void from_json(const nlohmann::json &j, Strictness &strictness)
{
    const auto parsed = j.is_string() ? parseStrictnessString(j.get<std::string>()) : std::nullopt;
    if (!parsed) {
        throw BlockingError::validation("strictness", "Unknown strictness: " + j.dump());
    }
    strictness = *parsed;
}

inline void to_json(nlohmann::json &j, const ScheduleType &type)
{
    j = toScheduleTypeString(type);
}

inline void from_json(const nlohmann::json &j, ScheduleType &type)
{
    const auto parsed = j.is_string() ? parseScheduleTypeString(j.get<std::string>()) : std::nullopt;
    if (!parsed) {
        throw BlockingError::validation("scheduleType", "Unknown schedule type: " + j.dump());
    }
    type = *parsed;
}

inline void to_json(nlohmann::json &j, const OverallPermissionStatus &status)
{
    j = toOverallStatusString(status);
}

inline nlohmann::json optionalTime(const std::optional<TimePoint> &value)
{
    return value ? nlohmann::json(toIso8601Utc(*value)) : nlohmann::json();
}

inline nlohmann::json optionalText(const std::optional<std::string> &value)
{
    return value ? nlohmann::json(*value) : nlohmann::json();
}

inline std::optional<std::string> textOrNull(const nlohmann::json &j, const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

inline void to_json(nlohmann::json &j, const BlockRule &rule)
{
    j = nlohmann::json{
        {"id", rule.id.value()},
        {"ruleType", rule.type()},
        {"target", rule.targetValue()},
        {"enabled", rule.enabled},
        {"strictness", rule.strictness},
        {"createdAt", toIso8601Utc(rule.createdAt)},
        {"scheduleType", rule.scheduleType},
        {"scheduleCron", rule.scheduleCron
            ? nlohmann::json(rule.scheduleCron->value())
            : nlohmann::json()}
    };
}

inline void from_json(const nlohmann::json &j, CreateRuleRequest &request)
{
    request.ruleType = j.at("ruleType").get<RuleType>();
    if (!j.contains("target") || !j.at("target").is_string()) {
        throw BlockingError::validation("target", "Missing rule target");
    }
    request.target = j.at("target").get<std::string>();
    if (j.contains("scheduleType")) {
        request.scheduleType = j.at("scheduleType").get<ScheduleType>();
    } else {
        request.scheduleType = ScheduleType::Always;
    }
    request.scheduleCron = textOrNull(j, "scheduleCron");
    if (j.contains("strictness") && !j.at("strictness").is_null()) {
        request.strictness = j.at("strictness").get<Strictness>();
    } else {
        request.strictness.reset();
    }
    request.enabled = j.value("enabled", true);
}

inline void from_json(const nlohmann::json &j, RuleFilter &filter)
{
    if (j.contains("ruleType") && !j.at("ruleType").is_null()) {
        filter.ruleType = j.at("ruleType").get<RuleType>();
    }
    if (j.contains("enabled") && j.at("enabled").is_boolean()) {
        filter.enabled = j.at("enabled").get<bool>();
    }
}

inline void to_json(nlohmann::json &j, const BlockTarget &target)
{
    j = std::visit([](const auto &value) { return value.value(); }, target);
}

// Persisted form of the lock. "state" selects the alternative.
inline void to_json(nlohmann::json &j, const EnforcementLock &lock)
{
    if (const auto *strict = std::get_if<StrictMode>(&lock)) {
        j = nlohmann::json{
            {"state", "strict_mode"},
            {"sessionId", strict->sessionId},
            {"canDisable", strict->canDisable},
            {"startedAt", toIso8601Utc(strict->startedAt)}
        };
    } else if (const auto *nuclear = std::get_if<Nuclear>(&lock)) {
        j = nlohmann::json{
            {"state", "nuclear"},
            {"startedAt", toIso8601Utc(nuclear->startedAt)},
            {"endsAt", toIso8601Utc(nuclear->endsAt)},
            {"durationMinutes", nuclear->durationMinutes}
        };
    } else {
        j = nlohmann::json{{"state", "unlocked"}};
    }
}

inline void from_json(const nlohmann::json &j, EnforcementLock &lock)
{
    const std::string state = j.value("state", "unlocked");
    if (state == "strict_mode") {
        StrictMode strict;
        strict.sessionId = j.value("sessionId", "");
        strict.canDisable = j.value("canDisable", false);
        strict.startedAt = fromIso8601Utc(j.value("startedAt", ""));
        lock = strict;
        return;
    }
    if (state == "nuclear") {
        Nuclear nuclear;
        nuclear.startedAt = fromIso8601Utc(j.value("startedAt", ""));
        nuclear.endsAt = fromIso8601Utc(j.value("endsAt", ""));
        nuclear.durationMinutes = j.value("durationMinutes", 0);
        lock = nuclear;
        return;
    }
    lock = Unlocked{};
}

inline void to_json(nlohmann::json &j, const StrictModeStatus &status)
{
    j = nlohmann::json{
        {"enabled", status.enabled},
        {"sessionId", optionalText(status.sessionId)},
        {"startedAt", optionalTime(status.startedAt)},
        {"canDisable", status.canDisable}
    };
}

inline void to_json(nlohmann::json &j, const NuclearStatus &status)
{
    j = nlohmann::json{
        {"active", status.active},
        {"durationMinutes", status.durationMinutes},
        {"startedAt", optionalTime(status.startedAt)},
        {"endsAt", optionalTime(status.endsAt)},
        {"remainingSeconds", status.remainingSeconds
            ? nlohmann::json(*status.remainingSeconds)
            : nlohmann::json()}
    };
}

inline void from_json(const nlohmann::json &j, BlockAttempt &attempt)
{
    attempt.ruleId = j.value("ruleId", "");
    attempt.target = j.value("target", "");
    const std::string blockedAt = j.value("blockedAt", "");
    attempt.blockedAt = blockedAt.empty() ? TimePoint{} : fromIso8601Utc(blockedAt);
    attempt.wasBypassed = j.value("wasBypassed", false);
    attempt.sessionId = textOrNull(j, "sessionId");
    attempt.processName = textOrNull(j, "processName");
}

inline void to_json(nlohmann::json &j, const BlockEvent &event)
{
    j = nlohmann::json{
        {"id", event.id},
        {"ruleId", event.ruleId.value()},
        {"blockedAt", toIso8601Utc(event.blockedAt)},
        {"target", event.target},
        {"wasBypassed", event.wasBypassed},
        {"createdAt", toIso8601Utc(event.createdAt)},
        {"sessionId", optionalText(event.sessionId)},
        {"processName", optionalText(event.processName)}
    };
}

inline void to_json(nlohmann::json &j, const BypassRequest &request)
{
    j = nlohmann::json{
        {"id", request.id},
        {"ruleId", request.ruleId},
        {"requestedAt", toIso8601Utc(request.requestedAt)},
        {"bypassCode", optionalText(request.bypassCode)},
        {"reason", optionalText(request.reason)}
    };
}

inline void from_json(const nlohmann::json &j, BypassRequest &request)
{
    request.id = j.value("id", "");
    request.ruleId = j.value("ruleId", "");
    const std::string requestedAt = j.value("requestedAt", "");
    request.requestedAt = requestedAt.empty() ? TimePoint{} : fromIso8601Utc(requestedAt);
    request.bypassCode = textOrNull(j, "bypassCode");
    request.reason = textOrNull(j, "reason");
}

inline void to_json(nlohmann::json &j, const RuleStats &stats)
{
    j = nlohmann::json{
        {"ruleId", stats.ruleId},
        {"totalBlocks", stats.totalBlocks},
        {"bypasses", stats.bypasses},
        {"lastTriggered", optionalTime(stats.lastTriggered)},
        {"avgBlocksPerDay", stats.avgBlocksPerDay}
    };
}

inline void to_json(nlohmann::json &j, const BlockedTargetStats &stats)
{
    j = nlohmann::json{
        {"target", stats.target},
        {"count", stats.count},
        {"lastAttempt", toIso8601Utc(stats.lastAttempt)}
    };
}

inline void to_json(nlohmann::json &j, const BlockStatistics &stats)
{
    j = nlohmann::json{
        {"totalAttempts", stats.totalAttempts},
        {"attemptsToday", stats.attemptsToday},
        {"attemptsThisWeek", stats.attemptsThisWeek},
        {"attemptsThisMonth", stats.attemptsThisMonth},
        {"topBlocked", stats.topBlocked},
        {"attemptsByHour", stats.attemptsByHour},
        {"recentBlocks", stats.recentBlocks}
    };
}

inline void to_json(nlohmann::json &j, const PermissionStatus &status)
{
    j = nlohmann::json{
        {"hosts_file_writable", status.hostsFileWritable},
        {"hosts_file_error", optionalText(status.hostsFileError)},
        {"hosts_file_path", status.hostsFilePath},
        {"process_monitoring_available", status.processMonitoringAvailable},
        {"process_monitoring_error", optionalText(status.processMonitoringError)},
        {"process_termination_available", status.processTerminationAvailable},
        {"process_termination_error", optionalText(status.processTerminationError)},
        {"overall_status", status.overallStatus},
        {"recommendations", status.recommendations},
        {"platform", status.platform}
    };
}

inline void to_json(nlohmann::json &j, const PermissionMethod &method)
{
    j = nlohmann::json{
        {"name", method.name},
        {"steps", method.steps},
        {"is_permanent", method.isPermanent},
        {"is_recommended", method.isRecommended},
        {"grants", method.grants}
    };
}

inline void to_json(nlohmann::json &j, const PlatformInstructions &instructions)
{
    j = nlohmann::json{
        {"platform", instructions.platform},
        {"primary_method", instructions.primaryMethod},
        {"alternative_methods", instructions.alternativeMethods},
        {"requires_restart", instructions.requiresRestart},
        {"security_notes", instructions.securityNotes}
    };
}

} // namespace focusguard
