#include "engine/enforcement_controller.hpp"

#include <string>
#include <utility>

#include "common/errors.hpp"

namespace focusguard {

std::string toWeakeningActionString(WeakeningAction action)
{
    switch (action) {
    case WeakeningAction::RemoveRule:
        return "remove a rule";
    case WeakeningAction::DisableRule:
        return "disable a rule";
    case WeakeningAction::LowerStrictness:
        return "lower rule strictness";
    case WeakeningAction::DisableBlocking:
        return "turn blocking off";
    }
    return "weaken blocking";
}

EnforcementController::EnforcementController(EnforcementLock initial)
    : m_lock(std::move(initial))
{
}

EnforcementLock EnforcementController::evaluateExpiry(const EnforcementLock &lock, TimePoint now)
{
    if (const auto *nuclear = std::get_if<Nuclear>(&lock)) {
        if (now >= nuclear->endsAt) {
            return Unlocked{};
        }
    }
    return lock;
}

EnforcementLock EnforcementController::lock(TimePoint now) const
{
    return evaluateExpiry(m_lock, now);
}

bool EnforcementController::commitExpiry(TimePoint now)
{
    if (!std::holds_alternative<Nuclear>(m_lock)) {
        return false;
    }
    EnforcementLock next = evaluateExpiry(m_lock, now);
    if (std::holds_alternative<Nuclear>(next)) {
        return false;
    }
    m_lock = std::move(next);
    return true;
}

void EnforcementController::enableStrictMode(const std::string &sessionId,
                                             bool sessionActive,
                                             TimePoint now)
{
    if (sessionId.empty()) {
        throw BlockingError::validation("sessionId", "Session id cannot be empty");
    }
    commitExpiry(now);
    if (std::holds_alternative<StrictMode>(m_lock)) {
        throw BlockingError::preconditionFailed("Strict mode is already enabled");
    }
    if (std::holds_alternative<Nuclear>(m_lock)) {
        throw BlockingError::preconditionFailed("Nuclear option is active");
    }
    if (!sessionActive) {
        throw BlockingError::preconditionFailed(
            "Strict mode requires an active focus session: " + sessionId);
    }
    m_lock = StrictMode{sessionId, false, now};
}

bool EnforcementController::notifySessionEnded(const std::string &sessionId)
{
    auto *strict = std::get_if<StrictMode>(&m_lock);
    if (!strict || strict->sessionId != sessionId || strict->canDisable) {
        return false;
    }
    strict->canDisable = true;
    return true;
}

void EnforcementController::disableStrictMode(TimePoint now)
{
    commitExpiry(now);
    const auto *strict = std::get_if<StrictMode>(&m_lock);
    if (!strict) {
        if (std::holds_alternative<Nuclear>(m_lock)) {
            throw BlockingError::permissionDenied(
                "Cannot disable strict mode while the nuclear option is active");
        }
        throw BlockingError::permissionDenied("Strict mode is not enabled");
    }
    if (!strict->canDisable) {
        throw BlockingError::permissionDenied(
            "Cannot disable strict mode during an active focus session");
    }
    m_lock = Unlocked{};
}

void EnforcementController::activateNuclearOption(int durationMinutes, TimePoint now)
{
    if (durationMinutes <= 0) {
        throw BlockingError::validation("durationMinutes",
                                        "Nuclear option duration must be a positive number of minutes");
    }
    if (durationMinutes > kMaxNuclearDurationMinutes) {
        throw BlockingError::validation("durationMinutes",
                                        "Nuclear option duration may not exceed "
                                            + std::to_string(kMaxNuclearDurationMinutes) + " minutes");
    }
    commitExpiry(now);
    if (std::holds_alternative<Nuclear>(m_lock)) {
        throw BlockingError::preconditionFailed("Nuclear option is already active");
    }
    if (std::holds_alternative<StrictMode>(m_lock)) {
        throw BlockingError::preconditionFailed(
            "Nuclear option cannot be activated while strict mode is enabled");
    }
    m_lock = Nuclear{now, now + std::chrono::minutes(durationMinutes), durationMinutes};
}

void EnforcementController::checkWeakening(WeakeningAction action, TimePoint now) const
{
    const EnforcementLock current = lock(now);
    if (std::holds_alternative<Nuclear>(current)) {
        throw BlockingError::permissionDenied(
            "Cannot " + toWeakeningActionString(action) + " while the nuclear option is active");
    }
    if (const auto *strict = std::get_if<StrictMode>(&current)) {
        if (!strict->canDisable) {
            throw BlockingError::permissionDenied(
                "Cannot " + toWeakeningActionString(action) + " while strict mode is enabled");
        }
    }
}

StrictModeStatus EnforcementController::strictModeStatus(TimePoint now) const
{
    StrictModeStatus status;
    const EnforcementLock current = lock(now);
    if (const auto *strict = std::get_if<StrictMode>(&current)) {
        status.enabled = true;
        status.sessionId = strict->sessionId;
        status.startedAt = strict->startedAt;
        status.canDisable = strict->canDisable;
    } else if (std::holds_alternative<Nuclear>(current)) {
        status.canDisable = false;
    }
    return status;
}

NuclearStatus EnforcementController::nuclearStatus(TimePoint now) const
{
    NuclearStatus status;
    const EnforcementLock current = lock(now);
    if (const auto *nuclear = std::get_if<Nuclear>(&current)) {
        status.active = true;
        status.durationMinutes = nuclear->durationMinutes;
        status.startedAt = nuclear->startedAt;
        status.endsAt = nuclear->endsAt;
        status.remainingSeconds = std::chrono::duration_cast<std::chrono::seconds>(
                                      nuclear->endsAt - now)
                                      .count();
    }
    return status;
}

} // namespace focusguard
