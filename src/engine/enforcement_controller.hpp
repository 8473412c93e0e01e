#pragma once

#include <string>

#include "common/models.hpp"

namespace focusguard {

// Mutations that loosen enforcement and therefore pass the lock gate.
enum class WeakeningAction {
    RemoveRule,
    DisableRule,
    LowerStrictness,
    DisableBlocking
};

std::string toWeakeningActionString(WeakeningAction action);

// Longest accepted nuclear option: one year.
constexpr int kMaxNuclearDurationMinutes = 525600;

/**
 * EnforcementController owns the enforcement lock:
 *
 *   Unlocked --enableStrictMode--> StrictMode{canDisable=false}
 *   StrictMode --session ended--> StrictMode{canDisable=true}
 *   StrictMode{canDisable=true} --disableStrictMode--> Unlocked
 *   Unlocked --activateNuclearOption--> Nuclear{endsAt}
 *   Nuclear --now >= endsAt--> Unlocked
 *
 * Nuclear has no manual exit. Expiry is computed from endsAt on every read,
 * and committed by the mutating calls and commitExpiry(). Not synchronized;
 * the owning engine serializes access.
 */
class EnforcementController {
public:
    explicit EnforcementController(EnforcementLock initial = Unlocked{});

    static EnforcementLock evaluateExpiry(const EnforcementLock &lock, TimePoint now);

    EnforcementLock lock(TimePoint now) const;
    const EnforcementLock &storedLock() const { return m_lock; }

    // Returns true when a stored Nuclear lock was replaced by Unlocked.
    bool commitExpiry(TimePoint now);

    void enableStrictMode(const std::string &sessionId, bool sessionActive, TimePoint now);
    // Returns true when the strict mode lock became disableable.
    bool notifySessionEnded(const std::string &sessionId);
    void disableStrictMode(TimePoint now);
    void activateNuclearOption(int durationMinutes, TimePoint now);

    // Throws permission_denied when the current lock forbids the action.
    void checkWeakening(WeakeningAction action, TimePoint now) const;

    StrictModeStatus strictModeStatus(TimePoint now) const;
    NuclearStatus nuclearStatus(TimePoint now) const;

private:
    EnforcementLock m_lock;
};

} // namespace focusguard
