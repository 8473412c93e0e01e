#pragma once

#include <functional>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "engine/block_event_recorder.hpp"
#include "engine/enforcement_controller.hpp"
#include "engine/permission_detector.hpp"
#include "engine/rule_store.hpp"
#include "engine/schedule_evaluator.hpp"
#include "engine/session_tracker.hpp"

namespace focusguard {

class FocusStore;

/**
 * FocusEngine is the single owner of blocking state: the rule set, the
 * enforcement lock, the global blocking switch, the block event log and the
 * session context. Every mutation runs under an exclusive lock and writes
 * through to SQLite before the in-memory state changes; queries take a shared
 * lock and see nuclear expiry without committing it.
 *
 * Weakening mutations consult the enforcement lock first and fail with
 * permission_denied while it forbids them.
 */
class FocusEngine {
public:
    using Clock = std::function<TimePoint()>;

    explicit FocusEngine(const FocusConfig &config,
                         Clock clock = {},
                         std::shared_ptr<CapabilityProbe> probe = nullptr);
    ~FocusEngine();

    FocusEngine(const FocusEngine &) = delete;
    FocusEngine &operator=(const FocusEngine &) = delete;

    // Rules
    BlockRule createRule(const CreateRuleRequest &request);
    void removeRule(const RuleId &id);
    BlockRule setEnabled(const RuleId &id, bool enabled);
    BlockRule setStrictness(const RuleId &id, Strictness strictness);
    std::vector<BlockRule> listRules(const RuleFilter &filter = {}) const;
    std::set<BlockTarget> expandCategories(const std::vector<std::string> &categories) const;

    bool isBlockingActiveFor(const std::string &target) const;
    bool isBlockingActiveFor(const std::string &target, TimePoint now) const;

    // Sessions and locks
    void notifySessionStarted(const std::string &sessionId);
    void notifySessionEnded(const std::string &sessionId);
    StrictModeStatus enableStrictMode(const std::string &sessionId);
    void disableStrictMode();
    StrictModeStatus getStrictModeStatus() const;
    NuclearStatus activateNuclearOption(int durationMinutes);
    NuclearStatus getNuclearOptionStatus() const;
    EnforcementLock currentLock() const;

    void setBlockingEnabled(bool enabled);
    bool isBlockingEnabled() const;

    // Capabilities
    PermissionStatus checkPermissions() const;
    PlatformInstructions getPermissionInstructions(const std::string &platform) const;

    // Events
    BlockEvent recordBlockAttempt(const BlockAttempt &attempt);
    RuleStats getRuleStats(const RuleId &ruleId) const;
    BlockStatistics getBlockStatistics() const;
    std::vector<BlockEvent> getSessionBlocks(const std::string &sessionId) const;
    BypassRequest recordBypassRequest(const BypassRequest &request);
    std::vector<BypassRequest> listBypassRequests(const RuleId &ruleId) const;

    // Commits nuclear expiry. Returns true when the lock changed.
    bool tick();

private:
    void loadState();
    bool commitExpiryLocked(TimePoint now);
    void replaceController(const EnforcementController &next, const char *transition);

    Clock m_clock;
    std::unique_ptr<FocusStore> m_store;
    RuleStore m_rules;
    BlockEventRecorder m_events;
    ScheduleEvaluator m_evaluator;
    SessionTracker m_sessions;
    EnforcementController m_controller;
    PermissionDetector m_permissions;
    bool m_blockingEnabled = true;

    mutable std::shared_mutex m_mutex;
};

} // namespace focusguard
