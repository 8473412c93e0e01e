#include "engine/focus_engine.hpp"

#include <mutex>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/category_expander.hpp"
#include "engine/focus_store.hpp"

namespace focusguard {

namespace {

constexpr const char *kLockMetaKey = "enforcement_lock";
constexpr const char *kBlockingEnabledMetaKey = "blocking_enabled";

std::string lockStateName(const EnforcementLock &lock)
{
    if (std::holds_alternative<StrictMode>(lock)) {
        return "strict_mode";
    }
    if (std::holds_alternative<Nuclear>(lock)) {
        return "nuclear";
    }
    return "unlocked";
}

void logEngineEvent(const QString &where, const QString &what, const QString &why,
                    const nlohmann::json &context)
{
    FGLOG_INFO(QStringLiteral("FocusEngine"),
               where,
               what,
               why,
               QStringLiteral("engine_call"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               context);
}

} // namespace

FocusEngine::FocusEngine(const FocusConfig &config,
                         Clock clock,
                         std::shared_ptr<CapabilityProbe> probe)
    : m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    , m_store(std::make_unique<FocusStore>(config.databasePath()))
    , m_rules(m_store.get())
    , m_events(m_rules, m_store.get())
    , m_permissions(config.hostsFilePath, config.probeTimeout, std::move(probe))
{
    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        throw BlockingError::systemError("SQLite integrity check failed: " + integrityMessage);
    }
    loadState();
}

FocusEngine::~FocusEngine() = default;

void FocusEngine::loadState()
{
    m_rules.load();
    m_events.load();

    const auto storedLock = m_store->getMeta(kLockMetaKey);
    if (storedLock) {
        const auto parsed = nlohmann::json::parse(*storedLock, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            FGLOG_WARN(QStringLiteral("FocusEngine"),
                       QStringLiteral("loadState"),
                       QStringLiteral("lock_state_ignored"),
                       QStringLiteral("invalid_json"),
                       QStringLiteral("meta_table"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       nlohmann::json::object());
        } else {
            m_controller = EnforcementController(parsed.get<EnforcementLock>());
        }
    }

    const auto blockingEnabled = m_store->getMeta(kBlockingEnabledMetaKey);
    m_blockingEnabled = !blockingEnabled || *blockingEnabled != "0";

    logEngineEvent(QStringLiteral("loadState"),
                   QStringLiteral("engine_state_loaded"),
                   QStringLiteral("startup"),
                   (nlohmann::json{{"rules", m_rules.rules().size()},
                                  {"lock", lockStateName(m_controller.lock(m_clock()))},
                                  {"blockingEnabled", m_blockingEnabled}}));
}

void FocusEngine::replaceController(const EnforcementController &next, const char *transition)
{
    const std::string before = lockStateName(m_controller.storedLock());
    m_store->setMeta(kLockMetaKey, nlohmann::json(next.storedLock()).dump());
    m_controller = next;
    logEngineEvent(QStringLiteral("replaceController"),
                   QStringLiteral("lock_transition"),
                   QString::fromUtf8(transition),
                   (nlohmann::json{{"from", before},
                                  {"to", lockStateName(next.storedLock())}}));
}

bool FocusEngine::commitExpiryLocked(TimePoint now)
{
    EnforcementController next = m_controller;
    if (!next.commitExpiry(now)) {
        return false;
    }
    replaceController(next, "nuclear_expired");
    return true;
}

BlockRule FocusEngine::createRule(const CreateRuleRequest &request)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    commitExpiryLocked(now);
    BlockRule rule = m_rules.createRule(request, now);
    logEngineEvent(QStringLiteral("createRule"),
                   QStringLiteral("rule_created"),
                   QStringLiteral("client_call"),
                   (nlohmann::json{{"ruleId", rule.id.value()},
                                  {"ruleType", rule.type()},
                                  {"target", rule.targetValue()}}));
    return rule;
}

void FocusEngine::removeRule(const RuleId &id)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    commitExpiryLocked(now);
    if (!m_rules.findRule(id)) {
        throw BlockingError::notFound(id.value());
    }
    m_controller.checkWeakening(WeakeningAction::RemoveRule, now);
    m_rules.removeRule(id);
    logEngineEvent(QStringLiteral("removeRule"),
                   QStringLiteral("rule_removed"),
                   QStringLiteral("client_call"),
                   (nlohmann::json{{"ruleId", id.value()}}));
}

BlockRule FocusEngine::setEnabled(const RuleId &id, bool enabled)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    commitExpiryLocked(now);
    const auto existing = m_rules.findRule(id);
    if (!existing) {
        throw BlockingError::notFound(id.value());
    }
    if (existing->enabled && !enabled) {
        m_controller.checkWeakening(WeakeningAction::DisableRule, now);
    }
    return m_rules.setEnabled(id, enabled);
}

BlockRule FocusEngine::setStrictness(const RuleId &id, Strictness strictness)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    commitExpiryLocked(now);
    const auto existing = m_rules.findRule(id);
    if (!existing) {
        throw BlockingError::notFound(id.value());
    }
    if (static_cast<int>(strictness) < static_cast<int>(existing->strictness)) {
        m_controller.checkWeakening(WeakeningAction::LowerStrictness, now);
    }
    return m_rules.setStrictness(id, strictness);
}

std::vector<BlockRule> FocusEngine::listRules(const RuleFilter &filter) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_rules.listRules(filter);
}

std::set<BlockTarget> FocusEngine::expandCategories(const std::vector<std::string> &categories) const
{
    return CategoryExpander::expand(categories);
}

bool FocusEngine::isBlockingActiveFor(const std::string &target) const
{
    return isBlockingActiveFor(target, m_clock());
}

bool FocusEngine::isBlockingActiveFor(const std::string &target, TimePoint now) const
{
    if (trimmed(target).empty()) {
        throw BlockingError::validation("target", "Target cannot be empty");
    }
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_blockingEnabled) {
        return false;
    }
    return m_evaluator.isBlockingActiveFor(m_rules.rules(), target, now,
                                           m_sessions.hasActiveSession());
}

void FocusEngine::notifySessionStarted(const std::string &sessionId)
{
    if (sessionId.empty()) {
        throw BlockingError::validation("sessionId", "Session id cannot be empty");
    }
    m_sessions.startSession(sessionId);
}

void FocusEngine::notifySessionEnded(const std::string &sessionId)
{
    if (sessionId.empty()) {
        throw BlockingError::validation("sessionId", "Session id cannot be empty");
    }
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_sessions.endSession(sessionId);
    EnforcementController next = m_controller;
    if (next.notifySessionEnded(sessionId)) {
        replaceController(next, "session_ended");
    }
}

StrictModeStatus FocusEngine::enableStrictMode(const std::string &sessionId)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    commitExpiryLocked(now);
    EnforcementController next = m_controller;
    next.enableStrictMode(sessionId, m_sessions.isSessionActive(sessionId), now);
    replaceController(next, "strict_mode_enabled");
    return m_controller.strictModeStatus(now);
}

void FocusEngine::disableStrictMode()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    commitExpiryLocked(now);
    EnforcementController next = m_controller;
    next.disableStrictMode(now);
    replaceController(next, "strict_mode_disabled");
}

StrictModeStatus FocusEngine::getStrictModeStatus() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_controller.strictModeStatus(m_clock());
}

NuclearStatus FocusEngine::activateNuclearOption(int durationMinutes)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    commitExpiryLocked(now);
    EnforcementController next = m_controller;
    next.activateNuclearOption(durationMinutes, now);
    replaceController(next, "nuclear_activated");
    return m_controller.nuclearStatus(now);
}

NuclearStatus FocusEngine::getNuclearOptionStatus() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_controller.nuclearStatus(m_clock());
}

EnforcementLock FocusEngine::currentLock() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_controller.lock(m_clock());
}

void FocusEngine::setBlockingEnabled(bool enabled)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    commitExpiryLocked(now);
    if (enabled == m_blockingEnabled) {
        return;
    }
    if (!enabled) {
        m_controller.checkWeakening(WeakeningAction::DisableBlocking, now);
    }
    m_store->setMeta(kBlockingEnabledMetaKey, enabled ? "1" : "0");
    m_blockingEnabled = enabled;
    logEngineEvent(QStringLiteral("setBlockingEnabled"),
                   QStringLiteral("blocking_switch_changed"),
                   QStringLiteral("client_call"),
                   (nlohmann::json{{"enabled", enabled}}));
}

bool FocusEngine::isBlockingEnabled() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_blockingEnabled;
}

PermissionStatus FocusEngine::checkPermissions() const
{
    return m_permissions.checkPermissions();
}

PlatformInstructions FocusEngine::getPermissionInstructions(const std::string &platform) const
{
    return PermissionDetector::instructionsFor(platform);
}

BlockEvent FocusEngine::recordBlockAttempt(const BlockAttempt &attempt)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_events.recordBlockAttempt(attempt, m_clock());
}

RuleStats FocusEngine::getRuleStats(const RuleId &ruleId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_events.ruleStats(ruleId, m_clock());
}

BlockStatistics FocusEngine::getBlockStatistics() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_events.blockStatistics(m_clock());
}

std::vector<BlockEvent> FocusEngine::getSessionBlocks(const std::string &sessionId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_events.sessionBlocks(sessionId);
}

BypassRequest FocusEngine::recordBypassRequest(const BypassRequest &request)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_events.recordBypassRequest(request, m_clock());
}

std::vector<BypassRequest> FocusEngine::listBypassRequests(const RuleId &ruleId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_events.listBypassRequests(ruleId);
}

bool FocusEngine::tick()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return commitExpiryLocked(m_clock());
}

} // namespace focusguard
