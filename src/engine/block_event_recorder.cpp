#include "engine/block_event_recorder.hpp"

#include <algorithm>
#include <map>

#include "common/errors.hpp"
#include "engine/focus_store.hpp"
#include "engine/rule_store.hpp"

namespace focusguard {

namespace {

constexpr long long kSecondsPerDay = 24 * 60 * 60;
constexpr long long kSecondsPerHour = 60 * 60;
constexpr std::size_t kTopBlockedLimit = 10;
constexpr std::size_t kRecentBlocksLimit = 20;
constexpr std::size_t kHoursPerDay = 24;

long long epochSeconds(TimePoint time)
{
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

// UTC calendar day number.
long long dayIndex(TimePoint time)
{
    const long long seconds = epochSeconds(time);
    return seconds >= 0 ? seconds / kSecondsPerDay : (seconds - kSecondsPerDay + 1) / kSecondsPerDay;
}

int utcHour(TimePoint time)
{
    long long secondOfDay = epochSeconds(time) % kSecondsPerDay;
    if (secondOfDay < 0) {
        secondOfDay += kSecondsPerDay;
    }
    return static_cast<int>(secondOfDay / kSecondsPerHour);
}

} // namespace

BlockEventRecorder::BlockEventRecorder(const RuleStore &rules, FocusStore *store)
    : m_rules(rules)
    , m_store(store)
{
}

void BlockEventRecorder::load()
{
    if (!m_store) {
        return;
    }
    m_events = m_store->listBlockEvents();
    m_bypassRequests = m_store->listBypassRequests();
}

BlockRule BlockEventRecorder::requireRule(const std::string &ruleId) const
{
    const auto rule = m_rules.findRule(RuleId(ruleId));
    if (!rule) {
        throw BlockingError::notFound(ruleId);
    }
    return *rule;
}

BlockEvent BlockEventRecorder::recordBlockAttempt(const BlockAttempt &attempt, TimePoint now)
{
    if (attempt.ruleId.empty()) {
        throw BlockingError::validation("ruleId", "Rule id cannot be empty");
    }
    const BlockRule rule = requireRule(attempt.ruleId);

    const std::string target = trimmed(attempt.target);
    if (target.empty()) {
        throw BlockingError::validation("target", "Blocked target cannot be empty");
    }

    BlockEvent event{
        generateId(),
        rule.id,
        attempt.blockedAt == TimePoint{} ? now : attempt.blockedAt,
        target,
        attempt.wasBypassed,
        now,
        attempt.sessionId,
        attempt.processName
    };

    if (m_store) {
        m_store->addBlockEvent(event);
    }
    m_events.push_back(event);
    return event;
}

RuleStats BlockEventRecorder::ruleStats(const RuleId &ruleId, TimePoint now) const
{
    const BlockRule rule = requireRule(ruleId.value());

    RuleStats stats;
    stats.ruleId = ruleId.value();
    for (const auto &event : m_events) {
        if (event.ruleId != ruleId) {
            continue;
        }
        ++stats.totalBlocks;
        if (event.wasBypassed) {
            ++stats.bypasses;
        }
        if (!stats.lastTriggered || event.blockedAt > *stats.lastTriggered) {
            stats.lastTriggered = event.blockedAt;
        }
    }

    const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - rule.createdAt).count();
    const long long days = std::max<long long>(1, age / kSecondsPerDay);
    stats.avgBlocksPerDay = static_cast<double>(stats.totalBlocks) / static_cast<double>(days);
    return stats;
}

BlockStatistics BlockEventRecorder::blockStatistics(TimePoint now) const
{
    const long long today = dayIndex(now);
    const long long weekStart = dayIndex(now - std::chrono::hours(24 * 7));
    const long long monthStart = dayIndex(now - std::chrono::hours(24 * 30));

    BlockStatistics stats;
    stats.attemptsByHour.assign(kHoursPerDay, 0LL);

    std::map<std::string, BlockedTargetStats> byTarget;
    for (const auto &event : m_events) {
        ++stats.totalAttempts;
        const long long day = dayIndex(event.blockedAt);
        if (day == today) {
            ++stats.attemptsToday;
        }
        if (day >= monthStart) {
            ++stats.attemptsThisMonth;
        }
        if (day < weekStart) {
            continue;
        }
        ++stats.attemptsThisWeek;
        ++stats.attemptsByHour[static_cast<std::size_t>(utcHour(event.blockedAt))];

        auto &entry = byTarget[event.target];
        entry.target = event.target;
        ++entry.count;
        entry.lastAttempt = std::max(entry.lastAttempt, event.blockedAt);
    }

    for (auto &item : byTarget) {
        stats.topBlocked.push_back(item.second);
    }
    std::stable_sort(stats.topBlocked.begin(), stats.topBlocked.end(),
                     [](const BlockedTargetStats &a, const BlockedTargetStats &b) {
                         return a.count > b.count;
                     });
    if (stats.topBlocked.size() > kTopBlockedLimit) {
        stats.topBlocked.resize(kTopBlockedLimit);
    }

    std::vector<BlockEvent> recent = m_events;
    std::stable_sort(recent.begin(), recent.end(), [](const BlockEvent &a, const BlockEvent &b) {
        return a.blockedAt > b.blockedAt;
    });
    const std::size_t recentCount = std::min(recent.size(), kRecentBlocksLimit);
    stats.recentBlocks.assign(recent.begin(), recent.begin() + static_cast<std::ptrdiff_t>(recentCount));
    return stats;
}

std::vector<BlockEvent> BlockEventRecorder::sessionBlocks(const std::string &sessionId) const
{
    std::vector<BlockEvent> events;
    for (const auto &event : m_events) {
        if (event.sessionId && *event.sessionId == sessionId) {
            events.push_back(event);
        }
    }
    return events;
}

BypassRequest BlockEventRecorder::recordBypassRequest(const BypassRequest &request, TimePoint now)
{
    if (request.ruleId.empty()) {
        throw BlockingError::validation("ruleId", "Rule id cannot be empty");
    }
    requireRule(request.ruleId);

    BypassRequest stored = request;
    if (stored.id.empty()) {
        stored.id = generateId();
    }
    if (stored.requestedAt == TimePoint{}) {
        stored.requestedAt = now;
    }
    if (stored.bypassCode && trimmed(*stored.bypassCode).empty()) {
        stored.bypassCode.reset();
    }

    if (m_store) {
        m_store->addBypassRequest(stored);
    }
    m_bypassRequests.push_back(stored);
    return stored;
}

std::vector<BypassRequest> BlockEventRecorder::listBypassRequests(const RuleId &ruleId) const
{
    std::vector<BypassRequest> requests;
    for (const auto &request : m_bypassRequests) {
        if (request.ruleId == ruleId.value()) {
            requests.push_back(request);
        }
    }
    return requests;
}

} // namespace focusguard
