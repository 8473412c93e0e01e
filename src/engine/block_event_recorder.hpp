#pragma once

#include <vector>

#include "common/models.hpp"

namespace focusguard {

class FocusStore;
class RuleStore;

// BlockEventRecorder appends block events and bypass requests and derives
// statistics from them. Events outlive the rule they reference.
class BlockEventRecorder {
public:
    BlockEventRecorder(const RuleStore &rules, FocusStore *store = nullptr);

    void load();

    BlockEvent recordBlockAttempt(const BlockAttempt &attempt, TimePoint now);
    RuleStats ruleStats(const RuleId &ruleId, TimePoint now) const;
    // Day boundaries are UTC. Top targets and hourly buckets cover the last
    // seven days.
    BlockStatistics blockStatistics(TimePoint now) const;
    std::vector<BlockEvent> sessionBlocks(const std::string &sessionId) const;

    // Recorded for auditing only; nothing is unlocked by a request.
    BypassRequest recordBypassRequest(const BypassRequest &request, TimePoint now);
    std::vector<BypassRequest> listBypassRequests(const RuleId &ruleId) const;

private:
    BlockRule requireRule(const std::string &ruleId) const;

    const RuleStore &m_rules;
    FocusStore *m_store = nullptr;
    std::vector<BlockEvent> m_events;
    std::vector<BypassRequest> m_bypassRequests;
};

} // namespace focusguard
