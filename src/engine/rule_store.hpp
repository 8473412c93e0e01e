#pragma once

#include <optional>
#include <vector>

#include "common/models.hpp"

namespace focusguard {

class FocusStore;

// RuleStore owns the in-memory rule set and writes every change through to
// the FocusStore when one is attached. It performs no lock checks.
class RuleStore {
public:
    explicit RuleStore(FocusStore *store = nullptr);

    // Replaces the in-memory set with the persisted rules.
    void load();

    BlockRule createRule(const CreateRuleRequest &request, TimePoint now);
    void removeRule(const RuleId &id);
    BlockRule setEnabled(const RuleId &id, bool enabled);
    BlockRule setStrictness(const RuleId &id, Strictness strictness);

    std::optional<BlockRule> findRule(const RuleId &id) const;
    std::vector<BlockRule> listRules(const RuleFilter &filter = {}) const;
    const std::vector<BlockRule> &rules() const { return m_rules; }

private:
    std::vector<BlockRule>::iterator findOrThrow(const RuleId &id);

    FocusStore *m_store = nullptr;
    std::vector<BlockRule> m_rules;
};

} // namespace focusguard
