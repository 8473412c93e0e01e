#include "engine/rule_store.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "engine/category_expander.hpp"
#include "engine/cron_schedule.hpp"
#include "engine/focus_store.hpp"

namespace focusguard {

RuleStore::RuleStore(FocusStore *store)
    : m_store(store)
{
}

void RuleStore::load()
{
    if (!m_store) {
        return;
    }
    m_rules = m_store->loadRules();
}

BlockRule RuleStore::createRule(const CreateRuleRequest &request, TimePoint now)
{
    RuleTarget target = makeRuleTarget(request.ruleType, request.target);
    if (const auto *category = std::get_if<CategoryId>(&target)) {
        if (!CategoryExpander::isKnown(*category)) {
            throw BlockingError::validation("target", "Unknown category: " + category->value());
        }
    }

    std::optional<CronExpression> cron;
    if (request.scheduleType == ScheduleType::Scheduled) {
        if (!request.scheduleCron || trimmed(*request.scheduleCron).empty()) {
            throw BlockingError::validation("scheduleCron",
                                            "Scheduled rules require a cron expression");
        }
        cron = CronExpression(*request.scheduleCron);
        std::string error;
        if (!CronSchedule::parse(cron->value(), &error)) {
            throw BlockingError::validation("scheduleCron",
                                            "Invalid cron expression: " + error);
        }
    }

    const RuleType type = ruleTypeOf(target);
    const std::string &value = targetValueOf(target);
    // App names compare the way they match processes: case and ".exe" ignored.
    const auto sameTarget = [type](const std::string &a, const std::string &b) {
        return type == RuleType::App ? normalizeProcessName(a) == normalizeProcessName(b) : a == b;
    };
    const bool duplicate = std::any_of(m_rules.begin(), m_rules.end(),
                                       [&](const BlockRule &rule) {
                                           return rule.type() == type
                                               && sameTarget(rule.targetValue(), value);
                                       });
    if (duplicate) {
        throw BlockingError::alreadyExists(value);
    }

    BlockRule rule{
        RuleId::generate(),
        request.enabled,
        request.strictness.value_or(Strictness::Medium),
        now,
        std::move(target),
        request.scheduleType,
        std::move(cron)
    };

    if (m_store) {
        m_store->insertRule(rule);
    }
    m_rules.push_back(rule);
    return rule;
}

void RuleStore::removeRule(const RuleId &id)
{
    auto it = findOrThrow(id);
    if (m_store) {
        m_store->deleteRule(id);
    }
    m_rules.erase(it);
}

BlockRule RuleStore::setEnabled(const RuleId &id, bool enabled)
{
    auto it = findOrThrow(id);
    BlockRule updated = *it;
    updated.enabled = enabled;
    if (m_store) {
        m_store->updateRule(updated);
    }
    *it = updated;
    return updated;
}

BlockRule RuleStore::setStrictness(const RuleId &id, Strictness strictness)
{
    auto it = findOrThrow(id);
    BlockRule updated = *it;
    updated.strictness = strictness;
    if (m_store) {
        m_store->updateRule(updated);
    }
    *it = updated;
    return updated;
}

std::optional<BlockRule> RuleStore::findRule(const RuleId &id) const
{
    auto it = std::find_if(m_rules.begin(), m_rules.end(), [&id](const BlockRule &rule) {
        return rule.id == id;
    });
    if (it == m_rules.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<BlockRule> RuleStore::listRules(const RuleFilter &filter) const
{
    std::vector<BlockRule> result;
    for (const auto &rule : m_rules) {
        if (filter.ruleType && rule.type() != *filter.ruleType) {
            continue;
        }
        if (filter.enabled && rule.enabled != *filter.enabled) {
            continue;
        }
        result.push_back(rule);
    }
    return result;
}

std::vector<BlockRule>::iterator RuleStore::findOrThrow(const RuleId &id)
{
    auto it = std::find_if(m_rules.begin(), m_rules.end(), [&id](const BlockRule &rule) {
        return rule.id == id;
    });
    if (it == m_rules.end()) {
        throw BlockingError::notFound(id.value());
    }
    return it;
}

} // namespace focusguard
