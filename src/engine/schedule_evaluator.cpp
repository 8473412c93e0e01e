#include "engine/schedule_evaluator.hpp"

#include <algorithm>
#include <type_traits>

#include "common/logging.hpp"
#include "engine/category_expander.hpp"

namespace focusguard {

namespace {

bool blockTargetCovers(const BlockTarget &blockTarget, const std::string &target)
{
    return std::visit([&target](const auto &value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Domain>) {
            return value.covers(target);
        } else {
            static_assert(std::is_same_v<T, AppName>, "unhandled block target");
            return value.matches(target);
        }
    }, blockTarget);
}

} // namespace

bool ScheduleEvaluator::isRuleActiveNow(const BlockRule &rule,
                                        TimePoint now,
                                        bool hasActiveSession) const
{
    switch (rule.scheduleType) {
    case ScheduleType::Always:
        return true;
    case ScheduleType::FocusOnly:
        return hasActiveSession;
    case ScheduleType::Scheduled: {
        if (!rule.scheduleCron) {
            return false;
        }
        const auto schedule = scheduleFor(*rule.scheduleCron);
        return schedule && schedule->matches(now);
    }
    }
    return false;
}

bool ScheduleEvaluator::ruleCoversTarget(const BlockRule &rule, const std::string &target)
{
    return std::visit([&target](const auto &value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Domain>) {
            return value.covers(target);
        } else if constexpr (std::is_same_v<T, AppName>) {
            return value.matches(target);
        } else {
            static_assert(std::is_same_v<T, CategoryId>, "unhandled rule target");
            if (!CategoryExpander::isKnown(value)) {
                return false;
            }
            const auto expanded = CategoryExpander::expand(std::vector<CategoryId>{value});
            return std::any_of(expanded.begin(), expanded.end(),
                               [&target](const BlockTarget &blockTarget) {
                                   return blockTargetCovers(blockTarget, target);
                               });
        }
    }, rule.target);
}

bool ScheduleEvaluator::isBlockingActiveFor(const std::vector<BlockRule> &rules,
                                            const std::string &target,
                                            TimePoint now,
                                            bool hasActiveSession) const
{
    return std::any_of(rules.begin(), rules.end(), [&](const BlockRule &rule) {
        return rule.enabled
            && ruleCoversTarget(rule, target)
            && isRuleActiveNow(rule, now, hasActiveSession);
    });
}

std::optional<CronSchedule> ScheduleEvaluator::scheduleFor(const CronExpression &cron) const
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    auto it = m_cache.find(cron.value());
    if (it != m_cache.end()) {
        return it->second;
    }

    std::string error;
    auto schedule = CronSchedule::parse(cron.value(), &error);
    if (!schedule) {
        FGLOG_WARN(QStringLiteral("ScheduleEvaluator"),
                   QStringLiteral("scheduleFor"),
                   QStringLiteral("cron_parse_failed"),
                   QStringLiteral("invalid_configuration"),
                   QStringLiteral("cron_parse"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"cron", cron.value()}, {"error", error}}));
    }
    m_cache.emplace(cron.value(), schedule);
    return schedule;
}

} // namespace focusguard
