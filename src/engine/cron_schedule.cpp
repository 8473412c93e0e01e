#include "engine/cron_schedule.hpp"

#include <array>
#include <cctype>
#include <sstream>
#include <vector>

#include "common/identifiers.hpp"

namespace focusguard {

namespace {

constexpr int kFieldCount = 5;

const std::array<const char *, 12> kMonthNames = {
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

const std::array<const char *, 7> kDayNames = {
    "sun", "mon", "tue", "wed", "thu", "fri", "sat"};

struct CronField {
    const char *name;
    int min;
    int max;
    const char *const *names;
    int nameCount;
    int nameBase;
};

const CronField kMinuteField{"minute", 0, 59, nullptr, 0, 0};
const CronField kHourField{"hour", 0, 23, nullptr, 0, 0};
const CronField kDayOfMonthField{"day-of-month", 1, 31, nullptr, 0, 0};
const CronField kMonthField{"month", 1, 12, kMonthNames.data(), 12, 1};
const CronField kDayOfWeekField{"day-of-week", 0, 7, kDayNames.data(), 7, 0};

bool isNumber(const std::string &text)
{
    if (text.empty() || text.size() > 4) {
        return false;
    }
    for (unsigned char c : text) {
        if (!std::isdigit(c)) {
            return false;
        }
    }
    return true;
}

bool parseValue(const std::string &token, const CronField &field, int &value)
{
    if (isNumber(token)) {
        value = std::stoi(token);
        return value >= field.min && value <= field.max;
    }
    const std::string lowered = toLower(token);
    for (int i = 0; i < field.nameCount; ++i) {
        if (lowered == field.names[i]) {
            value = field.nameBase + i;
            return true;
        }
    }
    return false;
}

std::vector<std::string> split(const std::string &text, char separator)
{
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in(text);
    while (std::getline(in, current, separator)) {
        parts.push_back(current);
    }
    if (!text.empty() && text.back() == separator) {
        parts.emplace_back();
    }
    return parts;
}

// Expands one comma-separated field into the list of values it selects.
bool parseField(const std::string &text, const CronField &field,
                std::vector<int> &values, std::string &error)
{
    for (const auto &item : split(text, ',')) {
        if (item.empty()) {
            error = std::string("empty list item in ") + field.name + " field";
            return false;
        }

        std::string base = item;
        int step = 1;
        const auto slash = item.find('/');
        if (slash != std::string::npos) {
            base = item.substr(0, slash);
            const std::string stepText = item.substr(slash + 1);
            if (!isNumber(stepText) || std::stoi(stepText) <= 0) {
                error = std::string("invalid step '") + stepText + "' in " + field.name + " field";
                return false;
            }
            step = std::stoi(stepText);
        }

        int low = field.min;
        int high = field.max;
        if (base != "*") {
            const auto dash = base.find('-');
            if (dash != std::string::npos) {
                if (!parseValue(base.substr(0, dash), field, low)
                    || !parseValue(base.substr(dash + 1), field, high)) {
                    error = std::string("invalid range '") + base + "' in " + field.name + " field";
                    return false;
                }
                if (low > high) {
                    error = std::string("descending range '") + base + "' in " + field.name + " field";
                    return false;
                }
            } else {
                if (!parseValue(base, field, low)) {
                    error = std::string("invalid value '") + base + "' in " + field.name + " field";
                    return false;
                }
                if (slash == std::string::npos) {
                    high = low;
                }
            }
        }

        for (int value = low; value <= high; value += step) {
            values.push_back(value);
        }
    }
    return true;
}

template <std::size_t N>
bool fillBits(const std::string &text, const CronField &field,
              std::bitset<N> &bits, std::string &error)
{
    std::vector<int> values;
    if (!parseField(text, field, values, error)) {
        return false;
    }
    for (int value : values) {
        bits.set(static_cast<std::size_t>(value) % N);
    }
    return true;
}

} // namespace

std::optional<CronSchedule> CronSchedule::parse(const std::string &expression,
                                                std::string *error)
{
    std::istringstream in(expression);
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) {
        fields.push_back(field);
    }

    std::string message;
    if (fields.size() != static_cast<std::size_t>(kFieldCount)) {
        message = "expected 5 fields, got " + std::to_string(fields.size());
        if (error) {
            *error = message;
        }
        return std::nullopt;
    }

    CronSchedule schedule;
    // Weekday bits are taken modulo 7 so that 7 lands on Sunday.
    const bool ok = fillBits(fields[0], kMinuteField, schedule.m_minutes, message)
        && fillBits(fields[1], kHourField, schedule.m_hours, message)
        && fillBits(fields[2], kDayOfMonthField, schedule.m_daysOfMonth, message)
        && fillBits(fields[3], kMonthField, schedule.m_months, message)
        && fillBits(fields[4], kDayOfWeekField, schedule.m_daysOfWeek, message);
    if (!ok) {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    }

    schedule.m_dayOfMonthRestricted = fields[2].front() != '*';
    schedule.m_dayOfWeekRestricted = fields[4].front() != '*';
    return schedule;
}

bool CronSchedule::matches(const std::tm &localTime) const
{
    if (!m_minutes.test(static_cast<std::size_t>(localTime.tm_min))
        || !m_hours.test(static_cast<std::size_t>(localTime.tm_hour))
        || !m_months.test(static_cast<std::size_t>(localTime.tm_mon + 1))) {
        return false;
    }

    const bool dayOfMonth = m_daysOfMonth.test(static_cast<std::size_t>(localTime.tm_mday));
    const bool dayOfWeek = m_daysOfWeek.test(static_cast<std::size_t>(localTime.tm_wday));
    if (m_dayOfMonthRestricted && m_dayOfWeekRestricted) {
        return dayOfMonth || dayOfWeek;
    }
    return dayOfMonth && dayOfWeek;
}

bool CronSchedule::matches(TimePoint time) const
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif
    return matches(tm);
}

} // namespace focusguard
