#include "common/identifiers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

#include "common/errors.hpp"

namespace focusguard {

namespace {

constexpr std::size_t kMaxDomainLength = 253;
constexpr std::size_t kMaxRuleIdLength = 128;
constexpr int kCronFieldCount = 5;

const std::regex &domainPattern()
{
    static const std::regex pattern(
        "^(?:[a-z0-9](?:[a-z0-9-]{0,61}[a-z0-9])?\\.)+[a-z0-9][a-z0-9-]{0,61}[a-z0-9]$");
    return pattern;
}

bool containsWhitespace(const std::string &value)
{
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // namespace

std::string trimmed(const std::string &value)
{
    auto begin = value.begin();
    auto end = value.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(begin, end);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string normalizeProcessName(const std::string &name)
{
    std::string normalized = toLower(trimmed(name));
    const std::string suffix = ".exe";
    if (normalized.size() > suffix.size()
        && normalized.compare(normalized.size() - suffix.size(), suffix.size(), suffix) == 0) {
        normalized.erase(normalized.size() - suffix.size());
    }
    return normalized;
}

RuleId::RuleId(const std::string &raw)
    : m_value(raw)
{
    if (m_value.empty()) {
        throw BlockingError::validation("id", "Rule id cannot be empty");
    }
    if (m_value.size() > kMaxRuleIdLength) {
        throw BlockingError::validation("id", "Rule id is too long");
    }
    if (containsWhitespace(m_value)) {
        throw BlockingError::validation("id", "Rule id cannot contain whitespace");
    }
}

std::string generateId()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    const uint64_t high = dist(gen);
    const uint64_t low = dist(gen);

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    out << std::setw(8) << (high >> 32) << "-";
    out << std::setw(4) << ((high >> 16) & 0xFFFF) << "-";
    out << std::setw(4) << (high & 0xFFFF) << "-";
    out << std::setw(4) << (low >> 48) << "-";
    out << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return out.str();
}

RuleId RuleId::generate()
{
    return RuleId(generateId());
}

Domain::Domain(const std::string &raw)
    : m_value(toLower(trimmed(raw)))
{
    if (m_value.empty()) {
        throw BlockingError::validation("target", "Domain cannot be empty");
    }
    if (m_value.size() > kMaxDomainLength) {
        throw BlockingError::validation("target",
                                        "Domain name is too long (max 253 characters)");
    }
    if (!std::regex_match(m_value, domainPattern())) {
        throw BlockingError::validation("target", "Invalid domain: " + raw);
    }
}

bool Domain::covers(const std::string &host) const
{
    const std::string normalized = toLower(trimmed(host));
    if (normalized == m_value) {
        return true;
    }
    if (normalized.size() <= m_value.size()) {
        return false;
    }
    const std::size_t offset = normalized.size() - m_value.size();
    return normalized[offset - 1] == '.'
        && normalized.compare(offset, m_value.size(), m_value) == 0;
}

AppName::AppName(const std::string &raw)
    : m_value(trimmed(raw))
{
    if (m_value.empty()) {
        throw BlockingError::validation("target", "App name cannot be empty");
    }
}

bool AppName::matches(const std::string &processName) const
{
    return normalizeProcessName(processName) == normalizeProcessName(m_value);
}

CronExpression::CronExpression(const std::string &raw)
    : m_value(trimmed(raw))
{
    std::istringstream in(m_value);
    std::string field;
    int count = 0;
    while (in >> field) {
        ++count;
    }
    if (count != kCronFieldCount) {
        throw BlockingError::validation("scheduleCron",
                                        "Cron expression must have 5 fields: " + raw);
    }
}

CategoryId::CategoryId(const std::string &raw)
    : m_value(trimmed(raw))
{
    if (m_value.empty()) {
        throw BlockingError::validation("target", "Category id cannot be empty");
    }
    const bool valid = std::all_of(m_value.begin(), m_value.end(), [](unsigned char c) {
        return std::islower(c) || std::isdigit(c) || c == '_';
    });
    if (!valid) {
        throw BlockingError::validation("target", "Invalid category id: " + raw);
    }
}

} // namespace focusguard
