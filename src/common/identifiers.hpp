#pragma once

#include <string>

namespace focusguard {

// Validated identifier types. Each constructor throws BlockingError with
// ErrorKind::Validation when the raw value does not meet its format, so code
// holding one of these never re-checks the underlying string.

class RuleId {
public:
    explicit RuleId(const std::string &raw);

    static RuleId generate();

    const std::string &value() const { return m_value; }

    bool operator==(const RuleId &other) const { return m_value == other.m_value; }
    bool operator!=(const RuleId &other) const { return m_value != other.m_value; }
    bool operator<(const RuleId &other) const { return m_value < other.m_value; }

private:
    std::string m_value;
};

// Lowercased DNS name made of valid labels, e.g. "example.com".
class Domain {
public:
    explicit Domain(const std::string &raw);

    const std::string &value() const { return m_value; }

    // True when host equals this domain or is one of its subdomains.
    bool covers(const std::string &host) const;

    bool operator==(const Domain &other) const { return m_value == other.m_value; }
    bool operator!=(const Domain &other) const { return m_value != other.m_value; }
    bool operator<(const Domain &other) const { return m_value < other.m_value; }

private:
    std::string m_value;
};

// Process or application name, stored trimmed.
class AppName {
public:
    explicit AppName(const std::string &raw);

    const std::string &value() const { return m_value; }

    // Case-insensitive comparison that ignores a trailing ".exe".
    bool matches(const std::string &processName) const;

    bool operator==(const AppName &other) const { return m_value == other.m_value; }
    bool operator!=(const AppName &other) const { return m_value != other.m_value; }
    bool operator<(const AppName &other) const { return m_value < other.m_value; }

private:
    std::string m_value;
};

// Five whitespace-separated cron fields. Field contents are checked when the
// schedule is evaluated, not here.
class CronExpression {
public:
    explicit CronExpression(const std::string &raw);

    const std::string &value() const { return m_value; }

    bool operator==(const CronExpression &other) const { return m_value == other.m_value; }
    bool operator!=(const CronExpression &other) const { return m_value != other.m_value; }

private:
    std::string m_value;
};

class CategoryId {
public:
    explicit CategoryId(const std::string &raw);

    const std::string &value() const { return m_value; }

    bool operator==(const CategoryId &other) const { return m_value == other.m_value; }
    bool operator!=(const CategoryId &other) const { return m_value != other.m_value; }
    bool operator<(const CategoryId &other) const { return m_value < other.m_value; }

private:
    std::string m_value;
};

std::string trimmed(const std::string &value);
std::string toLower(std::string value);
std::string normalizeProcessName(const std::string &name);

// Random hex identifier in the 8-4-4-4-12 layout.
std::string generateId();

} // namespace focusguard
