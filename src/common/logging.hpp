#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace focusguard::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogSettings {
    QString processName;
    // Empty selects <FOCUSGUARD_DATA_DIR or ~/.local/share/focusguard>/logs.
    QString directory;
    // Debug events reach the main log and a separate -trace.log only when set.
    bool traceEnabled = false;
    qint64 rotateAtBytes = 5 * 1024 * 1024;
    // <name>.log.1 is the newest rotated file.
    int keepRotated = 3;
};

// Call once from main() before the first event; later calls replace the settings.
void initLogging(const LogSettings &settings);
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Resolved path of the live log file, or of the trace log when trace is true.
QString logFilePath(bool trace = false);

// Thread-local id linking the events of one request.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// One JSON line per event. An empty correlationId takes the thread's current id.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
// "host:<hostname>,uid:<uid>", resolved once per process.
QString defaultWho();

} // namespace focusguard::logging

#define FGLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::focusguard::logging::logEvent(::focusguard::logging::LogLevel::Debug, \
                                    ::focusguard::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FGLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::focusguard::logging::logEvent(::focusguard::logging::LogLevel::Info, \
                                    ::focusguard::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FGLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::focusguard::logging::logEvent(::focusguard::logging::LogLevel::Warn, \
                                    ::focusguard::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FGLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::focusguard::logging::logEvent(::focusguard::logging::LogLevel::Error, \
                                    ::focusguard::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
