#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace focusguard::logging {

namespace {

std::mutex g_logMutex;
LogSettings g_settings;

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString fallbackDirectory()
{
    const QString dataDir = qEnvironmentVariable("FOCUSGUARD_DATA_DIR");
    if (!dataDir.isEmpty()) {
        return dataDir + QStringLiteral("/logs");
    }
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/focusguard/logs");
    return home.isEmpty() ? relative : home + QLatin1Char('/') + relative;
}

// Caller holds g_logMutex.
QString resolvedDirectory()
{
    return g_settings.directory.isEmpty() ? fallbackDirectory() : g_settings.directory;
}

QString pathFor(const QString &directory, const QString &process, bool trace)
{
    const QString base = process.isEmpty() ? QStringLiteral("focusguard") : process;
    return directory + QLatin1Char('/') + base
        + (trace ? QStringLiteral("-trace.log") : QStringLiteral(".log"));
}

// Shifts <path>.1 .. <path>.N-1 up by one and moves the live file to <path>.1.
void rotate(const QString &path, qint64 limit, int keep)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < limit) {
        return;
    }
    if (keep <= 0) {
        QFile::remove(path);
        return;
    }
    QFile::remove(path + QStringLiteral(".%1").arg(keep));
    for (int i = keep - 1; i >= 1; --i) {
        const QString from = path + QStringLiteral(".%1").arg(i);
        if (QFile::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(i + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

// Caller holds g_logMutex.
void append(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotate(path, g_settings.rotateAtBytes, g_settings.keepRotated);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const LogSettings &settings)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_settings = settings;
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LogSettings settings;
    settings.processName = processName;
    settings.traceEnabled = traceEnabled;
    initLogging(settings);
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_settings.traceEnabled;
}

QString logFilePath(bool trace)
{
    const QString process = defaultProcessName();
    std::lock_guard<std::mutex> lock(g_logMutex);
    return pathFor(resolvedDirectory(), process, trace);
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_settings.processName.isEmpty()) {
            return g_settings.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("focusguard");
}

QString defaultWho()
{
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<qulonglong>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"pid", static_cast<long long>(getpid())},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    std::lock_guard<std::mutex> lock(g_logMutex);
    const QString directory = resolvedDirectory();
    if (level != LogLevel::Debug || g_settings.traceEnabled) {
        append(pathFor(directory, process, false), line);
    }
    if (g_settings.traceEnabled) {
        append(pathFor(directory, process, true), line);
    }
}

} // namespace focusguard::logging
