#include "common/config.hpp"

#include <QDir>
#include <QFile>
#include <QStandardPaths>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace focusguard {

namespace {

std::string defaultDataDir()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty() ? QStringLiteral(".") : home;
    return (base + QStringLiteral("/.local/share/focusguard")).toStdString();
}

void warnConfig(const QString &path, const QString &why)
{
    FGLOG_WARN(QStringLiteral("FocusConfig"),
               QStringLiteral("fromFile"),
               QStringLiteral("config_ignored"),
               why,
               QStringLiteral("json_parse"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()}}));
}

// Non-positive values are ignored.
void applyMillis(const nlohmann::json &root, const char *key,
                 std::chrono::milliseconds &target)
{
    if (!root.contains(key) || !root.at(key).is_number_integer()) {
        return;
    }
    const long long value = root.at(key).get<long long>();
    if (value > 0) {
        target = std::chrono::milliseconds(value);
    }
}

void applyMillisEnv(const char *name, std::chrono::milliseconds &target)
{
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (ok && value > 0) {
        target = std::chrono::milliseconds(value);
    }
}

} // namespace

QString defaultConfigFilePath()
{
    QString configDir = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (configDir.isEmpty()) {
        const QString home = qEnvironmentVariable("HOME");
        configDir = (home.isEmpty() ? QStringLiteral(".") : home)
            + QStringLiteral("/.config");
    }
    return configDir + QStringLiteral("/focusguard/config.json");
}

QString defaultSocketPath()
{
    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/focusguard.sock");
}

std::string FocusConfig::databasePath() const
{
    return dataDir + "/focusguard.db";
}

std::string FocusConfig::logDirectory() const
{
    return dataDir + "/logs";
}

FocusConfig FocusConfig::defaults()
{
    FocusConfig config;
    config.dataDir = defaultDataDir();
    config.socketName = defaultSocketPath();
    return config;
}

FocusConfig FocusConfig::fromFile(const QString &path)
{
    FocusConfig config = defaults();

    QFile file(path);
    if (!file.exists()) {
        return config;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        warnConfig(path, QStringLiteral("unreadable"));
        return config;
    }

    const auto root = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        warnConfig(path, QStringLiteral("invalid_json"));
        return config;
    }

    if (root.contains("dataDir") && root.at("dataDir").is_string()) {
        config.dataDir = root.at("dataDir").get<std::string>();
    }
    if (root.contains("hostsFile") && root.at("hostsFile").is_string()) {
        config.hostsFilePath = root.at("hostsFile").get<std::string>();
    }
    if (root.contains("socketName") && root.at("socketName").is_string()) {
        config.socketName = QString::fromStdString(root.at("socketName").get<std::string>());
    }
    applyMillis(root, "probeTimeoutMs", config.probeTimeout);
    applyMillis(root, "tickIntervalMs", config.tickInterval);
    if (root.contains("trace") && root.at("trace").is_boolean()) {
        config.traceEnabled = root.at("trace").get<bool>();
    }
    return config;
}

FocusConfig FocusConfig::load()
{
    FocusConfig config = fromFile(defaultConfigFilePath());
    config.applyEnvironment();
    return config;
}

void FocusConfig::applyEnvironment()
{
    const QString dataDirEnv = qEnvironmentVariable("FOCUSGUARD_DATA_DIR");
    if (!dataDirEnv.isEmpty()) {
        dataDir = dataDirEnv.toStdString();
    }
    const QString hostsEnv = qEnvironmentVariable("FOCUSGUARD_HOSTS_FILE");
    if (!hostsEnv.isEmpty()) {
        hostsFilePath = hostsEnv.toStdString();
    }
    const QString socketEnv = qEnvironmentVariable("FOCUSGUARD_SOCKET_NAME");
    if (!socketEnv.isEmpty()) {
        socketName = socketEnv;
    }
    applyMillisEnv("FOCUSGUARD_PROBE_TIMEOUT_MS", probeTimeout);
    applyMillisEnv("FOCUSGUARD_TICK_INTERVAL_MS", tickInterval);
    if (qEnvironmentVariableIntValue("FOCUSGUARD_TRACE") == 1) {
        traceEnabled = true;
    }
}

} // namespace focusguard
