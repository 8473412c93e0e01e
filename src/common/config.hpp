#pragma once

#include <chrono>
#include <string>

#include <QString>

namespace focusguard {

// Runtime settings for the daemon and engine. Values come from defaults, then
// the optional JSON config file, then FOCUSGUARD_* environment variables.
struct FocusConfig {
    std::string dataDir;
    std::string hostsFilePath = "/etc/hosts";
    QString socketName;
    std::chrono::milliseconds probeTimeout{2000};
    std::chrono::milliseconds tickInterval{60000};
    bool traceEnabled = false;

    std::string databasePath() const;
    std::string logDirectory() const;

    static FocusConfig defaults();
    // Missing or unreadable files leave the defaults in place.
    static FocusConfig fromFile(const QString &path);
    static FocusConfig load();

    void applyEnvironment();
};

QString defaultConfigFilePath();
QString defaultSocketPath();

} // namespace focusguard
