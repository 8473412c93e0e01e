#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <utility>

#include "common/config.hpp"
#include "common/logging.hpp"

using focusguard::FocusConfig;

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();
    void testDefaults();
    void testFileOverridesDefaults();
    void testInvalidFileKeepsDefaults();
    void testEnvironmentOverridesFile();
    void testDefaultPaths();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QByteArray m_prevConfigHome;
    QByteArray m_prevRuntime;

    QString writeFile(const QString &name, const QByteArray &contents);
};

namespace {

const char *const kEnvironment[] = {
    "FOCUSGUARD_DATA_DIR",
    "FOCUSGUARD_HOSTS_FILE",
    "FOCUSGUARD_SOCKET_NAME",
    "FOCUSGUARD_PROBE_TIMEOUT_MS",
    "FOCUSGUARD_TICK_INTERVAL_MS",
    "FOCUSGUARD_TRACE",
};

} // namespace

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    m_prevConfigHome = qgetenv("XDG_CONFIG_HOME");
    m_prevRuntime = qgetenv("XDG_RUNTIME_DIR");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qputenv("XDG_CONFIG_HOME", (m_tempDir.path() + "/config").toUtf8());
    qputenv("XDG_RUNTIME_DIR", (m_tempDir.path() + "/run").toUtf8());
    focusguard::logging::initLogging(QStringLiteral("focusguard-test"), false);
    cleanup();
}

void ConfigTests::cleanupTestCase()
{
    const std::pair<const char *, QByteArray> saved[] = {
        {"HOME", m_prevHome},
        {"XDG_CONFIG_HOME", m_prevConfigHome},
        {"XDG_RUNTIME_DIR", m_prevRuntime},
    };
    for (const auto &entry : saved) {
        if (entry.second.isEmpty()) {
            qunsetenv(entry.first);
        } else {
            qputenv(entry.first, entry.second);
        }
    }
}

void ConfigTests::cleanup()
{
    for (const char *name : kEnvironment) {
        qunsetenv(name);
    }
}

QString ConfigTests::writeFile(const QString &name, const QByteArray &contents)
{
    const QString path = m_tempDir.path() + "/" + name;
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(contents);
    }
    return path;
}

void ConfigTests::testDefaults()
{
    const FocusConfig config = FocusConfig::defaults();
    QCOMPARE(QString::fromStdString(config.dataDir),
             m_tempDir.path() + "/.local/share/focusguard");
    QCOMPARE(QString::fromStdString(config.databasePath()),
             m_tempDir.path() + "/.local/share/focusguard/focusguard.db");
    QCOMPARE(QString::fromStdString(config.logDirectory()),
             m_tempDir.path() + "/.local/share/focusguard/logs");
    QCOMPARE(QString::fromStdString(config.hostsFilePath), QStringLiteral("/etc/hosts"));
    QCOMPARE(static_cast<long long>(config.probeTimeout.count()), 2000LL);
    QCOMPARE(static_cast<long long>(config.tickInterval.count()), 60000LL);
    QVERIFY(!config.traceEnabled);
}

void ConfigTests::testFileOverridesDefaults()
{
    const QString path = writeFile(QStringLiteral("full.json"),
        "{\"dataDir\": \"/tmp/fg-data\", \"hostsFile\": \"/tmp/fg-hosts\","
        " \"socketName\": \"fg-test\", \"probeTimeoutMs\": 500,"
        " \"tickIntervalMs\": -5, \"trace\": true}");

    const FocusConfig config = FocusConfig::fromFile(path);
    QCOMPARE(QString::fromStdString(config.dataDir), QStringLiteral("/tmp/fg-data"));
    QCOMPARE(QString::fromStdString(config.hostsFilePath), QStringLiteral("/tmp/fg-hosts"));
    QCOMPARE(config.socketName, QStringLiteral("fg-test"));
    QCOMPARE(static_cast<long long>(config.probeTimeout.count()), 500LL);
    QCOMPARE(static_cast<long long>(config.tickInterval.count()), 60000LL);
    QVERIFY(config.traceEnabled);
}

void ConfigTests::testInvalidFileKeepsDefaults()
{
    const QString path = writeFile(QStringLiteral("broken.json"), "{ not json");
    const FocusConfig config = FocusConfig::fromFile(path);
    const FocusConfig defaults = FocusConfig::defaults();
    QCOMPARE(QString::fromStdString(config.dataDir), QString::fromStdString(defaults.dataDir));
    QCOMPARE(config.socketName, defaults.socketName);

    const FocusConfig missing = FocusConfig::fromFile(m_tempDir.path() + "/absent.json");
    QCOMPARE(QString::fromStdString(missing.hostsFilePath),
             QString::fromStdString(defaults.hostsFilePath));

    const QString wrongTypes = writeFile(QStringLiteral("types.json"),
                                         "{\"dataDir\": 5, \"trace\": \"yes\"}");
    const FocusConfig typed = FocusConfig::fromFile(wrongTypes);
    QCOMPARE(QString::fromStdString(typed.dataDir), QString::fromStdString(defaults.dataDir));
    QVERIFY(!typed.traceEnabled);
}

void ConfigTests::testEnvironmentOverridesFile()
{
    QDir().mkpath(m_tempDir.path() + "/config/focusguard");
    writeFile(QStringLiteral("config/focusguard/config.json"),
              "{\"dataDir\": \"/from/file\", \"probeTimeoutMs\": 900}");

    FocusConfig fromFile = FocusConfig::load();
    QCOMPARE(QString::fromStdString(fromFile.dataDir), QStringLiteral("/from/file"));
    QCOMPARE(static_cast<long long>(fromFile.probeTimeout.count()), 900LL);

    qputenv("FOCUSGUARD_DATA_DIR", "/from/env");
    qputenv("FOCUSGUARD_PROBE_TIMEOUT_MS", "250");
    qputenv("FOCUSGUARD_TICK_INTERVAL_MS", "not-a-number");
    qputenv("FOCUSGUARD_TRACE", "1");
    qputenv("FOCUSGUARD_SOCKET_NAME", "fg-env");

    const FocusConfig config = FocusConfig::load();
    QCOMPARE(QString::fromStdString(config.dataDir), QStringLiteral("/from/env"));
    QCOMPARE(static_cast<long long>(config.probeTimeout.count()), 250LL);
    QCOMPARE(static_cast<long long>(config.tickInterval.count()), 60000LL);
    QCOMPARE(config.socketName, QStringLiteral("fg-env"));
    QVERIFY(config.traceEnabled);
}

void ConfigTests::testDefaultPaths()
{
    QCOMPARE(focusguard::defaultConfigFilePath(),
             m_tempDir.path() + "/config/focusguard/config.json");
    QCOMPARE(focusguard::defaultSocketPath(), m_tempDir.path() + "/run/focusguard.sock");
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
