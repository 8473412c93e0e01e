#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testTraceLogWrites();
    void testCorrelationScopeFillsMissingId();
    void testDataDirOverridesLogLocation();
    void testConfiguredDirectoryRotates();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QByteArray m_prevDataDir;

    QByteArray lastLine(const QString &path) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    m_prevDataDir = qgetenv("FOCUSGUARD_DATA_DIR");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("FOCUSGUARD_DATA_DIR");
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
    if (m_prevDataDir.isEmpty()) {
        qunsetenv("FOCUSGUARD_DATA_DIR");
    } else {
        qputenv("FOCUSGUARD_DATA_DIR", m_prevDataDir);
    }
}

QByteArray LoggingTests::lastLine(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    QByteArray last;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            last = line;
        }
    }
    return last;
}

void LoggingTests::testLogEventWrites()
{
    focusguard::logging::initLogging(QStringLiteral("focusguard-test"), false);
    const QString logPath = m_tempDir.path() + "/.local/share/focusguard/logs/focusguard-test.log";

    focusguard::logging::logEvent(focusguard::logging::LogLevel::Info,
                                  QStringLiteral("focusguard-test"),
                                  QStringLiteral("Test"),
                                  QStringLiteral("testLogEventWrites"),
                                  QStringLiteral("test_log"),
                                  QStringLiteral("unit_test"),
                                  QStringLiteral("direct_call"),
                                  focusguard::logging::defaultWho(),
                                  QStringLiteral("corr-1"),
                                  nlohmann::json{{"key", "value"}});

    QVERIFY(QFile::exists(logPath));
    const QByteArray line = lastLine(logPath);
    QVERIFY(!line.isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testTraceLogWrites()
{
    focusguard::logging::initLogging(QStringLiteral("focusguard-test"), true);
    QVERIFY(focusguard::logging::isTraceEnabled());
    const QString tracePath = m_tempDir.path() + "/.local/share/focusguard/logs/focusguard-test-trace.log";

    focusguard::logging::logEvent(focusguard::logging::LogLevel::Debug,
                                  QStringLiteral("focusguard-test"),
                                  QStringLiteral("Test"),
                                  QStringLiteral("testTraceLogWrites"),
                                  QStringLiteral("test_trace"),
                                  QStringLiteral("unit_test"),
                                  QStringLiteral("direct_call"),
                                  focusguard::logging::defaultWho(),
                                  QStringLiteral("corr-2"),
                                  nlohmann::json::object());

    QVERIFY(QFile::exists(tracePath));
    const auto parsed = nlohmann::json::parse(lastLine(tracePath).toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("DEBUG"));
    focusguard::logging::initLogging(QStringLiteral("focusguard-test"), false);
}

void LoggingTests::testCorrelationScopeFillsMissingId()
{
    focusguard::logging::initLogging(QStringLiteral("focusguard-test"), false);
    const QString logPath = m_tempDir.path() + "/.local/share/focusguard/logs/focusguard-test.log";

    {
        focusguard::logging::CorrelationScope scope(QStringLiteral("scoped-corr"));
        QCOMPARE(focusguard::logging::currentCorrelationId(), QStringLiteral("scoped-corr"));
        FGLOG_WARN(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScopeFillsMissingId"),
                   QStringLiteral("scoped_event"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   focusguard::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    QVERIFY(focusguard::logging::currentCorrelationId().isEmpty());

    const auto parsed = nlohmann::json::parse(lastLine(logPath).toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("scoped_event"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("scoped-corr"));
}

void LoggingTests::testDataDirOverridesLogLocation()
{
    focusguard::logging::initLogging(QStringLiteral("focusguard-test"), false);
    const QString dataDir = m_tempDir.path() + "/data";
    qputenv("FOCUSGUARD_DATA_DIR", dataDir.toUtf8());
    QCOMPARE(focusguard::logging::logFilePath(), dataDir + "/logs/focusguard-test.log");
    qunsetenv("FOCUSGUARD_DATA_DIR");
    QCOMPARE(focusguard::logging::logFilePath(true),
             m_tempDir.path() + "/.local/share/focusguard/logs/focusguard-test-trace.log");
}

void LoggingTests::testConfiguredDirectoryRotates()
{
    focusguard::logging::LogSettings settings;
    settings.processName = QStringLiteral("focusguard-rotate");
    settings.directory = m_tempDir.path() + "/rotating";
    settings.rotateAtBytes = 256;
    settings.keepRotated = 2;
    focusguard::logging::initLogging(settings);

    const QString logPath = focusguard::logging::logFilePath();
    QCOMPARE(logPath, settings.directory + "/focusguard-rotate.log");

    for (int i = 0; i < 30; ++i) {
        FGLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testConfiguredDirectoryRotates"),
                   QStringLiteral("rotation_fill"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   focusguard::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"index", i}}));
    }

    QVERIFY(QFile::exists(logPath));
    QVERIFY(QFile::exists(logPath + ".1"));
    QVERIFY(QFile::exists(logPath + ".2"));
    QVERIFY(!QFile::exists(logPath + ".3"));

    const auto parsed = nlohmann::json::parse(lastLine(logPath).toStdString());
    QCOMPARE(parsed["context"].value("index", -1), 29);
    QVERIFY(parsed.contains("pid"));
    QVERIFY(QString::fromStdString(parsed.value("who", "")).startsWith(QStringLiteral("host:")));

    focusguard::logging::initLogging(QStringLiteral("focusguard-test"), false);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
