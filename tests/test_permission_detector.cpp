#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <atomic>
#include <stdexcept>
#include <thread>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "engine/permission_detector.hpp"

using namespace focusguard;

namespace {

class FakeProbe : public CapabilityProbe {
public:
    FakeProbe(bool hosts, bool monitoring, bool termination)
        : m_hosts(hosts), m_monitoring(monitoring), m_termination(termination)
    {
    }

    ProbeResult probeHostsFile(const std::string &) override
    {
        return m_hosts ? ProbeResult{true, std::nullopt}
                       : ProbeResult{false, std::string("Permission denied. Elevated privileges required.")};
    }
    ProbeResult probeProcessMonitoring() override
    {
        return m_monitoring ? ProbeResult{true, std::nullopt}
                            : ProbeResult{false, std::string("no /proc")};
    }
    ProbeResult probeProcessTermination() override
    {
        return m_termination ? ProbeResult{true, std::nullopt}
                             : ProbeResult{false, std::string("no signals")};
    }

private:
    bool m_hosts;
    bool m_monitoring;
    bool m_termination;
};

class SlowProbe : public FakeProbe {
public:
    SlowProbe() : FakeProbe(true, true, true) {}

    ProbeResult probeHostsFile(const std::string &path) override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        return FakeProbe::probeHostsFile(path);
    }
};

class CountingSlowProbe : public FakeProbe {
public:
    CountingSlowProbe() : FakeProbe(true, true, true) {}

    ProbeResult probeHostsFile(const std::string &path) override
    {
        ++hostsRuns;
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        return FakeProbe::probeHostsFile(path);
    }
    ProbeResult probeProcessMonitoring() override
    {
        ++monitoringRuns;
        return FakeProbe::probeProcessMonitoring();
    }

    std::atomic<int> hostsRuns{0};
    std::atomic<int> monitoringRuns{0};
};

class ThrowingProbe : public FakeProbe {
public:
    ThrowingProbe() : FakeProbe(true, true, true) {}

    ProbeResult probeProcessMonitoring() override
    {
        throw std::runtime_error("boom");
    }
};

} // namespace

class PermissionDetectorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testOverallStatusTable();
    void testFullyFunctional();
    void testDegradedReportsErrors();
    void testNonFunctionalRecommendations();
    void testSlowProbeTimesOut();
    void testHungCheckIsNotRelaunched();
    void testThrowingProbeReported();
    void testSystemProbeOnWritableFile();
    void testSystemProbeOnMissingFile();
    void testInstructions();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void PermissionDetectorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    logging::initLogging(QStringLiteral("focusguard-test"), false);
}

void PermissionDetectorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void PermissionDetectorTests::testOverallStatusTable()
{
    QCOMPARE(PermissionDetector::overallStatusFor(true, true, true),
             OverallPermissionStatus::FullyFunctional);
    QCOMPARE(PermissionDetector::overallStatusFor(false, false, false),
             OverallPermissionStatus::NonFunctional);
    QCOMPARE(PermissionDetector::overallStatusFor(true, false, false),
             OverallPermissionStatus::Degraded);
    QCOMPARE(PermissionDetector::overallStatusFor(false, true, true),
             OverallPermissionStatus::Degraded);
}

void PermissionDetectorTests::testFullyFunctional()
{
    PermissionDetector detector("/etc/hosts", std::chrono::milliseconds(1000),
                                std::make_shared<FakeProbe>(true, true, true));
    const PermissionStatus status = detector.checkPermissions();
    QCOMPARE(status.overallStatus, OverallPermissionStatus::FullyFunctional);
    QVERIFY(status.recommendations.empty());
    QVERIFY(!status.hostsFileError.has_value());
    QCOMPARE(QString::fromStdString(status.hostsFilePath), QStringLiteral("/etc/hosts"));
    QCOMPARE(QString::fromStdString(status.platform),
             QString::fromStdString(PermissionDetector::currentPlatform()));
}

void PermissionDetectorTests::testDegradedReportsErrors()
{
    PermissionDetector detector("/etc/hosts", std::chrono::milliseconds(1000),
                                std::make_shared<FakeProbe>(false, true, true));
    const PermissionStatus status = detector.checkPermissions();
    QCOMPARE(status.overallStatus, OverallPermissionStatus::Degraded);
    QVERIFY(!status.hostsFileWritable);
    QVERIFY(status.hostsFileError.has_value());
    QVERIFY(status.processMonitoringAvailable);
    QVERIFY(!status.processMonitoringError.has_value());
    QCOMPARE(status.recommendations.size(), static_cast<size_t>(2));
    QVERIFY(status.recommendations.front().find("hosts file") != std::string::npos);
}

void PermissionDetectorTests::testNonFunctionalRecommendations()
{
    PermissionDetector detector("/etc/hosts", std::chrono::milliseconds(1000),
                                std::make_shared<FakeProbe>(false, false, false));
    const PermissionStatus status = detector.checkPermissions();
    QCOMPARE(status.overallStatus, OverallPermissionStatus::NonFunctional);
    QCOMPARE(status.recommendations.size(), static_cast<size_t>(4));
    QVERIFY(status.recommendations[2].find("fallback") != std::string::npos);
}

void PermissionDetectorTests::testSlowProbeTimesOut()
{
    PermissionDetector detector("/etc/hosts", std::chrono::milliseconds(50),
                                std::make_shared<SlowProbe>());
    QElapsedTimer timer;
    timer.start();
    const PermissionStatus status = detector.checkPermissions();
    QVERIFY(timer.elapsed() < 450);

    QVERIFY(!status.hostsFileWritable);
    QVERIFY(status.hostsFileError->find("timed out") != std::string::npos);
    QVERIFY(status.processMonitoringAvailable);
    QCOMPARE(status.overallStatus, OverallPermissionStatus::Degraded);
}

void PermissionDetectorTests::testHungCheckIsNotRelaunched()
{
    auto probe = std::make_shared<CountingSlowProbe>();
    PermissionDetector detector("/etc/hosts", std::chrono::milliseconds(30), probe);

    for (int i = 0; i < 3; ++i) {
        const PermissionStatus status = detector.checkPermissions();
        QVERIFY(!status.hostsFileWritable);
        QVERIFY(status.processMonitoringAvailable);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    QCOMPARE(probe->hostsRuns.load(), 1);
    QCOMPARE(probe->monitoringRuns.load(), 3);

    // The finished run is not reused; the next check starts a fresh one.
    detector.checkPermissions();
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    QCOMPARE(probe->hostsRuns.load(), 2);
}

void PermissionDetectorTests::testThrowingProbeReported()
{
    PermissionDetector detector("/etc/hosts", std::chrono::milliseconds(1000),
                                std::make_shared<ThrowingProbe>());
    const PermissionStatus status = detector.checkPermissions();
    QVERIFY(!status.processMonitoringAvailable);
    QVERIFY(status.processMonitoringError->find("boom") != std::string::npos);
}

void PermissionDetectorTests::testSystemProbeOnWritableFile()
{
    const QString hostsPath = m_tempDir.path() + "/hosts";
    QFile file(hostsPath);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("127.0.0.1 localhost\n");
    file.close();

    SystemCapabilityProbe probe;
    const ProbeResult result = probe.probeHostsFile(hostsPath.toStdString());
    QVERIFY(result.ok);

    QFile check(hostsPath);
    QVERIFY(check.open(QIODevice::ReadOnly));
    QCOMPARE(check.readAll(), QByteArray("127.0.0.1 localhost\n"));
}

void PermissionDetectorTests::testSystemProbeOnMissingFile()
{
    SystemCapabilityProbe probe;
    const ProbeResult result =
        probe.probeHostsFile((m_tempDir.path() + "/missing-hosts").toStdString());
    QVERIFY(!result.ok);
    QVERIFY(result.error->find("not found") != std::string::npos);
}

void PermissionDetectorTests::testInstructions()
{
    QCOMPARE(QString::fromStdString(PermissionDetector::instructionsFor("Darwin").platform),
             QStringLiteral("macOS"));
    QCOMPARE(QString::fromStdString(PermissionDetector::instructionsFor("WINDOWS").platform),
             QStringLiteral("Windows"));

    const PlatformInstructions onLinux = PermissionDetector::instructionsFor("linux");
    QVERIFY(onLinux.primaryMethod.isRecommended);
    QCOMPARE(onLinux.alternativeMethods.size(), static_cast<size_t>(2));
    QVERIFY(!onLinux.requiresRestart);
    QVERIFY(!onLinux.securityNotes.empty());

    QCOMPARE(QString::fromStdString(PermissionDetector::instructionsFor("").platform),
             QString::fromStdString(PermissionDetector::currentPlatform()));

    bool thrown = false;
    try {
        PermissionDetector::instructionsFor("beos");
    } catch (const BlockingError &ex) {
        thrown = true;
        QCOMPARE(ex.kind(), ErrorKind::Validation);
        QCOMPARE(QString::fromStdString(ex.field()), QStringLiteral("platform"));
    }
    QVERIFY(thrown);
}

QTEST_MAIN(PermissionDetectorTests)
#include "test_permission_detector.moc"
