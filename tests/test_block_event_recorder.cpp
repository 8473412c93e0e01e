#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "engine/block_event_recorder.hpp"
#include "engine/focus_store.hpp"
#include "engine/rule_store.hpp"

using namespace focusguard;

class BlockEventRecorderTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testRecordDefaultsTimestamp();
    void testRecordRejectsBadInput();
    void testRuleStats();
    void testBlockStatisticsWindows();
    void testTopBlockedAndRecentLimits();
    void testSessionBlocks();
    void testBypassRequests();
    void testEventsOutliveRule();
    void testPersistedReload();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    // 2026-10-19T12:00:00Z
    static TimePoint noon()
    {
        return std::chrono::system_clock::from_time_t(1792411200);
    }

    static BlockAttempt attempt(const RuleId &ruleId, const std::string &target, TimePoint at)
    {
        BlockAttempt blockAttempt;
        blockAttempt.ruleId = ruleId.value();
        blockAttempt.target = target;
        blockAttempt.blockedAt = at;
        return blockAttempt;
    }

    static BlockRule websiteRule(RuleStore &rules, const std::string &domain, TimePoint createdAt)
    {
        CreateRuleRequest request;
        request.ruleType = RuleType::Website;
        request.target = domain;
        return rules.createRule(request, createdAt);
    }

    template <typename Fn>
    static ErrorKind errorKindOf(Fn &&fn)
    {
        try {
            fn();
        } catch (const BlockingError &ex) {
            return ex.kind();
        }
        return ErrorKind::SystemError;
    }
};

void BlockEventRecorderTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    logging::initLogging(QStringLiteral("focusguard-test"), false);
}

void BlockEventRecorderTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void BlockEventRecorderTests::testRecordDefaultsTimestamp()
{
    RuleStore rules;
    BlockEventRecorder recorder(rules);
    const BlockRule rule = websiteRule(rules, "example.com", noon());

    BlockAttempt blockAttempt = attempt(rule.id, " example.com ", TimePoint{});
    blockAttempt.processName = std::string("firefox");
    const BlockEvent event = recorder.recordBlockAttempt(blockAttempt, noon());

    QVERIFY(!event.id.empty());
    QVERIFY(event.ruleId == rule.id);
    QVERIFY(event.blockedAt == noon());
    QVERIFY(event.createdAt == noon());
    QCOMPARE(QString::fromStdString(event.target), QStringLiteral("example.com"));
    QCOMPARE(QString::fromStdString(*event.processName), QStringLiteral("firefox"));
    QVERIFY(!event.wasBypassed);
}

void BlockEventRecorderTests::testRecordRejectsBadInput()
{
    RuleStore rules;
    BlockEventRecorder recorder(rules);
    const BlockRule rule = websiteRule(rules, "example.com", noon());

    QCOMPARE(errorKindOf([&] {
                 recorder.recordBlockAttempt(attempt(RuleId("unknown"), "example.com", noon()),
                                             noon());
             }),
             ErrorKind::NotFound);
    QCOMPARE(errorKindOf([&] { recorder.recordBlockAttempt(attempt(rule.id, "  ", noon()), noon()); }),
             ErrorKind::Validation);

    BlockAttempt noRule;
    noRule.target = "example.com";
    QCOMPARE(errorKindOf([&] { recorder.recordBlockAttempt(noRule, noon()); }),
             ErrorKind::Validation);
}

void BlockEventRecorderTests::testRuleStats()
{
    RuleStore rules;
    BlockEventRecorder recorder(rules);
    const TimePoint created = noon() - std::chrono::hours(24 * 4);
    const BlockRule rule = websiteRule(rules, "example.com", created);
    const BlockRule other = websiteRule(rules, "other.com", created);

    recorder.recordBlockAttempt(attempt(rule.id, "example.com", noon() - std::chrono::hours(30)), noon());
    BlockAttempt bypassed = attempt(rule.id, "example.com", noon() - std::chrono::hours(2));
    bypassed.wasBypassed = true;
    recorder.recordBlockAttempt(bypassed, noon());
    recorder.recordBlockAttempt(attempt(other.id, "other.com", noon()), noon());

    const RuleStats stats = recorder.ruleStats(rule.id, noon());
    QCOMPARE(stats.totalBlocks, 2LL);
    QCOMPARE(stats.bypasses, 1LL);
    QVERIFY(*stats.lastTriggered == noon() - std::chrono::hours(2));
    QCOMPARE(stats.avgBlocksPerDay, 0.5);

    // A rule younger than a day divides by one.
    const BlockRule fresh = websiteRule(rules, "fresh.com", noon());
    recorder.recordBlockAttempt(attempt(fresh.id, "fresh.com", noon()), noon());
    QCOMPARE(recorder.ruleStats(fresh.id, noon()).avgBlocksPerDay, 1.0);

    const RuleStats empty = recorder.ruleStats(websiteRule(rules, "quiet.com", noon()).id, noon());
    QCOMPARE(empty.totalBlocks, 0LL);
    QVERIFY(!empty.lastTriggered.has_value());

    QCOMPARE(errorKindOf([&] { recorder.ruleStats(RuleId("unknown"), noon()); }),
             ErrorKind::NotFound);
}

void BlockEventRecorderTests::testBlockStatisticsWindows()
{
    RuleStore rules;
    BlockEventRecorder recorder(rules);
    const BlockRule rule = websiteRule(rules, "example.com", noon() - std::chrono::hours(24 * 60));

    recorder.recordBlockAttempt(attempt(rule.id, "example.com", noon()), noon());
    recorder.recordBlockAttempt(attempt(rule.id, "example.com", noon() - std::chrono::hours(3)), noon());
    recorder.recordBlockAttempt(attempt(rule.id, "example.com", noon() - std::chrono::hours(24 * 3)), noon());
    recorder.recordBlockAttempt(attempt(rule.id, "example.com", noon() - std::chrono::hours(24 * 20)), noon());
    recorder.recordBlockAttempt(attempt(rule.id, "example.com", noon() - std::chrono::hours(24 * 45)), noon());

    const BlockStatistics stats = recorder.blockStatistics(noon());
    QCOMPARE(stats.totalAttempts, 5LL);
    QCOMPARE(stats.attemptsToday, 2LL);
    QCOMPARE(stats.attemptsThisWeek, 3LL);
    QCOMPARE(stats.attemptsThisMonth, 4LL);
    QCOMPARE(stats.attemptsByHour.size(), static_cast<size_t>(24));
    QCOMPARE(stats.attemptsByHour[12], 2LL);
    QCOMPARE(stats.attemptsByHour[9], 1LL);
    QCOMPARE(stats.topBlocked.size(), static_cast<size_t>(1));
    QCOMPARE(stats.topBlocked.front().count, 3LL);
    QVERIFY(stats.topBlocked.front().lastAttempt == noon());
}

void BlockEventRecorderTests::testTopBlockedAndRecentLimits()
{
    RuleStore rules;
    BlockEventRecorder recorder(rules);
    const BlockRule rule = websiteRule(rules, "example.com", noon() - std::chrono::hours(24));

    for (int i = 0; i < 12; ++i) {
        const std::string host = "site" + std::to_string(i) + ".example.com";
        for (int n = 0; n <= i; ++n) {
            recorder.recordBlockAttempt(
                attempt(rule.id, host, noon() - std::chrono::minutes(i * 20 + n)), noon());
        }
    }

    const BlockStatistics stats = recorder.blockStatistics(noon());
    QCOMPARE(stats.topBlocked.size(), static_cast<size_t>(10));
    QCOMPARE(QString::fromStdString(stats.topBlocked.front().target),
             QStringLiteral("site11.example.com"));
    QCOMPARE(stats.topBlocked.front().count, 12LL);
    QCOMPARE(stats.recentBlocks.size(), static_cast<size_t>(20));
    QVERIFY(stats.recentBlocks.front().blockedAt == noon());
    for (std::size_t i = 1; i < stats.recentBlocks.size(); ++i) {
        QVERIFY(stats.recentBlocks[i - 1].blockedAt >= stats.recentBlocks[i].blockedAt);
    }
}

void BlockEventRecorderTests::testSessionBlocks()
{
    RuleStore rules;
    BlockEventRecorder recorder(rules);
    const BlockRule rule = websiteRule(rules, "example.com", noon());

    BlockAttempt inSession = attempt(rule.id, "example.com", noon());
    inSession.sessionId = std::string("session-1");
    recorder.recordBlockAttempt(inSession, noon());
    recorder.recordBlockAttempt(inSession, noon());
    recorder.recordBlockAttempt(attempt(rule.id, "example.com", noon()), noon());

    QCOMPARE(recorder.sessionBlocks("session-1").size(), static_cast<size_t>(2));
    QVERIFY(recorder.sessionBlocks("session-2").empty());
}

void BlockEventRecorderTests::testBypassRequests()
{
    RuleStore rules;
    BlockEventRecorder recorder(rules);
    const BlockRule rule = websiteRule(rules, "example.com", noon());

    BypassRequest request;
    request.ruleId = rule.id.value();
    request.reason = std::string("need docs");
    request.bypassCode = std::string("  ");
    const BypassRequest stored = recorder.recordBypassRequest(request, noon());
    QVERIFY(!stored.id.empty());
    QVERIFY(stored.requestedAt == noon());
    QVERIFY(!stored.bypassCode.has_value());
    QCOMPARE(QString::fromStdString(*stored.reason), QStringLiteral("need docs"));

    QCOMPARE(recorder.listBypassRequests(rule.id).size(), static_cast<size_t>(1));
    QVERIFY(recorder.listBypassRequests(RuleId("other")).empty());

    BypassRequest unknown;
    unknown.ruleId = "unknown";
    QCOMPARE(errorKindOf([&] { recorder.recordBypassRequest(unknown, noon()); }),
             ErrorKind::NotFound);
}

void BlockEventRecorderTests::testEventsOutliveRule()
{
    RuleStore rules;
    BlockEventRecorder recorder(rules);
    const BlockRule rule = websiteRule(rules, "example.com", noon());
    recorder.recordBlockAttempt(attempt(rule.id, "example.com", noon()), noon());
    rules.removeRule(rule.id);

    const BlockStatistics stats = recorder.blockStatistics(noon());
    QCOMPARE(stats.totalAttempts, 1LL);
    QCOMPARE(errorKindOf([&] { recorder.ruleStats(rule.id, noon()); }), ErrorKind::NotFound);
}

void BlockEventRecorderTests::testPersistedReload()
{
    const std::string dbPath = (m_tempDir.path() + "/events.db").toStdString();
    RuleId ruleId("placeholder");
    {
        FocusStore store(dbPath);
        RuleStore rules(&store);
        BlockEventRecorder recorder(rules, &store);
        const BlockRule rule = websiteRule(rules, "example.com", noon());
        ruleId = rule.id;
        BlockAttempt blockAttempt = attempt(rule.id, "example.com", noon());
        blockAttempt.sessionId = std::string("session-1");
        recorder.recordBlockAttempt(blockAttempt, noon());

        BypassRequest request;
        request.ruleId = rule.id.value();
        recorder.recordBypassRequest(request, noon());
    }

    FocusStore store(dbPath);
    RuleStore rules(&store);
    rules.load();
    BlockEventRecorder recorder(rules, &store);
    recorder.load();
    QCOMPARE(recorder.ruleStats(ruleId, noon()).totalBlocks, 1LL);
    QCOMPARE(recorder.sessionBlocks("session-1").size(), static_cast<size_t>(1));
    QCOMPARE(recorder.listBypassRequests(ruleId).size(), static_cast<size_t>(1));
}

QTEST_MAIN(BlockEventRecorderTests)
#include "test_block_event_recorder.moc"
