#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/fact_prober.hpp"

using namespace std::chrono_literals;

namespace {

// Steady clock the test advances by hand.
struct ManualClock {
    std::chrono::steady_clock::time_point base = std::chrono::steady_clock::now();
    std::atomic<long long> offsetMs{0};
    std::atomic<bool> broken{false};
    std::atomic<bool> brokenNonStandard{false};

    std::chrono::steady_clock::time_point now() const
    {
        if (broken.load()) {
            throw std::runtime_error("clock unavailable");
        }
        if (brokenNonStandard.load()) {
            throw 7;
        }
        return base + std::chrono::milliseconds(offsetMs.load());
    }

    void advance(std::chrono::milliseconds by) { offsetMs += by.count(); }
};

} // namespace

class FactCacheTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testFreshEntryIsReused();
    void testStaleEntryRefreshesKnownKeys();
    void testUncoveredKeyTriggersRefresh();
    void testConcurrentCallersShareOneRefresh();
    void testInvalidateForcesRefresh();
    void testFailedRefreshKeepsPreviousEntry();
    void testNonStandardRefreshFailureDoesNotWedgeCache();
    void testNonStandardDerivedThrowStaysInSnapshot();

private:
    sysmend::FactSource countingSource();

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::atomic<int> m_queries{0};
};

void FactCacheTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void FactCacheTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void FactCacheTests::init()
{
    m_queries = 0;
}

sysmend::FactSource FactCacheTests::countingSource()
{
    sysmend::FactSource source;
    for (const char *key : {"a", "b", "c"}) {
        source[key] = [this] {
            ++m_queries;
            return sysmend::FactValue(std::string("v"));
        };
    }
    return source;
}

void FactCacheTests::testFreshEntryIsReused()
{
    ManualClock clock;
    sysmend::ProberOptions options;
    options.clock = [&clock] { return clock.now(); };
    sysmend::FactProber prober(countingSource(), {}, options);

    const auto first = prober.getCached({"a"}, 10s);
    clock.advance(5s);
    const auto second = prober.getCached({"a"}, 10s);

    QVERIFY(first == second);
    QCOMPARE(prober.probeCount(), 1);
    QCOMPARE(m_queries.load(), 1);

    const auto entry = prober.cacheEntry();
    QVERIFY(entry);
    QVERIFY(entry->snapshot == first);
    QVERIFY(entry->ttl == 10s);
}

void FactCacheTests::testStaleEntryRefreshesKnownKeys()
{
    ManualClock clock;
    sysmend::ProberOptions options;
    options.clock = [&clock] { return clock.now(); };
    sysmend::FactProber prober(countingSource(), {}, options);

    const auto first = prober.getCached({"a", "b"}, 1s);
    clock.advance(1500ms);
    const auto second = prober.getCached({"a"}, 1s);

    QVERIFY(first != second);
    QCOMPARE(prober.probeCount(), 2);
    // The refresh covers every key seen so far, not only the ones asked for.
    QVERIFY(second->contains("a"));
    QVERIFY(second->contains("b"));
    QVERIFY(!second->contains("c"));
}

void FactCacheTests::testUncoveredKeyTriggersRefresh()
{
    ManualClock clock;
    sysmend::ProberOptions options;
    options.clock = [&clock] { return clock.now(); };
    sysmend::FactProber prober(countingSource(), {}, options);

    const auto first = prober.getCached({"a"}, 60s);
    const auto second = prober.getCached({"c"}, 60s);

    QVERIFY(first != second);
    QVERIFY(second->contains("a"));
    QVERIFY(second->contains("c"));
    QVERIFY(prober.knownKeys() == (std::set<std::string>{"a", "c"}));
}

void FactCacheTests::testConcurrentCallersShareOneRefresh()
{
    std::atomic<int> slowQueries{0};
    sysmend::FactSource source;
    source["slow"] = [&slowQueries] {
        ++slowQueries;
        std::this_thread::sleep_for(300ms);
        return sysmend::FactValue(true);
    };
    sysmend::FactProber prober(source, {}, sysmend::ProberOptions());

    constexpr int kCallers = 8;
    std::vector<sysmend::SnapshotPtr> results(kCallers);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&prober, &results, i] {
            results[i] = prober.getCached({"slow"}, 30s);
        });
    }
    for (auto &caller : callers) {
        caller.join();
    }

    QCOMPARE(slowQueries.load(), 1);
    QCOMPARE(prober.probeCount(), 1);
    for (const auto &result : results) {
        QVERIFY(result);
        QVERIFY(result == results.front());
    }
}

void FactCacheTests::testInvalidateForcesRefresh()
{
    sysmend::FactProber prober(countingSource(), {}, sysmend::ProberOptions());

    const auto first = prober.getCached({"a"}, 60s);
    prober.invalidate();
    const auto second = prober.getCached({"a"}, 60s);
    const auto third = prober.getCached({"a"}, 60s);

    QVERIFY(first != second);
    QVERIFY(second == third);
    QCOMPARE(prober.probeCount(), 2);
}

void FactCacheTests::testFailedRefreshKeepsPreviousEntry()
{
    ManualClock clock;
    sysmend::ProberOptions options;
    options.clock = [&clock] { return clock.now(); };
    sysmend::FactProber prober(countingSource(), {}, options);

    const auto first = prober.getCached({"a"}, 60s);
    prober.invalidate();
    clock.broken = true;

    bool threw = false;
    try {
        prober.getCached({"a"}, 60s);
    } catch (const std::runtime_error &ex) {
        threw = true;
        QCOMPARE(QString::fromUtf8(ex.what()), QStringLiteral("clock unavailable"));
    }
    QVERIFY(threw);
    QVERIFY(prober.cacheEntry()->snapshot == first);

    // The retained entry keeps serving while it is fresh.
    clock.broken = false;
    QVERIFY(prober.getCached({"a"}, 60s) == first);

    prober.invalidate();
    const auto recovered = prober.getCached({"a"}, 60s);
    QVERIFY(recovered != first);
    QCOMPARE(prober.probeCount(), 3);
}

void FactCacheTests::testNonStandardRefreshFailureDoesNotWedgeCache()
{
    ManualClock clock;
    sysmend::ProberOptions options;
    options.clock = [&clock] { return clock.now(); };
    sysmend::FactProber prober(countingSource(), {}, options);

    const auto first = prober.getCached({"a"}, 60s);
    prober.invalidate();
    clock.brokenNonStandard = true;

    bool threw = false;
    try {
        prober.getCached({"a"}, 60s);
    } catch (int code) {
        threw = true;
        QCOMPARE(code, 7);
    }
    QVERIFY(threw);
    QVERIFY(prober.cacheEntry()->snapshot == first);

    // The next stale read starts a new refresh instead of joining the failed one.
    clock.brokenNonStandard = false;
    prober.invalidate();
    const auto recovered = prober.getCached({"a"}, 60s);
    QVERIFY(recovered);
    QVERIFY(recovered != first);
    QCOMPARE(prober.probeCount(), 3);
}

void FactCacheTests::testNonStandardDerivedThrowStaysInSnapshot()
{
    std::vector<sysmend::DerivedFact> derived{
        {"d", {"a"}, [](const sysmend::FactMap &) -> sysmend::FactValue { throw 7; }}};
    sysmend::FactProber prober(countingSource(), derived, sysmend::ProberOptions());

    const auto first = prober.getCached({"d"}, 60s);
    QCOMPARE(QString::fromStdString(*first->find("d")->error()), QStringLiteral("unknown exception"));

    prober.invalidate();
    const auto second = prober.getCached({"d"}, 60s);
    QVERIFY(second != first);
    QCOMPARE(prober.probeCount(), 2);
}

QTEST_MAIN(FactCacheTests)
#include "test_fact_cache.moc"
