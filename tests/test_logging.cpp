#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QThread>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSuppressedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testLogDirOverride();
    void testEventCarriesProcessIdentity();
    void testRotationKeepsThreeGenerations();

private:
    static nlohmann::json lastLine(const QString &path);

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("SYSMEND_LOG_DIR");
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

nlohmann::json LoggingTests::lastLine(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    const QList<QByteArray> lines = file.readAll().trimmed().split('\n');
    return nlohmann::json::parse(lines.last().toStdString());
}

void LoggingTests::testLogEventWrites()
{
    sysmend::logging::initLogging(QStringLiteral("sysmend-test"), false);
    const QString logPath = m_tempDir.path() + "/.local/share/sysmend/logs/sysmend-test.log";

    sysmend::logging::logEvent(sysmend::logging::LogLevel::Info,
                               QStringLiteral("sysmend-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testLogEventWrites"),
                               QStringLiteral("test_log"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               sysmend::logging::defaultWho(),
                               QStringLiteral("corr-1"),
                               nlohmann::json{{"key", "value"}});

    QFile file(logPath);
    QVERIFY(file.exists());

    const auto parsed = lastLine(logPath);
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    sysmend::logging::initLogging(QStringLiteral("sysmend-quiet"), false);
    const QString logPath = m_tempDir.path() + "/.local/share/sysmend/logs/sysmend-quiet.log";

    SMLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugSuppressedWithoutTrace"),
                QStringLiteral("hidden"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                sysmend::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QVERIFY(!QFile::exists(logPath));
    QVERIFY(!sysmend::logging::isTraceEnabled());
}

void LoggingTests::testTraceWrites()
{
    sysmend::logging::initLogging(QStringLiteral("sysmend-test"), true);
    const QString tracePath = m_tempDir.path() + "/.local/share/sysmend/logs/sysmend-test-trace.log";

    SMLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testTraceWrites"),
                QStringLiteral("test_trace"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                sysmend::logging::defaultWho(),
                QStringLiteral("corr-2"),
                nlohmann::json::object());

    QVERIFY(QFile::exists(tracePath));
    const auto parsed = lastLine(tracePath);
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_trace"));
    QCOMPARE(QString::fromStdString(parsed.value("process", "")), QStringLiteral("sysmend-test"));
}

void LoggingTests::testCorrelationScope()
{
    sysmend::logging::initLogging(QStringLiteral("sysmend-test"), false);
    const QString logPath = m_tempDir.path() + "/.local/share/sysmend/logs/sysmend-test.log";

    {
        sysmend::logging::CorrelationScope scope(QStringLiteral("batch-42"));
        SMLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   sysmend::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        QCOMPARE(QString::fromStdString(lastLine(logPath).value("corr", "")),
                 QStringLiteral("batch-42"));
    }
    QVERIFY(sysmend::logging::currentCorrelationId().isEmpty());
}

void LoggingTests::testLogDirOverride()
{
    const QString dir = m_tempDir.path() + QStringLiteral("/custom-logs");
    qputenv("SYSMEND_LOG_DIR", dir.toUtf8());
    QCOMPARE(sysmend::logging::logsDirPath(), dir);
    qunsetenv("SYSMEND_LOG_DIR");
}

void LoggingTests::testEventCarriesProcessIdentity()
{
    sysmend::logging::initLogging(QStringLiteral("sysmend-ident"), false);
    const QString logPath = sysmend::logging::logFilePath(QStringLiteral("sysmend-ident"), false);
    QCOMPARE(logPath, m_tempDir.path() + "/.local/share/sysmend/logs/sysmend-ident.log");

    QThread::currentThread()->setObjectName(QStringLiteral("main"));
    SMLOG_INFO(QStringLiteral("Test"),
               QStringLiteral("testEventCarriesProcessIdentity"),
               QStringLiteral("identity"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               sysmend::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    const auto parsed = lastLine(logPath);
    QCOMPARE(parsed.value("pid", 0LL), static_cast<long long>(QCoreApplication::applicationPid()));
    QCOMPARE(QString::fromStdString(parsed.value("thread", "")), QStringLiteral("main"));
    QVERIFY(QString::fromStdString(parsed.value("who", "")).startsWith(QStringLiteral("host:")));
}

void LoggingTests::testRotationKeepsThreeGenerations()
{
    sysmend::logging::initLogging(QStringLiteral("sysmend-rotate"), false);
    const QString logPath = sysmend::logging::logFilePath(QStringLiteral("sysmend-rotate"), false);
    QVERIFY(QDir().mkpath(QFileInfo(logPath).absolutePath()));

    const QByteArray filler(5 * 1024 * 1024 + 1, 'x');
    for (int round = 0; round < 4; ++round) {
        QFile big(logPath);
        QVERIFY(big.open(QIODevice::WriteOnly | QIODevice::Truncate));
        big.write(filler);
        big.close();

        SMLOG_WARN(QStringLiteral("Test"),
                   QStringLiteral("testRotationKeepsThreeGenerations"),
                   QStringLiteral("rotate"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   sysmend::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"round", round}}));
    }

    QVERIFY(QFileInfo::exists(logPath + ".1"));
    QVERIFY(QFileInfo::exists(logPath + ".2"));
    QVERIFY(QFileInfo::exists(logPath + ".3"));
    QVERIFY(!QFileInfo::exists(logPath + ".4"));
    QCOMPARE(lastLine(logPath).at("context").value("round", -1), 3);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
