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
#include <set>

namespace sysmend::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

// Process-wide sink state. Probe workers log concurrently, so every file
// operation happens under one mutex.
struct LogState {
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
    // Paths that already failed to open; reported to stderr only once.
    std::set<QString> failedPaths;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

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

// "sysmend.log" -> "sysmend.log.1" -> ... -> "sysmend.log.3", oldest dropped.
void rotateLog(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }
    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        const QString from = path + QStringLiteral(".%1").arg(generation);
        if (QFileInfo::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(generation + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void appendLine(LogState &log, const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateLog(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        if (log.failedPaths.insert(path).second) {
            fprintf(stderr, "sysmend: cannot write log %s: %s\n",
                    path.toUtf8().constData(), file.errorString().toUtf8().constData());
        }
        fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

// Pool workers are unnamed; fall back to the native id for them.
QString threadLabel()
{
    const QThread *thread = QThread::currentThread();
    if (thread && !thread->objectName().isEmpty()) {
        return thread->objectName();
    }
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogState &log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    log.processName = processName;
    log.traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    LogState &log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    return log.traceEnabled;
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

QString logsDirPath()
{
    const QString override = qEnvironmentVariable("SYSMEND_LOG_DIR");
    if (!override.isEmpty()) {
        return override;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/sysmend/logs");
    }
    return home + QStringLiteral("/.local/share/sysmend/logs");
}

QString logFilePath(const QString &processName, bool trace)
{
    const QString base = processName.isEmpty() ? QStringLiteral("sysmend") : processName;
    return logsDirPath() + QDir::separator() + base
        + (trace ? QStringLiteral("-trace.log") : QStringLiteral(".log"));
}

QString defaultProcessName()
{
    {
        LogState &log = state();
        std::lock_guard<std::mutex> lock(log.mutex);
        if (!log.processName.isEmpty()) {
            return log.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("sysmend");
}

QString defaultWho()
{
    // Host and effective uid do not change while the process runs.
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<qulonglong>(geteuid()));
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
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;

    const nlohmann::json event = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"pid", static_cast<long long>(getpid())},
        {"thread", threadLabel().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(event.dump());

    LogState &log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    // Debug events only reach disk in trace mode, where the trace file gets
    // every event.
    if (level != LogLevel::Debug || log.traceEnabled) {
        appendLine(log, logFilePath(process, false), line);
    }
    if (log.traceEnabled) {
        appendLine(log, logFilePath(process, true), line);
    }
}

} // namespace sysmend::logging
