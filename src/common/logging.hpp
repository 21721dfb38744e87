#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace sysmend::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the events of one batch.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

// $SYSMEND_LOG_DIR, else ~/.local/share/sysmend/logs.
QString logsDirPath();
// <logsDir>/<process>.log, or <process>-trace.log for the trace file.
// Files rotate at 5 MiB and keep three generations (.1 newest).
QString logFilePath(const QString &processName, bool trace);
QString defaultProcessName();
QString defaultWho();

} // namespace sysmend::logging

#define SMLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::sysmend::logging::logEvent(::sysmend::logging::LogLevel::Debug, \
                                 ::sysmend::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SMLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::sysmend::logging::logEvent(::sysmend::logging::LogLevel::Info, \
                                 ::sysmend::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SMLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::sysmend::logging::logEvent(::sysmend::logging::LogLevel::Warn, \
                                 ::sysmend::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SMLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::sysmend::logging::logEvent(::sysmend::logging::LogLevel::Error, \
                                 ::sysmend::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
