#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace timeledger::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// With tracing enabled, debug events are kept and every line is mirrored
// to <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// One JSON line per event. Pass empty strings for fields that do not apply.
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

QString defaultProcessName();
QString defaultWho();

} // namespace timeledger::logging

#define TLOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::timeledger::logging::logEvent((level), \
                                    ::timeledger::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    TLOG_EVENT(::timeledger::logging::LogLevel::Debug, component, where, what, why, how, who, corr, ctxJson)

#define TLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    TLOG_EVENT(::timeledger::logging::LogLevel::Info, component, where, what, why, how, who, corr, ctxJson)

#define TLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    TLOG_EVENT(::timeledger::logging::LogLevel::Warn, component, where, what, why, how, who, corr, ctxJson)

#define TLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    TLOG_EVENT(::timeledger::logging::LogLevel::Error, component, where, what, why, how, who, corr, ctxJson)
