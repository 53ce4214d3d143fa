#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace triage::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Lines go to <logsDir>/<processName>.log; debug lines only when tracing.
// An empty logsDir keeps the per-user default under $HOME.
void initLogging(const QString &processName,
                 bool traceEnabled,
                 const QString &logsDir = QString());

bool isTraceEnabled();

// Thread-local correlation id; one per API request or scheduler tick.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

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

// Identity of the daemon itself, "uid:<uid>@<host>". Computed once.
QString defaultWho();

// Identity of the process on the other end of a local socket, or defaultWho()
// when the kernel cannot report it.
QString peerWho(qintptr socketDescriptor);

QString logsDirPath();

} // namespace triage::logging

#define TLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::triage::logging::logEvent(::triage::logging::LogLevel::Debug, \
                                ::triage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::triage::logging::logEvent(::triage::logging::LogLevel::Info, \
                                ::triage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::triage::logging::logEvent(::triage::logging::LogLevel::Warn, \
                                ::triage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::triage::logging::logEvent(::triage::logging::LogLevel::Error, \
                                ::triage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
