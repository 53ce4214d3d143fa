#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <sys/socket.h>
#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace triage::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

// Guards every global below and serializes writes across threads.
std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;
QString g_logsDir;
quint64 g_sequence = 0;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString homeLogsDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/triage/logs");
    }
    return home + QStringLiteral("/.local/share/triage/logs");
}

// Caller holds g_logMutex.
QString logsDirLocked()
{
    return g_logsDir.isEmpty() ? homeLogsDir() : g_logsDir;
}

// name.log -> name.log.1 -> name.log.2 ..., the oldest generation is dropped.
void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        const QString from = path + QStringLiteral(".%1").arg(generation);
        if (QFile::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(generation + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void writeLine(const QString &dir, const QString &path, const QByteArray &line)
{
    QDir().mkpath(dir);
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file.write(line);
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

QString hostName()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        return QStringLiteral("unknown");
    }
    return QString::fromUtf8(hostname);
}

} // namespace

QString logsDirPath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return logsDirLocked();
}

void initLogging(const QString &processName, bool traceEnabled, const QString &logsDir)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
    g_logsDir = logsDir;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_traceEnabled;
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

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("triage-daemon");
}

QString defaultWho()
{
    static const QString who = QStringLiteral("uid:%1@%2")
                                   .arg(static_cast<qulonglong>(getuid()))
                                   .arg(hostName());
    return who;
}

QString peerWho(qintptr socketDescriptor)
{
    if (socketDescriptor < 0) {
        return defaultWho();
    }
    struct ucred cred {};
    socklen_t length = sizeof(cred);
    if (getsockopt(static_cast<int>(socketDescriptor), SOL_SOCKET, SO_PEERCRED,
                   &cred, &length) != 0) {
        return defaultWho();
    }
    return QStringLiteral("peer uid:%1 pid:%2")
        .arg(static_cast<qulonglong>(cred.uid))
        .arg(static_cast<qlonglong>(cred.pid));
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
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"pid", static_cast<qint64>(QCoreApplication::applicationPid())},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", (who.isEmpty() ? defaultWho() : who).toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    std::lock_guard<std::mutex> lock(g_logMutex);
    const bool toMain = level != LogLevel::Debug || g_traceEnabled;
    if (!toMain) {
        return;
    }
    payload["seq"] = ++g_sequence;

    // Item titles come from upstream and may carry invalid UTF-8.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString dir = logsDirLocked();
    writeLine(dir, dir + QDir::separator() + process + QStringLiteral(".log"), line);
    if (g_traceEnabled) {
        writeLine(dir, dir + QDir::separator() + process + QStringLiteral("-trace.log"), line);
    }
}

} // namespace triage::logging
