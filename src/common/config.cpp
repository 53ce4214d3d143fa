#include "common/config.hpp"

#include <filesystem>

#include <QStandardPaths>
#include <QString>
#include <QStringList>

#include <unistd.h>

namespace triage {

namespace {

QString defaultDataDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/triage");
    }
    return home + QStringLiteral("/.local/share/triage");
}

QString defaultSocketName()
{
    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/triage.sock");
}

} // namespace

std::string DaemonConfig::databasePath() const
{
    return (std::filesystem::path(dataDir) / kDatabaseFileName).string();
}

std::string DaemonConfig::legacyStatePath() const
{
    return (std::filesystem::path(dataDir) / kLegacyStateFileName).string();
}

std::string DaemonConfig::logsDir() const
{
    return (std::filesystem::path(dataDir) / "logs").string();
}

DaemonConfig loadConfigFromEnvironment()
{
    DaemonConfig config;

    QString dataDir = qEnvironmentVariable("TRIAGE_DATA_DIR");
    if (dataDir.isEmpty()) {
        dataDir = defaultDataDir();
    }
    config.dataDir = dataDir.toStdString();

    const QString registryFile = qEnvironmentVariable("TRIAGE_REGISTRY_FILE");
    config.registryFile = registryFile.isEmpty()
        ? (std::filesystem::path(config.dataDir) / "registry.json").string()
        : registryFile.toStdString();

    const QString socketName = qEnvironmentVariable("TRIAGE_SOCKET_NAME");
    config.socketName = socketName.isEmpty()
        ? defaultSocketName().toStdString()
        : socketName.toStdString();

    const QString executor = qEnvironmentVariable("TRIAGE_EXECUTOR");
    config.executorProgram = executor.isEmpty()
        ? std::string("copilot")
        : executor.toStdString();

    QString executorArgs = qEnvironmentVariable("TRIAGE_EXECUTOR_ARGS");
    if (executorArgs.isEmpty()) {
        executorArgs = QStringLiteral("-p {task} --allow-all");
    }
    const QStringList parts = executorArgs.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        config.executorArgs.push_back(part.toStdString());
    }

    config.traceEnabled = qEnvironmentVariableIntValue("TRIAGE_TRACE") == 1;
    return config;
}

} // namespace triage
