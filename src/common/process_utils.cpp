#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace triage {

namespace {

constexpr const char *kTaskPlaceholder = "{task}";

QString findSiblingBinary(const QString &name)
{
    if (!QCoreApplication::instance()) {
        return QString();
    }
    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList relCandidates = {
        QStringLiteral("."),
        QStringLiteral("../bin"),
        QStringLiteral("../../bin"),
    };

    for (const QString &relPath : relCandidates) {
        const QString candidate =
            QDir(appDir).absoluteFilePath(relPath + QDir::separator() + name);
        QFileInfo info(candidate);
        if (info.exists() && info.isExecutable()) {
            return info.absoluteFilePath();
        }
    }
    return QString();
}

} // namespace

QString resolveExecutable(const QString &program)
{
    if (program.contains(QLatin1Char('/'))) {
        QFileInfo info(program);
        return info.exists() && info.isExecutable() ? info.absoluteFilePath() : QString();
    }

    const QString sibling = findSiblingBinary(program);
    if (!sibling.isEmpty()) {
        return sibling;
    }
    return QStandardPaths::findExecutable(program);
}

ProcessTaskLauncher::ProcessTaskLauncher(std::string program,
                                         std::vector<std::string> args)
    : m_program(std::move(program))
    , m_args(std::move(args))
{
}

bool ProcessTaskLauncher::launch(const std::string &task, std::string *error)
{
    const QString program = QString::fromStdString(m_program);
    const QString resolved = resolveExecutable(program);
    if (resolved.isEmpty()) {
        if (error) {
            *error = "failed to launch " + m_program + ": executable not found";
        }
        return false;
    }

    QStringList arguments;
    for (const auto &arg : m_args) {
        if (arg == kTaskPlaceholder) {
            arguments << QString::fromStdString(task);
        } else {
            arguments << QString::fromStdString(arg);
        }
    }

    TLOG_INFO(QStringLiteral("ProcessTaskLauncher"),
              QStringLiteral("launch"),
              QStringLiteral("start_executor"),
              QStringLiteral("automation_dispatch"),
              QStringLiteral("process_start_detached"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"program", resolved.toStdString()},
                             {"argc", arguments.size()}}));

    // Output is inherited so the executor reports to the daemon's terminal.
    QProcess process;
    process.setProgram(resolved);
    process.setArguments(arguments);
    qint64 pid = 0;
    if (!process.startDetached(&pid)) {
        if (error) {
            *error = "failed to launch " + m_program + ": "
                + process.errorString().toStdString();
        }
        return false;
    }
    return true;
}

} // namespace triage
