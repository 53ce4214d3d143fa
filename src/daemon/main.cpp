#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/triage_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("triage-daemon"));
    qInfo() << "Triage daemon starting...";

    triage::DaemonConfig config = triage::loadConfigFromEnvironment();
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            config.traceEnabled = true;
        }
    }
    triage::logging::initLogging(QStringLiteral("triage-daemon"), config.traceEnabled,
                                 QString::fromStdString(config.logsDir()));
    TLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              QStringLiteral("env_config"),
              triage::logging::defaultWho(),
              QString(),
              nlohmann::json::object());

    try {
        // The daemon lives for the lifetime of the process.
        triage::TriageDaemon daemon(config);
        if (!daemon.start()) {
            qCritical() << "Triage daemon failed to start the API server";
            return 1;
        }
        return app.exec();
    } catch (const std::exception &ex) {
        qCritical() << "Triage daemon failed:" << ex.what();
        return 1;
    }
}
