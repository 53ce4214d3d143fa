#include "daemon/automation_gateway.hpp"

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

AutomationGateway::AutomationGateway(TaskLauncher &launcher, EventHub &hub)
    : m_launcher(launcher)
    , m_hub(hub)
{
}

bool AutomationGateway::dispatch(const std::string &task, std::string *error)
{
    if (trimmed(task).empty()) {
        if (error) {
            *error = "task is required";
        }
        return false;
    }

    std::string launchError;
    if (!m_launcher.launch(task, &launchError)) {
        if (launchError.empty()) {
            launchError = "automation launch failed";
        }
        TLOG_ERROR(QStringLiteral("AutomationGateway"),
                   QStringLiteral("dispatch"),
                   QStringLiteral("automation_launch_failed"),
                   QString::fromStdString(launchError),
                   QStringLiteral("task_launcher"),
                   triage::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"taskLength", task.size()}}));
        m_hub.publishAutomation("error", task, launchError);
        if (error) {
            *error = launchError;
        }
        return false;
    }

    m_hub.publishAutomation("started", task);
    TLOG_INFO(QStringLiteral("AutomationGateway"),
              QStringLiteral("dispatch"),
              QStringLiteral("automation_dispatched"),
              QStringLiteral("operator_request"),
              QStringLiteral("task_launcher"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"taskLength", task.size()}}));
    return true;
}

} // namespace triage
