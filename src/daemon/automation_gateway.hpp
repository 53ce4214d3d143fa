#pragma once

#include <string>

#include "common/process_utils.hpp"
#include "daemon/event_hub.hpp"

namespace triage {

// Fire-and-forget hand-off of a task to the external executor. Only the
// launch itself is observed; the executor's eventual outcome is not.
class AutomationGateway {
public:
    AutomationGateway(TaskLauncher &launcher, EventHub &hub);

    // Returns false and fills *error when the task is empty or the launch
    // fails. Publishes automation/started or automation/error accordingly.
    bool dispatch(const std::string &task, std::string *error);

private:
    TaskLauncher &m_launcher;
    EventHub &m_hub;
};

} // namespace triage
