#pragma once

#include <string>
#include <vector>

#include <QString>

namespace triage {

// Capability for starting an external executor without waiting on it.
class TaskLauncher {
public:
    virtual ~TaskLauncher() = default;

    // Returns false and fills *error when the process could not be started.
    virtual bool launch(const std::string &task, std::string *error) = 0;
};

// Launches `program args...` detached, substituting {task} in the arguments.
class ProcessTaskLauncher : public TaskLauncher {
public:
    ProcessTaskLauncher(std::string program, std::vector<std::string> args);

    bool launch(const std::string &task, std::string *error) override;

private:
    std::string m_program;
    std::vector<std::string> m_args;
};

QString resolveExecutable(const QString &program);

} // namespace triage
