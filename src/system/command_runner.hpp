#pragma once

#include <QString>
#include <QStringList>

namespace sysmend {

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QString standardOutput;
    QString standardError;

    bool ok() const { return started && !timedOut && exitCode == 0; }
};

// Runs a program to completion, killing it when timeoutMs elapses.
CommandResult runCommand(const QString &program, const QStringList &arguments,
                         int timeoutMs);

// Same as runCommand but throws std::runtime_error describing the failure
// unless the program exited with status 0. Returns trimmed stdout.
QString runCommandChecked(const QString &program, const QStringList &arguments,
                          int timeoutMs);

} // namespace sysmend
