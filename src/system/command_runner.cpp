#include "system/command_runner.hpp"

#include <algorithm>
#include <stdexcept>

#include <QElapsedTimer>
#include <QProcess>

namespace sysmend {

namespace {

constexpr int kKillGraceMs = 200;

} // namespace

CommandResult runCommand(const QString &program, const QStringList &arguments,
                         int timeoutMs)
{
    CommandResult result;

    // One budget covers both start-up and the run itself.
    QElapsedTimer timer;
    timer.start();

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(timeoutMs)) {
        result.standardError = process.errorString();
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    const int remainingMs = std::max(1, timeoutMs - static_cast<int>(timer.elapsed()));
    if (!process.waitForFinished(remainingMs)) {
        result.timedOut = true;
        process.kill();
        process.waitForFinished(kKillGraceMs);
        return result;
    }

    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput()).trimmed();
    result.standardError = QString::fromUtf8(process.readAllStandardError()).trimmed();
    if (process.exitStatus() != QProcess::NormalExit) {
        return result;
    }
    result.exitCode = process.exitCode();
    return result;
}

QString runCommandChecked(const QString &program, const QStringList &arguments,
                          int timeoutMs)
{
    const CommandResult result = runCommand(program, arguments, timeoutMs);
    const QString commandLine = (QStringList{program} + arguments).join(QChar(' '));
    if (!result.started) {
        throw std::runtime_error("could not start '" + commandLine.toStdString()
                                 + "': " + result.standardError.toStdString());
    }
    if (result.timedOut) {
        throw std::runtime_error("'" + commandLine.toStdString() + "' timed out");
    }
    if (result.exitCode != 0) {
        QString message = QStringLiteral("'%1' exited with %2").arg(commandLine).arg(result.exitCode);
        if (!result.standardError.isEmpty()) {
            message += QStringLiteral(": ") + result.standardError;
        }
        throw std::runtime_error(message.toStdString());
    }
    return result.standardOutput;
}

} // namespace sysmend
