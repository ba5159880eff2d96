#include "ProcessCommandRunner.hpp"
#include <QProcess>
#include <boost/log/trivial.hpp>

namespace btp {

ProcessCommandRunner::ProcessCommandRunner(int timeoutMs)
    : timeoutMs_(timeoutMs > 0 ? timeoutMs : -1)
{
}

CommandResult ProcessCommandRunner::run(const QString& program, const QStringList& arguments)
{
    CommandResult result;

    BOOST_LOG_TRIVIAL(debug) << "[ProcessCommandRunner] exec: " << program.toStdString()
                             << " " << arguments.join(' ').toStdString();

    QProcess proc;
    proc.start(program, arguments);
    if (!proc.waitForStarted(timeoutMs_)) {
        result.errorString = proc.errorString();
        BOOST_LOG_TRIVIAL(debug) << "[ProcessCommandRunner] " << program.toStdString()
                                 << " failed to start: " << result.errorString.toStdString();
        return result;
    }
    result.started = true;

    if (!proc.waitForFinished(timeoutMs_)) {
        // Either the timeout expired or the child died between start and wait.
        if (proc.state() != QProcess::NotRunning) {
            proc.kill();
            proc.waitForFinished();
            result.timedOut = true;
            result.errorString = QStringLiteral("timed out after %1 ms").arg(timeoutMs_);
            BOOST_LOG_TRIVIAL(warning) << "[ProcessCommandRunner] " << program.toStdString()
                                       << " " << result.errorString.toStdString();
            return result;
        }
    }

    result.standardOutput = proc.readAllStandardOutput();
    result.standardError = proc.readAllStandardError();
    result.crashed = proc.exitStatus() == QProcess::CrashExit;
    result.exitCode = proc.exitCode();
    if (result.crashed)
        result.errorString = proc.errorString();

    BOOST_LOG_TRIVIAL(debug) << "[ProcessCommandRunner] " << program.toStdString()
                             << " exited with " << result.exitCode
                             << (result.crashed ? " (crashed)" : "");
    return result;
}

} // namespace btp
