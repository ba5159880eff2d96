#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace btp {

/// Outcome of one blocking external command invocation.
struct CommandResult {
    bool started = false;       // false: program missing / not executable
    bool timedOut = false;
    int exitCode = -1;          // only meaningful when started && !timedOut
    bool crashed = false;       // terminated by a signal
    QByteArray standardOutput;
    QByteArray standardError;
    QString errorString;        // launch or timeout failure reason

    bool succeeded() const { return started && !timedOut && !crashed && exitCode == 0; }
};

class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /// Run program with arguments and wait for it to exit.
    /// Never throws; failures are described by the returned result.
    virtual CommandResult run(const QString& program, const QStringList& arguments) = 0;
};

} // namespace btp
