#pragma once

#include "ICommandRunner.hpp"

namespace btp {

/// QProcess-backed runner. Blocks the calling thread until the child exits.
class ProcessCommandRunner : public ICommandRunner {
public:
    /// timeoutMs <= 0 waits indefinitely.
    explicit ProcessCommandRunner(int timeoutMs = -1);

    CommandResult run(const QString& program, const QStringList& arguments) override;

    int timeoutMs() const { return timeoutMs_; }

private:
    int timeoutMs_;
};

} // namespace btp
