#pragma once

#include <lxp/Native/ICommandRunner.hpp>
#include <QList>
#include <QMutex>

namespace lxp {

/// Scripted ICommandRunner for tests. Each run() consumes the next queued
/// result (a clean exit when the queue is empty) and records the invocation.
class ReplayCommandRunner : public ICommandRunner {
public:
    CommandResult run(const QString& program, const QStringList& arguments) const override;

    // Test API
    void enqueueResult(const CommandResult& result);
    void enqueueExit(int exitCode, const QByteArray& standardError = {});
    void enqueueFailedToStart(const QString& errorString);

    /// Each entry is the program followed by its arguments.
    QList<QStringList> invocations() const;
    void clear();

private:
    mutable QMutex mutex_;
    mutable QList<CommandResult> pending_;
    mutable QList<QStringList> invocations_;
};

} // namespace lxp
