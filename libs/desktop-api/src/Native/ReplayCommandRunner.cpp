#include <lxp/Native/ReplayCommandRunner.hpp>
#include <QMutexLocker>

namespace lxp {

CommandResult ReplayCommandRunner::run(const QString& program, const QStringList& arguments) const
{
    QMutexLocker lock(&mutex_);
    invocations_.append(QStringList{program} + arguments);

    if (pending_.isEmpty())
        return CommandResult{};
    return pending_.takeFirst();
}

void ReplayCommandRunner::enqueueResult(const CommandResult& result)
{
    QMutexLocker lock(&mutex_);
    pending_.append(result);
}

void ReplayCommandRunner::enqueueExit(int exitCode, const QByteArray& standardError)
{
    CommandResult result;
    result.exitCode = exitCode;
    result.standardError = standardError;
    enqueueResult(result);
}

void ReplayCommandRunner::enqueueFailedToStart(const QString& errorString)
{
    CommandResult result;
    result.status = CommandResult::Status::FailedToStart;
    result.errorString = errorString;
    enqueueResult(result);
}

QList<QStringList> ReplayCommandRunner::invocations() const
{
    QMutexLocker lock(&mutex_);
    return invocations_;
}

void ReplayCommandRunner::clear()
{
    QMutexLocker lock(&mutex_);
    pending_.clear();
    invocations_.clear();
}

} // namespace lxp
