#include <lxp/Native/ReplayNotificationBus.hpp>
#include <QMutexLocker>

namespace lxp {

NotifyReply ReplayNotificationBus::notify(const NotifyRequest& request) const
{
    QMutexLocker lock(&mutex_);
    requests_.append(request);

    if (!pending_.isEmpty())
        return pending_.takeFirst();

    NotifyReply reply;
    reply.ok = true;
    reply.id = nextId_++;
    return reply;
}

void ReplayNotificationBus::enqueueReply(const NotifyReply& reply)
{
    QMutexLocker lock(&mutex_);
    pending_.append(reply);
}

void ReplayNotificationBus::enqueueError(const QString& errorName, const QString& errorMessage)
{
    NotifyReply reply;
    reply.errorName = errorName;
    reply.errorMessage = errorMessage;
    enqueueReply(reply);
}

void ReplayNotificationBus::enqueueDisconnected()
{
    NotifyReply reply;
    reply.busConnected = false;
    reply.errorMessage = QStringLiteral("Not connected to D-Bus server");
    enqueueReply(reply);
}

QList<NotifyRequest> ReplayNotificationBus::requests() const
{
    QMutexLocker lock(&mutex_);
    return requests_;
}

void ReplayNotificationBus::clear()
{
    QMutexLocker lock(&mutex_);
    pending_.clear();
    requests_.clear();
    nextId_ = 1;
}

} // namespace lxp
