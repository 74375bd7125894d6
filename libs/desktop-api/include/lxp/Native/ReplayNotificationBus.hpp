#pragma once

#include <lxp/Native/INotificationBus.hpp>
#include <QList>
#include <QMutex>

namespace lxp {

/// Scripted INotificationBus for tests. Accepts every request with an
/// increasing id unless a reply has been queued; records all requests.
class ReplayNotificationBus : public INotificationBus {
public:
    NotifyReply notify(const NotifyRequest& request) const override;

    // Test API
    void enqueueReply(const NotifyReply& reply);
    void enqueueError(const QString& errorName, const QString& errorMessage);
    void enqueueDisconnected();

    QList<NotifyRequest> requests() const;
    void clear();

private:
    mutable QMutex mutex_;
    mutable QList<NotifyReply> pending_;
    mutable QList<NotifyRequest> requests_;
    mutable quint32 nextId_ = 1;
};

} // namespace lxp
