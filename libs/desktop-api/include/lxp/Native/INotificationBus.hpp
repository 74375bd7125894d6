#pragma once

#include <lxp/Version.hpp>
#include <QString>
#include <QStringList>
#include <QVariantMap>

namespace lxp {

/// Arguments of org.freedesktop.Notifications.Notify, already marshalled.
struct NotifyRequest {
    QString appName;
    quint32 replacesId = 0;
    QString appIcon;
    QString summary;
    QString body;
    QStringList actions;    // flat [id, label, id, label, ...]
    QVariantMap hints;
    int expireTimeout = FDO_EXPIRE_DEFAULT;
};

struct NotifyReply {
    bool ok = false;
    quint32 id = 0;
    bool busConnected = true;
    QString errorName;      // D-Bus error name, e.g. org.freedesktop.DBus.Error.ServiceUnknown
    QString errorMessage;
};

/// Seam between the GNOME backend and the freedesktop notification service.
class INotificationBus {
public:
    virtual ~INotificationBus() = default;

    virtual NotifyReply notify(const NotifyRequest& request) const = 0;
};

} // namespace lxp
