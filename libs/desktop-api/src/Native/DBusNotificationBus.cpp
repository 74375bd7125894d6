#include <lxp/Native/DBusNotificationBus.hpp>
#include <QDBusConnection>
#include <QDBusError>
#include <QDBusMessage>
#include <QDebug>

namespace lxp {

static const QString NOTIFY_SERVICE = QStringLiteral("org.freedesktop.Notifications");
static const QString NOTIFY_PATH = QStringLiteral("/org/freedesktop/Notifications");
static const QString NOTIFY_INTERFACE = QStringLiteral("org.freedesktop.Notifications");

DBusNotificationBus::DBusNotificationBus(int callTimeoutMs)
    : callTimeoutMs_(callTimeoutMs)
{
}

NotifyReply DBusNotificationBus::notify(const NotifyRequest& request) const
{
    NotifyReply result;

    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        result.busConnected = false;
        result.errorName = bus.lastError().name();
        result.errorMessage = bus.lastError().message();
        qWarning() << "[DBusNotificationBus] session bus unavailable:" << result.errorMessage;
        return result;
    }

    QDBusMessage call = QDBusMessage::createMethodCall(
        NOTIFY_SERVICE, NOTIFY_PATH, NOTIFY_INTERFACE, QStringLiteral("Notify"));
    call << request.appName
         << request.replacesId
         << request.appIcon
         << request.summary
         << request.body
         << request.actions
         << request.hints
         << request.expireTimeout;

    const QDBusMessage reply = bus.call(call, QDBus::Block, callTimeoutMs_);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        result.errorName = reply.errorName();
        result.errorMessage = reply.errorMessage();
        return result;
    }

    if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
        result.errorMessage = QStringLiteral("unexpected reply to Notify");
        return result;
    }

    result.ok = true;
    result.id = reply.arguments().constFirst().toUInt();
    qDebug() << "[DBusNotificationBus] notification submitted, id" << result.id;
    return result;
}

} // namespace lxp
