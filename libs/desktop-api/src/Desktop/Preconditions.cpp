#include <lxp/Desktop/Preconditions.hpp>
#include <QFileInfo>

namespace lxp {

DesktopResult checkReadableFile(const QString& path)
{
    if (path.isEmpty())
        return DesktopResult::failure(DesktopErrorKind::FileNotFound, QStringLiteral("empty path"));

    const QFileInfo info(path);
    if (!info.exists())
        return DesktopResult::failure(DesktopErrorKind::FileNotFound,
                                      QStringLiteral("%1 does not exist").arg(path));

    if (!info.isFile())
        return DesktopResult::failure(DesktopErrorKind::FileNotFound,
                                      QStringLiteral("%1 is not a regular file").arg(path));

    if (!info.isReadable())
        return DesktopResult::failure(DesktopErrorKind::PermissionDenied,
                                      QStringLiteral("%1 is not readable").arg(path));

    return DesktopResult::success();
}

DesktopResult checkNotificationSupported(const Notification& notification, CapabilitySet capabilities)
{
    if (!notification.isValid())
        return DesktopResult::failure(DesktopErrorKind::NotificationError,
                                      QStringLiteral("notification title must not be empty"));

    if (!capabilities.testFlag(Capability::Notifications))
        return DesktopResult::failure(DesktopErrorKind::NotificationError,
                                      QStringLiteral("notifications are not supported on this system"));

    if (!notification.actions().isEmpty() && !capabilities.testFlag(Capability::NotificationActions))
        return DesktopResult::failure(DesktopErrorKind::NotificationError,
                                      QStringLiteral("%1 action(s) requested but this backend cannot show notification actions")
                                          .arg(notification.actions().size()));

    return DesktopResult::success();
}

} // namespace lxp
