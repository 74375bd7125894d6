#include <lxp/Desktop/Capability.hpp>

namespace lxp {

QString capabilityName(Capability capability)
{
    switch (capability) {
    case Capability::Wallpaper:
        return QStringLiteral("wallpaper");
    case Capability::Notifications:
        return QStringLiteral("notifications");
    case Capability::NotificationActions:
        return QStringLiteral("notification-actions");
    case Capability::FileOpen:
        return QStringLiteral("file-open");
    case Capability::RawIconBytes:
        return QStringLiteral("raw-icon-bytes");
    }
    return QString();
}

CapabilitySet allCapabilities()
{
    return Capability::Wallpaper
         | Capability::Notifications
         | Capability::NotificationActions
         | Capability::FileOpen
         | Capability::RawIconBytes;
}

QStringList capabilityNames(CapabilitySet set)
{
    static const Capability all[] = {
        Capability::Wallpaper,
        Capability::Notifications,
        Capability::NotificationActions,
        Capability::FileOpen,
        Capability::RawIconBytes,
    };

    QStringList names;
    for (Capability c : all) {
        if (set.testFlag(c))
            names.append(capabilityName(c));
    }
    return names;
}

} // namespace lxp
