#pragma once

#include <QFlags>
#include <QStringList>

namespace lxp {

/// Optional features a backend may or may not provide on the running system.
enum class Capability : quint8 {
    Wallpaper           = 0x01,
    Notifications       = 0x02,
    NotificationActions = 0x04,
    FileOpen            = 0x08,
    RawIconBytes        = 0x10
};

Q_DECLARE_FLAGS(CapabilitySet, Capability)

QString capabilityName(Capability capability);

/// Every capability this library knows about.
CapabilitySet allCapabilities();

/// Names of every capability in the set, in declaration order.
QStringList capabilityNames(CapabilitySet set);

} // namespace lxp

Q_DECLARE_OPERATORS_FOR_FLAGS(lxp::CapabilitySet)
