#pragma once

#include <lxp/Notification/Notification.hpp>
#include <QString>

namespace lxp {

/// Builds ToastGeneric XML for the Windows notification subsystem.
/// Pure string work, usable and testable on every platform.
class ToastTemplate {
public:
    /// Toast XML for a notification. Path and Resource icons become an
    /// appLogoOverride image, raw icons are dropped. Actions are not rendered.
    static QString build(const Notification& notification, bool sound = true);

    /// Long (~25 s) display for timeouts above the short duration and for
    /// critical notifications that leave the timeout to the platform.
    static bool isLongDuration(const Notification& notification);
};

} // namespace lxp
