#pragma once

#include <lxp/Desktop/Capability.hpp>
#include <lxp/Desktop/DesktopError.hpp>
#include <lxp/Notification/Notification.hpp>
#include <QString>

namespace lxp {

/// Platform-neutral desktop operations. One implementation per
/// platform/desktop-environment pair; callers only ever see this interface.
///
/// Every method is synchronous and may block while the native subsystem
/// works. Implementations are immutable after construction and safe to call
/// from several threads at once.
class IDesktopApi {
public:
    virtual ~IDesktopApi() = default;

    /// Short backend identifier, e.g. "gnome" or "windows".
    virtual QString name() const = 0;

    /// Fixed for the lifetime of the instance; never fails.
    virtual CapabilitySet capabilities() const = 0;

    /// Apply an existing, readable image file as the desktop background
    /// (light and dark variants alike where the platform has both).
    virtual DesktopResult changeBackground(const QString& imagePath) const = 0;

    /// Submit a notification. Returns once the notification subsystem has
    /// accepted it, not when the user dismisses it or picks an action.
    virtual DesktopResult sendNotification(const Notification& notification) const = 0;

    /// Open a file with the user's default application.
    virtual DesktopResult openFile(const QString& path) const = 0;

    bool supports(Capability capability) const
    {
        return capabilities().testFlag(capability);
    }
};

} // namespace lxp
