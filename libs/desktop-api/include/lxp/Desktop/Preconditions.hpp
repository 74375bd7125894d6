#pragma once

#include <lxp/Desktop/Capability.hpp>
#include <lxp/Desktop/DesktopError.hpp>
#include <lxp/Notification/Notification.hpp>
#include <QString>

namespace lxp {

// Checks every backend runs before touching its native subsystem, so the
// same bad input yields the same error kind on every platform.

/// FileNotFound if the path is empty, missing or not a regular file;
/// PermissionDenied if it exists but cannot be read.
DesktopResult checkReadableFile(const QString& path);

/// NotificationError if the notification has no title, the backend has no
/// Notifications capability, or actions were requested without
/// NotificationActions.
DesktopResult checkNotificationSupported(const Notification& notification, CapabilitySet capabilities);

} // namespace lxp
