#pragma once

#include <lxp/Native/INotificationBus.hpp>
#include <lxp/Version.hpp>

namespace lxp {

/// Calls org.freedesktop.Notifications on the session bus.
class DBusNotificationBus : public INotificationBus {
public:
    explicit DBusNotificationBus(int callTimeoutMs = DBUS_CALL_NO_TIMEOUT);

    NotifyReply notify(const NotifyRequest& request) const override;
    int callTimeout() const { return callTimeoutMs_; }

private:
    int callTimeoutMs_;
};

} // namespace lxp
