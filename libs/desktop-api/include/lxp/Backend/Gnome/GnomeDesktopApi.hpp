#pragma once

#include <lxp/Desktop/BackendOptions.hpp>
#include <lxp/Desktop/IDesktopApi.hpp>
#include <lxp/Native/ICommandRunner.hpp>
#include <lxp/Native/INotificationBus.hpp>
#include <memory>

namespace lxp {

/// GNOME desktop backend.
/// Wallpaper through gsettings (picture-uri and picture-uri-dark), notifications
/// through org.freedesktop.Notifications, file opening through xdg-open.
class GnomeDesktopApi : public IDesktopApi {
public:
    /// Null seams are replaced by the real ones (QProcess, session bus).
    explicit GnomeDesktopApi(const BackendOptions& options = {},
                             std::unique_ptr<ICommandRunner> runner = nullptr,
                             std::unique_ptr<INotificationBus> bus = nullptr);
    ~GnomeDesktopApi() override;

    QString name() const override;
    CapabilitySet capabilities() const override;
    DesktopResult changeBackground(const QString& imagePath) const override;
    DesktopResult sendNotification(const Notification& notification) const override;
    DesktopResult openFile(const QString& path) const override;

    /// Notify arguments for a notification, without sending anything.
    /// Fails only when a raw icon cannot be written to the icon cache.
    DesktopResult marshal(const Notification& notification, NotifyRequest* request) const;

    /// Per-user cache used for raw icons when BackendOptions::iconCacheDir is empty.
    static QString defaultIconCacheDir();

private:
    DesktopResult setBackgroundKey(const QString& key, const QString& uri) const;
    DesktopResult writeRawIcon(const QByteArray& bytes, QString* path) const;

    BackendOptions options_;
    std::unique_ptr<ICommandRunner> runner_;
    std::unique_ptr<INotificationBus> bus_;
};

} // namespace lxp
