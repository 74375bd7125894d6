#pragma once

#include <lxp/Desktop/BackendOptions.hpp>
#include <lxp/Desktop/IDesktopApi.hpp>
#include <QOperatingSystemVersion>

namespace lxp {

/// Windows desktop backend.
/// Wallpaper through SystemParametersInfoW, toasts through C++/WinRT,
/// file opening through ShellExecuteW.
class WindowsDesktopApi : public IDesktopApi {
public:
    explicit WindowsDesktopApi(const BackendOptions& options = {},
                               const QOperatingSystemVersion& version = QOperatingSystemVersion::current());

    QString name() const override;
    CapabilitySet capabilities() const override;
    DesktopResult changeBackground(const QString& imagePath) const override;
    DesktopResult sendNotification(const Notification& notification) const override;
    DesktopResult openFile(const QString& path) const override;

    QString appId() const { return appId_; }

private:
    BackendOptions options_;
    QString appId_;
    CapabilitySet capabilities_;
};

} // namespace lxp
