#pragma once

#include <lxp/Desktop/BackendOptions.hpp>
#include <lxp/Desktop/IDesktopApi.hpp>
#include <QOperatingSystemVersion>
#include <QString>
#include <memory>
#include <stdexcept>

namespace lxp {

enum class OperatingSystem {
    Linux,
    Windows,
    MacOS,
    Other
};

QString operatingSystemName(OperatingSystem os);

/// The facts backend selection depends on.
struct PlatformInfo {
    OperatingSystem os = OperatingSystem::Other;
    QString desktopEnvironment;  // XDG_CURRENT_DESKTOP, may list several
    QOperatingSystemVersion osVersion = QOperatingSystemVersion::current();

    /// Build target, XDG_CURRENT_DESKTOP and the running OS version.
    static PlatformInfo detect();
};

/// No backend exists for the running platform. Raised at startup only.
class UnsupportedPlatformError : public std::runtime_error {
public:
    explicit UnsupportedPlatformError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

class BackendSelector {
public:
    /// Construct the backend for `platform`, or throw UnsupportedPlatformError.
    static std::unique_ptr<IDesktopApi> select(const PlatformInfo& platform,
                                               const BackendOptions& options = {});

    /// True if any colon-separated entry is "gnome" or "gnome-*" (any case).
    static bool isGnomeDesktop(const QString& xdgCurrentDesktop);
};

/// Process-wide desktop handle, selected once and read-only afterwards.
class DesktopApiHandle {
public:
    /// Selects the backend on the first call; later calls ignore `options`
    /// and return the same handle. If selection throws, nothing is stored
    /// and the next call tries again.
    static std::shared_ptr<const IDesktopApi> initialize(const BackendOptions& options = {});

    /// initialize() with default options when nothing was selected yet.
    static std::shared_ptr<const IDesktopApi> instance();
};

} // namespace lxp
