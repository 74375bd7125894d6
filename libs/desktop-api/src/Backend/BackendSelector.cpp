#include <lxp/Backend/BackendSelector.hpp>
#include <lxp/Backend/Gnome/GnomeDesktopApi.hpp>
#ifdef LXP_HAVE_WINDOWS_BACKEND
#include <lxp/Backend/Windows/WindowsDesktopApi.hpp>
#endif
#include <QDebug>
#include <QStringList>
#include <QtGlobal>
#include <mutex>

namespace lxp {

QString operatingSystemName(OperatingSystem os)
{
    switch (os) {
    case OperatingSystem::Linux:
        return QStringLiteral("Linux");
    case OperatingSystem::Windows:
        return QStringLiteral("Windows");
    case OperatingSystem::MacOS:
        return QStringLiteral("macOS");
    case OperatingSystem::Other:
        break;
    }
    return QStringLiteral("unknown OS");
}

PlatformInfo PlatformInfo::detect()
{
    PlatformInfo info;
#if defined(Q_OS_LINUX)
    info.os = OperatingSystem::Linux;
#elif defined(Q_OS_WIN)
    info.os = OperatingSystem::Windows;
#elif defined(Q_OS_MACOS)
    info.os = OperatingSystem::MacOS;
#else
    info.os = OperatingSystem::Other;
#endif
    info.desktopEnvironment = qEnvironmentVariable("XDG_CURRENT_DESKTOP");
    info.osVersion = QOperatingSystemVersion::current();
    return info;
}

bool BackendSelector::isGnomeDesktop(const QString& xdgCurrentDesktop)
{
    const QStringList entries = xdgCurrentDesktop.split(QLatin1Char(':'), Qt::SkipEmptyParts);
    for (const QString& entry : entries) {
        const QString token = entry.trimmed().toLower();
        if (token == QLatin1String("gnome") || token.startsWith(QLatin1String("gnome-")))
            return true;
    }
    return false;
}

std::unique_ptr<IDesktopApi> BackendSelector::select(const PlatformInfo& platform, const BackendOptions& options)
{
    switch (platform.os) {
    case OperatingSystem::Linux:
        if (isGnomeDesktop(platform.desktopEnvironment)) {
            qInfo() << "[BackendSelector] GNOME desktop:" << platform.desktopEnvironment;
            return std::make_unique<GnomeDesktopApi>(options);
        }
        break;
    case OperatingSystem::Windows:
#ifdef LXP_HAVE_WINDOWS_BACKEND
        qInfo() << "[BackendSelector] Windows" << platform.osVersion.majorVersion()
                << platform.osVersion.minorVersion();
        return std::make_unique<WindowsDesktopApi>(options, platform.osVersion);
#else
        break;
#endif
    case OperatingSystem::MacOS:
    case OperatingSystem::Other:
        break;
    }

    const QString desktop = platform.desktopEnvironment.isEmpty()
        ? QStringLiteral("no desktop environment")
        : QStringLiteral("desktop \"%1\"").arg(platform.desktopEnvironment);
    throw UnsupportedPlatformError(
        QStringLiteral("no desktop backend for %1 with %2")
            .arg(operatingSystemName(platform.os), desktop));
}

// --- DesktopApiHandle ---

namespace {
std::once_flag g_selectOnce;
std::shared_ptr<const IDesktopApi> g_handle;
}

std::shared_ptr<const IDesktopApi> DesktopApiHandle::initialize(const BackendOptions& options)
{
    std::call_once(g_selectOnce, [&options]() {
        g_handle = BackendSelector::select(PlatformInfo::detect(), options);
    });
    return g_handle;
}

std::shared_ptr<const IDesktopApi> DesktopApiHandle::instance()
{
    return initialize();
}

} // namespace lxp
