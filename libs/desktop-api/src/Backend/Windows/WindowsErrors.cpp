#include <lxp/Backend/Windows/WindowsErrors.hpp>
#include <lxp/Version.hpp>

namespace lxp {

DesktopResult mapWin32Error(quint32 code, const QString& operation)
{
    switch (code) {
    case WIN32_ERROR_FILE_NOT_FOUND:
    case WIN32_ERROR_PATH_NOT_FOUND:
        return DesktopResult::failure(DesktopErrorKind::FileNotFound,
                                      QStringLiteral("%1: file not found").arg(operation), code);
    case WIN32_ERROR_ACCESS_DENIED:
        return DesktopResult::failure(DesktopErrorKind::PermissionDenied,
                                      QStringLiteral("%1: access denied").arg(operation), code);
    default:
        return DesktopResult::failure(DesktopErrorKind::ApiFailure,
                                      QStringLiteral("%1 failed with error %2").arg(operation).arg(code), code);
    }
}

static QString shellExecuteMessage(qintptr result)
{
    switch (result) {
    case 0:
    case 8:  return QStringLiteral("out of memory or resources");
    case 11: return QStringLiteral("invalid executable format");
    case 26: return QStringLiteral("sharing violation");
    case 27: return QStringLiteral("incomplete file association");
    case 28: return QStringLiteral("DDE transaction timed out");
    case 29: return QStringLiteral("DDE transaction failed");
    case 30: return QStringLiteral("DDE server busy");
    case 31: return QStringLiteral("no application associated with this file type");
    case 32: return QStringLiteral("required library not found");
    default: return QStringLiteral("unknown error");
    }
}

DesktopResult mapShellExecuteResult(qintptr result, const QString& path)
{
    if (result > SHELL_EXECUTE_MAX_ERROR)
        return DesktopResult::success();

    switch (result) {
    case 2:
    case 3:
        return DesktopResult::failure(DesktopErrorKind::FileNotFound,
                                      QStringLiteral("%1 not found").arg(path), result);
    case 5:
        return DesktopResult::failure(DesktopErrorKind::PermissionDenied,
                                      QStringLiteral("access to %1 denied").arg(path), result);
    default:
        return DesktopResult::failure(DesktopErrorKind::ApiFailure,
                                      QStringLiteral("cannot open %1: %2").arg(path, shellExecuteMessage(result)),
                                      result);
    }
}

CapabilitySet windowsCapabilities(const QOperatingSystemVersion& version)
{
    CapabilitySet caps = Capability::Wallpaper | Capability::FileOpen;

    const QOperatingSystemVersion toastsSince(QOperatingSystemVersion::Windows,
                                              TOAST_MIN_WINDOWS_MAJOR, TOAST_MIN_WINDOWS_MINOR);
    if (version >= toastsSince)
        caps |= Capability::Notifications;

    return caps;
}

} // namespace lxp
