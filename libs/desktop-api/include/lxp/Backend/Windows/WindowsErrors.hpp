#pragma once

#include <lxp/Desktop/Capability.hpp>
#include <lxp/Desktop/DesktopError.hpp>
#include <QOperatingSystemVersion>
#include <QString>
#include <QtGlobal>

namespace lxp {

// Win32 error codes the mapping distinguishes (winerror.h)
constexpr quint32 WIN32_ERROR_FILE_NOT_FOUND = 2;
constexpr quint32 WIN32_ERROR_PATH_NOT_FOUND = 3;
constexpr quint32 WIN32_ERROR_ACCESS_DENIED = 5;

// ShellExecute returns a value greater than this on success
constexpr qintptr SHELL_EXECUTE_MAX_ERROR = 32;

/// GetLastError() value after a failed call to `operation`.
DesktopResult mapWin32Error(quint32 code, const QString& operation);

/// ShellExecuteW return value for `path`.
DesktopResult mapShellExecuteResult(qintptr result, const QString& path);

/// Wallpaper and FileOpen everywhere; Notifications from Windows 8 on.
/// Never NotificationActions or RawIconBytes.
CapabilitySet windowsCapabilities(const QOperatingSystemVersion& version);

} // namespace lxp
