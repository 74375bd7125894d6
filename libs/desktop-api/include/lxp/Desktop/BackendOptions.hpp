#pragma once

#include <lxp/Version.hpp>
#include <QString>

namespace lxp {

/// Construction parameters shared by all backends. Each backend reads the
/// fields that concern it and ignores the rest.
struct BackendOptions {
    // Identity
    QString appName = DEFAULT_APP_NAME;
    QString appId;                  // Windows AUMID; empty = PowerShell's

    // Wallpaper
    bool applyDarkVariant = true;   // also set the dark-mode wallpaper where one exists
    QString gsettingsSchema = QStringLiteral("org.gnome.desktop.background");

    // File open
    QString openCommand = QStringLiteral("xdg-open");

    // Notifications
    bool notificationSound = true;
    QString iconCacheDir;           // where raw icon bytes are written; empty = per-user cache dir
};

} // namespace lxp
