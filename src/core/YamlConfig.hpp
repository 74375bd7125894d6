#pragma once

#include <lxp/Desktop/BackendOptions.hpp>
#include <lxp/Notification/Notification.hpp>
#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace lxp {

class YamlConfig {
public:
    YamlConfig();

    /// Merge the file over the defaults. Throws YAML::Exception on a
    /// missing or malformed file, or when a section such as "logging" is
    /// not a mapping; the previous state is kept in that case.
    void load(const QString& filePath);
    bool save(const QString& filePath) const;

    /// $XDG_CONFIG_HOME/loxerpaper/config.yaml (or the platform equivalent)
    static QString defaultPath();

    // App
    QString appName() const;
    void setAppName(const QString& v);
    QString appId() const;
    void setAppId(const QString& v);

    // Wallpaper
    bool applyDarkVariant() const;
    void setApplyDarkVariant(bool v);
    bool notifyOnChange() const;
    void setNotifyOnChange(bool v);

    // Notifications
    bool notificationsEnabled() const;
    void setNotificationsEnabled(bool v);
    Urgency notificationUrgency() const;
    void setNotificationUrgency(Urgency v);
    int notificationTimeoutMs() const;
    void setNotificationTimeoutMs(int v);
    bool notificationSound() const;
    void setNotificationSound(bool v);

    // Linux
    QString gsettingsSchema() const;
    void setGsettingsSchema(const QString& v);
    QString openCommand() const;
    void setOpenCommand(const QString& v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    /// Backend construction parameters derived from the settings above.
    BackendOptions backendOptions() const;

    // Generic dot-path access (e.g. "notifications.timeout_ms").
    // Writes must match the default's type; "yes"/"no" are accepted for booleans.
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    static YAML::Node defaultsTree();

    YAML::Node root_;  // single source of truth
};

} // namespace lxp
