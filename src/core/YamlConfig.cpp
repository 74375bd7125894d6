#include "core/YamlConfig.hpp"
#include "core/YamlTree.hpp"
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QStringList>
#include <fstream>
#include <limits>

namespace lxp {

YamlConfig::YamlConfig()
    : root_(defaultsTree())
{
}

YAML::Node YamlConfig::defaultsTree()
{
    YAML::Node tree(YAML::NodeType::Map);

    tree["app"]["name"] = DEFAULT_APP_NAME;
    tree["app"]["id"] = "";

    tree["wallpaper"]["apply_dark_variant"] = true;
    tree["wallpaper"]["notify_on_change"] = true;

    tree["notifications"]["enabled"] = true;
    tree["notifications"]["urgency"] = "normal";
    tree["notifications"]["timeout_ms"] = 0;
    tree["notifications"]["sound"] = true;

    tree["linux"]["gsettings_schema"] = "org.gnome.desktop.background";
    tree["linux"]["open_command"] = "xdg-open";

    tree["logging"]["level"] = "info";
    return tree;
}

void YamlConfig::load(const QString& filePath)
{
    const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = overlayOnDefaults(defaultsTree(), loaded);
}

bool YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    std::ofstream fout(filePath.toStdString());
    fout << root_;
    return fout.good();
}

QString YamlConfig::defaultPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
        + QStringLiteral("/loxerpaper/config.yaml");
}

// --- App ---

QString YamlConfig::appName() const
{
    return QString::fromStdString(root_["app"]["name"].as<std::string>(DEFAULT_APP_NAME));
}

void YamlConfig::setAppName(const QString& v)
{
    root_["app"]["name"] = v.toStdString();
}

QString YamlConfig::appId() const
{
    return QString::fromStdString(root_["app"]["id"].as<std::string>(""));
}

void YamlConfig::setAppId(const QString& v)
{
    root_["app"]["id"] = v.toStdString();
}

// --- Wallpaper ---

bool YamlConfig::applyDarkVariant() const
{
    return root_["wallpaper"]["apply_dark_variant"].as<bool>(true);
}

void YamlConfig::setApplyDarkVariant(bool v)
{
    root_["wallpaper"]["apply_dark_variant"] = v;
}

bool YamlConfig::notifyOnChange() const
{
    return root_["wallpaper"]["notify_on_change"].as<bool>(true);
}

void YamlConfig::setNotifyOnChange(bool v)
{
    root_["wallpaper"]["notify_on_change"] = v;
}

// --- Notifications ---

bool YamlConfig::notificationsEnabled() const
{
    return root_["notifications"]["enabled"].as<bool>(true);
}

void YamlConfig::setNotificationsEnabled(bool v)
{
    root_["notifications"]["enabled"] = v;
}

Urgency YamlConfig::notificationUrgency() const
{
    return urgencyFromString(QString::fromStdString(root_["notifications"]["urgency"].as<std::string>("normal")));
}

void YamlConfig::setNotificationUrgency(Urgency v)
{
    root_["notifications"]["urgency"] = urgencyToString(v).toStdString();
}

int YamlConfig::notificationTimeoutMs() const
{
    return root_["notifications"]["timeout_ms"].as<int>(0);
}

void YamlConfig::setNotificationTimeoutMs(int v)
{
    root_["notifications"]["timeout_ms"] = v;
}

bool YamlConfig::notificationSound() const
{
    return root_["notifications"]["sound"].as<bool>(true);
}

void YamlConfig::setNotificationSound(bool v)
{
    root_["notifications"]["sound"] = v;
}

// --- Linux ---

QString YamlConfig::gsettingsSchema() const
{
    return QString::fromStdString(
        root_["linux"]["gsettings_schema"].as<std::string>("org.gnome.desktop.background"));
}

void YamlConfig::setGsettingsSchema(const QString& v)
{
    root_["linux"]["gsettings_schema"] = v.toStdString();
}

QString YamlConfig::openCommand() const
{
    return QString::fromStdString(root_["linux"]["open_command"].as<std::string>("xdg-open"));
}

void YamlConfig::setOpenCommand(const QString& v)
{
    root_["linux"]["open_command"] = v.toStdString();
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

BackendOptions YamlConfig::backendOptions() const
{
    BackendOptions options;
    options.appName = appName();
    options.appId = appId();
    options.applyDarkVariant = applyDarkVariant();
    options.gsettingsSchema = gsettingsSchema();
    options.openCommand = openCommand();
    options.notificationSound = notificationSound();
    return options;
}

// --- Generic dot-path access ---
// Leaves are typed by their default: "no" reads as false for a boolean
// setting and stays a string for a text one.

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty())
        return {};

    const QStringList parts = dottedKey.split(QLatin1Char('.'));
    YAML::Node value;
    if (!findNode(root_, parts, &value) || !value.IsScalar())
        return {};

    YAML::Node fallback;
    if (!findNode(defaultsTree(), parts, &fallback) || !fallback.IsScalar())
        return decodeLeaf(value, leafTypeOf(value));

    // An undecodable value reads as its default, like the typed getters
    const LeafType type = leafTypeOf(fallback);
    const QVariant decoded = decodeLeaf(value, type);
    return decoded.isValid() ? decoded : decodeLeaf(fallback, type);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty())
        return false;

    // Only leaves that exist in the defaults can be written
    const QStringList parts = dottedKey.split(QLatin1Char('.'));
    YAML::Node fallback;
    if (!findNode(defaultsTree(), parts, &fallback) || !fallback.IsScalar())
        return false;

    YAML::Node encoded;
    switch (leafTypeOf(fallback)) {
    case LeafType::Bool: {
        const QVariant flag = value.typeId() == QMetaType::Bool
            ? value
            : decodeLeaf(YAML::Node(value.toString().toStdString()), LeafType::Bool);
        if (!flag.isValid())
            return false;
        encoded = flag.toBool();
        break;
    }
    case LeafType::Int: {
        bool ok = false;
        const qlonglong number = value.toLongLong(&ok);
        if (!ok || value.typeId() == QMetaType::Bool
            || number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max())
            return false;
        encoded = static_cast<int>(number);
        break;
    }
    case LeafType::String:
        encoded = value.toString().toStdString();
        break;
    }

    // load() keeps every default section a map, so the walk cannot hit a scalar
    YAML::Node section = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        section.reset(section[parts.at(i).toStdString()]);
    section[parts.last().toStdString()] = encoded;
    return true;
}

} // namespace lxp
