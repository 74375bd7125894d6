#include <lxp/Backend/Gnome/GnomeDesktopApi.hpp>
#include <lxp/Desktop/Preconditions.hpp>
#include <lxp/Native/DBusNotificationBus.hpp>
#include <lxp/Native/ProcessCommandRunner.hpp>
#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QStandardPaths>
#include <QUrl>
#include <limits>

Q_LOGGING_CATEGORY(lcGnome, "lxp.backend.gnome")

namespace lxp {

static const QString DBUS_ACCESS_DENIED = QStringLiteral("org.freedesktop.DBus.Error.AccessDenied");

// Map a helper-tool failure onto the error taxonomy.
static DesktopResult commandFailure(const QString& tool, const CommandResult& result)
{
    switch (result.status) {
    case CommandResult::Status::FailedToStart:
        return DesktopResult::failure(DesktopErrorKind::ApiFailure,
                                      QStringLiteral("%1 could not be started: %2").arg(tool, result.errorString));
    case CommandResult::Status::Crashed:
        return DesktopResult::failure(DesktopErrorKind::ApiFailure,
                                      QStringLiteral("%1 crashed").arg(tool));
    case CommandResult::Status::Finished:
        break;
    }

    const QString stderrText = QString::fromLocal8Bit(result.standardError).trimmed();
    if (stderrText.contains(QLatin1String("permission denied"), Qt::CaseInsensitive)
        || stderrText.contains(QLatin1String("not permitted"), Qt::CaseInsensitive)) {
        return DesktopResult::failure(DesktopErrorKind::PermissionDenied,
                                      QStringLiteral("%1: %2").arg(tool, stderrText), result.exitCode);
    }

    QString message = QStringLiteral("%1 exited with status %2").arg(tool).arg(result.exitCode);
    if (!stderrText.isEmpty())
        message += QStringLiteral(": ") + stderrText;
    return DesktopResult::failure(DesktopErrorKind::ApiFailure, message, result.exitCode);
}

GnomeDesktopApi::GnomeDesktopApi(const BackendOptions& options,
                                 std::unique_ptr<ICommandRunner> runner,
                                 std::unique_ptr<INotificationBus> bus)
    : options_(options)
    , runner_(std::move(runner))
    , bus_(std::move(bus))
{
    if (!runner_)
        runner_ = std::make_unique<ProcessCommandRunner>();
    if (!bus_)
        bus_ = std::make_unique<DBusNotificationBus>();
}

GnomeDesktopApi::~GnomeDesktopApi() = default;

QString GnomeDesktopApi::name() const
{
    return QStringLiteral("gnome");
}

CapabilitySet GnomeDesktopApi::capabilities() const
{
    return allCapabilities();
}

DesktopResult GnomeDesktopApi::changeBackground(const QString& imagePath) const
{
    DesktopResult check = checkReadableFile(imagePath);
    if (!check)
        return check;

    const QString uri = QUrl::fromLocalFile(QFileInfo(imagePath).absoluteFilePath())
                            .toString(QUrl::FullyEncoded);

    DesktopResult result = setBackgroundKey(QStringLiteral("picture-uri"), uri);
    if (!result)
        return result;

    if (options_.applyDarkVariant) {
        result = setBackgroundKey(QStringLiteral("picture-uri-dark"), uri);
        if (!result)
            return result;
    }

    qCInfo(lcGnome) << "wallpaper set to" << uri;
    return DesktopResult::success();
}

DesktopResult GnomeDesktopApi::setBackgroundKey(const QString& key, const QString& uri) const
{
    const CommandResult result = runner_->run(
        QStringLiteral("gsettings"),
        {QStringLiteral("set"), options_.gsettingsSchema, key, uri});

    if (result.succeeded())
        return DesktopResult::success();

    DesktopResult failure = commandFailure(QStringLiteral("gsettings"), result);
    qCWarning(lcGnome) << "setting" << key << "failed:" << failure.error().toString();
    return failure;
}

DesktopResult GnomeDesktopApi::sendNotification(const Notification& notification) const
{
    DesktopResult check = checkNotificationSupported(notification, capabilities());
    if (!check)
        return check;

    NotifyRequest request;
    DesktopResult marshalled = marshal(notification, &request);
    if (!marshalled)
        return marshalled;

    const NotifyReply reply = bus_->notify(request);
    if (reply.ok) {
        qCDebug(lcGnome) << "notification" << reply.id << "submitted:" << notification.title();
        return DesktopResult::success();
    }

    if (!reply.busConnected)
        return DesktopResult::failure(DesktopErrorKind::ApiFailure,
                                      QStringLiteral("session bus unavailable: %1").arg(reply.errorMessage));

    if (reply.errorName == DBUS_ACCESS_DENIED)
        return DesktopResult::failure(DesktopErrorKind::PermissionDenied, reply.errorMessage);

    QString message = reply.errorMessage;
    if (!reply.errorName.isEmpty())
        message = reply.errorName + QStringLiteral(": ") + message;
    qCWarning(lcGnome) << "Notify failed:" << message;
    return DesktopResult::failure(DesktopErrorKind::NotificationError, message);
}

DesktopResult GnomeDesktopApi::marshal(const Notification& notification, NotifyRequest* request) const
{
    request->appName = options_.appName;
    request->summary = notification.title();
    request->body = notification.body();

    uchar urgency = FDO_URGENCY_NORMAL;
    switch (notification.urgency()) {
    case Urgency::Low:
        urgency = FDO_URGENCY_LOW;
        break;
    case Urgency::Normal:
        urgency = FDO_URGENCY_NORMAL;
        break;
    case Urgency::Critical:
        urgency = FDO_URGENCY_CRITICAL;
        break;
    }
    request->hints.insert(QStringLiteral("urgency"), QVariant::fromValue(urgency));

    request->expireTimeout = FDO_EXPIRE_DEFAULT;
    if (notification.hasTimeout()) {
        const auto ms = notification.timeout().count();
        if (ms >= 0)
            request->expireTimeout = ms > std::numeric_limits<int>::max()
                ? std::numeric_limits<int>::max()
                : static_cast<int>(ms);
    }

    request->actions.clear();
    for (const auto& action : notification.actions())
        request->actions << action.id << action.title;

    const NotificationIcon& icon = notification.icon();
    switch (icon.kind()) {
    case NotificationIcon::Kind::None:
        break;
    case NotificationIcon::Kind::Path:
        request->appIcon = QFileInfo(icon.name()).absoluteFilePath();
        break;
    case NotificationIcon::Kind::Resource:
        request->appIcon = icon.name();
        break;
    case NotificationIcon::Kind::Raw: {
        QString path;
        DesktopResult written = writeRawIcon(icon.bytes(), &path);
        if (!written)
            return written;
        request->appIcon = path;
        break;
    }
    }

    return DesktopResult::success();
}

QString GnomeDesktopApi::defaultIconCacheDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericCacheLocation)
        + QStringLiteral("/loxerpaper/icons");
}

// Raw icon bytes are stored once per distinct content; notification servers
// only take icons by name or path.
DesktopResult GnomeDesktopApi::writeRawIcon(const QByteArray& bytes, QString* path) const
{
    if (bytes.isEmpty())
        return DesktopResult::failure(DesktopErrorKind::NotificationError, QStringLiteral("raw icon is empty"));

    const QString dir = options_.iconCacheDir.isEmpty() ? defaultIconCacheDir() : options_.iconCacheDir;
    if (!QDir().mkpath(dir))
        return DesktopResult::failure(DesktopErrorKind::NotificationError,
                                      QStringLiteral("cannot create icon cache %1").arg(dir));

    const QString digest = QString::fromLatin1(
        QCryptographicHash::hash(bytes, QCryptographicHash::Sha1).toHex());
    *path = dir + QLatin1Char('/') + digest + QStringLiteral(".png");

    if (QFileInfo::exists(*path))
        return DesktopResult::success();

    QSaveFile file(*path);
    if (!file.open(QIODevice::WriteOnly))
        return DesktopResult::failure(DesktopErrorKind::NotificationError,
                                      QStringLiteral("cannot write icon %1: %2").arg(*path, file.errorString()));
    if (file.write(bytes) != bytes.size() || !file.commit())
        return DesktopResult::failure(DesktopErrorKind::NotificationError,
                                      QStringLiteral("cannot write icon %1: %2").arg(*path, file.errorString()));

    qCDebug(lcGnome) << "raw icon cached at" << *path;
    return DesktopResult::success();
}

DesktopResult GnomeDesktopApi::openFile(const QString& path) const
{
    DesktopResult check = checkReadableFile(path);
    if (!check)
        return check;

    const QString absolute = QFileInfo(path).absoluteFilePath();
    const CommandResult result = runner_->run(options_.openCommand, {absolute});
    if (result.succeeded()) {
        qCInfo(lcGnome) << "opened" << absolute;
        return DesktopResult::success();
    }

    if (result.status == CommandResult::Status::Finished && result.exitCode == XDG_OPEN_FILE_MISSING)
        return DesktopResult::failure(DesktopErrorKind::FileNotFound,
                                      QStringLiteral("%1 reports %2 does not exist").arg(options_.openCommand, absolute),
                                      result.exitCode);

    DesktopResult failure = commandFailure(options_.openCommand, result);
    qCWarning(lcGnome) << "open failed:" << failure.error().toString();
    return failure;
}

} // namespace lxp
