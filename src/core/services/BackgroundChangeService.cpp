#include "BackgroundChangeService.hpp"
#include "IConfigService.hpp"
#include <lxp/Notification/Notification.hpp>
#include <QFileInfo>
#include <boost/log/trivial.hpp>
#include <chrono>

namespace lxp {

BackgroundChangeService::BackgroundChangeService(std::shared_ptr<const IDesktopApi> desktop,
                                                 IConfigService* config,
                                                 QObject* parent)
    : QObject(parent)
    , desktop_(std::move(desktop))
    , config_(config)
{
}

DesktopResult BackgroundChangeService::apply(const QString& imagePath, const QString& setBy)
{
    BOOST_LOG_TRIVIAL(info) << "[BackgroundChangeService] applying " << imagePath.toStdString()
                            << " via " << desktop_->name().toStdString();

    DesktopResult result = desktop_->changeBackground(imagePath);
    if (!result) {
        BOOST_LOG_TRIVIAL(error) << "[BackgroundChangeService] background change failed: "
                                 << result.error().toString().toStdString();
        emit changeFailed(imagePath, result.error().toString());
        return result;
    }

    currentImage_ = QFileInfo(imagePath).absoluteFilePath();
    emit backgroundChanged(currentImage_);

    notifyChanged(currentImage_, setBy);
    return result;
}

void BackgroundChangeService::notifyChanged(const QString& imagePath, const QString& setBy)
{
    if (!config_->value(QStringLiteral("notifications.enabled")).toBool()
        || !config_->value(QStringLiteral("wallpaper.notify_on_change")).toBool())
        return;

    if (!desktop_->supports(Capability::Notifications)) {
        BOOST_LOG_TRIVIAL(debug) << "[BackgroundChangeService] backend has no notifications, skipping";
        return;
    }

    QString body = QStringLiteral("Now showing %1").arg(QFileInfo(imagePath).fileName());
    if (!setBy.isEmpty())
        body += QStringLiteral(", provided by %1").arg(setBy);

    bool urgencyOk = false;
    const Urgency urgency = urgencyFromString(
        config_->value(QStringLiteral("notifications.urgency")).toString(), &urgencyOk);
    if (!urgencyOk)
        BOOST_LOG_TRIVIAL(warning) << "[BackgroundChangeService] unknown urgency in config, using normal";

    NotificationBuilder builder = Notification::builder(QStringLiteral("Background changed"));
    builder.body(body).urgency(urgency);

    const int timeoutMs = config_->value(QStringLiteral("notifications.timeout_ms")).toInt();
    if (timeoutMs > 0)
        builder.timeout(std::chrono::milliseconds(timeoutMs));

    if (desktop_->supports(Capability::NotificationActions))
        builder.action(QString::fromLatin1(OPEN_ACTION_ID), QStringLiteral("Open image"));

    const DesktopResult sent = desktop_->sendNotification(builder.build());
    if (!sent) {
        BOOST_LOG_TRIVIAL(warning) << "[BackgroundChangeService] notification failed: "
                                   << sent.error().toString().toStdString();
        emit notificationFailed(sent.error().toString());
    }
}

DesktopResult BackgroundChangeService::openCurrent() const
{
    if (currentImage_.isEmpty())
        return DesktopResult::failure(DesktopErrorKind::FileNotFound,
                                      QStringLiteral("no background has been applied yet"));

    return desktop_->openFile(currentImage_);
}

} // namespace lxp
