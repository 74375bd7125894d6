#include <lxp/Backend/Recording/RecordingDesktopApi.hpp>
#include <lxp/Desktop/Preconditions.hpp>
#include <QFileInfo>
#include <QMutexLocker>

namespace lxp {

RecordingDesktopApi::RecordingDesktopApi(CapabilitySet capabilities, const QString& name)
    : name_(name)
    , capabilities_(capabilities)
{
}

QString RecordingDesktopApi::name() const
{
    return name_;
}

CapabilitySet RecordingDesktopApi::capabilities() const
{
    return capabilities_;
}

bool RecordingDesktopApi::takePrimedFailure(DesktopError* error) const
{
    QMutexLocker lock(&mutex_);
    if (!failNext_)
        return false;
    failNext_ = false;
    *error = primed_;
    return true;
}

DesktopResult RecordingDesktopApi::changeBackground(const QString& imagePath) const
{
    DesktopResult check = checkReadableFile(imagePath);
    if (!check)
        return check;

    if (!capabilities_.testFlag(Capability::Wallpaper))
        return DesktopResult::failure(DesktopErrorKind::ApiFailure, QStringLiteral("wallpaper not supported"));

    DesktopError error;
    if (takePrimedFailure(&error))
        return error;

    QMutexLocker lock(&mutex_);
    backgrounds_.append(QFileInfo(imagePath).absoluteFilePath());
    return DesktopResult::success();
}

DesktopResult RecordingDesktopApi::sendNotification(const Notification& notification) const
{
    DesktopResult check = checkNotificationSupported(notification, capabilities_);
    if (!check)
        return check;

    DesktopError error;
    if (takePrimedFailure(&error))
        return error;

    QMutexLocker lock(&mutex_);
    notifications_.append(notification);
    return DesktopResult::success();
}

DesktopResult RecordingDesktopApi::openFile(const QString& path) const
{
    DesktopResult check = checkReadableFile(path);
    if (!check)
        return check;

    if (!capabilities_.testFlag(Capability::FileOpen))
        return DesktopResult::failure(DesktopErrorKind::ApiFailure, QStringLiteral("file open not supported"));

    DesktopError error;
    if (takePrimedFailure(&error))
        return error;

    QMutexLocker lock(&mutex_);
    openedFiles_.append(QFileInfo(path).absoluteFilePath());
    return DesktopResult::success();
}

void RecordingDesktopApi::failNextCall(const DesktopError& error)
{
    QMutexLocker lock(&mutex_);
    failNext_ = true;
    primed_ = error;
}

QStringList RecordingDesktopApi::backgrounds() const
{
    QMutexLocker lock(&mutex_);
    return backgrounds_;
}

QList<Notification> RecordingDesktopApi::notifications() const
{
    QMutexLocker lock(&mutex_);
    return notifications_;
}

QStringList RecordingDesktopApi::openedFiles() const
{
    QMutexLocker lock(&mutex_);
    return openedFiles_;
}

void RecordingDesktopApi::clear()
{
    QMutexLocker lock(&mutex_);
    failNext_ = false;
    backgrounds_.clear();
    notifications_.clear();
    openedFiles_.clear();
}

} // namespace lxp
