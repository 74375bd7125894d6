#include <lxp/Desktop/DesktopError.hpp>

namespace lxp {

QString errorKindName(DesktopErrorKind kind)
{
    switch (kind) {
    case DesktopErrorKind::FileNotFound:
        return QStringLiteral("file not found");
    case DesktopErrorKind::ApiFailure:
        return QStringLiteral("api failure");
    case DesktopErrorKind::NotificationError:
        return QStringLiteral("notification error");
    case DesktopErrorKind::PermissionDenied:
        return QStringLiteral("permission denied");
    }
    return QStringLiteral("unknown");
}

DesktopError::DesktopError(DesktopErrorKind kind, const QString& message, qint64 nativeCode)
    : kind_(kind)
    , message_(message)
    , nativeCode_(nativeCode)
{
}

QString DesktopError::toString() const
{
    QString text = errorKindName(kind_) + QStringLiteral(": ") + message_;
    if (nativeCode_ != 0)
        text += QStringLiteral(" (code %1)").arg(nativeCode_);
    return text;
}

DesktopResult::DesktopResult(const DesktopError& error)
    : ok_(false)
    , error_(error)
{
}

DesktopResult DesktopResult::failure(DesktopErrorKind kind, const QString& message, qint64 nativeCode)
{
    return DesktopResult(DesktopError(kind, message, nativeCode));
}

} // namespace lxp
