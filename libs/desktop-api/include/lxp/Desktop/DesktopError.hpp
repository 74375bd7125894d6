#pragma once

#include <QString>
#include <QtGlobal>

namespace lxp {

/// Every failure a backend reports falls into exactly one of these kinds.
enum class DesktopErrorKind {
    FileNotFound,
    ApiFailure,
    NotificationError,
    PermissionDenied
};

QString errorKindName(DesktopErrorKind kind);

/// A normalized backend failure. The native code and message are meant for
/// logs; callers branch on kind() only.
class DesktopError {
public:
    DesktopError() = default;
    DesktopError(DesktopErrorKind kind, const QString& message, qint64 nativeCode = 0);

    DesktopErrorKind kind() const { return kind_; }
    QString message() const { return message_; }
    qint64 nativeCode() const { return nativeCode_; }

    /// "kind: message (code N)", code omitted when zero.
    QString toString() const;

private:
    DesktopErrorKind kind_ = DesktopErrorKind::ApiFailure;
    QString message_;
    qint64 nativeCode_ = 0;
};

/// Outcome of a desktop operation: success, or one DesktopError.
class DesktopResult {
public:
    /// Default-constructed result is a success.
    DesktopResult() = default;
    DesktopResult(const DesktopError& error);

    static DesktopResult success() { return DesktopResult(); }
    static DesktopResult failure(DesktopErrorKind kind, const QString& message, qint64 nativeCode = 0);

    bool isOk() const { return ok_; }
    explicit operator bool() const { return ok_; }

    /// Only meaningful when isOk() is false.
    const DesktopError& error() const { return error_; }

private:
    bool ok_ = true;
    DesktopError error_;
};

} // namespace lxp
