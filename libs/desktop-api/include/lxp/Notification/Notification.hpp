#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <chrono>

namespace lxp {

enum class Urgency {
    Low,
    Normal,
    Critical
};

QString urgencyToString(Urgency urgency);

/// Parse "low", "normal" or "critical" (case-insensitive).
/// Returns Urgency::Normal and sets *ok = false for anything else.
Urgency urgencyFromString(const QString& text, bool* ok = nullptr);

struct NotificationAction {
    QString id;     // opaque token reported back when the user picks the action
    QString title;  // button label
};

inline bool operator==(const NotificationAction& a, const NotificationAction& b)
{
    return a.id == b.id && a.title == b.title;
}

/// Icon shown next to a notification.
/// Path: local image file. Resource: themed icon name. Raw: encoded image bytes.
class NotificationIcon {
public:
    enum class Kind {
        None,
        Path,
        Resource,
        Raw
    };

    NotificationIcon() = default;

    static NotificationIcon fromPath(const QString& path);
    static NotificationIcon fromResource(const QString& name);
    static NotificationIcon fromRaw(const QByteArray& bytes);

    Kind kind() const { return kind_; }
    bool isNull() const { return kind_ == Kind::None; }

    /// File path for Kind::Path, icon name for Kind::Resource, empty otherwise.
    QString name() const { return name_; }
    QByteArray bytes() const { return bytes_; }

private:
    Kind kind_ = Kind::None;
    QString name_;
    QByteArray bytes_;
};

class NotificationBuilder;

/// Immutable description of a desktop notification.
/// Only NotificationBuilder creates instances; there are no setters.
class Notification {
public:
    static NotificationBuilder builder(const QString& title);

    QString title() const { return title_; }
    QString body() const { return body_; }
    Urgency urgency() const { return urgency_; }

    /// False means "let the platform decide how long it stays".
    bool hasTimeout() const { return hasTimeout_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    /// In insertion order; backends render buttons in this order.
    const QList<NotificationAction>& actions() const { return actions_; }
    const NotificationIcon& icon() const { return icon_; }

    /// A notification needs a non-empty title to be dispatched.
    bool isValid() const { return !title_.isEmpty(); }

private:
    friend class NotificationBuilder;
    Notification() = default;

    QString title_;
    QString body_;
    Urgency urgency_ = Urgency::Normal;
    bool hasTimeout_ = false;
    std::chrono::milliseconds timeout_{0};
    QList<NotificationAction> actions_;
    NotificationIcon icon_;
};

/// Collects notification fields in any order. Scalar setters are
/// last-write-wins, action() appends. build() performs no I/O and never fails.
class NotificationBuilder {
public:
    explicit NotificationBuilder(const QString& title);

    NotificationBuilder& body(const QString& body);
    NotificationBuilder& urgency(Urgency urgency);
    NotificationBuilder& timeout(std::chrono::milliseconds timeout);
    NotificationBuilder& icon(const NotificationIcon& icon);
    NotificationBuilder& action(const QString& id, const QString& title);

    Notification build() const;

private:
    Notification draft_;
};

} // namespace lxp
