#include <lxp/Notification/Notification.hpp>

namespace lxp {

QString urgencyToString(Urgency urgency)
{
    switch (urgency) {
    case Urgency::Low:
        return QStringLiteral("low");
    case Urgency::Normal:
        return QStringLiteral("normal");
    case Urgency::Critical:
        return QStringLiteral("critical");
    }
    return QStringLiteral("normal");
}

Urgency urgencyFromString(const QString& text, bool* ok)
{
    const QString key = text.trimmed().toLower();
    bool matched = true;
    Urgency result = Urgency::Normal;

    if (key == QLatin1String("low"))
        result = Urgency::Low;
    else if (key == QLatin1String("critical"))
        result = Urgency::Critical;
    else if (key != QLatin1String("normal"))
        matched = false;

    if (ok)
        *ok = matched;
    return result;
}

// --- NotificationIcon ---

NotificationIcon NotificationIcon::fromPath(const QString& path)
{
    NotificationIcon icon;
    icon.kind_ = Kind::Path;
    icon.name_ = path;
    return icon;
}

NotificationIcon NotificationIcon::fromResource(const QString& name)
{
    NotificationIcon icon;
    icon.kind_ = Kind::Resource;
    icon.name_ = name;
    return icon;
}

NotificationIcon NotificationIcon::fromRaw(const QByteArray& bytes)
{
    NotificationIcon icon;
    icon.kind_ = Kind::Raw;
    icon.bytes_ = bytes;
    return icon;
}

// --- Notification / NotificationBuilder ---

NotificationBuilder Notification::builder(const QString& title)
{
    return NotificationBuilder(title);
}

NotificationBuilder::NotificationBuilder(const QString& title)
{
    draft_.title_ = title;
}

NotificationBuilder& NotificationBuilder::body(const QString& body)
{
    draft_.body_ = body;
    return *this;
}

NotificationBuilder& NotificationBuilder::urgency(Urgency urgency)
{
    draft_.urgency_ = urgency;
    return *this;
}

NotificationBuilder& NotificationBuilder::timeout(std::chrono::milliseconds timeout)
{
    draft_.hasTimeout_ = true;
    draft_.timeout_ = timeout;
    return *this;
}

NotificationBuilder& NotificationBuilder::icon(const NotificationIcon& icon)
{
    draft_.icon_ = icon;
    return *this;
}

NotificationBuilder& NotificationBuilder::action(const QString& id, const QString& title)
{
    draft_.actions_.append(NotificationAction{id, title});
    return *this;
}

Notification NotificationBuilder::build() const
{
    return draft_;
}

} // namespace lxp
