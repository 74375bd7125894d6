#include <lxp/Backend/Windows/ToastTemplate.hpp>
#include <lxp/Version.hpp>
#include <QFileInfo>
#include <QUrl>
#include <QXmlStreamWriter>

namespace lxp {

bool ToastTemplate::isLongDuration(const Notification& notification)
{
    if (notification.hasTimeout())
        return notification.timeout().count() > TOAST_LONG_THRESHOLD_MS;
    return notification.urgency() == Urgency::Critical;
}

QString ToastTemplate::build(const Notification& notification, bool sound)
{
    QString xml;
    QXmlStreamWriter writer(&xml);

    writer.writeStartElement(QStringLiteral("toast"));
    writer.writeAttribute(QStringLiteral("duration"),
                          isLongDuration(notification) ? QStringLiteral("long") : QStringLiteral("short"));

    writer.writeStartElement(QStringLiteral("visual"));
    writer.writeStartElement(QStringLiteral("binding"));
    writer.writeAttribute(QStringLiteral("template"), QStringLiteral("ToastGeneric"));

    writer.writeTextElement(QStringLiteral("text"), notification.title());
    if (!notification.body().isEmpty())
        writer.writeTextElement(QStringLiteral("text"), notification.body());

    const NotificationIcon& icon = notification.icon();
    QString src;
    if (icon.kind() == NotificationIcon::Kind::Path)
        src = QUrl::fromLocalFile(QFileInfo(icon.name()).absoluteFilePath()).toString(QUrl::FullyEncoded);
    else if (icon.kind() == NotificationIcon::Kind::Resource) {
        // Toasts have no icon theme; a resource only shows when it names a file.
        const QString resolved = QFileInfo(icon.name()).canonicalFilePath();
        if (!resolved.isEmpty())
            src = QUrl::fromLocalFile(resolved).toString(QUrl::FullyEncoded);
    }

    if (!src.isEmpty()) {
        writer.writeEmptyElement(QStringLiteral("image"));
        writer.writeAttribute(QStringLiteral("placement"), QStringLiteral("appLogoOverride"));
        writer.writeAttribute(QStringLiteral("src"), src);
    }

    writer.writeEndElement(); // binding
    writer.writeEndElement(); // visual

    if (!sound) {
        writer.writeEmptyElement(QStringLiteral("audio"));
        writer.writeAttribute(QStringLiteral("silent"), QStringLiteral("true"));
    }

    writer.writeEndElement(); // toast
    return xml;
}

} // namespace lxp
