#pragma once

#include <lxp/Desktop/IDesktopApi.hpp>
#include <QObject>
#include <QString>
#include <memory>

namespace lxp {

class IConfigService;

/// Applies a new desktop background and tells the user about it.
/// Notification problems never turn a successful background change into a
/// failure; they are reported through notificationFailed().
class BackgroundChangeService : public QObject {
    Q_OBJECT
public:
    static constexpr const char* OPEN_ACTION_ID = "open";

    BackgroundChangeService(std::shared_ptr<const IDesktopApi> desktop,
                            IConfigService* config,
                            QObject* parent = nullptr);

    /// `setBy` names whoever supplied the image; may be empty.
    DesktopResult apply(const QString& imagePath, const QString& setBy = QString());

    /// Open the last applied image with the default application.
    DesktopResult openCurrent() const;

    QString currentImage() const { return currentImage_; }

signals:
    void backgroundChanged(const QString& imagePath);
    void changeFailed(const QString& imagePath, const QString& reason);
    void notificationFailed(const QString& reason);

private:
    void notifyChanged(const QString& imagePath, const QString& setBy);

    std::shared_ptr<const IDesktopApi> desktop_;
    IConfigService* config_;
    QString currentImage_;
};

} // namespace lxp
