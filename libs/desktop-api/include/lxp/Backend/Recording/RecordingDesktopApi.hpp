#pragma once

#include <lxp/Desktop/IDesktopApi.hpp>
#include <QList>
#include <QMutex>
#include <QStringList>

namespace lxp {

/// In-memory IDesktopApi for tests and dry runs. Applies the same
/// preconditions as the real backends, then records the call instead of
/// touching the desktop.
class RecordingDesktopApi : public IDesktopApi {
public:
    explicit RecordingDesktopApi(CapabilitySet capabilities = allCapabilities(),
                                 const QString& name = QStringLiteral("recording"));

    QString name() const override;
    CapabilitySet capabilities() const override;
    DesktopResult changeBackground(const QString& imagePath) const override;
    DesktopResult sendNotification(const Notification& notification) const override;
    DesktopResult openFile(const QString& path) const override;

    // Test API
    /// The next call that passes its preconditions fails with this error.
    void failNextCall(const DesktopError& error);

    QStringList backgrounds() const;
    QList<Notification> notifications() const;
    QStringList openedFiles() const;
    void clear();

private:
    bool takePrimedFailure(DesktopError* error) const;

    QString name_;
    CapabilitySet capabilities_;

    mutable QMutex mutex_;
    mutable bool failNext_ = false;
    mutable DesktopError primed_;
    mutable QStringList backgrounds_;
    mutable QList<Notification> notifications_;
    mutable QStringList openedFiles_;
};

} // namespace lxp
