#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <lxp/Backend/Recording/RecordingDesktopApi.hpp>
#include "core/YamlConfig.hpp"
#include "core/services/BackgroundChangeService.hpp"
#include "core/services/ConfigService.hpp"
#include "core/services/IConfigService.hpp"

class MockConfigService : public lxp::IConfigService {
public:
    MockConfigService() {
        values_["notifications.enabled"] = true;
        values_["wallpaper.notify_on_change"] = true;
        values_["notifications.urgency"] = QString("normal");
        values_["notifications.timeout_ms"] = 0;
    }
    QVariant value(const QString& path) const override {
        return values_.value(path);
    }
    bool setValue(const QString& path, const QVariant& value) override {
        values_[path] = value;
        return true;
    }
    bool save() override { return true; }

    QMap<QString, QVariant> values_;
};

// Accepts wallpaper changes, but the notification daemon is gone.
class SilentDesktopApi : public lxp::RecordingDesktopApi {
public:
    lxp::DesktopResult sendNotification(const lxp::Notification&) const override {
        return lxp::DesktopResult::failure(lxp::DesktopErrorKind::NotificationError, "daemon gone");
    }
};

class TestBackgroundChangeService : public QObject {
    Q_OBJECT

private slots:
    void init();
    void testApplyNotifiesWithAction();
    void testNoActionWithoutCapability();
    void testNoNotificationWithoutCapability();
    void testNotificationsDisabled();
    void testNotificationsDisabledInYamlFile();
    void testConfiguredUrgencyAndTimeout();
    void testChangeFailure();
    void testNotificationFailureKeepsResult();
    void testOpenCurrent();

private:
    QTemporaryDir dir_;
    QString image_;
};

void TestBackgroundChangeService::init()
{
    QVERIFY(dir_.isValid());
    image_ = dir_.filePath("sunset.jpg");
    QFile f(image_);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("jpeg");
}

void TestBackgroundChangeService::testApplyNotifiesWithAction()
{
    auto desktop = std::make_shared<lxp::RecordingDesktopApi>();
    MockConfigService config;
    lxp::BackgroundChangeService service(desktop, &config);
    QSignalSpy changed(&service, &lxp::BackgroundChangeService::backgroundChanged);

    QVERIFY(service.apply(image_, "alice").isOk());

    QCOMPARE(desktop->backgrounds().size(), 1);
    QCOMPARE(service.currentImage(), QFileInfo(image_).absoluteFilePath());
    QCOMPARE(changed.count(), 1);

    const auto notifications = desktop->notifications();
    QCOMPARE(notifications.size(), 1);
    const auto& n = notifications.first();
    QCOMPARE(n.title(), QString("Background changed"));
    QVERIFY(n.body().contains("sunset.jpg"));
    QVERIFY(n.body().contains("alice"));
    QCOMPARE(n.actions().size(), 1);
    QCOMPARE(n.actions().first().id, QString("open"));
    QCOMPARE(n.actions().first().title, QString("Open image"));
}

void TestBackgroundChangeService::testNoActionWithoutCapability()
{
    auto desktop = std::make_shared<lxp::RecordingDesktopApi>(
        lxp::Capability::Wallpaper | lxp::Capability::Notifications | lxp::Capability::FileOpen);
    MockConfigService config;
    lxp::BackgroundChangeService service(desktop, &config);
    QSignalSpy failed(&service, &lxp::BackgroundChangeService::notificationFailed);

    QVERIFY(service.apply(image_).isOk());
    QCOMPARE(desktop->notifications().size(), 1);
    QVERIFY(desktop->notifications().first().actions().isEmpty());
    QVERIFY(!desktop->notifications().first().body().contains("provided by"));
    QCOMPARE(failed.count(), 0);
}

void TestBackgroundChangeService::testNoNotificationWithoutCapability()
{
    auto desktop = std::make_shared<lxp::RecordingDesktopApi>(
        lxp::Capability::Wallpaper | lxp::Capability::FileOpen);
    MockConfigService config;
    lxp::BackgroundChangeService service(desktop, &config);

    QVERIFY(service.apply(image_).isOk());
    QCOMPARE(desktop->backgrounds().size(), 1);
    QVERIFY(desktop->notifications().isEmpty());
}

void TestBackgroundChangeService::testNotificationsDisabled()
{
    auto desktop = std::make_shared<lxp::RecordingDesktopApi>();
    MockConfigService config;
    lxp::BackgroundChangeService service(desktop, &config);

    config.values_["wallpaper.notify_on_change"] = false;
    QVERIFY(service.apply(image_).isOk());
    QVERIFY(desktop->notifications().isEmpty());

    config.values_["wallpaper.notify_on_change"] = true;
    config.values_["notifications.enabled"] = false;
    QVERIFY(service.apply(image_).isOk());
    QVERIFY(desktop->notifications().isEmpty());
    QCOMPARE(desktop->backgrounds().size(), 2);
}

void TestBackgroundChangeService::testNotificationsDisabledInYamlFile()
{
    const QString path = QString(TEST_DATA_DIR) + "/notifications_off_config.yaml";
    lxp::YamlConfig yaml;
    yaml.load(path);
    lxp::ConfigService config(&yaml, path);

    auto desktop = std::make_shared<lxp::RecordingDesktopApi>();
    lxp::BackgroundChangeService service(desktop, &config);

    QVERIFY(service.apply(image_, "bob").isOk());
    QCOMPARE(desktop->backgrounds().size(), 1);
    QVERIFY(desktop->notifications().isEmpty());
}

void TestBackgroundChangeService::testConfiguredUrgencyAndTimeout()
{
    auto desktop = std::make_shared<lxp::RecordingDesktopApi>();
    MockConfigService config;
    config.values_["notifications.urgency"] = QString("critical");
    config.values_["notifications.timeout_ms"] = 7000;
    lxp::BackgroundChangeService service(desktop, &config);

    QVERIFY(service.apply(image_).isOk());
    const auto n = desktop->notifications().first();
    QCOMPARE(n.urgency(), lxp::Urgency::Critical);
    QVERIFY(n.hasTimeout());
    QCOMPARE(n.timeout(), std::chrono::milliseconds(7000));
}

void TestBackgroundChangeService::testChangeFailure()
{
    auto desktop = std::make_shared<lxp::RecordingDesktopApi>();
    MockConfigService config;
    lxp::BackgroundChangeService service(desktop, &config);
    QSignalSpy changed(&service, &lxp::BackgroundChangeService::backgroundChanged);
    QSignalSpy failed(&service, &lxp::BackgroundChangeService::changeFailed);

    auto r = service.apply(dir_.filePath("missing.jpg"));
    QCOMPARE(r.error().kind(), lxp::DesktopErrorKind::FileNotFound);
    QCOMPARE(changed.count(), 0);
    QCOMPARE(failed.count(), 1);
    QVERIFY(service.currentImage().isEmpty());
    QVERIFY(desktop->notifications().isEmpty());
}

void TestBackgroundChangeService::testNotificationFailureKeepsResult()
{
    auto desktop = std::make_shared<SilentDesktopApi>();
    MockConfigService config;
    lxp::BackgroundChangeService service(desktop, &config);
    QSignalSpy failed(&service, &lxp::BackgroundChangeService::notificationFailed);
    QSignalSpy changeFailed(&service, &lxp::BackgroundChangeService::changeFailed);

    QVERIFY(service.apply(image_).isOk());
    QCOMPARE(desktop->backgrounds().size(), 1);
    QCOMPARE(failed.count(), 1);
    QVERIFY(failed.at(0).at(0).toString().contains("daemon gone"));
    QCOMPARE(changeFailed.count(), 0);
}

void TestBackgroundChangeService::testOpenCurrent()
{
    auto desktop = std::make_shared<lxp::RecordingDesktopApi>();
    MockConfigService config;
    lxp::BackgroundChangeService service(desktop, &config);

    QCOMPARE(service.openCurrent().error().kind(), lxp::DesktopErrorKind::FileNotFound);
    QVERIFY(desktop->openedFiles().isEmpty());

    QVERIFY(service.apply(image_).isOk());
    QVERIFY(service.openCurrent().isOk());
    QCOMPARE(desktop->openedFiles(), QStringList({QFileInfo(image_).absoluteFilePath()}));
}

QTEST_MAIN(TestBackgroundChangeService)
#include "test_background_change_service.moc"
