#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"
#include "core/services/ConfigService.hpp"

class TestConfigService : public QObject {
    Q_OBJECT
private slots:
    void testReadValues();
    void testWriteValues();
    void testUnknownKeyRejected();
    void testSaveAndReload();
};

void TestConfigService::testReadValues()
{
    lxp::YamlConfig yaml;
    lxp::ConfigService svc(&yaml, "/tmp/lxp_test_cs.yaml");

    QCOMPARE(svc.value("notifications.enabled").toBool(), true);
    QCOMPARE(svc.value("notifications.urgency").toString(), QString("normal"));
    QCOMPARE(svc.value("app.name").toString(), QString("Loxerpaper"));
    QVERIFY(!svc.value("nonexistent.key").isValid());
}

void TestConfigService::testWriteValues()
{
    lxp::YamlConfig yaml;
    lxp::ConfigService svc(&yaml, "/tmp/lxp_test_cs.yaml");
    QSignalSpy spy(&svc, &lxp::ConfigService::configChanged);

    QVERIFY(svc.setValue("wallpaper.notify_on_change", false));
    QCOMPARE(svc.value("wallpaper.notify_on_change").toBool(), false);
    QCOMPARE(yaml.notifyOnChange(), false);

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("wallpaper.notify_on_change"));
}

void TestConfigService::testUnknownKeyRejected()
{
    lxp::YamlConfig yaml;
    lxp::ConfigService svc(&yaml, "/tmp/lxp_test_cs.yaml");
    QSignalSpy spy(&svc, &lxp::ConfigService::configChanged);

    QVERIFY(!svc.setValue("display.brightness", 50));
    QCOMPARE(spy.count(), 0);
}

void TestConfigService::testSaveAndReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("config.yaml");

    lxp::YamlConfig yaml;
    lxp::ConfigService svc(&yaml, path);
    QVERIFY(svc.setValue("notifications.timeout_ms", 4200));
    QVERIFY(svc.save());

    lxp::YamlConfig reloaded;
    reloaded.load(path);
    QCOMPARE(reloaded.notificationTimeoutMs(), 4200);
}

QTEST_MAIN(TestConfigService)
#include "test_config_service.moc"
