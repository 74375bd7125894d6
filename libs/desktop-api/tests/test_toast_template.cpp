#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <lxp/Backend/Windows/ToastTemplate.hpp>

using namespace std::chrono_literals;

class TestToastTemplate : public QObject {
    Q_OBJECT
private slots:
    void testMinimalToast()
    {
        const QString xml = lxp::ToastTemplate::build(lxp::Notification::builder("Hello").build());
        QCOMPARE(xml, QString("<toast duration=\"short\"><visual><binding template=\"ToastGeneric\">"
                              "<text>Hello</text></binding></visual></toast>"));
    }

    void testBodyAndEscaping()
    {
        const QString xml = lxp::ToastTemplate::build(
            lxp::Notification::builder("Tom & Jerry").body("<b>hi</b>").build());
        QVERIFY(xml.contains("<text>Tom &amp; Jerry</text><text>&lt;b&gt;hi&lt;/b&gt;</text>"));
    }

    void testIconOverride()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString logo = dir.filePath("logo.png");
        QFile file(logo);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("png");
        file.close();

        const QString xml = lxp::ToastTemplate::build(
            lxp::Notification::builder("i").icon(lxp::NotificationIcon::fromResource(logo)).build());
        const QString expected = QUrl::fromLocalFile(QFileInfo(logo).canonicalFilePath()).toString(QUrl::FullyEncoded);
        QVERIFY(xml.contains("<image placement=\"appLogoOverride\" src=\"" + expected + "\"/>"));

        const QString themed = lxp::ToastTemplate::build(
            lxp::Notification::builder("i").icon(lxp::NotificationIcon::fromResource("dialog-information")).build());
        QVERIFY(!themed.contains("<image"));

        const QString raw = lxp::ToastTemplate::build(
            lxp::Notification::builder("i").icon(lxp::NotificationIcon::fromRaw("bytes")).build());
        QVERIFY(!raw.contains("<image"));
    }

    void testSilentAudio()
    {
        auto n = lxp::Notification::builder("quiet").build();
        QVERIFY(lxp::ToastTemplate::build(n, false).contains("<audio silent=\"true\"/>"));
        QVERIFY(!lxp::ToastTemplate::build(n, true).contains("<audio"));
    }

    void testDuration()
    {
        QVERIFY(!lxp::ToastTemplate::isLongDuration(lxp::Notification::builder("a").build()));
        QVERIFY(!lxp::ToastTemplate::isLongDuration(lxp::Notification::builder("a").timeout(25s).build()));
        QVERIFY(lxp::ToastTemplate::isLongDuration(lxp::Notification::builder("a").timeout(26s).build()));
        QVERIFY(lxp::ToastTemplate::isLongDuration(
            lxp::Notification::builder("a").urgency(lxp::Urgency::Critical).build()));
        QVERIFY(!lxp::ToastTemplate::isLongDuration(
            lxp::Notification::builder("a").urgency(lxp::Urgency::Critical).timeout(5s).build()));
    }

    void testActionsAreNotRendered()
    {
        const QString xml = lxp::ToastTemplate::build(
            lxp::Notification::builder("a").action("view", "View").build());
        QVERIFY(!xml.contains("View"));
    }
};

QTEST_MAIN(TestToastTemplate)
#include "test_toast_template.moc"
