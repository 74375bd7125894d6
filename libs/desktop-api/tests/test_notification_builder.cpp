#include <QtTest/QtTest>
#include <lxp/Notification/Notification.hpp>

using namespace std::chrono_literals;

class TestNotificationBuilder : public QObject {
    Q_OBJECT
private slots:
    void testDefaults()
    {
        auto n = lxp::Notification::builder("Hello").build();
        QCOMPARE(n.title(), QString("Hello"));
        QVERIFY(n.body().isEmpty());
        QCOMPARE(n.urgency(), lxp::Urgency::Normal);
        QVERIFY(!n.hasTimeout());
        QVERIFY(n.actions().isEmpty());
        QVERIFY(n.icon().isNull());
        QVERIFY(n.isValid());
    }

    void testCriticalWithTimeoutReadsBack()
    {
        auto n = lxp::Notification::builder("Disk full")
                     .urgency(lxp::Urgency::Critical)
                     .timeout(5s)
                     .build();
        QCOMPARE(n.urgency(), lxp::Urgency::Critical);
        QVERIFY(n.hasTimeout());
        QCOMPARE(n.timeout(), std::chrono::milliseconds(5000));
    }

    void testActionsKeepInsertionOrder()
    {
        auto n = lxp::Notification::builder("Saved")
                     .action("view", "View")
                     .action("undo", "Undo")
                     .build();
        QCOMPARE(n.actions().size(), 2);
        QCOMPARE(n.actions().at(0).id, QString("view"));
        QCOMPARE(n.actions().at(0).title, QString("View"));
        QCOMPARE(n.actions().at(1).id, QString("undo"));
    }

    void testScalarsLastWriteWins()
    {
        auto n = lxp::Notification::builder("t")
                     .body("first")
                     .urgency(lxp::Urgency::Low)
                     .body("second")
                     .urgency(lxp::Urgency::Critical)
                     .build();
        QCOMPARE(n.body(), QString("second"));
        QCOMPARE(n.urgency(), lxp::Urgency::Critical);
    }

    void testOrderOfCallsDoesNotMatter()
    {
        auto a = lxp::Notification::builder("t").timeout(2s).body("b").action("x", "X").build();
        auto b = lxp::Notification::builder("t").action("x", "X").body("b").timeout(2s).build();
        QCOMPARE(a.body(), b.body());
        QCOMPARE(a.timeout(), b.timeout());
        QCOMPARE(a.actions(), b.actions());
    }

    void testBuilderIsReusable()
    {
        auto builder = lxp::Notification::builder("t");
        auto first = builder.build();
        builder.action("later", "Later");
        auto second = builder.build();
        QVERIFY(first.actions().isEmpty());
        QCOMPARE(second.actions().size(), 1);
    }

    void testEmptyTitleIsInvalid()
    {
        QVERIFY(!lxp::Notification::builder("").build().isValid());
    }

    void testIconKinds()
    {
        auto path = lxp::NotificationIcon::fromPath("/tmp/icon.png");
        QCOMPARE(path.kind(), lxp::NotificationIcon::Kind::Path);
        QCOMPARE(path.name(), QString("/tmp/icon.png"));

        auto resource = lxp::NotificationIcon::fromResource("dialog-information");
        QCOMPARE(resource.kind(), lxp::NotificationIcon::Kind::Resource);

        auto raw = lxp::NotificationIcon::fromRaw(QByteArray("\x89PNG", 4));
        QCOMPARE(raw.kind(), lxp::NotificationIcon::Kind::Raw);
        QCOMPARE(raw.bytes().size(), 4);
        QVERIFY(raw.name().isEmpty());
    }

    void testUrgencyStrings()
    {
        bool ok = false;
        QCOMPARE(lxp::urgencyFromString("CRITICAL", &ok), lxp::Urgency::Critical);
        QVERIFY(ok);
        QCOMPARE(lxp::urgencyFromString(" low ", &ok), lxp::Urgency::Low);
        QVERIFY(ok);
        QCOMPARE(lxp::urgencyFromString("urgent", &ok), lxp::Urgency::Normal);
        QVERIFY(!ok);
        QCOMPARE(lxp::urgencyToString(lxp::Urgency::Critical), QString("critical"));
    }
};

QTEST_MAIN(TestNotificationBuilder)
#include "test_notification_builder.moc"
