#include <QSignalSpy>
#include <QtTest>

#include "ArmedTrackRegistry.h"

namespace {
ArmedTrack trackFor(int padIndex, const QString &name) {
    ArmedTrack track;
    track.name = name;
    track.address = PadAddress{1, 0, padIndex};
    track.audioFileIds = {qint64(padIndex + 100)};
    return track;
}
}  // namespace

class ArmedTrackRegistryTest : public QObject {
    Q_OBJECT

private slots:
    void armKeepsOrder();
    void rearmReplacesInPlace();
    void disarm();
    void takeNextIsFirstInFirstOut();
    void clearEmitsOnlyWhenNonEmpty();
};

void ArmedTrackRegistryTest::armKeepsOrder() {
    ArmedTrackRegistry registry;
    QSignalSpy spy(&registry, &ArmedTrackRegistry::armedTracksChanged);
    registry.arm("b", trackFor(2, "Bell"));
    registry.arm("a", trackFor(1, "Airhorn"));

    QCOMPARE(spy.count(), 2);
    QCOMPARE(registry.count(), 2);
    const QVector<ArmedTrack> tracks = registry.list();
    QCOMPARE(tracks.at(0).key, QString("b"));
    QCOMPARE(tracks.at(1).key, QString("a"));
    QVERIFY(registry.isArmed("a"));
    QCOMPARE(registry.get("a")->name, QString("Airhorn"));
    QVERIFY(!registry.get("missing").has_value());
}

void ArmedTrackRegistryTest::rearmReplacesInPlace() {
    ArmedTrackRegistry registry;
    registry.arm("a", trackFor(1, "Airhorn"));
    registry.arm("b", trackFor(2, "Bell"));
    registry.arm("a", trackFor(1, "Applause"));

    QCOMPARE(registry.count(), 2);
    QCOMPARE(registry.list().at(0).name, QString("Applause"));
    QCOMPARE(registry.list().at(0).key, QString("a"));
}

void ArmedTrackRegistryTest::disarm() {
    ArmedTrackRegistry registry;
    registry.arm("a", trackFor(1, "Airhorn"));
    QSignalSpy spy(&registry, &ArmedTrackRegistry::armedTracksChanged);

    QVERIFY(registry.disarm("a"));
    QVERIFY(!registry.disarm("a"));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(registry.count(), 0);
}

void ArmedTrackRegistryTest::takeNextIsFirstInFirstOut() {
    ArmedTrackRegistry registry;
    registry.arm("a", trackFor(1, "Airhorn"));
    registry.arm("b", trackFor(2, "Bell"));

    std::optional<ArmedTrack> next = registry.takeNext();
    QVERIFY(next.has_value());
    QCOMPARE(next->key, QString("a"));
    QCOMPARE(next->audioFileIds, (QVector<qint64>{101}));
    next = registry.takeNext();
    QCOMPARE(next->key, QString("b"));
    QVERIFY(!registry.takeNext().has_value());
}

void ArmedTrackRegistryTest::clearEmitsOnlyWhenNonEmpty() {
    ArmedTrackRegistry registry;
    QSignalSpy spy(&registry, &ArmedTrackRegistry::armedTracksChanged);
    registry.clear();
    QCOMPARE(spy.count(), 0);
    registry.arm("a", trackFor(1, "Airhorn"));
    registry.clear();
    QCOMPARE(spy.count(), 2);
    QCOMPARE(registry.count(), 0);
}

QTEST_GUILESS_MAIN(ArmedTrackRegistryTest)
#include "test_armed_track_registry.moc"
