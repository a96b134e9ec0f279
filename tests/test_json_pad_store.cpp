#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QtTest>

#include "JsonPadStore.h"

namespace {
PadConfiguration padAt(int padIndex, const QVector<qint64> &clips, int page = 0) {
    PadConfiguration config = PadConfiguration::cleared(PadAddress{1, page, padIndex});
    config.audioFileIds = clips;
    return config;
}
}  // namespace

class JsonPadStoreTest : public QObject {
    Q_OBJECT

private slots:
    void insertsAndReadsBack();
    void upsertByAddressKeepsRowId();
    void movingOntoOccupiedSlotIsRejected();
    void unknownIdIsNotFound();
    void deleteFreesTheSlot();
    void listsOnePageInPadOrder();
    void storesAudioFiles();
    void persistsAcrossReload();
    void rejectsCorruptIndex();
    void importsFromDisk();
};

void JsonPadStoreTest::insertsAndReadsBack() {
    JsonPadStore store;
    QVERIFY(store.load());

    PadConfiguration config = padAt(4, {1, 2});
    config.name = "Airhorn";
    config.keyBinding = "h";
    config.playbackType = PlaybackType::Sequential;
    const StoreReply<PadConfiguration> written = store.upsertPadConfiguration(config).result();
    QVERIFY(written.ok());
    QVERIFY(written.value.id > 0);
    QVERIFY(written.value.createdAt.isValid());

    const auto read = store.padConfiguration(PadAddress{1, 0, 4}).result();
    QVERIFY(read.ok());
    QVERIFY(read.value.has_value());
    QCOMPARE(read.value->id, written.value.id);
    QCOMPARE(read.value->audioFileIds, (QVector<qint64>{1, 2}));
    QCOMPARE(read.value->name, QString("Airhorn"));
    QCOMPARE(read.value->keyBinding, QString("h"));
    QCOMPARE(read.value->playbackType, PlaybackType::Sequential);

    const auto empty = store.padConfiguration(PadAddress{1, 0, 5}).result();
    QVERIFY(empty.ok());
    QVERIFY(!empty.value.has_value());
}

void JsonPadStoreTest::upsertByAddressKeepsRowId() {
    JsonPadStore store;
    const qint64 id = store.upsertPadConfiguration(padAt(4, {1})).result().value.id;
    const StoreReply<PadConfiguration> again = store.upsertPadConfiguration(padAt(4, {1, 3})).result();
    QVERIFY(again.ok());
    QCOMPARE(again.value.id, id);
    QCOMPARE(store.padCount(), 1);
    QCOMPARE(store.padConfiguration(PadAddress{1, 0, 4}).result().value->audioFileIds,
             (QVector<qint64>{1, 3}));
}

void JsonPadStoreTest::movingOntoOccupiedSlotIsRejected() {
    JsonPadStore store;
    const PadConfiguration a = store.upsertPadConfiguration(padAt(3, {1})).result().value;
    store.upsertPadConfiguration(padAt(7, {2})).result();

    PadConfiguration moved = a;
    moved.padIndex = 7;
    const StoreReply<PadConfiguration> reply = store.upsertPadConfiguration(moved).result();
    QCOMPARE(reply.status, StoreStatus::ConstraintViolation);
    QCOMPARE(engineErrorForStatus(reply.status), EngineError::ConstraintViolation);
    QCOMPARE(store.padConfiguration(PadAddress{1, 0, 3}).result().value->audioFileIds,
             (QVector<qint64>{1}));

    // Moving onto a free slot is allowed and vacates the old one.
    moved.padIndex = 9;
    QVERIFY(store.upsertPadConfiguration(moved).result().ok());
    QVERIFY(!store.padConfiguration(PadAddress{1, 0, 3}).result().value.has_value());
    QCOMPARE(store.padConfiguration(PadAddress{1, 0, 9}).result().value->id, a.id);
}

void JsonPadStoreTest::unknownIdIsNotFound() {
    JsonPadStore store;
    PadConfiguration config = padAt(1, {1});
    config.id = 42;
    QCOMPARE(store.upsertPadConfiguration(config).result().status, StoreStatus::NotFound);
    QCOMPARE(engineErrorForStatus(StoreStatus::NotFound), EngineError::StorageFailed);
}

void JsonPadStoreTest::deleteFreesTheSlot() {
    JsonPadStore store;
    store.upsertPadConfiguration(padAt(3, {1})).result();
    QVERIFY(store.deletePadConfiguration(PadAddress{1, 0, 3}).result().ok());
    QVERIFY(!store.padConfiguration(PadAddress{1, 0, 3}).result().value.has_value());
    QVERIFY(store.deletePadConfiguration(PadAddress{1, 0, 3}).result().ok());
    QVERIFY(store.upsertPadConfiguration(padAt(3, {2})).result().ok());
}

void JsonPadStoreTest::listsOnePageInPadOrder() {
    JsonPadStore store;
    store.upsertPadConfiguration(padAt(9, {1})).result();
    store.upsertPadConfiguration(padAt(2, {2})).result();
    store.upsertPadConfiguration(padAt(5, {3}, 1)).result();

    const QVector<PadConfiguration> page = store.padConfigurations(1, 0).result().value;
    QCOMPARE(page.size(), 2);
    QCOMPARE(page.at(0).padIndex, 2);
    QCOMPARE(page.at(1).padIndex, 9);
    QCOMPARE(store.padConfigurations(2, 0).result().value.size(), 0);
}

void JsonPadStoreTest::storesAudioFiles() {
    JsonPadStore store;
    QString error;
    const qint64 id = store.addAudioFile("RIFFdata", "audio/wav", "horn.wav", &error);
    QVERIFY2(id > 0, qPrintable(error));

    const StoreReply<AudioFile> reply = store.audioFile(id).result();
    QVERIFY(reply.ok());
    QCOMPARE(reply.value.bytes, QByteArray("RIFFdata"));
    QCOMPARE(reply.value.name, QString("horn.wav"));
    QCOMPARE(store.audioFile(id + 1).result().status, StoreStatus::NotFound);

    QCOMPARE(store.addAudioFile(QByteArray(), "audio/wav", "empty.wav", &error), qint64(0));
    QVERIFY(!error.isEmpty());
    QCOMPARE(store.audioFileCount(), 1);
}

void JsonPadStoreTest::persistsAcrossReload() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    qint64 padId = 0;
    qint64 audioId = 0;
    {
        JsonPadStore store(dir.path());
        QString error;
        QVERIFY2(store.load(&error), qPrintable(error));
        audioId = store.addAudioFile("OggS-bytes", "audio/ogg", "bell.ogg", &error);
        QVERIFY(audioId > 0);
        PadConfiguration config = padAt(6, {audioId});
        config.name = "Bell";
        padId = store.upsertPadConfiguration(config).result().value.id;
        QVERIFY(QFile::exists(QDir(dir.path()).filePath("pads.json")));
    }

    JsonPadStore reopened(dir.path());
    QString error;
    QVERIFY2(reopened.load(&error), qPrintable(error));
    const auto read = reopened.padConfiguration(PadAddress{1, 0, 6}).result();
    QVERIFY(read.value.has_value());
    QCOMPARE(read.value->id, padId);
    QCOMPARE(read.value->name, QString("Bell"));
    QCOMPARE(read.value->audioFileIds, (QVector<qint64>{audioId}));
    QCOMPARE(reopened.audioFile(audioId).result().value.bytes, QByteArray("OggS-bytes"));

    const qint64 next = reopened.upsertPadConfiguration(padAt(7, {audioId})).result().value.id;
    QVERIFY(next > padId);
}

void JsonPadStoreTest::rejectsCorruptIndex() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QFile index(QDir(dir.path()).filePath("pads.json"));
    QVERIFY(index.open(QIODevice::WriteOnly));
    index.write("{ not json");
    index.close();

    JsonPadStore store(dir.path());
    QString error;
    QVERIFY(!store.load(&error));
    QVERIFY(!error.isEmpty());
}

void JsonPadStoreTest::importsFromDisk() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = QDir(dir.path()).filePath("cheer.wav");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("RIFF....WAVEfmt ");
    file.close();

    JsonPadStore store;
    QString error;
    const qint64 id = store.importAudioFile(path, &error);
    QVERIFY2(id > 0, qPrintable(error));
    QCOMPARE(store.audioFile(id).result().value.name, QString("cheer.wav"));
    QCOMPARE(store.importAudioFile(QDir(dir.path()).filePath("missing.wav"), &error), qint64(0));
}

QTEST_GUILESS_MAIN(JsonPadStoreTest)
#include "test_json_pad_store.moc"
