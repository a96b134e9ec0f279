#include "JsonPadStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMimeDatabase>
#include <QSaveFile>
#include <algorithm>

#include "FutureUtils.h"

namespace {
constexpr const char *kIndexFile = "pads.json";
constexpr const char *kAudioDir = "audio";
constexpr int kFormatVersion = 1;
}  // namespace

JsonPadStore::JsonPadStore(const QString &directory, QObject *parent)
    : QObject(parent), m_directory(directory) {}

QString JsonPadStore::indexPath() const {
    return QDir(m_directory).filePath(kIndexFile);
}

QString JsonPadStore::blobPath(qint64 id) const {
    return QDir(m_directory).filePath(QString("%1/%2.bin").arg(kAudioDir).arg(id));
}

bool JsonPadStore::load(QString *errorText) {
    m_rows.clear();
    m_index.clear();
    m_audio.clear();
    m_nextPadId = 1;
    m_nextAudioId = 1;
    if (!isPersistent()) {
        return true;
    }
    if (!QDir().mkpath(QDir(m_directory).filePath(kAudioDir))) {
        if (errorText) {
            *errorText = QString("Cannot create store directory %1").arg(m_directory);
        }
        return false;
    }
    QFile file(indexPath());
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorText) {
            *errorText = file.errorString();
        }
        return false;
    }
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (doc.isNull() || !doc.isObject()) {
        if (errorText) {
            *errorText = QString("Corrupt pad store %1: %2").arg(indexPath(), err.errorString());
        }
        return false;
    }
    const QJsonObject root = doc.object();
    m_nextPadId = qMax<qint64>(1, root.value("nextPadId").toInteger(1));
    m_nextAudioId = qMax<qint64>(1, root.value("nextAudioId").toInteger(1));

    for (const QJsonValue &value : root.value("pads").toArray()) {
        const PadConfiguration config = padConfigurationFromJson(value.toObject());
        if (config.id <= 0 || !config.address().isValid()) {
            continue;
        }
        if (m_index.contains(config.address())) {
            qWarning() << "[Store] duplicate slot in index, keeping first" << config.id;
            continue;
        }
        m_rows.insert(config.id, config);
        m_index.insert(config.address(), config.id);
        m_nextPadId = qMax(m_nextPadId, config.id + 1);
    }
    for (const QJsonValue &value : root.value("audio").toArray()) {
        const QJsonObject obj = value.toObject();
        const qint64 id = obj.value("id").toInteger(0);
        if (id <= 0) {
            continue;
        }
        AudioEntry entry;
        entry.type = obj.value("type").toString();
        entry.name = obj.value("name").toString();
        m_audio.insert(id, entry);
        m_nextAudioId = qMax(m_nextAudioId, id + 1);
    }
    return true;
}

bool JsonPadStore::save(const QMap<qint64, PadConfiguration> &rows,
                        const QMap<qint64, AudioEntry> &audio, QString *errorText) const {
    if (!isPersistent()) {
        return true;
    }
    QJsonObject root;
    root["version"] = kFormatVersion;
    root["nextPadId"] = m_nextPadId;
    root["nextAudioId"] = m_nextAudioId;
    QJsonArray pads;
    for (const PadConfiguration &config : rows) {
        pads.append(padConfigurationToJson(config));
    }
    root["pads"] = pads;
    QJsonArray clips;
    for (auto it = audio.cbegin(); it != audio.cend(); ++it) {
        QJsonObject obj;
        obj["id"] = it.key();
        obj["type"] = it.value().type;
        obj["name"] = it.value().name;
        clips.append(obj);
    }
    root["audio"] = clips;

    QSaveFile file(indexPath());
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorText) {
            *errorText = file.errorString();
        }
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        if (errorText) {
            *errorText = file.errorString();
        }
        return false;
    }
    return true;
}

qint64 JsonPadStore::rowIdAt(const PadAddress &address) const {
    return m_index.value(address, 0);
}

QFuture<StoreReply<std::optional<PadConfiguration>>> JsonPadStore::padConfiguration(
    const PadAddress &address) {
    StoreReply<std::optional<PadConfiguration>> reply;
    const qint64 id = rowIdAt(address);
    if (id > 0) {
        reply.value = m_rows.value(id);
    }
    return makeReadyFuture(reply);
}

QFuture<StoreReply<QVector<PadConfiguration>>> JsonPadStore::padConfigurations(int profileId,
                                                                               int pageIndex) {
    StoreReply<QVector<PadConfiguration>> reply;
    for (const PadConfiguration &config : m_rows) {
        if (config.profileId == profileId && config.pageIndex == pageIndex) {
            reply.value.push_back(config);
        }
    }
    std::sort(reply.value.begin(), reply.value.end(),
              [](const PadConfiguration &a, const PadConfiguration &b) {
                  return a.padIndex < b.padIndex;
              });
    return makeReadyFuture(reply);
}

QFuture<StoreReply<PadConfiguration>> JsonPadStore::upsertPadConfiguration(
    const PadConfiguration &config) {
    StoreReply<PadConfiguration> reply;
    const PadAddress address = config.address();
    if (!address.isValid()) {
        reply.status = StoreStatus::Failed;
        reply.message = QString("Invalid pad address %1").arg(address.playbackKey());
        return makeReadyFuture(reply);
    }

    const qint64 occupant = rowIdAt(address);
    qint64 id = config.id;
    if (id == 0) {
        id = occupant;
    } else if (!m_rows.contains(id)) {
        reply.status = StoreStatus::NotFound;
        reply.message = QString("No pad configuration with id %1").arg(id);
        return makeReadyFuture(reply);
    } else if (occupant != 0 && occupant != id) {
        reply.status = StoreStatus::ConstraintViolation;
        reply.message = QString("Slot %1 already holds configuration %2")
                            .arg(address.playbackKey())
                            .arg(occupant);
        return makeReadyFuture(reply);
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    PadConfiguration stored = config;
    const bool inserting = (id == 0);
    if (inserting) {
        id = m_nextPadId;
        stored.createdAt = now;
    } else {
        stored.createdAt = m_rows.value(id).createdAt;
    }
    stored.id = id;
    stored.updatedAt = now;

    QMap<qint64, PadConfiguration> rows = m_rows;
    rows.insert(id, stored);
    if (inserting) {
        ++m_nextPadId;
    }
    QString error;
    if (!save(rows, m_audio, &error)) {
        reply.status = StoreStatus::Failed;
        reply.message = error;
        return makeReadyFuture(reply);
    }

    const PadConfiguration previous = m_rows.value(id);
    if (!inserting && previous.address() != address) {
        m_index.remove(previous.address());
    }
    m_rows = rows;
    m_index.insert(address, id);
    reply.value = stored;
    return makeReadyFuture(reply);
}

QFuture<StoreResult> JsonPadStore::deletePadConfiguration(const PadAddress &address) {
    StoreResult result;
    const qint64 id = rowIdAt(address);
    if (id == 0) {
        return makeReadyFuture(result);
    }
    QMap<qint64, PadConfiguration> rows = m_rows;
    rows.remove(id);
    if (!save(rows, m_audio, &result.message)) {
        result.status = StoreStatus::Failed;
        return makeReadyFuture(result);
    }
    m_rows = rows;
    m_index.remove(address);
    return makeReadyFuture(result);
}

QFuture<StoreReply<AudioFile>> JsonPadStore::audioFile(qint64 id) {
    StoreReply<AudioFile> reply;
    const auto it = m_audio.constFind(id);
    if (it == m_audio.cend()) {
        reply.status = StoreStatus::NotFound;
        reply.message = QString("No audio file with id %1").arg(id);
        return makeReadyFuture(reply);
    }
    AudioFile file;
    file.id = id;
    file.type = it->type;
    file.name = it->name;
    if (isPersistent()) {
        QFile blob(blobPath(id));
        if (!blob.open(QIODevice::ReadOnly)) {
            reply.status = StoreStatus::Failed;
            reply.message = QString("Cannot read audio file %1: %2").arg(id).arg(blob.errorString());
            return makeReadyFuture(reply);
        }
        file.bytes = blob.readAll();
    } else {
        file.bytes = it->bytes;
    }
    reply.value = file;
    return makeReadyFuture(reply);
}

qint64 JsonPadStore::addAudioFile(const QByteArray &bytes, const QString &type,
                                  const QString &name, QString *errorText) {
    if (bytes.isEmpty()) {
        if (errorText) {
            *errorText = QString("Audio file %1 is empty").arg(name);
        }
        return 0;
    }
    const qint64 id = m_nextAudioId;
    AudioEntry entry;
    entry.type = type;
    entry.name = name;
    if (isPersistent()) {
        if (!QDir().mkpath(QDir(m_directory).filePath(kAudioDir))) {
            if (errorText) {
                *errorText = QString("Cannot create %1").arg(kAudioDir);
            }
            return 0;
        }
        QSaveFile blob(blobPath(id));
        if (!blob.open(QIODevice::WriteOnly)) {
            if (errorText) {
                *errorText = blob.errorString();
            }
            return 0;
        }
        blob.write(bytes);
        if (!blob.commit()) {
            if (errorText) {
                *errorText = blob.errorString();
            }
            return 0;
        }
    } else {
        entry.bytes = bytes;
    }

    QMap<qint64, AudioEntry> audio = m_audio;
    audio.insert(id, entry);
    ++m_nextAudioId;
    if (!save(m_rows, audio, errorText)) {
        QFile::remove(blobPath(id));
        return 0;
    }
    m_audio = audio;
    return id;
}

qint64 JsonPadStore::importAudioFile(const QString &path, QString *errorText) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorText) {
            *errorText = QString("Cannot open %1: %2").arg(path, file.errorString());
        }
        return 0;
    }
    const QByteArray bytes = file.readAll();
    const QString type = QMimeDatabase().mimeTypeForFileNameAndData(path, bytes).name();
    return addAudioFile(bytes, type, QFileInfo(path).fileName(), errorText);
}
