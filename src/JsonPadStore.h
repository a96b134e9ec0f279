#pragma once

#include <QHash>
#include <QMap>
#include <QObject>
#include <QString>

#include "PadStore.h"

// Local pad store kept in a JSON index next to an audio/ blob directory.
// An empty directory keeps everything in memory.
class JsonPadStore : public QObject, public PadStore {
    Q_OBJECT
public:
    explicit JsonPadStore(const QString &directory = QString(), QObject *parent = nullptr);

    bool load(QString *errorText = nullptr);
    QString directory() const { return m_directory; }
    bool isPersistent() const { return !m_directory.isEmpty(); }

    QFuture<StoreReply<std::optional<PadConfiguration>>> padConfiguration(
        const PadAddress &address) override;
    QFuture<StoreReply<QVector<PadConfiguration>>> padConfigurations(int profileId,
                                                                    int pageIndex) override;
    QFuture<StoreReply<PadConfiguration>> upsertPadConfiguration(
        const PadConfiguration &config) override;
    QFuture<StoreResult> deletePadConfiguration(const PadAddress &address) override;
    QFuture<StoreReply<AudioFile>> audioFile(qint64 id) override;

    // Registers a clip and returns its id, or 0 on failure.
    qint64 addAudioFile(const QByteArray &bytes, const QString &type, const QString &name,
                        QString *errorText = nullptr);
    qint64 importAudioFile(const QString &path, QString *errorText = nullptr);

    int padCount() const { return m_rows.size(); }
    int audioFileCount() const { return m_audio.size(); }

private:
    struct AudioEntry {
        QString type;
        QString name;
        QByteArray bytes;
    };

    qint64 rowIdAt(const PadAddress &address) const;
    bool save(const QMap<qint64, PadConfiguration> &rows, const QMap<qint64, AudioEntry> &audio,
              QString *errorText) const;
    QString indexPath() const;
    QString blobPath(qint64 id) const;

    QString m_directory;
    QMap<qint64, PadConfiguration> m_rows;
    QHash<PadAddress, qint64> m_index;
    QMap<qint64, AudioEntry> m_audio;
    qint64 m_nextPadId = 1;
    qint64 m_nextAudioId = 1;
};
