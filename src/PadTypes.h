#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QHashFunctions>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QVector>

enum class PlaybackType {
    Sequential,
    RoundRobin,
    Random
};

enum class ActivePadBehavior {
    Continue,
    Stop,
    Restart
};

QString playbackTypeName(PlaybackType type);
PlaybackType playbackTypeFromName(const QString &name, PlaybackType fallback = PlaybackType::RoundRobin);
QString activePadBehaviorName(ActivePadBehavior behavior);
ActivePadBehavior activePadBehaviorFromName(const QString &name,
                                            ActivePadBehavior fallback = ActivePadBehavior::Continue);

struct PadAddress {
    int profileId = -1;
    int pageIndex = 0;
    int padIndex = -1;

    bool isValid() const { return profileId >= 0 && pageIndex >= 0 && padIndex >= 0; }

    // Key used by the audio output and the loading tracker.
    QString playbackKey() const;
    QString armedKey() const;
};

inline bool operator==(const PadAddress &a, const PadAddress &b) {
    return a.profileId == b.profileId && a.pageIndex == b.pageIndex && a.padIndex == b.padIndex;
}

inline bool operator!=(const PadAddress &a, const PadAddress &b) {
    return !(a == b);
}

inline size_t qHash(const PadAddress &address, size_t seed = 0) {
    return qHashMulti(seed, address.profileId, address.pageIndex, address.padIndex);
}

struct PadConfiguration {
    qint64 id = 0;
    int profileId = -1;
    int pageIndex = 0;
    int padIndex = -1;
    QVector<qint64> audioFileIds;
    PlaybackType playbackType = PlaybackType::RoundRobin;
    QString name;
    QString keyBinding;
    QDateTime createdAt;
    QDateTime updatedAt;

    PadAddress address() const { return PadAddress{profileId, pageIndex, padIndex}; }
    bool hasClips() const { return !audioFileIds.isEmpty(); }

    // An empty pad at the given slot: no clips, default strategy, no name or binding.
    static PadConfiguration cleared(const PadAddress &address);
};

struct AudioFile {
    qint64 id = 0;
    QByteArray bytes;
    QString type;
    QString name;

    bool isValid() const { return id > 0 && !bytes.isEmpty(); }
};

QJsonObject padConfigurationToJson(const PadConfiguration &config);
PadConfiguration padConfigurationFromJson(const QJsonObject &obj);

Q_DECLARE_METATYPE(PadAddress)
