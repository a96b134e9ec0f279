#pragma once

#include <QObject>
#include <QString>
#include <QVector>
#include <optional>

#include "PadTypes.h"

struct ArmedTrack {
    QString key;
    QString name;
    PadAddress address;
    QVector<qint64> audioFileIds;
    PlaybackType playbackType = PlaybackType::RoundRobin;
};

// Pads picked for deferred playback. In memory only, kept in arm order.
class ArmedTrackRegistry : public QObject {
    Q_OBJECT
public:
    explicit ArmedTrackRegistry(QObject *parent = nullptr);

    // Re-arming a key replaces its entry in place.
    void arm(const QString &key, const ArmedTrack &track);
    bool disarm(const QString &key);
    std::optional<ArmedTrack> get(const QString &key) const;
    bool isArmed(const QString &key) const { return indexOf(key) >= 0; }
    QVector<ArmedTrack> list() const { return m_tracks; }
    int count() const { return m_tracks.size(); }

    // Removes and returns the oldest armed track.
    std::optional<ArmedTrack> takeNext();
    void clear();

signals:
    void armedTracksChanged();

private:
    int indexOf(const QString &key) const;

    QVector<ArmedTrack> m_tracks;
};
