#include "ArmedTrackRegistry.h"

ArmedTrackRegistry::ArmedTrackRegistry(QObject *parent) : QObject(parent) {}

int ArmedTrackRegistry::indexOf(const QString &key) const {
    for (int i = 0; i < m_tracks.size(); ++i) {
        if (m_tracks.at(i).key == key) {
            return i;
        }
    }
    return -1;
}

void ArmedTrackRegistry::arm(const QString &key, const ArmedTrack &track) {
    ArmedTrack entry = track;
    entry.key = key;
    const int index = indexOf(key);
    if (index >= 0) {
        m_tracks[index] = entry;
    } else {
        m_tracks.push_back(entry);
    }
    emit armedTracksChanged();
}

bool ArmedTrackRegistry::disarm(const QString &key) {
    const int index = indexOf(key);
    if (index < 0) {
        return false;
    }
    m_tracks.remove(index);
    emit armedTracksChanged();
    return true;
}

std::optional<ArmedTrack> ArmedTrackRegistry::get(const QString &key) const {
    const int index = indexOf(key);
    if (index < 0) {
        return std::nullopt;
    }
    return m_tracks.at(index);
}

std::optional<ArmedTrack> ArmedTrackRegistry::takeNext() {
    if (m_tracks.isEmpty()) {
        return std::nullopt;
    }
    ArmedTrack track = m_tracks.takeFirst();
    emit armedTracksChanged();
    return track;
}

void ArmedTrackRegistry::clear() {
    if (m_tracks.isEmpty()) {
        return;
    }
    m_tracks.clear();
    emit armedTracksChanged();
}
