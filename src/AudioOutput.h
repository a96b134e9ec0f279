#pragma once

#include <QString>
#include <QtGlobal>
#include <memory>

#include "AudioDecoder.h"
#include "PadTypes.h"

struct PlaybackMetadata {
    PadAddress address;
    qint64 audioFileId = 0;
    int clipIndex = -1;
    QString name;
    float volume = 1.0f;
};

// Position of a playing key, in seconds of the source buffer. Invalid when
// the key is not playing.
struct PlaybackProgress {
    double position = 0.0;
    double duration = 0.0;
    bool fading = false;

    bool isValid() const { return duration > 0.0; }
    double ratio() const { return isValid() ? qBound(0.0, position / duration, 1.0) : 0.0; }
    double remaining() const { return isValid() ? qMax(0.0, duration - position) : 0.0; }
};

// Sink for decoded buffers. Every playback is keyed by the owning pad's
// playback key; starting a key that is already playing replaces it.
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    virtual void play(const QString &key, const std::shared_ptr<const AudioBuffer> &buffer,
                      const PlaybackMetadata &metadata) = 0;
    virtual void stop(const QString &key) = 0;
    virtual void stopAll() = 0;
    virtual bool isPlaying(const QString &key) const = 0;
    virtual PlaybackProgress playbackProgress(const QString &key) const = 0;
    virtual void fadeOut(const QString &key, double seconds) = 0;
    virtual void fadeOutAll(double seconds) = 0;
};
