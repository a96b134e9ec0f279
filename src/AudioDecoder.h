#pragma once

#include <QFuture>
#include <QString>
#include <QVector>
#include <memory>

#include "PadTypes.h"

// Interleaved float PCM as handed to the audio output.
struct AudioBuffer {
    QVector<float> samples;
    int channels = 2;
    int sampleRate = 0;

    int frames() const {
        return channels > 0 ? samples.size() / channels : 0;
    }

    bool isValid() const {
        return sampleRate > 0 && !samples.isEmpty();
    }

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(frames()) / sampleRate : 0.0;
    }

    qint64 byteSize() const {
        return static_cast<qint64>(samples.size()) * static_cast<qint64>(sizeof(float));
    }
};

struct DecodeResult {
    std::shared_ptr<const AudioBuffer> buffer;
    QString error;

    bool ok() const { return buffer && buffer->isValid(); }
};

// Turns raw clip bytes into a playable buffer. The returned future reports
// progress through its progress range when the backend can measure it.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;
    virtual QFuture<DecodeResult> decode(const AudioFile &file) = 0;
};

// Prefers ffmpeg when it can be found, otherwise falls back to Qt Multimedia.
std::unique_ptr<AudioDecoder> createAudioDecoder(const QString &ffmpegPath, int sampleRate,
                                                 int channels);
