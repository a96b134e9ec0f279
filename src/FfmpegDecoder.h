#pragma once

#include <QObject>
#include <QString>

#include "AudioDecoder.h"

// Decodes by piping the clip bytes through an ffmpeg child process that
// writes signed 16-bit PCM at the engine rate.
class FfmpegDecoder : public QObject, public AudioDecoder {
    Q_OBJECT
public:
    FfmpegDecoder(const QString &ffmpegPath, int sampleRate, int channels,
                  QObject *parent = nullptr);

    QFuture<DecodeResult> decode(const AudioFile &file) override;

    QString program() const { return m_ffmpegPath; }

private:
    QString m_ffmpegPath;
    int m_sampleRate = 48000;
    int m_channels = 2;
};
