#pragma once

#include <QObject>

#include "AudioDecoder.h"

// Fallback decoder on top of QAudioDecoder, reading the clip from memory.
class QtAudioDecoder : public QObject, public AudioDecoder {
    Q_OBJECT
public:
    explicit QtAudioDecoder(QObject *parent = nullptr);

    QFuture<DecodeResult> decode(const AudioFile &file) override;
};
