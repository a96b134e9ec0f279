#include "AudioDecoder.h"

#include <QDebug>
#include <QFileInfo>
#include <QStandardPaths>

#include "FfmpegDecoder.h"
#include "QtAudioDecoder.h"

std::unique_ptr<AudioDecoder> createAudioDecoder(const QString &ffmpegPath, int sampleRate,
                                                 int channels) {
    QString program = ffmpegPath;
    if (program.isEmpty() || !QFileInfo(program).isExecutable()) {
        program = QStandardPaths::findExecutable("ffmpeg");
    }
    if (!program.isEmpty()) {
        return std::make_unique<FfmpegDecoder>(program, sampleRate, channels);
    }
    qWarning() << "[Decoder] ffmpeg not found, using QAudioDecoder";
    return std::make_unique<QtAudioDecoder>();
}
