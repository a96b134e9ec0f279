#include "QtAudioDecoder.h"

#include <QAudioBuffer>
#include <QAudioDecoder>
#include <QAudioFormat>
#include <QBuffer>
#include <QPromise>
#include <QtGlobal>
#include <memory>

namespace {
constexpr int kProgressMax = 1000;

float sampleToFloat(const char *data, QAudioFormat::SampleFormat format) {
    switch (format) {
        case QAudioFormat::UInt8: {
            const quint8 v = *reinterpret_cast<const quint8 *>(data);
            return (static_cast<float>(v) - 128.0f) / 128.0f;
        }
        case QAudioFormat::Int16: {
            const qint16 v = *reinterpret_cast<const qint16 *>(data);
            return static_cast<float>(v) / 32768.0f;
        }
        case QAudioFormat::Int32: {
            const qint32 v = *reinterpret_cast<const qint32 *>(data);
            return static_cast<float>(v) / 2147483648.0f;
        }
        case QAudioFormat::Float:
            return *reinterpret_cast<const float *>(data);
        default:
            return 0.0f;
    }
}

struct DecodeJob {
    QPromise<DecodeResult> promise;
    std::shared_ptr<AudioBuffer> buffer = std::make_shared<AudioBuffer>();
    bool done = false;
};
}  // namespace

QtAudioDecoder::QtAudioDecoder(QObject *parent) : QObject(parent) {}

QFuture<DecodeResult> QtAudioDecoder::decode(const AudioFile &file) {
    auto job = std::make_shared<DecodeJob>();
    QFuture<DecodeResult> future = job->promise.future();
    job->promise.start();
    job->promise.setProgressRange(0, kProgressMax);

    auto *decoder = new QAudioDecoder(this);
    auto *device = new QBuffer(decoder);
    device->setData(file.bytes);
    device->open(QIODevice::ReadOnly);

    auto finish = [job, decoder](DecodeResult result) {
        if (job->done) {
            return;
        }
        job->done = true;
        job->promise.setProgressValue(kProgressMax);
        job->promise.addResult(std::move(result));
        job->promise.finish();
        decoder->deleteLater();
    };

    const qint64 fileId = file.id;
    connect(decoder, &QAudioDecoder::bufferReady, decoder, [decoder, job]() {
        const QAudioBuffer chunk = decoder->read();
        if (!chunk.isValid()) {
            return;
        }
        const QAudioFormat format = chunk.format();
        if (format.sampleRate() == 0 || format.channelCount() == 0) {
            return;
        }
        AudioBuffer &out = *job->buffer;
        if (out.sampleRate == 0) {
            out.sampleRate = format.sampleRate();
            out.channels = format.channelCount();
        }
        const int bytesPerSample = format.bytesPerSample();
        const int sampleCount = chunk.frameCount() * format.channelCount();
        const char *data = chunk.constData<char>();
        out.samples.reserve(out.samples.size() + sampleCount);
        for (int i = 0; i < sampleCount; ++i) {
            out.samples.push_back(sampleToFloat(data + i * bytesPerSample, format.sampleFormat()));
        }

        const qint64 duration = decoder->duration();
        if (duration > 0) {
            const qint64 value = (decoder->position() * (kProgressMax - 1)) / duration;
            job->promise.setProgressValue(
                static_cast<int>(qBound<qint64>(0, value, kProgressMax - 1)));
        }
    });
    connect(decoder, &QAudioDecoder::finished, decoder, [job, finish, fileId]() {
        DecodeResult result;
        if (job->buffer->isValid()) {
            result.buffer = job->buffer;
        } else {
            result.error = QString("Audio file %1 decoded to no samples").arg(fileId);
        }
        finish(result);
    });
    connect(decoder,
            static_cast<void (QAudioDecoder::*)(QAudioDecoder::Error)>(&QAudioDecoder::error),
            decoder, [decoder, finish, fileId](QAudioDecoder::Error) {
                DecodeResult result;
                result.error = QString("Could not decode audio file %1: %2")
                                   .arg(fileId)
                                   .arg(decoder->errorString());
                finish(result);
            });

    decoder->setSourceDevice(device);
    decoder->start();
    return future;
}
