#include "FfmpegDecoder.h"

#include <QProcess>
#include <QPromise>
#include <QStringList>
#include <QtGlobal>
#include <cstdint>
#include <memory>

namespace {
constexpr int kProgressMax = 1000;

std::shared_ptr<AudioBuffer> decodePcm16(const QByteArray &bytes, int sampleRate, int channels) {
    if (bytes.isEmpty() || channels <= 0 || sampleRate <= 0) {
        return nullptr;
    }
    const int sampleCount = bytes.size() / static_cast<int>(sizeof(int16_t));
    if (sampleCount <= 0) {
        return nullptr;
    }
    auto buffer = std::make_shared<AudioBuffer>();
    buffer->channels = channels;
    buffer->sampleRate = sampleRate;
    buffer->samples.resize(sampleCount - sampleCount % channels);
    const int16_t *src = reinterpret_cast<const int16_t *>(bytes.constData());
    for (int i = 0; i < buffer->samples.size(); ++i) {
        buffer->samples[i] = static_cast<float>(src[i]) / 32768.0f;
    }
    return buffer;
}

QStringList buildFfmpegArgs(int sampleRate, int channels) {
    QStringList args = {"-v", "error", "-i", "pipe:0", "-vn"};
    args << "-ac" << QString::number(qMax(1, channels));
    args << "-ar" << QString::number(qMax(8000, sampleRate));
    args << "-f" << "s16le" << "-";
    return args;
}

struct DecodeJob {
    QPromise<DecodeResult> promise;
    QByteArray pcm;
    QByteArray stderrText;
    qint64 totalBytes = 0;
    qint64 writtenBytes = 0;
    bool done = false;
};
}  // namespace

FfmpegDecoder::FfmpegDecoder(const QString &ffmpegPath, int sampleRate, int channels,
                             QObject *parent)
    : QObject(parent),
      m_ffmpegPath(ffmpegPath),
      m_sampleRate(sampleRate),
      m_channels(channels) {}

QFuture<DecodeResult> FfmpegDecoder::decode(const AudioFile &file) {
    auto job = std::make_shared<DecodeJob>();
    QFuture<DecodeResult> future = job->promise.future();
    job->promise.start();
    job->promise.setProgressRange(0, kProgressMax);
    job->totalBytes = file.bytes.size();

    auto finish = [job](QProcess *proc, DecodeResult result) {
        if (job->done) {
            return;
        }
        job->done = true;
        job->promise.setProgressValue(kProgressMax);
        job->promise.addResult(std::move(result));
        job->promise.finish();
        if (proc) {
            proc->deleteLater();
        }
    };

    if (file.bytes.isEmpty()) {
        DecodeResult result;
        result.error = QString("Audio file %1 has no data").arg(file.id);
        finish(nullptr, result);
        return future;
    }

    QProcess *proc = new QProcess(this);
    proc->setProgram(m_ffmpegPath);
    proc->setArguments(buildFfmpegArgs(m_sampleRate, m_channels));
    proc->setProcessChannelMode(QProcess::SeparateChannels);

    const int rate = qMax(8000, m_sampleRate);
    const int channels = qMax(1, m_channels);
    const qint64 fileId = file.id;
    const QByteArray bytes = file.bytes;

    connect(proc, &QProcess::started, proc, [proc, bytes]() {
        proc->write(bytes);
        proc->closeWriteChannel();
    });
    connect(proc, &QProcess::bytesWritten, proc, [job](qint64 written) {
        if (job->done || job->totalBytes <= 0) {
            return;
        }
        job->writtenBytes += written;
        const qint64 value = (job->writtenBytes * (kProgressMax - 1)) / job->totalBytes;
        job->promise.setProgressValue(static_cast<int>(qMin<qint64>(value, kProgressMax - 1)));
    });
    connect(proc, &QProcess::readyReadStandardOutput, proc,
            [proc, job]() { job->pcm.append(proc->readAllStandardOutput()); });
    connect(proc, &QProcess::readyReadStandardError, proc,
            [proc, job]() { job->stderrText.append(proc->readAllStandardError()); });
    connect(proc, &QProcess::errorOccurred, proc, [proc, finish, fileId](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        DecodeResult result;
        result.error = QString("ffmpeg failed to start for audio file %1: %2")
                           .arg(fileId)
                           .arg(proc->errorString());
        finish(proc, result);
    });
    connect(proc,
            static_cast<void (QProcess::*)(int, QProcess::ExitStatus)>(&QProcess::finished), proc,
            [proc, job, finish, fileId, rate, channels](int exitCode, QProcess::ExitStatus status) {
                job->pcm.append(proc->readAllStandardOutput());
                DecodeResult result;
                if (status != QProcess::NormalExit || exitCode != 0) {
                    const QString detail = QString::fromUtf8(job->stderrText).trimmed();
                    result.error = QString("ffmpeg could not decode audio file %1 (exit %2) %3")
                                       .arg(fileId)
                                       .arg(exitCode)
                                       .arg(detail)
                                       .trimmed();
                    finish(proc, result);
                    return;
                }
                auto buffer = decodePcm16(job->pcm, rate, channels);
                job->pcm.clear();
                if (!buffer || !buffer->isValid()) {
                    result.error = QString("Audio file %1 decoded to no samples").arg(fileId);
                } else {
                    result.buffer = buffer;
                }
                finish(proc, result);
            });

    proc->start();
    return future;
}
