#include "AudioBufferCache.h"

#include <QDebug>

#include "FutureUtils.h"
#include "PadStore.h"

namespace {
constexpr int kProgressMax = 1000;
constexpr int kFetchedProgress = 500;
}  // namespace

AudioBufferCache::AudioBufferCache(PadStore *store, AudioDecoder *decoder, QObject *parent)
    : QObject(parent), m_store(store), m_decoder(decoder) {}

void AudioBufferCache::setByteBudget(qint64 bytes) {
    m_byteBudget = qMax<qint64>(0, bytes);
    evictIfNeeded(0);
}

bool AudioBufferCache::isFailed(qint64 audioFileId) const {
    const auto it = m_entries.constFind(audioFileId);
    return it != m_entries.cend() && !it->result.ok();
}

QFuture<DecodeResult> AudioBufferCache::resolve(qint64 audioFileId) {
    auto cached = m_entries.find(audioFileId);
    if (cached != m_entries.end()) {
        cached->lastUse = ++m_useCounter;
        ++m_counters.hits;
        return makeReadyFuture(cached->result);
    }
    const auto pending = m_pending.constFind(audioFileId);
    if (pending != m_pending.cend()) {
        ++m_counters.hits;
        return pending->future;
    }

    ++m_counters.misses;
    qDebug() << "[Cache] miss for audio file" << audioFileId;
    Pending job;
    job.promise = std::make_shared<QPromise<DecodeResult>>();
    job.future = job.promise->future();
    job.promise->start();
    job.promise->setProgressRange(0, kProgressMax);
    job.promise->setProgressValue(0);
    m_pending.insert(audioFileId, job);

    if (!m_store || !m_decoder) {
        DecodeResult result;
        result.error = "No storage or decoder attached";
        complete(audioFileId, result, false);
        return job.future;
    }

    onFinished(m_store->audioFile(audioFileId), this,
               [this, audioFileId](const StoreReply<AudioFile> &reply) {
                   if (!m_pending.contains(audioFileId)) {
                       return;
                   }
                   if (!reply.ok()) {
                       DecodeResult result;
                       result.error = reply.message.isEmpty()
                                          ? QString("Audio file %1 unavailable").arg(audioFileId)
                                          : reply.message;
                       // Missing files stay missing; I/O errors may clear up on a retry.
                       complete(audioFileId, result, reply.status == StoreStatus::NotFound);
                       return;
                   }
                   startDecode(audioFileId, reply.value);
               });
    return job.future;
}

void AudioBufferCache::startDecode(qint64 audioFileId, const AudioFile &file) {
    const auto it = m_pending.constFind(audioFileId);
    if (it == m_pending.cend()) {
        return;
    }
    std::shared_ptr<QPromise<DecodeResult>> promise = it->promise;
    promise->setProgressValue(kFetchedProgress);
    ++m_counters.decodes;

    const QFuture<DecodeResult> decoding = m_decoder->decode(file);
    onProgress(decoding, this, [promise](float ratio) {
        const int span = kProgressMax - kFetchedProgress - 1;
        promise->setProgressValue(kFetchedProgress + static_cast<int>(ratio * span));
    });
    onFinished(decoding, this, [this, audioFileId](const DecodeResult &result) {
        complete(audioFileId, result, true);
    });
}

void AudioBufferCache::complete(qint64 audioFileId, DecodeResult result, bool remember) {
    const auto it = m_pending.find(audioFileId);
    if (it == m_pending.end()) {
        return;
    }
    const Pending job = it.value();
    m_pending.erase(it);

    const bool ok = result.ok();
    if (!ok) {
        result.buffer.reset();
        if (result.error.isEmpty()) {
            result.error = QString("Decode of audio file %1 failed").arg(audioFileId);
        }
        qWarning() << "[Cache]" << result.error;
    }
    if (remember) {
        Entry entry;
        entry.result = result;
        entry.bytes = ok ? result.buffer->byteSize() : 0;
        entry.lastUse = ++m_useCounter;
        m_entries.insert(audioFileId, entry);
        m_bytes += entry.bytes;
        evictIfNeeded(audioFileId);
    }

    job.promise->setProgressValue(kProgressMax);
    job.promise->addResult(result);
    job.promise->finish();
    emit decodeFinished(audioFileId, ok);
}

void AudioBufferCache::evictIfNeeded(qint64 keepId) {
    if (m_byteBudget <= 0) {
        return;
    }
    while (m_bytes > m_byteBudget) {
        auto victim = m_entries.end();
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            if (it.key() == keepId || !it->result.ok()) {
                continue;
            }
            if (victim == m_entries.end() || it->lastUse < victim->lastUse) {
                victim = it;
            }
        }
        if (victim == m_entries.end()) {
            return;
        }
        qDebug() << "[Cache] evicting audio file" << victim.key() << victim->bytes << "bytes";
        m_bytes -= victim->bytes;
        m_entries.erase(victim);
        ++m_counters.evictions;
    }
}

void AudioBufferCache::preload(const QVector<qint64> &audioFileIds) {
    for (qint64 id : audioFileIds) {
        if (m_entries.contains(id) || m_pending.contains(id)) {
            continue;
        }
        resolve(id);
    }
}

void AudioBufferCache::remove(qint64 audioFileId) {
    const auto it = m_entries.find(audioFileId);
    if (it == m_entries.end()) {
        return;
    }
    m_bytes -= it->bytes;
    m_entries.erase(it);
}

void AudioBufferCache::clear() {
    m_entries.clear();
    m_bytes = 0;
}

AudioBufferCache::Stats AudioBufferCache::stats() const {
    Stats stats = m_counters;
    stats.entries = m_entries.size();
    stats.inFlight = m_pending.size();
    stats.bytes = m_bytes;
    stats.failures = 0;
    for (const Entry &entry : m_entries) {
        if (!entry.result.ok()) {
            ++stats.failures;
        }
    }
    return stats;
}
