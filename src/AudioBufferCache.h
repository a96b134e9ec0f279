#pragma once

#include <QFuture>
#include <QHash>
#include <QObject>
#include <QPromise>
#include <QVector>
#include <memory>

#include "AudioDecoder.h"

class PadStore;

// Decoded buffers keyed by audio file id. Concurrent requests for the same id
// share one fetch and decode; failures are remembered for the process lifetime.
// Successful entries are evicted least recently used first once the decoded
// byte total exceeds the budget.
class AudioBufferCache : public QObject {
    Q_OBJECT
public:
    struct Stats {
        int entries = 0;
        int failures = 0;
        int inFlight = 0;
        qint64 bytes = 0;
        qint64 hits = 0;
        qint64 misses = 0;
        qint64 decodes = 0;
        qint64 evictions = 0;
    };

    AudioBufferCache(PadStore *store, AudioDecoder *decoder, QObject *parent = nullptr);

    // 0 disables eviction.
    void setByteBudget(qint64 bytes);

    // The future reports progress on a 0..1000 range: fetching covers the first
    // half, decoding the second.
    QFuture<DecodeResult> resolve(qint64 audioFileId);
    void preload(const QVector<qint64> &audioFileIds);

    bool contains(qint64 audioFileId) const { return m_entries.contains(audioFileId); }
    bool isFailed(qint64 audioFileId) const;
    bool isInFlight(qint64 audioFileId) const { return m_pending.contains(audioFileId); }
    void remove(qint64 audioFileId);
    void clear();
    Stats stats() const;

signals:
    void decodeFinished(qint64 audioFileId, bool ok);

private:
    struct Entry {
        DecodeResult result;
        qint64 bytes = 0;
        quint64 lastUse = 0;
    };

    struct Pending {
        std::shared_ptr<QPromise<DecodeResult>> promise;
        QFuture<DecodeResult> future;
    };

    void startDecode(qint64 audioFileId, const AudioFile &file);
    void complete(qint64 audioFileId, DecodeResult result, bool remember);
    void evictIfNeeded(qint64 keepId);

    PadStore *m_store = nullptr;
    AudioDecoder *m_decoder = nullptr;
    QHash<qint64, Entry> m_entries;
    QHash<qint64, Pending> m_pending;
    qint64 m_byteBudget = 0;
    qint64 m_bytes = 0;
    quint64 m_useCounter = 0;
    Stats m_counters;
};
