#pragma once

#include <QFuture>
#include <QHash>
#include <QObject>
#include <QString>
#include <QVector>

#include "AudioOutput.h"
#include "EngineError.h"
#include "PadTypes.h"
#include "PlaybackStrategy.h"

class AudioBufferCache;
class LoadingStateTracker;
class QRandomGenerator;

struct TriggerRequest {
    PadAddress address;
    QVector<qint64> clipIds;
    PlaybackType playbackType = PlaybackType::RoundRobin;
    ActivePadBehavior behavior = ActivePadBehavior::Continue;
    QString name;
};

struct TriggerOutcome {
    enum class Kind {
        Played,
        Stopped,
        Ignored,
        Superseded,
        Failed
    };

    Kind kind = Kind::Failed;
    EngineError error = EngineError::None;
    QString message;
    qint64 audioFileId = 0;
    int clipIndex = -1;
    quint64 sequence = 0;
};

// Runs a pad trigger from key press to audio output. Instant feedback is
// emitted before any I/O; the returned future completes once the trigger has
// played, failed or been overtaken by a newer trigger for the same pad.
class PlaybackDispatcher : public QObject {
    Q_OBJECT
public:
    PlaybackDispatcher(AudioBufferCache *cache, AudioOutput *output, LoadingStateTracker *loading,
                       QObject *parent = nullptr);

    QFuture<TriggerOutcome> trigger(const TriggerRequest &request);

    void stop(const PadAddress &address);
    void stopAll();
    void fadeOut(const PadAddress &address, double seconds);
    void fadeOutAll(double seconds);
    bool isPlaying(const PadAddress &address) const;
    PlaybackProgress playbackProgress(const PadAddress &address) const;

    // Drops strategy state, e.g. after the pad configuration was deleted.
    void forgetPad(const PadAddress &address);
    StrategyState strategyState(const PadAddress &address) const;
    quint64 sequence(const PadAddress &address) const { return m_sequences.value(address, 0); }

    void setRandomGenerator(QRandomGenerator *rng) { m_rng = rng; }

signals:
    void instantFeedback(const PadAddress &address);
    void playbackStarted(const PadAddress &address, qint64 audioFileId, int clipIndex);
    void errorOccurred(const PadAddress &address, EngineError error, const QString &message);

private:
    void invalidate(const PadAddress &address);
    void invalidateAll();

    AudioBufferCache *m_cache = nullptr;
    AudioOutput *m_output = nullptr;
    LoadingStateTracker *m_loading = nullptr;
    QRandomGenerator *m_rng = nullptr;
    QHash<PadAddress, StrategyState> m_strategies;
    QHash<PadAddress, quint64> m_sequences;
};

Q_DECLARE_METATYPE(TriggerOutcome)
