#include "PlaybackDispatcher.h"

#include <QDebug>
#include <QPromise>
#include <memory>

#include "AudioBufferCache.h"
#include "AudioOutput.h"
#include "FutureUtils.h"
#include "LoadingStateTracker.h"

namespace {
TriggerOutcome makeOutcome(TriggerOutcome::Kind kind, EngineError error = EngineError::None,
                           const QString &message = QString()) {
    TriggerOutcome outcome;
    outcome.kind = kind;
    outcome.error = error;
    outcome.message = message;
    return outcome;
}
}  // namespace

PlaybackDispatcher::PlaybackDispatcher(AudioBufferCache *cache, AudioOutput *output,
                                       LoadingStateTracker *loading, QObject *parent)
    : QObject(parent), m_cache(cache), m_output(output), m_loading(loading) {}

QFuture<TriggerOutcome> PlaybackDispatcher::trigger(const TriggerRequest &request) {
    const PadAddress address = request.address;
    if (address.profileId < 0) {
        return makeReadyFuture(makeOutcome(TriggerOutcome::Kind::Failed,
                                           EngineError::NoActiveProfile,
                                           "No active profile"));
    }
    if (request.clipIds.isEmpty()) {
        return makeReadyFuture(makeOutcome(TriggerOutcome::Kind::Failed,
                                           EngineError::EmptyPlaylist,
                                           QString("Pad %1 has no clips").arg(address.padIndex)));
    }

    emit instantFeedback(address);

    const QString key = address.playbackKey();
    if (m_output && m_output->isPlaying(key)) {
        switch (request.behavior) {
            case ActivePadBehavior::Continue:
                qDebug() << "[Dispatcher]" << key << "already playing, continuing";
                return makeReadyFuture(makeOutcome(TriggerOutcome::Kind::Ignored));
            case ActivePadBehavior::Stop: {
                qDebug() << "[Dispatcher]" << key << "already playing, stopping";
                m_output->stop(key);
                invalidate(address);
                TriggerOutcome outcome = makeOutcome(TriggerOutcome::Kind::Stopped);
                outcome.sequence = sequence(address);
                return makeReadyFuture(outcome);
            }
            case ActivePadBehavior::Restart:
                qDebug() << "[Dispatcher]" << key << "already playing, restarting";
                m_output->stop(key);
                break;
        }
    }

    StrategyState state = m_strategies.value(address, initialStrategyState(request.playbackType));
    if (state.kind != request.playbackType) {
        state = initialStrategyState(request.playbackType);
    }
    const Selection selection = selectNext(request.clipIds, state, m_rng);
    m_strategies.insert(address, selection.state);

    const quint64 seq = ++m_sequences[address];
    m_loading->setState(address, LoadingState::loading(0.0f));

    auto promise = std::make_shared<QPromise<TriggerOutcome>>();
    QFuture<TriggerOutcome> future = promise->future();
    promise->start();

    const QFuture<DecodeResult> resolving = m_cache->resolve(selection.clipId);
    onProgress(resolving, this, [this, address, seq](float ratio) {
        if (sequence(address) != seq) {
            return;
        }
        m_loading->setState(address, LoadingState::loading(ratio));
    });

    PlaybackMetadata metadata;
    metadata.address = address;
    metadata.audioFileId = selection.clipId;
    metadata.clipIndex = selection.index;
    metadata.name = request.name;

    onFinished(resolving, this, [this, address, seq, metadata, promise](const DecodeResult &result) {
        TriggerOutcome outcome;
        outcome.sequence = seq;
        outcome.audioFileId = metadata.audioFileId;
        outcome.clipIndex = metadata.clipIndex;

        if (sequence(address) != seq) {
            qDebug() << "[Dispatcher] discarding stale completion" << seq << "for"
                     << address.playbackKey();
            outcome.kind = TriggerOutcome::Kind::Superseded;
        } else if (result.ok()) {
            m_loading->setState(address, LoadingState::ready());
            if (m_output) {
                m_output->play(address.playbackKey(), result.buffer, metadata);
            }
            emit playbackStarted(address, metadata.audioFileId, metadata.clipIndex);
            m_loading->clear(address);
            outcome.kind = TriggerOutcome::Kind::Played;
        } else {
            const QString message = result.error.isEmpty()
                                        ? QString("Could not decode audio file %1")
                                              .arg(metadata.audioFileId)
                                        : result.error;
            m_loading->setState(address, LoadingState::error(message));
            emit errorOccurred(address, EngineError::DecodeFailed, message);
            m_loading->clear(address);
            outcome.kind = TriggerOutcome::Kind::Failed;
            outcome.error = EngineError::DecodeFailed;
            outcome.message = message;
        }
        promise->addResult(outcome);
        promise->finish();
    });
    return future;
}

void PlaybackDispatcher::invalidate(const PadAddress &address) {
    const auto it = m_sequences.find(address);
    if (it != m_sequences.end()) {
        ++it.value();
    }
    m_loading->clear(address);
}

void PlaybackDispatcher::invalidateAll() {
    for (auto it = m_sequences.begin(); it != m_sequences.end(); ++it) {
        ++it.value();
    }
    m_loading->clearAll();
}

void PlaybackDispatcher::stop(const PadAddress &address) {
    if (m_output) {
        m_output->stop(address.playbackKey());
    }
    invalidate(address);
}

void PlaybackDispatcher::stopAll() {
    qDebug() << "[Dispatcher] stop all";
    if (m_output) {
        m_output->stopAll();
    }
    invalidateAll();
}

void PlaybackDispatcher::fadeOut(const PadAddress &address, double seconds) {
    if (m_output) {
        m_output->fadeOut(address.playbackKey(), seconds);
    }
    invalidate(address);
}

void PlaybackDispatcher::fadeOutAll(double seconds) {
    qDebug() << "[Dispatcher] fade out all over" << seconds << "s";
    if (m_output) {
        m_output->fadeOutAll(seconds);
    }
    invalidateAll();
}

bool PlaybackDispatcher::isPlaying(const PadAddress &address) const {
    return m_output && m_output->isPlaying(address.playbackKey());
}

PlaybackProgress PlaybackDispatcher::playbackProgress(const PadAddress &address) const {
    return m_output ? m_output->playbackProgress(address.playbackKey()) : PlaybackProgress();
}

void PlaybackDispatcher::forgetPad(const PadAddress &address) {
    m_strategies.remove(address);
}

StrategyState PlaybackDispatcher::strategyState(const PadAddress &address) const {
    return m_strategies.value(address);
}
