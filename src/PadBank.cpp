#include "PadBank.h"

#include <QDebug>
#include <QPromise>
#include <QtGlobal>
#include <memory>

#include "ArmedTrackRegistry.h"
#include "AudioBufferCache.h"
#include "AudioOutput.h"
#include "FutureUtils.h"
#include "PadStore.h"

namespace {
PadEditResult makeEditResult(EngineError error, const QString &message = QString()) {
    PadEditResult result;
    result.error = error;
    result.message = message;
    return result;
}
}  // namespace

PadBank::PadBank(PadStore *store, AudioDecoder *decoder, AudioOutput *output,
                 const EngineSettings &settings, QObject *parent)
    : QObject(parent),
      m_store(store),
      m_settings(settings),
      m_journal(settings.journalPath()),
      m_resolver(settings.grid),
      m_debouncer(settings.debounceMs) {
    m_cache = new AudioBufferCache(store, decoder, this);
    m_cache->setByteBudget(m_settings.cacheByteBudget());
    m_loading = new LoadingStateTracker(this);
    m_dispatcher = new PlaybackDispatcher(m_cache, output, m_loading, this);
    m_armed = new ArmedTrackRegistry(this);
    m_swapper = new PadSwapCoordinator(store, m_settings.grid, &m_journal, this);

    connect(m_dispatcher, &PlaybackDispatcher::instantFeedback, this,
            [this](const PadAddress &address) {
                if (isOnCurrentPage(address)) {
                    emit instantFeedback(address.padIndex);
                }
            });
    connect(m_dispatcher, &PlaybackDispatcher::errorOccurred, this,
            [this](const PadAddress &address, EngineError error, const QString &message) {
                qWarning() << "[PadBank]" << address.playbackKey() << engineErrorName(error)
                           << message;
                emit errorOccurred(error, message);
            });
    connect(m_loading, &LoadingStateTracker::stateChanged, this,
            [this](const PadAddress &address, const LoadingState &) {
                if (isOnCurrentPage(address)) {
                    emit padStateChanged(address.padIndex);
                }
            });
    connect(m_armed, &ArmedTrackRegistry::armedTracksChanged, this, &PadBank::armedChanged);
}

PadBank::~PadBank() = default;

void PadBank::setActiveProfile(int profileId) {
    if (m_profileId == profileId) {
        return;
    }
    m_profileId = profileId;
    emit profileChanged(profileId);
    reloadPage();
}

void PadBank::setCurrentPage(int pageIndex) {
    if (pageIndex < 0 || m_pageIndex == pageIndex) {
        return;
    }
    m_pageIndex = pageIndex;
    emit pageChanged(pageIndex);
    reloadPage();
}

void PadBank::reloadPage() {
    const int serial = ++m_pageSerial;
    m_pads.clear();
    m_bindings.clear();
    m_pageLoaded = false;
    if (m_profileId < 0) {
        emit padsChanged();
        return;
    }
    const int profileId = m_profileId;
    const int pageIndex = m_pageIndex;
    onFinished(m_store->padConfigurations(profileId, pageIndex), this,
               [this, serial](const StoreReply<QVector<PadConfiguration>> &reply) {
                   if (serial != m_pageSerial) {
                       return;
                   }
                   if (!reply.ok()) {
                       qWarning() << "[PadBank] cannot load page" << m_pageIndex << reply.message;
                       emit errorOccurred(engineErrorForStatus(reply.status), reply.message);
                       return;
                   }
                   QVector<qint64> clips;
                   for (const PadConfiguration &config : reply.value) {
                       m_pads.insert(config.padIndex, config);
                       clips += config.audioFileIds;
                   }
                   m_bindings = keyBindingsFor(reply.value);
                   m_pageLoaded = true;
                   m_cache->preload(clips);
                   emit padsChanged();
               });
}

PadAddress PadBank::addressOf(int padIndex) const {
    return PadAddress{m_profileId, m_pageIndex, padIndex};
}

bool PadBank::isOnCurrentPage(const PadAddress &address) const {
    return address.profileId == m_profileId && address.pageIndex == m_pageIndex;
}

PadConfiguration PadBank::pad(int padIndex) const {
    const auto it = m_pads.constFind(padIndex);
    if (it != m_pads.cend()) {
        return it.value();
    }
    return PadConfiguration::cleared(addressOf(padIndex));
}

QString PadBank::padName(int padIndex) const {
    if (padIndex == grid().stopAllPad()) {
        return "STOP ALL";
    }
    if (padIndex == grid().fadeOutAllPad()) {
        return "FADE ALL";
    }
    return pad(padIndex).name;
}

QString PadBank::keyHint(int padIndex) const {
    const PadConfiguration config = pad(padIndex);
    if (!config.keyBinding.isEmpty()) {
        return config.keyBinding.toUpper();
    }
    return m_resolver.defaultKeyForPad(padIndex).toUpper();
}

TriggerRequest PadBank::requestFor(int padIndex) const {
    const PadConfiguration config = pad(padIndex);
    TriggerRequest request;
    request.address = addressOf(padIndex);
    request.clipIds = config.audioFileIds;
    request.playbackType = config.playbackType;
    request.behavior = m_settings.activePadBehavior;
    request.name = config.name;
    return request;
}

QFuture<TriggerOutcome> PadBank::triggerPad(int padIndex) {
    TriggerOutcome ignored;
    ignored.kind = TriggerOutcome::Kind::Ignored;
    if (padIndex == grid().stopAllPad()) {
        stopAll();
        return makeReadyFuture(ignored);
    }
    if (padIndex == grid().fadeOutAllPad()) {
        fadeOutAll();
        return makeReadyFuture(ignored);
    }
    if (!grid().contains(padIndex)) {
        return makeReadyFuture(ignored);
    }

    const QFuture<TriggerOutcome> future = m_dispatcher->trigger(requestFor(padIndex));
    if (m_profileId < 0) {
        emit errorOccurred(EngineError::NoActiveProfile, "No active profile");
    }
    return future;
}

bool PadBank::handleKeyPress(const KeyPress &press) {
    if (press.autoRepeat) {
        return false;
    }
    const KeyAction action = m_resolver.resolve(press, m_bindings);
    switch (action.kind) {
        case KeyAction::Kind::None:
            return false;
        case KeyAction::Kind::StopAll:
            stopAll();
            return true;
        case KeyAction::Kind::FadeOutAll:
            fadeOutAll();
            return true;
        case KeyAction::Kind::SwitchBank:
            setCurrentPage(action.pageIndex);
            return true;
        case KeyAction::Kind::TriggerPad:
            if (!m_debouncer.accept(press.key)) {
                return true;
            }
            triggerPad(action.padIndex);
            return true;
    }
    return false;
}

void PadBank::stopPad(int padIndex) {
    m_dispatcher->stop(addressOf(padIndex));
}

void PadBank::stopAll() {
    m_dispatcher->stopAll();
}

void PadBank::fadeOutAll() {
    m_dispatcher->fadeOutAll(m_settings.fadeOutSeconds);
}

bool PadBank::isPlaying(int padIndex) const {
    return m_dispatcher->isPlaying(addressOf(padIndex));
}

PlaybackProgress PadBank::playbackProgress(int padIndex) const {
    return m_dispatcher->playbackProgress(addressOf(padIndex));
}

LoadingState PadBank::loadingState(int padIndex) const {
    return m_loading->state(addressOf(padIndex));
}

bool PadBank::armPad(int padIndex) {
    const PadConfiguration config = pad(padIndex);
    if (m_profileId < 0 || isControlPad(padIndex) || !config.hasClips()) {
        return false;
    }
    ArmedTrack track;
    track.name = config.name;
    track.address = addressOf(padIndex);
    track.audioFileIds = config.audioFileIds;
    track.playbackType = config.playbackType;
    m_armed->arm(track.address.armedKey(), track);
    return true;
}

bool PadBank::disarmPad(int padIndex) {
    return m_armed->disarm(addressOf(padIndex).armedKey());
}

void PadBank::toggleArmed(int padIndex) {
    if (!disarmPad(padIndex)) {
        armPad(padIndex);
    }
}

bool PadBank::isArmed(int padIndex) const {
    return m_armed->isArmed(addressOf(padIndex).armedKey());
}

QFuture<TriggerOutcome> PadBank::playNextArmed() {
    const std::optional<ArmedTrack> track = m_armed->takeNext();
    if (!track) {
        TriggerOutcome outcome;
        outcome.kind = TriggerOutcome::Kind::Ignored;
        return makeReadyFuture(outcome);
    }
    TriggerRequest request;
    request.address = track->address;
    request.clipIds = track->audioFileIds;
    request.playbackType = track->playbackType;
    request.behavior = m_settings.activePadBehavior;
    request.name = track->name;
    return m_dispatcher->trigger(request);
}

QFuture<SwapOutcome> PadBank::swapPads(int fromPad, int toPad) {
    const QFuture<SwapOutcome> future = m_swapper->swap(m_profileId, m_pageIndex, fromPad, toPad);
    const int profileId = m_profileId;
    const int pageIndex = m_pageIndex;
    onFinished(future, this, [this, profileId, pageIndex](const SwapOutcome &outcome) {
        if (outcome.status == SwapOutcome::Status::Swapped ||
            outcome.status == SwapOutcome::Status::Failed) {
            for (int padIndex : outcome.affectedPads) {
                m_dispatcher->forgetPad(PadAddress{profileId, pageIndex, padIndex});
            }
            reloadPage();
        }
        if (!outcome.ok() && outcome.error != EngineError::None) {
            emit errorOccurred(outcome.error, outcome.message);
        }
    });
    return future;
}

void PadBank::storePadLocally(const PadConfiguration &config) {
    if (!isOnCurrentPage(config.address())) {
        return;
    }
    m_pads.insert(config.padIndex, config);
    m_bindings = keyBindingsFor(m_pads.values());
    emit padsChanged();
}

QFuture<PadEditResult> PadBank::savePad(const PadConfiguration &input) {
    PadConfiguration config = input;
    if (config.profileId < 0) {
        return makeReadyFuture(makeEditResult(EngineError::NoActiveProfile, "No active profile"));
    }
    if (!grid().contains(config.padIndex) || isControlPad(config.padIndex)) {
        return makeReadyFuture(makeEditResult(EngineError::ConstraintViolation,
                                              QString("Pad %1 cannot hold clips").arg(config.padIndex)));
    }
    if (validateKeyBinding(config.keyBinding) != EngineError::None) {
        return makeReadyFuture(makeEditResult(
            EngineError::InvalidKeyBinding,
            QString("'%1' cannot be used as a key binding").arg(config.keyBinding)));
    }
    config.keyBinding = normalizeKeyBinding(config.keyBinding);
    if (!config.keyBinding.isEmpty() && isOnCurrentPage(config.address())) {
        for (const PadConfiguration &other : m_pads) {
            if (other.padIndex != config.padIndex && other.keyBinding == config.keyBinding) {
                return makeReadyFuture(makeEditResult(
                    EngineError::InvalidKeyBinding,
                    QString("Key '%1' is already bound to pad %2")
                        .arg(config.keyBinding)
                        .arg(other.padIndex)));
            }
        }
    }
    return writePad(config);
}

QFuture<PadEditResult> PadBank::writePad(const PadConfiguration &config) {
    auto promise = std::make_shared<QPromise<PadEditResult>>();
    QFuture<PadEditResult> future = promise->future();
    promise->start();
    onFinished(m_store->upsertPadConfiguration(config), this,
               [this, promise](const StoreReply<PadConfiguration> &reply) {
                   PadEditResult result;
                   if (reply.ok()) {
                       storePadLocally(reply.value);
                   } else {
                       result = makeEditResult(engineErrorForStatus(reply.status), reply.message);
                       emit errorOccurred(result.error, result.message);
                   }
                   promise->addResult(result);
                   promise->finish();
               });
    return future;
}

QFuture<PadEditResult> PadBank::appendClips(int padIndex, const QVector<qint64> &audioFileIds) {
    PadConfiguration config = pad(padIndex);
    if (audioFileIds.isEmpty()) {
        return makeReadyFuture(PadEditResult());
    }
    config.id = 0;
    config.audioFileIds += audioFileIds;
    return savePad(config);
}

QFuture<PadEditResult> PadBank::clearPad(int padIndex) {
    const PadAddress address = addressOf(padIndex);
    if (m_profileId < 0) {
        return makeReadyFuture(makeEditResult(EngineError::NoActiveProfile, "No active profile"));
    }
    auto promise = std::make_shared<QPromise<PadEditResult>>();
    QFuture<PadEditResult> future = promise->future();
    promise->start();
    onFinished(m_store->deletePadConfiguration(address), this,
               [this, promise, address](const StoreResult &reply) {
                   PadEditResult result;
                   if (reply.ok()) {
                       m_dispatcher->forgetPad(address);
                       if (isOnCurrentPage(address)) {
                           m_pads.remove(address.padIndex);
                           m_bindings = keyBindingsFor(m_pads.values());
                           emit padsChanged();
                       }
                   } else {
                       result = makeEditResult(engineErrorForStatus(reply.status), reply.message);
                       emit errorOccurred(result.error, result.message);
                   }
                   promise->addResult(result);
                   promise->finish();
               });
    return future;
}

QFuture<SwapOutcome> PadBank::recoverPendingSwap() {
    const QFuture<SwapOutcome> future = m_swapper->recoverPendingSwap();
    onFinished(future, this, [this](const SwapOutcome &outcome) {
        if (outcome.status == SwapOutcome::Status::Recovered) {
            reloadPage();
        } else if (outcome.error != EngineError::None) {
            emit errorOccurred(outcome.error, outcome.message);
        }
    });
    return future;
}
