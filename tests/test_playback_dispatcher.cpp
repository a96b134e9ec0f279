#include <QRandomGenerator>
#include <QSet>
#include <QSignalSpy>
#include <QtTest>

#include "AudioBufferCache.h"
#include "FakeCollaborators.h"
#include "LoadingStateTracker.h"
#include "PlaybackDispatcher.h"

namespace {
const PadAddress kPad{1, 0, 4};

TriggerRequest requestFor(const QVector<qint64> &clips,
                          ActivePadBehavior behavior = ActivePadBehavior::Continue,
                          PlaybackType type = PlaybackType::Sequential) {
    TriggerRequest request;
    request.address = kPad;
    request.clipIds = clips;
    request.playbackType = type;
    request.behavior = behavior;
    request.name = "Airhorn";
    return request;
}
}  // namespace

class PlaybackDispatcherTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void playsSelectedClip();
    void feedbackPrecedesIo();
    void rapidRestartPlaysOnlyLatestSelection();
    void staleCompletionIsDiscarded();
    void continueIgnoresRetrigger();
    void stopBehaviorStopsPlayingPad();
    void restartBehaviorReplacesPlayback();
    void emptyPlaylistIsSilent();
    void noActiveProfile();
    void decodeFailureReportsError();
    void stopAllInvalidatesPendingTriggers();
    void fadeOutInvalidatesPendingTrigger();
    void strategyResetsWhenKindChanges();
    void sequentialAdvancesPerPad();
    void roundRobinPlaysEachClipOncePerCycle();

private:
    std::unique_ptr<FakePadStore> m_store;
    std::unique_ptr<FakeDecoder> m_decoder;
    std::unique_ptr<FakeAudioOutput> m_output;
    std::unique_ptr<AudioBufferCache> m_cache;
    std::unique_ptr<LoadingStateTracker> m_loading;
    std::unique_ptr<PlaybackDispatcher> m_dispatcher;
};

void PlaybackDispatcherTest::initTestCase() {
    qRegisterMetaType<PadAddress>();
    qRegisterMetaType<LoadingState>();
    qRegisterMetaType<EngineError>();
}

void PlaybackDispatcherTest::init() {
    m_store = std::make_unique<FakePadStore>();
    for (qint64 id = 1; id <= 3; ++id) {
        m_store->addClip(id);
    }
    m_decoder = std::make_unique<FakeDecoder>();
    m_output = std::make_unique<FakeAudioOutput>();
    m_cache = std::make_unique<AudioBufferCache>(m_store.get(), m_decoder.get());
    m_loading = std::make_unique<LoadingStateTracker>();
    m_dispatcher = std::make_unique<PlaybackDispatcher>(m_cache.get(), m_output.get(), m_loading.get());
}

void PlaybackDispatcherTest::cleanup() {
    m_dispatcher.reset();
    m_loading.reset();
    m_cache.reset();
}

void PlaybackDispatcherTest::playsSelectedClip() {
    QSignalSpy started(m_dispatcher.get(), &PlaybackDispatcher::playbackStarted);
    QFuture<TriggerOutcome> future = m_dispatcher->trigger(requestFor({2, 3}));
    QTRY_VERIFY(future.isFinished());

    const TriggerOutcome outcome = future.result();
    QCOMPARE(outcome.kind, TriggerOutcome::Kind::Played);
    QCOMPARE(outcome.audioFileId, qint64(2));
    QCOMPARE(outcome.clipIndex, 0);
    QCOMPARE(m_output->plays.size(), 1);
    QCOMPARE(m_output->plays.at(0).key, kPad.playbackKey());
    QCOMPARE(m_output->plays.at(0).audioFileId, qint64(2));
    QCOMPARE(started.count(), 1);
    QVERIFY(m_loading->state(kPad).isIdle());
    QVERIFY(m_dispatcher->isPlaying(kPad));
}

void PlaybackDispatcherTest::feedbackPrecedesIo() {
    m_decoder->autoComplete = false;
    QSignalSpy feedback(m_dispatcher.get(), &PlaybackDispatcher::instantFeedback);

    QFuture<TriggerOutcome> future = m_dispatcher->trigger(requestFor({1}));
    QCOMPARE(feedback.count(), 1);
    QVERIFY(m_loading->state(kPad).isLoading());
    QCOMPARE(m_store->audioFetches, 1);
    QVERIFY(!future.isFinished());

    QTRY_COMPARE(m_decoder->pendingCount(), 1);
    m_decoder->complete(1);
    QTRY_VERIFY(future.isFinished());
    QCOMPARE(future.result().kind, TriggerOutcome::Kind::Played);
}

void PlaybackDispatcherTest::rapidRestartPlaysOnlyLatestSelection() {
    m_decoder->autoComplete = false;
    const TriggerRequest request = requestFor({1, 2}, ActivePadBehavior::Restart);

    QFuture<TriggerOutcome> first = m_dispatcher->trigger(request);
    QFuture<TriggerOutcome> second = m_dispatcher->trigger(request);
    QTRY_COMPARE(m_decoder->pendingCount(), 2);

    // Finish the newer decode first; the older one must not start playback afterwards.
    m_decoder->complete(2);
    QTRY_VERIFY(second.isFinished());
    m_decoder->complete(1);
    QTRY_VERIFY(first.isFinished());

    QCOMPARE(second.result().kind, TriggerOutcome::Kind::Played);
    QCOMPARE(first.result().kind, TriggerOutcome::Kind::Superseded);
    QCOMPARE(m_output->plays.size(), 1);
    QCOMPARE(m_output->plays.at(0).audioFileId, qint64(2));
    QCOMPARE(m_output->plays.at(0).clipIndex, 1);
}

void PlaybackDispatcherTest::staleCompletionIsDiscarded() {
    m_decoder->autoComplete = false;
    const TriggerRequest request = requestFor({1, 2}, ActivePadBehavior::Restart);

    QFuture<TriggerOutcome> first = m_dispatcher->trigger(request);
    QFuture<TriggerOutcome> second = m_dispatcher->trigger(request);
    QTRY_COMPARE(m_decoder->pendingCount(), 2);
    QCOMPARE(m_dispatcher->sequence(kPad), quint64(2));

    m_decoder->complete(1);
    QTRY_VERIFY(first.isFinished());
    QCOMPARE(first.result().kind, TriggerOutcome::Kind::Superseded);
    QVERIFY(m_output->plays.isEmpty());
    QVERIFY(m_loading->state(kPad).isLoading());

    m_decoder->complete(2);
    QTRY_VERIFY(second.isFinished());
    QCOMPARE(m_output->plays.size(), 1);
    QCOMPARE(m_output->plays.at(0).audioFileId, qint64(2));
}

void PlaybackDispatcherTest::continueIgnoresRetrigger() {
    QFuture<TriggerOutcome> first = m_dispatcher->trigger(requestFor({1, 2}));
    QTRY_VERIFY(first.isFinished());
    QSignalSpy feedback(m_dispatcher.get(), &PlaybackDispatcher::instantFeedback);

    QFuture<TriggerOutcome> again = m_dispatcher->trigger(requestFor({1, 2}));
    QVERIFY(again.isFinished());
    QCOMPARE(again.result().kind, TriggerOutcome::Kind::Ignored);
    QCOMPARE(feedback.count(), 1);
    QCOMPARE(m_output->plays.size(), 1);
    QVERIFY(m_output->stops.isEmpty());
    // The ignored press does not advance the playlist.
    QCOMPARE(m_dispatcher->strategyState(kPad).cursor, 1);
}

void PlaybackDispatcherTest::stopBehaviorStopsPlayingPad() {
    const TriggerRequest request = requestFor({1}, ActivePadBehavior::Stop);
    QFuture<TriggerOutcome> first = m_dispatcher->trigger(request);
    QTRY_VERIFY(first.isFinished());
    QVERIFY(m_dispatcher->isPlaying(kPad));

    QFuture<TriggerOutcome> again = m_dispatcher->trigger(request);
    QVERIFY(again.isFinished());
    QCOMPARE(again.result().kind, TriggerOutcome::Kind::Stopped);
    QCOMPARE(m_output->stops, QStringList{kPad.playbackKey()});
    QVERIFY(!m_dispatcher->isPlaying(kPad));
    QCOMPARE(m_output->plays.size(), 1);
}

void PlaybackDispatcherTest::restartBehaviorReplacesPlayback() {
    const TriggerRequest request = requestFor({1, 2}, ActivePadBehavior::Restart);
    QFuture<TriggerOutcome> first = m_dispatcher->trigger(request);
    QTRY_VERIFY(first.isFinished());

    QFuture<TriggerOutcome> again = m_dispatcher->trigger(request);
    QCOMPARE(m_output->stops.size(), 1);
    QTRY_VERIFY(again.isFinished());
    QCOMPARE(again.result().kind, TriggerOutcome::Kind::Played);
    QCOMPARE(m_output->plays.size(), 2);
    QCOMPARE(m_output->plays.at(1).audioFileId, qint64(2));
}

void PlaybackDispatcherTest::emptyPlaylistIsSilent() {
    QSignalSpy feedback(m_dispatcher.get(), &PlaybackDispatcher::instantFeedback);
    QFuture<TriggerOutcome> future = m_dispatcher->trigger(requestFor({}));
    QVERIFY(future.isFinished());
    QCOMPARE(future.result().kind, TriggerOutcome::Kind::Failed);
    QCOMPARE(future.result().error, EngineError::EmptyPlaylist);
    QCOMPARE(feedback.count(), 0);
    QCOMPARE(m_store->audioFetches, 0);
    QVERIFY(m_loading->state(kPad).isIdle());
}

void PlaybackDispatcherTest::noActiveProfile() {
    TriggerRequest request = requestFor({1});
    request.address.profileId = -1;
    QSignalSpy feedback(m_dispatcher.get(), &PlaybackDispatcher::instantFeedback);
    QFuture<TriggerOutcome> future = m_dispatcher->trigger(request);
    QVERIFY(future.isFinished());
    QCOMPARE(future.result().error, EngineError::NoActiveProfile);
    QCOMPARE(feedback.count(), 0);
}

void PlaybackDispatcherTest::decodeFailureReportsError() {
    m_decoder->failingIds.insert(1);
    QSignalSpy errors(m_dispatcher.get(), &PlaybackDispatcher::errorOccurred);
    QSignalSpy states(m_loading.get(), &LoadingStateTracker::stateChanged);

    QFuture<TriggerOutcome> future = m_dispatcher->trigger(requestFor({1}));
    QTRY_VERIFY(future.isFinished());

    QCOMPARE(future.result().kind, TriggerOutcome::Kind::Failed);
    QCOMPARE(future.result().error, EngineError::DecodeFailed);
    QCOMPARE(errors.count(), 1);
    QCOMPARE(errors.first().at(1).value<EngineError>(), EngineError::DecodeFailed);
    QVERIFY(m_output->plays.isEmpty());
    QVERIFY(m_loading->state(kPad).isIdle());

    bool sawError = false;
    for (const QList<QVariant> &args : states) {
        sawError = sawError || args.at(1).value<LoadingState>().status == LoadingState::Status::Error;
    }
    QVERIFY(sawError);
}

void PlaybackDispatcherTest::stopAllInvalidatesPendingTriggers() {
    m_decoder->autoComplete = false;
    QFuture<TriggerOutcome> future = m_dispatcher->trigger(requestFor({1}));
    QTRY_COMPARE(m_decoder->pendingCount(), 1);

    m_dispatcher->stopAll();
    QCOMPARE(m_output->stopAllCalls, 1);
    QVERIFY(m_loading->state(kPad).isIdle());

    m_decoder->complete(1);
    QTRY_VERIFY(future.isFinished());
    QCOMPARE(future.result().kind, TriggerOutcome::Kind::Superseded);
    QVERIFY(m_output->plays.isEmpty());
}

void PlaybackDispatcherTest::fadeOutInvalidatesPendingTrigger() {
    m_decoder->autoComplete = false;
    QFuture<TriggerOutcome> future = m_dispatcher->trigger(requestFor({1}));
    QTRY_COMPARE(m_decoder->pendingCount(), 1);

    m_dispatcher->fadeOut(kPad, 2.0);
    QCOMPARE(m_output->fades, QStringList{kPad.playbackKey()});

    m_decoder->complete(1);
    QTRY_VERIFY(future.isFinished());
    QCOMPARE(future.result().kind, TriggerOutcome::Kind::Superseded);
    QVERIFY(m_output->plays.isEmpty());
}

void PlaybackDispatcherTest::strategyResetsWhenKindChanges() {
    QFuture<TriggerOutcome> first = m_dispatcher->trigger(requestFor({1, 2, 3}));
    QTRY_VERIFY(first.isFinished());
    QCOMPARE(m_dispatcher->strategyState(kPad).kind, PlaybackType::Sequential);
    m_output->playing.clear();

    QFuture<TriggerOutcome> second = m_dispatcher->trigger(
        requestFor({1, 2, 3}, ActivePadBehavior::Continue, PlaybackType::RoundRobin));
    QTRY_VERIFY(second.isFinished());
    const StrategyState state = m_dispatcher->strategyState(kPad);
    QCOMPARE(state.kind, PlaybackType::RoundRobin);
    QCOMPARE(state.pool.size(), 2);

    m_dispatcher->forgetPad(kPad);
    QCOMPARE(m_dispatcher->strategyState(kPad).pool.size(), 0);
}

void PlaybackDispatcherTest::sequentialAdvancesPerPad() {
    QVector<qint64> played;
    for (int i = 0; i < 4; ++i) {
        QFuture<TriggerOutcome> future = m_dispatcher->trigger(requestFor({1, 2, 3}));
        QTRY_VERIFY(future.isFinished());
        played << future.result().audioFileId;
        m_output->playing.clear();
    }
    QCOMPARE(played, (QVector<qint64>{1, 2, 3, 1}));
}

void PlaybackDispatcherTest::roundRobinPlaysEachClipOncePerCycle() {
    const TriggerRequest request =
        requestFor({1, 2, 3}, ActivePadBehavior::Continue, PlaybackType::RoundRobin);
    auto playSix = [this, &request]() {
        QVector<qint64> played;
        for (int i = 0; i < 6; ++i) {
            QFuture<TriggerOutcome> future = m_dispatcher->trigger(request);
            if (!QTest::qWaitFor([&future]() { return future.isFinished(); }, 5000)) {
                return QVector<qint64>();
            }
            played << future.result().audioFileId;
            m_output->playing.clear();
        }
        return played;
    };

    QRandomGenerator seeded(20240611);
    m_dispatcher->setRandomGenerator(&seeded);
    const QVector<qint64> played = playSix();
    QCOMPARE(played.size(), 6);
    const QSet<qint64> all{1, 2, 3};
    QCOMPARE(QSet<qint64>(played.cbegin(), played.cbegin() + 3), all);
    QCOMPARE(QSet<qint64>(played.cbegin() + 3, played.cend()), all);

    // The same seed on a fresh pad state replays the same order.
    m_dispatcher->forgetPad(kPad);
    QRandomGenerator reseeded(20240611);
    m_dispatcher->setRandomGenerator(&reseeded);
    QCOMPARE(playSix(), played);
    m_dispatcher->setRandomGenerator(nullptr);
}

QTEST_GUILESS_MAIN(PlaybackDispatcherTest)
#include "test_playback_dispatcher.moc"
