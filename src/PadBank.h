#pragma once

#include <QFuture>
#include <QHash>
#include <QObject>
#include <QString>
#include <QVector>

#include "EngineError.h"
#include "EngineSettings.h"
#include "KeyBindingResolver.h"
#include "LoadingStateTracker.h"
#include "PadSwapCoordinator.h"
#include "PadTypes.h"
#include "PlaybackDispatcher.h"
#include "SwapJournal.h"

class ArmedTrackRegistry;
class AudioBufferCache;
class AudioDecoder;
class AudioOutput;
class PadStore;

struct PadEditResult {
    EngineError error = EngineError::None;
    QString message;

    bool ok() const { return error == EngineError::None; }
};

Q_DECLARE_METATYPE(PadEditResult)

// Session facade over the pad engine: keeps the active profile and page, a
// read-through view of the page's pad configurations, and routes clicks, key
// presses and edits to the engine components.
class PadBank : public QObject {
    Q_OBJECT
public:
    PadBank(PadStore *store, AudioDecoder *decoder, AudioOutput *output,
            const EngineSettings &settings = EngineSettings(), QObject *parent = nullptr);
    ~PadBank() override;

    const EngineSettings &settings() const { return m_settings; }
    const GridLayout &grid() const { return m_settings.grid; }
    int padCount() const { return m_settings.grid.padCount(); }

    int activeProfile() const { return m_profileId; }
    void setActiveProfile(int profileId);
    int currentPage() const { return m_pageIndex; }
    void setCurrentPage(int pageIndex);
    void reloadPage();
    bool isPageLoaded() const { return m_pageLoaded; }

    PadAddress addressOf(int padIndex) const;
    PadConfiguration pad(int padIndex) const;
    QString padName(int padIndex) const;
    QString keyHint(int padIndex) const;
    bool isControlPad(int padIndex) const { return m_settings.grid.isControlPad(padIndex); }

    QFuture<TriggerOutcome> triggerPad(int padIndex);
    // True when the press was consumed.
    bool handleKeyPress(const KeyPress &press);
    void stopPad(int padIndex);
    void stopAll();
    void fadeOutAll();
    bool isPlaying(int padIndex) const;
    PlaybackProgress playbackProgress(int padIndex) const;
    LoadingState loadingState(int padIndex) const;

    bool armPad(int padIndex);
    bool disarmPad(int padIndex);
    void toggleArmed(int padIndex);
    bool isArmed(int padIndex) const;
    QFuture<TriggerOutcome> playNextArmed();

    QFuture<SwapOutcome> swapPads(int fromPad, int toPad);
    QFuture<PadEditResult> savePad(const PadConfiguration &config);
    QFuture<PadEditResult> appendClips(int padIndex, const QVector<qint64> &audioFileIds);
    QFuture<PadEditResult> clearPad(int padIndex);
    QFuture<SwapOutcome> recoverPendingSwap();

    AudioBufferCache *cache() const { return m_cache; }
    LoadingStateTracker *loadingTracker() const { return m_loading; }
    PlaybackDispatcher *dispatcher() const { return m_dispatcher; }
    ArmedTrackRegistry *armedTracks() const { return m_armed; }
    KeyDebouncer &debouncer() { return m_debouncer; }

signals:
    void profileChanged(int profileId);
    void pageChanged(int pageIndex);
    void padsChanged();
    void instantFeedback(int padIndex);
    void padStateChanged(int padIndex);
    void armedChanged();
    void errorOccurred(EngineError error, const QString &message);

private:
    TriggerRequest requestFor(int padIndex) const;
    bool isOnCurrentPage(const PadAddress &address) const;
    void storePadLocally(const PadConfiguration &config);
    QFuture<PadEditResult> writePad(const PadConfiguration &config);

    PadStore *m_store = nullptr;
    EngineSettings m_settings;

    AudioBufferCache *m_cache = nullptr;
    LoadingStateTracker *m_loading = nullptr;
    PlaybackDispatcher *m_dispatcher = nullptr;
    ArmedTrackRegistry *m_armed = nullptr;
    PadSwapCoordinator *m_swapper = nullptr;
    SwapJournal m_journal;
    KeyBindingResolver m_resolver;
    KeyDebouncer m_debouncer;

    int m_profileId = -1;
    int m_pageIndex = 0;
    int m_pageSerial = 0;
    bool m_pageLoaded = false;
    QHash<int, PadConfiguration> m_pads;
    QVector<KeyBinding> m_bindings;
};
