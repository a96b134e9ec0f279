#pragma once

#include <QFuture>
#include <QObject>
#include <QString>
#include <QVector>
#include <memory>
#include <optional>

#include "EngineError.h"
#include "KeyBindingResolver.h"
#include "PadTypes.h"

class PadStore;
class SwapJournal;

struct SwapOutcome {
    enum class Status {
        Swapped,
        NoOp,
        Refused,
        Failed,
        Recovered
    };

    Status status = Status::Failed;
    EngineError error = EngineError::None;
    QString message;
    bool rolledBack = false;
    QVector<int> affectedPads;

    bool ok() const { return status == Status::Swapped || status == Status::NoOp; }
};

// Exchanges the contents of two pads on one page. The store forbids two rows
// for one slot, so both pads are cleared before either is rewritten. A failure
// after the first write is rolled back from the snapshots; if that fails too
// the journal stays behind for recoverPendingSwap().
class PadSwapCoordinator : public QObject {
    Q_OBJECT
public:
    PadSwapCoordinator(PadStore *store, const GridLayout &grid, SwapJournal *journal = nullptr,
                       QObject *parent = nullptr);

    void setGrid(const GridLayout &grid) { m_grid = grid; }
    bool isBusy() const { return m_busy; }

    QFuture<SwapOutcome> swap(int profileId, int pageIndex, int fromPad, int toPad);
    // Restores the pads named by a leftover journal to their pre-swap contents.
    QFuture<SwapOutcome> recoverPendingSwap();

signals:
    void swapFinished(const SwapOutcome &outcome);

private:
    struct Job;

    void snapshotPads(const std::shared_ptr<Job> &job);
    void begin(const std::shared_ptr<Job> &job);
    void runStep(const std::shared_ptr<Job> &job);
    void rollBack(const std::shared_ptr<Job> &job);
    void runRestore(const std::shared_ptr<Job> &job, int index);
    void finish(const std::shared_ptr<Job> &job, SwapOutcome outcome);

    PadStore *m_store = nullptr;
    GridLayout m_grid;
    SwapJournal *m_journal = nullptr;
    bool m_busy = false;
};

Q_DECLARE_METATYPE(SwapOutcome)
