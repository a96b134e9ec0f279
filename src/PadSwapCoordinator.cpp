#include "PadSwapCoordinator.h"

#include <QDebug>
#include <QPromise>
#include <utility>

#include "FutureUtils.h"
#include "PadStore.h"
#include "SwapJournal.h"

struct PadSwapCoordinator::Job {
    QPromise<SwapOutcome> promise;
    PadAddress from;
    PadAddress to;
    std::optional<PadConfiguration> fromSnapshot;
    std::optional<PadConfiguration> toSnapshot;
    QVector<PadConfiguration> writes;
    int nextWrite = 0;
    StoreStatus failedStatus = StoreStatus::Ok;
    QString failure;
    bool recovery = false;
};

namespace {
SwapOutcome makeOutcome(SwapOutcome::Status status, EngineError error = EngineError::None,
                        const QString &message = QString()) {
    SwapOutcome outcome;
    outcome.status = status;
    outcome.error = error;
    outcome.message = message;
    return outcome;
}

// The slot at address carrying snapshot's clips, strategy, name and binding.
PadConfiguration contentAt(const PadAddress &address,
                           const std::optional<PadConfiguration> &snapshot) {
    PadConfiguration config = PadConfiguration::cleared(address);
    if (snapshot) {
        config.audioFileIds = snapshot->audioFileIds;
        config.playbackType = snapshot->playbackType;
        config.name = snapshot->name;
        config.keyBinding = snapshot->keyBinding;
    }
    return config;
}

bool holdsClips(const std::optional<PadConfiguration> &snapshot) {
    return snapshot && snapshot->hasClips();
}

// Store writes of a swap, in order. Clearing both slots first keeps the
// (profile, page, pad) index free of transient duplicates.
QVector<PadConfiguration> planWrites(const PadAddress &from, const PadAddress &to,
                                     const std::optional<PadConfiguration> &fromSnapshot,
                                     const std::optional<PadConfiguration> &toSnapshot) {
    QVector<PadConfiguration> writes;
    writes.push_back(PadConfiguration::cleared(from));
    if (toSnapshot) {
        writes.push_back(PadConfiguration::cleared(to));
    }
    writes.push_back(contentAt(to, fromSnapshot));
    if (toSnapshot) {
        writes.push_back(contentAt(from, toSnapshot));
    }
    return writes;
}
}  // namespace

PadSwapCoordinator::PadSwapCoordinator(PadStore *store, const GridLayout &grid,
                                       SwapJournal *journal, QObject *parent)
    : QObject(parent), m_store(store), m_grid(grid), m_journal(journal) {}

QFuture<SwapOutcome> PadSwapCoordinator::swap(int profileId, int pageIndex, int fromPad,
                                              int toPad) {
    if (profileId < 0) {
        return makeReadyFuture(makeOutcome(SwapOutcome::Status::Failed,
                                           EngineError::NoActiveProfile, "No active profile"));
    }
    if (m_busy) {
        return makeReadyFuture(
            makeOutcome(SwapOutcome::Status::Refused, EngineError::None, "A swap is already running"));
    }
    if (!m_grid.contains(fromPad) || !m_grid.contains(toPad)) {
        return makeReadyFuture(
            makeOutcome(SwapOutcome::Status::Refused, EngineError::None, "Pad outside the grid"));
    }
    if (m_grid.isControlPad(fromPad) || m_grid.isControlPad(toPad)) {
        return makeReadyFuture(makeOutcome(SwapOutcome::Status::Refused, EngineError::None,
                                           "Control pads cannot be moved"));
    }
    if (fromPad == toPad) {
        return makeReadyFuture(makeOutcome(SwapOutcome::Status::NoOp));
    }

    m_busy = true;
    auto job = std::make_shared<Job>();
    job->from = PadAddress{profileId, pageIndex, fromPad};
    job->to = PadAddress{profileId, pageIndex, toPad};
    QFuture<SwapOutcome> future = job->promise.future();
    job->promise.start();
    snapshotPads(job);
    return future;
}

void PadSwapCoordinator::snapshotPads(const std::shared_ptr<Job> &job) {
    onFinished(m_store->padConfiguration(job->from), this,
               [this, job](const StoreReply<std::optional<PadConfiguration>> &fromReply) {
                   if (!fromReply.ok()) {
                       finish(job, makeOutcome(SwapOutcome::Status::Failed,
                                               engineErrorForStatus(fromReply.status),
                                               fromReply.message));
                       return;
                   }
                   job->fromSnapshot = fromReply.value;
                   onFinished(m_store->padConfiguration(job->to), this,
                              [this, job](const StoreReply<std::optional<PadConfiguration>> &toReply) {
                                  if (!toReply.ok()) {
                                      finish(job, makeOutcome(SwapOutcome::Status::Failed,
                                                              engineErrorForStatus(toReply.status),
                                                              toReply.message));
                                      return;
                                  }
                                  job->toSnapshot = toReply.value;
                                  begin(job);
                              });
               });
}

void PadSwapCoordinator::begin(const std::shared_ptr<Job> &job) {
    if (!holdsClips(job->fromSnapshot)) {
        if (!holdsClips(job->toSnapshot)) {
            finish(job, makeOutcome(SwapOutcome::Status::NoOp));
            return;
        }
        // An empty source swaps roles instead of doing nothing, so a repeated swap restores the layout.
        std::swap(job->from, job->to);
        std::swap(job->fromSnapshot, job->toSnapshot);
    }

    job->writes = planWrites(job->from, job->to, job->fromSnapshot, job->toSnapshot);

    if (m_journal) {
        SwapJournal::Record record;
        record.from = job->from;
        record.to = job->to;
        record.fromSnapshot = job->fromSnapshot;
        record.toSnapshot = job->toSnapshot;
        QString error;
        if (!m_journal->write(record, &error)) {
            finish(job, makeOutcome(SwapOutcome::Status::Failed, EngineError::StorageFailed,
                                    QString("Cannot write swap journal: %1").arg(error)));
            return;
        }
    }
    runStep(job);
}

void PadSwapCoordinator::runStep(const std::shared_ptr<Job> &job) {
    if (job->nextWrite >= job->writes.size()) {
        if (m_journal && !m_journal->remove()) {
            qWarning() << "[Swap] could not remove journal" << m_journal->path();
        }
        qInfo() << "[Swap] pads" << job->from.padIndex << "and" << job->to.padIndex << "swapped";
        finish(job, makeOutcome(SwapOutcome::Status::Swapped));
        return;
    }

    const PadConfiguration config = job->writes.at(job->nextWrite);
    onFinished(m_store->upsertPadConfiguration(config), this,
               [this, job](const StoreReply<PadConfiguration> &reply) {
                   if (!reply.ok()) {
                       job->failedStatus = reply.status;
                       job->failure = reply.message;
                       qWarning() << "[Swap] write" << job->nextWrite + 1 << "of"
                                  << job->writes.size() << "failed:" << reply.message;
                       if (job->nextWrite == 0) {
                           if (m_journal && !m_journal->remove()) {
                               qWarning() << "[Swap] could not remove journal"
                                          << m_journal->path();
                           }
                           finish(job, makeOutcome(SwapOutcome::Status::Failed,
                                                   engineErrorForStatus(reply.status),
                                                   reply.message));
                       } else {
                           rollBack(job);
                       }
                       return;
                   }
                   ++job->nextWrite;
                   if (m_journal) {
                       SwapJournal::Record record;
                       record.from = job->from;
                       record.to = job->to;
                       record.fromSnapshot = job->fromSnapshot;
                       record.toSnapshot = job->toSnapshot;
                       record.completedSteps = job->nextWrite;
                       QString error;
                       if (!m_journal->write(record, &error)) {
                           qWarning() << "[Swap] journal update failed:" << error;
                       }
                   }
                   runStep(job);
               });
}

void PadSwapCoordinator::rollBack(const std::shared_ptr<Job> &job) {
    qWarning() << "[Swap] rolling back pads" << job->from.padIndex << "and" << job->to.padIndex;
    runRestore(job, 0);
}

void PadSwapCoordinator::runRestore(const std::shared_ptr<Job> &job, int index) {
    if (index >= 2) {
        if (m_journal && !m_journal->remove()) {
            qWarning() << "[Swap] could not remove journal" << m_journal->path();
        }
        if (job->recovery) {
            qInfo() << "[Swap] recovered interrupted swap of pads" << job->from.padIndex << "and"
                    << job->to.padIndex;
            finish(job, makeOutcome(SwapOutcome::Status::Recovered));
            return;
        }
        SwapOutcome outcome = makeOutcome(SwapOutcome::Status::Failed,
                                          engineErrorForStatus(job->failedStatus), job->failure);
        outcome.rolledBack = true;
        finish(job, outcome);
        return;
    }

    const PadAddress address = index == 0 ? job->from : job->to;
    const std::optional<PadConfiguration> &snapshot = index == 0 ? job->fromSnapshot : job->toSnapshot;
    auto next = [this, job, index](bool ok, const QString &message) {
        if (ok) {
            runRestore(job, index + 1);
            return;
        }
        const QString text = QString("Swap of pads %1 and %2 left incomplete: %3")
                                 .arg(job->from.padIndex)
                                 .arg(job->to.padIndex)
                                 .arg(message);
        qWarning() << "[Swap]" << text;
        finish(job, makeOutcome(SwapOutcome::Status::Failed, EngineError::SwapIncomplete, text));
    };

    if (snapshot) {
        onFinished(m_store->upsertPadConfiguration(contentAt(address, snapshot)), this,
                   [next](const StoreReply<PadConfiguration> &reply) {
                       next(reply.ok(), reply.message);
                   });
    } else {
        onFinished(m_store->deletePadConfiguration(address), this,
                   [next](const StoreResult &result) { next(result.ok(), result.message); });
    }
}

QFuture<SwapOutcome> PadSwapCoordinator::recoverPendingSwap() {
    if (!m_journal || !m_journal->exists()) {
        return makeReadyFuture(makeOutcome(SwapOutcome::Status::NoOp));
    }
    if (m_busy) {
        return makeReadyFuture(
            makeOutcome(SwapOutcome::Status::Refused, EngineError::None, "A swap is already running"));
    }
    QString error;
    const std::optional<SwapJournal::Record> record = m_journal->read(&error);
    if (!record) {
        return makeReadyFuture(makeOutcome(SwapOutcome::Status::Failed, EngineError::StorageFailed,
                                           error));
    }

    const int planned =
        planWrites(record->from, record->to, record->fromSnapshot, record->toSnapshot).size();
    if (record->completedSteps >= planned) {
        // Every write landed; only the journal removal was lost.
        qInfo() << "[Swap] interrupted swap of pads" << record->from.padIndex << "and"
                << record->to.padIndex << "had completed";
        if (!m_journal->remove()) {
            return makeReadyFuture(makeOutcome(SwapOutcome::Status::Failed,
                                               EngineError::StorageFailed,
                                               QString("Cannot remove swap journal %1")
                                                   .arg(m_journal->path())));
        }
        SwapOutcome outcome = makeOutcome(SwapOutcome::Status::Recovered);
        outcome.affectedPads = {record->from.padIndex, record->to.padIndex};
        return makeReadyFuture(outcome);
    }

    m_busy = true;
    auto job = std::make_shared<Job>();
    job->recovery = true;
    job->from = record->from;
    job->to = record->to;
    job->fromSnapshot = record->fromSnapshot;
    job->toSnapshot = record->toSnapshot;
    QFuture<SwapOutcome> future = job->promise.future();
    job->promise.start();
    qWarning() << "[Swap] found interrupted swap after step" << record->completedSteps;
    runRestore(job, 0);
    return future;
}

void PadSwapCoordinator::finish(const std::shared_ptr<Job> &job, SwapOutcome outcome) {
    m_busy = false;
    if (outcome.affectedPads.isEmpty()) {
        outcome.affectedPads = {job->from.padIndex, job->to.padIndex};
    }
    job->promise.addResult(outcome);
    job->promise.finish();
    emit swapFinished(outcome);
}
