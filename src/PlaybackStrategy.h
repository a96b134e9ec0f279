#pragma once

#include <QVector>

#include "EngineError.h"
#include "PadTypes.h"

class QRandomGenerator;

// Per-pad strategy state. Owned by the caller and replaced by the value
// returned from selectNext().
struct StrategyState {
    PlaybackType kind = PlaybackType::RoundRobin;
    int cursor = 0;
    QVector<int> pool;
    int lastIndex = -1;
};

struct Selection {
    qint64 clipId = 0;
    int index = -1;
    StrategyState state;
    EngineError error = EngineError::None;

    bool ok() const { return error == EngineError::None; }
};

// Picks the next clip of clipIds. Fails only with EmptyPlaylist.
// rng defaults to QRandomGenerator::global().
Selection selectNext(const QVector<qint64> &clipIds, const StrategyState &state,
                     QRandomGenerator *rng = nullptr);

StrategyState initialStrategyState(PlaybackType kind);
