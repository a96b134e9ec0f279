#include "PlaybackStrategy.h"

#include <QRandomGenerator>
#include <algorithm>

namespace {
QVector<int> fullPool(int count) {
    QVector<int> pool;
    pool.reserve(count);
    for (int i = 0; i < count; ++i) {
        pool.push_back(i);
    }
    return pool;
}

bool poolFits(const QVector<int> &pool, int count) {
    return std::all_of(pool.cbegin(), pool.cend(),
                       [count](int index) { return index >= 0 && index < count; });
}
}  // namespace

StrategyState initialStrategyState(PlaybackType kind) {
    StrategyState state;
    state.kind = kind;
    return state;
}

Selection selectNext(const QVector<qint64> &clipIds, const StrategyState &state,
                     QRandomGenerator *rng) {
    Selection selection;
    selection.state = state;
    const int count = clipIds.size();
    if (count == 0) {
        selection.error = EngineError::EmptyPlaylist;
        return selection;
    }
    if (!rng) {
        rng = QRandomGenerator::global();
    }

    StrategyState &next = selection.state;
    int index = 0;
    switch (state.kind) {
        case PlaybackType::Sequential: {
            index = state.cursor >= 0 ? state.cursor % count : 0;
            next.cursor = (index + 1) % count;
            break;
        }
        case PlaybackType::RoundRobin: {
            if (next.pool.isEmpty() || !poolFits(next.pool, count)) {
                next.pool = fullPool(count);
            }
            const int slot = static_cast<int>(rng->bounded(next.pool.size()));
            index = next.pool.at(slot);
            next.pool.remove(slot);
            break;
        }
        case PlaybackType::Random: {
            if (count > 1 && state.lastIndex >= 0 && state.lastIndex < count) {
                // Pick among the other clips so the same one never plays twice in a row.
                index = static_cast<int>(rng->bounded(count - 1));
                if (index >= state.lastIndex) {
                    ++index;
                }
            } else {
                index = static_cast<int>(rng->bounded(count));
            }
            break;
        }
    }

    next.lastIndex = index;
    selection.index = index;
    selection.clipId = clipIds.at(index);
    return selection;
}
