#include "LoadingStateTracker.h"

#include <QtGlobal>

LoadingState LoadingState::loading(float progress) {
    LoadingState state;
    state.status = Status::Loading;
    state.progress = qBound(0.0f, progress, 1.0f);
    return state;
}

LoadingState LoadingState::ready() {
    LoadingState state;
    state.status = Status::Ready;
    state.progress = 1.0f;
    return state;
}

LoadingState LoadingState::error(const QString &message) {
    LoadingState state;
    state.status = Status::Error;
    state.message = message;
    return state;
}

bool operator==(const LoadingState &a, const LoadingState &b) {
    return a.status == b.status && qFuzzyCompare(1.0f + a.progress, 1.0f + b.progress) &&
           a.message == b.message;
}

LoadingStateTracker::LoadingStateTracker(QObject *parent) : QObject(parent) {}

LoadingState LoadingStateTracker::state(const PadAddress &address) const {
    return m_states.value(address);
}

void LoadingStateTracker::setState(const PadAddress &address, const LoadingState &state) {
    if (state.isIdle()) {
        clear(address);
        return;
    }
    const auto it = m_states.constFind(address);
    if (it != m_states.cend() && *it == state) {
        return;
    }
    m_states.insert(address, state);
    emit stateChanged(address, state);
}

void LoadingStateTracker::clear(const PadAddress &address) {
    if (m_states.remove(address) > 0) {
        emit stateChanged(address, LoadingState::idle());
    }
}

void LoadingStateTracker::clearAll() {
    const QList<PadAddress> addresses = m_states.keys();
    m_states.clear();
    for (const PadAddress &address : addresses) {
        emit stateChanged(address, LoadingState::idle());
    }
}
