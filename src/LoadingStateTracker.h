#pragma once

#include <QHash>
#include <QMetaType>
#include <QObject>
#include <QString>

#include "PadTypes.h"

struct LoadingState {
    enum class Status {
        Idle,
        Loading,
        Ready,
        Error
    };

    Status status = Status::Idle;
    float progress = 0.0f;
    QString message;

    static LoadingState idle() { return LoadingState(); }
    static LoadingState loading(float progress);
    static LoadingState ready();
    static LoadingState error(const QString &message);

    bool isIdle() const { return status == Status::Idle; }
    bool isLoading() const { return status == Status::Loading; }
};

bool operator==(const LoadingState &a, const LoadingState &b);
inline bool operator!=(const LoadingState &a, const LoadingState &b) {
    return !(a == b);
}

Q_DECLARE_METATYPE(LoadingState)

// Current loading state per pad. Holds no behavior of its own; the dispatcher
// drives every transition.
class LoadingStateTracker : public QObject {
    Q_OBJECT
public:
    explicit LoadingStateTracker(QObject *parent = nullptr);

    LoadingState state(const PadAddress &address) const;
    void setState(const PadAddress &address, const LoadingState &state);
    void clear(const PadAddress &address);
    void clearAll();
    int activeCount() const { return m_states.size(); }

signals:
    void stateChanged(const PadAddress &address, const LoadingState &state);

private:
    QHash<PadAddress, LoadingState> m_states;
};
