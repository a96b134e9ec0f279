#pragma once

#include <QFuture>
#include <QString>
#include <QVector>
#include <optional>

#include "EngineError.h"
#include "PadTypes.h"

enum class StoreStatus {
    Ok,
    NotFound,
    ConstraintViolation,
    Failed
};

struct StoreResult {
    StoreStatus status = StoreStatus::Ok;
    QString message;

    bool ok() const { return status == StoreStatus::Ok; }
};

template <typename T>
struct StoreReply {
    StoreStatus status = StoreStatus::Ok;
    QString message;
    T value{};

    bool ok() const { return status == StoreStatus::Ok; }
    StoreResult result() const { return StoreResult{status, message}; }
};

// Maps a failed store status onto the engine's error taxonomy.
EngineError engineErrorForStatus(StoreStatus status);

// Persistent pad configuration storage. At most one configuration exists per
// (profile, page, pad); a write that would create a second one is rejected
// with ConstraintViolation.
class PadStore {
public:
    virtual ~PadStore() = default;

    // Ok with an empty optional when the slot holds no configuration.
    virtual QFuture<StoreReply<std::optional<PadConfiguration>>> padConfiguration(
        const PadAddress &address) = 0;
    virtual QFuture<StoreReply<QVector<PadConfiguration>>> padConfigurations(int profileId,
                                                                            int pageIndex) = 0;
    // id == 0 writes the slot named by the configuration's address, inserting
    // when empty. A non-zero id updates that row, possibly moving it.
    virtual QFuture<StoreReply<PadConfiguration>> upsertPadConfiguration(
        const PadConfiguration &config) = 0;
    virtual QFuture<StoreResult> deletePadConfiguration(const PadAddress &address) = 0;
    virtual QFuture<StoreReply<AudioFile>> audioFile(qint64 id) = 0;
};
