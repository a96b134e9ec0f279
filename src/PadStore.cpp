#include "PadStore.h"

EngineError engineErrorForStatus(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok:
            return EngineError::None;
        case StoreStatus::ConstraintViolation:
            return EngineError::ConstraintViolation;
        case StoreStatus::NotFound:
        case StoreStatus::Failed:
            return EngineError::StorageFailed;
    }
    return EngineError::StorageFailed;
}
