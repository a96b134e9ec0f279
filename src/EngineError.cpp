#include "EngineError.h"

QString engineErrorName(EngineError error) {
    switch (error) {
        case EngineError::None:
            return "None";
        case EngineError::EmptyPlaylist:
            return "EmptyPlaylist";
        case EngineError::DecodeFailed:
            return "DecodeFailed";
        case EngineError::NoActiveProfile:
            return "NoActiveProfile";
        case EngineError::InvalidKeyBinding:
            return "InvalidKeyBinding";
        case EngineError::SwapIncomplete:
            return "SwapIncomplete";
        case EngineError::ConstraintViolation:
            return "ConstraintViolation";
        case EngineError::StorageFailed:
            return "StorageFailed";
    }
    return "Unknown";
}
