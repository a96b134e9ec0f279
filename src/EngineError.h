#pragma once

#include <QMetaType>
#include <QString>

enum class EngineError {
    None,
    EmptyPlaylist,
    DecodeFailed,
    NoActiveProfile,
    InvalidKeyBinding,
    SwapIncomplete,
    ConstraintViolation,
    StorageFailed
};

QString engineErrorName(EngineError error);

Q_DECLARE_METATYPE(EngineError)
