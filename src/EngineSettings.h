#pragma once

#include <QString>

#include "KeyBindingResolver.h"
#include "PadTypes.h"

struct EngineSettings {
    QString storeDirectory;
    QString alsaDevice;
    QString ffmpegPath;
    int sampleRate = 48000;
    int channels = 2;
    int periodFrames = 256;
    int debounceMs = 100;
    GridLayout grid;
    ActivePadBehavior activePadBehavior = ActivePadBehavior::Continue;
    double fadeOutSeconds = 3.0;
    int cacheMegabytes = 512;
    int profileId = 1;

    qint64 cacheByteBudget() const { return static_cast<qint64>(cacheMegabytes) * 1024 * 1024; }
    QString journalPath() const;

    // Defaults overridden by SOUNDBOARD_* environment variables.
    static EngineSettings fromEnvironment();
};
