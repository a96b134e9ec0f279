#include "EngineSettings.h"

#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

namespace {
int envInt(const char *name, int fallback, int lo, int hi) {
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    return ok ? qBound(lo, value, hi) : fallback;
}

double envDouble(const char *name, double fallback, double lo, double hi) {
    bool ok = false;
    const double value = qEnvironmentVariable(name).toDouble(&ok);
    return ok ? qBound(lo, value, hi) : fallback;
}
}  // namespace

QString EngineSettings::journalPath() const {
    if (storeDirectory.isEmpty()) {
        return QString();
    }
    return QDir(storeDirectory).filePath("swap-journal.json");
}

EngineSettings EngineSettings::fromEnvironment() {
    EngineSettings settings;
    settings.storeDirectory = qEnvironmentVariable("SOUNDBOARD_STORE_DIR");
    if (settings.storeDirectory.isEmpty()) {
        settings.storeDirectory = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    }
    settings.alsaDevice = qEnvironmentVariable("SOUNDBOARD_ALSA_DEVICE");
    settings.ffmpegPath = qEnvironmentVariable("SOUNDBOARD_FFMPEG");
    settings.sampleRate = envInt("SOUNDBOARD_SAMPLE_RATE", settings.sampleRate, 8000, 192000);
    settings.periodFrames = envInt("SOUNDBOARD_PERIOD_FRAMES", settings.periodFrames, 64, 2048);
    settings.debounceMs = envInt("SOUNDBOARD_DEBOUNCE_MS", settings.debounceMs, 0, 2000);
    settings.grid.rows = envInt("SOUNDBOARD_GRID_ROWS", settings.grid.rows, 1, 16);
    settings.grid.columns = envInt("SOUNDBOARD_GRID_COLUMNS", settings.grid.columns, 1, 32);
    settings.activePadBehavior = activePadBehaviorFromName(
        qEnvironmentVariable("SOUNDBOARD_ACTIVE_PAD_BEHAVIOR"), settings.activePadBehavior);
    settings.fadeOutSeconds = envDouble("SOUNDBOARD_FADE_SECONDS", settings.fadeOutSeconds, 0.0, 60.0);
    settings.cacheMegabytes = envInt("SOUNDBOARD_CACHE_MB", settings.cacheMegabytes, 0, 65536);
    settings.profileId = envInt("SOUNDBOARD_PROFILE", settings.profileId, 0, 1 << 30);
    return settings;
}
