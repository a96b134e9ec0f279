#pragma once

#include <QElapsedTimer>
#include <QHash>
#include <QString>
#include <QVector>

#include "EngineError.h"
#include "PadTypes.h"

class QKeyEvent;

struct KeyPress {
    // Lower-case character for printable keys, otherwise a name such as
    // "Escape", "Space" or "Enter".
    QString key;
    bool ctrl = false;
    bool alt = false;
    bool meta = false;
    bool shift = false;
    bool autoRepeat = false;
    bool textInputFocused = false;

    bool hasCommandModifier() const { return ctrl || alt || meta; }

    static KeyPress fromEvent(const QKeyEvent *event, bool textInputFocused = false);
    static KeyPress character(const QString &key);
};

struct KeyAction {
    enum class Kind {
        None,
        TriggerPad,
        SwitchBank,
        StopAll,
        FadeOutAll
    };

    Kind kind = Kind::None;
    int padIndex = -1;
    // Zero-based page index; bank 1 is page 0, bank 10 (key 0) is page 9.
    int pageIndex = -1;
};

struct KeyBinding {
    int padIndex = -1;
    QString key;
};

struct GridLayout {
    int rows = 4;
    int columns = 12;

    int padCount() const { return rows * columns; }
    int stopAllPad() const { return rows > 1 && columns > 0 ? columns + columns - 1 : -1; }
    int fadeOutAllPad() const { return rows > 2 && columns > 0 ? 2 * columns + columns - 1 : -1; }
    bool isControlPad(int padIndex) const {
        return padIndex >= 0 && (padIndex == stopAllPad() || padIndex == fadeOutAllPad());
    }
    bool contains(int padIndex) const { return padIndex >= 0 && padIndex < padCount(); }
};

// Custom bindings of a page in pad order, skipping pads without one.
QVector<KeyBinding> keyBindingsFor(const QVector<PadConfiguration> &configs);

// None when the binding is empty or usable, InvalidKeyBinding otherwise.
EngineError validateKeyBinding(const QString &binding);
QString normalizeKeyBinding(const QString &binding);

class KeyBindingResolver {
public:
    explicit KeyBindingResolver(const GridLayout &grid = GridLayout());

    void setGrid(const GridLayout &grid) { m_grid = grid; }
    const GridLayout &grid() const { return m_grid; }

    KeyAction resolve(const KeyPress &press, const QVector<KeyBinding> &bindings) const;

    // Pad reached by key on the default keyboard layout, or -1.
    int defaultPadForKey(const QString &key) const;
    // Default layout key for a pad, or an empty string.
    QString defaultKeyForPad(int padIndex) const;

private:
    GridLayout m_grid;
};

// Suppresses a key for a short window after it triggered a pad.
class KeyDebouncer {
public:
    explicit KeyDebouncer(int windowMs = 100);

    int windowMs() const { return m_windowMs; }
    void setWindowMs(int windowMs) { m_windowMs = windowMs; }

    bool accept(const QString &key);
    bool accept(const QString &key, qint64 nowMs);
    void reset() { m_lastAccepted.clear(); }

private:
    int m_windowMs = 100;
    QElapsedTimer m_clock;
    QHash<QString, qint64> m_lastAccepted;
};
