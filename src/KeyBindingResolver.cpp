#include "KeyBindingResolver.h"

#include <QKeyEvent>
#include <algorithm>

namespace {
constexpr const char *kDefaultRows[] = {"qwertyuiop", "asdfghjkl;", "zxcvbnm,./"};
constexpr int kDefaultRowCount = 3;
constexpr int kBankKeys = 10;

int digitValue(const QString &key) {
    if (key.size() != 1 || !key.at(0).isDigit()) {
        return -1;
    }
    return key.at(0).digitValue();
}

// Digits 1..9 select banks 1..9, 0 selects bank 10.
int bankPageForDigit(int digit) {
    return digit == 0 ? kBankKeys - 1 : digit - 1;
}
}  // namespace

KeyPress KeyPress::fromEvent(const QKeyEvent *event, bool textInputFocused) {
    KeyPress press;
    const Qt::KeyboardModifiers mods = event->modifiers();
    press.ctrl = mods.testFlag(Qt::ControlModifier);
    press.alt = mods.testFlag(Qt::AltModifier);
    press.meta = mods.testFlag(Qt::MetaModifier);
    press.shift = mods.testFlag(Qt::ShiftModifier);
    press.autoRepeat = event->isAutoRepeat();
    press.textInputFocused = textInputFocused;

    const int key = event->key();
    if (key == Qt::Key_Escape) {
        press.key = "Escape";
    } else if (key == Qt::Key_Space) {
        press.key = "Space";
    } else if (key == Qt::Key_Return || key == Qt::Key_Enter) {
        press.key = "Enter";
    } else if (key >= Qt::Key_0 && key <= Qt::Key_9) {
        // With Ctrl held, text() carries no character.
        press.key = QString(QChar('0' + (key - Qt::Key_0)));
    } else if (key >= Qt::Key_A && key <= Qt::Key_Z) {
        press.key = QString(QChar('a' + (key - Qt::Key_A)));
    } else {
        const QString text = event->text();
        if (text.size() == 1 && text.at(0).isPrint()) {
            press.key = text.toLower();
        }
    }
    return press;
}

KeyPress KeyPress::character(const QString &key) {
    KeyPress press;
    press.key = key;
    return press;
}

QVector<KeyBinding> keyBindingsFor(const QVector<PadConfiguration> &configs) {
    QVector<KeyBinding> bindings;
    for (const PadConfiguration &config : configs) {
        if (!config.keyBinding.isEmpty()) {
            bindings.push_back(KeyBinding{config.padIndex, normalizeKeyBinding(config.keyBinding)});
        }
    }
    std::stable_sort(bindings.begin(), bindings.end(),
                     [](const KeyBinding &a, const KeyBinding &b) { return a.padIndex < b.padIndex; });
    return bindings;
}

QString normalizeKeyBinding(const QString &binding) {
    return binding.toLower();
}

EngineError validateKeyBinding(const QString &binding) {
    if (binding.isEmpty()) {
        return EngineError::None;
    }
    if (binding.size() != 1) {
        return EngineError::InvalidKeyBinding;
    }
    const QChar c = binding.at(0);
    if (c.isDigit() || c.isSpace() || !c.isPrint()) {
        return EngineError::InvalidKeyBinding;
    }
    return EngineError::None;
}

KeyBindingResolver::KeyBindingResolver(const GridLayout &grid) : m_grid(grid) {}

KeyAction KeyBindingResolver::resolve(const KeyPress &press,
                                      const QVector<KeyBinding> &bindings) const {
    KeyAction action;
    if (press.textInputFocused || press.key.isEmpty()) {
        return action;
    }

    if (press.key == "Escape") {
        action.kind = KeyAction::Kind::StopAll;
        return action;
    }
    const int digit = digitValue(press.key);
    if (digit >= 0) {
        if (!press.hasCommandModifier()) {
            action.kind = KeyAction::Kind::SwitchBank;
            action.pageIndex = bankPageForDigit(digit);
        } else if (press.ctrl && !press.alt && !press.meta) {
            action.kind = KeyAction::Kind::SwitchBank;
            action.pageIndex = kBankKeys + bankPageForDigit(digit);
        }
        return action;
    }
    if (press.hasCommandModifier()) {
        return action;
    }
    if (press.key == "Space") {
        action.kind = KeyAction::Kind::FadeOutAll;
        return action;
    }

    const QString key = press.key.toLower();
    for (const KeyBinding &binding : bindings) {
        if (binding.key.compare(key, Qt::CaseInsensitive) == 0 && m_grid.contains(binding.padIndex)) {
            action.kind = KeyAction::Kind::TriggerPad;
            action.padIndex = binding.padIndex;
            return action;
        }
    }

    const int pad = defaultPadForKey(key);
    if (pad < 0) {
        return action;
    }
    // A pad with its own binding no longer answers to its layout key.
    const bool rebound = std::any_of(bindings.cbegin(), bindings.cend(),
                                     [pad](const KeyBinding &b) { return b.padIndex == pad; });
    if (rebound) {
        return action;
    }
    action.kind = KeyAction::Kind::TriggerPad;
    action.padIndex = pad;
    return action;
}

int KeyBindingResolver::defaultPadForKey(const QString &key) const {
    if (key.size() != 1) {
        return -1;
    }
    const QChar c = key.at(0).toLower();
    for (int row = 0; row < kDefaultRowCount && row < m_grid.rows; ++row) {
        const int column = QString::fromLatin1(kDefaultRows[row]).indexOf(c);
        if (column < 0 || column >= m_grid.columns) {
            continue;
        }
        const int pad = row * m_grid.columns + column;
        if (m_grid.isControlPad(pad)) {
            return -1;
        }
        return pad;
    }
    return -1;
}

QString KeyBindingResolver::defaultKeyForPad(int padIndex) const {
    if (m_grid.columns <= 0 || !m_grid.contains(padIndex) || m_grid.isControlPad(padIndex)) {
        return QString();
    }
    const int row = padIndex / m_grid.columns;
    const int column = padIndex % m_grid.columns;
    if (row >= kDefaultRowCount) {
        return QString();
    }
    const QString keys = QString::fromLatin1(kDefaultRows[row]);
    return column < keys.size() ? keys.mid(column, 1) : QString();
}

KeyDebouncer::KeyDebouncer(int windowMs) : m_windowMs(windowMs) {
    m_clock.start();
}

bool KeyDebouncer::accept(const QString &key) {
    return accept(key, m_clock.elapsed());
}

bool KeyDebouncer::accept(const QString &key, qint64 nowMs) {
    const QString normalized = key.toLower();
    const auto it = m_lastAccepted.constFind(normalized);
    if (it != m_lastAccepted.cend() && nowMs - it.value() < m_windowMs) {
        return false;
    }
    m_lastAccepted.insert(normalized, nowMs);
    return true;
}
