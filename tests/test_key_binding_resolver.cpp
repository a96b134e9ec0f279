#include <QKeyEvent>
#include <QtTest>

#include "KeyBindingResolver.h"

namespace {
KeyPress ctrlPress(const QString &key) {
    KeyPress press = KeyPress::character(key);
    press.ctrl = true;
    return press;
}

PadConfiguration boundPad(int padIndex, const QString &key) {
    PadConfiguration config = PadConfiguration::cleared(PadAddress{1, 0, padIndex});
    config.keyBinding = key;
    return config;
}
}  // namespace

class KeyBindingResolverTest : public QObject {
    Q_OBJECT

private slots:
    void defaultLayoutMapsRowsToPads();
    void defaultLayoutSkipsControlPads();
    void customBindingOverridesDefault();
    void bindingOutsideGridIsIgnored();
    void digitsSwitchBanks();
    void reservedKeys();
    void textInputSwallowsEverything();
    void commandModifiersDoNotTriggerPads();
    void validatesBindings();
    void bindingsAreSortedAndLowercased();
    void defaultKeyForPad();
    void debouncerSuppressesRepeats();
    void keyPressFromEvent();
};

void KeyBindingResolverTest::defaultLayoutMapsRowsToPads() {
    const KeyBindingResolver resolver;
    KeyAction action = resolver.resolve(KeyPress::character("q"), {});
    QCOMPARE(action.kind, KeyAction::Kind::TriggerPad);
    QCOMPARE(action.padIndex, 0);

    action = resolver.resolve(KeyPress::character("p"), {});
    QCOMPARE(action.padIndex, 9);
    action = resolver.resolve(KeyPress::character("a"), {});
    QCOMPARE(action.padIndex, 12);
    action = resolver.resolve(KeyPress::character("/"), {});
    QCOMPARE(action.padIndex, 33);
    action = resolver.resolve(KeyPress::character("Q"), {});
    QCOMPARE(action.padIndex, 0);
}

void KeyBindingResolverTest::defaultLayoutSkipsControlPads() {
    // With ten columns the last key of the second row lands on the stop-all pad.
    const KeyBindingResolver resolver(GridLayout{4, 10});
    QCOMPARE(resolver.grid().stopAllPad(), 19);
    QCOMPARE(resolver.resolve(KeyPress::character(";"), {}).kind, KeyAction::Kind::None);
    QCOMPARE(resolver.resolve(KeyPress::character("/"), {}).kind, KeyAction::Kind::None);
    QCOMPARE(resolver.resolve(KeyPress::character("l"), {}).padIndex, 18);
}

void KeyBindingResolverTest::customBindingOverridesDefault() {
    const KeyBindingResolver resolver;
    const QVector<KeyBinding> bindings = keyBindingsFor({boundPad(5, "q")});

    KeyAction action = resolver.resolve(KeyPress::character("q"), bindings);
    QCOMPARE(action.kind, KeyAction::Kind::TriggerPad);
    QCOMPARE(action.padIndex, 5);

    // Pad 5 no longer answers to its layout key.
    QCOMPARE(resolver.resolve(KeyPress::character("y"), bindings).kind, KeyAction::Kind::None);
    // Other pads keep theirs.
    QCOMPARE(resolver.resolve(KeyPress::character("w"), bindings).padIndex, 1);
}

void KeyBindingResolverTest::bindingOutsideGridIsIgnored() {
    const KeyBindingResolver resolver;
    const QVector<KeyBinding> bindings{KeyBinding{100, "x"}};
    const KeyAction action = resolver.resolve(KeyPress::character("x"), bindings);
    QCOMPARE(action.kind, KeyAction::Kind::TriggerPad);
    QCOMPARE(action.padIndex, 25);
}

void KeyBindingResolverTest::digitsSwitchBanks() {
    const KeyBindingResolver resolver;
    KeyAction action = resolver.resolve(KeyPress::character("5"), {});
    QCOMPARE(action.kind, KeyAction::Kind::SwitchBank);
    QCOMPARE(action.pageIndex, 4);

    action = resolver.resolve(KeyPress::character("0"), {});
    QCOMPARE(action.pageIndex, 9);

    action = resolver.resolve(ctrlPress("3"), {});
    QCOMPARE(action.kind, KeyAction::Kind::SwitchBank);
    QCOMPARE(action.pageIndex, 12);

    KeyPress alt = KeyPress::character("3");
    alt.alt = true;
    QCOMPARE(resolver.resolve(alt, {}).kind, KeyAction::Kind::None);

    // A stored digit binding never takes a bank key.
    const QVector<KeyBinding> digitBound = keyBindingsFor({boundPad(2, "5")});
    QCOMPARE(digitBound.size(), 1);
    action = resolver.resolve(KeyPress::character("5"), digitBound);
    QCOMPARE(action.kind, KeyAction::Kind::SwitchBank);
    QCOMPARE(action.pageIndex, 4);
    QCOMPARE(action.padIndex, -1);
}

void KeyBindingResolverTest::reservedKeys() {
    const KeyBindingResolver resolver;
    QCOMPARE(resolver.resolve(KeyPress::character("Escape"), {}).kind, KeyAction::Kind::StopAll);
    QCOMPARE(resolver.resolve(KeyPress::character("Space"), {}).kind, KeyAction::Kind::FadeOutAll);
    QCOMPARE(resolver.resolve(ctrlPress("Escape"), {}).kind, KeyAction::Kind::StopAll);
}

void KeyBindingResolverTest::textInputSwallowsEverything() {
    const KeyBindingResolver resolver;
    const QVector<KeyBinding> bindings = keyBindingsFor({boundPad(3, "m")});
    for (const QString &key : {QString("q"), QString("m"), QString("5"), QString("Escape")}) {
        KeyPress press = KeyPress::character(key);
        press.textInputFocused = true;
        QCOMPARE(resolver.resolve(press, bindings).kind, KeyAction::Kind::None);
    }
}

void KeyBindingResolverTest::commandModifiersDoNotTriggerPads() {
    const KeyBindingResolver resolver;
    QCOMPARE(resolver.resolve(ctrlPress("q"), {}).kind, KeyAction::Kind::None);
    KeyPress meta = KeyPress::character("q");
    meta.meta = true;
    QCOMPARE(resolver.resolve(meta, {}).kind, KeyAction::Kind::None);
    KeyPress shift = KeyPress::character("q");
    shift.shift = true;
    QCOMPARE(resolver.resolve(shift, {}).kind, KeyAction::Kind::TriggerPad);
}

void KeyBindingResolverTest::validatesBindings() {
    QCOMPARE(validateKeyBinding(QString()), EngineError::None);
    QCOMPARE(validateKeyBinding("a"), EngineError::None);
    QCOMPARE(validateKeyBinding("/"), EngineError::None);
    QCOMPARE(validateKeyBinding("ab"), EngineError::InvalidKeyBinding);
    QCOMPARE(validateKeyBinding("5"), EngineError::InvalidKeyBinding);
    QCOMPARE(validateKeyBinding(" "), EngineError::InvalidKeyBinding);
    QCOMPARE(validateKeyBinding(QString(QChar(0x07))), EngineError::InvalidKeyBinding);
    QCOMPARE(normalizeKeyBinding("K"), QString("k"));
}

void KeyBindingResolverTest::bindingsAreSortedAndLowercased() {
    PadConfiguration unbound = PadConfiguration::cleared(PadAddress{1, 0, 4});
    const QVector<KeyBinding> bindings =
        keyBindingsFor({boundPad(9, "B"), unbound, boundPad(2, "c")});
    QCOMPARE(bindings.size(), 2);
    QCOMPARE(bindings.at(0).padIndex, 2);
    QCOMPARE(bindings.at(0).key, QString("c"));
    QCOMPARE(bindings.at(1).padIndex, 9);
    QCOMPARE(bindings.at(1).key, QString("b"));
}

void KeyBindingResolverTest::defaultKeyForPad() {
    const KeyBindingResolver resolver;
    QCOMPARE(resolver.defaultKeyForPad(0), QString("q"));
    QCOMPARE(resolver.defaultKeyForPad(13), QString("s"));
    QCOMPARE(resolver.defaultKeyForPad(10), QString());
    QCOMPARE(resolver.defaultKeyForPad(36), QString());
    QCOMPARE(resolver.defaultKeyForPad(resolver.grid().stopAllPad()), QString());
    QCOMPARE(resolver.defaultKeyForPad(-1), QString());
}

void KeyBindingResolverTest::debouncerSuppressesRepeats() {
    KeyDebouncer debouncer(100);
    QVERIFY(debouncer.accept("q", 0));
    QVERIFY(!debouncer.accept("q", 50));
    QVERIFY(!debouncer.accept("Q", 60));
    QVERIFY(debouncer.accept("w", 60));
    QVERIFY(debouncer.accept("q", 100));
    debouncer.reset();
    QVERIFY(debouncer.accept("q", 101));
}

void KeyBindingResolverTest::keyPressFromEvent() {
    QKeyEvent shifted(QEvent::KeyPress, Qt::Key_A, Qt::ShiftModifier, "A");
    KeyPress press = KeyPress::fromEvent(&shifted);
    QCOMPARE(press.key, QString("a"));
    QVERIFY(press.shift);

    QKeyEvent ctrlDigit(QEvent::KeyPress, Qt::Key_5, Qt::ControlModifier);
    press = KeyPress::fromEvent(&ctrlDigit);
    QCOMPARE(press.key, QString("5"));
    QVERIFY(press.ctrl);

    QKeyEvent escape(QEvent::KeyPress, Qt::Key_Escape, Qt::NoModifier);
    QCOMPARE(KeyPress::fromEvent(&escape).key, QString("Escape"));

    QKeyEvent repeat(QEvent::KeyPress, Qt::Key_Semicolon, Qt::NoModifier, ";", true);
    press = KeyPress::fromEvent(&repeat, true);
    QCOMPARE(press.key, QString(";"));
    QVERIFY(press.autoRepeat);
    QVERIFY(press.textInputFocused);
}

QTEST_MAIN(KeyBindingResolverTest)
#include "test_key_binding_resolver.moc"
