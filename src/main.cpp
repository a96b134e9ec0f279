#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QGuiApplication>
#include <QKeyEvent>
#include <QTimer>
#include <QtGlobal>
#include <csignal>

#include "EngineError.h"
#include "EngineSettings.h"
#include "LoadingStateTracker.h"
#include "MainWindow.h"
#include "PadBank.h"
#include "PadSwapCoordinator.h"
#include "PadTypes.h"
#include "PlaybackDispatcher.h"

namespace {
// Escape is the stop-all key, so only F12 and Ctrl+Q leave the app.
class ExitShortcutFilter : public QObject {
public:
    using QObject::QObject;

protected:
    bool eventFilter(QObject *obj, QEvent *event) override {
        if (event->type() == QEvent::KeyPress) {
            auto *keyEvent = static_cast<QKeyEvent *>(event);
            const bool ctrl = keyEvent->modifiers().testFlag(Qt::ControlModifier);
            const int key = keyEvent->key();
            if (key == Qt::Key_F12 || (ctrl && key == Qt::Key_Q)) {
                QCoreApplication::quit();
                return true;
            }
        }
        return QObject::eventFilter(obj, event);
    }
};

bool isFramebufferPlatform(const QString &platform) {
    return platform.contains("linuxfb") || platform.contains("eglfs") ||
           platform.contains("vkkhrdisplay");
}

void registerMetaTypes() {
    qRegisterMetaType<PadAddress>();
    qRegisterMetaType<LoadingState>();
    qRegisterMetaType<EngineError>();
    qRegisterMetaType<TriggerOutcome>();
    qRegisterMetaType<SwapOutcome>();
    qRegisterMetaType<PadEditResult>();
}

volatile std::sig_atomic_t g_sigintRequested = 0;

void handleSigint(int) {
    g_sigintRequested = 1;
}
}  // namespace

int main(int argc, char *argv[]) {
#ifdef Q_OS_LINUX
    if (qEnvironmentVariableIsEmpty("DISPLAY") &&
        qEnvironmentVariableIsEmpty("WAYLAND_DISPLAY") &&
        qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", QByteArray("linuxfb"));
    }
#endif

    QApplication app(argc, argv);
    app.setApplicationName("Soundboard");
    app.setOrganizationName("Soundboard");
    app.setQuitOnLastWindowClosed(true);
    registerMetaTypes();

    ExitShortcutFilter exitFilter;
    app.installEventFilter(&exitFilter);

    std::signal(SIGINT, handleSigint);
    QTimer sigintTimer;
    sigintTimer.setInterval(100);
    QObject::connect(&sigintTimer, &QTimer::timeout, []() {
        if (g_sigintRequested) {
            QCoreApplication::quit();
        }
    });
    sigintTimer.start();

    const QString platform = QGuiApplication::platformName();
    if (isFramebufferPlatform(platform) && qEnvironmentVariableIsEmpty("SOUNDBOARD_LITE")) {
        qputenv("SOUNDBOARD_LITE", QByteArray("1"));
    }

    const EngineSettings settings = EngineSettings::fromEnvironment();
    qInfo() << "[Main] store" << settings.storeDirectory << "grid" << settings.grid.rows << "x"
            << settings.grid.columns << "behavior"
            << activePadBehaviorName(settings.activePadBehavior);

    MainWindow window(settings);
    if (isFramebufferPlatform(platform)) {
        window.showFullScreen();
    } else {
        window.resize(1280, 720);
        window.show();
    }

    return app.exec();
}
