#include "MainWindow.h"

#include <QAbstractSpinBox>
#include <QApplication>
#include <QDebug>
#include <QKeyEvent>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QTextEdit>

#include "AudioDecoder.h"
#include "AudioEngine.h"
#include "FutureUtils.h"
#include "JsonPadStore.h"
#include "PadBank.h"
#include "ui/PadGridWidget.h"

namespace {
bool isTextInput(const QWidget *widget) {
    return qobject_cast<const QLineEdit *>(widget) || qobject_cast<const QTextEdit *>(widget) ||
           qobject_cast<const QPlainTextEdit *>(widget) ||
           qobject_cast<const QAbstractSpinBox *>(widget);
}
}  // namespace

MainWindow::MainWindow(const EngineSettings &settings, QWidget *parent)
    : QMainWindow(parent), m_settings(settings) {
    setWindowTitle("Soundboard");
    setAttribute(Qt::WA_OpaquePaintEvent);

    m_store = new JsonPadStore(m_settings.storeDirectory, this);
    QString error;
    if (!m_store->load(&error)) {
        qWarning() << "[Main] pad store unavailable:" << error;
    }
    m_decoder = createAudioDecoder(m_settings.ffmpegPath, m_settings.sampleRate, m_settings.channels);
    m_engine = new AudioEngine(m_settings.alsaDevice, m_settings.sampleRate,
                               m_settings.periodFrames, this);
    m_padBank = new PadBank(m_store, m_decoder.get(), m_engine, m_settings, this);

    m_grid = new PadGridWidget(m_padBank, this);
    setCentralWidget(m_grid);
    m_grid->setFocus();

    connect(m_padBank, &PadBank::errorOccurred, this,
            [this](EngineError err, const QString &message) {
                m_grid->showMessage(QString("%1: %2").arg(engineErrorName(err), message), true);
            });
    connect(m_grid, &PadGridWidget::filesDropped, this, &MainWindow::importFiles);

    if (!m_engine->isAvailable()) {
        m_grid->showMessage("No audio output device", true);
    }

    onFinished(m_padBank->recoverPendingSwap(), this, [this](const SwapOutcome &outcome) {
        if (outcome.status == SwapOutcome::Status::Recovered) {
            m_grid->showMessage("Recovered an interrupted pad swap");
        }
        m_padBank->setActiveProfile(m_settings.profileId);
    });
}

MainWindow::~MainWindow() {
    // The pad bank's pending work refers to the decoder.
    delete m_padBank;
    m_padBank = nullptr;
}

void MainWindow::importFiles(int padIndex, const QStringList &paths) {
    QVector<qint64> ids;
    for (const QString &path : paths) {
        QString error;
        const qint64 id = m_store->importAudioFile(path, &error);
        if (id <= 0) {
            m_grid->showMessage(error, true);
            continue;
        }
        ids.push_back(id);
    }
    if (ids.isEmpty()) {
        return;
    }
    onFinished(m_padBank->appendClips(padIndex, ids), this,
               [this, padIndex, count = ids.size()](const PadEditResult &result) {
                   if (result.ok()) {
                       m_grid->showMessage(
                           QString("Added %1 clip(s) to pad %2").arg(count).arg(padIndex + 1));
                   }
               });
}

void MainWindow::keyPressEvent(QKeyEvent *event) {
    const KeyPress press = KeyPress::fromEvent(event, isTextInput(QApplication::focusWidget()));
    if (m_padBank && m_padBank->handleKeyPress(press)) {
        event->accept();
        return;
    }
    QMainWindow::keyPressEvent(event);
}
