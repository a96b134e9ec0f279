#pragma once

#include <QMainWindow>
#include <memory>

#include "EngineSettings.h"

class AudioDecoder;
class AudioEngine;
class JsonPadStore;
class PadBank;
class PadGridWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const EngineSettings &settings, QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    void keyPressEvent(QKeyEvent *event) override;

private:
    void importFiles(int padIndex, const QStringList &paths);

    EngineSettings m_settings;
    JsonPadStore *m_store = nullptr;
    std::unique_ptr<AudioDecoder> m_decoder;
    AudioEngine *m_engine = nullptr;
    PadBank *m_padBank = nullptr;
    PadGridWidget *m_grid = nullptr;
};
