#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "AudioOutput.h"

// ALSA mixer. Voices are mixed on a dedicated thread and written as interleaved
// S16 at the device rate; without ALSA the engine reports itself unavailable.
class AudioEngine : public QObject, public AudioOutput {
    Q_OBJECT
public:
    explicit AudioEngine(const QString &device = QString(), int sampleRate = 48000,
                         int periodFrames = 256, QObject *parent = nullptr);
    ~AudioEngine() override;

    bool isAvailable() const { return m_available; }
    int sampleRate() const { return m_sampleRate; }
    int channels() const { return m_channels; }
    QString deviceName() const { return m_deviceName; }

    void play(const QString &key, const std::shared_ptr<const AudioBuffer> &buffer,
              const PlaybackMetadata &metadata) override;
    void stop(const QString &key) override;
    void stopAll() override;
    bool isPlaying(const QString &key) const override;
    PlaybackProgress playbackProgress(const QString &key) const override;
    void fadeOut(const QString &key, double seconds) override;
    void fadeOutAll(double seconds) override;

private:
    struct Voice {
        QString key;
        std::shared_ptr<const AudioBuffer> buffer;
        double position = 0.0;
        double step = 1.0;
        float gain = 1.0f;
        float fade = 1.0f;
        float fadeStep = 0.0f;
        bool fading = false;
        bool stopping = false;
    };

    QStringList deviceCandidates() const;
    void start();
    void shutdown();
    void run();
    void mix(float *out, int frames);
    float fadeStepFor(double seconds) const;

    QString m_requestedDevice;
    QString m_deviceName;
    bool m_available = false;
    int m_sampleRate = 48000;
    int m_channels = 2;
    int m_periodFrames = 256;

    std::atomic<bool> m_running{false};
    std::thread m_thread;
    mutable std::mutex m_mutex;
    std::vector<Voice> m_voices;
    std::vector<float> m_lastOut;
    bool m_lastOutValid = false;
    void *m_pcmHandle = nullptr;
};
