#include "AudioEngine.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <QDebug>
#include <QFile>
#include <QtGlobal>

#ifdef SOUNDBOARD_WITH_ALSA
#include <alsa/asoundlib.h>
#endif

namespace {
constexpr double kStopRampSeconds = 0.008;

float clampSample(float v) {
    if (v > 1.0f) {
        return 1.0f;
    }
    if (v < -1.0f) {
        return -1.0f;
    }
    return v;
}

QString detectUsbCard() {
#ifdef Q_OS_LINUX
    QFile file("/proc/asound/cards");
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString();
    }
    while (!file.atEnd()) {
        const QString line = QString::fromUtf8(file.readLine()).trimmed();
        if (line.contains("USB Audio", Qt::CaseInsensitive) ||
            line.contains("CODEC", Qt::CaseInsensitive)) {
            const QString index = line.section(' ', 0, 0).trimmed();
            if (!index.isEmpty() && index[0].isDigit()) {
                return index;
            }
        }
    }
#endif
    return QString();
}
}  // namespace

AudioEngine::AudioEngine(const QString &device, int sampleRate, int periodFrames, QObject *parent)
    : QObject(parent),
      m_requestedDevice(device),
      m_sampleRate(qBound(8000, sampleRate, 192000)),
      m_periodFrames(qBound(64, periodFrames, 2048)) {
#ifdef SOUNDBOARD_WITH_ALSA
    start();
#else
    qWarning() << "[Audio] built without ALSA, playback disabled";
#endif
}

AudioEngine::~AudioEngine() {
    shutdown();
}

QStringList AudioEngine::deviceCandidates() const {
    QStringList list;
    if (!m_requestedDevice.isEmpty()) {
        for (const QString &item : m_requestedDevice.split(',', Qt::SkipEmptyParts)) {
            const QString trimmed = item.trimmed();
            if (!trimmed.isEmpty()) {
                list << trimmed;
            }
        }
    }
    const QString card = detectUsbCard();
    if (!card.isEmpty()) {
        list << QString("plughw:%1,0").arg(card);
    }
    list << "default"
         << "plughw:0,0"
         << "sysdefault"
         << "plughw:1,0";
    list.removeDuplicates();
    return list;
}

void AudioEngine::start() {
#ifdef SOUNDBOARD_WITH_ALSA
    if (m_running) {
        return;
    }

    snd_pcm_t *pcm = nullptr;
    for (const QString &dev : deviceCandidates()) {
        if (snd_pcm_open(&pcm, dev.toLocal8Bit().constData(), SND_PCM_STREAM_PLAYBACK, 0) >= 0) {
            m_deviceName = dev;
            break;
        }
        pcm = nullptr;
    }

    if (!pcm) {
        qWarning() << "[Audio] no ALSA playback device could be opened";
        m_available = false;
        return;
    }

    snd_pcm_hw_params_t *params = nullptr;
    snd_pcm_hw_params_malloc(&params);
    snd_pcm_hw_params_any(pcm, params);
    snd_pcm_hw_params_set_access(pcm, params, SND_PCM_ACCESS_RW_INTERLEAVED);
    snd_pcm_hw_params_set_format(pcm, params, SND_PCM_FORMAT_S16_LE);
    snd_pcm_hw_params_set_channels(pcm, params, static_cast<unsigned int>(m_channels));

    unsigned int rate = static_cast<unsigned int>(m_sampleRate);
    snd_pcm_hw_params_set_rate_near(pcm, params, &rate, nullptr);
    m_sampleRate = static_cast<int>(rate);

    snd_pcm_uframes_t period = static_cast<snd_pcm_uframes_t>(m_periodFrames);
    snd_pcm_hw_params_set_period_size_near(pcm, params, &period, nullptr);
    m_periodFrames = static_cast<int>(period);

    snd_pcm_uframes_t bufferSize = period * 4;
    snd_pcm_hw_params_set_buffer_size_near(pcm, params, &bufferSize);

    const int err = snd_pcm_hw_params(pcm, params);
    snd_pcm_hw_params_free(params);
    if (err < 0) {
        qWarning() << "[Audio] cannot configure" << m_deviceName << snd_strerror(err);
        snd_pcm_close(pcm);
        m_available = false;
        return;
    }

    snd_pcm_prepare(pcm);
    qInfo() << "[Audio] playing on" << m_deviceName << m_sampleRate << "Hz, period"
            << m_periodFrames;
    m_pcmHandle = pcm;
    m_available = true;
    m_running = true;
    m_thread = std::thread(&AudioEngine::run, this);
#endif
}

void AudioEngine::shutdown() {
    if (!m_running) {
        return;
    }

    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }

#ifdef SOUNDBOARD_WITH_ALSA
    if (m_pcmHandle) {
        snd_pcm_t *pcm = static_cast<snd_pcm_t *>(m_pcmHandle);
        snd_pcm_drop(pcm);
        snd_pcm_close(pcm);
        m_pcmHandle = nullptr;
    }
#endif
    m_available = false;
}

float AudioEngine::fadeStepFor(double seconds) const {
    if (seconds <= 0.0) {
        return 1.0f;
    }
    return static_cast<float>(1.0 / (seconds * m_sampleRate));
}

void AudioEngine::play(const QString &key, const std::shared_ptr<const AudioBuffer> &buffer,
                       const PlaybackMetadata &metadata) {
    if (!m_available || !buffer || !buffer->isValid()) {
        return;
    }

    Voice voice;
    voice.key = key;
    voice.buffer = buffer;
    voice.position = 0.0;
    voice.step = static_cast<double>(buffer->sampleRate) / static_cast<double>(m_sampleRate);
    voice.gain = qBound(0.0f, metadata.volume, 2.0f);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_voices.erase(std::remove_if(m_voices.begin(), m_voices.end(),
                                  [&key](const Voice &v) { return v.key == key; }),
                   m_voices.end());
    m_voices.push_back(std::move(voice));
}

void AudioEngine::stop(const QString &key) {
    if (!m_available) {
        return;
    }
    const float step = fadeStepFor(kStopRampSeconds);
    std::lock_guard<std::mutex> lock(m_mutex);
    for (Voice &voice : m_voices) {
        if (voice.key == key) {
            voice.stopping = true;
            voice.fadeStep = std::max(voice.fadeStep, step);
        }
    }
}

void AudioEngine::stopAll() {
    if (!m_available) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_voices.clear();
}

bool AudioEngine::isPlaying(const QString &key) const {
    if (!m_available) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_voices.cbegin(), m_voices.cend(),
                       [&key](const Voice &v) { return v.key == key && !v.stopping; });
}

void AudioEngine::fadeOut(const QString &key, double seconds) {
    if (!m_available) {
        return;
    }
    const float step = fadeStepFor(seconds);
    std::lock_guard<std::mutex> lock(m_mutex);
    for (Voice &voice : m_voices) {
        if (voice.key == key && !voice.stopping) {
            voice.fading = true;
            voice.fadeStep = std::max(voice.fadeStep, step);
        }
    }
}

void AudioEngine::fadeOutAll(double seconds) {
    if (!m_available) {
        return;
    }
    const float step = fadeStepFor(seconds);
    std::lock_guard<std::mutex> lock(m_mutex);
    for (Voice &voice : m_voices) {
        if (!voice.stopping) {
            voice.fading = true;
            voice.fadeStep = std::max(voice.fadeStep, step);
        }
    }
}

PlaybackProgress AudioEngine::playbackProgress(const QString &key) const {
    PlaybackProgress progress;
    if (!m_available) {
        return progress;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const Voice &voice : m_voices) {
        if (voice.key != key || voice.stopping || !voice.buffer || voice.buffer->sampleRate <= 0) {
            continue;
        }
        progress.duration = voice.buffer->durationSeconds();
        progress.position = voice.position / voice.buffer->sampleRate;
        progress.fading = voice.fading;
        break;
    }
    return progress;
}

void AudioEngine::run() {
#ifdef SOUNDBOARD_WITH_ALSA
    snd_pcm_t *pcm = static_cast<snd_pcm_t *>(m_pcmHandle);
    if (!pcm) {
        return;
    }

    const int framesPerPeriod = std::max(1, m_periodFrames);
    std::vector<float> mixBuffer(framesPerPeriod * m_channels, 0.0f);
    std::vector<int16_t> out(framesPerPeriod * m_channels, 0);

    while (m_running) {
        std::fill(mixBuffer.begin(), mixBuffer.end(), 0.0f);
        mix(mixBuffer.data(), framesPerPeriod);

        for (int i = 0; i < framesPerPeriod * m_channels; ++i) {
            out[i] = static_cast<int16_t>(clampSample(mixBuffer[i]) * 32767.0f);
        }

        int framesLeft = framesPerPeriod;
        int offset = 0;
        while (framesLeft > 0 && m_running) {
            const snd_pcm_sframes_t written =
                snd_pcm_writei(pcm, out.data() + offset * m_channels, framesLeft);
            if (written < 0) {
                const int err = snd_pcm_recover(pcm, static_cast<int>(written), 1);
                if (err < 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
            } else {
                framesLeft -= static_cast<int>(written);
                offset += static_cast<int>(written);
            }
        }
    }
#endif
}

void AudioEngine::mix(float *out, int frames) {
    std::unique_lock<std::mutex> lock(m_mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        if (m_lastOutValid && static_cast<int>(m_lastOut.size()) == frames * m_channels) {
            std::copy(m_lastOut.begin(), m_lastOut.end(), out);
        } else {
            std::fill(out, out + frames * m_channels, 0.0f);
        }
        return;
    }

    for (auto it = m_voices.begin(); it != m_voices.end();) {
        Voice &voice = *it;
        if (!voice.buffer || !voice.buffer->isValid()) {
            it = m_voices.erase(it);
            continue;
        }

        const float *data = voice.buffer->samples.constData();
        const int channels = voice.buffer->channels;
        const int totalFrames = voice.buffer->frames();
        bool done = false;

        for (int i = 0; i < frames; ++i) {
            if (voice.position >= totalFrames) {
                done = true;
                break;
            }
            const int idx = static_cast<int>(voice.position);
            const float frac = static_cast<float>(voice.position - idx);
            const int next = std::min(idx + 1, totalFrames - 1);
            const float leftA = data[idx * channels];
            const float leftB = data[next * channels];
            const float rightA = channels > 1 ? data[idx * channels + 1] : leftA;
            const float rightB = channels > 1 ? data[next * channels + 1] : leftB;
            const float left = leftA + (leftB - leftA) * frac;
            const float right = rightA + (rightB - rightA) * frac;

            if (voice.fading || voice.stopping) {
                voice.fade -= voice.fadeStep;
                if (voice.fade <= 0.0f) {
                    done = true;
                    break;
                }
            }
            const float gain = voice.gain * voice.fade;
            out[i * m_channels] += left * gain;
            if (m_channels > 1) {
                out[i * m_channels + 1] += right * gain;
            }
            voice.position += voice.step;
        }

        if (done) {
            it = m_voices.erase(it);
        } else {
            ++it;
        }
    }

    m_lastOut.assign(out, out + frames * m_channels);
    m_lastOutValid = true;
}
