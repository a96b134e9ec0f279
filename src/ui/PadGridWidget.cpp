#include "PadGridWidget.h"

#include <QDragEnterEvent>
#include <QDropEvent>
#include <QKeyEvent>
#include <QMimeData>
#include <QMouseEvent>
#include <QPainter>
#include <QUrl>
#include <cmath>

#include "KeyBindingResolver.h"
#include "LoadingStateTracker.h"
#include "PadBank.h"
#include "Theme.h"

namespace {
constexpr int kFlashMs = 180;
constexpr int kErrorFlashMs = 900;
constexpr int kMessageMs = 4000;

QString remainingLabel(double seconds) {
    const int total = static_cast<int>(std::ceil(seconds));
    return QString("-%1:%2").arg(total / 60).arg(total % 60, 2, 10, QChar('0'));
}
}  // namespace

PadGridWidget::PadGridWidget(PadBank *pads, QWidget *parent) : QWidget(parent), m_pads(pads) {
    setFocusPolicy(Qt::StrongFocus);
    setAcceptDrops(true);
    m_clock.start();

    m_repaintTimer.setInterval(50);
    connect(&m_repaintTimer, &QTimer::timeout, this, [this]() { update(); });
    m_repaintTimer.start();

    connect(m_pads, &PadBank::padsChanged, this, [this]() { update(); });
    connect(m_pads, &PadBank::pageChanged, this, [this]() { update(); });
    connect(m_pads, &PadBank::armedChanged, this, [this]() { update(); });
    connect(m_pads, &PadBank::instantFeedback, this, [this](int pad) { flashPad(pad, false); });
    connect(m_pads, &PadBank::padStateChanged, this, [this](int pad) {
        if (m_pads->loadingState(pad).status == LoadingState::Status::Error) {
            flashPad(pad, true);
        }
        update();
    });
}

void PadGridWidget::showMessage(const QString &text, bool error) {
    m_message = text;
    m_messageIsError = error;
    m_messageAt = m_clock.elapsed();
    update();
}

void PadGridWidget::flashPad(int padIndex, bool error) {
    if (error) {
        m_errorAt.insert(padIndex, m_clock.elapsed());
    } else {
        m_feedbackAt.insert(padIndex, m_clock.elapsed());
    }
    update();
}

QRectF PadGridWidget::gridRect() const {
    const float margin = Theme::pxF(16.0f);
    const float header = Theme::pxF(36.0f);
    const float footer = Theme::pxF(28.0f);
    return QRectF(margin, margin + header, width() - margin * 2.0f,
                  height() - margin * 2.0f - header - footer);
}

QRectF PadGridWidget::padRect(int padIndex) const {
    const GridLayout &grid = m_pads->grid();
    const QRectF area = gridRect();
    const float gap = Theme::pxF(6.0f);
    const float cellW = (area.width() - gap * (grid.columns - 1)) / grid.columns;
    const float cellH = (area.height() - gap * (grid.rows - 1)) / grid.rows;
    const int row = padIndex / grid.columns;
    const int col = padIndex % grid.columns;
    return QRectF(area.left() + col * (cellW + gap), area.top() + row * (cellH + gap), cellW, cellH);
}

int PadGridWidget::padAt(const QPointF &pos) const {
    for (int pad = 0; pad < m_pads->padCount(); ++pad) {
        if (padRect(pad).contains(pos)) {
            return pad;
        }
    }
    return -1;
}

void PadGridWidget::paintEvent(QPaintEvent *event) {
    Q_UNUSED(event);

    QPainter p(this);
    Theme::applyRenderHints(p);

    QLinearGradient bg(0, 0, 0, height());
    bg.setColorAt(0.0, Theme::background());
    bg.setColorAt(1.0, Theme::backgroundLow());
    p.fillRect(rect(), bg);

    const float margin = Theme::pxF(16.0f);
    p.setPen(Theme::text());
    p.setFont(Theme::baseFont(14, QFont::Bold));
    const QString title = m_pads->activeProfile() < 0
                              ? QString("NO PROFILE")
                              : QString("PROFILE %1  //  BANK %2")
                                    .arg(m_pads->activeProfile())
                                    .arg(m_pads->currentPage() + 1);
    p.drawText(QRectF(margin, margin, width() - margin * 2, Theme::pxF(28.0f)),
               Qt::AlignLeft | Qt::AlignVCenter, title);
    const int armed = m_pads->armedTracks()->count();
    if (armed > 0) {
        p.setPen(Theme::padArmed());
        p.setFont(Theme::baseFont(10));
        p.drawText(QRectF(margin, margin, width() - margin * 2, Theme::pxF(28.0f)),
                   Qt::AlignRight | Qt::AlignVCenter, QString("ARMED %1  [ENTER]").arg(armed));
    }

    const qint64 now = m_clock.elapsed();
    for (int pad = 0; pad < m_pads->padCount(); ++pad) {
        const QRectF r = padRect(pad);
        const PadConfiguration config = m_pads->pad(pad);
        const bool control = m_pads->isControlPad(pad);
        const bool playing = m_pads->isPlaying(pad);
        const LoadingState state = m_pads->loadingState(pad);

        QColor fill = config.hasClips() ? Theme::padLoaded() : Theme::padEmpty();
        if (control) {
            fill = Theme::padControl();
        }
        const qint64 feedback = m_feedbackAt.value(pad, -kFlashMs);
        if (now - feedback < kFlashMs) {
            fill = Theme::withAlpha(Theme::padTriggered(), 140);
        }
        const qint64 error = m_errorAt.value(pad, -kErrorFlashMs);
        const bool erroring = now - error < kErrorFlashMs;

        QColor border = playing ? Theme::padPlaying() : Theme::outline();
        if (erroring) {
            border = Theme::padError();
        }
        Theme::drawPadTile(p, r, fill, border, playing || erroring ? 2.0 : 1.0);

        const QRectF inner = r.adjusted(Theme::pxF(6), Theme::pxF(4), -Theme::pxF(6), -Theme::pxF(4));
        p.setPen(Theme::textMuted());
        p.setFont(Theme::baseFont(9));
        p.drawText(inner, Qt::AlignLeft | Qt::AlignTop, m_pads->keyHint(pad));
        if (config.audioFileIds.size() > 1) {
            p.drawText(inner, Qt::AlignRight | Qt::AlignTop,
                       QString("%1x").arg(config.audioFileIds.size()));
        }

        p.setPen(control ? Theme::padError() : Theme::text());
        p.setFont(Theme::baseFont(10, QFont::DemiBold));
        QString name = m_pads->padName(pad);
        if (name.isEmpty() && config.hasClips()) {
            name = QString("PAD %1").arg(pad + 1);
        }
        p.drawText(inner, Qt::AlignCenter | Qt::TextWordWrap, name);

        if (state.isLoading()) {
            const QRectF bar(inner.left(), inner.bottom() - Theme::pxF(4), inner.width(), Theme::pxF(3));
            p.setPen(Qt::NoPen);
            p.setBrush(Theme::loadingTrack());
            p.drawRect(bar);
            p.setBrush(Theme::loadingFill());
            p.drawRect(QRectF(bar.left(), bar.top(), bar.width() * state.progress, bar.height()));
        } else if (playing) {
            const PlaybackProgress progress = m_pads->playbackProgress(pad);
            if (progress.isValid()) {
                const QRectF bar(inner.left(), inner.bottom() - Theme::pxF(4), inner.width(),
                                 Theme::pxF(3));
                p.setPen(Qt::NoPen);
                p.setBrush(Theme::loadingTrack());
                p.drawRect(bar);
                p.setBrush(progress.fading ? Theme::withAlpha(Theme::padPlaying(), 120)
                                           : Theme::padPlaying());
                p.drawRect(QRectF(bar.left(), bar.top(), bar.width() * progress.ratio(), bar.height()));

                p.setPen(Theme::textMuted());
                p.setFont(Theme::baseFont(8));
                p.drawText(inner.adjusted(0, 0, 0, -Theme::pxF(6)), Qt::AlignLeft | Qt::AlignBottom,
                           remainingLabel(progress.remaining()));
            }
        }
        if (m_pads->isArmed(pad)) {
            p.setPen(Qt::NoPen);
            p.setBrush(Theme::padArmed());
            p.drawEllipse(QPointF(inner.right() - Theme::pxF(4), inner.bottom() - Theme::pxF(8)),
                          Theme::pxF(3.5f), Theme::pxF(3.5f));
        }
    }

    if (!m_message.isEmpty() && now - m_messageAt < kMessageMs) {
        p.setPen(m_messageIsError ? Theme::padError() : Theme::textMuted());
        p.setFont(Theme::baseFont(10));
        p.drawText(QRectF(margin, height() - margin - Theme::pxF(24.0f), width() - margin * 2,
                          Theme::pxF(24.0f)),
                   Qt::AlignLeft | Qt::AlignVCenter, m_message);
    }
}

void PadGridWidget::mousePressEvent(QMouseEvent *event) {
    setFocus(Qt::MouseFocusReason);
    const int pad = padAt(event->position());
    if (pad < 0) {
        return;
    }
    if (event->button() == Qt::RightButton) {
        m_pads->toggleArmed(pad);
        return;
    }
    if (event->button() != Qt::LeftButton) {
        return;
    }
    if (event->modifiers().testFlag(Qt::ShiftModifier)) {
        m_dragFrom = pad;
        return;
    }
    m_pads->triggerPad(pad);
}

void PadGridWidget::mouseReleaseEvent(QMouseEvent *event) {
    if (m_dragFrom < 0) {
        return;
    }
    const int from = m_dragFrom;
    m_dragFrom = -1;
    const int to = padAt(event->position());
    if (to < 0 || to == from) {
        return;
    }
    m_pads->swapPads(from, to);
}

void PadGridWidget::keyPressEvent(QKeyEvent *event) {
    if ((event->key() == Qt::Key_Return || event->key() == Qt::Key_Enter) && !event->isAutoRepeat()) {
        m_pads->playNextArmed();
        return;
    }
    if (m_pads->handleKeyPress(KeyPress::fromEvent(event))) {
        event->accept();
        return;
    }
    QWidget::keyPressEvent(event);
}

void PadGridWidget::dragEnterEvent(QDragEnterEvent *event) {
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    }
}

void PadGridWidget::dropEvent(QDropEvent *event) {
    const int pad = padAt(event->position());
    if (pad < 0 || m_pads->isControlPad(pad)) {
        return;
    }
    QStringList paths;
    for (const QUrl &url : event->mimeData()->urls()) {
        if (url.isLocalFile()) {
            paths << url.toLocalFile();
        }
    }
    if (!paths.isEmpty()) {
        emit filesDropped(pad, paths);
        event->acceptProposedAction();
    }
}
