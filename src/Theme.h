#pragma once

#include <QColor>
#include <QFont>
#include <QFontInfo>
#include <QGuiApplication>
#include <QLinearGradient>
#include <QPainter>
#include <QScreen>
#include <QtGlobal>
#include <cmath>

namespace Theme {
inline QColor background() { return QColor(6, 10, 14); }
inline QColor backgroundLow() { return QColor(12, 18, 26); }
inline QColor text() { return QColor(222, 232, 240); }
inline QColor textMuted() { return QColor(120, 140, 158); }
inline QColor outline() { return QColor(52, 78, 104); }

// Pad tile states.
inline QColor padEmpty() { return QColor(14, 20, 28); }
inline QColor padLoaded() { return QColor(24, 36, 50); }
inline QColor padControl() { return QColor(70, 24, 28); }
inline QColor padTriggered() { return QColor(84, 200, 255); }
inline QColor padPlaying() { return QColor(96, 230, 160); }
inline QColor padError() { return QColor(255, 92, 84); }
inline QColor padArmed() { return QColor(255, 186, 64); }
inline QColor loadingTrack() { return QColor(40, 60, 80); }
inline QColor loadingFill() { return QColor(255, 208, 110); }

inline QColor withAlpha(const QColor &c, int alpha) {
    QColor out = c;
    out.setAlpha(alpha);
    return out;
}

// SOUNDBOARD_SCALE overrides the factor derived from a 1280x720 reference screen.
inline float uiScale() {
    static float scale = -1.0f;
    if (scale > 0.0f) {
        return scale;
    }
    bool ok = false;
    const float envScale = qgetenv("SOUNDBOARD_SCALE").toFloat(&ok);
    if (ok && envScale > 0.1f) {
        scale = envScale;
        return scale;
    }
    QSize size(1280, 720);
    if (QScreen *screen = QGuiApplication::primaryScreen()) {
        size = screen->geometry().size();
    }
    scale = qBound(0.6f, qMin(size.width() / 1280.0f, size.height() / 720.0f), 1.6f);
    return scale;
}

inline int px(int value) {
    return qMax(1, static_cast<int>(std::lround(value * uiScale())));
}

inline float pxF(float value) {
    return value * uiScale();
}

inline QFont baseFont(int pt, QFont::Weight weight = QFont::Normal) {
    QFont f("DejaVu Sans");
    if (!QFontInfo(f).exactMatch()) {
        f = QFont("sans-serif");
    }
    f.setPixelSize(qMax(8, static_cast<int>(std::lround(pt * uiScale()))));
    f.setWeight(weight);
    return f;
}

inline bool liteMode() {
    return qEnvironmentVariableIsSet("SOUNDBOARD_LITE");
}

inline void applyRenderHints(QPainter &p) {
    const bool lite = liteMode();
    p.setRenderHint(QPainter::Antialiasing, !lite);
    p.setRenderHint(QPainter::TextAntialiasing, !lite);
}

// Rounded tile with a soft top highlight; lite mode paints a flat tile.
inline void drawPadTile(QPainter &p, const QRectF &r, const QColor &fill, const QColor &border,
                        qreal borderWidth) {
    const qreal radius = pxF(6.0f);
    p.save();
    p.setPen(QPen(border, borderWidth));
    if (liteMode()) {
        p.setBrush(fill);
    } else {
        QLinearGradient g(r.topLeft(), r.bottomLeft());
        g.setColorAt(0.0, fill.lighter(125));
        g.setColorAt(1.0, fill);
        p.setBrush(g);
    }
    p.drawRoundedRect(r, radius, radius);
    p.restore();
}
}  // namespace Theme
