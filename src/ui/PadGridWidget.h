#pragma once

#include <QElapsedTimer>
#include <QHash>
#include <QStringList>
#include <QTimer>
#include <QWidget>

class QDragEnterEvent;
class QDropEvent;
class QKeyEvent;
class QMouseEvent;
class QPaintEvent;
class PadBank;

class PadGridWidget : public QWidget {
    Q_OBJECT
public:
    explicit PadGridWidget(PadBank *pads, QWidget *parent = nullptr);

    void showMessage(const QString &text, bool error = false);

signals:
    void filesDropped(int padIndex, const QStringList &paths);

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dropEvent(QDropEvent *event) override;

private:
    QRectF gridRect() const;
    QRectF padRect(int padIndex) const;
    int padAt(const QPointF &pos) const;
    void flashPad(int padIndex, bool error);

    PadBank *m_pads = nullptr;
    QTimer m_repaintTimer;
    QElapsedTimer m_clock;
    QHash<int, qint64> m_feedbackAt;
    QHash<int, qint64> m_errorAt;
    int m_dragFrom = -1;
    QString m_message;
    bool m_messageIsError = false;
    qint64 m_messageAt = 0;
};
