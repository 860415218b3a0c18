#pragma once

// ============================================================================
// SignaturePad - Freehand capture surface for signatures and initials
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// A fixed-size white pad. Each press-drag-release adds one stroke, drawn
// black, 2 px wide with round caps. Strokes are kept as point lists so the
// pad can undo the last one and re-render at any size.
// ============================================================================

#include <QImage>
#include <QPointF>
#include <QVector>
#include <QWidget>

class SignaturePad : public QWidget {
    Q_OBJECT

public:
    static constexpr int PAD_WIDTH = 400;
    static constexpr int PAD_HEIGHT = 150;

    explicit SignaturePad(QWidget* parent = nullptr);

    bool isEmpty() const { return m_strokes.isEmpty(); }

    /**
     * @brief Remove the most recent stroke.
     */
    void undo();
    void clear();

    /**
     * @brief The pad as an opaque PDF-ready bitmap (white background).
     */
    QImage toImage() const;

    QSize sizeHint() const override { return QSize(PAD_WIDTH, PAD_HEIGHT); }

signals:
    void changed();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    void paintStrokes(QPainter& painter) const;

    QVector<QVector<QPointF>> m_strokes;
    bool m_drawing = false;
};
