#include "SignaturePad.h"

#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>

SignaturePad::SignaturePad(QWidget* parent)
    : QWidget(parent)
{
    setFixedSize(PAD_WIDTH, PAD_HEIGHT);
    setCursor(Qt::CrossCursor);
    setAttribute(Qt::WA_OpaquePaintEvent);
}

void SignaturePad::undo()
{
    if (m_strokes.isEmpty()) {
        return;
    }
    m_strokes.removeLast();
    m_drawing = false;
    update();
    emit changed();
}

void SignaturePad::clear()
{
    m_strokes.clear();
    m_drawing = false;
    update();
    emit changed();
}

QImage SignaturePad::toImage() const
{
    QImage image(PAD_WIDTH, PAD_HEIGHT, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::white);
    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing, true);
    paintStrokes(painter);
    painter.end();
    return image;
}

void SignaturePad::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.fillRect(rect(), Qt::white);
    painter.setRenderHint(QPainter::Antialiasing, true);
    paintStrokes(painter);

    painter.setPen(QPen(QColor(0xd1, 0xd5, 0xdb), 1));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(rect().adjusted(0, 0, -1, -1));
}

void SignaturePad::paintStrokes(QPainter& painter) const
{
    QPen pen(Qt::black, 2);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);

    for (const QVector<QPointF>& stroke : m_strokes) {
        if (stroke.size() == 1) {
            painter.drawPoint(stroke.first());
            continue;
        }
        QPainterPath path(stroke.first());
        for (int i = 1; i < stroke.size(); ++i) {
            path.lineTo(stroke.at(i));
        }
        painter.drawPath(path);
    }
}

void SignaturePad::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        return;
    }
    m_strokes.append(QVector<QPointF>{ event->position() });
    m_drawing = true;
    update();
}

void SignaturePad::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_drawing || m_strokes.isEmpty()) {
        return;
    }
    m_strokes.last().append(event->position());
    update();
}

void SignaturePad::mouseReleaseEvent(QMouseEvent* event)
{
    Q_UNUSED(event);
    if (!m_drawing) {
        return;
    }
    m_drawing = false;
    emit changed();
}
