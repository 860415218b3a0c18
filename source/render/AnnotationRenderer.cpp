// ============================================================================
// AnnotationRenderer - Implementation
// ============================================================================

#include "AnnotationRenderer.h"
#include "RasterCache.h"
#include "../annotations/DrawingAnnotation.h"
#include "../annotations/FormAnnotations.h"
#include "../annotations/RasterAnnotations.h"
#include "../annotations/ShapeAnnotations.h"
#include "../annotations/StampAnnotations.h"
#include "../annotations/TextAnnotations.h"
#include "../core/AnnotationToolController.h"
#include "../core/HitTesting.h"
#include "../core/ToolSettings.h"

#include <QFontMetricsF>
#include <QPainterPath>
#include <QPolygonF>
#include <QtMath>

const QColor AnnotationRenderer::SELECTION_COLOR = QColor(0x25, 0x63, 0xeb);

namespace {

const QColor CHECK_COLOR(0x16, 0xa3, 0x4a);
const QColor ERASER_PREVIEW_COLOR(0xff, 0x00, 0x00);

// Stamp fonts are specified in pixels
QFont pixelFont(const QString& family, qreal pixelSize, bool bold = false, bool italic = false)
{
    QFont font(family);
    font.setPixelSize(qMax(1, qRound(pixelSize)));
    font.setBold(bold);
    font.setItalic(italic);
    return font;
}

QPen strokePen(const QColor& color, qreal width, Qt::PenCapStyle cap = Qt::FlatCap,
               Qt::PenJoinStyle join = Qt::MiterJoin)
{
    QPen pen(color, width, Qt::SolidLine, cap, join);
    return pen;
}

void setDash(QPen& pen, qreal dash, qreal gap)
{
    // QPen dash patterns are in units of the pen width
    const qreal w = pen.widthF() > 0 ? pen.widthF() : 1.0;
    pen.setDashPattern({ dash / w, gap / w });
}

/**
 * Draw text with its top-left corner at pos.
 */
void drawTextTop(QPainter& painter, const QPointF& pos, const QString& text)
{
    const QFontMetricsF metrics(painter.font());
    painter.drawText(QPointF(pos.x(), pos.y() + metrics.ascent()), text);
}

/**
 * Draw text centered at pos (both axes).
 */
void drawTextCentered(QPainter& painter, const QPointF& pos, const QString& text)
{
    const QFontMetricsF metrics(painter.font());
    const qreal width = metrics.horizontalAdvance(text);
    const qreal baseline = pos.y() + (metrics.ascent() - metrics.descent()) / 2.0;
    painter.drawText(QPointF(pos.x() - width / 2.0, baseline), text);
}

/**
 * Horizontally centered text whose top or bottom edge sits at y.
 */
void drawTextHCentered(QPainter& painter, qreal centerX, qreal y, const QString& text, bool alignBottom)
{
    const QFontMetricsF metrics(painter.font());
    const qreal width = metrics.horizontalAdvance(text);
    const qreal baseline = alignBottom ? y - metrics.descent() : y + metrics.ascent();
    painter.drawText(QPointF(centerX - width / 2.0, baseline), text);
}

// ===== Per-variant painters =====

void paintText(QPainter& painter, const TextAnnotation& a)
{
    painter.setFont(pixelFont(a.fontFamily, a.fontSize, a.bold, a.italic));
    painter.setPen(a.color);

    const QStringList lines = a.text.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        drawTextTop(painter, QPointF(a.position.x(), a.position.y() + i * a.fontSize * TextAnnotation::LINE_HEIGHT_FACTOR),
                    lines.at(i));
    }
}

void paintDate(QPainter& painter, const DateAnnotation& a)
{
    painter.setFont(pixelFont(a.fontFamily, a.fontSize));
    painter.setPen(a.color);
    drawTextTop(painter, a.position, a.text);
}

void paintDrawing(QPainter& painter, const DrawingAnnotation& a)
{
    painter.setPen(strokePen(a.color, a.strokeWidth, Qt::RoundCap, Qt::RoundJoin));
    painter.setBrush(Qt::NoBrush);
    for (const DrawingPath& path : a.paths) {
        if (path.points.size() < 2) {
            continue;
        }
        painter.drawPolyline(path.points.constData(), path.points.size());
    }
}

void paintRectangle(QPainter& painter, const RectangleAnnotation& a)
{
    if (a.fill) {
        painter.fillRect(a.boundingRect(), a.fillColor);
    }
    painter.setPen(strokePen(a.color, a.strokeWidth));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(a.boundingRect());
}

void paintCircle(QPainter& painter, const CircleAnnotation& a)
{
    painter.setPen(strokePen(a.color, a.strokeWidth));
    painter.setBrush(a.fill ? QBrush(a.fillColor) : QBrush(Qt::NoBrush));
    painter.drawEllipse(a.boundingRect());
}

void paintLine(QPainter& painter, const SegmentAnnotation& a)
{
    painter.setPen(strokePen(a.color, a.strokeWidth));
    painter.drawLine(a.p1, a.p2);
}

QPolygonF arrowHead(const QPointF& from, const QPointF& to)
{
    const qreal angle = qAtan2(to.y() - from.y(), to.x() - from.x());
    const qreal head = ArrowAnnotation::HEAD_LENGTH;
    QPolygonF polygon;
    polygon << to
            << QPointF(to.x() - head * qCos(angle - M_PI / 6), to.y() - head * qSin(angle - M_PI / 6))
            << QPointF(to.x() - head * qCos(angle + M_PI / 6), to.y() - head * qSin(angle + M_PI / 6));
    return polygon;
}

void paintArrow(QPainter& painter, const ArrowAnnotation& a)
{
    paintLine(painter, a);
    painter.setPen(Qt::NoPen);
    painter.setBrush(a.color);
    painter.drawPolygon(arrowHead(a.p1, a.p2));
}

void paintHighlight(QPainter& painter, const HighlightAnnotation& a)
{
    painter.setOpacity(a.opacity);
    painter.fillRect(a.boundingRect(), a.color);
}

void paintStrikethrough(QPainter& painter, const StrikethroughAnnotation& a)
{
    if (a.isRedact) {
        painter.fillRect(a.boundingRect(), Qt::black);
        return;
    }
    const qreal midY = a.position.y() + a.size.height() / 2.0;
    painter.setPen(strokePen(a.color, a.strokeWidth));
    painter.drawLine(QPointF(a.position.x(), midY), QPointF(a.position.x() + a.size.width(), midY));
}

void paintCheckbox(QPainter& painter, const CheckboxAnnotation& a)
{
    painter.setPen(strokePen(Qt::black, 2));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(a.boundingRect());

    if (a.checked) {
        const qreal x = a.position.x();
        const qreal y = a.position.y();
        const qreal w = a.size.width();
        const qreal h = a.size.height();
        const QPointF tick[] = {
            QPointF(x + w * 0.2, y + h * 0.5),
            QPointF(x + w * 0.4, y + h * 0.75),
            QPointF(x + w * 0.8, y + h * 0.25)
        };
        painter.setPen(strokePen(CHECK_COLOR, 3));
        painter.drawPolyline(tick, 3);
    }
}

void paintRadio(QPainter& painter, const RadioAnnotation& a)
{
    const QPointF center = a.center();
    const qreal radius = qMin(a.size.width(), a.size.height()) / 2.0;

    painter.setPen(strokePen(Qt::black, 2));
    painter.setBrush(Qt::NoBrush);
    painter.drawEllipse(center, radius, radius);

    if (a.checked) {
        painter.setPen(Qt::NoPen);
        painter.setBrush(AnnotationRenderer::SELECTION_COLOR);
        painter.drawEllipse(center, radius * 0.5, radius * 0.5);
    }
}

void paintStamp(QPainter& painter, const StampAnnotation& a)
{
    painter.translate(a.center());
    painter.rotate(a.rotation);

    QPen pen = strokePen(a.color, 3);
    if (a.isDashed) {
        setDash(pen, 8, 4);
    }
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);

    const qreal w = a.size.width();
    const qreal h = a.size.height();
    qreal fontSize = 0;
    if (a.shape == StampShape::Circle) {
        const qreal radius = qMin(w, h) / 2.0;
        painter.drawEllipse(QPointF(0, 0), radius, radius);
        fontSize = qMin(w * 0.25, 18.0);
    } else {
        painter.drawRect(QRectF(-w / 2.0, -h / 2.0, w, h));
        fontSize = qMin(h * 0.5, 24.0);
    }

    painter.setPen(a.color);
    painter.setFont(pixelFont(QStringLiteral("Arial"), fontSize, true));
    drawTextCentered(painter, QPointF(0, 0), a.label());
}

/**
 * Characters laid out along an arc, each rotated to follow the circle.
 */
void drawCurvedText(QPainter& painter, const QPointF& center, qreal radius, const QString& text,
                    qreal startAngle, qreal step, qreal glyphRotation)
{
    for (int i = 0; i < text.length(); ++i) {
        const qreal angle = startAngle + i * step;
        const QPointF pos(center.x() + radius * qCos(angle), center.y() + radius * qSin(angle));
        painter.save();
        painter.translate(pos);
        painter.rotate(qRadiansToDegrees(angle + glyphRotation));
        drawTextCentered(painter, QPointF(0, 0), QString(text.at(i)));
        painter.restore();
    }
}

void paintSignedStampBorder(QPainter& painter, const SignedStampAnnotation& a)
{
    const QColor color = a.borderColor;
    const QRectF box = a.boundingRect();
    const QPointF center = a.center();
    const qreal radius = qMin(a.size.width(), a.size.height()) / 2.0;
    const bool circle = a.shape == StampShape::Circle;

    painter.setBrush(Qt::NoBrush);

    switch (a.stampStyle) {
        case SignedStampStyle::Official: {
            painter.setPen(strokePen(color, 3));
            if (circle) {
                painter.drawEllipse(center, radius, radius);
                painter.setPen(strokePen(color, 1.5));
                painter.drawEllipse(center, radius - 6, radius - 6);

                painter.setPen(Qt::NoPen);
                painter.setBrush(color);
                const int dotCount = 24;
                const qreal dotRadius = radius - 12;
                for (int i = 0; i < dotCount; ++i) {
                    const qreal angle = (static_cast<qreal>(i) / dotCount) * 2 * M_PI;
                    painter.drawEllipse(QPointF(center.x() + dotRadius * qCos(angle),
                                                center.y() + dotRadius * qSin(angle)), 1.0, 1.0);
                }
                painter.setBrush(Qt::NoBrush);
            } else {
                painter.drawRect(box);
                painter.setPen(strokePen(color, 1.5));
                painter.drawRect(box.adjusted(4, 4, -4, -4));
            }
            break;
        }
        case SignedStampStyle::Classic: {
            QPen pen = strokePen(color, 4);
            if (a.isDashed) {
                setDash(pen, 6, 4);
            }
            painter.setPen(pen);
            if (circle) {
                painter.drawEllipse(center, radius, radius);
                painter.setPen(strokePen(color, 1));
                painter.drawEllipse(center, radius - 8, radius - 8);
            } else {
                painter.drawRect(box);
            }
            break;
        }
        case SignedStampStyle::Modern: {
            QPen pen = strokePen(color, 2);
            if (a.isDashed) {
                setDash(pen, 6, 4);
            }
            painter.setPen(pen);
            if (circle) {
                painter.drawEllipse(center, radius, radius);
            } else {
                painter.drawRect(box);
            }
            break;
        }
    }
}

void paintSignedStampText(QPainter& painter, const SignedStampAnnotation& a)
{
    const qreal padding = 10;
    const QPointF center = a.center();
    const qreal radius = qMin(a.size.width(), a.size.height()) / 2.0;
    const QString heading = a.stampText.toUpper();
    const QString family = QStringLiteral("Arial");

    painter.setPen(a.borderColor);

    if (a.shape == StampShape::Circle) {
        if (a.textLayout == StampTextLayout::Curved) {
            painter.setFont(pixelFont(family, 10, true));
            drawCurvedText(painter, center, radius - 18, heading,
                           -M_PI / 2 - heading.length() * 0.08, 0.16, M_PI / 2);
            painter.setFont(pixelFont(family, 9));
            drawCurvedText(painter, center, radius - 18, a.dateText,
                           M_PI / 2 + a.dateText.length() * 0.06, -0.12, -M_PI / 2);
        } else {
            painter.setFont(pixelFont(family, 11, true));
            drawTextHCentered(painter, center.x(), a.position.y() + padding + 5, heading, false);
            painter.setFont(pixelFont(family, 10));
            drawTextHCentered(painter, center.x(), a.position.y() + a.size.height() - padding - 5,
                              a.dateText, true);
        }
        return;
    }

    const bool official = a.stampStyle == SignedStampStyle::Official;
    painter.setFont(pixelFont(family, official ? 14 : 12, true));
    drawTextHCentered(painter, center.x(), a.position.y() + padding, heading, false);
    painter.setFont(pixelFont(family, 11));
    drawTextHCentered(painter, center.x(), a.position.y() + a.size.height() - padding, a.dateText, true);
}

QRectF signedStampSignatureRect(const SignedStampAnnotation& a)
{
    const qreal padding = 10;
    const qreal lineHeight = 20;
    if (a.shape == StampShape::Circle) {
        const QPointF center = a.center();
        const qreal sigSize = qMin(a.size.width(), a.size.height()) / 2.0 * 0.8;
        return QRectF(center.x() - sigSize / 2.0, center.y() - sigSize / 4.0, sigSize, sigSize * 0.5);
    }
    return QRectF(a.position.x() + padding, a.position.y() + padding + lineHeight,
                  a.size.width() - padding * 2,
                  a.size.height() - lineHeight * 2 - padding * 3);
}

void applyWatermarkBorderPen(QPainter& painter, const WatermarkAnnotation& a)
{
    QPen pen = strokePen(a.borderColor, 2);
    if (a.borderStyle == WatermarkBorderStyle::Dashed) {
        setDash(pen, 8, 4);
    } else if (a.borderStyle == WatermarkBorderStyle::Dotted) {
        setDash(pen, 2, 4);
    }
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
}

} // namespace

// ============================================================================
// AnnotationRenderer
// ============================================================================

AnnotationRenderer::AnnotationRenderer(RasterCache* cache)
    : m_cache(cache)
{
}

QImage AnnotationRenderer::renderOverlay(const QSizeF& contentSize, qreal devicePixelRatio,
                                         const AnnotationCollection& annotations, int page,
                                         const QString& selectedId,
                                         const LiveGesture* gesture,
                                         const ToolSettings* settings)
{
    const QSize bufferSize(qCeil(contentSize.width() * devicePixelRatio),
                           qCeil(contentSize.height() * devicePixelRatio));
    if (bufferSize.isEmpty()) {
        return QImage();
    }

    QImage overlay(bufferSize, QImage::Format_ARGB32_Premultiplied);
    overlay.fill(Qt::transparent);

    QPainter painter(&overlay);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.scale(devicePixelRatio, devicePixelRatio);

    paintPage(painter, annotations, page, selectedId);

    if (gesture && settings && gesture->kind != LiveGesture::Kind::None) {
        paintLiveGesture(painter, *gesture, *settings);
    }

    painter.end();
    return overlay;
}

void AnnotationRenderer::paintPage(QPainter& painter, const AnnotationCollection& annotations, int page,
                                   const QString& selectedId)
{
    for (const Annotation* annotation : annotations.onPage(page)) {
        painter.save();
        const bool drawn = paintAnnotation(painter, *annotation);
        painter.restore();

        // Frame waits for the bitmap so it never outlines an empty box
        if (drawn && annotation->id == selectedId) {
            painter.save();
            paintSelection(painter, annotation->boundingRect());
            painter.restore();
        }
    }
}

bool AnnotationRenderer::paintAnnotation(QPainter& painter, const Annotation& annotation)
{
    switch (annotation.type()) {
        case AnnotationType::Text:
            paintText(painter, static_cast<const TextAnnotation&>(annotation));
            return true;

        case AnnotationType::Date:
            paintDate(painter, static_cast<const DateAnnotation&>(annotation));
            return true;

        case AnnotationType::Drawing:
            paintDrawing(painter, static_cast<const DrawingAnnotation&>(annotation));
            return true;

        case AnnotationType::Rectangle:
            paintRectangle(painter, static_cast<const RectangleAnnotation&>(annotation));
            return true;

        case AnnotationType::Circle:
            paintCircle(painter, static_cast<const CircleAnnotation&>(annotation));
            return true;

        case AnnotationType::Line:
            paintLine(painter, static_cast<const LineAnnotation&>(annotation));
            return true;

        case AnnotationType::Arrow:
            paintArrow(painter, static_cast<const ArrowAnnotation&>(annotation));
            return true;

        case AnnotationType::Highlight:
            paintHighlight(painter, static_cast<const HighlightAnnotation&>(annotation));
            return true;

        case AnnotationType::Strikethrough:
            paintStrikethrough(painter, static_cast<const StrikethroughAnnotation&>(annotation));
            return true;

        case AnnotationType::Checkbox:
            paintCheckbox(painter, static_cast<const CheckboxAnnotation&>(annotation));
            return true;

        case AnnotationType::Radio:
            paintRadio(painter, static_cast<const RadioAnnotation&>(annotation));
            return true;

        case AnnotationType::Stamp:
            paintStamp(painter, static_cast<const StampAnnotation&>(annotation));
            return true;

        case AnnotationType::Signature:
        case AnnotationType::Initials:
        case AnnotationType::Image: {
            const auto& raster = static_cast<const RasterAnnotation&>(annotation);
            const QImage image = this->raster(raster.data, raster.page);
            if (image.isNull()) {
                return false;
            }
            painter.drawImage(raster.boundingRect(), image);
            return true;
        }

        case AnnotationType::SignedStamp: {
            const auto& stamp = static_cast<const SignedStampAnnotation&>(annotation);
            const QPointF center = stamp.center();
            if (stamp.stampStyle != SignedStampStyle::Modern) {
                painter.translate(center);
                painter.rotate(qRadiansToDegrees(-0.03));
                painter.translate(-center);
            }
            if (stamp.stampStyle == SignedStampStyle::Classic) {
                painter.setOpacity(0.85);
            }
            paintSignedStampBorder(painter, stamp);
            paintSignedStampText(painter, stamp);

            const QImage signature = raster(stamp.signatureData, stamp.page);
            if (signature.isNull()) {
                return false;
            }
            painter.drawImage(signedStampSignatureRect(stamp), signature);
            return true;
        }

        case AnnotationType::Watermark: {
            const auto& watermark = static_cast<const WatermarkAnnotation&>(annotation);
            QImage image;
            if (watermark.contentType == WatermarkContentType::Image) {
                image = raster(watermark.content, watermark.page);
                if (image.isNull()) {
                    return false;
                }
            }

            painter.setOpacity(watermark.opacity);
            painter.translate(watermark.center());
            painter.rotate(watermark.rotation);

            if (watermark.contentType == WatermarkContentType::Text) {
                const QFont font = pixelFont(QStringLiteral("Arial"), watermark.fontSize, true);
                painter.setFont(font);
                painter.setPen(watermark.color);
                drawTextCentered(painter, QPointF(0, 0), watermark.content);

                if (watermark.borderStyle != WatermarkBorderStyle::None) {
                    const qreal padding = 10;
                    const qreal boxWidth = QFontMetricsF(font).horizontalAdvance(watermark.content) + padding * 2;
                    const qreal boxHeight = watermark.fontSize + padding * 2;
                    applyWatermarkBorderPen(painter, watermark);
                    painter.drawRect(QRectF(-boxWidth / 2.0, -boxHeight / 2.0, boxWidth, boxHeight));
                }
            } else {
                const QRectF target(-watermark.size.width() / 2.0, -watermark.size.height() / 2.0,
                                    watermark.size.width(), watermark.size.height());
                painter.drawImage(target, image);
                if (watermark.borderStyle != WatermarkBorderStyle::None) {
                    applyWatermarkBorderPen(painter, watermark);
                    painter.drawRect(target);
                }
            }
            return true;
        }
    }
    return true;
}

void AnnotationRenderer::paintSelection(QPainter& painter, const QRectF& bounds)
{
    QPen pen(SELECTION_COLOR, 2);
    setDash(pen, 5, 5);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.setOpacity(1.0);
    painter.drawRect(bounds.adjusted(-4, -4, 4, 4));

    static const ResizeHandle handles[] = {
        ResizeHandle::NW, ResizeHandle::NE, ResizeHandle::SW, ResizeHandle::SE
    };
    for (ResizeHandle handle : handles) {
        const QPointF anchor = HitTesting::handleAnchor(bounds, handle);
        painter.fillRect(QRectF(anchor.x() - 4, anchor.y() - 4, 8, 8), SELECTION_COLOR);
    }
}

void AnnotationRenderer::paintLiveGesture(QPainter& painter, const LiveGesture& gesture,
                                          const ToolSettings& settings)
{
    painter.save();

    switch (gesture.kind) {
        case LiveGesture::Kind::Freehand:
        case LiveGesture::Kind::Eraser: {
            if (gesture.points.size() < 2) {
                break;
            }
            const bool eraser = gesture.kind == LiveGesture::Kind::Eraser;
            QPen pen = strokePen(eraser ? ERASER_PREVIEW_COLOR : settings.strokeColor,
                                 settings.strokeWidth, Qt::RoundCap, Qt::RoundJoin);
            if (eraser) {
                setDash(pen, 5, 5);
            }
            painter.setPen(pen);
            painter.drawPolyline(gesture.points.constData(), gesture.points.size());
            break;
        }

        case LiveGesture::Kind::RubberBand: {
            const QRectF rect = QRectF(gesture.start, gesture.current).normalized();
            painter.setBrush(Qt::NoBrush);
            switch (gesture.tool) {
                case ToolType::Rectangle:
                case ToolType::Strikethrough:
                    painter.setPen(strokePen(settings.strokeColor, settings.strokeWidth));
                    painter.drawRect(rect);
                    break;
                case ToolType::Highlight:
                    painter.setOpacity(0.35);
                    painter.fillRect(rect, settings.highlightColor);
                    break;
                case ToolType::Circle:
                    painter.setPen(strokePen(settings.strokeColor, settings.strokeWidth));
                    painter.drawEllipse(rect);
                    break;
                case ToolType::Line:
                case ToolType::Arrow:
                    painter.setPen(strokePen(settings.strokeColor, settings.strokeWidth));
                    painter.drawLine(gesture.start, gesture.current);
                    if (gesture.tool == ToolType::Arrow && gesture.start != gesture.current) {
                        painter.setPen(Qt::NoPen);
                        painter.setBrush(settings.strokeColor);
                        painter.drawPolygon(arrowHead(gesture.start, gesture.current));
                    }
                    break;
                default:
                    break;
            }
            break;
        }

        case LiveGesture::Kind::None:
            break;
    }

    painter.restore();
}

QImage AnnotationRenderer::raster(const QString& dataUrl, int page)
{
    if (dataUrl.isEmpty()) {
        return QImage();
    }
    if (!m_cache) {
        return RasterCache::decodeDataUrl(dataUrl);
    }

    QImage image = m_cache->image(dataUrl);
    if (image.isNull()) {
        m_cache->request(dataUrl, page);
    }
    return image;
}
