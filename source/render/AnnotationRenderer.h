#pragma once

// ============================================================================
// AnnotationRenderer - Paints annotations, selection and live previews
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// The overlay is rendered into a QImage sized contentSize x devicePixelRatio
// with the ratio applied once as a painter scale, so every draw call below
// works in content coordinates.
//
// Bitmaps come from a RasterCache. When a bitmap is not decoded yet the
// annotation (and its selection frame) is skipped and a decode is
// requested; the cache's rasterReady signal triggers the repaint that
// draws it. Without a cache (export) bitmaps decode synchronously.
// ============================================================================

#include "../annotations/AnnotationCollection.h"

#include <QColor>
#include <QImage>
#include <QPainter>
#include <QSizeF>

class RasterCache;
struct LiveGesture;
struct ToolSettings;

class AnnotationRenderer {
public:
    /**
     * @param cache Async bitmap cache; nullptr decodes synchronously.
     */
    explicit AnnotationRenderer(RasterCache* cache = nullptr);

    /**
     * @brief Render the transparent overlay for one page.
     *
     * @param contentSize Page size in content coordinates.
     * @param devicePixelRatio Backing-store scale.
     * @param selectedId Annotation to frame with the selection border.
     * @param gesture Live gesture preview (may be nullptr).
     * @param settings Style for the live preview (may be nullptr if gesture is).
     */
    QImage renderOverlay(const QSizeF& contentSize, qreal devicePixelRatio,
                         const AnnotationCollection& annotations, int page,
                         const QString& selectedId = QString(),
                         const LiveGesture* gesture = nullptr,
                         const ToolSettings* settings = nullptr);

    /**
     * @brief Paint one page into an already scaled painter.
     */
    void paintPage(QPainter& painter, const AnnotationCollection& annotations, int page,
                   const QString& selectedId = QString());

    /**
     * @brief Paint one annotation.
     * @return false if a bitmap was not ready and drawing was deferred.
     */
    bool paintAnnotation(QPainter& painter, const Annotation& annotation);

    /**
     * @brief Dashed frame inflated by 4 plus four 8x8 corner handles.
     */
    static void paintSelection(QPainter& painter, const QRectF& bounds);

    /**
     * @brief Freehand, eraser or rubber-band preview.
     */
    static void paintLiveGesture(QPainter& painter, const LiveGesture& gesture, const ToolSettings& settings);

    static const QColor SELECTION_COLOR;  ///< #2563eb

private:
    /**
     * @brief Bitmap for a payload; requests a decode when missing.
     */
    QImage raster(const QString& dataUrl, int page);

    RasterCache* m_cache = nullptr;
};
