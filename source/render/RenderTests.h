#pragma once

// ============================================================================
// RenderTests - Unit tests for AnnotationRenderer and RasterCache
// ============================================================================
// Part of the PdfMarkup annotation engine
// Run with: pdfmarkup --test-render
// ============================================================================

#include "AnnotationRenderer.h"
#include "RasterCache.h"
#include "../annotations/RasterAnnotations.h"
#include "../annotations/ShapeAnnotations.h"

#include <QDebug>
#include <QSignalSpy>
#include <QTest>

namespace RenderTests {

inline bool sameRgb(QRgb pixel, const QColor& color)
{
    return qAlpha(pixel) == 255 && qRed(pixel) == color.red() && qGreen(pixel) == color.green()
        && qBlue(pixel) == color.blue();
}

inline QString solidPng(const QColor& color, const QSize& size = QSize(8, 8))
{
    QImage image(size, QImage::Format_ARGB32);
    image.fill(color);
    return RasterCache::encodeDataUrl(image);
}

inline AnnotationCollection redRectangle(const QString& id)
{
    auto rect = std::make_unique<RectangleAnnotation>();
    rect->id = id;
    rect->setBoundingRect(QRectF(10, 10, 50, 30));
    rect->color = Qt::red;
    rect->strokeWidth = 4;
    return AnnotationCollection().withAdded(std::move(rect));
}

inline bool testOverlayBuffer()
{
    qDebug() << "=== Test: Overlay Buffer ===";
    bool success = true;

    AnnotationRenderer renderer;
    const QImage overlay = renderer.renderOverlay(QSizeF(100, 50.5), 2.0, AnnotationCollection(), 1);
    if (overlay.size() != QSize(200, 101)) {
        qDebug() << "FAIL: buffer should be 200x101, got" << overlay.size();
        success = false;
    }
    if (qAlpha(overlay.pixel(0, 0)) != 0 || qAlpha(overlay.pixel(150, 80)) != 0) {
        qDebug() << "FAIL: empty overlay should be transparent";
        success = false;
    }

    if (!renderer.renderOverlay(QSizeF(0, 50), 1.0, AnnotationCollection(), 1).isNull()) {
        qDebug() << "FAIL: empty content should give a null overlay";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Overlay buffer";
    }
    return success;
}

/**
 * @brief Annotations paint in content coordinates scaled by the ratio,
 *        and only on their own page.
 */
inline bool testPagePainting()
{
    qDebug() << "=== Test: Page Painting ===";
    bool success = true;

    AnnotationRenderer renderer;
    const AnnotationCollection annotations = redRectangle("r");

    QImage overlay = renderer.renderOverlay(QSizeF(100, 100), 1.0, annotations, 1);
    if (!sameRgb(overlay.pixel(10, 25), Qt::red)) {
        qDebug() << "FAIL: left edge should be red";
        success = false;
    }
    if (qAlpha(overlay.pixel(35, 25)) != 0) {
        qDebug() << "FAIL: unfilled interior should stay transparent";
        success = false;
    }

    overlay = renderer.renderOverlay(QSizeF(100, 100), 2.0, annotations, 1);
    if (!sameRgb(overlay.pixel(20, 50), Qt::red)) {
        qDebug() << "FAIL: dpr 2 should double pixel positions";
        success = false;
    }

    overlay = renderer.renderOverlay(QSizeF(100, 100), 1.0, annotations, 2);
    if (qAlpha(overlay.pixel(10, 25)) != 0) {
        qDebug() << "FAIL: page 2 should not show page 1 annotations";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Page painting";
    }
    return success;
}

inline bool testSelectionHandles()
{
    qDebug() << "=== Test: Selection Handles ===";
    bool success = true;

    AnnotationRenderer renderer;
    const AnnotationCollection annotations = redRectangle("r");

    // NW handle square spans (2, 2) to (10, 10)
    QImage overlay = renderer.renderOverlay(QSizeF(100, 100), 1.0, annotations, 1, "r");
    if (!sameRgb(overlay.pixel(5, 5), AnnotationRenderer::SELECTION_COLOR)) {
        qDebug() << "FAIL: NW handle should use the selection color";
        success = false;
    }
    // SE handle centered on (60, 40)
    if (!sameRgb(overlay.pixel(62, 42), AnnotationRenderer::SELECTION_COLOR)) {
        qDebug() << "FAIL: SE handle should use the selection color";
        success = false;
    }

    overlay = renderer.renderOverlay(QSizeF(100, 100), 1.0, annotations, 1);
    if (qAlpha(overlay.pixel(5, 5)) != 0) {
        qDebug() << "FAIL: unselected annotation has no handles";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Selection handles";
    }
    return success;
}

/**
 * @brief A bitmap that is not decoded yet is skipped along with its frame,
 *        then drawn after the cache reports it.
 */
inline bool testDeferredRaster()
{
    qDebug() << "=== Test: Deferred Raster ===";
    bool success = true;

    const QString data = solidPng(Qt::blue);
    auto image = std::make_unique<ImageAnnotation>();
    image->id = "img";
    image->data = data;
    image->setBoundingRect(QRectF(20, 20, 40, 40));
    const AnnotationCollection annotations = AnnotationCollection().withAdded(std::move(image));

    RasterCache cache;
    AnnotationRenderer renderer(&cache);
    QSignalSpy ready(&cache, &RasterCache::rasterReady);

    QImage overlay = renderer.renderOverlay(QSizeF(100, 100), 1.0, annotations, 1, "img");
    if (qAlpha(overlay.pixel(40, 40)) != 0 || qAlpha(overlay.pixel(15, 15)) != 0) {
        qDebug() << "FAIL: undecoded bitmap and its frame should not paint";
        success = false;
    }
    if (!cache.isPending(data)) {
        qDebug() << "FAIL: renderer should request a decode";
        success = false;
    }

    if (!ready.wait(5000) || ready.first().at(0).toInt() != 1) {
        qDebug() << "FAIL: rasterReady(1) not emitted";
        return false;
    }

    overlay = renderer.renderOverlay(QSizeF(100, 100), 1.0, annotations, 1, "img");
    if (!sameRgb(overlay.pixel(40, 40), Qt::blue)) {
        qDebug() << "FAIL: decoded bitmap should paint";
        success = false;
    }
    if (!sameRgb(overlay.pixel(15, 15), AnnotationRenderer::SELECTION_COLOR)) {
        qDebug() << "FAIL: frame should paint once the bitmap is ready";
        success = false;
    }

    // Without a cache bitmaps decode synchronously
    AnnotationRenderer exporter;
    overlay = exporter.renderOverlay(QSizeF(100, 100), 1.0, annotations, 1);
    if (!sameRgb(overlay.pixel(40, 40), Qt::blue)) {
        qDebug() << "FAIL: cache-less render should decode inline";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Deferred raster";
    }
    return success;
}

inline bool testRasterCacheLifecycle()
{
    qDebug() << "=== Test: Raster Cache Lifecycle ===";
    bool success = true;

    RasterCache cache;
    QSignalSpy ready(&cache, &RasterCache::rasterReady);

    // Off-page decodes are cached silently
    const QString green = solidPng(Qt::green);
    cache.setCurrentPage(1);
    cache.request(green, 3);
    for (int i = 0; i < 250 && cache.pendingCount() > 0; ++i) {
        QTest::qWait(20);
    }
    if (!cache.contains(green) || !ready.isEmpty()) {
        qDebug() << "FAIL: off-page decode should cache without rasterReady";
        success = false;
    }

    // Broken payloads are remembered and not retried
    const QString broken = QStringLiteral("data:image/png;base64,bm90IGFuIGltYWdl");
    cache.request(broken, 1);
    for (int i = 0; i < 250 && cache.pendingCount() > 0; ++i) {
        QTest::qWait(20);
    }
    if (!cache.hasFailed(broken) || cache.contains(broken)) {
        qDebug() << "FAIL: broken payload should be marked failed";
        success = false;
    }
    cache.request(broken, 1);
    if (cache.isPending(broken)) {
        qDebug() << "FAIL: failed payload should not be requested again";
        success = false;
    }

    // Clearing drops everything, including in-flight work
    cache.request(solidPng(Qt::yellow), 1);
    cache.clear();
    if (cache.pendingCount() != 0 || cache.contains(green) || cache.hasFailed(broken)) {
        qDebug() << "FAIL: clear should reset the cache";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Raster cache lifecycle";
    }
    return success;
}

/**
 * @brief A payload shown on two pages repaints whichever page is current
 *        when the shared decode finishes.
 */
inline bool testSharedPayloadAcrossPages()
{
    qDebug() << "=== Test: Shared Payload Across Pages ===";
    bool success = true;

    RasterCache cache;
    QSignalSpy ready(&cache, &RasterCache::rasterReady);
    const QString data = solidPng(Qt::magenta);

    cache.setCurrentPage(1);
    cache.request(data, 1);
    cache.setCurrentPage(2);
    cache.request(data, 2);
    if (cache.pendingCount() != 1) {
        qDebug() << "FAIL: the second page should join the running decode";
        success = false;
    }

    if (!ready.wait(5000) || ready.first().at(0).toInt() != 2) {
        qDebug() << "FAIL: rasterReady(2) not emitted for the page now shown";
        return false;
    }
    if (!cache.contains(data)) {
        qDebug() << "FAIL: decoded payload should be cached";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Shared payload across pages";
    }
    return success;
}

inline bool testDataUrls()
{
    qDebug() << "=== Test: Data URLs ===";
    bool success = true;

    QImage source(3, 2, QImage::Format_ARGB32);
    source.fill(QColor(10, 200, 30));
    const QString url = RasterCache::encodeDataUrl(source);
    if (!url.startsWith(QLatin1String("data:image/png;base64,"))) {
        qDebug() << "FAIL: encoded URL prefix:" << url.left(30);
        success = false;
    }

    const QImage decoded = RasterCache::decodeDataUrl(url);
    if (decoded.size() != QSize(3, 2) || !sameRgb(decoded.pixel(2, 1), QColor(10, 200, 30))) {
        qDebug() << "FAIL: decoded image differs";
        success = false;
    }

    if (!RasterCache::decodeDataUrl(QStringLiteral("data:image/png,abc")).isNull()
        || !RasterCache::decodeDataUrl(QStringLiteral("data:image/png;base64")).isNull()
        || !RasterCache::decodeDataUrl(QString()).isNull()) {
        qDebug() << "FAIL: malformed URLs should decode to null";
        success = false;
    }

    if (!RasterCache::encodeDataUrl(QImage()).isEmpty()) {
        qDebug() << "FAIL: null image should encode to an empty string";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Data URLs";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Render Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testOverlayBuffer();
    allPass &= testPagePainting();
    allPass &= testSelectionHandles();
    allPass &= testDeferredRaster();
    allPass &= testRasterCacheLifecycle();
    allPass &= testSharedPayloadAcrossPages();
    allPass &= testDataUrls();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace RenderTests
