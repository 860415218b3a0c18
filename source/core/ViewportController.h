#pragma once

// ============================================================================
// ViewportController - Document, page navigation, zoom and page bitmaps
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Pages are rasterized once per page change at RENDER_SCALE x device pixel
// ratio. Zoom is a pure display scale applied by the canvas and never
// re-rasterizes.
//
// Rasterization runs on the global thread pool with a thread-local
// PdfProvider. Each request bumps a generation counter; a finished task
// whose generation is no longer current is ignored, so cancelling a
// superseded task is only advisory.
// ============================================================================

#include "../geometry/CoordinateTransform.h"

#include <QByteArray>
#include <QFutureWatcher>
#include <QImage>
#include <QList>
#include <QObject>
#include <QSizeF>
#include <QString>
#include <QVector>

class Environment;

/**
 * @brief Output of one background page render.
 */
struct PageRasterResult {
    QImage image;
    QString errorMessage;   ///< Set when image is null
};

class ViewportController : public QObject {
    Q_OBJECT

public:
    static constexpr qreal RENDER_SCALE = 1.5;   ///< Content pixels per PDF point
    static constexpr qreal MIN_ZOOM = 0.3;
    static constexpr qreal MAX_ZOOM = 2.0;
    static constexpr qreal ZOOM_STEP = 0.1;
    static constexpr int NARROW_WINDOW_WIDTH = 768;
    static constexpr qreal NARROW_INITIAL_ZOOM = 0.4;
    static constexpr qreal FIT_WIDTH_MARGIN = 32;

    /**
     * @param environment Display properties; must outlive the controller.
     */
    explicit ViewportController(const Environment* environment, QObject* parent = nullptr);
    ~ViewportController() override;

    // ===== Document =====

    /**
     * @brief Open a PDF and show its first page.
     *
     * Resets page and zoom, records the page sizes and reads the original
     * bytes (kept for export). Rasterization of page 1 starts immediately.
     * @return false with errorMessage set if the file cannot be opened.
     */
    bool loadDocument(const QString& path, QString* errorMessage = nullptr);

    /**
     * @brief Drop the document and any in-flight rasterization.
     */
    void closeDocument();

    bool hasDocument() const { return !m_pageSizes.isEmpty(); }
    QString documentPath() const { return m_documentPath; }
    QString documentTitle() const { return m_documentTitle; }
    QByteArray documentBytes() const { return m_documentBytes; }
    int pageCount() const { return m_pageSizes.size(); }

    // ===== Navigation =====

    int currentPage() const { return m_currentPage; }

    /**
     * @brief Go to a 1-based page, clamped to [1, pageCount].
     * @return true if the page changed.
     */
    bool setCurrentPage(int page);
    bool nextPage() { return setCurrentPage(m_currentPage + 1); }
    bool previousPage() { return setCurrentPage(m_currentPage - 1); }

    // ===== Zoom =====

    qreal zoom() const { return m_zoom; }
    void setZoom(qreal zoom);
    void zoomIn() { setZoom(m_zoom + ZOOM_STEP); }
    void zoomOut() { setZoom(m_zoom - ZOOM_STEP); }
    void resetZoom() { setZoom(1.0); }

    /**
     * @brief Zoom so the page fills the container minus a 32 px margin.
     */
    void fitToWidth(qreal containerWidth);

    static qreal clampZoom(qreal zoom);

    /**
     * @brief 0.4 on windows narrower than 768, otherwise 1.0.
     */
    static qreal initialZoom(const Environment& environment);

    // ===== Geometry =====

    /**
     * @brief Page size in PDF points (1-based page).
     */
    QSizeF pageSizePoints(int page) const;

    /**
     * @brief Zoom-free size of the current page in content coordinates.
     */
    QSizeF contentSize() const;

    /**
     * @brief On-screen size of the current page (content size x zoom).
     */
    QSizeF displaySize() const { return contentSize() * m_zoom; }

    /**
     * @brief Transform for an overlay displayed at the given rect.
     */
    CoordinateTransform transform(const QRectF& overlayRect) const {
        return CoordinateTransform(overlayRect, contentSize());
    }

    // ===== Page Bitmap =====

    /**
     * @brief Bitmap of the current page, null until rasterization finishes.
     *
     * Its devicePixelRatio is set so it paints at contentSize().
     */
    QImage pageImage() const { return m_pageImage; }

    bool isRasterizing() const { return !m_watchers.isEmpty(); }

signals:
    void documentLoaded(int pageCount);
    void documentClosed();
    void pageChanged(int page);
    void zoomChanged(qreal zoom);
    void pageRasterized(int page);
    void rasterizationFailed(int page, const QString& message);

private:
    /**
     * @brief Start rendering the current page, superseding earlier requests.
     */
    void requestRasterization();
    void cancelRasterization();

    const Environment* m_environment = nullptr;

    QString m_documentPath;
    QString m_documentTitle;
    QByteArray m_documentBytes;
    QVector<QSizeF> m_pageSizes;   ///< Points, index = page - 1

    int m_currentPage = 1;
    qreal m_zoom = 1.0;
    bool m_autoFitPending = false; ///< Narrow windows fit to width after the first render

    QImage m_pageImage;
    quint64 m_renderGeneration = 0;
    QList<QFutureWatcher<PageRasterResult>*> m_watchers;
};
