// ============================================================================
// ViewportController - Implementation
// ============================================================================

#include "ViewportController.h"
#include "../geometry/Environment.h"
#include "../pdf/PdfProvider.h"

#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QtConcurrent>
#include <QtMath>

ViewportController::ViewportController(const Environment* environment, QObject* parent)
    : QObject(parent)
    , m_environment(environment)
{
    if (m_environment) {
        m_zoom = initialZoom(*m_environment);
    }
}

ViewportController::~ViewportController()
{
    cancelRasterization();
}

// ===== Document =====

bool ViewportController::loadDocument(const QString& path, QString* errorMessage)
{
    closeDocument();

    QString error;
    std::unique_ptr<PdfProvider> provider = PdfProvider::open(path, &error);
    if (!provider) {
        qWarning() << "[ViewportController] Load failed:" << error;
        if (errorMessage) {
            *errorMessage = error;
        }
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = tr("Could not read %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    m_documentBytes = file.readAll();
    file.close();

    const int count = provider->pageCount();
    m_pageSizes.reserve(count);
    for (int i = 0; i < count; ++i) {
        m_pageSizes.append(provider->pageSize(i));
    }

    m_documentPath = path;
    m_documentTitle = provider->title();
    m_currentPage = 1;
    m_zoom = m_environment ? initialZoom(*m_environment) : 1.0;
    m_autoFitPending = m_environment && m_environment->windowWidth() < NARROW_WINDOW_WIDTH;

    qDebug() << "[ViewportController] Loaded" << path << "with" << count << "pages";

    emit documentLoaded(count);
    emit pageChanged(m_currentPage);
    emit zoomChanged(m_zoom);

    requestRasterization();
    return true;
}

void ViewportController::closeDocument()
{
    cancelRasterization();
    ++m_renderGeneration;

    const bool hadDocument = hasDocument();
    m_documentPath.clear();
    m_documentTitle.clear();
    m_documentBytes.clear();
    m_pageSizes.clear();
    m_pageImage = QImage();
    m_currentPage = 1;
    m_autoFitPending = false;

    if (hadDocument) {
        emit documentClosed();
    }
}

// ===== Navigation =====

bool ViewportController::setCurrentPage(int page)
{
    if (!hasDocument()) {
        return false;
    }

    const int clamped = qBound(1, page, pageCount());
    if (clamped == m_currentPage) {
        return false;
    }

    m_currentPage = clamped;
    m_pageImage = QImage();
    emit pageChanged(m_currentPage);

    requestRasterization();
    return true;
}

// ===== Zoom =====

void ViewportController::setZoom(qreal zoom)
{
    const qreal clamped = clampZoom(zoom);
    if (qFuzzyCompare(clamped, m_zoom)) {
        return;
    }
    m_zoom = clamped;
    emit zoomChanged(m_zoom);
}

void ViewportController::fitToWidth(qreal containerWidth)
{
    const QSizeF content = contentSize();
    if (content.width() <= 0) {
        return;
    }
    setZoom((containerWidth - FIT_WIDTH_MARGIN) / content.width());
}

qreal ViewportController::clampZoom(qreal zoom)
{
    // Hundredths keep repeated steps from drifting (1.0 + 0.1 * 3 == 1.3)
    const qreal rounded = qRound(zoom * 100.0) / 100.0;
    return qBound(MIN_ZOOM, rounded, MAX_ZOOM);
}

qreal ViewportController::initialZoom(const Environment& environment)
{
    return environment.windowWidth() < NARROW_WINDOW_WIDTH ? NARROW_INITIAL_ZOOM : 1.0;
}

// ===== Geometry =====

QSizeF ViewportController::pageSizePoints(int page) const
{
    if (page < 1 || page > m_pageSizes.size()) {
        return QSizeF();
    }
    return m_pageSizes.at(page - 1);
}

QSizeF ViewportController::contentSize() const
{
    return pageSizePoints(m_currentPage) * RENDER_SCALE;
}

// ===== Rasterization =====

void ViewportController::requestRasterization()
{
    if (!hasDocument()) {
        return;
    }

    // Superseded tasks run to completion; their results fail the generation check
    for (QFutureWatcher<PageRasterResult>* watcher : m_watchers) {
        watcher->cancel();
    }

    const quint64 generation = ++m_renderGeneration;
    const int page = m_currentPage;
    const QString path = m_documentPath;
    const qreal dpr = m_environment ? m_environment->devicePixelRatio() : 1.0;
    const qreal dpi = 72.0 * RENDER_SCALE * dpr;

    QFutureWatcher<PageRasterResult>* watcher = new QFutureWatcher<PageRasterResult>(this);
    m_watchers.append(watcher);

    connect(watcher, &QFutureWatcher<PageRasterResult>::finished, this, [this, watcher, generation, page, dpr]() {
        m_watchers.removeOne(watcher);
        watcher->deleteLater();

        if (generation != m_renderGeneration || page != m_currentPage || watcher->isCanceled()) {
#ifdef PDFMARKUP_DEBUG
            qDebug() << "[ViewportController] Dropping stale render of page" << page;
#endif
            return;
        }

        PageRasterResult result = watcher->result();
        if (result.image.isNull()) {
            qWarning() << "[ViewportController] Rasterization failed for page" << page
                       << "-" << result.errorMessage;
            emit rasterizationFailed(page, result.errorMessage);
            return;
        }

        result.image.setDevicePixelRatio(dpr);
        m_pageImage = result.image;

        if (m_autoFitPending && m_environment) {
            m_autoFitPending = false;
            fitToWidth(m_environment->windowWidth());
        }

        emit pageRasterized(page);
    });

    // Providers are not thread-safe; the task opens its own copy of the document
    QFuture<PageRasterResult> future = QtConcurrent::run([path, page, dpi]() -> PageRasterResult {
        PageRasterResult result;
        std::unique_ptr<PdfProvider> provider = PdfProvider::create(path);
        if (!provider) {
            result.errorMessage = QCoreApplication::translate("ViewportController", "Could not open %1").arg(path);
            return result;
        }
        result.image = provider->renderPageToImage(page - 1, dpi);
        if (result.image.isNull()) {
            result.errorMessage = QCoreApplication::translate("ViewportController", "Failed to render page %1").arg(page);
        }
        return result;
    });
    watcher->setFuture(future);
}

void ViewportController::cancelRasterization()
{
    for (QFutureWatcher<PageRasterResult>* watcher : m_watchers) {
        watcher->disconnect(this);
        watcher->cancel();
        watcher->waitForFinished();
        delete watcher;
    }
    m_watchers.clear();
}
