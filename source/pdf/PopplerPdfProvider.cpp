#include "PopplerPdfProvider.h"

#include <QDebug>

PopplerPdfProvider::PopplerPdfProvider(const QString& pdfPath)
    : m_document(Poppler::Document::load(pdfPath))
{
    if (!m_document || m_document->isLocked()) {
        return;
    }

    m_document->setRenderHint(Poppler::Document::Antialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextAntialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextSlightHinting, true);
    m_document->setPaperColor(Qt::white);

    const int count = m_document->numPages();
    m_pageSizes.reserve(count);
    for (int i = 0; i < count; ++i) {
        const std::unique_ptr<Poppler::Page> page = m_document->page(i);
        m_pageSizes.append(page ? page->pageSizeF() : QSizeF());
    }
}

bool PopplerPdfProvider::isValid() const
{
    return m_document && !m_document->isLocked() && !m_pageSizes.isEmpty();
}

bool PopplerPdfProvider::isLocked() const
{
    return m_document && m_document->isLocked();
}

QString PopplerPdfProvider::title() const
{
    return isValid() ? m_document->title() : QString();
}

QSizeF PopplerPdfProvider::pageSize(int pageIndex) const
{
    return m_pageSizes.value(pageIndex);
}

QImage PopplerPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
        return QImage();
    }

    const std::unique_ptr<Poppler::Page> page = m_document->page(pageIndex);
    if (!page) {
        qWarning() << "[PopplerPdfProvider] Page" << pageIndex << "could not be loaded";
        return QImage();
    }
#ifdef PDFMARKUP_DEBUG
    qDebug() << "[PopplerPdfProvider] Rendering page" << pageIndex << "at" << dpi << "dpi";
#endif
    return page->renderToImage(dpi, dpi);
}
