#include "MuPdfProvider.h"

#include <mupdf/fitz.h>

#include <QDebug>

#include <cstring>

MuPdfProvider::MuPdfProvider(const QString& pdfPath)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfProvider] Could not create a MuPDF context";
        return;
    }

    const QByteArray path = pdfPath.toUtf8();
    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
        m_doc = fz_open_document(m_ctx, path.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Could not open" << pdfPath << fz_caught_message(m_ctx);
        return;
    }

    m_locked = fz_needs_password(m_ctx, m_doc) != 0;
    if (!m_locked) {
        readDocumentInfo();
    }
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_ctx) {
        fz_drop_document(m_ctx, m_doc);
        fz_drop_context(m_ctx);
    }
}

void MuPdfProvider::readDocumentInfo()
{
    fz_page* page = nullptr;
    fz_var(page);

    fz_try(m_ctx) {
        const int count = fz_count_pages(m_ctx, m_doc);
        for (int i = 0; i < count; ++i) {
            page = fz_load_page(m_ctx, m_doc, i);
            const fz_rect bounds = fz_bound_page(m_ctx, page);
            m_pageSizes.append(QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0));
            fz_drop_page(m_ctx, page);
            page = nullptr;
        }

        char title[256] = { 0 };
        if (fz_lookup_metadata(m_ctx, m_doc, FZ_META_INFO_TITLE, title, sizeof(title)) > 0) {
            m_title = QString::fromUtf8(title);
        }
    }
    fz_catch(m_ctx) {
        fz_drop_page(m_ctx, page);
        qWarning() << "[MuPdfProvider] Could not read page geometry:" << fz_caught_message(m_ctx);
        m_pageSizes.clear();
    }

#ifdef PDFMARKUP_DEBUG
    qDebug() << "[MuPdfProvider]" << m_pageSizes.size() << "pages";
#endif
}

bool MuPdfProvider::isValid() const
{
    return m_doc && !m_locked && !m_pageSizes.isEmpty();
}

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    return m_pageSizes.value(pageIndex);
}

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
        return QImage();
    }

    const float zoom = static_cast<float>(dpi / 72.0);
    fz_pixmap* pixmap = nullptr;
    fz_var(pixmap);
    QImage image;

    fz_try(m_ctx) {
        // RGB without alpha, composited on white by MuPDF
        pixmap = fz_new_pixmap_from_page_number(m_ctx, m_doc, pageIndex, fz_scale(zoom, zoom),
                                                fz_device_rgb(m_ctx), 0);

        const int width = fz_pixmap_width(m_ctx, pixmap);
        const int height = fz_pixmap_height(m_ctx, pixmap);
        const int stride = static_cast<int>(fz_pixmap_stride(m_ctx, pixmap));
        const unsigned char* samples = fz_pixmap_samples(m_ctx, pixmap);

        image = QImage(width, height, QImage::Format_RGB888);
        for (int y = 0; y < height; ++y) {
            std::memcpy(image.scanLine(y), samples + static_cast<size_t>(y) * stride,
                        static_cast<size_t>(width) * 3);
        }
    }
    fz_always(m_ctx) {
        fz_drop_pixmap(m_ctx, pixmap);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Page" << pageIndex << "failed to render:" << fz_caught_message(m_ctx);
        return QImage();
    }

    return image;
}
