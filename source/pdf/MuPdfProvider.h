#pragma once

// ============================================================================
// MuPdfProvider - PdfProvider backed by MuPDF
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Built with PDFMARKUP_USE_MUPDF, for platforms without Poppler.
// ============================================================================

#include "PdfProvider.h"

#include <QVector>

struct fz_context;
struct fz_document;

class MuPdfProvider : public PdfProvider {
public:
    explicit MuPdfProvider(const QString& pdfPath);
    ~MuPdfProvider() override;

    MuPdfProvider(const MuPdfProvider&) = delete;
    MuPdfProvider& operator=(const MuPdfProvider&) = delete;

    bool isValid() const override;
    bool isLocked() const override { return m_locked; }
    int pageCount() const override { return m_pageSizes.size(); }
    QString title() const override { return m_title; }

    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    void readDocumentInfo();

    fz_context* m_ctx = nullptr;
    fz_document* m_doc = nullptr;
    bool m_locked = false;
    QString m_title;
    QVector<QSizeF> m_pageSizes;
};
