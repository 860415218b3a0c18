#pragma once

// ============================================================================
// PopplerPdfProvider - PdfProvider backed by Poppler-Qt6
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include "PdfProvider.h"

#include <QVector>
#include <poppler/qt6/poppler-qt6.h>
#include <memory>

class PopplerPdfProvider : public PdfProvider {
public:
    explicit PopplerPdfProvider(const QString& pdfPath);

    bool isValid() const override;
    bool isLocked() const override;
    int pageCount() const override { return m_pageSizes.size(); }
    QString title() const override;

    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    std::unique_ptr<Poppler::Document> m_document;
    QVector<QSizeF> m_pageSizes;   ///< Read once when the document opens
};
