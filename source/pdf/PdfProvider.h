#pragma once

// ============================================================================
// PdfProvider - Read-only access to the pages of the document being marked up
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// The markup editor only needs page geometry and page bitmaps. Poppler-Qt6
// backs the default build; PDFMARKUP_USE_MUPDF switches to MuPDF.
//
// A provider must only be used from the thread that created it. The
// rasterization worker opens its own instance for every page request.
// ============================================================================

#include <QImage>
#include <QSizeF>
#include <QString>
#include <memory>

class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    /**
     * @brief Parsed, unlocked and at least one page long.
     */
    virtual bool isValid() const = 0;

    virtual bool isLocked() const = 0;

    virtual int pageCount() const = 0;

    /// Info dictionary title, empty when absent.
    virtual QString title() const = 0;

    /**
     * @brief Size of a page in points.
     * @param pageIndex 0-based.
     * @return Empty size when the index is out of range.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    /**
     * @brief Rasterize a page on an opaque white background.
     * @param pageIndex 0-based.
     * @param dpi 72 renders one pixel per point.
     * @return Null image on failure.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    /**
     * @brief Open with the compiled-in backend, nullptr when unusable.
     */
    static std::unique_ptr<PdfProvider> create(const QString& pdfPath);

    /**
     * @brief Like create(), with a user-facing reason on failure.
     */
    static std::unique_ptr<PdfProvider> open(const QString& pdfPath, QString* errorMessage);
};
