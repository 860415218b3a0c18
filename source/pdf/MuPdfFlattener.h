#pragma once

// ============================================================================
// MuPdfFlattener - Bakes annotations into a PDF using MuPDF
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Every page that carries annotations gets one extra image XObject: the
// page's annotations painted by AnnotationRenderer onto a transparent
// layer at the export resolution. The original page content is wrapped in
// q/Q and left untouched, so text and vector content stay selectable.
// Pages without annotations are not modified at all.
//
// An empty collection returns the original bytes unchanged.
// ============================================================================

#include "PdfFlattener.h"

#include <QObject>

#ifdef PDFMARKUP_MUPDF_EXPORT

class MuPdfFlattener : public QObject {
    Q_OBJECT

public:
    explicit MuPdfFlattener(QObject* parent = nullptr);
    ~MuPdfFlattener() override = default;

    /**
     * @brief Flatten the payload into a new document.
     *
     * Blocking. The request is never modified, so a failed export can be
     * retried with the same annotations.
     */
    FlattenResult flatten(const FlattenRequest& request);

    /**
     * @brief Whether this build can flatten non-empty payloads.
     */
    static bool isAvailable() { return true; }

signals:
    void exportComplete(const QString& downloadName, qint64 sizeBytes);
    void exportFailed(const QString& errorMessage);

private:
    FlattenResult fail(const QString& message);
};

#else // PDFMARKUP_MUPDF_EXPORT not defined

/**
 * @brief Stub used when MuPDF is not available.
 *
 * Empty payloads still round-trip; anything else fails.
 */
class MuPdfFlattener : public QObject {
    Q_OBJECT

public:
    explicit MuPdfFlattener(QObject* parent = nullptr) : QObject(parent) {}

    FlattenResult flatten(const FlattenRequest& request);

    static bool isAvailable() { return false; }

signals:
    void exportComplete(const QString& downloadName, qint64 sizeBytes);
    void exportFailed(const QString& errorMessage);
};

#endif // PDFMARKUP_MUPDF_EXPORT
