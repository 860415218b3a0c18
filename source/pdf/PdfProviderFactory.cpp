// ============================================================================
// PdfProviderFactory - Picks the compiled-in PdfProvider backend
// ============================================================================
// Poppler-Qt6 unless built with PDFMARKUP_USE_MUPDF.
// ============================================================================

#include "PdfProvider.h"

#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>

#ifdef PDFMARKUP_USE_MUPDF
#include "MuPdfProvider.h"
using BackendProvider = MuPdfProvider;
#else
#include "PopplerPdfProvider.h"
using BackendProvider = PopplerPdfProvider;
#endif

std::unique_ptr<PdfProvider> PdfProvider::create(const QString& pdfPath)
{
    return open(pdfPath, nullptr);
}

std::unique_ptr<PdfProvider> PdfProvider::open(const QString& pdfPath, QString* errorMessage)
{
    QString reason;
    std::unique_ptr<PdfProvider> provider;

    if (!QFileInfo(pdfPath).isFile()) {
        reason = QCoreApplication::translate("PdfProvider", "File not found: %1").arg(pdfPath);
    } else {
        provider = std::make_unique<BackendProvider>(pdfPath);
        if (provider->isLocked()) {
            reason = QCoreApplication::translate("PdfProvider", "The document is password protected.");
        } else if (!provider->isValid()) {
            reason = QCoreApplication::translate("PdfProvider", "Could not open PDF: %1").arg(pdfPath);
        }
    }

    if (reason.isEmpty()) {
        return provider;
    }
    qWarning() << "[PdfProvider]" << reason;
    if (errorMessage) {
        *errorMessage = reason;
    }
    return nullptr;
}
