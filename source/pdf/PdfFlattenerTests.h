#pragma once

// ============================================================================
// PdfFlattenerTests - Unit tests for the export payload and MuPdfFlattener
// ============================================================================
// Part of the PdfMarkup annotation engine
// Run with: pdfmarkup --test-serialization
//
// Current tests:
// - coordinate normalization by canvas scale
// - payload parsing and identity results
// - flattening a generated PDF (skipped when built without MuPDF)
// ============================================================================

#include "MuPdfFlattener.h"
#include "PdfFlattener.h"
#include "PdfProvider.h"
#include "../annotations/AnnotationCollection.h"
#include "../annotations/ShapeAnnotations.h"

#include <QBuffer>
#include <QDebug>
#include <QFile>
#include <QJsonObject>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QSignalSpy>
#include <QTemporaryDir>

namespace PdfFlattenerTests {

inline QByteArray generatePdf(int pages)
{
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);

    QPdfWriter writer(&buffer);
    writer.setPageSize(QPageSize(QPageSize::A4));
    QPainter painter(&writer);
    for (int i = 0; i < pages; ++i) {
        if (i > 0) {
            writer.newPage();
        }
        painter.drawText(200, 200, QString("Page %1").arg(i + 1));
    }
    painter.end();
    return bytes;
}

inline AnnotationCollection rectangleOn(int page, const QString& id)
{
    auto rect = std::make_unique<RectangleAnnotation>();
    rect->id = id;
    rect->page = page;
    rect->setBoundingRect(QRectF(150, 150, 300, 120));
    rect->color = Qt::red;
    rect->strokeWidth = 3;
    return AnnotationCollection().withAdded(std::move(rect));
}

/**
 * @brief Geometric fields are divided by the canvas scale; the rest stay.
 */
inline bool testNormalizeAnnotations()
{
    qDebug() << "=== Test: normalizeAnnotations() ===";
    bool success = true;

    QJsonObject point{ { "x", 3 }, { "y", 6 } };
    QJsonObject obj{
        { "type", "drawing" }, { "id", "d" }, { "page", 2 },
        { "x", 15 }, { "y", 30 }, { "width", 150 }, { "height", 45 },
        { "fontSize", 21 }, { "strokeWidth", 3 }, { "x1", 3 }, { "y2", 4.5 },
        { "color", "#ff0000" }, { "rotation", -15 }, { "label", "12" },
        { "paths", QJsonArray{ QJsonObject{ { "points", QJsonArray{ point } } } } }
    };

    const QJsonObject out = PdfFlattenPayload::normalizeAnnotations(QJsonArray{ obj }, 1.5).at(0).toObject();

    const struct {
        const char* key;
        double expected;
    } scaled[] = {
        { "x", 10 }, { "y", 20 }, { "width", 100 }, { "height", 30 },
        { "fontSize", 14 }, { "strokeWidth", 2 }, { "x1", 2 }, { "y2", 3 },
    };
    for (const auto& s : scaled) {
        if (qAbs(out.value(QLatin1String(s.key)).toDouble() - s.expected) > 1e-9) {
            qDebug() << "FAIL:" << s.key << "should be" << s.expected << "got" << out.value(QLatin1String(s.key));
            success = false;
        }
    }

    const QJsonObject outPoint = out["paths"].toArray().at(0).toObject()["points"].toArray().at(0).toObject();
    if (qAbs(outPoint["x"].toDouble() - 2) > 1e-9 || qAbs(outPoint["y"].toDouble() - 4) > 1e-9) {
        qDebug() << "FAIL: path point should be (2,4), got" << outPoint;
        success = false;
    }

    if (out["page"].toInt() != 2 || out["rotation"].toDouble() != -15 || out["color"].toString() != QLatin1String("#ff0000")
        || out["label"].toString() != QLatin1String("12") || out["id"].toString() != QLatin1String("d")) {
        qDebug() << "FAIL: non-geometric fields should be untouched";
        success = false;
    }
    if (out.contains("y1")) {
        qDebug() << "FAIL: absent fields should stay absent";
        success = false;
    }

    // A string where a number belongs is left as is
    const QJsonObject odd = PdfFlattenPayload::normalizeAnnotations(
        QJsonArray{ QJsonObject{ { "x", "12" } } }, 2.0).at(0).toObject();
    if (odd["x"].toString() != QLatin1String("12")) {
        qDebug() << "FAIL: non-numeric x should be untouched";
        success = false;
    }

    // Scale 1 and non-positive scales are the identity
    const QJsonArray input{ obj };
    if (PdfFlattenPayload::normalizeAnnotations(input, 1.0) != input
        || PdfFlattenPayload::normalizeAnnotations(input, 0) != input
        || PdfFlattenPayload::normalizeAnnotations(input, -2) != input) {
        qDebug() << "FAIL: scale 1, 0 and negative should be the identity";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: normalizeAnnotations()";
    }
    return success;
}

inline bool testParseAnnotations()
{
    qDebug() << "=== Test: parseAnnotations() ===";
    bool success = true;

    AnnotationCollection annotations = rectangleOn(1, "r");
    QString error;

    if (!PdfFlattenPayload::parseAnnotations("  ", &annotations, &error) || !annotations.isEmpty()) {
        qDebug() << "FAIL: blank payload should parse to an empty collection";
        success = false;
    }

    if (PdfFlattenPayload::parseAnnotations("[{\"type\":", &annotations, &error)
        || !error.startsWith(QLatin1String("Invalid annotation payload"))) {
        qDebug() << "FAIL: truncated JSON should be rejected, error" << error;
        success = false;
    }

    error.clear();
    if (PdfFlattenPayload::parseAnnotations("{\"type\":\"rectangle\"}", &annotations, &error)
        || !error.contains("expected an array")) {
        qDebug() << "FAIL: object payload should be rejected, error" << error;
        success = false;
    }

    const AnnotationCollection original = rectangleOn(3, "r3");
    const FlattenRequest request = PdfFlattenPayload::buildRequest("%PDF-1.4", original, 1.5);
    if (request.canvasScale != 1.5 || request.document != "%PDF-1.4" || request.exportDpi != 150) {
        qDebug() << "FAIL: buildRequest fields";
        success = false;
    }
    if (!PdfFlattenPayload::parseAnnotations(request.annotationsJson, &annotations, &error)
        || annotations != original) {
        qDebug() << "FAIL: request payload should parse back to the collection";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: parseAnnotations()";
    }
    return success;
}

inline bool testIdentityResult()
{
    qDebug() << "=== Test: Identity Result ===";
    bool success = true;

    const QByteArray document = generatePdf(1);
    const FlattenResult result = PdfFlattenPayload::identityResult(document);
    if (!result.success || result.document != document || result.sizeBytes != document.size()
        || result.pagesFlattened != 0 || result.downloadName != QLatin1String("filled.pdf")) {
        qDebug() << "FAIL: identity result fields";
        success = false;
    }

    // Empty collections never touch the document, with or without MuPDF
    MuPdfFlattener flattener;
    QSignalSpy complete(&flattener, &MuPdfFlattener::exportComplete);
    FlattenRequest request;
    request.document = document;
    request.annotationsJson = "[]";
    const FlattenResult flattened = flattener.flatten(request);
    if (!flattened.success || flattened.document != document || complete.count() != 1) {
        qDebug() << "FAIL: empty payload should return the original bytes";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Identity result";
    }
    return success;
}

inline bool testFlattenDocument()
{
    qDebug() << "=== Test: Flatten Document ===";
    bool success = true;

    MuPdfFlattener flattener;
    QSignalSpy failed(&flattener, &MuPdfFlattener::exportFailed);

    AnnotationCollection annotations = rectangleOn(1, "a");
    annotations = annotations.withAdded(rectangleOn(9, "beyond").find("beyond")->clone());
    const QByteArray document = generatePdf(2);
    const FlattenRequest request = PdfFlattenPayload::buildRequest(document, annotations, 1.5);

    if (!MuPdfFlattener::isAvailable()) {
        const FlattenResult result = flattener.flatten(request);
        if (result.success || result.errorMessage.isEmpty() || failed.count() != 1) {
            qDebug() << "FAIL: flatten without MuPDF should fail with a message";
            success = false;
        }
        qDebug() << "SKIP: MuPDF not available, flattening not exercised";
        return success;
    }

    const FlattenResult result = flattener.flatten(request);
    if (!result.success) {
        qDebug() << "FAIL: flatten failed:" << result.errorMessage;
        return false;
    }
    if (result.pagesFlattened != 1 || !result.document.startsWith("%PDF")
        || result.sizeBytes != result.document.size()) {
        qDebug() << "FAIL: expected one flattened page, got" << result.pagesFlattened;
        success = false;
    }

    // Output must still open with the same page count
    QTemporaryDir dir;
    const QString path = dir.filePath("flattened.pdf");
    QFile file(path);
    if (!dir.isValid() || !file.open(QIODevice::WriteOnly) || file.write(result.document) != result.document.size()) {
        qDebug() << "FAIL: could not write flattened output";
        return false;
    }
    file.close();

    QString error;
    std::unique_ptr<PdfProvider> provider = PdfProvider::open(path, &error);
    if (!provider || provider->pageCount() != 2) {
        qDebug() << "FAIL: flattened PDF should reopen with 2 pages:" << error;
        success = false;
    }

    // Garbage input fails cleanly
    FlattenRequest broken = request;
    broken.document = "not a pdf";
    if (flattener.flatten(broken).success || failed.count() != 1) {
        qDebug() << "FAIL: invalid document should fail with exportFailed";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Flatten document";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Export Payload Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testNormalizeAnnotations();
    allPass &= testParseAnnotations();
    allPass &= testIdentityResult();
    allPass &= testFlattenDocument();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PdfFlattenerTests
