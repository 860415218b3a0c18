#ifndef VIEWPORTTESTS_H
#define VIEWPORTTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QTemporaryDir>
#include "ViewportController.h"
#include "../geometry/Environment.h"

/**
 * Document, navigation and zoom tests for ViewportController.
 * Run with: pdfmarkup --test-viewport
 *
 * Uses a two-page Letter PDF written with QPdfWriter, so pages measure
 * 612 x 792 points and 918 x 1188 content pixels.
 */
class ViewportTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    QString m_pdfPath;

    static bool fuzzy(qreal a, qreal b, qreal tolerance = 0.5) {
        return qAbs(a - b) <= tolerance;
    }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
        m_pdfPath = m_dir.filePath("two-pages.pdf");

        QPdfWriter writer(m_pdfPath);
        writer.setPageSize(QPageSize(QPageSize::Letter));
        writer.setTitle("Viewport Test");
        QPainter painter(&writer);
        QVERIFY(painter.isActive());
        painter.drawText(100, 100, "Page one");
        writer.newPage();
        painter.drawText(100, 100, "Page two");
        painter.end();
    }

    void testClampZoom() {
        QCOMPARE(ViewportController::clampZoom(0.1), 0.3);
        QCOMPARE(ViewportController::clampZoom(5.0), 2.0);
        QCOMPARE(ViewportController::clampZoom(1.234), 1.23);
        QCOMPARE(ViewportController::clampZoom(0.3 + 0.1 + 0.1), 0.5);
    }

    void testInitialZoom() {
        FixedEnvironment wide;
        QCOMPARE(ViewportController::initialZoom(wide), 1.0);
        FixedEnvironment narrow(1.0, 600);
        QCOMPARE(ViewportController::initialZoom(narrow), 0.4);

        ViewportController viewport(&narrow);
        QCOMPARE(viewport.zoom(), 0.4);
    }

    void testZoomSteps() {
        FixedEnvironment env;
        ViewportController viewport(&env);
        QSignalSpy spy(&viewport, &ViewportController::zoomChanged);

        viewport.zoomIn();
        viewport.zoomIn();
        viewport.zoomIn();
        QCOMPARE(viewport.zoom(), 1.3);
        QCOMPARE(spy.count(), 3);

        viewport.setZoom(10);
        QCOMPARE(viewport.zoom(), 2.0);
        viewport.zoomIn();
        QCOMPARE(spy.count(), 4);

        viewport.resetZoom();
        QCOMPARE(viewport.zoom(), 1.0);
    }

    void testLoadFailure() {
        FixedEnvironment env;
        ViewportController viewport(&env);
        QSignalSpy loaded(&viewport, &ViewportController::documentLoaded);

        QString error;
        QVERIFY(!viewport.loadDocument(m_dir.filePath("missing.pdf"), &error));
        QVERIFY(!error.isEmpty());
        QVERIFY(!viewport.hasDocument());
        QCOMPARE(loaded.count(), 0);
        QVERIFY(!viewport.setCurrentPage(2));
    }

    void testLoadAndRasterize() {
        FixedEnvironment env;
        ViewportController viewport(&env);
        QSignalSpy loaded(&viewport, &ViewportController::documentLoaded);
        QSignalSpy rasterized(&viewport, &ViewportController::pageRasterized);

        QString error;
        QVERIFY2(viewport.loadDocument(m_pdfPath, &error), qPrintable(error));
        QCOMPARE(loaded.count(), 1);
        QCOMPARE(loaded.takeFirst().at(0).toInt(), 2);
        QCOMPARE(viewport.pageCount(), 2);
        QCOMPARE(viewport.currentPage(), 1);
        QVERIFY(!viewport.documentBytes().isEmpty());
        QVERIFY(viewport.documentBytes().startsWith("%PDF"));

        QVERIFY(fuzzy(viewport.pageSizePoints(1).width(), 612));
        QVERIFY(fuzzy(viewport.pageSizePoints(1).height(), 792));
        QVERIFY(fuzzy(viewport.contentSize().width(), 918));
        QVERIFY(fuzzy(viewport.contentSize().height(), 1188));
        QVERIFY(viewport.pageSizePoints(3).isEmpty());

        QVERIFY(rasterized.wait(10000));
        QCOMPARE(rasterized.takeFirst().at(0).toInt(), 1);
        const QImage image = viewport.pageImage();
        QVERIFY(!image.isNull());
        QVERIFY(fuzzy(image.width(), 918, 2));
        QVERIFY(fuzzy(image.height(), 1188, 2));
        QVERIFY(!viewport.isRasterizing());

        viewport.closeDocument();
        QVERIFY(!viewport.hasDocument());
        QVERIFY(viewport.pageImage().isNull());
    }

    void testNavigation() {
        FixedEnvironment env;
        ViewportController viewport(&env);
        QVERIFY(viewport.loadDocument(m_pdfPath));
        QSignalSpy changed(&viewport, &ViewportController::pageChanged);
        QSignalSpy rasterized(&viewport, &ViewportController::pageRasterized);

        QVERIFY(!viewport.previousPage());
        QVERIFY(viewport.nextPage());
        QCOMPARE(viewport.currentPage(), 2);
        QCOMPARE(changed.count(), 1);

        // Out of range requests clamp to the last page
        QVERIFY(!viewport.setCurrentPage(7));
        QCOMPARE(viewport.currentPage(), 2);

        // Only the page that is still current gets reported
        QTRY_VERIFY_WITH_TIMEOUT(!viewport.isRasterizing(), 10000);
        QVERIFY(!rasterized.isEmpty());
        QCOMPARE(rasterized.last().at(0).toInt(), 2);
        QVERIFY(!viewport.pageImage().isNull());

        QVERIFY(viewport.setCurrentPage(0));
        QCOMPARE(viewport.currentPage(), 1);
    }

    void testNarrowWindowFitsAfterFirstRender() {
        FixedEnvironment env(1.0, 600);
        ViewportController viewport(&env);
        QSignalSpy rasterized(&viewport, &ViewportController::pageRasterized);

        QVERIFY(viewport.loadDocument(m_pdfPath));
        QCOMPARE(viewport.zoom(), 0.4);
        QVERIFY(rasterized.wait(10000));

        // (600 - 32) / 918 rounded to hundredths
        QCOMPARE(viewport.zoom(), 0.62);
    }

    void testDevicePixelRatio() {
        FixedEnvironment env(2.0, 1280);
        ViewportController viewport(&env);
        QSignalSpy rasterized(&viewport, &ViewportController::pageRasterized);

        QVERIFY(viewport.loadDocument(m_pdfPath));
        QVERIFY(rasterized.wait(10000));

        // Twice the pixels, same content size
        const QImage image = viewport.pageImage();
        QVERIFY(fuzzy(image.width(), 1836, 3));
        QCOMPARE(image.devicePixelRatio(), 2.0);
        QVERIFY(fuzzy(viewport.contentSize().width(), 918));
    }
};

/**
 * Run viewport tests.
 * @return 0 if all tests pass, non-zero otherwise
 */
inline int runViewportTests() {
    ViewportTests tests;
    return QTest::qExec(&tests);
}

#endif // VIEWPORTTESTS_H
