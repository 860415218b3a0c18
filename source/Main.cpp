// ============================================================================
// PdfMarkup - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QTranslator>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QFont>

#include "MainWindow.h"

// Platform-specific includes
#ifdef Q_OS_WIN
#include <windows.h>
#endif

// Test includes (desktop only)
#ifndef Q_OS_ANDROID
#include "geometry/GeometryTests.h"
#include "annotations/AnnotationTests.h"
#include "history/HistoryTests.h"
#include "core/HitTestingTests.h"
#include "core/ShortcutTests.h"
#include "core/ToolControllerTests.h"
#include "core/ViewportTests.h"
#include "render/RenderTests.h"
#include "pdf/PdfFlattenerTests.h"
#endif

// ============================================================================
// Platform Helpers
// ============================================================================

#ifdef Q_OS_WIN
static void applyWindowsFonts(QApplication& app)
{
    QFont font("Segoe UI", 9);
    font.setStyleHint(QFont::SansSerif);
    font.setHintingPreference(QFont::PreferFullHinting);
    app.setFont(font);
}

static void enableDebugConsole()
{
#ifdef PDFMARKUP_DEBUG
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#else
    FreeConsole();
#endif
}
#endif // Q_OS_WIN

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QApplication& app, QTranslator& translator)
{
    const QSettings settings("PdfMarkup", "App");
    const QString langCode = settings.value("useSystemLanguage", true).toBool()
        ? QLocale::system().name().section('_', 0, 0)
        : settings.value("languageOverride", "en").toString();

    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList searchPath = {
        appDir,
        appDir + "/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation, "pdfmarkup/translations",
                               QStandardPaths::LocateDirectory),
    };

    for (const QString& dir : searchPath) {
        if (!dir.isEmpty() && translator.load("app_" + langCode, dir)) {
            app.installTranslator(&translator);
            return;
        }
    }
}

// ============================================================================
// Test Runners (Desktop Only)
// ============================================================================

#ifndef Q_OS_ANDROID
static int runTests(const QString& testType)
{
#ifdef Q_OS_WIN
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#endif

    // Keep user settings and shortcuts.json out of test runs
    QStandardPaths::setTestModeEnabled(true);

    bool success = false;

    if (testType == "geometry") {
        success = GeometryTests::runAllTests();
    } else if (testType == "annotations") {
        success = AnnotationTests::runAllTests();
    } else if (testType == "history") {
        success = HistoryTests::runAllTests();
    } else if (testType == "hittest") {
        success = HitTestingTests::runAllTests();
    } else if (testType == "shortcuts") {
        success = ShortcutTests::runAllTests();
    } else if (testType == "render") {
        success = RenderTests::runAllTests();
    } else if (testType == "serialization") {
        success = PdfFlattenerTests::runAllTests();
    } else if (testType == "controller") {
        return runToolControllerTests();
    } else if (testType == "viewport") {
        return runViewportTests();
    }

    return success ? 0 : 1;
}
#endif

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
#ifdef Q_OS_WIN
    enableDebugConsole();
#endif

#ifndef Q_OS_ANDROID
    // Tests run headless unless a platform was chosen explicitly
    for (int i = 1; i < argc; ++i) {
        if (QByteArray(argv[i]).startsWith("--test-") && qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
            qputenv("QT_QPA_PLATFORM", "offscreen");
            break;
        }
    }
#endif

    QApplication app(argc, argv);
    app.setOrganizationName("PdfMarkup");
    app.setApplicationName("App");

#ifdef Q_OS_WIN
    applyWindowsFonts(app);
#endif

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString inputFile;

#ifndef Q_OS_ANDROID
    QString testToRun;
#endif

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

#ifndef Q_OS_ANDROID
        if (arg == "--test-geometry") {
            testToRun = "geometry";
        } else if (arg == "--test-annotations") {
            testToRun = "annotations";
        } else if (arg == "--test-history") {
            testToRun = "history";
        } else if (arg == "--test-hittest") {
            testToRun = "hittest";
        } else if (arg == "--test-shortcuts") {
            testToRun = "shortcuts";
        } else if (arg == "--test-controller") {
            testToRun = "controller";
        } else if (arg == "--test-render") {
            testToRun = "render";
        } else if (arg == "--test-viewport") {
            testToRun = "viewport";
        } else if (arg == "--test-serialization") {
            testToRun = "serialization";
        } else
#endif
        if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

#ifndef Q_OS_ANDROID
    // Handle test commands
    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }
#endif

    // ========== Launch Application ==========
    auto* w = new MainWindow();
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->show();
    if (!inputFile.isEmpty()) {
        w->openDocument(inputFile);
    }

    return app.exec();
}
