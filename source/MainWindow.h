#ifndef MAINWINDOW_H
#define MAINWINDOW_H

// ============================================================================
// MainWindow - PdfMarkup editor window
// ============================================================================
// Owns the editing session: ViewportController (document, page, zoom),
// AnnotationToolController (annotations, tools, history), the RasterCache
// shared by the canvas, and the MarkupCanvas inside a scroll area.
//
// The window forwards controller requests that need user input (date,
// signed stamp and watermark dialogs, signature/initials capture, image
// upload) and runs the export through MuPdfFlattener.
// ============================================================================

#include <QHash>
#include <QMainWindow>
#include <QPointF>

#include "core/ToolType.h"
#include "geometry/Environment.h"

class AnnotationToolController;
class MarkupCanvas;
class MuPdfFlattener;
class QAction;
class QActionGroup;
class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QScrollArea;
class QSpinBox;
class RasterCache;
class ViewportController;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Load a PDF and start a fresh annotation session.
     * @return false (after telling the user) if the file cannot be opened.
     */
    bool openDocument(const QString& path);

public slots:
    void showOpenDialog();
    void exportPdf();

protected:
    void resizeEvent(QResizeEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onDocumentLoaded(int pageCount);
    void onPageChanged(int page);
    void onZoomChanged(qreal zoom);
    void onToolChanged(ToolType tool);
    void onModalInputRequested(ToolType tool, const QPointF& position);
    void onCaptureRequested(ToolType tool);
    void onShortcutTriggered(const QString& actionId);
    void updateEditActions();
    void insertImage();
    void editSignature();
    void editInitials();

private:
    void setupUi();
    void setupToolBar();
    void setupStyleBar();
    void setupMenus();
    void connectSession();

    /**
     * @brief Push the style widgets' values into the controller settings.
     */
    void applyStyleWidgets();
    void syncStyleWidgets();
    void setSwatch(QPushButton* button, const QColor& color);

    bool captureSignature(ToolType tool);
    void showMessage(const QString& message, int timeoutMs = 3000);

    QtEnvironment m_environment;
    ViewportController* m_viewport = nullptr;
    AnnotationToolController* m_controller = nullptr;
    RasterCache* m_rasterCache = nullptr;
    MuPdfFlattener* m_flattener = nullptr;

    QScrollArea* m_scrollArea = nullptr;
    MarkupCanvas* m_canvas = nullptr;

    // Actions
    QActionGroup* m_toolGroup = nullptr;
    QHash<ToolType, QAction*> m_toolActions;
    QAction* m_exportAction = nullptr;
    QAction* m_undoAction = nullptr;
    QAction* m_redoAction = nullptr;
    QAction* m_deleteAction = nullptr;
    QAction* m_revertAction = nullptr;
    QAction* m_prevPageAction = nullptr;
    QAction* m_nextPageAction = nullptr;

    // Navigation widgets
    QSpinBox* m_pageSpin = nullptr;
    QLabel* m_pageCountLabel = nullptr;
    QLabel* m_zoomLabel = nullptr;

    // Style widgets
    QPushButton* m_strokeColorButton = nullptr;
    QDoubleSpinBox* m_strokeWidthSpin = nullptr;
    QDoubleSpinBox* m_fontSizeSpin = nullptr;
    QPushButton* m_highlightColorButton = nullptr;
    QCheckBox* m_redactCheck = nullptr;
    QComboBox* m_stampCombo = nullptr;
    QLineEdit* m_stampTextEdit = nullptr;
    QComboBox* m_stampShapeCombo = nullptr;
    QCheckBox* m_stampDashedCheck = nullptr;
    QSpinBox* m_radioGroupSpin = nullptr;
    bool m_syncingStyle = false;
};

#endif // MAINWINDOW_H
