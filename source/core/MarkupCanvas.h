#pragma once

// ============================================================================
// MarkupCanvas - Page display and annotation input widget
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// MarkupCanvas is a QWidget that:
// - Paints the current page bitmap and the annotation overlay at the
//   current zoom (zoom only scales the blit, it never re-rasterizes)
// - Converts mouse and touch input into content coordinates and feeds the
//   AnnotationToolController
// - Hosts the inline text editor used by the text tool
// - Dispatches keyboard shortcuts not handled by the controller (zoom,
//   page navigation)
//
// The widget resizes itself to the displayed page size; MainWindow puts it
// in a QScrollArea.
// ============================================================================

#include "../geometry/PointerEvent.h"
#include "../render/AnnotationRenderer.h"

#include <QImage>
#include <QWidget>

class AnnotationToolController;
class QPlainTextEdit;
class QTouchEvent;
class RasterCache;
class ViewportController;

class MarkupCanvas : public QWidget {
    Q_OBJECT

public:
    /**
     * All collaborators must outlive the canvas.
     */
    MarkupCanvas(ViewportController* viewport, AnnotationToolController* controller,
                 RasterCache* rasterCache, QWidget* parent = nullptr);
    ~MarkupCanvas() override = default;

    QSize sizeHint() const override;

    /**
     * @brief Widget-space rect of the displayed page.
     */
    QRectF pageRect() const;

    /**
     * @brief Route a pointer sample to the controller.
     * @return false if the sample has no usable coordinate.
     */
    bool handlePointerEvent(const PointerEvent& event);

signals:
    /**
     * @brief A key press matched a shortcut nobody handled here.
     */
    void shortcutTriggered(const QString& actionId);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    bool event(QEvent* event) override;
    bool eventFilter(QObject* watched, QEvent* event) override;

private slots:
    void onTextEditingStarted(const QString& id, const QRectF& bounds);
    void onTextEditingFinished(const QString& id);
    void onEditorTextChanged();
    void updateCanvasSize();

private:
    PointerEvent mouseToPointerEvent(QMouseEvent* event, PointerEvent::Type type) const;
    bool handleTouchEvent(QTouchEvent* event);

    /**
     * @brief Keep the inline editor over the annotation being edited.
     */
    void positionEditor();

    /**
     * @brief Tool-dependent cursor when the controller has no hover cursor.
     */
    void applyToolCursor();

    ViewportController* m_viewport = nullptr;
    AnnotationToolController* m_controller = nullptr;
    RasterCache* m_rasterCache = nullptr;
    AnnotationRenderer m_renderer;

    QPlainTextEdit* m_textEditor = nullptr;
    bool m_syncingEditor = false;   ///< Suppresses textChanged while positioning
    bool m_pointerActive = false;
    PointerEvent::Source m_activeSource = PointerEvent::Mouse;
};
