#pragma once

// ============================================================================
// AnnotationToolController - Turns pointer gestures into annotation edits
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Owns the live annotation collection, the selection, the undo history and
// the active tool. All pointer input arrives already converted to content
// coordinates (see CoordinateTransform), so the controller is independent
// of zoom and device pixel ratio.
//
// Gesture states:
//   Idle -> DrawingPath        (draw, eraser)
//   Idle -> RubberBandShape    (rectangle, circle, line, arrow, highlight,
//                               strikethrough)
//   Idle -> DraggingAnnotation / ResizingAnnotation (select)
//   Idle -> EditingText        (text)
//   Idle -> AwaitingModalInput (date, signed stamp, watermark)
// Every state returns to Idle on pointer release, on confirm/cancel, or
// when the tool or page changes.
// ============================================================================

#include "ToolSettings.h"
#include "ToolType.h"
#include "HitTesting.h"
#include "../annotations/AnnotationCollection.h"
#include "../history/AnnotationHistory.h"

#include <QDate>
#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QVector>

/**
 * @brief Preview of the gesture in progress, painted by AnnotationRenderer.
 */
struct LiveGesture {
    enum class Kind {
        None,
        Freehand,     ///< points = stroke so far
        Eraser,       ///< points = eraser path so far
        RubberBand    ///< start..current defines the shape
    };

    Kind kind = Kind::None;
    ToolType tool = ToolType::Select;
    QVector<QPointF> points;
    QPointF start;
    QPointF current;
};

class AnnotationToolController : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        DrawingPath,
        DraggingAnnotation,
        ResizingAnnotation,
        RubberBandShape,
        EditingText,
        AwaitingModalInput
    };
    Q_ENUM(State)

    /**
     * @param historyLimit Undo retention cap (0 = unbounded).
     */
    explicit AnnotationToolController(int historyLimit = 0, QObject* parent = nullptr);

    // ===== Session =====

    const AnnotationCollection& annotations() const { return m_annotations; }
    const AnnotationHistory& history() const { return m_history; }

    /**
     * @brief Clear annotations, history and selection and go to page 1.
     *
     * Called when a new document is loaded.
     */
    void resetSession();

    int currentPage() const { return m_currentPage; }

    /**
     * @brief Change the page that receives new annotations.
     *
     * Cancels gestures, pending modal input and ends text editing.
     */
    void setCurrentPage(int page);

    // ===== Tools =====

    ToolType activeTool() const { return m_activeTool; }

    /**
     * @brief Switch tools; cancels any gesture in progress.
     */
    void setActiveTool(ToolType tool);

    ToolSettings& settings() { return m_settings; }
    const ToolSettings& settings() const { return m_settings; }
    void setSettings(const ToolSettings& settings) { m_settings = settings; }

    State state() const { return m_state; }

    // ===== Selection =====

    QString selectedId() const { return m_selectedId; }
    const Annotation* selectedAnnotation() const;
    void clearSelection();

    // ===== Pointer Input (content coordinates) =====

    void pointerPress(const QPointF& pt);
    void pointerMove(const QPointF& pt);
    void pointerRelease(const QPointF& pt);

    const LiveGesture& liveGesture() const { return m_gesture; }
    Qt::CursorShape hoverCursor() const { return m_cursor; }

    // ===== Text Editing =====

    QString editingTextId() const { return m_editingId; }

    /**
     * @brief Replace the text being edited; the box is re-estimated.
     */
    void updateEditingText(const QString& text);

    /**
     * @brief End editing. Blank text removes the annotation.
     *
     * Either way one history entry is committed.
     */
    void finishTextEditing();

    // ===== Modal Placement =====

    ToolType pendingModalTool() const { return m_modalTool; }
    QPointF pendingModalPosition() const { return m_modalPosition; }

    /**
     * @brief Confirm the pending date placement.
     * @return false if no date placement is pending.
     */
    bool placeDate(const QDate& date);

    /**
     * @brief Confirm the pending signed stamp.
     *
     * Without signature data validationFailed() is emitted and the modal
     * stays pending.
     */
    bool placeSignedStamp(const QString& signatureData, const QDate& date);

    /**
     * @brief Confirm the pending watermark using the current watermark
     *        settings (text, or the staged image for image watermarks).
     */
    bool placeWatermark();

    /**
     * @brief Abandon the pending modal placement without changes.
     */
    void cancelModalInput();

    // ===== Captured Payloads =====

    void setSignatureData(const QString& data) { m_settings.signatureData = data; }
    void setInitialsData(const QString& data) { m_settings.initialsData = data; }

    /**
     * @brief Stage an image to be placed at the next image-tool click.
     */
    void stageImage(const QString& data, const QSizeF& naturalSize);

    /**
     * @brief Place an uploaded image immediately at (100, 100).
     *
     * Width is 200; height keeps the natural aspect ratio.
     */
    bool placeImage(const QString& data, const QSizeF& naturalSize);

    // ===== Commands =====

    bool canUndo() const { return m_history.canUndo(); }
    bool canRedo() const { return m_history.canRedo(); }
    bool undo();
    bool redo();
    bool deleteSelected();

    /**
     * @brief Remove every annotation and reset history.
     */
    void revertAll();

    /**
     * @brief Dispatch a key press through ShortcutManager.
     * @return true if the key was consumed.
     *
     * Ignored while editing text. Meta is treated as Ctrl.
     */
    bool handleKeyPress(int key, Qt::KeyboardModifiers modifiers);

    // ===== Placement Geometry =====

    static constexpr qreal SHAPE_MIN_DRAG = 5.0;       ///< Drag extent needed to define a shape
    static constexpr qreal STRIKE_MIN_SIZE = 10.0;     ///< Smallest strikethrough box
    static constexpr qreal ERASER_RADIUS_FACTOR = 3.0; ///< Eraser radius / stroke width
    static constexpr qreal IMAGE_PLACE_WIDTH = 200.0;

    /**
     * @brief Box of a click-placed annotation for the given tool.
     */
    static QRectF placementRect(ToolType tool, const QPointF& click, const ToolSettings& settings);

signals:
    void annotationsChanged();
    void selectionChanged(const QString& id);
    void toolChanged(ToolType tool);
    void stateChanged(AnnotationToolController::State state);
    void modalInputRequested(ToolType tool, const QPointF& position);
    void captureRequested(ToolType tool);
    void validationFailed(const QString& message);
    void textEditingStarted(const QString& id, const QRectF& bounds);
    void textEditingFinished(const QString& id);
    void cursorChanged(Qt::CursorShape cursor);
    void statusMessage(const QString& message);
    void repaintRequested();

private:
    void setState(State state);
    void select(const QString& id);
    void setCursor(Qt::CursorShape cursor);
    void commit();
    void setLive(const AnnotationCollection& annotations);

    /**
     * @brief Validate, add, commit and select a new annotation.
     * @return false (and emits validationFailed) if the factory rejects it.
     */
    bool addAndCommit(AnnotationType type, int page, const QRectF& bounds,
                      const QJsonObject& payload = QJsonObject());

    /**
     * @brief Drop any pointer gesture, restoring dragged geometry.
     */
    void cancelGesture();

    void pressSelect(const QPointF& pt);
    void pressText(const QPointF& pt);
    void pressPlacement(const QPointF& pt);
    void releaseFreehand();
    void releaseEraser();
    void releaseShape(const QPointF& pt);
    void updateHoverCursor(const QPointF& pt);

    AnnotationCollection m_annotations;   ///< Live state (may be ahead of history mid-gesture)
    AnnotationHistory m_history;
    ToolSettings m_settings;

    ToolType m_activeTool = ToolType::Select;
    State m_state = State::Idle;
    int m_currentPage = 1;

    QString m_selectedId;
    QString m_editingId;

    // Select-tool drag
    ResizeHandle m_activeHandle = ResizeHandle::None;
    QPointF m_dragOffset;
    QRectF m_gestureStartBounds;

    LiveGesture m_gesture;
    Qt::CursorShape m_cursor = Qt::ArrowCursor;

    // Pending modal placement
    ToolType m_modalTool = ToolType::Select;
    QPointF m_modalPosition;
    int m_modalPage = 1;
};
