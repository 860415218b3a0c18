// ============================================================================
// AnnotationToolController - Implementation
// ============================================================================

#include "AnnotationToolController.h"
#include "ShortcutManager.h"
#include "../annotations/AnnotationFactory.h"
#include "../annotations/DrawingAnnotation.h"
#include "../annotations/TextAnnotations.h"

#include <QDebug>
#include <QJsonArray>
#include <QKeySequence>

AnnotationToolController::AnnotationToolController(int historyLimit, QObject* parent)
    : QObject(parent)
    , m_history(historyLimit)
{
}

// ============================================================================
// Session
// ============================================================================

void AnnotationToolController::resetSession()
{
    revertAll();
    m_currentPage = 1;
}

void AnnotationToolController::setCurrentPage(int page)
{
    if (page == m_currentPage) {
        return;
    }

    finishTextEditing();
    cancelGesture();
    cancelModalInput();

    m_currentPage = page;
    setCursor(Qt::ArrowCursor);
    emit repaintRequested();
}

void AnnotationToolController::setActiveTool(ToolType tool)
{
    if (tool == m_activeTool) {
        return;
    }

    finishTextEditing();
    cancelGesture();
    cancelModalInput();

    m_activeTool = tool;
    setCursor(tool == ToolType::Select ? Qt::ArrowCursor : Qt::CrossCursor);

#ifdef PDFMARKUP_DEBUG
    qDebug() << "[AnnotationToolController] Tool:" << toolTypeName(tool);
#endif

    emit toolChanged(tool);
    emit repaintRequested();
}

// ============================================================================
// Selection
// ============================================================================

const Annotation* AnnotationToolController::selectedAnnotation() const
{
    return m_selectedId.isEmpty() ? nullptr : m_annotations.find(m_selectedId);
}

void AnnotationToolController::clearSelection()
{
    select(QString());
}

void AnnotationToolController::select(const QString& id)
{
    if (id == m_selectedId) {
        return;
    }
    m_selectedId = id;
    emit selectionChanged(id);
    emit repaintRequested();
}

// ============================================================================
// Pointer Input
// ============================================================================

void AnnotationToolController::pointerPress(const QPointF& pt)
{
    // A click outside the inline editor ends the edit first
    if (m_state == State::EditingText) {
        finishTextEditing();
    }
    if (m_state != State::Idle) {
        return;
    }

    switch (m_activeTool) {
        case ToolType::Select:
            pressSelect(pt);
            break;

        case ToolType::Text:
            pressText(pt);
            break;

        case ToolType::Draw:
        case ToolType::Eraser:
            m_gesture = LiveGesture();
            m_gesture.kind = m_activeTool == ToolType::Draw ? LiveGesture::Kind::Freehand
                                                             : LiveGesture::Kind::Eraser;
            m_gesture.tool = m_activeTool;
            m_gesture.points.append(pt);
            setState(State::DrawingPath);
            emit repaintRequested();
            break;

        case ToolType::Rectangle:
        case ToolType::Line:
        case ToolType::Highlight:
        case ToolType::Circle:
        case ToolType::Arrow:
        case ToolType::Strikethrough:
            m_gesture = LiveGesture();
            m_gesture.kind = LiveGesture::Kind::RubberBand;
            m_gesture.tool = m_activeTool;
            m_gesture.start = pt;
            m_gesture.current = pt;
            setState(State::RubberBandShape);
            break;

        case ToolType::Date:
        case ToolType::SignedStamp:
        case ToolType::Watermark:
            m_modalTool = m_activeTool;
            m_modalPosition = pt;
            m_modalPage = m_currentPage;
            setState(State::AwaitingModalInput);
            emit modalInputRequested(m_modalTool, pt);
            break;

        case ToolType::Signature:
        case ToolType::Initials:
        case ToolType::Image:
        case ToolType::Checkbox:
        case ToolType::Radio:
        case ToolType::Stamp:
            pressPlacement(pt);
            break;
    }
}

void AnnotationToolController::pointerMove(const QPointF& pt)
{
    switch (m_state) {
        case State::Idle:
            if (m_activeTool == ToolType::Select) {
                updateHoverCursor(pt);
            }
            break;

        case State::DraggingAnnotation: {
            const Annotation* annotation = selectedAnnotation();
            if (!annotation) {
                break;
            }
            const QRectF bounds(pt - m_dragOffset, annotation->size);
            setLive(m_annotations.withBounds(m_selectedId, bounds));
            break;
        }

        case State::ResizingAnnotation: {
            const Annotation* annotation = selectedAnnotation();
            if (!annotation) {
                break;
            }
            const QRectF bounds = HitTesting::resizedBounds(annotation->boundingRect(), m_activeHandle, pt);
            setLive(m_annotations.withBounds(m_selectedId, bounds));
            break;
        }

        case State::DrawingPath:
            m_gesture.points.append(pt);
            emit repaintRequested();
            break;

        case State::RubberBandShape:
            m_gesture.current = pt;
            emit repaintRequested();
            break;

        case State::EditingText:
        case State::AwaitingModalInput:
            break;
    }
}

void AnnotationToolController::pointerRelease(const QPointF& pt)
{
    switch (m_state) {
        case State::DraggingAnnotation:
        case State::ResizingAnnotation: {
            const Annotation* annotation = selectedAnnotation();
            if (annotation && annotation->boundingRect() != m_gestureStartBounds) {
                commit();
            } else {
                // No net change; drop any rounding left by intermediate moves
                m_annotations = m_history.current();
            }
            m_activeHandle = ResizeHandle::None;
            setState(State::Idle);
            break;
        }

        case State::DrawingPath:
            if (m_gesture.kind == LiveGesture::Kind::Freehand) {
                releaseFreehand();
            } else {
                releaseEraser();
            }
            m_gesture = LiveGesture();
            setState(State::Idle);
            emit repaintRequested();
            break;

        case State::RubberBandShape:
            releaseShape(pt);
            m_gesture = LiveGesture();
            setState(State::Idle);
            emit repaintRequested();
            break;

        case State::Idle:
        case State::EditingText:
        case State::AwaitingModalInput:
            break;
    }
}

void AnnotationToolController::pressSelect(const QPointF& pt)
{
    // Handles of the current selection take priority over everything else
    const Annotation* selected = selectedAnnotation();
    if (selected && selected->page == m_currentPage) {
        const ResizeHandle handle = HitTesting::resizeHandleAt(selected->boundingRect(), pt);
        if (handle != ResizeHandle::None) {
            m_activeHandle = handle;
            m_gestureStartBounds = selected->boundingRect();
            setState(State::ResizingAnnotation);
            return;
        }
    }

    const Annotation* hit = HitTesting::hitTest(m_annotations, m_currentPage, pt);
    if (!hit) {
        clearSelection();
        return;
    }

    const QString id = hit->id;
    const AnnotationType hitType = hit->type();
    m_dragOffset = pt - hit->position;
    m_gestureStartBounds = hit->boundingRect();
    m_activeHandle = ResizeHandle::None;
    select(id);

    switch (HitTesting::clickActionFor(hitType)) {
        case ClickAction::ToggleCheckbox:
            setLive(m_annotations.withToggledCheckbox(id));
            commit();
            break;
        case ClickAction::SelectRadio:
            setLive(m_annotations.withRadioSelected(id));
            commit();
            break;
        case ClickAction::None:
            break;
    }

    setState(State::DraggingAnnotation);
}

void AnnotationToolController::pressText(const QPointF& pt)
{
    const QRectF bounds = placementRect(ToolType::Text, pt, m_settings);

    QString error;
    std::unique_ptr<Annotation> annotation =
        AnnotationFactory::create(AnnotationType::Text, m_currentPage, bounds, m_settings, QJsonObject(), &error);
    if (!annotation) {
        emit validationFailed(error);
        return;
    }

    // Not committed until editing ends
    const QString id = annotation->id;
    setLive(m_annotations.withAdded(std::move(annotation)));
    m_editingId = id;
    select(id);
    setState(State::EditingText);
    emit textEditingStarted(id, bounds);
}

void AnnotationToolController::pressPlacement(const QPointF& pt)
{
    const ToolType tool = m_activeTool;
    const QRectF bounds = placementRect(tool, pt, m_settings);
    bool placed = false;

    switch (tool) {
        case ToolType::Signature:
            if (m_settings.signatureData.isEmpty()) {
                emit captureRequested(tool);
                return;
            }
            placed = addAndCommit(AnnotationType::Signature, m_currentPage, bounds);
            if (placed) {
                emit statusMessage(tr("Signature placed! Drag to reposition."));
            }
            break;

        case ToolType::Initials:
            if (m_settings.initialsData.isEmpty()) {
                emit captureRequested(tool);
                return;
            }
            placed = addAndCommit(AnnotationType::Initials, m_currentPage, bounds);
            if (placed) {
                emit statusMessage(tr("Initials placed!"));
            }
            break;

        case ToolType::Image:
            if (m_settings.stagedImageData.isEmpty() || m_settings.stagedImageSize.width() <= 0) {
                emit captureRequested(tool);
                return;
            }
            placed = addAndCommit(AnnotationType::Image, m_currentPage, bounds);
            if (placed) {
                m_settings.stagedImageData.clear();
                m_settings.stagedImageSize = QSizeF();
                emit statusMessage(tr("Image added! Drag to reposition."));
            }
            break;

        case ToolType::Checkbox:
            placed = addAndCommit(AnnotationType::Checkbox, m_currentPage, bounds);
            break;

        case ToolType::Radio:
            placed = addAndCommit(AnnotationType::Radio, m_currentPage, bounds);
            break;

        case ToolType::Stamp:
            placed = addAndCommit(AnnotationType::Stamp, m_currentPage, bounds);
            if (placed) {
                emit statusMessage(tr("Stamp placed!"));
            }
            break;

        default:
            return;
    }

    if (placed && isOneShotTool(tool)) {
        setActiveTool(ToolType::Select);
    }
}

void AnnotationToolController::releaseFreehand()
{
    if (m_gesture.points.size() <= 1) {
        return;
    }

    QJsonArray points;
    for (const QPointF& p : m_gesture.points) {
        QJsonObject point;
        point["x"] = p.x();
        point["y"] = p.y();
        points.append(point);
    }
    QJsonObject path;
    path["points"] = points;
    QJsonObject payload;
    payload["paths"] = QJsonArray{ path };

    const QRectF bounds = DrawingAnnotation::boundsOf(m_gesture.points);

    QString error;
    std::unique_ptr<Annotation> annotation =
        AnnotationFactory::create(AnnotationType::Drawing, m_currentPage, bounds, m_settings, payload, &error);
    if (!annotation) {
        emit validationFailed(error);
        return;
    }
    setLive(m_annotations.withAdded(std::move(annotation)));
    commit();
}

void AnnotationToolController::releaseEraser()
{
    const qreal radius = m_settings.strokeWidth * ERASER_RADIUS_FACTOR;
    const QVector<QPointF> eraserPath = m_gesture.points;
    const int page = m_currentPage;

    AnnotationCollection remaining = m_annotations.withRemovedIf([&](const Annotation& a) {
        if (a.type() != AnnotationType::Drawing || a.page != page) {
            return false;
        }
        const auto& drawing = static_cast<const DrawingAnnotation&>(a);
        for (const QPointF& pt : eraserPath) {
            if (drawing.hasPointNear(pt, radius)) {
                return true;
            }
        }
        return false;
    });

    if (remaining.size() == m_annotations.size()) {
        return;
    }

    setLive(remaining);
    commit();
    if (!m_selectedId.isEmpty() && !m_annotations.find(m_selectedId)) {
        clearSelection();
    }
}

void AnnotationToolController::releaseShape(const QPointF& pt)
{
    const QPointF start = m_gesture.start;
    const qreal width = qAbs(pt.x() - start.x());
    const qreal height = qAbs(pt.y() - start.y());
    const QPointF topLeft(qMin(start.x(), pt.x()), qMin(start.y(), pt.y()));

    switch (m_gesture.tool) {
        case ToolType::Rectangle:
        case ToolType::Circle:
        case ToolType::Highlight: {
            if (!(width > SHAPE_MIN_DRAG && height > SHAPE_MIN_DRAG)) {
                return;
            }
            const AnnotationType type = m_gesture.tool == ToolType::Rectangle ? AnnotationType::Rectangle
                                      : m_gesture.tool == ToolType::Circle    ? AnnotationType::Circle
                                                                              : AnnotationType::Highlight;
            addAndCommit(type, m_currentPage, QRectF(topLeft, QSizeF(width, height)));
            break;
        }

        case ToolType::Strikethrough:
            if (!(width > SHAPE_MIN_DRAG || height > SHAPE_MIN_DRAG)) {
                return;
            }
            addAndCommit(AnnotationType::Strikethrough, m_currentPage,
                         QRectF(topLeft, QSizeF(qMax(width, STRIKE_MIN_SIZE), qMax(height, STRIKE_MIN_SIZE))));
            break;

        case ToolType::Line:
        case ToolType::Arrow: {
            if (width <= SHAPE_MIN_DRAG && height <= SHAPE_MIN_DRAG) {
                return;
            }
            QJsonObject payload;
            payload["x1"] = start.x();
            payload["y1"] = start.y();
            payload["x2"] = pt.x();
            payload["y2"] = pt.y();
            // Axis-aligned lines still get a 1 px extent
            const QSizeF size(qMax(width, 1.0), qMax(height, 1.0));
            addAndCommit(m_gesture.tool == ToolType::Line ? AnnotationType::Line : AnnotationType::Arrow,
                         m_currentPage, QRectF(topLeft, size), payload);
            break;
        }

        default:
            break;
    }
}

void AnnotationToolController::updateHoverCursor(const QPointF& pt)
{
    const Annotation* selected = selectedAnnotation();
    if (!selected || selected->page != m_currentPage) {
        setCursor(Qt::ArrowCursor);
        return;
    }
    const ResizeHandle handle = HitTesting::resizeHandleAt(selected->boundingRect(), pt);
    setCursor(HitTesting::cursorFor(handle, selected->boundsContain(pt)));
}

// ============================================================================
// Text Editing
// ============================================================================

void AnnotationToolController::updateEditingText(const QString& text)
{
    if (m_state != State::EditingText || m_editingId.isEmpty()) {
        return;
    }

    setLive(m_annotations.withModified(m_editingId, [&text](Annotation& a) {
        if (a.type() != AnnotationType::Text) {
            return;
        }
        auto& textAnnotation = static_cast<TextAnnotation&>(a);
        textAnnotation.text = text;
        textAnnotation.size = TextAnnotation::estimatedSize(text, textAnnotation.fontSize);
    }));
}

void AnnotationToolController::finishTextEditing()
{
    if (m_state != State::EditingText) {
        return;
    }

    const QString id = m_editingId;
    const auto* annotation = static_cast<const TextAnnotation*>(m_annotations.find(id));
    if (annotation && annotation->text.trimmed().isEmpty()) {
        setLive(m_annotations.withRemoved(id));
        if (m_selectedId == id) {
            clearSelection();
        }
    }
    commit();

    m_editingId.clear();
    setState(State::Idle);
    emit textEditingFinished(id);
}

// ============================================================================
// Modal Placement
// ============================================================================

bool AnnotationToolController::placeDate(const QDate& date)
{
    if (m_state != State::AwaitingModalInput || m_modalTool != ToolType::Date) {
        return false;
    }

    const QString text = DateAnnotation::formatDate(date, m_settings.dateFormat);
    const QRectF bounds(m_modalPosition,
                        QSizeF(text.length() * m_settings.fontSize * TextAnnotation::CHAR_WIDTH_FACTOR,
                               m_settings.fontSize * TextAnnotation::LINE_HEIGHT_FACTOR));
    QJsonObject payload;
    payload["text"] = text;

    if (!addAndCommit(AnnotationType::Date, m_modalPage, bounds, payload)) {
        return false;
    }
    setState(State::Idle);
    emit statusMessage(tr("Date placed!"));
    return true;
}

bool AnnotationToolController::placeSignedStamp(const QString& signatureData, const QDate& date)
{
    if (m_state != State::AwaitingModalInput || m_modalTool != ToolType::SignedStamp) {
        return false;
    }

    const bool circle = m_settings.signedStampShape == StampShape::Circle;
    const QRectF bounds(m_modalPosition, circle ? QSizeF(150, 150) : QSizeF(200, 120));
    QJsonObject payload;
    payload["signatureData"] = signatureData;
    payload["dateText"] = DateAnnotation::formatDate(date, m_settings.signedStampDateFormat);

    if (!addAndCommit(AnnotationType::SignedStamp, m_modalPage, bounds, payload)) {
        return false;
    }
    setState(State::Idle);
    setActiveTool(ToolType::Select);
    emit statusMessage(tr("Signed stamp placed!"));
    return true;
}

bool AnnotationToolController::placeWatermark()
{
    if (m_state != State::AwaitingModalInput || m_modalTool != ToolType::Watermark) {
        return false;
    }

    QSizeF size(150, 150);
    if (m_settings.watermarkContentType == WatermarkContentType::Text) {
        size = QSizeF(m_settings.watermarkText.length() * m_settings.watermarkFontSize
                          * TextAnnotation::CHAR_WIDTH_FACTOR,
                      m_settings.watermarkFontSize + 20);
    }
    const QRectF bounds(m_modalPosition - QPointF(size.width() / 2.0, size.height() / 2.0), size);

    if (!addAndCommit(AnnotationType::Watermark, m_modalPage, bounds)) {
        return false;
    }
    setState(State::Idle);
    setActiveTool(ToolType::Select);
    emit statusMessage(tr("Watermark placed!"));
    return true;
}

void AnnotationToolController::cancelModalInput()
{
    if (m_state != State::AwaitingModalInput) {
        return;
    }
    m_modalTool = ToolType::Select;
    setState(State::Idle);
}

// ============================================================================
// Captured Payloads
// ============================================================================

void AnnotationToolController::stageImage(const QString& data, const QSizeF& naturalSize)
{
    m_settings.stagedImageData = data;
    m_settings.stagedImageSize = naturalSize;
}

bool AnnotationToolController::placeImage(const QString& data, const QSizeF& naturalSize)
{
    if (naturalSize.width() <= 0 || naturalSize.height() <= 0) {
        emit validationFailed(tr("Could not read image dimensions"));
        return false;
    }

    finishTextEditing();
    cancelGesture();
    cancelModalInput();

    const qreal scale = IMAGE_PLACE_WIDTH / naturalSize.width();
    const QRectF bounds(QPointF(100, 100), QSizeF(IMAGE_PLACE_WIDTH, naturalSize.height() * scale));
    QJsonObject payload;
    payload["data"] = data;

    if (!addAndCommit(AnnotationType::Image, m_currentPage, bounds, payload)) {
        return false;
    }
    setActiveTool(ToolType::Select);
    emit statusMessage(tr("Image added! Drag to reposition."));
    return true;
}

// ============================================================================
// Commands
// ============================================================================

bool AnnotationToolController::undo()
{
    finishTextEditing();
    cancelGesture();

    const AnnotationCollection* snapshot = m_history.undo();
    if (!snapshot) {
        return false;
    }
    setLive(*snapshot);
    clearSelection();
    return true;
}

bool AnnotationToolController::redo()
{
    finishTextEditing();
    cancelGesture();

    const AnnotationCollection* snapshot = m_history.redo();
    if (!snapshot) {
        return false;
    }
    setLive(*snapshot);
    clearSelection();
    return true;
}

bool AnnotationToolController::deleteSelected()
{
    if (m_selectedId.isEmpty() || m_state != State::Idle) {
        return false;
    }
    setLive(m_annotations.withRemoved(m_selectedId));
    commit();
    clearSelection();
    return true;
}

void AnnotationToolController::revertAll()
{
    if (m_state == State::EditingText) {
        const QString id = m_editingId;
        m_editingId.clear();
        setState(State::Idle);
        emit textEditingFinished(id);
    }
    m_gesture = LiveGesture();
    m_activeHandle = ResizeHandle::None;
    cancelModalInput();
    setState(State::Idle);

    m_history.reset();
    setLive(AnnotationCollection());
    clearSelection();
    emit statusMessage(tr("All changes reverted"));
}

bool AnnotationToolController::handleKeyPress(int key, Qt::KeyboardModifiers modifiers)
{
    if (m_state == State::EditingText) {
        return false;
    }

    Qt::KeyboardModifiers mods = modifiers & ~Qt::KeypadModifier;
    if (mods & Qt::MetaModifier) {
        mods = (mods & ~Qt::MetaModifier) | Qt::ControlModifier;
    }

    const QKeySequence sequence(QKeyCombination(mods, static_cast<Qt::Key>(key)));
    const QString action = ShortcutManager::instance()->actionForKeySequence(sequence);
    if (action.isEmpty()) {
        return false;
    }

    if (action == QLatin1String("edit.undo")) {
        undo();
        return true;
    }
    if (action == QLatin1String("edit.redo")) {
        redo();
        return true;
    }
    if (action == QLatin1String("edit.delete") || action == QLatin1String("edit.delete_alt")) {
        return deleteSelected();
    }
    if (action == QLatin1String("edit.deselect")) {
        clearSelection();
        setActiveTool(ToolType::Select);
        return true;
    }

    static const struct {
        const char* action;
        ToolType tool;
    } toolBindings[] = {
        { "tool.select", ToolType::Select },       { "tool.select_alt", ToolType::Select },
        { "tool.text", ToolType::Text },           { "tool.text_alt", ToolType::Text },
        { "tool.draw", ToolType::Draw },           { "tool.draw_alt", ToolType::Draw },
        { "tool.signature", ToolType::Signature }, { "tool.signature_alt", ToolType::Signature },
        { "tool.highlight", ToolType::Highlight }, { "tool.highlight_alt", ToolType::Highlight },
        { "tool.rectangle", ToolType::Rectangle }, { "tool.rectangle_alt", ToolType::Rectangle },
        { "tool.circle", ToolType::Circle },       { "tool.circle_alt", ToolType::Circle },
        { "tool.arrow", ToolType::Arrow },         { "tool.arrow_alt", ToolType::Arrow },
    };
    for (const auto& binding : toolBindings) {
        if (action == QLatin1String(binding.action)) {
            setActiveTool(binding.tool);
            return true;
        }
    }
    return false;
}

// ============================================================================
// Placement Geometry
// ============================================================================

QRectF AnnotationToolController::placementRect(ToolType tool, const QPointF& click,
                                               const ToolSettings& settings)
{
    switch (tool) {
        case ToolType::Text:
            return QRectF(click, QSizeF(200, settings.fontSize * 1.5));
        case ToolType::Checkbox:
            return QRectF(click, QSizeF(24, 24));
        case ToolType::Radio:
            return QRectF(click, QSizeF(20, 20));
        case ToolType::Signature:
            return QRectF(click, QSizeF(200, 80));
        case ToolType::Initials:
            return QRectF(click, QSizeF(60, 30));
        case ToolType::Stamp: {
            if (settings.stampShape == StampShape::Circle) {
                return QRectF(click, QSizeF(100, 100));
            }
            const qreal width = settings.stampType == QLatin1String("custom")
                ? qMax(settings.stampCustomText.length() * 12.0, 100.0)
                : 150.0;
            return QRectF(click, QSizeF(width, 40));
        }
        case ToolType::Image: {
            const QSizeF natural = settings.stagedImageSize;
            const qreal height = natural.width() > 0
                ? natural.height() * (IMAGE_PLACE_WIDTH / natural.width())
                : IMAGE_PLACE_WIDTH;
            return QRectF(click, QSizeF(IMAGE_PLACE_WIDTH, height));
        }
        default:
            break;
    }
    return QRectF(click, QSizeF(1, 1));
}

// ============================================================================
// Internals
// ============================================================================

void AnnotationToolController::setState(State state)
{
    if (state == m_state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void AnnotationToolController::setCursor(Qt::CursorShape cursor)
{
    if (cursor == m_cursor) {
        return;
    }
    m_cursor = cursor;
    emit cursorChanged(cursor);
}

void AnnotationToolController::commit()
{
    if (m_annotations == m_history.current()) {
        return;
    }
    m_history.commit(m_annotations);
}

void AnnotationToolController::setLive(const AnnotationCollection& annotations)
{
    m_annotations = annotations;
    emit annotationsChanged();
    emit repaintRequested();
}

bool AnnotationToolController::addAndCommit(AnnotationType type, int page, const QRectF& bounds,
                                            const QJsonObject& payload)
{
    QString error;
    std::unique_ptr<Annotation> annotation =
        AnnotationFactory::create(type, page, bounds, m_settings, payload, &error);
    if (!annotation) {
        emit validationFailed(error);
        return false;
    }

    const QString id = annotation->id;
    setLive(m_annotations.withAdded(std::move(annotation)));
    commit();
    select(id);
    return true;
}

void AnnotationToolController::cancelGesture()
{
    switch (m_state) {
        case State::DraggingAnnotation:
        case State::ResizingAnnotation:
            // Nothing is committed mid-drag, so the last snapshot is the pre-drag state
            setLive(m_history.current());
            m_activeHandle = ResizeHandle::None;
            setState(State::Idle);
            break;
        case State::DrawingPath:
        case State::RubberBandShape:
            m_gesture = LiveGesture();
            setState(State::Idle);
            emit repaintRequested();
            break;
        case State::Idle:
        case State::EditingText:
        case State::AwaitingModalInput:
            break;
    }
}
