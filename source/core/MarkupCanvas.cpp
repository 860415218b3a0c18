// ============================================================================
// MarkupCanvas - Implementation
// ============================================================================

#include "MarkupCanvas.h"
#include "AnnotationToolController.h"
#include "ShortcutManager.h"
#include "ViewportController.h"
#include "../annotations/TextAnnotations.h"
#include "../render/RasterCache.h"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QPlainTextEdit>
#include <QTouchEvent>

MarkupCanvas::MarkupCanvas(ViewportController* viewport, AnnotationToolController* controller,
                           RasterCache* rasterCache, QWidget* parent)
    : QWidget(parent)
    , m_viewport(viewport)
    , m_controller(controller)
    , m_rasterCache(rasterCache)
    , m_renderer(rasterCache)
{
    setAttribute(Qt::WA_AcceptTouchEvents, true);
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(true);

    // Inline editor for the text tool
    m_textEditor = new QPlainTextEdit(this);
    m_textEditor->hide();
    m_textEditor->setFrameShape(QFrame::NoFrame);
    m_textEditor->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    m_textEditor->setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    m_textEditor->setStyleSheet(QStringLiteral(
        "QPlainTextEdit { background: rgba(255, 255, 255, 220); border: 1px dashed #2563eb; }"));
    m_textEditor->document()->setDocumentMargin(0);
    m_textEditor->installEventFilter(this);
    connect(m_textEditor, &QPlainTextEdit::textChanged, this, &MarkupCanvas::onEditorTextChanged);

    // Display
    connect(m_viewport, &ViewportController::documentLoaded, this, &MarkupCanvas::updateCanvasSize);
    connect(m_viewport, &ViewportController::documentClosed, this, &MarkupCanvas::updateCanvasSize);
    connect(m_viewport, &ViewportController::pageChanged, this, &MarkupCanvas::updateCanvasSize);
    connect(m_viewport, &ViewportController::zoomChanged, this, &MarkupCanvas::updateCanvasSize);
    connect(m_viewport, &ViewportController::pageRasterized, this, [this]() { update(); });

    if (m_rasterCache) {
        connect(m_rasterCache, &RasterCache::rasterReady, this, [this]() { update(); });
    }

    // Controller
    connect(m_controller, &AnnotationToolController::annotationsChanged, this, [this]() {
        positionEditor();
        update();
    });
    connect(m_controller, &AnnotationToolController::repaintRequested, this, [this]() { update(); });
    connect(m_controller, &AnnotationToolController::selectionChanged, this, [this]() { update(); });
    connect(m_controller, &AnnotationToolController::cursorChanged, this, [this](Qt::CursorShape shape) {
        setCursor(shape);
    });
    connect(m_controller, &AnnotationToolController::toolChanged, this, &MarkupCanvas::applyToolCursor);
    connect(m_controller, &AnnotationToolController::textEditingStarted, this, &MarkupCanvas::onTextEditingStarted);
    connect(m_controller, &AnnotationToolController::textEditingFinished, this, &MarkupCanvas::onTextEditingFinished);

    applyToolCursor();
}

QSize MarkupCanvas::sizeHint() const
{
    if (!m_viewport->hasDocument()) {
        return QWidget::sizeHint();
    }
    return m_viewport->displaySize().toSize();
}

QRectF MarkupCanvas::pageRect() const
{
    return QRectF(QPointF(0, 0), m_viewport->displaySize());
}

// ===== Painting =====

void MarkupCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), QColor(64, 64, 64));

    if (!m_viewport->hasDocument()) {
        return;
    }

    const QRectF target = pageRect();
    painter.fillRect(target, Qt::white);

    const QImage page = m_viewport->pageImage();
    if (!page.isNull()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        painter.drawImage(target, page);
    }

    // Overlay is rendered zoom-free and scaled with the page
    const QImage overlay = m_renderer.renderOverlay(m_viewport->contentSize(), devicePixelRatioF(),
                                                    m_controller->annotations(),
                                                    m_controller->currentPage(),
                                                    m_controller->selectedId(),
                                                    &m_controller->liveGesture(),
                                                    &m_controller->settings());
    if (!overlay.isNull()) {
        painter.drawImage(target, overlay);
    }
}

void MarkupCanvas::updateCanvasSize()
{
    setFixedSize(sizeHint());
    positionEditor();
    update();
}

// ===== Pointer Input =====

PointerEvent MarkupCanvas::mouseToPointerEvent(QMouseEvent* event, PointerEvent::Type type) const
{
    PointerEvent pe = PointerEvent::mouse(type, event->position());
    pe.buttons = event->buttons();
    pe.modifiers = event->modifiers();
    return pe;
}

bool MarkupCanvas::handlePointerEvent(const PointerEvent& event)
{
    if (!m_viewport->hasDocument()) {
        return false;
    }

    const CoordinateTransform transform = m_viewport->transform(pageRect());
    bool ok = false;
    const QPointF pt = transform.toContentCoords(event, &ok);
    if (!ok) {
        return false;
    }

    switch (event.type) {
        case PointerEvent::Press:
            m_controller->pointerPress(pt);
            break;
        case PointerEvent::Move:
            m_controller->pointerMove(pt);
            break;
        case PointerEvent::Release:
            m_controller->pointerRelease(pt);
            break;
    }
    return true;
}

void MarkupCanvas::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }

    // Touch arrives through event(); drop the synthesized duplicate
    if (event->source() == Qt::MouseEventSynthesizedBySystem ||
        event->source() == Qt::MouseEventSynthesizedByQt) {
        event->ignore();
        return;
    }

    if (m_pointerActive && m_activeSource == PointerEvent::Touch) {
        event->accept();
        return;
    }

    setFocus(Qt::MouseFocusReason);
    m_pointerActive = true;
    m_activeSource = PointerEvent::Mouse;
    handlePointerEvent(mouseToPointerEvent(event, PointerEvent::Press));
    event->accept();
}

void MarkupCanvas::mouseMoveEvent(QMouseEvent* event)
{
    if (event->source() == Qt::MouseEventSynthesizedBySystem ||
        event->source() == Qt::MouseEventSynthesizedByQt) {
        event->ignore();
        return;
    }

    if (m_pointerActive && m_activeSource == PointerEvent::Touch) {
        event->accept();
        return;
    }

    // Moves without a button are hover updates (resize cursors)
    handlePointerEvent(mouseToPointerEvent(event, PointerEvent::Move));
    event->accept();
}

void MarkupCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }

    if (event->source() == Qt::MouseEventSynthesizedBySystem ||
        event->source() == Qt::MouseEventSynthesizedByQt) {
        event->ignore();
        return;
    }

    if (m_activeSource == PointerEvent::Mouse) {
        handlePointerEvent(mouseToPointerEvent(event, PointerEvent::Release));
        m_pointerActive = false;
    }
    event->accept();
}

bool MarkupCanvas::event(QEvent* event)
{
    switch (event->type()) {
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
        case QEvent::TouchCancel:
            return handleTouchEvent(static_cast<QTouchEvent*>(event));
        default:
            return QWidget::event(event);
    }
}

bool MarkupCanvas::handleTouchEvent(QTouchEvent* event)
{
    if (m_pointerActive && m_activeSource == PointerEvent::Mouse) {
        event->accept();
        return true;
    }

    PointerEvent pe;
    pe.source = PointerEvent::Touch;
    pe.modifiers = event->modifiers();
    for (const QEventPoint& point : event->points()) {
        if (point.state() != QEventPoint::Released) {
            pe.touches.append(point.position());
        }
        if (point.state() != QEventPoint::Stationary) {
            pe.changedTouches.append(point.position());
        }
    }

    switch (event->type()) {
        case QEvent::TouchBegin:
            pe.type = PointerEvent::Press;
            m_pointerActive = true;
            m_activeSource = PointerEvent::Touch;
            setFocus(Qt::MouseFocusReason);
            break;
        case QEvent::TouchUpdate:
            pe.type = PointerEvent::Move;
            break;
        default:
            pe.type = PointerEvent::Release;
            break;
    }

    handlePointerEvent(pe);

    if (pe.type == PointerEvent::Release) {
        m_pointerActive = false;
    }
    event->accept();
    return true;
}

// ===== Keyboard =====

void MarkupCanvas::keyPressEvent(QKeyEvent* event)
{
    if (m_controller->handleKeyPress(event->key(), event->modifiers())) {
        event->accept();
        return;
    }

    const Qt::KeyboardModifiers mods = event->modifiers() & ~Qt::KeypadModifier;
    const QKeySequence sequence(QKeyCombination(mods, static_cast<Qt::Key>(event->key())));
    const QString action = ShortcutManager::instance()->actionForKeySequence(sequence);

    if (action == QLatin1String("zoom.in")) {
        m_viewport->zoomIn();
    } else if (action == QLatin1String("zoom.out")) {
        m_viewport->zoomOut();
    } else if (action == QLatin1String("zoom.reset")) {
        m_viewport->resetZoom();
    } else if (action == QLatin1String("zoom.fit_width")) {
        m_viewport->fitToWidth(parentWidget() ? parentWidget()->width() : width());
    } else if (action == QLatin1String("navigation.prev_page")) {
        m_viewport->previousPage();
    } else if (action == QLatin1String("navigation.next_page")) {
        m_viewport->nextPage();
    } else if (!action.isEmpty()) {
        emit shortcutTriggered(action);
    } else {
        QWidget::keyPressEvent(event);
        return;
    }
    event->accept();
}

// ===== Inline Text Editor =====

void MarkupCanvas::onTextEditingStarted(const QString& id, const QRectF& bounds)
{
    Q_UNUSED(bounds);

    const Annotation* annotation = m_controller->annotations().find(id);
    if (!annotation || annotation->type() != AnnotationType::Text) {
        return;
    }
    const auto* text = static_cast<const TextAnnotation*>(annotation);

    QFont font(text->fontFamily);
    font.setPixelSize(qMax(1, qRound(text->fontSize * m_viewport->zoom())));
    font.setBold(text->bold);
    font.setItalic(text->italic);

    m_syncingEditor = true;
    m_textEditor->setFont(font);
    m_textEditor->setPlainText(text->text);
    m_syncingEditor = false;

    positionEditor();
    m_textEditor->show();
    m_textEditor->setFocus(Qt::OtherFocusReason);
}

void MarkupCanvas::onTextEditingFinished(const QString& id)
{
    Q_UNUSED(id);
    m_textEditor->hide();
    setFocus(Qt::OtherFocusReason);
    update();
}

void MarkupCanvas::onEditorTextChanged()
{
    if (m_syncingEditor) {
        return;
    }
    m_controller->updateEditingText(m_textEditor->toPlainText());
}

void MarkupCanvas::positionEditor()
{
    const QString id = m_controller->editingTextId();
    if (id.isEmpty() || !m_viewport->hasDocument()) {
        return;
    }
    const Annotation* annotation = m_controller->annotations().find(id);
    if (!annotation) {
        return;
    }

    const CoordinateTransform transform = m_viewport->transform(pageRect());
    QRect editorRect = transform.toClient(annotation->boundingRect()).toAlignedRect();
    // Room for the caret past the estimated text width
    editorRect.setWidth(qMax(editorRect.width() + 16, 60));
    m_textEditor->setGeometry(editorRect);
}

bool MarkupCanvas::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == m_textEditor) {
        if (event->type() == QEvent::FocusOut) {
            m_controller->finishTextEditing();
        } else if (event->type() == QEvent::KeyPress
                   && static_cast<QKeyEvent*>(event)->key() == Qt::Key_Escape) {
            m_controller->finishTextEditing();
            return true;
        }
    }
    return QWidget::eventFilter(watched, event);
}

void MarkupCanvas::applyToolCursor()
{
    switch (m_controller->activeTool()) {
        case ToolType::Select:
            setCursor(m_controller->hoverCursor());
            break;
        case ToolType::Text:
            setCursor(Qt::IBeamCursor);
            break;
        default:
            setCursor(Qt::CrossCursor);
            break;
    }
}
