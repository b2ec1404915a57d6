#include "CanvasView.hpp"

#include <QPainter>
#include <QTimer>
#include <QWheelEvent>

CanvasView::CanvasView(const Config &config, QWidget *parent)
    : QWidget(parent), m_config(config), m_canvas(config), m_surface(this)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent);
    applyRenderingConfig();
    m_clock.start();
}

void
CanvasView::applyRenderingConfig() noexcept
{
    m_surface.setAntialiasing(m_config.rendering.antialiasing);
    m_surface.setTextAntialiasing(m_config.rendering.text_antialiasing);
    m_surface.setSmoothPixmapTransform(m_config.rendering.smooth_pixmap_transform);
}

void
CanvasView::setModel(std::shared_ptr<const ItemModel> model) noexcept
{
    m_canvas.setModel(std::move(model));
    update();
    emit viewChanged();
}

void
CanvasView::setPageImage(const QImage &image) noexcept
{
    m_canvas.setPageImage(image);
    update();
}

void
CanvasView::setSearchQuery(const QString &query) noexcept
{
    m_canvas.setSearchQuery(query);
    update();
    emit viewChanged();
}

void
CanvasView::setEditMode(bool enabled) noexcept
{
    m_canvas.setEditMode(enabled);
    update();
    emit viewChanged();
}

void
CanvasView::setItemOverrideText(const QString &id, const QString &text) noexcept
{
    m_canvas.setItemOverrideText(id, text);
    update();
}

void
CanvasView::clearOverrides() noexcept
{
    m_canvas.clearOverrides();
    update();
}

void
CanvasView::ZoomIn() noexcept
{
    m_canvas.zoomIn();
    update();
    emit viewChanged();
}

void
CanvasView::ZoomOut() noexcept
{
    m_canvas.zoomOut();
    update();
    emit viewChanged();
}

void
CanvasView::ZoomReset() noexcept
{
    m_canvas.resetView();
    update();
    emit viewChanged();
}

void
CanvasView::Pan(const QPointF &delta) noexcept
{
    m_canvas.setPan(m_canvas.pan() + delta);
    update();
    emit viewChanged();
}

void
CanvasView::handleOutcome(const DocumentCanvas::Outcome &out) noexcept
{
    if (out.copy_text)
        emit itemCopied(*out.copy_text);

    if (!out.edit_item.isEmpty())
        emit editRequested(out.edit_item);

    if (out.zoom || out.reset_view || !out.pan_delta.isNull())
        emit viewChanged();

    if (out.repaint)
        update();

    // One repaint once the toast expired instead of animating every frame
    if (out.repaint_after_ms > 0)
        QTimer::singleShot(out.repaint_after_ms, this, [this]() { update(); });
}

void
CanvasView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    m_surface.begin(&painter);
    m_canvas.paint(m_surface, m_clock.elapsed());
    m_surface.end();
}

void
CanvasView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton)
    {
        QWidget::mousePressEvent(event);
        return;
    }

    setFocus(Qt::MouseFocusReason);
    handleOutcome(m_canvas.mousePress(event->position(), event->button(),
                                      m_surface));
    event->accept();
}

void
CanvasView::mouseMoveEvent(QMouseEvent *event)
{
    handleOutcome(m_canvas.mouseMove(event->position(), m_surface));
    event->accept();
}

void
CanvasView::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton)
    {
        QWidget::mouseReleaseEvent(event);
        return;
    }

    handleOutcome(m_canvas.mouseRelease(event->position(), event->button(),
                                        m_surface, m_clock.elapsed()));
    event->accept();
}

void
CanvasView::mouseDoubleClickEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton)
    {
        QWidget::mouseDoubleClickEvent(event);
        return;
    }

    handleOutcome(m_canvas.mouseDoubleClick(event->position(), m_surface));
    event->accept();
}

void
CanvasView::wheelEvent(QWheelEvent *event)
{
    // Trackpads report pixels, mice report eighths of a degree
    const QPointF delta = !event->pixelDelta().isNull()
                              ? QPointF(event->pixelDelta())
                              : QPointF(event->angleDelta()) / 3.0;

    handleOutcome(m_canvas.wheel(delta, event->modifiers()));
    event->accept();
}

void
CanvasView::keyPressEvent(QKeyEvent *event)
{
    const DocumentCanvas::Outcome out
        = m_canvas.keyPress(event->key(), event->modifiers());

    if (!out.consumed)
    {
        QWidget::keyPressEvent(event);
        return;
    }

    handleOutcome(out);
    event->accept();
}

void
CanvasView::leaveEvent(QEvent *event)
{
    QWidget::leaveEvent(event);
    handleOutcome(m_canvas.leave());
}
