#include "InteractionController.hpp"

#include "ViewTransform.hpp"

#include <QDebug>

InteractionController::InteractionController(const Config &config) noexcept
    : m_config(config)
{
}

int
InteractionController::hitTest(const std::vector<HitTarget> &targets,
                               const QPointF &pos) noexcept
{
    for (int i = static_cast<int>(targets.size()) - 1; i >= 0; --i)
    {
        if (targets[static_cast<size_t>(i)].rect.contains(pos))
            return i;
    }

    return -1;
}

double
InteractionController::zoomIn(double zoom) const noexcept
{
    return ViewTransform::clampZoom(zoom * m_config.zoom.factor,
                                    m_config.zoom.min, m_config.zoom.max);
}

double
InteractionController::zoomOut(double zoom) const noexcept
{
    const double factor = m_config.zoom.factor > 0 ? m_config.zoom.factor : 1.0;
    return ViewTransform::clampZoom(zoom / factor, m_config.zoom.min,
                                    m_config.zoom.max);
}

bool
InteractionController::beyondDragThreshold(const QPointF &pos) const noexcept
{
    return (pos - m_press_pos).manhattanLength()
           > m_config.canvas.drag_threshold;
}

void
InteractionController::updateHover(const QPointF &pos,
                                   const std::vector<HitTarget> &targets) noexcept
{
    const int hit = hitTest(targets, pos);
    m_hovered_id  = hit >= 0 ? targets[static_cast<size_t>(hit)].id : QString();

    if (m_state == State::Idle || m_state == State::Hovering)
        m_state = m_hovered_id.isEmpty() ? State::Idle : State::Hovering;
}

void
InteractionController::refreshHover(const std::vector<HitTarget> &targets) noexcept
{
    if (m_inside)
        updateHover(m_last_pos, targets);
}

InteractionController::Outcome
InteractionController::pointerMoved(const QPointF &pos,
                                    const std::vector<HitTarget> &targets) noexcept
{
    Outcome out;
    const bool wasInside = m_inside;
    m_inside             = true;

    if (m_state == State::Pressed && beyondDragThreshold(pos))
    {
        const bool dragItem = m_press_edit && !m_press_item.isEmpty();
        m_state             = dragItem ? State::DraggingItem : State::Panning;
        m_drag_total        = QPointF();
        // The threshold distance counts as part of the drag
        m_last_pos = m_press_pos;
    }

    const QPointF delta = pos - m_last_pos;
    m_last_pos          = pos;

    switch (m_state)
    {
        case State::Panning:
            out.pan_delta = delta;
            m_drag_total += delta;
            out.repaint  = true;
            out.consumed = true;
            break;

        case State::DraggingItem:
            out.offset_item  = m_press_item;
            out.offset_delta = delta;
            m_drag_total += delta;
            out.repaint  = true;
            out.consumed = true;
            break;

        case State::Pressed:
            out.consumed = true;
            break;

        default:
        {
            const QString previous = m_hovered_id;
            updateHover(pos, targets);
            out.repaint = previous != m_hovered_id || !wasInside;
        }
        break;
    }

    return out;
}

// A press on an item outside edit mode is a click candidate until the
// pointer moves past the drag threshold, then it pans like a press on the
// background. Only edit mode turns a drag on an item into an item move.
InteractionController::Outcome
InteractionController::pointerPressed(const QPointF &pos,
                                      Qt::MouseButton button,
                                      const std::vector<HitTarget> &targets,
                                      bool editMode) noexcept
{
    Outcome out;
    if (button != Qt::LeftButton)
        return out;

    const int hit = hitTest(targets, pos);
    m_press_item  = hit >= 0 ? targets[static_cast<size_t>(hit)].id : QString();
    m_press_pos   = pos;
    m_last_pos    = pos;
    m_press_edit  = editMode;
    m_drag_total  = QPointF();
    m_state       = State::Pressed;
    m_inside      = true;

    out.consumed = true;
    return out;
}

InteractionController::Outcome
InteractionController::pointerReleased(const QPointF &pos,
                                       Qt::MouseButton button,
                                       const std::vector<HitTarget> &targets) noexcept
{
    Outcome out;
    if (button != Qt::LeftButton)
        return out;

    const State previous = m_state;
    m_state              = State::Idle;
    out.consumed         = true;

    if (previous == State::Pressed && !m_press_item.isEmpty())
    {
        const int hit = hitTest(targets, pos);
        if (hit >= 0 && targets[static_cast<size_t>(hit)].id == m_press_item)
            out.copy_text = targets[static_cast<size_t>(hit)].text;
    }

    if (previous == State::Panning || previous == State::DraggingItem)
        out.repaint = true;

    m_press_item.clear();
    m_drag_total = QPointF();
    updateHover(pos, targets);
    return out;
}

InteractionController::Outcome
InteractionController::doubleClicked(const QPointF &pos,
                                     const std::vector<HitTarget> &targets,
                                     bool editMode) noexcept
{
    Outcome out;

    // The release that follows a double click must not copy again
    m_state = State::Idle;
    m_press_item.clear();

    if (!editMode)
        return out;

    const int hit = hitTest(targets, pos);
    if (hit < 0)
        return out;

    out.edit_item = targets[static_cast<size_t>(hit)].id;
    out.consumed  = true;
    return out;
}

InteractionController::Outcome
InteractionController::wheel(const QPointF &delta,
                             Qt::KeyboardModifiers modifiers,
                             double zoom) const noexcept
{
    Outcome out;
    out.consumed = true;
    out.repaint  = true;

    if (modifiers & (Qt::ControlModifier | Qt::MetaModifier))
    {
        const double factor = 1.0 + delta.y() * m_config.zoom.wheel_factor;
        out.zoom = ViewTransform::clampZoom(zoom * factor, m_config.zoom.min,
                                            m_config.zoom.max);
        return out;
    }

    out.pan_delta = delta;
    return out;
}

InteractionController::Outcome
InteractionController::keyPressed(int key, Qt::KeyboardModifiers modifiers,
                                  double zoom) noexcept
{
    Outcome out;
    const qreal step = m_config.zoom.pan_step;

    // Modified keys belong to the window shortcuts
    if (key != Qt::Key_Escape
        && (modifiers & (Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier)))
        return out;

    switch (key)
    {
        case Qt::Key_Plus:
        case Qt::Key_Equal:
            out.zoom = zoomIn(zoom);
            break;

        case Qt::Key_Minus:
            out.zoom = zoomOut(zoom);
            break;

        case Qt::Key_0:
            out.reset_view = true;
            break;

        case Qt::Key_Left:
            out.pan_delta = QPointF(step, 0);
            break;

        case Qt::Key_Right:
            out.pan_delta = QPointF(-step, 0);
            break;

        case Qt::Key_Up:
            out.pan_delta = QPointF(0, step);
            break;

        case Qt::Key_Down:
            out.pan_delta = QPointF(0, -step);
            break;

        case Qt::Key_Escape:
            if (m_state == State::Panning)
                out.pan_delta = -m_drag_total;
            else if (m_state == State::DraggingItem)
            {
                out.offset_item  = m_press_item;
                out.offset_delta = -m_drag_total;
            }
            else if (m_state != State::Pressed)
                return out;

#ifndef NDEBUG
            qDebug() << "InteractionController: drag cancelled";
#endif
            m_state = State::Idle;
            m_press_item.clear();
            m_drag_total = QPointF();
            break;

        default:
            return out;
    }

    out.repaint  = true;
    out.consumed = true;
    return out;
}

InteractionController::Outcome
InteractionController::pointerLeft() noexcept
{
    Outcome out;
    m_inside = false;

    if (m_state == State::Hovering)
        m_state = State::Idle;

    // Hover outline and hint line go away
    out.repaint = true;
    m_hovered_id.clear();
    return out;
}

void
InteractionController::recordCopy(const QString &text, qint64 nowMs) noexcept
{
    m_copied_text = text;
    m_copied_at   = nowMs;
}

bool
InteractionController::toastVisible(qint64 nowMs) const noexcept
{
    if (m_copied_at < 0)
        return false;

    return nowMs - m_copied_at < m_config.canvas.toast_duration_ms;
}

Qt::CursorShape
InteractionController::cursorShape() const noexcept
{
    switch (m_state)
    {
        case State::Panning:
            return Qt::ClosedHandCursor;

        case State::DraggingItem:
            return Qt::SizeAllCursor;

        default:
            break;
    }

    return m_hovered_id.isEmpty() ? Qt::ArrowCursor : Qt::PointingHandCursor;
}
