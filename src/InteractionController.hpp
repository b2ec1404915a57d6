#pragma once

// Pointer and keyboard state machine for the canvas. Holds only transient
// state; every effect on the view is handed back as an Outcome.

#include "Config.hpp"

#include <QPointF>
#include <QRectF>
#include <QString>
#include <Qt>
#include <optional>
#include <vector>

class InteractionController
{
public:
    enum class State
    {
        Idle = 0,
        Hovering,
        Pressed,
        Panning,
        DraggingItem,
        COUNT
    };

    // Screen rect of one item as painted in the last frame
    struct HitTarget
    {
        QString id;
        QRectF rect;
        QString text;
    };

    struct Outcome
    {
        QPointF pan_delta;
        std::optional<double> zoom;
        QString offset_item;
        QPointF offset_delta;
        std::optional<QString> copy_text;
        QString edit_item;
        bool reset_view{false};
        int repaint_after_ms{-1};
        bool repaint{false};
        bool consumed{false};
    };

    explicit InteractionController(const Config &config) noexcept;

    // Index of the last (topmost painted) target containing `pos`, or -1
    static int hitTest(const std::vector<HitTarget> &targets,
                       const QPointF &pos) noexcept;

    Outcome pointerMoved(const QPointF &pos,
                         const std::vector<HitTarget> &targets) noexcept;
    Outcome pointerPressed(const QPointF &pos, Qt::MouseButton button,
                           const std::vector<HitTarget> &targets,
                           bool editMode) noexcept;
    Outcome pointerReleased(const QPointF &pos, Qt::MouseButton button,
                            const std::vector<HitTarget> &targets) noexcept;
    Outcome doubleClicked(const QPointF &pos,
                          const std::vector<HitTarget> &targets,
                          bool editMode) noexcept;
    Outcome wheel(const QPointF &delta, Qt::KeyboardModifiers modifiers,
                  double zoom) const noexcept;
    Outcome keyPressed(int key, Qt::KeyboardModifiers modifiers,
                       double zoom) noexcept;
    Outcome pointerLeft() noexcept;

    double zoomIn(double zoom) const noexcept;
    double zoomOut(double zoom) const noexcept;

    void recordCopy(const QString &text, qint64 nowMs) noexcept;
    bool toastVisible(qint64 nowMs) const noexcept;

    // Re-resolves hover after the rects moved under a still pointer
    void refreshHover(const std::vector<HitTarget> &targets) noexcept;

    Qt::CursorShape cursorShape() const noexcept;

    inline State state() const noexcept
    {
        return m_state;
    }

    inline const QString &hoveredId() const noexcept
    {
        return m_hovered_id;
    }

    inline bool pointerInside() const noexcept
    {
        return m_inside;
    }

    inline const QString &copiedText() const noexcept
    {
        return m_copied_text;
    }

private:
    void updateHover(const QPointF &pos,
                     const std::vector<HitTarget> &targets) noexcept;
    bool beyondDragThreshold(const QPointF &pos) const noexcept;

    const Config &m_config;
    State m_state{State::Idle};
    bool m_inside{false};
    QPointF m_last_pos;
    QPointF m_press_pos;
    QPointF m_drag_total;
    QString m_press_item;
    bool m_press_edit{false};
    QString m_hovered_id;
    QString m_copied_text;
    qint64 m_copied_at{-1};
};
