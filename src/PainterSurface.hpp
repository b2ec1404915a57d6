#pragma once

#include "RenderSurface.hpp"

#include <QFont>
#include <QPainter>
#include <QPointer>
#include <QWidget>

// RenderSurface over a QPainter that is only valid inside paintEvent.
// Measuring, cursor and clipboard work outside of painting too.
class PainterSurface : public RenderSurface
{
public:
    explicit PainterSurface(QWidget *widget) noexcept;

    void begin(QPainter *painter) noexcept;
    void end() noexcept;

    inline void setAntialiasing(bool enabled) noexcept
    {
        m_antialiasing = enabled;
    }

    inline void setTextAntialiasing(bool enabled) noexcept
    {
        m_text_antialiasing = enabled;
    }

    inline void setSmoothPixmapTransform(bool enabled) noexcept
    {
        m_smooth_pixmap = enabled;
    }

    QSizeF size() const noexcept override;
    void drawRect(const QRectF &rect, const QColor &fill, const QColor &stroke,
                  qreal strokeWidth, qreal radius) noexcept override;
    void drawText(const QPointF &topLeft, const QString &text,
                  const FontSpec &font, const QColor &color) noexcept override;
    void drawLine(const QPointF &from, const QPointF &to, const QColor &color,
                  qreal width) noexcept override;
    void drawPolyline(const QPolygonF &points, const QColor &color,
                      qreal width) noexcept override;
    void drawImage(const QRectF &target, const QImage &image) noexcept override;
    QSizeF measureText(const QString &text,
                       const FontSpec &font) const noexcept override;
    void setCursor(Qt::CursorShape shape) noexcept override;
    bool copyToClipboard(const QString &text) noexcept override;

private:
    QFont toQFont(const FontSpec &spec) const noexcept;

    QPointer<QWidget> m_widget;
    QPainter *m_painter{nullptr};
    bool m_antialiasing{true};
    bool m_text_antialiasing{true};
    bool m_smooth_pixmap{true};
};
