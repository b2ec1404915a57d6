#pragma once

// Drawing, measuring and platform capabilities used by the canvas.
// The widget hands in a QPainter backed surface, tests hand in a fake.

#include <QColor>
#include <QImage>
#include <QPointF>
#include <QPolygonF>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <Qt>

struct FontSpec
{
    qreal point_size{12.0};
    bool bold{false};
    bool italic{false};
};

class RenderSurface
{
public:
    virtual ~RenderSurface() = default;

    virtual QSizeF size() const noexcept = 0;

    // `fill` or `stroke` may be transparent to skip that part
    virtual void drawRect(const QRectF &rect, const QColor &fill,
                          const QColor &stroke, qreal strokeWidth = 1.0,
                          qreal radius = 0.0) noexcept = 0;
    virtual void drawText(const QPointF &topLeft, const QString &text,
                          const FontSpec &font, const QColor &color) noexcept
        = 0;
    virtual void drawLine(const QPointF &from, const QPointF &to,
                          const QColor &color, qreal width = 1.0) noexcept
        = 0;
    virtual void drawPolyline(const QPolygonF &points, const QColor &color,
                              qreal width = 1.0) noexcept = 0;
    virtual void drawImage(const QRectF &target, const QImage &image) noexcept
        = 0;

    // Width of `text` and the line height of `font`
    virtual QSizeF measureText(const QString &text,
                               const FontSpec &font) const noexcept = 0;

    virtual void setCursor(Qt::CursorShape shape) noexcept = 0;
    virtual bool copyToClipboard(const QString &text) noexcept = 0;
};
