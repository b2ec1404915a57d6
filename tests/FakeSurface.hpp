#pragma once

// Deterministic RenderSurface for tests: every glyph is half the point size
// wide and a line is 1.2 point sizes high. Draw calls are recorded.

#include "RenderSurface.hpp"

#include <QStringList>
#include <vector>

class FakeSurface : public RenderSurface
{
public:
    struct TextCall
    {
        QPointF pos;
        QString text;
        FontSpec font;
        QColor color;
    };

    struct RectCall
    {
        QRectF rect;
        QColor fill;
        QColor stroke;
    };

    explicit FakeSurface(const QSizeF &size = QSizeF(612, 792)) : m_size(size)
    {
    }

    QSizeF size() const noexcept override
    {
        return m_size;
    }

    void drawRect(const QRectF &rect, const QColor &fill, const QColor &stroke,
                  qreal strokeWidth, qreal radius) noexcept override
    {
        Q_UNUSED(strokeWidth);
        Q_UNUSED(radius);
        rects.push_back({rect, fill, stroke});
    }

    void drawText(const QPointF &topLeft, const QString &text,
                  const FontSpec &font, const QColor &color) noexcept override
    {
        texts.push_back({topLeft, text, font, color});
    }

    void drawLine(const QPointF &from, const QPointF &to, const QColor &color,
                  qreal width) noexcept override
    {
        Q_UNUSED(to);
        Q_UNUSED(color);
        Q_UNUSED(width);
        lines.push_back(from);
    }

    void drawPolyline(const QPolygonF &points, const QColor &color,
                      qreal width) noexcept override
    {
        Q_UNUSED(color);
        Q_UNUSED(width);
        polylines.push_back(points);
    }

    void drawImage(const QRectF &target, const QImage &image) noexcept override
    {
        Q_UNUSED(image);
        images.push_back(target);
    }

    QSizeF measureText(const QString &text,
                       const FontSpec &font) const noexcept override
    {
        return QSizeF(text.size() * font.point_size * 0.5,
                      font.point_size * 1.2);
    }

    void setCursor(Qt::CursorShape shape) noexcept override
    {
        cursor = shape;
    }

    bool copyToClipboard(const QString &text) noexcept override
    {
        if (!clipboard_available)
            return false;
        clipboard = text;
        return true;
    }

    void reset() noexcept
    {
        texts.clear();
        rects.clear();
        lines.clear();
        polylines.clear();
        images.clear();
    }

    bool drewTextStartingWith(const QString &prefix) const noexcept
    {
        for (const TextCall &call : texts)
        {
            if (call.text.startsWith(prefix))
                return true;
        }
        return false;
    }

    std::vector<TextCall> texts;
    std::vector<RectCall> rects;
    std::vector<QPointF> lines;
    std::vector<QPolygonF> polylines;
    std::vector<QRectF> images;
    Qt::CursorShape cursor{Qt::ArrowCursor};
    QString clipboard;
    bool clipboard_available{true};

private:
    QSizeF m_size;
};
