#include "PainterSurface.hpp"

#include <QClipboard>
#include <QFontMetricsF>
#include <QGuiApplication>
#include <QPen>

PainterSurface::PainterSurface(QWidget *widget) noexcept : m_widget(widget) {}

void
PainterSurface::begin(QPainter *painter) noexcept
{
    m_painter = painter;
    if (!m_painter)
        return;

    m_painter->setRenderHint(QPainter::Antialiasing, m_antialiasing);
    m_painter->setRenderHint(QPainter::TextAntialiasing, m_text_antialiasing);
    m_painter->setRenderHint(QPainter::SmoothPixmapTransform, m_smooth_pixmap);
}

void
PainterSurface::end() noexcept
{
    m_painter = nullptr;
}

QFont
PainterSurface::toQFont(const FontSpec &spec) const noexcept
{
    QFont font = m_widget ? m_widget->font() : QGuiApplication::font();
    font.setPointSizeF(spec.point_size > 0 ? spec.point_size : 1.0);
    font.setBold(spec.bold);
    font.setItalic(spec.italic);
    return font;
}

QSizeF
PainterSurface::size() const noexcept
{
    return m_widget ? QSizeF(m_widget->size()) : QSizeF();
}

void
PainterSurface::drawRect(const QRectF &rect, const QColor &fill,
                         const QColor &stroke, qreal strokeWidth,
                         qreal radius) noexcept
{
    if (!m_painter)
        return;

    m_painter->save();
    m_painter->setBrush(fill.alpha() > 0 ? QBrush(fill) : QBrush(Qt::NoBrush));
    m_painter->setPen(stroke.alpha() > 0 ? QPen(stroke, strokeWidth)
                                         : QPen(Qt::NoPen));
    if (radius > 0)
        m_painter->drawRoundedRect(rect, radius, radius);
    else
        m_painter->drawRect(rect);
    m_painter->restore();
}

void
PainterSurface::drawText(const QPointF &topLeft, const QString &text,
                         const FontSpec &font, const QColor &color) noexcept
{
    if (!m_painter || text.isEmpty())
        return;

    const QFont qfont = toQFont(font);
    const QFontMetricsF fm(qfont);

    m_painter->save();
    m_painter->setFont(qfont);
    m_painter->setPen(color);
    m_painter->drawText(QPointF(topLeft.x(), topLeft.y() + fm.ascent()), text);
    m_painter->restore();
}

void
PainterSurface::drawLine(const QPointF &from, const QPointF &to,
                         const QColor &color, qreal width) noexcept
{
    if (!m_painter)
        return;

    m_painter->save();
    m_painter->setPen(QPen(color, width));
    m_painter->drawLine(from, to);
    m_painter->restore();
}

void
PainterSurface::drawPolyline(const QPolygonF &points, const QColor &color,
                             qreal width) noexcept
{
    if (!m_painter || points.size() < 2)
        return;

    m_painter->save();
    m_painter->setPen(QPen(color, width, Qt::SolidLine, Qt::RoundCap,
                           Qt::RoundJoin));
    m_painter->drawPolyline(points);
    m_painter->restore();
}

void
PainterSurface::drawImage(const QRectF &target, const QImage &image) noexcept
{
    if (!m_painter || image.isNull())
        return;

    m_painter->drawImage(target, image);
}

QSizeF
PainterSurface::measureText(const QString &text,
                            const FontSpec &font) const noexcept
{
    const QFontMetricsF fm(toQFont(font));
    return QSizeF(fm.horizontalAdvance(text), fm.height());
}

void
PainterSurface::setCursor(Qt::CursorShape shape) noexcept
{
    if (m_widget && m_widget->cursor().shape() != shape)
        m_widget->setCursor(shape);
}

bool
PainterSurface::copyToClipboard(const QString &text) noexcept
{
    QClipboard *clipboard = QGuiApplication::clipboard();
    if (!clipboard)
        return false;

    clipboard->setText(text);
    if (clipboard->supportsSelection())
        clipboard->setText(text, QClipboard::Selection);

    return true;
}
